#ifndef NAVL_CERTIFICATE_LOG_HPP
#define NAVL_CERTIFICATE_LOG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <rclcpp/rclcpp.hpp>

#include "certification_compiler.hpp"

namespace navl
{

/**
 * @brief A persisted certificate and its hash-chain link
 */
struct CertificateLogEntry {
    Certificate certificate;
    std::string prev_hash;
    std::string hash;
};

/**
 * @brief Append-only, tamper-evident CSV certificate log
 *
 * Every line carries hash = SHA-256(prev_hash + "|" + canonical record),
 * starting from a genesis hash of 64 zeros. Doubles are written with
 * max_digits10 precision so a parsed record re-serialises to the same
 * line. Reopening an existing log resumes the chain from its last line.
 * A failed append is rolled back, and an unterminated final line left by
 * an interrupted write is dropped on open.
 *
 * File format:
 *   sequence,timestamp,log_type,equation,p_score,...,verified,prev_hash,hash
 */
class CertificateLog : public CertificateSink {
public:
    static constexpr const char* HEADER =
        "sequence,timestamp,log_type,equation,p_score,h_safety,goal_proximity,"
        "model_intent,consciousness,margin_state,sim2val_y,p_estimate,sigma,"
        "status,verified,prev_hash,hash";
    static constexpr std::size_t COLUMN_COUNT = 17;

    /**
     * @brief Open (or create) a certificate log
     * @param path CSV file path; parent directories are created
     * @param logger ROS2 logger for output
     * @throws std::runtime_error if an existing log is malformed or its
     *         hash chain is broken
     */
    explicit CertificateLog(const std::string& path,
                            rclcpp::Logger logger = rclcpp::get_logger("certificate_log"));

    bool append(const Certificate& certificate) override;
    uint64_t recordCount() const override { return record_count_; }

    const std::string& lastHash() const { return last_hash_; }
    const std::string& path() const { return path_; }

    /**
     * @brief Genesis link of every chain (64 zeros)
     */
    static std::string genesisHash();

    /**
     * @brief Canonical CSV form of the certificate columns (no hashes)
     */
    static std::string serialize(const Certificate& certificate);

    /**
     * @brief Full CSV line of an entry
     */
    static std::string formatLine(const CertificateLogEntry& entry);

    /**
     * @brief Parse one CSV line
     * @throws std::runtime_error on a malformed line
     */
    static CertificateLogEntry parseLine(const std::string& line);

    /**
     * @brief Read every entry of a log in file order
     * @throws std::runtime_error if the file cannot be opened or is malformed
     */
    static std::vector<CertificateLogEntry> readAll(const std::string& path);

    /**
     * @brief Check every link of a chain
     * @return true if each hash matches its record and links to the
     *         previous entry
     */
    static bool verifyChain(const std::vector<CertificateLogEntry>& entries);

    static std::string computeHash(const std::string& prev_hash, const std::string& canonical);

private:
    void dropTornTail();

    std::string path_;
    std::string last_hash_;
    uint64_t record_count_;
    std::uintmax_t committed_size_;
    rclcpp::Logger logger_;
};

}  // namespace navl

#endif // NAVL_CERTIFICATE_LOG_HPP
