#include "certificate_log.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>

namespace navl
{

namespace
{
std::string formatDouble(double value)
{
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return ss.str();
}

std::vector<std::string> splitCsv(const std::string& line)
{
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

double parseDouble(const std::string& field, const char* column)
{
    try {
        std::size_t consumed = 0;
        const double value = std::stod(field, &consumed);
        if (consumed != field.size()) {
            throw std::invalid_argument(field);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string("Malformed value in column '") + column + "': " + field);
    }
}

// Byte length of the file up to and including its last newline
std::uintmax_t completeLinesSize(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    const std::string content((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    const auto pos = content.rfind('\n');
    return pos == std::string::npos ? 0 : pos + 1;
}

bool isHexDigest(const std::string& value)
{
    if (value.size() != 2 * SHA256_DIGEST_LENGTH) {
        return false;
    }
    return value.find_first_not_of("0123456789abcdef") == std::string::npos;
}
}  // namespace

CertificateLog::CertificateLog(const std::string& path, rclcpp::Logger logger)
    : path_(path),
      last_hash_(genesisHash()),
      record_count_(0),
      committed_size_(0),
      logger_(logger) {

    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        dropTornTail();
    }

    const bool exists = std::filesystem::exists(path_, ec) &&
                        std::filesystem::file_size(path_, ec) > 0;

    if (exists) {
        const auto entries = readAll(path_);
        if (!verifyChain(entries)) {
            throw std::runtime_error("Certificate log hash chain is broken: " + path_);
        }
        record_count_ = entries.size();
        if (!entries.empty()) {
            last_hash_ = entries.back().hash;
        }
        committed_size_ = std::filesystem::file_size(path_);
        RCLCPP_INFO(logger_, "Resumed certificate log %s (%lu records, head %s...)",
                    path_.c_str(), static_cast<unsigned long>(record_count_),
                    last_hash_.substr(0, 16).c_str());
        return;
    }

    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path_, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Could not create certificate log: " + path_);
    }
    file << HEADER << "\n";
    file.close();
    committed_size_ = std::filesystem::file_size(path_);

    RCLCPP_INFO(logger_, "Created certificate log %s", path_.c_str());
}

bool CertificateLog::append(const Certificate& certificate) {
    CertificateLogEntry entry;
    entry.certificate = certificate;
    entry.prev_hash = last_hash_;
    entry.hash = computeHash(last_hash_, serialize(certificate));

    // Discard bytes past the last committed record, left by a failed write
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path_, ec);
    if (!ec && size != committed_size_) {
        std::filesystem::resize_file(path_, committed_size_, ec);
    }
    if (ec) {
        RCLCPP_ERROR(logger_, "Could not restore certificate log %s: %s",
                     path_.c_str(), ec.message().c_str());
        return false;
    }

    const std::string line = formatLine(entry) + "\n";
    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        RCLCPP_ERROR(logger_, "Could not open certificate log: %s", path_.c_str());
        return false;
    }

    file << line;
    file.flush();
    if (!file.good()) {
        file.close();
        // A failed rollback is retried by the next append
        std::filesystem::resize_file(path_, committed_size_, ec);
        RCLCPP_ERROR(logger_, "Write to certificate log failed: %s", path_.c_str());
        return false;
    }

    committed_size_ += line.size();
    last_hash_ = entry.hash;
    ++record_count_;
    return true;
}

void CertificateLog::dropTornTail() {
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return;
    }
    const std::uintmax_t complete = completeLinesSize(path_);
    if (complete == size) {
        return;
    }

    std::filesystem::resize_file(path_, complete, ec);
    if (ec) {
        throw std::runtime_error("Could not truncate torn record in certificate log " +
                                 path_ + ": " + ec.message());
    }
    RCLCPP_WARN(logger_, "Dropped %lu bytes of an unterminated record from %s",
                static_cast<unsigned long>(size - complete), path_.c_str());
}

std::string CertificateLog::genesisHash() {
    return std::string(2 * SHA256_DIGEST_LENGTH, '0');
}

std::string CertificateLog::serialize(const Certificate& c) {
    std::ostringstream ss;
    ss << c.sequence << ','
       << c.timestamp << ','
       << c.log_type << ','
       << c.equation << ','
       << formatDouble(c.p_score) << ','
       << formatDouble(c.h_safety) << ','
       << formatDouble(c.goal_proximity) << ','
       << formatDouble(c.model_intent) << ','
       << formatDouble(c.consciousness) << ','
       << formatDouble(c.margin) << ','
       << formatDouble(c.sim2val_y) << ','
       << formatDouble(c.p_estimate) << ','
       << formatDouble(c.sigma) << ','
       << c.status << ','
       << (c.verified ? 1 : 0);
    return ss.str();
}

std::string CertificateLog::formatLine(const CertificateLogEntry& entry) {
    return serialize(entry.certificate) + ',' + entry.prev_hash + ',' + entry.hash;
}

CertificateLogEntry CertificateLog::parseLine(const std::string& line) {
    const auto fields = splitCsv(line);
    if (fields.size() != COLUMN_COUNT) {
        throw std::runtime_error("Expected " + std::to_string(COLUMN_COUNT) +
                                 " columns, got " + std::to_string(fields.size()));
    }

    CertificateLogEntry entry;
    Certificate& c = entry.certificate;

    try {
        std::size_t consumed = 0;
        c.sequence = std::stoull(fields[0], &consumed);
        if (consumed != fields[0].size()) {
            throw std::invalid_argument(fields[0]);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error("Malformed sequence: " + fields[0]);
    }

    c.timestamp = fields[1];
    c.log_type = fields[2];
    c.equation = fields[3];
    c.p_score = parseDouble(fields[4], "p_score");
    c.h_safety = parseDouble(fields[5], "h_safety");
    c.goal_proximity = parseDouble(fields[6], "goal_proximity");
    c.model_intent = parseDouble(fields[7], "model_intent");
    c.consciousness = parseDouble(fields[8], "consciousness");
    c.margin = parseDouble(fields[9], "margin_state");
    c.sim2val_y = parseDouble(fields[10], "sim2val_y");
    c.p_estimate = parseDouble(fields[11], "p_estimate");
    c.sigma = parseDouble(fields[12], "sigma");
    c.status = fields[13];

    if (fields[14] == "1") {
        c.verified = true;
    } else if (fields[14] == "0") {
        c.verified = false;
    } else {
        throw std::runtime_error("Malformed verified flag: " + fields[14]);
    }

    entry.prev_hash = fields[15];
    entry.hash = fields[16];
    if (!isHexDigest(entry.prev_hash) || !isHexDigest(entry.hash)) {
        throw std::runtime_error("Malformed hash in record " + fields[0]);
    }

    return entry;
}

std::vector<CertificateLogEntry> CertificateLog::readAll(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open certificate log: " + path);
    }

    std::string line;
    if (!std::getline(file, line) || line != HEADER) {
        throw std::runtime_error("Certificate log has an unexpected header: " + path);
    }

    std::vector<CertificateLogEntry> entries;
    std::size_t line_number = 1;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            entries.push_back(parseLine(line));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path + ":" + std::to_string(line_number) + ": " + e.what());
        }
    }
    return entries;
}

bool CertificateLog::verifyChain(const std::vector<CertificateLogEntry>& entries) {
    std::string expected_prev = genesisHash();
    for (const auto& entry : entries) {
        if (entry.prev_hash != expected_prev) {
            return false;
        }
        if (computeHash(entry.prev_hash, serialize(entry.certificate)) != entry.hash) {
            return false;
        }
        expected_prev = entry.hash;
    }
    return true;
}

std::string CertificateLog::computeHash(const std::string& prev_hash, const std::string& canonical) {
    const std::string data = prev_hash + "|" + canonical;

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.length(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

}  // namespace navl
