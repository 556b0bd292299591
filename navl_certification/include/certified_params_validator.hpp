#ifndef NAVL_CERTIFIED_PARAMS_VALIDATOR_HPP
#define NAVL_CERTIFIED_PARAMS_VALIDATOR_HPP

#include <ctime>
#include <map>
#include <string>
#include <rclcpp/rclcpp.hpp>

namespace navl
{

/**
 * @brief Loader and integrity check for certified safety parameters
 *
 * Barrier strictness, margins, RAIM threshold, P-score threshold and the
 * certification window are safety-critical and may only change through
 * recertification. The YAML file carries a SHA-256 of the canonical
 * parameter string and an HMAC-SHA256 keyed with a shared secret.
 *
 * File layout:
 *   certification: { hash, hmac, date, certified_by, certificate_id,
 *                    valid_until, project_version }
 *   safety_limits:
 *     <name>: { value, unit, standard }
 */
class CertifiedParamsValidator {
public:
    struct CertifiedParam {
        std::string name;
        double value;
        std::string unit;
        std::string standard_reference;
    };

    struct CertificationInfo {
        std::string hash;                // SHA-256 of all parameters
        std::string date;                // ISO 8601
        std::string certified_by;
        std::string certificate_id;
        std::string valid_until;         // ISO 8601
        std::string project_version;
    };

    /**
     * @brief Constructor
     * @param config_path Path to certified parameters YAML file
     * @param secret_path Path to the file containing the HMAC secret key
     * @param logger ROS2 logger for output
     */
    CertifiedParamsValidator(const std::string& config_path,
                             const std::string& secret_path,
                             rclcpp::Logger logger = rclcpp::get_logger("certified_params"));

    /**
     * @brief Load and validate certified parameters from file
     * @return true if valid; false if missing, tampered, unauthenticated or
     *         expired
     */
    bool loadAndValidate();

    /**
     * @brief Get parameter value by name
     * @throws std::runtime_error if not found
     */
    double getParameter(const std::string& name) const;

    /**
     * @brief Get parameter value, or a fallback if it is not certified
     */
    double getParameterOr(const std::string& name, double fallback) const;

    bool hasParameter(const std::string& name) const;

    std::map<std::string, double> getAllParameters() const;
    CertificationInfo getCertificationInfo() const { return cert_info_; }

    bool isCertificationValid() const;

    /**
     * @brief SHA-256 (hex) of the canonical representation of the loaded
     *        parameters
     */
    std::string computeCurrentHash() const;

    /**
     * @brief Canonical representation: sorted "name=value;" with six decimals
     */
    static std::string buildCanonicalRepresentation(const std::map<std::string, double>& values);

    static std::string computeSHA256(const std::string& data);
    static std::string computeHMAC(const std::string& data, const std::string& key);

private:
    bool readSecret(std::string& secret) const;
    time_t parseISO8601(const std::string& date_str) const;

    std::string config_path_;
    std::string secret_path_;
    std::map<std::string, CertifiedParam> params_;
    CertificationInfo cert_info_;
    std::string canonical_representation_;
    rclcpp::Logger logger_;
};

}  // namespace navl

#endif // NAVL_CERTIFIED_PARAMS_VALIDATOR_HPP
