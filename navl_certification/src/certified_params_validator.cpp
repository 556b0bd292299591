#include "certified_params_validator.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <yaml-cpp/yaml.h>

namespace navl
{

namespace
{
std::string toHex(const unsigned char* data, unsigned int len)
{
    std::stringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}
}  // namespace

CertifiedParamsValidator::CertifiedParamsValidator(const std::string& config_path,
                                                   const std::string& secret_path,
                                                   rclcpp::Logger logger)
    : config_path_(config_path),
      secret_path_(secret_path),
      logger_(logger) {
}

bool CertifiedParamsValidator::loadAndValidate() {
    params_.clear();
    canonical_representation_.clear();

    try {
        YAML::Node config = YAML::LoadFile(config_path_);

        if (!config["certification"]) {
            RCLCPP_ERROR(logger_, "No 'certification' section in %s", config_path_.c_str());
            return false;
        }

        auto cert = config["certification"];
        cert_info_.hash = cert["hash"].as<std::string>();
        cert_info_.date = cert["date"].as<std::string>();
        cert_info_.certified_by = cert["certified_by"].as<std::string>();
        cert_info_.certificate_id = cert["certificate_id"].as<std::string>();
        cert_info_.valid_until = cert["valid_until"].as<std::string>();
        cert_info_.project_version = cert["project_version"].as<std::string>();

        if (!config["safety_limits"]) {
            RCLCPP_ERROR(logger_, "No 'safety_limits' section in %s", config_path_.c_str());
            return false;
        }

        std::map<std::string, double> values;
        for (const auto& param : config["safety_limits"]) {
            CertifiedParam cp;
            cp.name = param.first.as<std::string>();
            cp.value = param.second["value"].as<double>();
            cp.unit = param.second["unit"].as<std::string>();
            cp.standard_reference = param.second["standard"].as<std::string>();

            values[cp.name] = cp.value;
            params_[cp.name] = cp;
        }

        canonical_representation_ = buildCanonicalRepresentation(values);
        const std::string current_hash = computeSHA256(canonical_representation_);

        if (current_hash != cert_info_.hash) {
            RCLCPP_FATAL(logger_, "TAMPERING DETECTED in certified safety parameters");
            RCLCPP_FATAL(logger_, "  Expected hash: %s", cert_info_.hash.c_str());
            RCLCPP_FATAL(logger_, "  Current hash:  %s", current_hash.c_str());
            return false;
        }

        if (!cert["hmac"]) {
            RCLCPP_ERROR(logger_, "Authenticity field 'hmac' missing from certification metadata");
            return false;
        }
        const std::string expected_hmac = cert["hmac"].as<std::string>();

        std::string secret;
        if (!readSecret(secret)) {
            return false;
        }

        const std::string computed_hmac = computeHMAC(canonical_representation_, secret);
        if (expected_hmac.size() != computed_hmac.size() ||
            CRYPTO_memcmp(expected_hmac.data(), computed_hmac.data(), expected_hmac.size()) != 0) {
            RCLCPP_FATAL(logger_, "AUTHENTICITY CHECK FAILED (hash recomputed without the key?)");
            return false;
        }

        if (!isCertificationValid()) {
            RCLCPP_ERROR(logger_, "Certification EXPIRED (valid until %s) - recertification required",
                         cert_info_.valid_until.c_str());
            return false;
        }

        RCLCPP_INFO(logger_, "Certified parameters validated: %s by %s (%zu parameters, hash %s...)",
                    cert_info_.certificate_id.c_str(), cert_info_.certified_by.c_str(),
                    params_.size(), current_hash.substr(0, 16).c_str());
        return true;

    } catch (const YAML::Exception& e) {
        RCLCPP_ERROR(logger_, "YAML error in %s: %s", config_path_.c_str(), e.what());
        return false;
    }
}

bool CertifiedParamsValidator::readSecret(std::string& secret) const {
    std::ifstream secret_file(secret_path_);
    if (!secret_file.is_open()) {
        RCLCPP_ERROR(logger_, "Could not open secret file: %s", secret_path_.c_str());
        return false;
    }

    std::getline(secret_file, secret);
    if (secret.empty()) {
        RCLCPP_ERROR(logger_, "Secret file is empty: %s", secret_path_.c_str());
        return false;
    }
    return true;
}

double CertifiedParamsValidator::getParameter(const std::string& name) const {
    auto it = params_.find(name);
    if (it == params_.end()) {
        throw std::runtime_error("Parameter not found: " + name);
    }
    return it->second.value;
}

double CertifiedParamsValidator::getParameterOr(const std::string& name, double fallback) const {
    auto it = params_.find(name);
    return it == params_.end() ? fallback : it->second.value;
}

bool CertifiedParamsValidator::hasParameter(const std::string& name) const {
    return params_.count(name) > 0;
}

std::map<std::string, double> CertifiedParamsValidator::getAllParameters() const {
    std::map<std::string, double> result;
    for (const auto& pair : params_) {
        result[pair.first] = pair.second.value;
    }
    return result;
}

bool CertifiedParamsValidator::isCertificationValid() const {
    return std::time(nullptr) < parseISO8601(cert_info_.valid_until);
}

std::string CertifiedParamsValidator::computeCurrentHash() const {
    if (canonical_representation_.empty()) {
        return computeSHA256(buildCanonicalRepresentation(getAllParameters()));
    }
    return computeSHA256(canonical_representation_);
}

std::string CertifiedParamsValidator::buildCanonicalRepresentation(
    const std::map<std::string, double>& values) {
    // std::map iterates in sorted key order
    std::stringstream ss;
    for (const auto& pair : values) {
        ss << pair.first << "=" << std::fixed << std::setprecision(6) << pair.second << ";";
    }
    return ss.str();
}

std::string CertifiedParamsValidator::computeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string CertifiedParamsValidator::computeHMAC(const std::string& data, const std::string& key) {
    unsigned int len = SHA256_DIGEST_LENGTH;
    unsigned char hmac_value[SHA256_DIGEST_LENGTH];

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hmac_value, &len);

    return toHex(hmac_value, len);
}

time_t CertifiedParamsValidator::parseISO8601(const std::string& date_str) const {
    struct tm tm = {};
    std::istringstream ss(date_str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        // Unparseable expiry counts as expired
        RCLCPP_ERROR(logger_, "Failed to parse certification date: %s", date_str.c_str());
        return 0;
    }

    return timegm(&tm);
}

}  // namespace navl
