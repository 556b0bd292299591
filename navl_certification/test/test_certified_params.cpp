#include <gtest/gtest.h>
#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

#include "certified_params_validator.hpp"
#include "safety_core_config.hpp"

using navl::CertifiedParamsValidator;
using navl::SafetyCoreConfig;

namespace
{
constexpr const char * kTestKey = "unit-test-key";

const std::string kConfigDir = NAVL_TEST_CONFIG_DIR;
}

class CertifiedParamsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    const auto unique_suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    temp_dir_ = std::filesystem::temp_directory_path() / ("navl_certified_params_test_" + unique_suffix);
    std::filesystem::create_directories(temp_dir_);

    key_path_ = temp_dir_ / "cert.key";
    std::ofstream key_file(key_path_);
    key_file << kTestKey << "\n";
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  // Write a parameter file signed with kTestKey over `signed_values`,
  // but listing `listed_values` under safety_limits
  std::string writeParams(
    const std::map<std::string, double> & listed_values,
    const std::map<std::string, double> & signed_values,
    const std::string & valid_until = "2099-01-01T00:00:00Z")
  {
    const std::string canonical = CertifiedParamsValidator::buildCanonicalRepresentation(signed_values);
    const auto path = temp_dir_ / "params.yaml";

    std::ofstream file(path);
    file << "certification:\n";
    file << "  hash: \"" << CertifiedParamsValidator::computeSHA256(canonical) << "\"\n";
    file << "  hmac: \"" << CertifiedParamsValidator::computeHMAC(canonical, kTestKey) << "\"\n";
    file << "  date: \"2026-01-01T00:00:00Z\"\n";
    file << "  certified_by: \"Unit Test\"\n";
    file << "  certificate_id: \"TEST-001\"\n";
    file << "  valid_until: \"" << valid_until << "\"\n";
    file << "  project_version: \"0.0.0\"\n";
    file << "safety_limits:\n";
    for (const auto & pair : listed_values) {
      file << "  " << pair.first << ":\n";
      file << "    value: " << pair.second << "\n";
      file << "    unit: \"-\"\n";
      file << "    standard: \"test\"\n";
    }
    return path.string();
  }

  std::string writeParams(
    const std::map<std::string, double> & values,
    const std::string & valid_until = "2099-01-01T00:00:00Z")
  {
    return writeParams(values, values, valid_until);
  }

  static std::map<std::string, double> tunedValues()
  {
    return {
      {"cbf_alpha", 7.0},
      {"cbf_min_alpha", 6.0},
      {"cbf_max_alpha", 9.0},
      {"safety_margin", 0.75},
      {"raim_threshold", 3.0},
      {"p_score_threshold", 40.0},
      {"sim2val_window_size", 25.0},
      {"control_variate_beta", 0.25},
      {"near_miss_range", 4.0},
    };
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path key_path_;
};

TEST_F(CertifiedParamsTest, ShippedParametersValidate)
{
  CertifiedParamsValidator validator(
    kConfigDir + "/certified_safety_params.yaml", kConfigDir + "/cert.key");

  ASSERT_TRUE(validator.loadAndValidate());
  EXPECT_TRUE(validator.isCertificationValid());
  EXPECT_EQ(validator.getCertificationInfo().certificate_id, "NAVL-CERT-2026-001");
  EXPECT_DOUBLE_EQ(validator.getParameter("safety_margin"), 0.5);
  EXPECT_EQ(validator.computeCurrentHash(), validator.getCertificationInfo().hash);

  const SafetyCoreConfig config = SafetyCoreConfig::fromCertifiedParams(validator);
  EXPECT_DOUBLE_EQ(config.barrier.alpha, 5.0);
  EXPECT_DOUBLE_EQ(config.barrier.max_alpha, 10.0);
  EXPECT_DOUBLE_EQ(config.estimator.raim_threshold, 2.0);
  EXPECT_DOUBLE_EQ(config.scorer.safety_threshold, 50.0);
  EXPECT_EQ(config.compiler.window_size, 100u);
}

TEST_F(CertifiedParamsTest, MapsParametersOntoComponents)
{
  CertifiedParamsValidator validator(writeParams(tunedValues()), key_path_.string());
  ASSERT_TRUE(validator.loadAndValidate());

  const SafetyCoreConfig config = SafetyCoreConfig::fromCertifiedParams(validator);
  EXPECT_DOUBLE_EQ(config.barrier.alpha, 7.0);
  EXPECT_DOUBLE_EQ(config.barrier.min_alpha, 6.0);
  EXPECT_DOUBLE_EQ(config.barrier.max_alpha, 9.0);
  EXPECT_DOUBLE_EQ(config.barrier.safety_margin, 0.75);
  EXPECT_DOUBLE_EQ(config.estimator.raim_threshold, 3.0);
  EXPECT_DOUBLE_EQ(config.scorer.safety_threshold, 40.0);
  EXPECT_EQ(config.compiler.window_size, 25u);
  EXPECT_DOUBLE_EQ(config.compiler.beta, 0.25);
  EXPECT_DOUBLE_EQ(config.compiler.near_miss_range, 4.0);

  // Not listed: defaults retained
  EXPECT_DOUBLE_EQ(config.scorer.max_goal_distance, 10.0);
  EXPECT_DOUBLE_EQ(config.estimator.measurement_noise.x, 0.1);
  EXPECT_FALSE(validator.hasParameter("max_goal_distance"));
  EXPECT_DOUBLE_EQ(validator.getParameterOr("max_goal_distance", 12.0), 12.0);
  EXPECT_THROW(validator.getParameter("max_goal_distance"), std::runtime_error);
}

TEST_F(CertifiedParamsTest, TamperedValueIsRejected)
{
  auto listed = tunedValues();
  listed["safety_margin"] = 0.05;

  CertifiedParamsValidator validator(writeParams(listed, tunedValues()), key_path_.string());
  EXPECT_FALSE(validator.loadAndValidate());
}

TEST_F(CertifiedParamsTest, WrongKeyIsRejected)
{
  const std::string params_path = writeParams(tunedValues());

  const auto other_key = temp_dir_ / "other.key";
  std::ofstream key_file(other_key);
  key_file << "some-other-key\n";
  key_file.close();

  CertifiedParamsValidator validator(params_path, other_key.string());
  EXPECT_FALSE(validator.loadAndValidate());
}

TEST_F(CertifiedParamsTest, MissingKeyIsRejected)
{
  CertifiedParamsValidator validator(
    writeParams(tunedValues()), (temp_dir_ / "absent.key").string());
  EXPECT_FALSE(validator.loadAndValidate());
}

TEST_F(CertifiedParamsTest, ExpiredCertificationIsRejected)
{
  CertifiedParamsValidator validator(
    writeParams(tunedValues(), "2001-01-01T00:00:00Z"), key_path_.string());
  EXPECT_FALSE(validator.loadAndValidate());
  EXPECT_FALSE(validator.isCertificationValid());
}

TEST_F(CertifiedParamsTest, UnparseableExpiryCountsAsExpired)
{
  CertifiedParamsValidator validator(writeParams(tunedValues(), "someday"), key_path_.string());
  EXPECT_FALSE(validator.loadAndValidate());
}

TEST_F(CertifiedParamsTest, MissingFileIsRejected)
{
  CertifiedParamsValidator validator((temp_dir_ / "absent.yaml").string(), key_path_.string());
  EXPECT_FALSE(validator.loadAndValidate());
}

TEST_F(CertifiedParamsTest, FractionalWindowSizeThrows)
{
  auto values = tunedValues();
  values["sim2val_window_size"] = 12.5;

  CertifiedParamsValidator validator(writeParams(values), key_path_.string());
  ASSERT_TRUE(validator.loadAndValidate());
  EXPECT_THROW(SafetyCoreConfig::fromCertifiedParams(validator), std::invalid_argument);
}

TEST_F(CertifiedParamsTest, InvertedAlphaRangeThrows)
{
  auto values = tunedValues();
  values["cbf_min_alpha"] = 12.0;

  CertifiedParamsValidator validator(writeParams(values), key_path_.string());
  ASSERT_TRUE(validator.loadAndValidate());
  EXPECT_THROW(SafetyCoreConfig::fromCertifiedParams(validator), std::invalid_argument);
}

TEST(SafetyCoreConfigTest, DefaultsAreValid)
{
  EXPECT_NO_THROW(SafetyCoreConfig().validate());
}

TEST(SafetyCoreConfigTest, ValidateRejectsMalformedValues)
{
  SafetyCoreConfig zero_window;
  zero_window.compiler.window_size = 0;
  EXPECT_THROW(zero_window.validate(), std::invalid_argument);

  SafetyCoreConfig zero_margin;
  zero_margin.barrier.safety_margin = 0.0;
  EXPECT_THROW(zero_margin.validate(), std::invalid_argument);

  SafetyCoreConfig negative_rate;
  negative_rate.compilation_rate_hz = -1.0;
  EXPECT_THROW(negative_rate.validate(), std::invalid_argument);
}
