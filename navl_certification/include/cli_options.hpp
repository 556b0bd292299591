#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace navl
{
struct CliOptions
{
  bool autostart{false};
  std::optional<std::string> certificate_log_path;
};

namespace detail
{
inline std::string normalize_flag_value(const char * raw)
{
  std::string value(raw);
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [&](unsigned char c) { return !is_space(c); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [&](unsigned char c) { return !is_space(c); }).base(), value.end());
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}
}  // namespace detail

/**
 * @brief Strip navl-specific flags from argv before handing it to rclcpp.
 *
 * Recognised: --autostart, --no-autostart, --certificate-log=<path>.
 * Without an explicit autostart flag NAVL_AUTOSTART (1/true/yes/on) decides.
 * @param filtered Remaining arguments, nullptr-terminated
 * @throws std::invalid_argument on conflicting or malformed flags
 */
inline CliOptions parse_cli_arguments(int argc, char * argv[], std::vector<char *> & filtered)
{
  if (argc < 0) {
    throw std::invalid_argument("argc cannot be negative");
  }
  if (argc > 0 && argv == nullptr) {
    throw std::invalid_argument("argv cannot be null when argc > 0");
  }

  static constexpr char kLogFlag[] = "--certificate-log=";
  constexpr std::size_t kLogFlagLen = sizeof(kLogFlag) - 1;

  CliOptions options;
  bool autostart_set = false;

  filtered.clear();
  filtered.reserve(static_cast<size_t>(argc) + 1);
  if (argc > 0) {
    filtered.push_back(argv[0]);
  }

  for (int i = 1; i < argc; ++i) {
    if (argv[i] == nullptr) {
      throw std::invalid_argument("argv contains a null entry");
    }

    const bool is_autostart = std::strcmp(argv[i], "--autostart") == 0;
    const bool is_no_autostart = std::strcmp(argv[i], "--no-autostart") == 0;

    if (is_autostart || is_no_autostart) {
      if (autostart_set && options.autostart != is_autostart) {
        throw std::invalid_argument(
          "Conflicting autostart flags detected (both --autostart and --no-autostart)");
      }
      options.autostart = is_autostart;
      autostart_set = true;
      continue;
    }

    if (std::strncmp(argv[i], kLogFlag, kLogFlagLen) == 0) {
      std::string path(argv[i] + kLogFlagLen);
      if (path.empty()) {
        throw std::invalid_argument("--certificate-log requires a path");
      }
      options.certificate_log_path = path;
      continue;
    }

    filtered.push_back(argv[i]);
  }

  filtered.push_back(nullptr);

  if (!autostart_set) {
    if (const char * env = std::getenv("NAVL_AUTOSTART")) {
      const std::string value = detail::normalize_flag_value(env);
      options.autostart = (value == "1" || value == "true" || value == "yes" || value == "on");
    }
  }

  return options;
}
}  // namespace navl
