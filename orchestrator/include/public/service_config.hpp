#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

namespace basil {

/**
 * @brief Process-wide settings of a CampaignService.
 *
 * JSON keys, all optional: workspace, optimizer_timeout_ms, log_level,
 * fallback_seed.
 */
struct ServiceConfig {
  boost::filesystem::path workspace = ".";
  std::chrono::milliseconds optimizer_timeout{30000};
  std::string log_level = "info";
  boost::optional<uint64_t> fallback_seed;

  /// @throws ValidationError on wrongly typed or out-of-range values.
  static ServiceConfig from_json(const nlohmann::json &j);
  nlohmann::json to_json() const;
};

/**
 * @brief Reads a ServiceConfig from a JSON file. A relative workspace is
 * taken relative to the file's directory.
 */
class ConfigLoader {
public:
  explicit ConfigLoader(boost::filesystem::path config_path);

  /// @throws StorageError if unreadable, ValidationError if malformed.
  ServiceConfig load() const;

private:
  boost::filesystem::path _path;
};

} // namespace basil
