#pragma once
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

namespace basil {

/**
 * @brief User preferences kept in <workspace>/settings.json. Currently only
 * the most recently opened campaign; unknown keys are preserved.
 */
class SettingsService {
public:
  explicit SettingsService(boost::filesystem::path workspace);

  /// Missing file: defaults. Unparsable file: defaults and a warning.
  void load();

  /// @throws StorageError
  void save() const;

  boost::optional<std::string> recent_campaign() const { return _recent; }
  void set_recent_campaign(const std::string &campaign_id) {
    _recent = campaign_id;
  }
  void clear_recent_campaign() { _recent = boost::none; }

  const boost::filesystem::path &path() const { return _path; }

private:
  boost::filesystem::path _path;
  boost::optional<std::string> _recent;
  nlohmann::json _document = nlohmann::json::object();
};

} // namespace basil
