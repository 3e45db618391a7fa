#include <public/atomic_file.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>
#include <public/settings_service.hpp>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;
using json = nlohmann::json;

namespace basil {

namespace {
const char kRecentKey[] = "recent_campaign";
}

SettingsService::SettingsService(fs::path workspace)
    : _path(std::move(workspace) / "settings.json") {}

void SettingsService::load() {
  _recent = boost::none;
  _document = json::object();
  boost::system::error_code ec;
  if (!fs::exists(_path, ec)) {
    return;
  }
  try {
    json j = json::parse(read_file(_path));
    if (!j.is_object()) {
      throw ValidationError("settings.json is not a JSON object");
    }
    if (j.count(kRecentKey) && j.at(kRecentKey).is_string()) {
      _recent = j.at(kRecentKey).get<std::string>();
    }
    _document = std::move(j);
  } catch (const json::exception &e) {
    get_logger("service")->warn("Ignoring unreadable {}: {}", _path.string(),
                                e.what());
  } catch (const BasilError &e) {
    get_logger("service")->warn("Ignoring unreadable {}: {}", _path.string(),
                                e.what());
  }
}

void SettingsService::save() const {
  json j = _document;
  if (_recent) {
    j[kRecentKey] = *_recent;
  } else {
    j.erase(kRecentKey);
  }
  write_file_atomic(_path, j.dump(2));
}

} // namespace basil
