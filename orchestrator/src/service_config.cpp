#include <public/atomic_file.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>
#include <public/service_config.hpp>

namespace fs = boost::filesystem;
using json = nlohmann::json;

namespace basil {

ServiceConfig ServiceConfig::from_json(const json &j) {
  if (!j.is_object()) {
    throw ValidationError("Service configuration must be a JSON object");
  }
  ServiceConfig c;
  try {
    if (j.count("workspace")) {
      c.workspace = j.at("workspace").get<std::string>();
    }
    if (j.count("optimizer_timeout_ms")) {
      const json &t = j.at("optimizer_timeout_ms");
      if (!t.is_number_integer() || t.get<long long>() <= 0) {
        throw ValidationError("optimizer_timeout_ms must be a positive integer");
      }
      c.optimizer_timeout = std::chrono::milliseconds(t.get<long long>());
    }
    if (j.count("log_level")) {
      c.log_level = j.at("log_level").get<std::string>();
    }
    if (j.count("fallback_seed") && !j.at("fallback_seed").is_null()) {
      const json &s = j.at("fallback_seed");
      if (!s.is_number_integer() || s.get<long long>() < 0) {
        throw ValidationError("fallback_seed must be a non-negative integer");
      }
      c.fallback_seed = s.get<uint64_t>();
    }
  } catch (const json::exception &e) {
    throw ValidationError(std::string("Malformed service configuration: ") +
                          e.what());
  }
  return c;
}

json ServiceConfig::to_json() const {
  json j;
  j["workspace"] = workspace.string();
  j["optimizer_timeout_ms"] = optimizer_timeout.count();
  j["log_level"] = log_level;
  if (fallback_seed) {
    j["fallback_seed"] = *fallback_seed;
  } else {
    j["fallback_seed"] = nullptr;
  }
  return j;
}

ConfigLoader::ConfigLoader(fs::path config_path)
    : _path(std::move(config_path)) {}

ServiceConfig ConfigLoader::load() const {
  const std::string text = read_file(_path);
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ValidationError("Cannot parse " + _path.string() + ": " + e.what());
  }
  ServiceConfig c = ServiceConfig::from_json(j);
  if (c.workspace.is_relative()) {
    c.workspace = _path.parent_path() / c.workspace;
  }
  get_logger("service")->debug("Loaded service configuration from {}",
                               _path.string());
  return c;
}

} // namespace basil
