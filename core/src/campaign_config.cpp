#include <public/campaign_config.hpp>
#include <public/config_migration.hpp>
#include <public/errors.hpp>
#include <public/hashing.hpp>
#include <public/timestamp.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using json = nlohmann::json;

namespace basil {

const int CampaignConfig::kSchemaVersion;

namespace {

std::string new_campaign_id() {
  boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

json hashed_content(const ParameterSpace &parameters,
                    const ObjectiveSpec &objectives, const json &settings) {
  json j;
  j["parameters"] = parameters.to_json();
  j["objectives"] = objectives.to_json();
  j["settings"] = settings;
  return j;
}

} // namespace

void CampaignConfig::validate_spec(const CampaignSpec &spec) {
  if (spec.name.empty()) {
    throw ValidationError("Campaign name must not be empty");
  }
  spec.parameters.validate();
  spec.objectives.validate();
  for (const auto &o : spec.objectives.objectives()) {
    if (spec.parameters.find(o.name)) {
      throw ValidationError("Objective '" + o.name +
                            "' has the same name as a parameter");
    }
  }
  if (!spec.settings.is_object()) {
    throw ValidationError("Campaign settings must be a JSON object");
  }
}

CampaignConfig CampaignConfig::create(const std::string &name,
                                      ParameterSpace parameters,
                                      ObjectiveSpec objectives,
                                      json settings) {
  CampaignSpec spec;
  spec.name = name;
  spec.parameters = std::move(parameters);
  spec.objectives = std::move(objectives);
  spec.settings = std::move(settings);
  return create(spec);
}

CampaignConfig CampaignConfig::create(const CampaignSpec &spec) {
  validate_spec(spec);
  CampaignConfig config;
  config._id = new_campaign_id();
  config._name = spec.name;
  config._description = spec.description;
  config._parameters = spec.parameters;
  config._objectives = spec.objectives;
  config._settings = spec.settings;
  config._version = 1;
  config._created_at = now_millis();
  config._updated_at = config._created_at;
  return config;
}

bool CampaignConfig::edit(const CampaignSpec &spec) {
  validate_spec(spec);
  const std::string before = config_hash();
  const std::string after = fnv1a_hex(
      hashed_content(spec.parameters, spec.objectives, spec.settings).dump());
  const bool structural = before != after;

  _name = spec.name;
  _description = spec.description;
  _parameters = spec.parameters;
  _objectives = spec.objectives;
  _settings = spec.settings;
  if (structural) {
    ++_version;
  }
  _updated_at = now_millis();
  return structural;
}

std::string CampaignConfig::config_hash() const {
  // json objects keep keys sorted, so dump() is canonical
  return fnv1a_hex(hashed_content(_parameters, _objectives, _settings).dump());
}

CampaignSpec CampaignConfig::spec() const {
  CampaignSpec spec;
  spec.name = _name;
  spec.description = _description;
  spec.parameters = _parameters;
  spec.objectives = _objectives;
  spec.settings = _settings;
  return spec;
}

json CampaignConfig::to_json() const {
  json j;
  j["schema"] = kSchemaVersion;
  j["id"] = _id;
  j["name"] = _name;
  j["description"] = _description;
  j["parameters"] = _parameters.to_json();
  j["objectives"] = _objectives.to_json();
  j["settings"] = _settings;
  j["version"] = _version;
  j["created_at"] = _created_at;
  j["updated_at"] = _updated_at;
  return j;
}

std::string CampaignConfig::serialize() const { return to_json().dump(2); }

CampaignConfig CampaignConfig::from_json(const json &j, bool *migrated) {
  int steps = 0;
  json doc = ConfigMigrator::standard().migrate(j, steps);
  if (migrated) {
    *migrated = steps > 0;
  }

  CampaignConfig config;
  try {
    config._id = doc.at("id").get<std::string>();
    config._name = doc.at("name").get<std::string>();
    config._description = doc.value("description", std::string());
    config._parameters = ParameterSpace::from_json(doc.at("parameters"));
    config._objectives = ObjectiveSpec::from_json(doc.at("objectives"));
    config._settings = doc.value("settings", json::object());
    config._version = doc.at("version").get<int>();
    config._created_at = doc.value("created_at", static_cast<int64_t>(0));
    config._updated_at = doc.value("updated_at", config._created_at);
  } catch (const json::exception &e) {
    throw ValidationError(std::string("Malformed campaign config: ") +
                          e.what());
  }
  if (config._id.empty()) {
    throw ValidationError("Campaign config has an empty id");
  }
  if (config._version < 1) {
    throw ValidationError("Campaign config version must be >= 1");
  }
  validate_spec(config.spec());

  if (steps > 0) {
    ++config._version;
    config._updated_at = now_millis();
  }
  return config;
}

CampaignConfig CampaignConfig::deserialize(const std::string &text,
                                           bool *migrated) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ValidationError(std::string("Campaign config is not valid JSON: ") +
                          e.what());
  }
  return from_json(doc, migrated);
}

bool CampaignConfig::operator==(const CampaignConfig &o) const {
  return _id == o._id && _name == o._name && _description == o._description &&
         _parameters == o._parameters && _objectives == o._objectives &&
         _settings == o._settings && _version == o._version &&
         _created_at == o._created_at && _updated_at == o._updated_at;
}

} // namespace basil
