#include <public/config_migration.hpp>
#include <public/errors.hpp>

#include <string>

using json = nlohmann::json;

namespace basil {

ConfigMigrator ConfigMigrator::standard() {
  ConfigMigrator migrator(2);
  migrator.register_step(1, &migrate_schema_1_to_2);
  return migrator;
}

void ConfigMigrator::register_step(int from_schema, Step step) {
  _steps[from_schema] = std::move(step);
}

json ConfigMigrator::migrate(const json &doc, int &steps_applied) const {
  steps_applied = 0;
  if (!doc.is_object()) {
    throw IncompatibleSchemaError("Campaign config is not a JSON object");
  }
  int schema = 1;
  if (doc.contains("schema")) {
    if (!doc.at("schema").is_number_integer()) {
      throw IncompatibleSchemaError("Campaign config schema is not an integer");
    }
    schema = doc.at("schema").get<int>();
  }
  if (schema > _current) {
    throw IncompatibleSchemaError(
        "Campaign config schema " + std::to_string(schema) +
        " is newer than supported schema " + std::to_string(_current));
  }
  if (schema < 1) {
    throw IncompatibleSchemaError("Invalid campaign config schema " +
                                  std::to_string(schema));
  }

  json current = doc;
  while (schema < _current) {
    auto it = _steps.find(schema);
    if (it == _steps.end()) {
      throw IncompatibleSchemaError("No migration from campaign config schema " +
                                    std::to_string(schema));
    }
    try {
      current = it->second(current);
    } catch (const json::exception &e) {
      throw IncompatibleSchemaError("Migration from schema " +
                                    std::to_string(schema) +
                                    " failed: " + e.what());
    }
    ++schema;
    current["schema"] = schema;
    ++steps_applied;
  }
  return current;
}

json migrate_schema_1_to_2(const json &doc) {
  json out = doc;

  json parameters = json::array();
  for (const auto &p : doc.at("parameters")) {
    json q;
    q["name"] = p.at("name");
    const std::string kind = p.at("type").get<std::string>();
    q["kind"] = kind;
    if (kind == "continuous") {
      q["lower"] = p.at("bounds").at(0);
      q["upper"] = p.at("bounds").at(1);
    } else if (kind == "discrete") {
      q["values"] = p.at("values");
    } else if (kind == "categorical") {
      q["levels"] = p.at("levels");
    } else if (kind == "fixed") {
      q["value"] = p.at("value");
    } else if (kind == "chemistry") {
      // schema 1 stored the pool as an object keyed by label
      json pool = json::array();
      for (auto it = p.at("smiles").begin(); it != p.at("smiles").end(); ++it) {
        pool.push_back({{"label", it.key()}, {"smiles", it.value()}});
      }
      q["candidates"] = pool;
    } else {
      throw IncompatibleSchemaError("Schema 1 parameter type '" + kind +
                                    "' has no migration");
    }
    parameters.push_back(q);
  }
  out["parameters"] = parameters;

  json objectives = json::array();
  for (const auto &t : doc.at("targets")) {
    json o;
    o["name"] = t.at("name");
    const std::string mode = t.at("mode").get<std::string>();
    if (mode == "MAX") {
      o["direction"] = "maximize";
    } else if (mode == "MIN") {
      o["direction"] = "minimize";
    } else {
      throw IncompatibleSchemaError("Schema 1 target mode '" + mode +
                                    "' has no migration");
    }
    o["weight"] = t.value("weight", 1.0);
    if (t.contains("bounds")) {
      o["lower"] = t.at("bounds").at(0);
      o["upper"] = t.at("bounds").at(1);
    }
    objectives.push_back(o);
  }
  out.erase("targets");
  out["objectives"] = objectives;

  if (!out.contains("description")) {
    out["description"] = "";
  }
  if (!out.contains("settings")) {
    out["settings"] = json::object();
  }
  return out;
}

} // namespace basil
