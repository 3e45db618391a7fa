#include "private/json_codec.hpp"
#include <public/errors.hpp>

using json = nlohmann::json;

namespace basil {
namespace detail {

namespace {

Row row_from_json(const json &j) {
  if (!j.is_object()) {
    throw ValidationError("A row must be a JSON object");
  }
  Row row;
  for (auto it = j.begin(); it != j.end(); ++it) {
    row[it.key()] = ParameterValue::from_json(it.value());
  }
  return row;
}

Measurement measurement_from_json(const json &j) {
  if (!j.is_object()) {
    throw ValidationError("Measured values must be a JSON object");
  }
  Measurement m;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_number()) {
      throw ValidationError("Value of objective '" + it.key() +
                            "' is not a number");
    }
    m[it.key()] = it.value().get<double>();
  }
  return m;
}

} // namespace

CampaignSpec spec_from_json(const json &j) {
  try {
    if (!j.is_object()) {
      throw ValidationError("Campaign spec must be a JSON object");
    }
    CampaignSpec spec;
    spec.name = j.value("name", std::string());
    spec.description = j.value("description", std::string());
    spec.parameters = ParameterSpace::from_json(j.at("parameters"));
    spec.objectives = ObjectiveSpec::from_json(j.at("objectives"));
    if (j.count("settings")) {
      spec.settings = j.at("settings");
    }
    return spec;
  } catch (const json::exception &e) {
    throw ValidationError(std::string("Malformed campaign spec: ") + e.what());
  }
}

std::vector<Measurement> measurements_from_json(const json &j) {
  if (!j.is_array()) {
    throw ValidationError("Results must be a JSON array");
  }
  std::vector<Measurement> rows;
  for (const auto &item : j) {
    rows.push_back(measurement_from_json(item));
  }
  return rows;
}

std::vector<ImportedRun> imported_runs_from_json(const json &j) {
  if (!j.is_array()) {
    throw ValidationError("Imported runs must be a JSON array");
  }
  std::vector<ImportedRun> runs;
  try {
    for (const auto &item : j) {
      ImportedRun run;
      run.row = row_from_json(item.at("row"));
      run.values = measurement_from_json(item.at("values"));
      runs.push_back(std::move(run));
    }
  } catch (const json::exception &e) {
    throw ValidationError(std::string("Malformed imported run: ") + e.what());
  }
  return runs;
}

json row_to_json(const Row &row) {
  json j = json::object();
  for (const auto &kv : row) {
    j[kv.first] = kv.second.to_json();
  }
  return j;
}

json batch_to_json(const RunBatch &batch) {
  json j;
  j["batch_id"] = batch.batch_id;
  j["generated_at"] = batch.generated_at;
  j["status"] = to_string(batch.status);
  j["source"] = to_string(batch.source);
  j["config_version"] = batch.config_version;
  j["rows"] = json::array();
  for (const auto &row : batch.rows) {
    j["rows"].push_back(row_to_json(row));
  }
  return j;
}

json result_to_json(const RunResult &result) {
  json j;
  j["batch_id"] = result.batch_id;
  j["row_index"] = result.row_index;
  j["values"] = result.values;
  j["ingested_at"] = result.ingested_at;
  return j;
}

json history_to_json(const RunHistory &history) {
  json j;
  j["batches"] = json::array();
  for (const auto &b : history.batches()) {
    j["batches"].push_back(batch_to_json(b));
  }
  j["results"] = json::array();
  for (const auto &r : history.results()) {
    j["results"].push_back(result_to_json(r));
  }
  return j;
}

json summary_to_json(const CampaignSummary &summary) {
  json j;
  j["id"] = summary.id;
  j["name"] = summary.name;
  j["version"] = summary.version;
  j["updated_at"] = summary.updated_at;
  return j;
}

json best_arm_to_json(const BestArm &best) {
  json j;
  j["row"] = row_to_json(best.row);
  j["mean"] = best.mean;
  j["uncertainty"] = best.uncertainty;
  return j;
}

} // namespace detail
} // namespace basil
