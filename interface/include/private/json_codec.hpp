#pragma once
#include <vector>

#include <nlohmann/json.hpp>

#include <public/campaign_config.hpp>
#include <public/campaign_orchestrator.hpp>
#include <public/campaign_service.hpp>
#include <public/run_history.hpp>

namespace basil {
namespace detail {

// Decoders throw ValidationError on malformed documents.
CampaignSpec spec_from_json(const nlohmann::json &j);
std::vector<Measurement> measurements_from_json(const nlohmann::json &j);
std::vector<ImportedRun> imported_runs_from_json(const nlohmann::json &j);

nlohmann::json row_to_json(const Row &row);
nlohmann::json batch_to_json(const RunBatch &batch);
nlohmann::json result_to_json(const RunResult &result);
nlohmann::json history_to_json(const RunHistory &history);
nlohmann::json summary_to_json(const CampaignSummary &summary);
nlohmann::json best_arm_to_json(const BestArm &best);

} // namespace detail
} // namespace basil
