#include <public/campaign_orchestrator.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>
#include <public/timestamp.hpp>

#include <chrono>
#include <map>
#include <set>

namespace fs = boost::filesystem;

namespace basil {

namespace {

struct StateInfo {
  std::string name;
  std::set<OrchestratorState> next_states;
};

const std::map<OrchestratorState, StateInfo> &state_machine_config() {
  static const std::map<OrchestratorState, StateInfo> config = {
      {OrchestratorState::Idle,
       {"Idle", {OrchestratorState::ResolvingOptimizer}}},
      {OrchestratorState::ResolvingOptimizer,
       {"ResolvingOptimizer",
        {OrchestratorState::Suggesting, OrchestratorState::FallingBack,
         OrchestratorState::Idle}}},
      {OrchestratorState::Suggesting,
       {"Suggesting",
        {OrchestratorState::FallingBack, OrchestratorState::BatchPersisted,
         OrchestratorState::Idle}}},
      {OrchestratorState::FallingBack,
       {"FallingBack",
        {OrchestratorState::BatchPersisted, OrchestratorState::Idle}}},
      {OrchestratorState::BatchPersisted,
       {"BatchPersisted", {OrchestratorState::Idle}}},
  };
  return config;
}

std::string row_label(size_t i) { return "Row " + std::to_string(i) + ": "; }

} // namespace

std::string to_string(OrchestratorState state) {
  return state_machine_config().at(state).name;
}

std::unique_ptr<CampaignOrchestrator> CampaignOrchestrator::create(
    const fs::path &workspace, const CampaignSpec &spec,
    std::shared_ptr<OptimizerAdapter> adapter, std::shared_ptr<EventSink> sink,
    OrchestratorOptions options) {
  CampaignConfig config = CampaignConfig::create(spec);
  CampaignStore store(workspace, config.id());
  std::unique_ptr<CampaignLock> lock(new CampaignLock(store.lock_path()));
  store.save_config(config);
  get_logger("campaign")
      ->info("Created campaign {} '{}' with {} parameters and {} objectives",
             config.id(), config.name(), config.parameters().size(),
             config.objectives().size());
  return std::unique_ptr<CampaignOrchestrator>(new CampaignOrchestrator(
      workspace, std::move(lock), std::move(config), RunHistory(),
      std::move(adapter), std::move(sink), options));
}

std::unique_ptr<CampaignOrchestrator> CampaignOrchestrator::open(
    const fs::path &workspace, const std::string &campaign_id,
    std::shared_ptr<OptimizerAdapter> adapter, std::shared_ptr<EventSink> sink,
    OrchestratorOptions options) {
  CampaignStore store(workspace, campaign_id);
  if (campaign_id.empty() || !store.exists()) {
    throw CampaignNotFound(campaign_id);
  }
  std::unique_ptr<CampaignLock> lock(new CampaignLock(store.lock_path()));

  bool migrated = false;
  CampaignConfig config = store.load_config(&migrated);
  if (config.id() != campaign_id) {
    throw StorageError("Campaign directory " + campaign_id +
                       " holds config of campaign " + config.id());
  }
  if (migrated) {
    get_logger("campaign")
        ->info("Migrated config of campaign {} to schema {}, now version {}",
               campaign_id, CampaignConfig::kSchemaVersion, config.version());
    store.save_config(config);
  }
  RunHistory history = store.load_history(config);
  get_logger("campaign")
      ->info("Opened campaign {} '{}': {} batches, {} results", campaign_id,
             config.name(), history.batch_count(), history.result_count());
  return std::unique_ptr<CampaignOrchestrator>(new CampaignOrchestrator(
      workspace, std::move(lock), std::move(config), std::move(history),
      std::move(adapter), std::move(sink), options));
}

CampaignOrchestrator::CampaignOrchestrator(
    const fs::path &workspace, std::unique_ptr<CampaignLock> lock,
    CampaignConfig config, RunHistory history,
    std::shared_ptr<OptimizerAdapter> adapter, std::shared_ptr<EventSink> sink,
    OrchestratorOptions options)
    : _id(config.id()), _store(workspace, config.id()), _lock(std::move(lock)),
      _state(OrchestratorState::Idle), _config(std::move(config)),
      _history(std::move(history)), _adapter(std::move(adapter)),
      _sink(std::move(sink)), _options(options),
      _sampler(options.fallback_seed) {}

CampaignOrchestrator::~CampaignOrchestrator() {
  if (_adapter) {
    _adapter->release_campaign(_id);
  }
}

RunBatch CampaignOrchestrator::generate_next_batch(
    size_t batch_size, const GenerateOptions &options) {
  if (batch_size == 0) {
    throw ValidationError("Batch size must be at least 1");
  }
  std::lock_guard<std::mutex> lock(_mutex);

  auto report = [&](double p) {
    if (options.progress) {
      options.progress(p);
    }
  };
  auto check_cancel = [&]() {
    if (options.cancel && options.cancel->cancelled()) {
      throw OperationCancelled("Batch generation for campaign " + _id +
                               " was cancelled");
    }
  };

  try {
    report(0.0);
    check_cancel();

    _transition_to(OrchestratorState::ResolvingOptimizer);
    _publish(CampaignEvent(EventType::OptimizerAttempted, _id)
                 .with("batch_size", std::to_string(batch_size)));

    std::vector<Row> rows;
    BatchSource source = BatchSource::Optimizer;
    std::string failure;
    const std::atomic<bool> *cancel_flag =
        options.cancel ? &options.cancel->flag() : nullptr;
    const auto started = std::chrono::steady_clock::now();
    try {
      _handle = _adapter->resolve(_config, _history, _store,
                                  _options.optimizer_timeout, cancel_flag);
      if (_handle.origin == OptimizerHandle::Origin::Rebuilt) {
        _publish(CampaignEvent(EventType::OptimizerRebuilt, _id)
                     .with("config_hash", _handle.config_hash)
                     .with("observations",
                           std::to_string(_handle.observations)));
      }
      report(0.2);
      _transition_to(OrchestratorState::Suggesting,
                     "handle " + std::to_string(_handle.id) + " (" +
                         to_string(_handle.origin) + ")");
      // resolving and suggesting share one optimizer_timeout
      const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      if (spent >= _options.optimizer_timeout) {
        throw OptimizerUnavailable("Optimizer did not answer within " +
                                   std::to_string(
                                       _options.optimizer_timeout.count()) +
                                   " ms");
      }
      rows = _adapter->suggest_batch(_handle, _config, batch_size,
                                     _options.optimizer_timeout - spent,
                                     cancel_flag);
    } catch (const OptimizerUnavailable &e) {
      failure = e.what();
    }

    if (!failure.empty()) {
      _publish(CampaignEvent(EventType::OptimizerFailed, _id)
                   .with("reason", failure));
      check_cancel();
      _transition_to(OrchestratorState::FallingBack, failure);
      rows = _sampler.sample(_config.parameters(), batch_size);
      source = BatchSource::Fallback;
      _publish(CampaignEvent(EventType::FallbackUsed, _id)
                   .with("rows", std::to_string(rows.size())));
    }
    report(0.8);
    check_cancel();

    RunBatch batch;
    batch.batch_id = _history.next_batch_id();
    batch.generated_at = now_millis();
    batch.rows = std::move(rows);
    batch.status = BatchStatus::Pending;
    batch.source = source;
    batch.config_version = _config.version();

    _store.save_batch(_config, batch, {});
    _history.append_batch(batch);
    _transition_to(OrchestratorState::BatchPersisted, batch.batch_id);
    _publish(CampaignEvent(EventType::BatchPersisted, _id)
                 .with("batch_id", batch.batch_id)
                 .with("rows", std::to_string(batch.rows.size()))
                 .with("source", to_string(batch.source)));
    report(1.0);
    _transition_to(OrchestratorState::Idle);
    return batch;
  } catch (...) {
    if (_state.load() != OrchestratorState::Idle) {
      _transition_to(OrchestratorState::Idle, "aborted");
    }
    throw;
  }
}

bool CampaignOrchestrator::record_results(
    const std::string &batch_id, const std::vector<Measurement> &rows) {
  std::lock_guard<std::mutex> lock(_mutex);
  const RunBatch *batch = _history.find_batch(batch_id);
  if (!batch) {
    throw BatchNotFound(batch_id);
  }
  if (batch->status == BatchStatus::Completed) {
    get_logger("campaign")
        ->info("Batch {} of campaign {} is already completed, ignoring "
               "resubmission",
               batch_id, _id);
    return false;
  }
  if (rows.size() != batch->rows.size()) {
    throw ValidationError("Batch " + batch_id + " has " +
                          std::to_string(batch->rows.size()) +
                          " rows, got results for " +
                          std::to_string(rows.size()));
  }

  const int64_t ingested_at = _history.next_ingested_at(now_millis());
  std::vector<RunResult> results;
  for (size_t i = 0; i < rows.size(); ++i) {
    try {
      _config.objectives().check_measurement(rows[i]);
    } catch (const ValidationError &e) {
      throw ValidationError(row_label(i) + e.what());
    }
    RunResult r;
    r.batch_id = batch_id;
    r.row_index = i;
    r.values = rows[i];
    r.ingested_at = ingested_at;
    results.push_back(std::move(r));
  }

  RunBatch completed = *batch;
  completed.status = BatchStatus::Completed;
  _store.save_batch(_config, completed, results);
  _history.complete_batch(batch_id, results);
  _publish(CampaignEvent(EventType::ResultIngested, _id)
               .with("batch_id", batch_id)
               .with("rows", std::to_string(results.size())));

  _feed_engine();
  return true;
}

RunBatch
CampaignOrchestrator::import_results(const std::vector<ImportedRun> &runs) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (runs.empty()) {
    throw ValidationError("Nothing to import");
  }
  for (size_t i = 0; i < runs.size(); ++i) {
    if (!_config.parameters().contains(runs[i].row)) {
      throw ValidationError(row_label(i) +
                            "values do not match the parameter space");
    }
    try {
      _config.objectives().check_measurement(runs[i].values);
    } catch (const ValidationError &e) {
      throw ValidationError(row_label(i) + e.what());
    }
  }

  const int64_t now = now_millis();
  RunBatch batch;
  batch.batch_id = _history.next_batch_id();
  batch.generated_at = now;
  batch.status = BatchStatus::Completed;
  batch.source = BatchSource::Import;
  batch.config_version = _config.version();
  std::vector<RunResult> results;
  for (size_t i = 0; i < runs.size(); ++i) {
    batch.rows.push_back(runs[i].row);
    RunResult r;
    r.batch_id = batch.batch_id;
    r.row_index = i;
    r.values = runs[i].values;
    r.ingested_at = _history.next_ingested_at(now);
    results.push_back(std::move(r));
  }

  _store.save_batch(_config, batch, results);
  RunBatch pending = batch;
  pending.status = BatchStatus::Pending;
  _history.append_batch(pending);
  _history.complete_batch(batch.batch_id, results);
  _publish(CampaignEvent(EventType::ResultsImported, _id)
               .with("batch_id", batch.batch_id)
               .with("rows", std::to_string(runs.size())));

  _feed_engine();
  return batch;
}

bool CampaignOrchestrator::edit_config(const CampaignSpec &spec) {
  std::lock_guard<std::mutex> lock(_mutex);
  CampaignConfig edited = _config;
  const bool structural = edited.edit(spec);
  _store.save_config(edited);
  _config = std::move(edited);
  if (structural) {
    _adapter->release_campaign(_id);
    _handle = OptimizerHandle();
  }
  _publish(CampaignEvent(EventType::ConfigEdited, _id)
               .with("version", std::to_string(_config.version()))
               .with("structural", structural ? "true" : "false")
               .with("config_hash", _config.config_hash()));
  return structural;
}

boost::optional<BestArm> CampaignOrchestrator::best_arm() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_handle.valid()) {
    try {
      _handle = _adapter->resolve(_config, _history, _store,
                                  _options.optimizer_timeout);
    } catch (const OptimizerUnavailable &e) {
      get_logger("campaign")
          ->warn("No optimizer for campaign {}: {}", _id, e.what());
      return boost::none;
    }
  }
  return _adapter->best_arm(_handle, _config);
}

CampaignConfig CampaignOrchestrator::config() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _config;
}

RunHistory CampaignOrchestrator::history() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _history;
}

OptimizerHandle CampaignOrchestrator::optimizer_handle() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _handle;
}

void CampaignOrchestrator::_transition_to(OrchestratorState next,
                                          const std::string &detail) {
  const OrchestratorState current = _state.load();
  const StateInfo &current_info = state_machine_config().at(current);
  const StateInfo &next_info = state_machine_config().at(next);
  auto log = get_logger("campaign");
  if (!current_info.next_states.count(next)) {
    log->error("Campaign {}: unexpected state transition {} -> {}", _id,
               current_info.name, next_info.name);
  }
  if (detail.empty()) {
    log->debug("Campaign {}: state transition {} -> {}", _id,
               current_info.name, next_info.name);
  } else {
    log->debug("Campaign {}: state transition {} -> {} ({})", _id,
               current_info.name, next_info.name, detail);
  }
  _state.store(next);
}

void CampaignOrchestrator::_publish(const CampaignEvent &event) {
  if (_sink) {
    _sink->publish(event);
  }
}

void CampaignOrchestrator::_feed_engine() {
  if (!_handle.valid() || !_adapter->is_live(_handle)) {
    return;
  }
  try {
    _handle = _adapter->observe(_handle, _config, _history, _store,
                                _options.optimizer_timeout);
  } catch (const OptimizerUnavailable &e) {
    _handle = OptimizerHandle();
    _publish(CampaignEvent(EventType::OptimizerFailed, _id)
                 .with("reason", e.what()));
  }
}

} // namespace basil
