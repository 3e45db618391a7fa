#include <public/errors.hpp>
#include <public/logging.hpp>
#include <public/optimizer_adapter.hpp>
#include <public/parameter_encoder.hpp>
#include <public/timestamp.hpp>

#include <cmath>
#include <future>
#include <thread>
#include <utility>

namespace basil {

constexpr std::chrono::milliseconds OptimizerAdapter::kNoTimeout;

namespace {

using Clock = std::chrono::steady_clock;

const std::chrono::milliseconds kWaitSlice(20);

Measurement objective_values(const CampaignConfig &config,
                             const RunResult &result) {
  Measurement m;
  for (const auto &o : config.objectives().objectives()) {
    m[o.name] = result.values.at(o.name);
  }
  return m;
}

double reward_of(const CampaignConfig &config, const Observation &obs) {
  return config.objectives().scalarize(objective_values(config, *obs.result));
}

Clock::time_point deadline_after(std::chrono::milliseconds timeout) {
  if (timeout == OptimizerAdapter::kNoTimeout) {
    return Clock::time_point::max();
  }
  return Clock::now() + timeout;
}

/**
 * Runs @p work(stop) on a worker thread while the caller waits in slices.
 * On cancellation or at @p deadline the caller raises stop and leaves; the
 * worker finishes alone and everything it owns dies with it.
 */
template <typename Work>
auto run_bounded(Work work, const std::string &what, Clock::time_point deadline,
                 std::chrono::milliseconds timeout,
                 const std::atomic<bool> *cancel)
    -> decltype(work(std::declval<const std::atomic<bool> &>())) {
  using Result = decltype(work(std::declval<const std::atomic<bool> &>()));
  auto stop = std::make_shared<std::atomic<bool>>(false);
  std::promise<Result> promise;
  std::future<Result> future = promise.get_future();
  std::thread worker(
      [stop](Work w, std::promise<Result> p) {
        try {
          p.set_value(w(*stop));
        } catch (...) {
          p.set_exception(std::current_exception());
        }
      },
      std::move(work), std::move(promise));

  while (future.wait_for(kWaitSlice) != std::future_status::ready) {
    const bool cancelled = cancel && cancel->load();
    if (cancelled || Clock::now() >= deadline) {
      stop->store(true);
      worker.detach();
      if (cancelled) {
        throw OptimizerUnavailable(what + " was cancelled");
      }
      throw OptimizerUnavailable(what + " did not finish within " +
                                 std::to_string(timeout.count()) + " ms");
    }
  }
  worker.join();
  return future.get();
}

using EncodedObservation = std::pair<Eigen::VectorXd, double>;

std::vector<EncodedObservation>
encode_observations(const CampaignConfig &config,
                    const std::vector<Observation> &observations, size_t from) {
  ParameterEncoder encoder(config.parameters());
  std::vector<EncodedObservation> out;
  for (size_t i = from; i < observations.size(); ++i) {
    out.emplace_back(encoder.encode(*observations[i].row),
                     reward_of(config, observations[i]));
  }
  return out;
}

} // namespace

std::string to_string(OptimizerHandle::Origin origin) {
  switch (origin) {
  case OptimizerHandle::Origin::Live:
    return "live";
  case OptimizerHandle::Origin::Restored:
    return "restored";
  case OptimizerHandle::Origin::Rebuilt:
    return "rebuilt";
  }
  return "unknown";
}

std::vector<Observation> usable_observations(const CampaignConfig &config,
                                             const RunHistory &history) {
  std::vector<Observation> out;
  for (const auto &obs : history.observations()) {
    if (!config.parameters().contains(*obs.row)) {
      continue;
    }
    bool covered = true;
    for (const auto &o : config.objectives().objectives()) {
      auto it = obs.result->values.find(o.name);
      if (it == obs.result->values.end() || !std::isfinite(it->second)) {
        covered = false;
        break;
      }
    }
    if (covered) {
      out.push_back(obs);
    }
  }
  return out;
}

OptimizerAdapter::OptimizerAdapter(OptimizerFactory factory)
    : _factory(std::move(factory)) {}

OptimizerHandle OptimizerAdapter::resolve(const CampaignConfig &config,
                                          const RunHistory &history,
                                          const CampaignStore &store,
                                          std::chrono::milliseconds timeout,
                                          const std::atomic<bool> *cancel) {
  auto log = get_logger("optimizer");
  ParameterEncoder encoder(config.parameters());
  if (encoder.dim() == 0) {
    throw OptimizerUnavailable("Parameter space of campaign " + config.id() +
                               " has no free dimension");
  }
  const std::vector<Observation> usable = usable_observations(config, history);
  const std::string hash = config.config_hash();

  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _table.find(config.id());
    if (it != _table.end()) {
      const Entry &e = it->second;
      if (e.config_hash == hash && e.observations == usable.size()) {
        OptimizerHandle h;
        h.id = e.id;
        h.campaign_id = config.id();
        h.config_hash = hash;
        h.observations = e.observations;
        h.origin = OptimizerHandle::Origin::Live;
        return h;
      }
      log->info("Dropping live engine of campaign {}: built for {}/{}, "
                "campaign is at {}/{}",
                config.id(), e.config_hash, e.observations, hash,
                usable.size());
      _table.erase(it);
    }
  }

  const Budget budget{deadline_after(timeout), timeout, cancel};
  std::unique_ptr<CampaignOptimizer> engine;
  try {
    engine = _restore(config, store, encoder.dim(), usable.size(), budget);
  } catch (const StaleStateError &e) {
    log->info("Optimizer state of campaign {} is stale: {}", config.id(),
              e.what());
  } catch (const StorageError &e) {
    log->warn("Optimizer state of campaign {} is unreadable: {}", config.id(),
              e.what());
  }
  if (engine) {
    log->debug("Restored engine of campaign {} with {} observations",
               config.id(), usable.size());
    return _install(config, usable.size(), std::move(engine),
                    OptimizerHandle::Origin::Restored);
  }

  engine = _rebuild(config, usable, encoder.dim(), budget);
  log->info("Rebuilt engine of campaign {} from {} observations ({} results "
            "skipped)",
            config.id(), usable.size(), history.result_count() - usable.size());
  OptimizerHandle h = _install(config, usable.size(), std::move(engine),
                               OptimizerHandle::Origin::Rebuilt);
  try {
    persist_state(h, store);
  } catch (const StorageError &) {
    release(h);
    throw;
  }
  return h;
}

std::vector<Row> OptimizerAdapter::suggest_batch(
    const OptimizerHandle &handle, const CampaignConfig &config,
    size_t batch_size, std::chrono::milliseconds timeout,
    const std::atomic<bool> *cancel) {
  if (batch_size == 0) {
    throw ValidationError("Batch size must be at least 1");
  }
  std::unique_ptr<CampaignOptimizer> engine;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    const Entry *e = _find(handle);
    if (!e) {
      throw OptimizerUnavailable("Unknown or released optimizer handle");
    }
    if (e->config_hash != config.config_hash()) {
      throw OptimizerUnavailable("Optimizer handle was built for another "
                                 "version of campaign " +
                                 config.id());
    }
    try {
      engine = e->engine->clone();
    } catch (const std::exception &ex) {
      throw OptimizerUnavailable(std::string("Cannot copy engine: ") +
                                 ex.what());
    }
  }

  // The worker owns the clone; an abandoned call leaves the live engine alone.
  const auto started = Clock::now();
  std::vector<Eigen::VectorXd> points;
  try {
    points = run_bounded(
        [engine = std::move(engine), batch_size](
            const std::atomic<bool> &stop) mutable {
          return engine->act(batch_size, stop);
        },
        "Suggestion", deadline_after(timeout), timeout, cancel);
  } catch (const OptimizerUnavailable &) {
    throw;
  } catch (const std::exception &e) {
    throw OptimizerUnavailable(std::string("Engine failed: ") + e.what());
  }
  if (points.size() != batch_size) {
    throw OptimizerUnavailable("Engine proposed " +
                               std::to_string(points.size()) + " of " +
                               std::to_string(batch_size) + " rows");
  }

  ParameterEncoder encoder(config.parameters());
  std::vector<Row> rows;
  rows.reserve(points.size());
  for (const auto &x : points) {
    try {
      rows.push_back(encoder.decode(x));
    } catch (const ValidationError &e) {
      throw OptimizerUnavailable(std::string("Engine proposal is malformed: ") +
                                 e.what());
    }
  }
  get_logger("optimizer")
      ->debug("Engine proposed {} rows for campaign {} in {} ms", rows.size(),
              config.id(),
              std::chrono::duration_cast<std::chrono::milliseconds>(
                  Clock::now() - started)
                  .count());
  return rows;
}

OptimizerHandle OptimizerAdapter::observe(const OptimizerHandle &handle,
                                          const CampaignConfig &config,
                                          const RunHistory &history,
                                          const CampaignStore &store,
                                          std::chrono::milliseconds timeout,
                                          const std::atomic<bool> *cancel) {
  auto log = get_logger("optimizer");
  const std::vector<Observation> usable = usable_observations(config, history);
  std::unique_ptr<CampaignOptimizer> engine;
  size_t seen = 0;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    Entry *e = _find(handle);
    if (!e) {
      throw OptimizerUnavailable("Unknown or released optimizer handle");
    }
    if (e->config_hash != config.config_hash() ||
        e->observations > usable.size()) {
      _table.erase(handle.campaign_id);
      throw OptimizerUnavailable("Optimizer handle no longer matches "
                                 "campaign " +
                                 config.id());
    }
    seen = e->observations;
    if (seen < usable.size()) {
      try {
        engine = e->engine->clone();
      } catch (const std::exception &ex) {
        _table.erase(handle.campaign_id);
        throw OptimizerUnavailable(std::string("Cannot copy engine: ") +
                                   ex.what());
      }
    }
  }

  OptimizerHandle updated = handle;
  if (!engine) {
    return updated;
  }

  // Updates run on a clone that replaces the live engine once refitted.
  try {
    engine = run_bounded(
        [engine = std::move(engine),
         fresh = encode_observations(config, usable, seen)](
            const std::atomic<bool> &stop) mutable
        -> std::unique_ptr<CampaignOptimizer> {
          for (const auto &obs : fresh) {
            if (stop) {
              return nullptr;
            }
            engine->update(obs.first, obs.second);
          }
          engine->refit();
          return std::move(engine);
        },
        "Observing results", deadline_after(timeout), timeout, cancel);
  } catch (const std::exception &e) {
    release(handle);
    log->warn("Engine of campaign {} failed while observing results: {}",
              config.id(), e.what());
    throw OptimizerUnavailable(
        std::string("Engine failed while observing results: ") + e.what());
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    Entry *e = _find(handle);
    if (!e) {
      throw OptimizerUnavailable("Optimizer handle was released while "
                                 "observing results");
    }
    e->engine = std::move(engine);
    e->observations = usable.size();
  }
  updated.observations = usable.size();
  updated.origin = OptimizerHandle::Origin::Live;
  log->debug("Engine of campaign {} now holds {} observations", config.id(),
             usable.size());

  try {
    persist_state(updated, store);
  } catch (const StorageError &e) {
    // The stored state keeps its old observation count and is rebuilt on
    // the next restore.
    log->warn("Could not persist optimizer state of campaign {}: {}",
              config.id(), e.what());
  }
  return updated;
}

void OptimizerAdapter::persist_state(const OptimizerHandle &handle,
                                     const CampaignStore &store) const {
  OptimizerStateRecord record;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    const Entry *e = _find(handle);
    if (!e) {
      throw OptimizerUnavailable("Unknown or released optimizer handle");
    }
    try {
      record.blob = e->engine->save();
    } catch (const std::exception &ex) {
      throw OptimizerUnavailable(std::string("Cannot serialize engine: ") +
                                 ex.what());
    }
    record.config_hash = e->config_hash;
    record.observations = e->observations;
  }
  record.built_at = now_millis();
  store.save_optimizer_state(record);
}

boost::optional<BestArm>
OptimizerAdapter::best_arm(const OptimizerHandle &handle,
                           const CampaignConfig &config) const {
  Eigen::VectorXd v;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    const Entry *e = _find(handle);
    if (!e) {
      return boost::none;
    }
    v = e->engine->best_arm_prediction();
  }
  ParameterEncoder encoder(config.parameters());
  const long dim = static_cast<long>(encoder.dim());
  if (v.size() != dim + 2) {
    return boost::none;
  }
  BestArm best;
  best.row = encoder.decode(v.head(dim));
  best.mean = v(dim);
  best.uncertainty = v(dim + 1);
  return best;
}

void OptimizerAdapter::release(const OptimizerHandle &handle) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_find(handle)) {
    _table.erase(handle.campaign_id);
  }
}

void OptimizerAdapter::release_campaign(const std::string &campaign_id) {
  std::lock_guard<std::mutex> lock(_mutex);
  _table.erase(campaign_id);
}

bool OptimizerAdapter::is_live(const OptimizerHandle &handle) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _find(handle) != nullptr;
}

size_t OptimizerAdapter::live_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _table.size();
}

std::unique_ptr<CampaignOptimizer>
OptimizerAdapter::_create(const CampaignConfig &config, size_t dim) const {
  std::unique_ptr<CampaignOptimizer> engine;
  try {
    engine = _factory(dim, config.settings());
  } catch (const OptimizerUnavailable &) {
    throw;
  } catch (const std::exception &e) {
    throw OptimizerUnavailable(std::string("Cannot create engine: ") +
                               e.what());
  }
  if (!engine) {
    throw OptimizerUnavailable("Engine factory returned no engine");
  }
  return engine;
}

std::unique_ptr<CampaignOptimizer>
OptimizerAdapter::_restore(const CampaignConfig &config,
                           const CampaignStore &store, size_t dim,
                           size_t expected_observations,
                           const Budget &budget) const {
  boost::optional<OptimizerStateRecord> state = store.load_optimizer_state();
  if (!state) {
    return nullptr;
  }
  if (state->config_hash != config.config_hash()) {
    throw StaleStateError("built for config " + state->config_hash +
                          ", campaign is at " + config.config_hash());
  }
  if (state->observations != expected_observations) {
    throw StaleStateError("built from " + std::to_string(state->observations) +
                          " observations, campaign has " +
                          std::to_string(expected_observations));
  }
  std::unique_ptr<CampaignOptimizer> engine = _create(config, dim);
  try {
    engine = run_bounded(
        [engine = std::move(engine), blob = std::move(state->blob)](
            const std::atomic<bool> &) mutable {
          engine->load(blob);
          return std::move(engine);
        },
        "Restoring the engine", budget.deadline, budget.timeout,
        budget.cancel);
  } catch (const OptimizerUnavailable &) {
    throw;
  } catch (const std::exception &e) {
    get_logger("optimizer")
        ->warn("Optimizer state of campaign {} is corrupt: {}", config.id(),
               e.what());
    return nullptr;
  }
  if (engine->observation_count() != expected_observations) {
    throw StaleStateError("engine blob holds " +
                          std::to_string(engine->observation_count()) +
                          " observations");
  }
  return engine;
}

std::unique_ptr<CampaignOptimizer>
OptimizerAdapter::_rebuild(const CampaignConfig &config,
                           const std::vector<Observation> &observations,
                           size_t dim, const Budget &budget) const {
  std::unique_ptr<CampaignOptimizer> engine = _create(config, dim);
  try {
    return run_bounded(
        [engine = std::move(engine),
         replay = encode_observations(config, observations, 0)](
            const std::atomic<bool> &stop) mutable
        -> std::unique_ptr<CampaignOptimizer> {
          for (const auto &obs : replay) {
            if (stop) {
              return nullptr;
            }
            engine->update(obs.first, obs.second);
          }
          engine->refit();
          return std::move(engine);
        },
        "Rebuilding the engine", budget.deadline, budget.timeout,
        budget.cancel);
  } catch (const OptimizerUnavailable &) {
    throw;
  } catch (const std::exception &e) {
    throw OptimizerUnavailable(std::string("Engine failed while rebuilding: ") +
                               e.what());
  }
}

OptimizerHandle
OptimizerAdapter::_install(const CampaignConfig &config, size_t observations,
                           std::unique_ptr<CampaignOptimizer> engine,
                           OptimizerHandle::Origin origin) {
  std::lock_guard<std::mutex> lock(_mutex);
  Entry entry;
  entry.id = _next_id++;
  entry.config_hash = config.config_hash();
  entry.observations = observations;
  entry.engine = std::move(engine);

  OptimizerHandle h;
  h.id = entry.id;
  h.campaign_id = config.id();
  h.config_hash = entry.config_hash;
  h.observations = observations;
  h.origin = origin;
  _table[config.id()] = std::move(entry);
  return h;
}

OptimizerAdapter::Entry *
OptimizerAdapter::_find(const OptimizerHandle &handle) {
  auto it = _table.find(handle.campaign_id);
  if (it == _table.end() || it->second.id != handle.id) {
    return nullptr;
  }
  return &it->second;
}

const OptimizerAdapter::Entry *
OptimizerAdapter::_find(const OptimizerHandle &handle) const {
  auto it = _table.find(handle.campaign_id);
  if (it == _table.end() || it->second.id != handle.id) {
    return nullptr;
  }
  return &it->second;
}

} // namespace basil
