#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <public/campaign_config.hpp>
#include <public/campaign_optimizer.hpp>
#include <public/campaign_store.hpp>
#include <public/run_history.hpp>

namespace basil {

/**
 * @brief Reference to a live engine in the adapter's handle table, tagged
 * with what it was built from.
 */
struct OptimizerHandle {
  enum class Origin { Live, Restored, Rebuilt };

  uint64_t id = 0;
  std::string campaign_id;
  std::string config_hash;
  size_t observations = 0;
  Origin origin = Origin::Live;

  bool valid() const { return id != 0; }
};

std::string to_string(OptimizerHandle::Origin origin);

/// Best observed row with the surrogate's prediction there.
struct BestArm {
  Row row;
  double mean = 0.0;
  double uncertainty = 0.0;
};

/**
 * @brief Completed rows of @p history the current config can learn from:
 * inside the parameter space and covering every objective. Chronological.
 */
std::vector<Observation> usable_observations(const CampaignConfig &config,
                                             const RunHistory &history);

/**
 * @brief Owns live engines and keeps them consistent with a campaign's config
 * and history.
 *
 * Engine and staleness failures come out as OptimizerUnavailable; only
 * StorageError and the caller's own mistakes propagate otherwise.
 */
class OptimizerAdapter {
public:
  /// Wait for engine work without limit.
  static constexpr std::chrono::milliseconds kNoTimeout =
      std::chrono::milliseconds::max();

  explicit OptimizerAdapter(OptimizerFactory factory = make_limbo_optimizer);

  /**
   * @brief Live engine for @p config and @p history: reused from memory,
   * restored from @p store, or rebuilt from the usable observations and
   * persisted.
   *
   * Restoring and rebuilding run in a worker thread like suggest_batch();
   * together they get @p timeout.
   *
   * @throws OptimizerUnavailable on engine failure, timeout or cancellation.
   * @throws StorageError
   */
  OptimizerHandle resolve(const CampaignConfig &config,
                          const RunHistory &history,
                          const CampaignStore &store,
                          std::chrono::milliseconds timeout = kNoTimeout,
                          const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Ask the engine for @p batch_size rows.
   *
   * The engine runs on a clone in a worker thread; the caller waits until it
   * finishes, @p timeout elapses or @p cancel is set. Never returns a partial
   * batch.
   *
   * @throws OptimizerUnavailable on any failure, timeout or cancellation.
   */
  std::vector<Row> suggest_batch(const OptimizerHandle &handle,
                                 const CampaignConfig &config,
                                 size_t batch_size,
                                 std::chrono::milliseconds timeout,
                                 const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Feed usable observations the engine has not seen yet, refit and
   * persist.
   *
   * The work runs on a clone in a worker thread, bounded by @p timeout and
   * @p cancel; the clone replaces the live engine when it is done.
   *
   * @return the handle with updated tags.
   * @throws OptimizerUnavailable after releasing the handle if the engine
   * fails, times out or is cancelled.
   */
  OptimizerHandle observe(const OptimizerHandle &handle,
                          const CampaignConfig &config,
                          const RunHistory &history,
                          const CampaignStore &store,
                          std::chrono::milliseconds timeout = kNoTimeout,
                          const std::atomic<bool> *cancel = nullptr);

  /// @throws StorageError, OptimizerUnavailable for an unknown handle.
  void persist_state(const OptimizerHandle &handle,
                     const CampaignStore &store) const;

  /// Best observed row, or none before any observation.
  boost::optional<BestArm> best_arm(const OptimizerHandle &handle,
                                    const CampaignConfig &config) const;

  void release(const OptimizerHandle &handle);
  void release_campaign(const std::string &campaign_id);

  bool is_live(const OptimizerHandle &handle) const;
  size_t live_count() const;

private:
  struct Entry {
    uint64_t id;
    std::string config_hash;
    size_t observations;
    std::unique_ptr<CampaignOptimizer> engine;
  };

  struct Budget {
    std::chrono::steady_clock::time_point deadline;
    std::chrono::milliseconds timeout;
    const std::atomic<bool> *cancel;
  };

  std::unique_ptr<CampaignOptimizer> _create(const CampaignConfig &config,
                                             size_t dim) const;
  std::unique_ptr<CampaignOptimizer>
  _restore(const CampaignConfig &config, const CampaignStore &store,
           size_t dim, size_t expected_observations,
           const Budget &budget) const;
  std::unique_ptr<CampaignOptimizer>
  _rebuild(const CampaignConfig &config,
           const std::vector<Observation> &observations, size_t dim,
           const Budget &budget) const;
  OptimizerHandle _install(const CampaignConfig &config, size_t observations,
                           std::unique_ptr<CampaignOptimizer> engine,
                           OptimizerHandle::Origin origin);
  Entry *_find(const OptimizerHandle &handle);
  const Entry *_find(const OptimizerHandle &handle) const;

  OptimizerFactory _factory;
  mutable std::mutex _mutex;
  std::map<std::string, Entry> _table;
  uint64_t _next_id = 1;
};

} // namespace basil
