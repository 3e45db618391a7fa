#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include <public/campaign_config.hpp>
#include <public/campaign_store.hpp>
#include <public/events.hpp>
#include <public/fallback_sampler.hpp>
#include <public/optimizer_adapter.hpp>
#include <public/run_history.hpp>

namespace basil {

enum class OrchestratorState {
  Idle,
  ResolvingOptimizer,
  Suggesting,
  FallingBack,
  BatchPersisted
};

std::string to_string(OrchestratorState state);

class CancellationToken {
public:
  void cancel() { _flag.store(true); }
  bool cancelled() const { return _flag.load(); }
  const std::atomic<bool> &flag() const { return _flag; }

private:
  std::atomic<bool> _flag{false};
};

/// Receives values in [0, 1], non-decreasing, ending at 1 on success.
using ProgressCallback = std::function<void(double)>;

struct GenerateOptions {
  ProgressCallback progress;
  std::shared_ptr<CancellationToken> cancel;
};

struct OrchestratorOptions {
  std::chrono::milliseconds optimizer_timeout{30000};
  boost::optional<uint64_t> fallback_seed;
};

/// A previously measured experiment brought into a campaign.
struct ImportedRun {
  Row row;
  Measurement values;
};

/**
 * @brief Coordinates one open campaign: its config, its history and its
 * optimizer handle.
 *
 * Holds the campaign's process lock for its whole life. Mutating calls
 * serialize on one mutex; different campaigns never share it.
 */
class CampaignOrchestrator {
public:
  /// @throws ValidationError, StorageError
  static std::unique_ptr<CampaignOrchestrator>
  create(const boost::filesystem::path &workspace, const CampaignSpec &spec,
         std::shared_ptr<OptimizerAdapter> adapter,
         std::shared_ptr<EventSink> sink, OrchestratorOptions options = {});

  /// @throws CampaignNotFound, IncompatibleSchemaError, StorageError
  static std::unique_ptr<CampaignOrchestrator>
  open(const boost::filesystem::path &workspace, const std::string &campaign_id,
       std::shared_ptr<OptimizerAdapter> adapter,
       std::shared_ptr<EventSink> sink, OrchestratorOptions options = {});

  ~CampaignOrchestrator();

  CampaignOrchestrator(const CampaignOrchestrator &) = delete;
  CampaignOrchestrator &operator=(const CampaignOrchestrator &) = delete;

  /**
   * @brief Produce and persist a pending batch of @p batch_size rows.
   *
   * Tries the optimizer once; on OptimizerUnavailable draws the batch from
   * the fallback sampler instead. Never retries.
   *
   * @throws ValidationError for batch_size 0.
   * @throws OperationCancelled if cancelled before the batch is persisted.
   * @throws StorageError
   */
  RunBatch generate_next_batch(size_t batch_size,
                               const GenerateOptions &options = {});

  /**
   * @brief Complete a pending batch with one measurement per row.
   *
   * @return false if the batch was already completed (nothing recorded).
   * @throws BatchNotFound, ValidationError, StorageError
   */
  bool record_results(const std::string &batch_id,
                      const std::vector<Measurement> &rows);

  /**
   * @brief Append already measured experiments as one completed batch.
   *
   * @throws ValidationError, StorageError
   */
  RunBatch import_results(const std::vector<ImportedRun> &runs);

  /**
   * @brief Apply an edit and save it.
   *
   * @return true if the edit was structural; the optimizer handle is then
   * released.
   * @throws ValidationError, StorageError
   */
  bool edit_config(const CampaignSpec &spec);

  /// Best observed row according to the live engine, if there is one.
  boost::optional<BestArm> best_arm();

  const std::string &id() const { return _id; }
  CampaignConfig config() const;
  RunHistory history() const;
  OrchestratorState state() const { return _state.load(); }
  OptimizerHandle optimizer_handle() const;

private:
  CampaignOrchestrator(const boost::filesystem::path &workspace,
                       std::unique_ptr<CampaignLock> lock,
                       CampaignConfig config, RunHistory history,
                       std::shared_ptr<OptimizerAdapter> adapter,
                       std::shared_ptr<EventSink> sink,
                       OrchestratorOptions options);

  void _transition_to(OrchestratorState next, const std::string &detail = "");
  void _publish(const CampaignEvent &event);
  void _feed_engine();

  const std::string _id;
  CampaignStore _store;
  std::unique_ptr<CampaignLock> _lock;

  mutable std::mutex _mutex;
  std::atomic<OrchestratorState> _state;
  CampaignConfig _config;
  RunHistory _history;
  OptimizerHandle _handle;

  std::shared_ptr<OptimizerAdapter> _adapter;
  std::shared_ptr<EventSink> _sink;
  OrchestratorOptions _options;
  FallbackSampler _sampler;
};

} // namespace basil
