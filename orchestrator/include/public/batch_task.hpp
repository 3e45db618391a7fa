#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include <public/campaign_orchestrator.hpp>

namespace basil {

/**
 * @brief Background batch generation with progress and cancellation.
 *
 * The work runs on its own thread; the destructor waits for it.
 */
class BatchTask {
public:
  using Work = std::function<RunBatch(const GenerateOptions &)>;

  static std::shared_ptr<BatchTask> start(Work work);

  ~BatchTask();

  BatchTask(const BatchTask &) = delete;
  BatchTask &operator=(const BatchTask &) = delete;

  /// Last reported progress in [0, 1].
  double progress() const { return _progress.load(); }

  void cancel() { _token->cancel(); }
  bool cancel_requested() const { return _token->cancelled(); }

  bool done() const;
  void wait() const;
  bool wait_for(std::chrono::milliseconds timeout) const;

  /// Waits, then returns the batch or rethrows the task's error.
  RunBatch get() const;

private:
  BatchTask();

  std::atomic<double> _progress;
  std::shared_ptr<CancellationToken> _token;
  std::shared_future<RunBatch> _future;
  std::thread _thread;
};

} // namespace basil
