#include <public/batch_task.hpp>

namespace basil {

BatchTask::BatchTask()
    : _progress(0.0), _token(std::make_shared<CancellationToken>()) {}

std::shared_ptr<BatchTask> BatchTask::start(Work work) {
  std::shared_ptr<BatchTask> task(new BatchTask());
  std::promise<RunBatch> promise;
  task->_future = promise.get_future().share();

  GenerateOptions options;
  options.cancel = task->_token;
  // The thread is joined by the destructor, so the raw pointer outlives it.
  BatchTask *self = task.get();
  options.progress = [self](double p) { self->_progress.store(p); };

  task->_thread = std::thread(
      [](Work w, GenerateOptions o, std::promise<RunBatch> p) {
        try {
          p.set_value(w(o));
        } catch (...) {
          p.set_exception(std::current_exception());
        }
      },
      std::move(work), std::move(options), std::move(promise));
  return task;
}

BatchTask::~BatchTask() {
  if (_thread.joinable()) {
    _thread.join();
  }
}

bool BatchTask::done() const {
  return _future.wait_for(std::chrono::seconds(0)) ==
         std::future_status::ready;
}

void BatchTask::wait() const { _future.wait(); }

bool BatchTask::wait_for(std::chrono::milliseconds timeout) const {
  return _future.wait_for(timeout) == std::future_status::ready;
}

RunBatch BatchTask::get() const { return _future.get(); }

} // namespace basil
