#include <public/errors.hpp>
#include <public/run_history.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <set>

namespace basil {

namespace {

const char kBatchPrefix[] = "batch-";

long batch_sequence(const std::string &batch_id) {
  const std::string prefix(kBatchPrefix);
  if (batch_id.compare(0, prefix.size(), prefix) != 0) {
    return 0;
  }
  return std::strtol(batch_id.c_str() + prefix.size(), nullptr, 10);
}

bool generated_before(const RunBatch &a, const RunBatch &b) {
  if (a.generated_at != b.generated_at) {
    return a.generated_at < b.generated_at;
  }
  return a.batch_id < b.batch_id;
}

} // namespace

std::string to_string(BatchStatus status) {
  return status == BatchStatus::Pending ? "pending" : "completed";
}

std::string to_string(BatchSource source) {
  switch (source) {
  case BatchSource::Optimizer:
    return "optimizer";
  case BatchSource::Fallback:
    return "fallback";
  case BatchSource::Import:
    return "import";
  }
  return "unknown";
}

BatchStatus batch_status_from_string(const std::string &name) {
  if (name == "pending")
    return BatchStatus::Pending;
  if (name == "completed")
    return BatchStatus::Completed;
  throw ValidationError("Unknown batch status: " + name);
}

BatchSource batch_source_from_string(const std::string &name) {
  if (name == "optimizer")
    return BatchSource::Optimizer;
  if (name == "fallback")
    return BatchSource::Fallback;
  if (name == "import")
    return BatchSource::Import;
  throw ValidationError("Unknown batch source: " + name);
}

const RunBatch &RunHistory::append_batch(RunBatch batch) {
  if (find_batch(batch.batch_id)) {
    throw ValidationError("Batch id already used: " + batch.batch_id);
  }
  auto at = std::upper_bound(_batches.begin(), _batches.end(), batch,
                             generated_before);
  const bool last = at == _batches.end();
  at = _batches.insert(at, std::move(batch));
  if (!last) {
    _sort_results();
  }
  return *at;
}

void RunHistory::complete_batch(const std::string &batch_id,
                                std::vector<RunResult> results) {
  auto it = std::find_if(
      _batches.begin(), _batches.end(),
      [&](const RunBatch &b) { return b.batch_id == batch_id; });
  if (it == _batches.end()) {
    throw BatchNotFound(batch_id);
  }
  if (it->status != BatchStatus::Pending) {
    throw ValidationError("Batch " + batch_id + " is already completed");
  }
  if (results.size() != it->rows.size()) {
    throw ValidationError("Batch " + batch_id + " has " +
                          std::to_string(it->rows.size()) + " rows but " +
                          std::to_string(results.size()) +
                          " results were given");
  }
  std::set<size_t> seen;
  for (const auto &r : results) {
    if (r.batch_id != batch_id || r.row_index >= it->rows.size() ||
        !seen.insert(r.row_index).second) {
      throw ValidationError("Result rows do not match batch " + batch_id);
    }
  }

  it->status = BatchStatus::Completed;
  const bool in_order =
      _results.empty() ||
      std::all_of(results.begin(), results.end(), [&](const RunResult &r) {
        return r.ingested_at > _results.back().ingested_at;
      });
  std::sort(results.begin(), results.end(),
            [](const RunResult &a, const RunResult &b) {
              if (a.ingested_at != b.ingested_at) {
                return a.ingested_at < b.ingested_at;
              }
              return a.row_index < b.row_index;
            });
  for (auto &r : results) {
    _results.push_back(std::move(r));
  }
  if (!in_order) {
    _sort_results();
  }
}

const RunBatch *RunHistory::find_batch(const std::string &batch_id) const {
  for (const auto &b : _batches) {
    if (b.batch_id == batch_id) {
      return &b;
    }
  }
  return nullptr;
}

std::vector<const RunBatch *> RunHistory::pending_batches() const {
  std::vector<const RunBatch *> out;
  for (const auto &b : _batches) {
    if (b.status == BatchStatus::Pending) {
      out.push_back(&b);
    }
  }
  return out;
}

std::vector<Observation> RunHistory::observations() const {
  std::vector<Observation> out;
  out.reserve(_results.size());
  for (const auto &r : _results) {
    const RunBatch *batch = find_batch(r.batch_id);
    if (batch && r.row_index < batch->rows.size()) {
      out.push_back(Observation{&batch->rows[r.row_index], &r});
    }
  }
  return out;
}

std::string RunHistory::next_batch_id() const {
  long next = 1;
  for (const auto &b : _batches) {
    next = std::max(next, batch_sequence(b.batch_id) + 1);
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%06ld", kBatchPrefix, next);
  return std::string(buf);
}

int64_t RunHistory::next_ingested_at(int64_t now) const {
  if (_results.empty()) {
    return now;
  }
  return std::max(now, _results.back().ingested_at + 1);
}

RunHistory RunHistory::from_records(std::vector<RunBatch> batches,
                                    std::vector<RunResult> results) {
  std::sort(batches.begin(), batches.end(), generated_before);
  RunHistory history;
  history._batches = std::move(batches);
  history._results = std::move(results);
  history._sort_results();
  return history;
}

void RunHistory::_sort_results() {
  std::map<std::string, size_t> order;
  for (size_t i = 0; i < _batches.size(); ++i) {
    order[_batches[i].batch_id] = i;
  }
  std::sort(_results.begin(), _results.end(),
            [&](const RunResult &a, const RunResult &b) {
              if (a.ingested_at != b.ingested_at) {
                return a.ingested_at < b.ingested_at;
              }
              if (a.batch_id != b.batch_id) {
                return order[a.batch_id] < order[b.batch_id];
              }
              return a.row_index < b.row_index;
            });
}

} // namespace basil
