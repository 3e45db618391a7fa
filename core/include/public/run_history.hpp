#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <public/objective_spec.hpp>
#include <public/parameter_space.hpp>

namespace basil {

enum class BatchStatus { Pending, Completed };
enum class BatchSource { Optimizer, Fallback, Import };

std::string to_string(BatchStatus status);
std::string to_string(BatchSource source);
BatchStatus batch_status_from_string(const std::string &name);
BatchSource batch_source_from_string(const std::string &name);

struct RunBatch {
  std::string batch_id;
  int64_t generated_at = 0;
  std::vector<Row> rows;
  BatchStatus status = BatchStatus::Pending;
  BatchSource source = BatchSource::Optimizer;
  int config_version = 0;

  bool operator==(const RunBatch &o) const {
    return batch_id == o.batch_id && generated_at == o.generated_at &&
           rows == o.rows && status == o.status && source == o.source &&
           config_version == o.config_version;
  }
};

struct RunResult {
  std::string batch_id;
  size_t row_index = 0;
  Measurement values;
  int64_t ingested_at = 0;

  bool operator==(const RunResult &o) const {
    return batch_id == o.batch_id && row_index == o.row_index &&
           values == o.values && ingested_at == o.ingested_at;
  }
};

/**
 * @brief A completed experiment: the suggested row and what was measured.
 */
struct Observation {
  const Row *row;
  const RunResult *result;
};

/**
 * @brief Append-only ledger of batches and their results.
 *
 * Batches are only ever added or flipped pending -> completed; results
 * are only added. Batches are kept ordered by (generated_at, batch_id),
 * results by (ingested_at, batch order, row_index), the same order
 * from_records() restores.
 */
class RunHistory {
public:
  /// @throws ValidationError if the id is already used.
  const RunBatch &append_batch(RunBatch batch);

  /**
   * @brief Flip a pending batch to completed and add its results.
   *
   * @throws BatchNotFound if the id is unknown.
   * @throws ValidationError if the batch is not pending or the results do
   * not cover each row exactly once.
   */
  void complete_batch(const std::string &batch_id,
                      std::vector<RunResult> results);

  const RunBatch *find_batch(const std::string &batch_id) const;
  const std::vector<RunBatch> &batches() const { return _batches; }
  const std::vector<RunResult> &results() const { return _results; }
  std::vector<const RunBatch *> pending_batches() const;

  /// Completed rows paired with their results, in chronological order.
  std::vector<Observation> observations() const;

  /// Next unused id of the form batch-NNNNNN.
  std::string next_batch_id() const;

  /**
   * @brief Ingestion time for the next completed batch: @p now, moved past
   * every recorded result so that each batch lands after the ones before.
   */
  int64_t next_ingested_at(int64_t now) const;

  size_t batch_count() const { return _batches.size(); }
  size_t result_count() const { return _results.size(); }

  /**
   * @brief Rebuild a history from persisted records.
   *
   * Batches are ordered by (generated_at, batch_id), results by
   * (ingested_at, batch order, row_index).
   */
  static RunHistory from_records(std::vector<RunBatch> batches,
                                 std::vector<RunResult> results);

  bool operator==(const RunHistory &o) const {
    return _batches == o._batches && _results == o._results;
  }

private:
  void _sort_results();

  std::vector<RunBatch> _batches;
  std::vector<RunResult> _results;
};

} // namespace basil
