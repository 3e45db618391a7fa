#pragma once
#include <stdexcept>
#include <string>

namespace basil {

/**
 * @brief Base class of every error raised by the campaign core.
 */
class BasilError : public std::runtime_error {
public:
  explicit BasilError(const std::string &message)
      : std::runtime_error(message) {}
  virtual const char *kind() const noexcept { return "BasilError"; }
};

/**
 * @brief Malformed parameter/objective spec or malformed result submission.
 */
class ValidationError : public BasilError {
public:
  explicit ValidationError(const std::string &message)
      : BasilError(message) {}
  const char *kind() const noexcept override { return "ValidationError"; }
};

/**
 * @brief Stored data uses a schema this build cannot read or migrate.
 */
class IncompatibleSchemaError : public BasilError {
public:
  explicit IncompatibleSchemaError(const std::string &message)
      : BasilError(message) {}
  const char *kind() const noexcept override {
    return "IncompatibleSchemaError";
  }
};

/**
 * @brief The optimization engine could not produce an answer (engine error,
 * corrupt handle, timeout, unsupported settings). Recovered by fallback.
 */
class OptimizerUnavailable : public BasilError {
public:
  explicit OptimizerUnavailable(const std::string &message)
      : BasilError(message) {}
  const char *kind() const noexcept override { return "OptimizerUnavailable"; }
};

/**
 * @brief Persisted optimizer state does not match the current campaign.
 * Internal to the optimizer adapter; triggers a rebuild.
 */
class StaleStateError : public BasilError {
public:
  explicit StaleStateError(const std::string &message)
      : BasilError(message) {}
  const char *kind() const noexcept override { return "StaleStateError"; }
};

class StorageError : public BasilError {
public:
  explicit StorageError(const std::string &message) : BasilError(message) {}
  const char *kind() const noexcept override { return "StorageError"; }
};

class BatchNotFound : public BasilError {
public:
  explicit BatchNotFound(const std::string &batch_id)
      : BasilError("Batch not found: " + batch_id), _batch_id(batch_id) {}
  const char *kind() const noexcept override { return "BatchNotFound"; }
  const std::string &batch_id() const { return _batch_id; }

private:
  std::string _batch_id;
};

class CampaignNotFound : public BasilError {
public:
  explicit CampaignNotFound(const std::string &campaign_id)
      : BasilError("Campaign not found: " + campaign_id) {}
  const char *kind() const noexcept override { return "CampaignNotFound"; }
};

class OperationCancelled : public BasilError {
public:
  explicit OperationCancelled(const std::string &message)
      : BasilError(message) {}
  const char *kind() const noexcept override { return "OperationCancelled"; }
};

} // namespace basil
