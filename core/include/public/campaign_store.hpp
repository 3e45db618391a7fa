#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include <public/campaign_config.hpp>
#include <public/run_history.hpp>

namespace basil {

/**
 * @brief Opaque engine snapshot plus the tags that decide whether it may be
 * reused for a campaign.
 */
struct OptimizerStateRecord {
  std::string config_hash;
  size_t observations = 0;
  int64_t built_at = 0;
  std::string blob;
};

/**
 * @brief Holds the advisory lock on one campaign directory for as long as
 * it lives.
 */
class CampaignLock {
public:
  /// @throws StorageError if another holder owns the lock.
  explicit CampaignLock(const boost::filesystem::path &lock_file);
  ~CampaignLock();

  CampaignLock(const CampaignLock &) = delete;
  CampaignLock &operator=(const CampaignLock &) = delete;

private:
  int _fd;
};

/**
 * @brief On-disk layout of one campaign:
 *
 *   campaigns/<id>/config.json
 *   campaigns/<id>/runs/<batch_id>.csv
 *   campaigns/<id>/optimizer_state.bin
 *   campaigns/<id>/.lock
 *
 * Every write goes through write_file_atomic().
 */
class CampaignStore {
public:
  /// @throws CampaignNotFound if @p campaign_id is not a campaign UUID.
  CampaignStore(const boost::filesystem::path &workspace,
                const std::string &campaign_id);

  /// Canonical lowercase UUID, as CampaignConfig::create() assigns.
  static bool is_campaign_id(const std::string &text);

  static boost::filesystem::path
  campaigns_dir(const boost::filesystem::path &workspace);

  /// Ids of every campaign directory holding a config.json, sorted.
  static std::vector<std::string>
  list_campaigns(const boost::filesystem::path &workspace);

  const boost::filesystem::path &dir() const { return _dir; }
  boost::filesystem::path config_path() const;
  boost::filesystem::path runs_dir() const;
  boost::filesystem::path batch_path(const std::string &batch_id) const;
  boost::filesystem::path optimizer_state_path() const;
  boost::filesystem::path lock_path() const;

  bool exists() const;

  void save_config(const CampaignConfig &config) const;

  /// @param migrated Optional, set when the stored schema was migrated.
  CampaignConfig load_config(bool *migrated = nullptr) const;

  /**
   * @brief Write one batch file: the rows and, for completed batches, the
   * results belonging to it.
   */
  void save_batch(const CampaignConfig &config, const RunBatch &batch,
                  const std::vector<RunResult> &results) const;

  /**
   * @brief Read every batch file back into a history. @p config supplies
   * the value types of known parameter columns.
   *
   * @throws StorageError on unreadable or malformed batch files.
   */
  RunHistory load_history(const CampaignConfig &config) const;

  void save_optimizer_state(const OptimizerStateRecord &state) const;

  /**
   * @return none if no state file exists.
   * @throws StorageError if the file exists but is malformed.
   */
  boost::optional<OptimizerStateRecord> load_optimizer_state() const;

private:
  boost::filesystem::path _dir;
};

/// Results of @p history that belong to @p batch_id, by row index.
std::vector<RunResult> results_for_batch(const RunHistory &history,
                                         const std::string &batch_id);

} // namespace basil
