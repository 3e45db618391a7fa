#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <public/batch_task.hpp>
#include <public/campaign_orchestrator.hpp>
#include <public/events.hpp>
#include <public/service_config.hpp>
#include <public/settings_service.hpp>

namespace basil {

struct CampaignSummary {
  std::string id;
  std::string name;
  int version = 0;
  int64_t updated_at = 0;
};

/**
 * @brief Command interface of the campaign core for its UI collaborator.
 *
 * Owns the workspace, at most one orchestrator per campaign, and the
 * settings store. The service mutex only guards the table of open
 * campaigns; work on different campaigns runs in parallel.
 *
 * Operations on a campaign that exists but is not open yet open it first.
 * Unknown campaign ids raise CampaignNotFound.
 */
class CampaignService {
public:
  explicit CampaignService(ServiceConfig config,
                           std::shared_ptr<EventSink> sink = default_event_sink(),
                           OptimizerFactory factory = make_limbo_optimizer);
  ~CampaignService();

  CampaignService(const CampaignService &) = delete;
  CampaignService &operator=(const CampaignService &) = delete;

  /// Creates and opens a campaign. @return its id.
  std::string create_campaign(const CampaignSpec &spec);

  /// @return true if the edit was structural.
  bool edit_campaign(const std::string &campaign_id, const CampaignSpec &spec);

  CampaignConfig open_campaign(const std::string &campaign_id);

  /// Every campaign of the workspace, open or not.
  std::vector<CampaignSummary> list_campaigns() const;

  /// @throws ValidationError for batch_size 0; other errors come from get().
  std::shared_ptr<BatchTask> generate_next_batch(const std::string &campaign_id,
                                                 size_t batch_size);

  bool record_results(const std::string &campaign_id,
                      const std::string &batch_id,
                      const std::vector<Measurement> &rows);

  RunBatch import_results(const std::string &campaign_id,
                          const std::vector<ImportedRun> &runs);

  RunHistory get_history(const std::string &campaign_id);
  CampaignConfig get_config(const std::string &campaign_id);
  boost::optional<BestArm> best_arm(const std::string &campaign_id);

  /// @return false if the campaign was not open.
  bool close_campaign(const std::string &campaign_id);

  bool is_open(const std::string &campaign_id) const;
  boost::optional<std::string> recent_campaign() const;
  const ServiceConfig &config() const { return _config; }

private:
  std::shared_ptr<CampaignOrchestrator> _get(const std::string &campaign_id);
  OrchestratorOptions _orchestrator_options() const;
  void _remember(const std::string &campaign_id);

  ServiceConfig _config;
  std::shared_ptr<EventSink> _sink;
  std::shared_ptr<OptimizerAdapter> _adapter;

  mutable std::mutex _mutex;
  std::map<std::string, std::shared_ptr<CampaignOrchestrator>> _open;
  SettingsService _settings;
};

} // namespace basil
