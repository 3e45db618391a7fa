#include <public/campaign_service.hpp>
#include <public/campaign_store.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>

namespace basil {

CampaignService::CampaignService(ServiceConfig config,
                                 std::shared_ptr<EventSink> sink,
                                 OptimizerFactory factory)
    : _config(std::move(config)), _sink(std::move(sink)),
      _adapter(std::make_shared<OptimizerAdapter>(std::move(factory))),
      _settings(_config.workspace) {
  set_log_level(_config.log_level);
  _settings.load();
  get_logger("service")->info("Campaign service on workspace {}",
                              _config.workspace.string());
}

CampaignService::~CampaignService() {
  std::lock_guard<std::mutex> lock(_mutex);
  _open.clear();
}

std::string CampaignService::create_campaign(const CampaignSpec &spec) {
  std::shared_ptr<CampaignOrchestrator> orchestrator =
      CampaignOrchestrator::create(_config.workspace, spec, _adapter, _sink,
                                   _orchestrator_options());
  const std::string id = orchestrator->id();
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _open[id] = orchestrator;
  }
  _remember(id);
  return id;
}

bool CampaignService::edit_campaign(const std::string &campaign_id,
                                    const CampaignSpec &spec) {
  return _get(campaign_id)->edit_config(spec);
}

CampaignConfig CampaignService::open_campaign(const std::string &campaign_id) {
  CampaignConfig config = _get(campaign_id)->config();
  _remember(campaign_id);
  return config;
}

std::vector<CampaignSummary> CampaignService::list_campaigns() const {
  std::vector<CampaignSummary> out;
  for (const auto &id : CampaignStore::list_campaigns(_config.workspace)) {
    try {
      CampaignConfig c = CampaignStore(_config.workspace, id).load_config();
      CampaignSummary s;
      s.id = id;
      s.name = c.name();
      s.version = c.version();
      s.updated_at = c.updated_at();
      out.push_back(s);
    } catch (const BasilError &e) {
      get_logger("service")->warn("Skipping campaign {} in listing: {}", id,
                                  e.what());
    }
  }
  return out;
}

std::shared_ptr<BatchTask>
CampaignService::generate_next_batch(const std::string &campaign_id,
                                     size_t batch_size) {
  if (batch_size == 0) {
    throw ValidationError("Batch size must be at least 1");
  }
  std::shared_ptr<CampaignOrchestrator> orchestrator = _get(campaign_id);
  return BatchTask::start([orchestrator, batch_size](const GenerateOptions &o) {
    return orchestrator->generate_next_batch(batch_size, o);
  });
}

bool CampaignService::record_results(const std::string &campaign_id,
                                     const std::string &batch_id,
                                     const std::vector<Measurement> &rows) {
  return _get(campaign_id)->record_results(batch_id, rows);
}

RunBatch CampaignService::import_results(const std::string &campaign_id,
                                         const std::vector<ImportedRun> &runs) {
  return _get(campaign_id)->import_results(runs);
}

RunHistory CampaignService::get_history(const std::string &campaign_id) {
  return _get(campaign_id)->history();
}

CampaignConfig CampaignService::get_config(const std::string &campaign_id) {
  return _get(campaign_id)->config();
}

boost::optional<BestArm>
CampaignService::best_arm(const std::string &campaign_id) {
  return _get(campaign_id)->best_arm();
}

bool CampaignService::close_campaign(const std::string &campaign_id) {
  std::lock_guard<std::mutex> lock(_mutex);
  return _open.erase(campaign_id) > 0;
}

bool CampaignService::is_open(const std::string &campaign_id) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _open.count(campaign_id) > 0;
}

boost::optional<std::string> CampaignService::recent_campaign() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _settings.recent_campaign();
}

std::shared_ptr<CampaignOrchestrator>
CampaignService::_get(const std::string &campaign_id) {
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _open.find(campaign_id);
  if (it != _open.end()) {
    return it->second;
  }
  std::shared_ptr<CampaignOrchestrator> orchestrator =
      CampaignOrchestrator::open(_config.workspace, campaign_id, _adapter,
                                 _sink, _orchestrator_options());
  _open[campaign_id] = orchestrator;
  return orchestrator;
}

OrchestratorOptions CampaignService::_orchestrator_options() const {
  OrchestratorOptions options;
  options.optimizer_timeout = _config.optimizer_timeout;
  options.fallback_seed = _config.fallback_seed;
  return options;
}

void CampaignService::_remember(const std::string &campaign_id) {
  std::lock_guard<std::mutex> lock(_mutex);
  _settings.set_recent_campaign(campaign_id);
  try {
    _settings.save();
  } catch (const StorageError &e) {
    get_logger("service")->warn("Cannot save {}: {}", _settings.path().string(),
                                e.what());
  }
}

} // namespace basil
