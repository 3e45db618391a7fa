#include <public/events.hpp>
#include <public/logging.hpp>
#include <public/timestamp.hpp>

#include <sstream>

namespace basil {

std::string to_string(EventType type) {
  switch (type) {
  case EventType::OptimizerAttempted:
    return "optimizer_attempted";
  case EventType::OptimizerRebuilt:
    return "optimizer_rebuilt";
  case EventType::OptimizerFailed:
    return "optimizer_failed";
  case EventType::FallbackUsed:
    return "fallback_used";
  case EventType::BatchPersisted:
    return "batch_persisted";
  case EventType::ResultIngested:
    return "result_ingested";
  case EventType::ResultsImported:
    return "results_imported";
  case EventType::ConfigEdited:
    return "config_edited";
  }
  return "unknown";
}

CampaignEvent::CampaignEvent(EventType type_, std::string campaign_id_)
    : type(type_), campaign_id(std::move(campaign_id_)),
      timestamp(now_millis()) {}

std::string CampaignEvent::field(const std::string &key) const {
  for (const auto &kv : fields) {
    if (kv.first == key) {
      return kv.second;
    }
  }
  return std::string();
}

void LoggingEventSink::publish(const CampaignEvent &event) {
  std::ostringstream line;
  line << "event=" << to_string(event.type)
       << " campaign=" << event.campaign_id;
  for (const auto &kv : event.fields) {
    line << " " << kv.first << "=";
    if (kv.second.find_first_of(" =\"") != std::string::npos) {
      line << "\"";
      for (char c : kv.second) {
        if (c == '"') {
          line << '\\';
        }
        line << c;
      }
      line << "\"";
    } else {
      line << kv.second;
    }
  }
  auto logger = get_logger("campaign");
  if (event.type == EventType::OptimizerFailed ||
      event.type == EventType::FallbackUsed) {
    logger->warn("{}", line.str());
  } else {
    logger->info("{}", line.str());
  }
}

std::shared_ptr<EventSink> default_event_sink() {
  static std::shared_ptr<EventSink> sink = std::make_shared<LoggingEventSink>();
  return sink;
}

} // namespace basil
