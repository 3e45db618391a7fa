#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace basil {

enum class EventType {
  OptimizerAttempted,
  OptimizerRebuilt,
  OptimizerFailed,
  FallbackUsed,
  BatchPersisted,
  ResultIngested,
  ResultsImported,
  ConfigEdited
};

std::string to_string(EventType type);

/**
 * @brief Structured record of something the core did for one campaign.
 *
 * fields carry the details as ordered key/value pairs (batch_id, reason,
 * rows, ...).
 */
struct CampaignEvent {
  EventType type;
  std::string campaign_id;
  int64_t timestamp = 0;
  std::vector<std::pair<std::string, std::string>> fields;

  CampaignEvent(EventType type_, std::string campaign_id_);

  CampaignEvent &with(std::string key, std::string value) {
    fields.emplace_back(std::move(key), std::move(value));
    return *this;
  }

  /// Value of the first field named @p key, or an empty string.
  std::string field(const std::string &key) const;
};

/**
 * @brief Receiver of campaign events. Implementations must be thread safe;
 * events of different campaigns arrive from different threads.
 */
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void publish(const CampaignEvent &event) = 0;
};

/// Writes every event as one key=value line through the "campaign" logger.
class LoggingEventSink : public EventSink {
public:
  void publish(const CampaignEvent &event) override;
};

std::shared_ptr<EventSink> default_event_sink();

} // namespace basil
