#include "private/json_codec.hpp"
#include "public/interface.hpp"
#include <public/campaign_service.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>

#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace basil;

namespace {

struct TaskHandle {
  std::shared_ptr<BatchTask> task;
  std::string error_kind;
  std::string error_message;
};

char *to_cstring(const json &response) {
  const std::string text = response.dump();
  char *out = static_cast<char *>(std::malloc(text.size() + 1));
  if (out) {
    std::memcpy(out, text.c_str(), text.size() + 1);
  }
  return out;
}

json ok(json result) {
  json j;
  j["ok"] = true;
  j["result"] = std::move(result);
  return j;
}

json error(const std::string &kind, const std::string &message) {
  json j;
  j["ok"] = false;
  j["error"] = {{"kind", kind}, {"message", message}};
  return j;
}

json parse_argument(const char *text, const char *what) {
  if (!text) {
    throw ValidationError(std::string(what) + " is missing");
  }
  try {
    return json::parse(text);
  } catch (const json::parse_error &e) {
    throw ValidationError(std::string("Cannot parse ") + what + ": " +
                          e.what());
  }
}

std::string string_argument(const char *text, const char *what) {
  if (!text) {
    throw ValidationError(std::string(what) + " is missing");
  }
  return text;
}

// Runs @p call and turns its outcome or exception into a response string.
// No exception crosses the C boundary.
char *respond(const char *function, const std::function<json()> &call) {
  try {
    return to_cstring(ok(call()));
  } catch (const BasilError &e) {
    get_logger("service")->debug("{} failed: {}: {}", function, e.kind(),
                                 e.what());
    return to_cstring(error(e.kind(), e.what()));
  } catch (const std::exception &e) {
    get_logger("service")->error("{} failed: {}", function, e.what());
    return to_cstring(error("InternalError", e.what()));
  } catch (...) {
    get_logger("service")->error("{} failed with an unknown error", function);
    return to_cstring(error("InternalError", "Unknown error"));
  }
}

CampaignService &service_of(void *service) {
  if (!service) {
    throw ValidationError("Service handle is null");
  }
  return *static_cast<CampaignService *>(service);
}

} // namespace

extern "C" {

void *basil_service_create(const char *config_json) {
  try {
    ServiceConfig config;
    if (config_json && *config_json) {
      config = ServiceConfig::from_json(json::parse(config_json));
    }
    return new CampaignService(config);
  } catch (const std::exception &e) {
    get_logger("service")->error("Error creating campaign service: {}",
                                 e.what());
    return nullptr;
  } catch (...) {
    get_logger("service")->error("Unknown error creating campaign service.");
    return nullptr;
  }
}

void basil_service_destroy(void *service) {
  if (!service)
    return;
  auto *s = static_cast<CampaignService *>(service);
  try {
    delete s;
  } catch (const std::exception &e) {
    get_logger("service")->error("Error destroying campaign service: {}",
                                 e.what());
  } catch (...) {
    get_logger("service")->error("Unknown error destroying campaign service.");
  }
}

char *basil_create_campaign(void *service, const char *spec_json) {
  return respond(__func__, [&]() {
    CampaignSpec spec =
        detail::spec_from_json(parse_argument(spec_json, "spec"));
    return json(service_of(service).create_campaign(spec));
  });
}

char *basil_edit_campaign(void *service, const char *campaign_id,
                          const char *spec_json) {
  return respond(__func__, [&]() {
    const std::string id = string_argument(campaign_id, "campaign id");
    CampaignSpec spec =
        detail::spec_from_json(parse_argument(spec_json, "spec"));
    CampaignService &s = service_of(service);
    json result;
    result["structural"] = s.edit_campaign(id, spec);
    result["config"] = s.get_config(id).to_json();
    return result;
  });
}

char *basil_open_campaign(void *service, const char *campaign_id) {
  return respond(__func__, [&]() {
    return service_of(service)
        .open_campaign(string_argument(campaign_id, "campaign id"))
        .to_json();
  });
}

char *basil_list_campaigns(void *service) {
  return respond(__func__, [&]() {
    json list = json::array();
    for (const auto &summary : service_of(service).list_campaigns()) {
      list.push_back(detail::summary_to_json(summary));
    }
    return list;
  });
}

void *basil_generate_next_batch(void *service, const char *campaign_id,
                                int batch_size) {
  if (!service) {
    return nullptr;
  }
  auto *handle = new TaskHandle();
  try {
    if (batch_size <= 0) {
      throw ValidationError("Batch size must be at least 1");
    }
    handle->task = service_of(service).generate_next_batch(
        string_argument(campaign_id, "campaign id"),
        static_cast<size_t>(batch_size));
  } catch (const BasilError &e) {
    handle->error_kind = e.kind();
    handle->error_message = e.what();
  } catch (const std::exception &e) {
    handle->error_kind = "InternalError";
    handle->error_message = e.what();
  }
  return handle;
}

double basil_task_progress(void *task) {
  auto *handle = static_cast<TaskHandle *>(task);
  if (!handle || !handle->task) {
    return 0.0;
  }
  return handle->task->progress();
}

void basil_task_cancel(void *task) {
  auto *handle = static_cast<TaskHandle *>(task);
  if (handle && handle->task) {
    handle->task->cancel();
  }
}

int basil_task_done(void *task) {
  auto *handle = static_cast<TaskHandle *>(task);
  if (!handle) {
    return 0;
  }
  return !handle->task || handle->task->done() ? 1 : 0;
}

char *basil_task_result(void *task) {
  auto *handle = static_cast<TaskHandle *>(task);
  if (handle && !handle->error_kind.empty()) {
    return to_cstring(error(handle->error_kind, handle->error_message));
  }
  return respond(__func__, [&]() {
    if (!handle || !handle->task) {
      throw ValidationError("Task handle is null");
    }
    return detail::batch_to_json(handle->task->get());
  });
}

void basil_task_destroy(void *task) {
  auto *handle = static_cast<TaskHandle *>(task);
  delete handle;
}

char *basil_record_results(void *service, const char *campaign_id,
                           const char *batch_id, const char *rows_json) {
  return respond(__func__, [&]() {
    std::vector<Measurement> rows =
        detail::measurements_from_json(parse_argument(rows_json, "results"));
    json result;
    result["recorded"] = service_of(service).record_results(
        string_argument(campaign_id, "campaign id"),
        string_argument(batch_id, "batch id"), rows);
    return result;
  });
}

char *basil_import_results(void *service, const char *campaign_id,
                           const char *runs_json) {
  return respond(__func__, [&]() {
    std::vector<ImportedRun> runs =
        detail::imported_runs_from_json(parse_argument(runs_json, "runs"));
    return detail::batch_to_json(service_of(service).import_results(
        string_argument(campaign_id, "campaign id"), runs));
  });
}

char *basil_get_history(void *service, const char *campaign_id) {
  return respond(__func__, [&]() {
    return detail::history_to_json(service_of(service).get_history(
        string_argument(campaign_id, "campaign id")));
  });
}

char *basil_get_config(void *service, const char *campaign_id) {
  return respond(__func__, [&]() {
    return service_of(service)
        .get_config(string_argument(campaign_id, "campaign id"))
        .to_json();
  });
}

char *basil_best_arm(void *service, const char *campaign_id) {
  return respond(__func__, [&]() {
    boost::optional<BestArm> best = service_of(service).best_arm(
        string_argument(campaign_id, "campaign id"));
    return best ? detail::best_arm_to_json(*best) : json(nullptr);
  });
}

char *basil_close_campaign(void *service, const char *campaign_id) {
  return respond(__func__, [&]() {
    json result;
    result["closed"] = service_of(service).close_campaign(
        string_argument(campaign_id, "campaign id"));
    return result;
  });
}

char *basil_recent_campaign(void *service) {
  return respond(__func__, [&]() {
    boost::optional<std::string> recent =
        service_of(service).recent_campaign();
    return recent ? json(*recent) : json(nullptr);
  });
}

void basil_free_string(char *str) { std::free(str); }
}
