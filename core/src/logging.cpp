#include <public/errors.hpp>
#include <public/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace basil {

namespace {

std::mutex g_logger_mutex;
spdlog::level::level_enum g_level = spdlog::level::info;

spdlog::sink_ptr shared_sink() {
  static spdlog::sink_ptr sink =
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return sink;
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  logger = std::make_shared<spdlog::logger>(name, shared_sink());
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
  logger->set_level(g_level);
  spdlog::register_logger(logger);
  return logger;
}

void set_log_level(const std::string &level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"
  if (parsed == spdlog::level::off && level != "off") {
    throw ValidationError("Unknown log level: " + level);
  }
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_level = parsed;
  spdlog::apply_all([parsed](std::shared_ptr<spdlog::logger> l) {
    l->set_level(parsed);
  });
}

} // namespace basil
