#pragma once
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace basil {

/**
 * @brief Named logger shared by one component ("campaign", "optimizer",
 * "store", "service"). All loggers write to the same stderr sink.
 */
std::shared_ptr<spdlog::logger> get_logger(const std::string &name);

/**
 * @brief Set the level of every basil logger, current and future.
 *
 * @param level One of trace, debug, info, warn, error, critical, off.
 * @throws ValidationError on an unknown level name.
 */
void set_log_level(const std::string &level);

} // namespace basil
