#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace parking {

/**
 * @brief Returns the process-wide logger registered under @p name,
 *        creating a colored stdout logger on first use.
 */
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/**
 * @brief Applies a level ("trace", "debug", "info", "warn", "error", "off")
 *        to every registered logger and to loggers created afterwards.
 * @return False if @p level is not a known spdlog level name.
 */
bool set_log_level(const std::string& level);

} // namespace parking
