#include "logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace parking {

namespace {
std::mutex g_logger_mu;
} // namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    // stdout_color_mt throws if the name is already registered, so look up first
    std::lock_guard<std::mutex> guard(g_logger_mu);
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return logger;
}

bool set_log_level(const std::string& level) {
    const spdlog::level::level_enum lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept "off" when asked for it
    if (lvl == spdlog::level::off && level != "off") {
        return false;
    }
    spdlog::set_level(lvl);
    return true;
}

} // namespace parking
