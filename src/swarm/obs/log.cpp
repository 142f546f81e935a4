/**
 * @file log.cpp
 * @brief Lazily created "swarm" logger.
 */
#include "swarm/obs/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace swarm::obs {

namespace {
constexpr const char* kLoggerName = "swarm";
std::mutex g_mu;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lk(g_mu);
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto lg = spdlog::stdout_color_mt(kLoggerName);
    lg->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    return lg;
}

bool is_valid_level(const std::string& level) {
    // from_str maps unknown names to "off", so "off" itself is checked explicitly.
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

bool set_level(const std::string& level) {
    if (!is_valid_level(level)) return false;
    logger()->set_level(spdlog::level::from_str(level));
    return true;
}

} // namespace swarm::obs
