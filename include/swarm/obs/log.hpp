#pragma once
/**
 * @file log.hpp
 * @brief Access to the process-wide "swarm" spdlog logger.
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace swarm::obs {

/// The shared logger (stdout color sink), created on first use.
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from a name ("trace", "debug", "info", "warn", ...).
 * @return false if the name is not a known level (level unchanged).
 */
bool set_level(const std::string& level);

/// True if @p level names a spdlog level.
[[nodiscard]] bool is_valid_level(const std::string& level);

} // namespace swarm::obs
