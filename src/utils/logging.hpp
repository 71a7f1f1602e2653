#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace motor_design {
namespace utils {

/**
 * @brief Create (or reconfigure) the shared "motor_design" logger
 *
 * The logger writes to stderr through a thread-safe color sink, so Monte
 * Carlo workers may log concurrently.
 *
 * @param level Minimum severity that is emitted
 */
void initLogging(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 * @throws ConfigurationError for unknown names
 */
spdlog::level::level_enum parseLogLevel(const std::string& name);

/**
 * @brief Shared logger, created at info level on first use
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace utils
} // namespace motor_design
