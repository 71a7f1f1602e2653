#include "utils/logging.hpp"
#include "physics/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace motor_design {
namespace utils {

namespace {
    const char* kLoggerName = "motor_design";
    std::mutex logger_mutex;

    std::shared_ptr<spdlog::logger> getOrCreate() {
        auto existing = spdlog::get(kLoggerName);
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }
}

void initLogging(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    getOrCreate()->set_level(level);
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto level = spdlog::level::from_str(lowered);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && lowered != "off") {
        throw ConfigurationError("unknown log level '" + name + "'");
    }
    return level;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    return getOrCreate();
}

} // namespace utils
} // namespace motor_design
