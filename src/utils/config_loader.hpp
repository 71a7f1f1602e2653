#pragma once

#include "../physics/types.hpp"
#include "../analysis/monte_carlo.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

namespace motor_design {
namespace utils {

/**
 * @brief Run settings outside the motor description
 */
struct AnalysisSettings {
    size_t regression_steps;
    std::optional<spdlog::level::level_enum> log_level;

    AnalysisSettings() : regression_steps(100), log_level() {}
};

/**
 * @brief Monte Carlo study read from the monte_carlo section
 */
struct MonteCarloSettings {
    size_t samples;
    MonteCarloOptions options;
    UncertaintySpec uncertainty;

    MonteCarloSettings() : samples(1000), options(), uncertainty() {}
};

/**
 * @brief Load a motor description from a YAML file
 *
 * Sections: motor, nozzle, oxidizer, feed, grain, combustion, injector.
 * Absent keys stay unset and receive defaults in validate(). Unknown keys
 * are logged and ignored.
 *
 * @param filename Path to the YAML file
 * @return Raw configuration
 * @throws ConfigurationError if the file is missing, malformed or mistyped
 */
RawMotorConfiguration loadConfiguration(const std::string& filename);

/**
 * @brief Parse a motor description from YAML text
 */
RawMotorConfiguration parseConfiguration(const std::string& yaml_text);

/**
 * @brief Load the regression and logging sections
 */
AnalysisSettings loadAnalysisSettings(const std::string& filename);
AnalysisSettings parseAnalysisSettings(const std::string& yaml_text);

/**
 * @brief Load the monte_carlo section
 * @throws ConfigurationError if the section is missing or mistyped
 */
MonteCarloSettings loadMonteCarloSettings(const std::string& filename);
MonteCarloSettings parseMonteCarloSettings(const std::string& yaml_text);

} // namespace utils
} // namespace motor_design
