#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace motor_design {

/**
 * @brief Plausibility limits applied by the configuration validator
 */
struct ValidationLimits {
    double thrust_min;              // [N]
    double thrust_max;              // [N]
    double burn_time_min;           // [s]
    double burn_time_max;           // [s]
    double of_ratio_max;
    double of_ratio_warn_min;
    double chamber_pressure_max;    // [Pa]
    double tank_margin_recommended; // (Ptank - Pc)/Pc
    double chamber_diameter_min;    // [m]
    double chamber_diameter_max;    // [m]
    double impulse_tolerance;       // Relative |F⋅tb - I| tolerance
    double port_warning_fraction;   // Port/chamber diameter warning level

    // Default constructor
    ValidationLimits() : thrust_min(10.0), thrust_max(1e6), burn_time_min(0.1), burn_time_max(300.0),
                         of_ratio_max(20.0), of_ratio_warn_min(0.5), chamber_pressure_max(200e5),
                         tank_margin_recommended(0.2), chamber_diameter_min(0.01), chamber_diameter_max(2.0),
                         impulse_tolerance(0.1), port_warning_fraction(0.8) {}
};

/**
 * @brief Configuration plus the advisory warnings raised while building it
 */
struct ValidatedConfiguration {
    MotorConfiguration configuration;
    std::vector<std::string> warnings;
};

/**
 * @brief Configuration checker class
 *
 * Every check returns a ConstraintViolation record whether or not it is
 * violated; callers filter on is_violated.
 */
class ConfigurationValidator {
public:
    /**
     * @brief Constructor
     * @param limits Plausibility limits
     */
    explicit ConfigurationValidator(const ValidationLimits& limits = ValidationLimits());

    /**
     * @brief Run every rule
     * @param config Configuration to check
     * @return All rule outcomes, violated or not
     */
    std::vector<ConstraintViolation> checkConfiguration(const MotorConfiguration& config) const;

    /**
     * @brief Run every rule and keep the violated ones
     * @param config Configuration to check
     * @return Violated rules in check order
     */
    std::vector<ConstraintViolation> violations(const MotorConfiguration& config) const;

    /**
     * @brief Advisory conditions that do not block analysis
     * @param config Configuration to inspect
     * @return Ordered warning messages
     */
    std::vector<std::string> collectWarnings(const MotorConfiguration& config) const;

    std::vector<ConstraintViolation> checkPositivity(const MotorConfiguration& config) const;
    ConstraintViolation checkThrust(const MotorConfiguration& config) const;
    ConstraintViolation checkBurnTime(const MotorConfiguration& config) const;
    ConstraintViolation checkOfRatio(const MotorConfiguration& config) const;
    std::vector<ConstraintViolation> checkChamberPressure(const MotorConfiguration& config) const;
    ConstraintViolation checkTankPressure(const MotorConfiguration& config) const;
    ConstraintViolation checkGasProperties(const MotorConfiguration& config) const;
    ConstraintViolation checkBurnRateLaw(const MotorConfiguration& config) const;
    std::vector<ConstraintViolation> checkNozzle(const MotorConfiguration& config) const;
    ConstraintViolation checkChamberDiameter(const MotorConfiguration& config) const;
    std::vector<ConstraintViolation> checkFiniteAreaInputs(const MotorConfiguration& config) const;
    std::vector<ConstraintViolation> checkInjector(const MotorConfiguration& config) const;
    std::vector<ConstraintViolation> checkGrain(const MotorConfiguration& config) const;
    ConstraintViolation checkBurnthroughMargin(const MotorConfiguration& config) const;
    std::vector<ConstraintViolation> checkGeometry(const MotorConfiguration& config) const;

    /**
     * @brief Check if any rule is violated
     */
    bool hasViolations(const MotorConfiguration& config) const;

    /**
     * @brief Get violation count
     */
    int getViolationCount(const MotorConfiguration& config) const;

    const ValidationLimits& getLimits() const { return limits_; }

private:
    ValidationLimits limits_;

    ConstraintViolation checkPositive(const std::string& field, double value) const;
    ConstraintViolation checkSolidGrain(const SolidGrain& grain, const std::string& prefix) const;
};

/**
 * @brief Fill defaults and validate raw input
 *
 * Defaults come from the propellant database first, then from documented
 * constants. Thrust or burn time is derived from total impulse, ambient
 * pressure from altitude.
 *
 * @param raw Raw user input
 * @param limits Plausibility limits
 * @return Validated configuration and its warnings
 * @throws ValidationError listing every violated rule
 */
ValidatedConfiguration validate(const RawMotorConfiguration& raw, const ValidationLimits& limits = ValidationLimits());

/**
 * @brief Re-check an already built configuration
 * @throws ValidationError listing every violated rule
 */
void requireValid(const MotorConfiguration& config, const ValidationLimits& limits = ValidationLimits());

/**
 * @brief Create configuration validator
 * @param limits Plausibility limits
 * @return Shared pointer to validator
 */
std::shared_ptr<ConfigurationValidator> createConfigurationValidator(const ValidationLimits& limits);

} // namespace motor_design
