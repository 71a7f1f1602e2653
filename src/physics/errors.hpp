#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace motor_design {

/**
 * @brief Validation rule identifiers
 */
enum class ConstraintType {
    POSITIVITY,             // value <= 0
    THRUST_RANGE,           // F outside [10, 1e6] N
    BURN_TIME_RANGE,        // tb outside [0.1, 300] s
    OF_RATIO_RANGE,         // O/F outside (0, 20]
    CHAMBER_PRESSURE_RANGE, // Pc > 200 bar or Pc <= Pa
    AMBIENT_CONDITIONS,     // Altitude outside the ISA table
    TANK_PRESSURE,          // Ptank <= Pc
    GAS_PROPERTIES,         // γ outside (1, 2)
    BURN_RATE_LAW,          // n outside (0, 1)
    EXPANSION_RATIO,        // ε not 0 and <= 1
    NOZZLE_EFFICIENCY,      // η outside (0, 1]
    CHAMBER_DIAMETER,       // Implausible supplied diameter
    FINITE_AREA_INPUTS,     // Contraction ratio / mass flux exclusivity
    INJECTOR_PARAMETERS,    // Injector request out of range
    GRAIN_GEOMETRY,         // Solid grain dimensions
    BURNTHROUGH_MARGIN,     // Margin outside (0, 1)
    PROPELLANT_NAME,        // Unknown database entry
    UNCERTAINTY_PARAMETER,  // Unknown Monte Carlo parameter
    GEOMETRY                // Frozen hardware inconsistent
};

/**
 * @brief Constraint violation information
 */
struct ConstraintViolation {
    ConstraintType type;
    std::string field;
    double value;
    double limit;
    double violation_magnitude;
    bool is_violated;
    std::string message;

    ConstraintViolation(ConstraintType t, std::string f, double v, double l, double vm, bool iv, std::string msg)
        : type(t), field(std::move(f)), value(v), limit(l), violation_magnitude(vm), is_violated(iv),
          message(std::move(msg)) {}
};

/**
 * @brief Base class of all motor analysis errors
 */
class MotorError : public std::runtime_error {
public:
    explicit MotorError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Aggregated input violations
 *
 * Carries every violated rule so callers can present a consolidated list.
 */
class ValidationError : public MotorError {
public:
    explicit ValidationError(std::vector<ConstraintViolation> violations)
        : MotorError(formatMessage(violations)), violations_(std::move(violations)) {}

    const std::vector<ConstraintViolation>& violations() const { return violations_; }

    bool hasViolation(ConstraintType type) const {
        for (const auto& v : violations_) {
            if (v.type == type) return true;
        }
        return false;
    }

private:
    std::vector<ConstraintViolation> violations_;

    static std::string formatMessage(const std::vector<ConstraintViolation>& violations) {
        std::string message = "invalid motor configuration (" + std::to_string(violations.size()) + " violation";
        message += violations.size() == 1 ? ")" : "s)";
        for (const auto& v : violations) {
            message += "\n  - " + v.message;
        }
        return message;
    }
};

/**
 * @brief Chamber-pressure iteration did not settle within the iteration cap
 */
class ConvergenceError : public MotorError {
public:
    ConvergenceError(const std::string& message, double last_pressure, int iterations, double residual)
        : MotorError(message), last_pressure_(last_pressure), iterations_(iterations), residual_(residual) {}

    double lastPressure() const { return last_pressure_; }
    int iterations() const { return iterations_; }
    double residual() const { return residual_; }

private:
    double last_pressure_;
    int iterations_;
    double residual_;
};

/**
 * @brief Physically nonsensical intermediate result
 */
class InfeasibleDesignError : public MotorError {
public:
    explicit InfeasibleDesignError(const std::string& message) : MotorError(message) {}
};

/**
 * @brief Injector cannot be sized within the stated bounds
 */
class InfeasibleGeometryError : public MotorError {
public:
    explicit InfeasibleGeometryError(const std::string& message) : MotorError(message) {}
};

/**
 * @brief Configuration file missing or malformed
 */
class ConfigurationError : public MotorError {
public:
    explicit ConfigurationError(const std::string& message) : MotorError(message) {}
};

} // namespace motor_design
