#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <memory>

namespace motor_design {

/**
 * @brief Steady-state motor performance solver
 *
 * Without a frozen geometry the solver first sizes hardware that meets the
 * design targets (design mode), then evaluates that hardware. With a frozen
 * geometry it only evaluates (as-built mode). Evaluation converges the
 * chamber pressure at which mass generation equals nozzle discharge:
 * - Hybrid: injector flow from the tank-to-chamber drop, fuel flow from
 *   flux-driven regression
 * - Solid: pressure-driven burn rate over the BATES burning surface
 */
class PerformanceSolver {
public:
    /**
     * @brief Constructor
     * @param config Validated configuration
     */
    explicit PerformanceSolver(const MotorConfiguration& config);

    /**
     * @brief Destructor
     */
    ~PerformanceSolver() = default;

    /**
     * @brief Solve the operating point
     * @return Performance at the converged chamber pressure
     * @throws ConvergenceError, InfeasibleDesignError
     */
    MotorPerformance solve() const;

    /**
     * @brief Size hardware for the design targets
     * @return As-built geometry meeting thrust, chamber pressure and burn time
     * @throws InfeasibleDesignError
     */
    MotorGeometry designGeometry() const;

    /**
     * @brief Evaluate fixed hardware
     * @param geometry As-built geometry
     * @return Performance at the converged chamber pressure
     */
    MotorPerformance evaluate(const MotorGeometry& geometry) const;

    /**
     * @brief Converge chamber pressure for fixed hardware
     * @param geometry As-built geometry
     * @return Converged solver state
     * @throws ConvergenceError when the iteration cap is reached
     */
    SolverState converge(const MotorGeometry& geometry) const;

    /**
     * @brief Mass generation at a trial chamber pressure
     * @param geometry As-built geometry
     * @param pressure Trial chamber pressure [Pa]
     * @return Total mass generation [kg/s]
     */
    double massGeneration(const MotorGeometry& geometry, double pressure) const;

    /**
     * @brief Injector oxidizer flow (hybrid)
     * @param geometry As-built geometry
     * @param pressure Chamber pressure [Pa]
     * @return Oxidizer mass flow [kg/s], zero when the feed is not driven
     */
    double oxidizerMassFlow(const MotorGeometry& geometry, double pressure) const;

    /**
     * @brief Hybrid regression rate r = a·Gⁿ·f_T
     * @param oxidizer_flux Port oxidizer mass flux [kg/(m²⋅s)]
     * @return Regression rate [m/s]
     */
    double regressionRate(double oxidizer_flux) const;

    /**
     * @brief Solid burn rate r = a·Pcⁿ·f_T
     * @param pressure Chamber pressure [Pa]
     * @return Burn rate [m/s]
     */
    double burnRate(double pressure) const;

    /**
     * @brief Expansion ratio used for sizing: configured, or matched to ambient
     */
    double resolvedExpansionRatio() const;

    double getCharacteristicVelocity() const { return characteristic_velocity_; }
    double getTemperatureFactor() const { return temperature_factor_; }
    const MotorConfiguration& getConfig() const { return config_; }

private:
    MotorConfiguration config_;
    double characteristic_velocity_;
    double temperature_factor_;

    // Design-mode sizing per family
    void sizeHybrid(MotorGeometry& geometry, double mass_flow) const;
    void sizeSolid(MotorGeometry& geometry, double mass_flow) const;
    double sizeChamberDiameter(const MotorGeometry& geometry, double mass_flow, double default_diameter) const;

    // Sanity checks on intermediates
    void requireFinite(const char* name, double value) const;
};

/**
 * @brief Solve a validated configuration
 * @param config Validated configuration
 * @return Steady-state performance
 * @throws ConvergenceError, InfeasibleDesignError
 */
MotorPerformance solve(const MotorConfiguration& config);

/**
 * @brief Factory function to create a performance solver
 * @param config Validated configuration
 * @return Shared pointer to solver
 */
std::shared_ptr<PerformanceSolver> createPerformanceSolver(const MotorConfiguration& config);

} // namespace motor_design
