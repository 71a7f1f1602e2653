#pragma once

#include "types.hpp"
#include "performance_solver.hpp"
#include <memory>

namespace motor_design {

/**
 * @brief Quasi-steady burn-history simulator
 *
 * Steps the fuel port (hybrid) or BATES grain (solid) through the burn with
 * explicit Euler steps, re-solving the as-built operating point at every
 * sample. When the next step would pass the structural limit the state
 * freezes and the rest of the timeline repeats it with the burnthrough flag.
 */
class RegressionSimulator {
public:
    /**
     * @brief Constructor
     * @param config Validated configuration; hardware is sized when it has no geometry
     * @throws ConvergenceError, InfeasibleDesignError while sizing
     */
    explicit RegressionSimulator(const MotorConfiguration& config);

    /**
     * @brief Run the burn
     * @param steps Number of time steps (steps + 1 samples)
     * @return Timeline with impulse summary
     * @throws std::invalid_argument when steps is zero
     */
    RegressionTimeline run(size_t steps) const;

    /**
     * @brief Advance the burning surface by one step
     * @param geometry Current geometry
     * @param performance Operating point at the current geometry
     * @param dt Time step [s]
     * @return Regressed geometry
     */
    MotorGeometry advance(const MotorGeometry& geometry, const MotorPerformance& performance, double dt) const;

    /**
     * @brief Check the structural limit
     * @return True when the geometry passes the burnthrough limit
     */
    bool exceedsLimit(const MotorGeometry& geometry) const;

    const MotorGeometry& getInitialGeometry() const { return initial_geometry_; }
    double getNominalBurnTime() const { return nominal_burn_time_; }

private:
    MotorConfiguration config_;
    MotorGeometry initial_geometry_;
    double nominal_burn_time_;
    std::shared_ptr<PerformanceSolver> solver_;

    static double portOf(const MotorConfiguration& config, const MotorGeometry& geometry);
};

/**
 * @brief Simulate the burn history of a validated configuration
 * @param config Validated configuration
 * @param steps Number of time steps
 * @return Timeline of steps + 1 samples
 */
RegressionTimeline simulateRegression(const MotorConfiguration& config, size_t steps = 100);

} // namespace motor_design
