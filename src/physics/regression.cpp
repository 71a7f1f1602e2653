#include "regression.hpp"
#include "propulsion/grain.hpp"
#include "../utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <stdexcept>

namespace motor_design {

RegressionSimulator::RegressionSimulator(const MotorConfiguration& config)
    : config_(config), initial_geometry_(), nominal_burn_time_(0.0) {
    if (!config_.geometry) {
        config_.geometry = PerformanceSolver(config_).designGeometry();
    }
    initial_geometry_ = *config_.geometry;
    solver_ = createPerformanceSolver(config_);
}

double RegressionSimulator::portOf(const MotorConfiguration& config, const MotorGeometry& geometry) {
    return config.kind == PropellantKind::HYBRID ? geometry.port_diameter : geometry.grain.core_diameter;
}

MotorGeometry RegressionSimulator::advance(const MotorGeometry& geometry, const MotorPerformance& performance,
                                           double dt) const {
    MotorGeometry next = geometry;
    const double depth = performance.regression_rate * dt;
    if (config_.kind == PropellantKind::HYBRID) {
        next.port_diameter += 2.0 * depth;
    } else {
        next.grain = propulsion::BatesGrain::regress(geometry.grain, depth);
    }
    return next;
}

bool RegressionSimulator::exceedsLimit(const MotorGeometry& geometry) const {
    if (config_.kind == PropellantKind::HYBRID) {
        return geometry.port_diameter > config_.burnthrough_margin * geometry.chamber_diameter;
    }
    return propulsion::BatesGrain::burned_out(geometry.grain) || !(geometry.grain.web() > 0.0);
}

RegressionTimeline RegressionSimulator::run(size_t steps) const {
    if (steps == 0) {
        throw std::invalid_argument("regression simulation needs at least one step");
    }

    MotorGeometry geometry = initial_geometry_;
    MotorPerformance performance = solver_->evaluate(geometry);
    const double dt = performance.burn_time / static_cast<double>(steps);

    RegressionTimeline timeline;
    timeline.samples.reserve(steps + 1);
    bool frozen = false;

    for (size_t i = 0; i <= steps; ++i) {
        if (i > 0 && !frozen) {
            performance = solver_->evaluate(geometry);
        }

        TimelineSample sample;
        sample.time = static_cast<double>(i) * dt;
        sample.port_diameter = portOf(config_, geometry);
        sample.of_ratio = performance.of_ratio;
        sample.chamber_pressure = performance.chamber_pressure;
        sample.thrust = performance.thrust;
        sample.mass_flow_rate = performance.mass_flow_rate;
        sample.burnthrough_risk = frozen;
        sample.performance = performance;
        timeline.samples.push_back(sample);

        if (frozen || i == steps) continue;

        MotorGeometry next = advance(geometry, performance, dt);
        if (exceedsLimit(next)) {
            frozen = true;
            timeline.burnthrough_index = i + 1;
            std::string message = fmt::format(
                "burnthrough risk at t = {:.3f} s: port {:.1f} mm would pass the structural limit",
                static_cast<double>(i + 1) * dt, 1e3 * portOf(config_, next));
            utils::logger()->warn(message);
            timeline.warnings.push_back(message);
        } else {
            geometry = next;
        }
    }

    // Time base is the initial burn time; a regressive solid outlasts it
    if (config_.kind == PropellantKind::SOLID && !frozen && geometry.grain.web() > 0.0) {
        std::string message = fmt::format(
            "timeline ends at t = {:.3f} s with {:.2f} mm of web unburned (Pc {:.2f} bar)",
            timeline.samples.back().time, 1e3 * geometry.grain.web(),
            1e-5 * timeline.samples.back().chamber_pressure);
        utils::logger()->info(message);
        timeline.warnings.push_back(message);
    }

    // Trapezoidal impulse
    for (size_t i = 1; i < timeline.samples.size(); ++i) {
        const auto& a = timeline.samples[i - 1];
        const auto& b = timeline.samples[i];
        timeline.total_impulse += 0.5 * (a.thrust + b.thrust) * (b.time - a.time);
    }
    timeline.average_thrust = timeline.total_impulse / timeline.samples.back().time;

    return timeline;
}

RegressionTimeline simulateRegression(const MotorConfiguration& config, size_t steps) {
    if (steps == 0) {
        throw std::invalid_argument("regression simulation needs at least one step");
    }
    return RegressionSimulator(config).run(steps);
}

} // namespace motor_design
