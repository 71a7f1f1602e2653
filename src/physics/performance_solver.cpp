#include "performance_solver.hpp"
#include "nozzle.hpp"
#include "propulsion/grain.hpp"
#include "../utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace motor_design {

namespace {
    constexpr double kMinRelaxation = 1e-3;
    constexpr double kHybridDefaultChamberRatio = 1.5;  // Chamber / final port diameter
    constexpr int kPortSizingSteps = 100;
}

PerformanceSolver::PerformanceSolver(const MotorConfiguration& config)
    : config_(config), characteristic_velocity_(0.0), temperature_factor_(1.0) {
    characteristic_velocity_ = nozzle::characteristicVelocity(config_.gamma, config_.gas_constant,
                                                              config_.chamber_temperature);
    requireFinite("characteristic velocity", characteristic_velocity_);

    temperature_factor_ = 1.0 + config_.temperature_coefficient *
                                (config_.initial_temperature - constants::kReferenceTemperature);
    if (!(temperature_factor_ > 0.0)) {
        throw InfeasibleDesignError(fmt::format(
            "burn-rate temperature factor {:.4f} is not positive at {:.1f} K",
            temperature_factor_, config_.initial_temperature));
    }
}

MotorPerformance PerformanceSolver::solve() const {
    if (config_.geometry) {
        return evaluate(*config_.geometry);
    }
    return evaluate(designGeometry());
}

double PerformanceSolver::resolvedExpansionRatio() const {
    if (config_.geometry) return config_.geometry->expansion_ratio;
    if (config_.expansion_ratio > 0.0) return config_.expansion_ratio;
    return nozzle::optimumExpansionRatio(config_.chamber_pressure, config_.atmospheric_pressure, config_.gamma);
}

double PerformanceSolver::regressionRate(double oxidizer_flux) const {
    return config_.burn_rate_coefficient * std::pow(oxidizer_flux, config_.burn_rate_exponent) * temperature_factor_;
}

double PerformanceSolver::burnRate(double pressure) const {
    return config_.burn_rate_coefficient * std::pow(pressure, config_.burn_rate_exponent) * temperature_factor_;
}

double PerformanceSolver::oxidizerMassFlow(const MotorGeometry& geometry, double pressure) const {
    const double drop = config_.tank_pressure - pressure;
    if (drop <= 0.0) return 0.0;
    return geometry.injector_effective_area * std::sqrt(2.0 * config_.oxidizer.density * drop);
}

double PerformanceSolver::massGeneration(const MotorGeometry& geometry, double pressure) const {
    if (config_.kind == PropellantKind::HYBRID) {
        const double oxidizer = oxidizerMassFlow(geometry, pressure);
        const double flux = oxidizer / utils::areaFromDiameter(geometry.port_diameter);
        const double fuel = config_.propellant_density * constants::kPi * geometry.port_diameter *
                            geometry.grain_length * regressionRate(flux);
        return oxidizer + fuel;
    }
    return config_.propellant_density * propulsion::BatesGrain::burning_area(geometry.grain) * burnRate(pressure);
}

SolverState PerformanceSolver::converge(const MotorGeometry& geometry) const {
    const bool hybrid = config_.kind == PropellantKind::HYBRID;
    const double tank = config_.tank_pressure;

    SolverState state(config_.chamber_pressure);
    if (hybrid && state.pressure >= tank) {
        state.pressure = 0.5 * tank;
    }

    double previous_residual = std::numeric_limits<double>::infinity();
    for (int iter = 1; iter <= constants::kSolverMaxIterations; ++iter) {
        state.iterations = iter;
        state.mass_flow = massGeneration(geometry, state.pressure);
        requireFinite("mass generation", state.mass_flow);

        const double updated = state.mass_flow * characteristic_velocity_ / geometry.throat_area;
        state.residual = std::abs(updated - state.pressure) / state.pressure;

        if (state.residual < constants::kSolverTolerance) {
            state.converged = true;
            break;
        }

        // Residual growth means the step overshot
        if (state.residual > previous_residual) {
            state.relaxation = std::max(0.5 * state.relaxation, kMinRelaxation);
        }
        previous_residual = state.residual;

        double candidate = state.pressure + state.relaxation * (updated - state.pressure);
        if (hybrid && candidate >= tank) {
            candidate = state.pressure + 0.5 * (tank - state.pressure);
        }
        if (candidate <= 0.0) {
            candidate = 0.5 * state.pressure;
        }
        state.pressure = candidate;
    }

    if (!state.converged) {
        throw ConvergenceError(
            fmt::format("chamber pressure did not converge after {} iterations (last {:.1f} Pa, residual {:.3e})",
                        state.iterations, state.pressure, state.residual),
            state.pressure, state.iterations, state.residual);
    }
    if (!(state.mass_flow > 0.0)) {
        throw InfeasibleDesignError("converged operating point has no mass flow");
    }
    if (hybrid && state.pressure >= tank) {
        throw InfeasibleDesignError(fmt::format(
            "chamber pressure {:.0f} Pa reached tank pressure {:.0f} Pa", state.pressure, tank));
    }

    utils::logger()->debug("chamber pressure converged to {:.1f} Pa in {} iterations (residual {:.2e})",
                           state.pressure, state.iterations, state.residual);
    return state;
}

MotorGeometry PerformanceSolver::designGeometry() const {
    const double pc = config_.chamber_pressure;
    const double gamma = config_.gamma;

    MotorGeometry geometry;
    geometry.expansion_ratio = resolvedExpansionRatio();

    const double exit_ratio = nozzle::exitPressureRatio(geometry.expansion_ratio, gamma);
    const double cf = nozzle::idealThrustCoefficient(gamma, exit_ratio, config_.atmospheric_pressure / pc,
                                                     geometry.expansion_ratio);
    if (!(cf > 0.0)) {
        throw InfeasibleDesignError(fmt::format(
            "ideal thrust coefficient {:.4f} is not positive (expansion ratio {:.3f})",
            cf, geometry.expansion_ratio));
    }

    geometry.throat_area = config_.thrust / (config_.nozzle_efficiency * cf * pc);
    requireFinite("throat area", geometry.throat_area);
    const double mass_flow = nozzle::throatMassFlow(pc, geometry.throat_area, characteristic_velocity_);

    if (config_.kind == PropellantKind::HYBRID) {
        sizeHybrid(geometry, mass_flow);
    } else {
        sizeSolid(geometry, mass_flow);
    }

    // Free volume for L*, added downstream of the grain
    const double free_volume = config_.characteristic_length * geometry.throat_area;
    const double grain_length = config_.kind == PropellantKind::HYBRID
                              ? geometry.grain_length
                              : propulsion::BatesGrain::total_length(geometry.grain);
    geometry.chamber_length = grain_length + free_volume / utils::areaFromDiameter(geometry.chamber_diameter);

    return geometry;
}

void PerformanceSolver::sizeHybrid(MotorGeometry& geometry, double mass_flow) const {
    const double of = config_.of_ratio;
    const double oxidizer_flow = mass_flow * of / (1.0 + of);
    const double fuel_flow = mass_flow / (1.0 + of);

    geometry.port_diameter = std::sqrt(4.0 * oxidizer_flow / (constants::kPi * config_.initial_oxidizer_flux));
    const double initial_rate = regressionRate(config_.initial_oxidizer_flux);
    geometry.grain_length = fuel_flow / (config_.propellant_density * constants::kPi *
                                         geometry.port_diameter * initial_rate);
    requireFinite("grain length", geometry.grain_length);

    const double final_port = propulsion::hybrid_final_port(
        geometry.port_diameter, oxidizer_flow, config_.burn_rate_coefficient, config_.burn_rate_exponent,
        temperature_factor_, config_.burn_time, kPortSizingSteps);

    geometry.injector_effective_area = oxidizer_flow /
        std::sqrt(2.0 * config_.oxidizer.density * (config_.tank_pressure - config_.chamber_pressure));
    requireFinite("injector effective area", geometry.injector_effective_area);
    geometry.oxidizer_load = oxidizer_flow * config_.burn_time;

    geometry.chamber_diameter = sizeChamberDiameter(geometry, mass_flow, kHybridDefaultChamberRatio * final_port);
    if (!(geometry.chamber_diameter > final_port)) {
        throw InfeasibleDesignError(fmt::format(
            "chamber diameter {:.1f} mm cannot house the final port ({:.1f} mm)",
            1e3 * geometry.chamber_diameter, 1e3 * final_port));
    }
}

void PerformanceSolver::sizeSolid(MotorGeometry& geometry, double mass_flow) const {
    if (config_.grain) {
        geometry.grain = *config_.grain;
    } else {
        const double rate = burnRate(config_.chamber_pressure);
        const double web = rate * config_.burn_time;
        const double required_area = mass_flow / (config_.propellant_density * rate);

        // Core equals the web and the outer diameter is three webs, so each
        // segment's end faces contribute 4·π·web² of burning area
        const double end_area = 4.0 * constants::kPi * web * web;
        const double outer = 3.0 * web;
        int count = static_cast<int>(std::floor(required_area / (end_area + constants::kPi * web * outer)));
        count = std::max(count, 1);

        const double length = required_area / (count * constants::kPi * web) - 4.0 * web;
        if (!(length > 0.0)) {
            throw InfeasibleDesignError(fmt::format(
                "BATES grain cannot provide {:.4g} m² of burning area with a {:.1f} mm web",
                required_area, 1e3 * web));
        }
        geometry.grain = SolidGrain(outer, web, length, count);
    }

    const double casing = geometry.grain.outer_diameter + 2.0 * constants::kLinerThickness;
    geometry.chamber_diameter = sizeChamberDiameter(geometry, mass_flow, casing);
    if (geometry.chamber_diameter < casing) {
        throw InfeasibleDesignError(fmt::format(
            "chamber diameter {:.1f} mm cannot house the grain and liner ({:.1f} mm)",
            1e3 * geometry.chamber_diameter, 1e3 * casing));
    }
}

double PerformanceSolver::sizeChamberDiameter(const MotorGeometry& geometry, double mass_flow,
                                              double default_diameter) const {
    if (config_.chamber_diameter) {
        return *config_.chamber_diameter;
    }
    if (config_.combustion_mode == CombustionMode::FINITE_AREA) {
        const double area = config_.contraction_ratio
                          ? *config_.contraction_ratio * geometry.throat_area
                          : mass_flow / *config_.chamber_mass_flux;
        return utils::diameterFromArea(area);
    }
    return default_diameter;
}

MotorPerformance PerformanceSolver::evaluate(const MotorGeometry& geometry) const {
    const SolverState state = converge(geometry);
    const double pc = state.pressure;
    const double gamma = config_.gamma;

    MotorPerformance perf;
    perf.kind = config_.kind;
    perf.geometry = geometry;
    perf.chamber_pressure = pc;
    perf.mass_flow_rate = state.mass_flow;
    perf.characteristic_velocity = characteristic_velocity_;
    perf.solver_iterations = state.iterations;
    perf.solver_residual = state.residual;
    perf.tank_pressure = config_.tank_pressure;
    perf.oxidizer = config_.oxidizer;

    if (config_.kind == PropellantKind::HYBRID) {
        perf.oxidizer_mass_flow = oxidizerMassFlow(geometry, pc);
        perf.fuel_mass_flow = state.mass_flow - perf.oxidizer_mass_flow;
        if (!(perf.oxidizer_mass_flow > 0.0) || !(perf.fuel_mass_flow > 0.0)) {
            throw InfeasibleDesignError("hybrid operating point lacks oxidizer or fuel flow");
        }
        perf.of_ratio = perf.oxidizer_mass_flow / perf.fuel_mass_flow;
        perf.oxidizer_mass_flux = perf.oxidizer_mass_flow / utils::areaFromDiameter(geometry.port_diameter);
        perf.regression_rate = regressionRate(perf.oxidizer_mass_flux);
        perf.burning_area = constants::kPi * geometry.port_diameter * geometry.grain_length;
        perf.burn_time = geometry.oxidizer_load / perf.oxidizer_mass_flow;
        perf.port_diameter_initial = geometry.port_diameter;
        perf.port_diameter_final = propulsion::hybrid_final_port(
            geometry.port_diameter, perf.oxidizer_mass_flow, config_.burn_rate_coefficient,
            config_.burn_rate_exponent, temperature_factor_, perf.burn_time, kPortSizingSteps);
    } else {
        perf.oxidizer_mass_flow = 0.0;
        perf.fuel_mass_flow = state.mass_flow;
        perf.of_ratio = 0.0;
        perf.regression_rate = burnRate(pc);
        perf.burning_area = propulsion::BatesGrain::burning_area(geometry.grain);
        perf.burn_time = geometry.grain.web() / perf.regression_rate;
        perf.port_diameter_initial = geometry.grain.core_diameter;
        perf.port_diameter_final = geometry.grain.core_diameter + 2.0 * geometry.grain.web();
    }
    requireFinite("burn time", perf.burn_time);

    // Nozzle
    perf.throat_area = geometry.throat_area;
    perf.throat_diameter = utils::diameterFromArea(geometry.throat_area);
    perf.expansion_ratio = geometry.expansion_ratio;
    perf.exit_area = geometry.expansion_ratio * geometry.throat_area;
    perf.exit_diameter = utils::diameterFromArea(perf.exit_area);
    perf.nozzle_divergent_length = nozzle::divergentLength(perf.throat_diameter, perf.exit_diameter,
                                                           config_.nozzle_type);

    const double exit_ratio = nozzle::exitPressureRatio(geometry.expansion_ratio, gamma);
    perf.exit_pressure = exit_ratio * pc;
    if (!(perf.exit_pressure < pc)) {
        throw InfeasibleDesignError(fmt::format(
            "exit pressure {:.0f} Pa not below chamber pressure {:.0f} Pa", perf.exit_pressure, pc));
    }
    perf.exit_velocity = nozzle::exitVelocity(gamma, config_.gas_constant, config_.chamber_temperature, exit_ratio);
    requireFinite("exit velocity", perf.exit_velocity);

    perf.thrust = config_.nozzle_efficiency *
                  (state.mass_flow * perf.exit_velocity +
                   (perf.exit_pressure - config_.atmospheric_pressure) * perf.exit_area);
    if (!(perf.thrust > 0.0)) {
        throw InfeasibleDesignError(fmt::format("nozzle produces no thrust ({:.1f} N)", perf.thrust));
    }
    perf.thrust_coefficient = perf.thrust / (pc * geometry.throat_area);

    perf.oxidizer_mass = perf.oxidizer_mass_flow * perf.burn_time;
    perf.fuel_mass = perf.fuel_mass_flow * perf.burn_time;
    perf.propellant_mass = perf.oxidizer_mass + perf.fuel_mass;
    perf.total_impulse = perf.thrust * perf.burn_time;
    perf.specific_impulse = perf.total_impulse / (perf.propellant_mass * constants::kG0);
    requireFinite("specific impulse", perf.specific_impulse);

    // Chamber
    perf.chamber_diameter = geometry.chamber_diameter;
    perf.chamber_length = geometry.chamber_length;
    perf.chamber_volume = config_.characteristic_length * geometry.throat_area;
    if (config_.combustion_mode == CombustionMode::FINITE_AREA) {
        const double contraction = utils::areaFromDiameter(geometry.chamber_diameter) / geometry.throat_area;
        perf.chamber_mach = nozzle::subsonicMach(contraction, gamma);
        perf.stagnation_pressure_ratio = nozzle::rayleighStagnationRatio(perf.chamber_mach, gamma);
    }

    return perf;
}

void PerformanceSolver::requireFinite(const char* name, double value) const {
    if (!std::isfinite(value) || value < 0.0) {
        throw InfeasibleDesignError(fmt::format("{} is not a finite non-negative value ({})", name, value));
    }
}

MotorPerformance solve(const MotorConfiguration& config) {
    return PerformanceSolver(config).solve();
}

// Factory function
std::shared_ptr<PerformanceSolver> createPerformanceSolver(const MotorConfiguration& config) {
    return std::make_shared<PerformanceSolver>(config);
}

} // namespace motor_design
