#include "validation.hpp"
#include "nozzle.hpp"
#include "propellants.hpp"
#include "environment/isa_atmosphere.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace motor_design {

namespace {

ConstraintViolation makeCheck(ConstraintType type, const std::string& field, double value, double limit,
                              bool is_violated, const std::string& message) {
    double magnitude = is_violated ? std::abs(value - limit) : 0.0;
    return ConstraintViolation(type, field, value, limit, magnitude, is_violated, message);
}

ConstraintViolation satisfied(ConstraintType type, const std::string& field, double value) {
    return ConstraintViolation(type, field, value, value, 0.0, false, "");
}

// True outside (lo, hi]; NaN counts as outside
bool outsideHalfOpen(double value, double lo, double hi) {
    return !(value > lo && value <= hi);
}

} // namespace

// ConfigurationValidator implementation
ConfigurationValidator::ConfigurationValidator(const ValidationLimits& limits) : limits_(limits) {
}

std::vector<ConstraintViolation> ConfigurationValidator::checkConfiguration(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    auto append = [&checks](std::vector<ConstraintViolation> more) {
        checks.insert(checks.end(), more.begin(), more.end());
    };

    append(checkPositivity(config));
    checks.push_back(checkThrust(config));
    checks.push_back(checkBurnTime(config));
    checks.push_back(checkOfRatio(config));
    append(checkChamberPressure(config));
    checks.push_back(checkTankPressure(config));
    checks.push_back(checkGasProperties(config));
    checks.push_back(checkBurnRateLaw(config));
    append(checkNozzle(config));
    checks.push_back(checkChamberDiameter(config));
    append(checkFiniteAreaInputs(config));
    append(checkInjector(config));
    append(checkGrain(config));
    checks.push_back(checkBurnthroughMargin(config));
    append(checkGeometry(config));

    return checks;
}

std::vector<ConstraintViolation> ConfigurationValidator::violations(const MotorConfiguration& config) const {
    auto checks = checkConfiguration(config);
    std::vector<ConstraintViolation> violated;
    std::copy_if(checks.begin(), checks.end(), std::back_inserter(violated),
                 [](const ConstraintViolation& v) { return v.is_violated; });
    return violated;
}

std::vector<ConstraintViolation> ConfigurationValidator::checkPositivity(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    checks.push_back(checkPositive("chamber_temperature", config.chamber_temperature));
    checks.push_back(checkPositive("gas_constant", config.gas_constant));
    checks.push_back(checkPositive("characteristic_length", config.characteristic_length));
    checks.push_back(checkPositive("burn_rate_coefficient", config.burn_rate_coefficient));
    checks.push_back(checkPositive("propellant_density", config.propellant_density));
    checks.push_back(checkPositive("initial_temperature", config.initial_temperature));

    if (config.kind == PropellantKind::HYBRID) {
        checks.push_back(checkPositive("oxidizer_density", config.oxidizer.density));
        checks.push_back(checkPositive("oxidizer_viscosity", config.oxidizer.viscosity));
        checks.push_back(checkPositive("oxidizer_vapor_pressure", config.oxidizer.vapor_pressure));
        checks.push_back(checkPositive("initial_oxidizer_flux", config.initial_oxidizer_flux));
    }
    return checks;
}

ConstraintViolation ConfigurationValidator::checkThrust(const MotorConfiguration& config) const {
    bool is_violated = !(config.thrust >= limits_.thrust_min && config.thrust <= limits_.thrust_max);
    double limit = config.thrust < limits_.thrust_min ? limits_.thrust_min : limits_.thrust_max;
    return makeCheck(ConstraintType::THRUST_RANGE, "thrust", config.thrust, limit, is_violated,
                     fmt::format("thrust {:.3g} N outside [{:.3g}, {:.3g}] N",
                                 config.thrust, limits_.thrust_min, limits_.thrust_max));
}

ConstraintViolation ConfigurationValidator::checkBurnTime(const MotorConfiguration& config) const {
    bool is_violated = !(config.burn_time >= limits_.burn_time_min && config.burn_time <= limits_.burn_time_max);
    double limit = config.burn_time < limits_.burn_time_min ? limits_.burn_time_min : limits_.burn_time_max;
    return makeCheck(ConstraintType::BURN_TIME_RANGE, "burn_time", config.burn_time, limit, is_violated,
                     fmt::format("burn time {:.3g} s outside [{:.3g}, {:.3g}] s",
                                 config.burn_time, limits_.burn_time_min, limits_.burn_time_max));
}

ConstraintViolation ConfigurationValidator::checkOfRatio(const MotorConfiguration& config) const {
    if (config.kind != PropellantKind::HYBRID) {
        return satisfied(ConstraintType::OF_RATIO_RANGE, "of_ratio", config.of_ratio);
    }
    bool is_violated = outsideHalfOpen(config.of_ratio, 0.0, limits_.of_ratio_max);
    double limit = config.of_ratio > 0.0 ? limits_.of_ratio_max : 0.0;
    return makeCheck(ConstraintType::OF_RATIO_RANGE, "of_ratio", config.of_ratio, limit, is_violated,
                     fmt::format("O/F ratio {:.3g} outside (0, {:.3g}]", config.of_ratio, limits_.of_ratio_max));
}

std::vector<ConstraintViolation> ConfigurationValidator::checkChamberPressure(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    const double pc = config.chamber_pressure;
    const double pa = config.atmospheric_pressure;

    checks.push_back(makeCheck(ConstraintType::CHAMBER_PRESSURE_RANGE, "atmospheric_pressure", pa, 0.0,
                               !(pa >= 0.0),
                               fmt::format("atmospheric pressure {:.4g} Pa must not be negative", pa)));
    checks.push_back(makeCheck(ConstraintType::CHAMBER_PRESSURE_RANGE, "chamber_pressure", pc, pa,
                               !(pc > pa) || !(pc > 0.0),
                               fmt::format("chamber pressure {:.4g} Pa must exceed atmospheric pressure {:.4g} Pa",
                                           pc, pa)));
    checks.push_back(makeCheck(ConstraintType::CHAMBER_PRESSURE_RANGE, "chamber_pressure", pc,
                               limits_.chamber_pressure_max, pc > limits_.chamber_pressure_max,
                               fmt::format("chamber pressure {:.4g} Pa above {:.4g} Pa",
                                           pc, limits_.chamber_pressure_max)));
    return checks;
}

ConstraintViolation ConfigurationValidator::checkTankPressure(const MotorConfiguration& config) const {
    if (config.kind != PropellantKind::HYBRID) {
        return satisfied(ConstraintType::TANK_PRESSURE, "tank_pressure", config.tank_pressure);
    }
    bool is_violated = !(config.tank_pressure > config.chamber_pressure);
    return makeCheck(ConstraintType::TANK_PRESSURE, "tank_pressure", config.tank_pressure, config.chamber_pressure,
                     is_violated,
                     fmt::format("tank pressure {:.4g} Pa must exceed chamber pressure {:.4g} Pa",
                                 config.tank_pressure, config.chamber_pressure));
}

ConstraintViolation ConfigurationValidator::checkGasProperties(const MotorConfiguration& config) const {
    bool is_violated = !(config.gamma > 1.0 && config.gamma < 2.0);
    double limit = config.gamma > 1.0 ? 2.0 : 1.0;
    return makeCheck(ConstraintType::GAS_PROPERTIES, "gamma", config.gamma, limit, is_violated,
                     fmt::format("ratio of specific heats {:.4g} outside (1, 2)", config.gamma));
}

ConstraintViolation ConfigurationValidator::checkBurnRateLaw(const MotorConfiguration& config) const {
    double n = config.burn_rate_exponent;
    bool is_violated = !(n > 0.0 && n < 1.0);
    double limit = n > 0.0 ? 1.0 : 0.0;
    return makeCheck(ConstraintType::BURN_RATE_LAW, "burn_rate_exponent", n, limit, is_violated,
                     fmt::format("burn-rate exponent {:.4g} outside (0, 1)", n));
}

std::vector<ConstraintViolation> ConfigurationValidator::checkNozzle(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    const double eps = config.expansion_ratio;
    checks.push_back(makeCheck(ConstraintType::EXPANSION_RATIO, "expansion_ratio", eps, 1.0,
                               !(eps == 0.0 || eps > 1.0),
                               fmt::format("expansion ratio {:.4g} must be 0 (auto) or greater than 1", eps)));
    checks.push_back(makeCheck(ConstraintType::EXPANSION_RATIO, "atmospheric_pressure",
                               config.atmospheric_pressure, 0.0,
                               eps == 0.0 && !(config.atmospheric_pressure > 0.0),
                               "automatic expansion ratio requires a positive atmospheric pressure"));
    checks.push_back(makeCheck(ConstraintType::NOZZLE_EFFICIENCY, "nozzle_efficiency", config.nozzle_efficiency, 1.0,
                               outsideHalfOpen(config.nozzle_efficiency, 0.0, 1.0),
                               fmt::format("nozzle efficiency {:.4g} outside (0, 1]", config.nozzle_efficiency)));
    return checks;
}

ConstraintViolation ConfigurationValidator::checkChamberDiameter(const MotorConfiguration& config) const {
    if (!config.chamber_diameter) {
        return satisfied(ConstraintType::CHAMBER_DIAMETER, "chamber_diameter", 0.0);
    }
    const double d = *config.chamber_diameter;
    bool is_violated = !(d >= limits_.chamber_diameter_min && d <= limits_.chamber_diameter_max);
    double limit = d < limits_.chamber_diameter_min ? limits_.chamber_diameter_min : limits_.chamber_diameter_max;
    std::string message = fmt::format("chamber diameter {:.4g} m outside [{:.4g}, {:.4g}] m",
                                      d, limits_.chamber_diameter_min, limits_.chamber_diameter_max);

    if (!is_violated && config.kind == PropellantKind::SOLID && config.grain) {
        double required = config.grain->outer_diameter + 2.0 * constants::kLinerThickness;
        if (d < required) {
            is_violated = true;
            limit = required;
            message = fmt::format("chamber diameter {:.4g} m cannot hold grain plus liner ({:.4g} m)", d, required);
        }
    }
    return makeCheck(ConstraintType::CHAMBER_DIAMETER, "chamber_diameter", d, limit, is_violated, message);
}

std::vector<ConstraintViolation> ConfigurationValidator::checkFiniteAreaInputs(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    if (config.combustion_mode != CombustionMode::FINITE_AREA) {
        checks.push_back(satisfied(ConstraintType::FINITE_AREA_INPUTS, "combustion_mode", 0.0));
        return checks;
    }

    const bool has_ratio = config.contraction_ratio.has_value();
    const bool has_flux = config.chamber_mass_flux.has_value();
    const double supplied = static_cast<double>(has_ratio) + static_cast<double>(has_flux);
    checks.push_back(makeCheck(ConstraintType::FINITE_AREA_INPUTS, "combustion_mode", supplied, 1.0,
                               has_ratio == has_flux,
                               has_ratio ? "finite-area combustion takes a contraction ratio or a mass flux, not both"
                                         : "finite-area combustion requires a contraction ratio or a mass flux"));
    if (has_ratio) {
        checks.push_back(makeCheck(ConstraintType::FINITE_AREA_INPUTS, "contraction_ratio", *config.contraction_ratio,
                                   1.0, !(*config.contraction_ratio > 1.0),
                                   fmt::format("contraction ratio {:.4g} must exceed 1", *config.contraction_ratio)));
    }
    if (has_flux) {
        checks.push_back(makeCheck(ConstraintType::FINITE_AREA_INPUTS, "chamber_mass_flux", *config.chamber_mass_flux,
                                   0.0, !(*config.chamber_mass_flux > 0.0),
                                   fmt::format("chamber mass flux {:.4g} kg/(m²·s) must be positive",
                                               *config.chamber_mass_flux)));
    }
    return checks;
}

std::vector<ConstraintViolation> ConfigurationValidator::checkInjector(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    const InjectorSpec& spec = config.injector;
    const ConstraintType type = ConstraintType::INJECTOR_PARAMETERS;

    if (spec.discharge_coefficient) {
        double cd = *spec.discharge_coefficient;
        checks.push_back(makeCheck(type, "discharge_coefficient", cd, 1.0, outsideHalfOpen(cd, 0.0, 1.0),
                                   fmt::format("discharge coefficient {:.4g} outside (0, 1]", cd)));
    }
    if (spec.pressure_drop) {
        checks.push_back(checkPositive("injector_pressure_drop", *spec.pressure_drop));
        checks.back().type = type;
    }

    if (const auto* shower = std::get_if<ShowerheadParams>(&spec.params)) {
        checks.push_back(makeCheck(type, "min_hole_diameter", shower->min_hole_diameter, 0.0,
                                   !(shower->min_hole_diameter > 0.0),
                                   "minimum hole diameter must be positive"));
        checks.push_back(makeCheck(type, "max_hole_diameter", shower->max_hole_diameter, shower->min_hole_diameter,
                                   !(shower->max_hole_diameter >= shower->min_hole_diameter),
                                   fmt::format("maximum hole diameter {:.4g} m below minimum {:.4g} m",
                                               shower->max_hole_diameter, shower->min_hole_diameter)));
        checks.push_back(makeCheck(type, "target_velocity", shower->target_velocity, 0.0,
                                   !(shower->target_velocity > 0.0), "target injection velocity must be positive"));
        checks.push_back(makeCheck(type, "plate_thickness", shower->plate_thickness, 0.0,
                                   !(shower->plate_thickness > 0.0), "injector plate thickness must be positive"));
        checks.push_back(makeCheck(type, "hole_count", shower->hole_count, 0.0, shower->hole_count < 0,
                                   "hole count must be 0 (auto) or positive"));
    } else if (const auto* pintle = std::get_if<PintleParams>(&spec.params)) {
        checks.push_back(makeCheck(type, "pintle_diameter", pintle->pintle_diameter, 0.0,
                                   !(pintle->pintle_diameter > 0.0), "pintle diameter must be positive"));
        checks.push_back(makeCheck(type, "outer_diameter", pintle->outer_diameter, pintle->pintle_diameter,
                                   !(pintle->outer_diameter > pintle->pintle_diameter),
                                   fmt::format("pintle outer diameter {:.4g} m must exceed pintle diameter {:.4g} m",
                                               pintle->outer_diameter, pintle->pintle_diameter)));
    } else if (const auto* swirl = std::get_if<SwirlParams>(&spec.params)) {
        checks.push_back(makeCheck(type, "slot_count", swirl->slot_count, 1.0, swirl->slot_count < 1,
                                   "swirl injector needs at least one slot"));
        checks.push_back(makeCheck(type, "spray_half_angle", swirl->spray_half_angle, 0.5 * constants::kPi,
                                   !(swirl->spray_half_angle > 0.0 && swirl->spray_half_angle < 0.5 * constants::kPi),
                                   fmt::format("spray half angle {:.4g} rad outside (0, pi/2)",
                                               swirl->spray_half_angle)));
    }
    return checks;
}

std::vector<ConstraintViolation> ConfigurationValidator::checkGrain(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    if (config.kind == PropellantKind::SOLID && config.grain) {
        checks.push_back(checkSolidGrain(*config.grain, "grain"));
    }
    return checks;
}

ConstraintViolation ConfigurationValidator::checkBurnthroughMargin(const MotorConfiguration& config) const {
    double margin = config.burnthrough_margin;
    bool is_violated = !(margin > 0.0 && margin < 1.0);
    return makeCheck(ConstraintType::BURNTHROUGH_MARGIN, "burnthrough_margin", margin, margin > 0.0 ? 1.0 : 0.0,
                     is_violated, fmt::format("burnthrough margin {:.4g} outside (0, 1)", margin));
}

std::vector<ConstraintViolation> ConfigurationValidator::checkGeometry(const MotorConfiguration& config) const {
    std::vector<ConstraintViolation> checks;
    if (!config.geometry) {
        return checks;
    }
    const MotorGeometry& g = *config.geometry;
    const ConstraintType type = ConstraintType::GEOMETRY;

    checks.push_back(makeCheck(type, "geometry.throat_area", g.throat_area, 0.0,
                               !utils::isPositiveFinite(g.throat_area), "throat area must be positive"));
    checks.push_back(makeCheck(type, "geometry.expansion_ratio", g.expansion_ratio, 1.0, !(g.expansion_ratio > 1.0),
                               fmt::format("as-built expansion ratio {:.4g} must exceed 1", g.expansion_ratio)));
    checks.push_back(makeCheck(type, "geometry.chamber_diameter", g.chamber_diameter, 0.0,
                               !utils::isPositiveFinite(g.chamber_diameter), "chamber diameter must be positive"));

    if (config.kind == PropellantKind::HYBRID) {
        checks.push_back(makeCheck(type, "geometry.injector_effective_area", g.injector_effective_area, 0.0,
                                   !utils::isPositiveFinite(g.injector_effective_area),
                                   "injector effective area must be positive"));
        checks.push_back(makeCheck(type, "geometry.grain_length", g.grain_length, 0.0,
                                   !utils::isPositiveFinite(g.grain_length), "grain length must be positive"));
        checks.push_back(makeCheck(type, "geometry.port_diameter", g.port_diameter, g.chamber_diameter,
                                   !(g.port_diameter > 0.0 && g.port_diameter < g.chamber_diameter),
                                   fmt::format("port diameter {:.4g} m must lie in (0, chamber diameter {:.4g} m)",
                                               g.port_diameter, g.chamber_diameter)));
    } else {
        auto grain_check = checkSolidGrain(g.grain, "geometry.grain");
        grain_check.type = type;
        checks.push_back(grain_check);
    }
    return checks;
}

bool ConfigurationValidator::hasViolations(const MotorConfiguration& config) const {
    auto checks = checkConfiguration(config);
    return std::any_of(checks.begin(), checks.end(),
                       [](const ConstraintViolation& v) { return v.is_violated; });
}

int ConfigurationValidator::getViolationCount(const MotorConfiguration& config) const {
    auto checks = checkConfiguration(config);
    return static_cast<int>(std::count_if(checks.begin(), checks.end(),
                                          [](const ConstraintViolation& v) { return v.is_violated; }));
}

std::vector<std::string> ConfigurationValidator::collectWarnings(const MotorConfiguration& config) const {
    std::vector<std::string> warnings;

    if (config.kind == PropellantKind::HYBRID) {
        double margin = (config.tank_pressure - config.chamber_pressure) / config.chamber_pressure;
        if (margin > 0.0 && margin < limits_.tank_margin_recommended) {
            warnings.push_back(fmt::format(
                "tank pressure margin {:.1f}% is below the recommended {:.0f}%; injector stiffness is low",
                100.0 * margin, 100.0 * limits_.tank_margin_recommended));
        }
        if (config.of_ratio > 0.0 && config.of_ratio < limits_.of_ratio_warn_min) {
            warnings.push_back(fmt::format("O/F ratio {:.2f} is unusually fuel rich", config.of_ratio));
        }
    }

    if (config.combustion_mode == CombustionMode::FINITE_AREA && config.chamber_diameter) {
        warnings.push_back("chamber diameter supplied; finite-area inputs only set the chamber Mach number");
    }
    if (config.combustion_mode == CombustionMode::INFINITE_AREA &&
        (config.contraction_ratio || config.chamber_mass_flux)) {
        warnings.push_back("contraction ratio / chamber mass flux ignored in infinite-area combustion mode");
    }

    if (config.geometry && config.kind == PropellantKind::HYBRID &&
        config.geometry->port_diameter >= limits_.port_warning_fraction * config.geometry->chamber_diameter) {
        warnings.push_back(fmt::format("port diameter is {:.0f}% of the chamber diameter",
                                       100.0 * config.geometry->port_diameter / config.geometry->chamber_diameter));
    }
    return warnings;
}

// Helper methods
ConstraintViolation ConfigurationValidator::checkPositive(const std::string& field, double value) const {
    return makeCheck(ConstraintType::POSITIVITY, field, value, 0.0, !utils::isPositiveFinite(value),
                     fmt::format("{} must be positive (got {:.4g})", field, value));
}

ConstraintViolation ConfigurationValidator::checkSolidGrain(const SolidGrain& grain, const std::string& prefix) const {
    if (!(grain.outer_diameter > 0.0 && grain.core_diameter > 0.0)) {
        return makeCheck(ConstraintType::GRAIN_GEOMETRY, prefix + ".core_diameter", grain.core_diameter, 0.0, true,
                         "grain diameters must be positive");
    }
    if (!(grain.core_diameter < grain.outer_diameter)) {
        return makeCheck(ConstraintType::GRAIN_GEOMETRY, prefix + ".core_diameter", grain.core_diameter,
                         grain.outer_diameter, true,
                         fmt::format("grain core {:.4g} m must be smaller than outer diameter {:.4g} m",
                                     grain.core_diameter, grain.outer_diameter));
    }
    if (!(grain.segment_length > 0.0) || grain.segment_count < 1) {
        return makeCheck(ConstraintType::GRAIN_GEOMETRY, prefix + ".segment_length", grain.segment_length, 0.0, true,
                         "grain needs at least one segment of positive length");
    }
    return satisfied(ConstraintType::GRAIN_GEOMETRY, prefix, grain.outer_diameter);
}

// Defaulting and validation entry points
ValidatedConfiguration validate(const RawMotorConfiguration& raw, const ValidationLimits& limits) {
    std::vector<ConstraintViolation> violations;
    std::vector<std::string> warnings;
    MotorConfiguration config;

    config.kind = raw.kind.value_or(PropellantKind::HYBRID);
    config.propellant = raw.propellant.value_or(config.kind == PropellantKind::HYBRID ? "htpb" : "apcp");
    config.nozzle_type = raw.nozzle_type.value_or(NozzleType::CONICAL);
    config.nozzle_efficiency = nozzle::nozzleEfficiency(config.nozzle_type);

    // Propellant database, overridden field by field by explicit input
    if (config.kind == PropellantKind::HYBRID) {
        auto fuel = findHybridFuel(config.propellant);
        if (fuel) {
            config.propellant_density = fuel->density;
            config.burn_rate_coefficient = fuel->regression_a;
            config.burn_rate_exponent = fuel->regression_n;
            config.chamber_temperature = fuel->chamber_temperature;
            config.gas_constant = fuel->gas_constant;
        } else if (!(raw.propellant_density && raw.burn_rate_coefficient && raw.burn_rate_exponent &&
                     raw.chamber_temperature && raw.gas_constant)) {
            violations.emplace_back(ConstraintType::PROPELLANT_NAME, "propellant", 0.0, 0.0, 0.0, true,
                                    fmt::format("unknown hybrid fuel '{}' and incomplete custom properties",
                                                config.propellant));
        }
    } else {
        auto propellant = findSolidPropellant(config.propellant);
        if (propellant) {
            config.propellant_density = propellant->density;
            config.burn_rate_coefficient = propellant->burnRateCoefficientSI();
            config.burn_rate_exponent = propellant->burn_rate_n;
            config.chamber_temperature = propellant->chamber_temperature;
            config.gamma = propellant->gamma;
            config.gas_constant = propellant->gasConstant();
            config.nozzle_efficiency = propellant->nozzle_efficiency;
            config.temperature_coefficient = propellant->temperature_coefficient;
        } else if (!(raw.propellant_density && raw.burn_rate_coefficient && raw.burn_rate_exponent &&
                     raw.chamber_temperature && raw.gas_constant && raw.gamma)) {
            violations.emplace_back(ConstraintType::PROPELLANT_NAME, "propellant", 0.0, 0.0, 0.0, true,
                                    fmt::format("unknown solid propellant '{}' and incomplete custom properties",
                                                config.propellant));
        }
    }

    // Thrust, burn time and total impulse
    if (raw.total_impulse) {
        const double impulse = *raw.total_impulse;
        if (!utils::isPositiveFinite(impulse)) {
            violations.emplace_back(ConstraintType::POSITIVITY, "total_impulse", impulse, 0.0, std::abs(impulse), true,
                                    fmt::format("total_impulse must be positive (got {:.4g})", impulse));
        } else if (raw.thrust && raw.burn_time) {
            config.thrust = *raw.thrust;
            config.burn_time = *raw.burn_time;
            double mismatch = std::abs(config.thrust * config.burn_time - impulse) / impulse;
            if (mismatch > limits.impulse_tolerance) {
                warnings.push_back(fmt::format(
                    "thrust x burn time ({:.0f} N·s) differs from total impulse ({:.0f} N·s) by {:.0f}%",
                    config.thrust * config.burn_time, impulse, 100.0 * mismatch));
            }
        } else if (raw.burn_time) {
            config.burn_time = *raw.burn_time;
            config.thrust = impulse / config.burn_time;
        } else {
            config.thrust = raw.thrust.value_or(config.thrust);
            config.burn_time = impulse / config.thrust;
        }
    } else {
        config.thrust = raw.thrust.value_or(config.thrust);
        config.burn_time = raw.burn_time.value_or(config.burn_time);
    }

    // Ambient pressure: explicit value, then ISA altitude, then sea level
    if (raw.atmospheric_pressure) {
        config.atmospheric_pressure = *raw.atmospheric_pressure;
    } else if (raw.altitude) {
        if (environment::IsaAtmosphere::inRange(*raw.altitude)) {
            config.atmospheric_pressure = environment::IsaAtmosphere::pressureAt(*raw.altitude);
        } else {
            violations.emplace_back(ConstraintType::AMBIENT_CONDITIONS, "altitude", *raw.altitude,
                                    environment::IsaAtmosphere::kMaxAltitude, 0.0, true,
                                    fmt::format("altitude {:.0f} m outside the standard atmosphere table",
                                                *raw.altitude));
        }
    }

    config.of_ratio = raw.of_ratio.value_or(config.of_ratio);
    config.chamber_pressure = raw.chamber_pressure.value_or(config.chamber_pressure);
    config.chamber_temperature = raw.chamber_temperature.value_or(config.chamber_temperature);
    config.gamma = raw.gamma.value_or(config.gamma);
    config.gas_constant = raw.gas_constant.value_or(config.gas_constant);
    config.characteristic_length = raw.characteristic_length.value_or(config.characteristic_length);
    config.expansion_ratio = raw.expansion_ratio.value_or(config.expansion_ratio);
    config.nozzle_efficiency = raw.nozzle_efficiency.value_or(config.nozzle_efficiency);
    config.burn_rate_coefficient = raw.burn_rate_coefficient.value_or(config.burn_rate_coefficient);
    config.burn_rate_exponent = raw.burn_rate_exponent.value_or(config.burn_rate_exponent);
    config.propellant_density = raw.propellant_density.value_or(config.propellant_density);
    config.initial_temperature = raw.initial_temperature.value_or(config.initial_temperature);
    config.temperature_coefficient = raw.temperature_coefficient.value_or(config.temperature_coefficient);

    config.oxidizer.phase = raw.oxidizer_phase.value_or(OxidizerPhase::LIQUID);
    config.oxidizer.density = raw.oxidizer_density.value_or(config.oxidizer.phase == OxidizerPhase::LIQUID ? 1220.0 : 1.8);
    config.oxidizer.viscosity = raw.oxidizer_viscosity.value_or(config.oxidizer.viscosity);
    config.oxidizer.vapor_pressure = raw.oxidizer_vapor_pressure.value_or(config.oxidizer.vapor_pressure);
    config.tank_pressure = raw.tank_pressure.value_or(config.tank_pressure);
    config.initial_oxidizer_flux = raw.initial_oxidizer_flux.value_or(config.initial_oxidizer_flux);

    config.combustion_mode = raw.combustion_mode.value_or(CombustionMode::INFINITE_AREA);
    config.contraction_ratio = raw.contraction_ratio;
    config.chamber_mass_flux = raw.chamber_mass_flux;
    config.chamber_diameter = raw.chamber_diameter;
    config.grain = raw.grain;
    config.burnthrough_margin = raw.burnthrough_margin.value_or(config.burnthrough_margin);
    if (raw.injector) {
        config.injector = *raw.injector;
    }
    config.geometry = raw.geometry;

    ConfigurationValidator validator(limits);
    auto rule_violations = validator.violations(config);
    violations.insert(violations.end(), rule_violations.begin(), rule_violations.end());
    if (!violations.empty()) {
        throw ValidationError(std::move(violations));
    }

    auto rule_warnings = validator.collectWarnings(config);
    warnings.insert(warnings.end(), rule_warnings.begin(), rule_warnings.end());
    return {config, warnings};
}

void requireValid(const MotorConfiguration& config, const ValidationLimits& limits) {
    ConfigurationValidator validator(limits);
    auto violated = validator.violations(config);
    if (!violated.empty()) {
        throw ValidationError(std::move(violated));
    }
}

// Factory functions
std::shared_ptr<ConfigurationValidator> createConfigurationValidator(const ValidationLimits& limits) {
    return std::make_shared<ConfigurationValidator>(limits);
}

} // namespace motor_design
