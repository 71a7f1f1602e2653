#include "physics/injector/injector.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace motor_design {

namespace {
    constexpr int kMaxHoleCount = 2000;
    constexpr double kAreaOversizeLimit = 1.1;     // Accepted delivered/required area
    constexpr double kTargetLengthToDiameter = 4.0;
    constexpr double kMinLengthToDiameter = 3.0;
    constexpr double kMaxLengthToDiameter = 5.0;
    constexpr double kNominalPitchRatio = 3.0;     // Hole pitch / hole diameter
    constexpr double kMinPitchRatio = 1.5;
    constexpr double kNominalSwirlRatio = 3.0;     // Swirl chamber / orifice diameter
    constexpr double kMinSwirlRatio = 1.5;
    constexpr double kFootprintFraction = 0.9;
    constexpr double kMinPintleGap = 0.3e-3;
    constexpr double kMaxPintleGap = 3.0e-3;

    double lengthToDiameterPenalty(double ratio) {
        double outside = 0.0;
        if (ratio < kMinLengthToDiameter) outside = kMinLengthToDiameter - ratio;
        if (ratio > kMaxLengthToDiameter) outside = ratio - kMaxLengthToDiameter;
        return std::abs(ratio - kTargetLengthToDiameter) + 10.0 * outside;
    }

    double showerheadFootprint(int hole_count, double pitch) {
        return std::sqrt(4.0 * hole_count / constants::kPi) * pitch;
    }

    double pintleGap(double pintle_diameter, double area) {
        return 0.5 * (std::sqrt(pintle_diameter * pintle_diameter + 4.0 * area / constants::kPi) - pintle_diameter);
    }

    // One sizing routine per variant alternative
    struct FamilySizer {
        const InjectorFlowConditions& flow;

        InjectorDesign operator()(const ShowerheadParams& params) const { return sizeShowerhead(flow, params); }
        InjectorDesign operator()(const PintleParams& params) const { return sizePintle(flow, params); }
        InjectorDesign operator()(const SwirlParams& params) const { return sizeSwirl(flow, params); }
    };
}

double defaultDischargeCoefficient(InjectorFamily family) {
    switch (family) {
        case InjectorFamily::PINTLE: return 0.75;
        case InjectorFamily::SWIRL: return 0.65;
        default: return 0.70;
    }
}

double requiredFlowArea(double mass_flow, double discharge_coefficient, double density, double pressure_drop) {
    return mass_flow / (discharge_coefficient * std::sqrt(2.0 * density * pressure_drop));
}

InjectorFlowConditions resolveFlowConditions(const MotorPerformance& performance, const InjectorSpec& spec) {
    InjectorFlowConditions flow;
    flow.mass_flow = performance.oxidizer_mass_flow;
    flow.density = performance.oxidizer.density;
    flow.viscosity = performance.oxidizer.viscosity;
    flow.discharge_coefficient = spec.discharge_coefficient.value_or(defaultDischargeCoefficient(spec.family()));

    if (spec.pressure_drop) {
        flow.pressure_drop = *spec.pressure_drop;
    } else if (const auto* shower = std::get_if<ShowerheadParams>(&spec.params)) {
        const double ideal_velocity = shower->target_velocity / flow.discharge_coefficient;
        flow.pressure_drop = 0.5 * flow.density * ideal_velocity * ideal_velocity;
    } else {
        flow.pressure_drop = performance.tank_pressure - performance.chamber_pressure;
    }

    if (!(flow.pressure_drop > 0.0)) {
        throw InfeasibleGeometryError(fmt::format(
            "injector pressure drop {:.0f} Pa is not positive", flow.pressure_drop));
    }
    flow.required_area = requiredFlowArea(flow.mass_flow, flow.discharge_coefficient, flow.density,
                                          flow.pressure_drop);
    return flow;
}

InjectorDesign sizeShowerhead(const InjectorFlowConditions& flow, const ShowerheadParams& params) {
    const double area = flow.required_area;
    InjectorDesign design;
    design.family = InjectorFamily::SHOWERHEAD;

    int count = 0;
    double diameter = 0.0;

    if (params.hole_count > 0) {
        count = params.hole_count;
        diameter = std::sqrt(4.0 * area / (constants::kPi * count));
        if (diameter < params.min_hole_diameter || diameter > params.max_hole_diameter) {
            design.warnings.push_back(fmt::format(
                "hole diameter {:.3f} mm for {} holes is outside [{:.3f}, {:.3f}] mm",
                1e3 * diameter, count, 1e3 * params.min_hole_diameter, 1e3 * params.max_hole_diameter));
        }
    } else {
        double best_score = std::numeric_limits<double>::infinity();
        for (int n = 1; n <= kMaxHoleCount; ++n) {
            const double d = std::clamp(std::sqrt(4.0 * area / (constants::kPi * n)),
                                        params.min_hole_diameter, params.max_hole_diameter);
            const double delivered = n * utils::areaFromDiameter(d);
            // Relative slack absorbs rounding of the unclamped diameter
            if (delivered < area * (1.0 - 1e-9) || delivered > kAreaOversizeLimit * area) continue;

            const double score = lengthToDiameterPenalty(params.plate_thickness / d);
            if (score < best_score) {
                best_score = score;
                count = n;
                diameter = d;
            }
        }
        if (count == 0) {
            throw InfeasibleGeometryError(fmt::format(
                "no showerhead with 1-{} holes of {:.3f}-{:.3f} mm delivers {:.4g} mm² within 10%",
                kMaxHoleCount, 1e3 * params.min_hole_diameter, 1e3 * params.max_hole_diameter, 1e6 * area));
        }
    }

    ShowerheadGeometry geometry;
    geometry.hole_count = count;
    geometry.hole_diameter = diameter;
    geometry.plate_thickness = params.plate_thickness;
    geometry.length_to_diameter = params.plate_thickness / diameter;
    geometry.hole_pitch = kNominalPitchRatio * diameter;

    // Hydraulics of the delivered area
    design.flow_area = count * utils::areaFromDiameter(diameter);
    design.discharge_coefficient = flow.discharge_coefficient;
    design.exit_velocity = flow.mass_flow / (flow.density * design.flow_area);
    const double ideal_velocity = design.exit_velocity / flow.discharge_coefficient;
    design.pressure_drop = 0.5 * flow.density * ideal_velocity * ideal_velocity;
    design.reynolds_number = flow.density * design.exit_velocity * diameter / flow.viscosity;
    design.footprint_diameter = showerheadFootprint(count, geometry.hole_pitch);
    design.geometry = geometry;
    return design;
}

InjectorDesign sizePintle(const InjectorFlowConditions& flow, const PintleParams& params) {
    InjectorDesign design;
    design.family = InjectorFamily::PINTLE;

    PintleGeometry geometry;
    geometry.outer_diameter = params.outer_diameter;
    geometry.pintle_diameter = params.pintle_diameter;
    geometry.gap = pintleGap(params.pintle_diameter, flow.required_area);

    if (geometry.pintle_diameter + 2.0 * geometry.gap > geometry.outer_diameter) {
        throw InfeasibleGeometryError(fmt::format(
            "pintle annulus {:.2f} mm does not fit the {:.2f} mm injector body",
            1e3 * (geometry.pintle_diameter + 2.0 * geometry.gap), 1e3 * geometry.outer_diameter));
    }
    if (geometry.gap < kMinPintleGap || geometry.gap > kMaxPintleGap) {
        design.warnings.push_back(fmt::format("pintle gap {:.3f} mm is outside [0.3, 3] mm", 1e3 * geometry.gap));
    }

    design.flow_area = flow.required_area;
    design.discharge_coefficient = flow.discharge_coefficient;
    design.pressure_drop = flow.pressure_drop;
    design.exit_velocity = flow.mass_flow / (flow.density * design.flow_area);
    design.reynolds_number = flow.density * design.exit_velocity * 2.0 * geometry.gap / flow.viscosity;
    design.footprint_diameter = geometry.outer_diameter;
    design.geometry = geometry;
    return design;
}

InjectorDesign sizeSwirl(const InjectorFlowConditions& flow, const SwirlParams& params) {
    InjectorDesign design;
    design.family = InjectorFamily::SWIRL;

    const double orifice_area = flow.required_area;
    const double slot_area = orifice_area / std::tan(params.spray_half_angle);

    SwirlGeometry geometry;
    geometry.slot_count = params.slot_count;
    geometry.spray_half_angle = params.spray_half_angle;
    geometry.orifice_diameter = utils::diameterFromArea(orifice_area);
    geometry.slot_height = std::sqrt(slot_area / params.slot_count / 2.0);
    geometry.slot_width = 2.0 * geometry.slot_height;
    geometry.swirl_chamber_diameter = kNominalSwirlRatio * geometry.orifice_diameter;

    const double axial_velocity = flow.mass_flow / (flow.density * orifice_area);
    const double slot_velocity = flow.mass_flow / (flow.density * slot_area);
    const double slot_hydraulic = 2.0 * geometry.slot_width * geometry.slot_height /
                                  (geometry.slot_width + geometry.slot_height);

    design.flow_area = orifice_area;
    design.discharge_coefficient = flow.discharge_coefficient;
    design.pressure_drop = flow.pressure_drop;
    design.exit_velocity = axial_velocity / std::cos(params.spray_half_angle);
    design.reynolds_number = flow.density * slot_velocity * slot_hydraulic / flow.viscosity;
    design.footprint_diameter = geometry.swirl_chamber_diameter;
    design.geometry = geometry;
    return design;
}

void applyFootprintClamp(InjectorDesign& design, double chamber_diameter) {
    const double limit = kFootprintFraction * chamber_diameter;
    if (design.footprint_diameter <= limit) return;

    if (auto* shower = std::get_if<ShowerheadGeometry>(&design.geometry)) {
        const double pitch = limit / std::sqrt(4.0 * shower->hole_count / constants::kPi);
        if (pitch < kMinPitchRatio * shower->hole_diameter) {
            throw InfeasibleGeometryError(fmt::format(
                "{} holes at 1.5 d pitch need {:.1f} mm, chamber allows {:.1f} mm",
                shower->hole_count,
                1e3 * showerheadFootprint(shower->hole_count, kMinPitchRatio * shower->hole_diameter),
                1e3 * limit));
        }
        shower->hole_pitch = pitch;
        design.footprint_diameter = showerheadFootprint(shower->hole_count, pitch);
        design.warnings.push_back(fmt::format(
            "design assist: hole pitch reduced to {:.2f} d to fit the chamber", pitch / shower->hole_diameter));
    } else if (auto* pintle = std::get_if<PintleGeometry>(&design.geometry)) {
        const double scale = limit / pintle->outer_diameter;
        const double outer = pintle->outer_diameter * scale;
        const double shaft = pintle->pintle_diameter * scale;
        const double gap = pintleGap(shaft, design.flow_area);
        if (shaft + 2.0 * gap > outer) {
            throw InfeasibleGeometryError(fmt::format(
                "pintle annulus does not fit a {:.1f} mm body inside the chamber", 1e3 * outer));
        }
        pintle->outer_diameter = outer;
        pintle->pintle_diameter = shaft;
        pintle->gap = gap;
        design.footprint_diameter = outer;
        design.warnings.push_back(fmt::format(
            "design assist: pintle scaled to {:.0f}% to fit the chamber", 100.0 * scale));
    } else if (auto* swirl = std::get_if<SwirlGeometry>(&design.geometry)) {
        const double ratio = limit / swirl->orifice_diameter;
        if (ratio < kMinSwirlRatio) {
            throw InfeasibleGeometryError(fmt::format(
                "swirl chamber needs {:.1f} mm, chamber allows {:.1f} mm",
                1e3 * kMinSwirlRatio * swirl->orifice_diameter, 1e3 * limit));
        }
        swirl->swirl_chamber_diameter = ratio * swirl->orifice_diameter;
        design.footprint_diameter = swirl->swirl_chamber_diameter;
        design.warnings.push_back(fmt::format(
            "design assist: swirl chamber ratio reduced to {:.2f} to fit the chamber", ratio));
    }
}

std::vector<std::string> advisoryWarnings(const InjectorDesign& design, const MotorPerformance& performance) {
    std::vector<std::string> warnings;
    const double dp = design.pressure_drop;
    const double pc = performance.chamber_pressure;
    const double tank = performance.tank_pressure;

    if (dp < 0.2 * pc) {
        warnings.push_back(fmt::format(
            "pressure drop {:.1f} bar is below 20% of chamber pressure; feed may couple to chamber oscillations",
            dp / constants::kPascalPerBar));
    }
    if (dp > 0.5 * tank) {
        warnings.push_back(fmt::format(
            "pressure drop {:.1f} bar exceeds half the tank pressure; cavitation risk", dp / constants::kPascalPerBar));
    }
    if (design.exit_velocity < 20.0 || design.exit_velocity > 50.0) {
        warnings.push_back(fmt::format("injection velocity {:.1f} m/s is outside [20, 50] m/s", design.exit_velocity));
    }
    if (design.reynolds_number < 4000.0) {
        warnings.push_back(fmt::format("Reynolds number {:.0f} is below the turbulent limit", design.reynolds_number));
    }
    if (const auto* shower = std::get_if<ShowerheadGeometry>(&design.geometry)) {
        if (shower->length_to_diameter < kMinLengthToDiameter || shower->length_to_diameter > kMaxLengthToDiameter) {
            warnings.push_back(fmt::format("hole L/D {:.2f} is outside [3, 5]", shower->length_to_diameter));
        }
    }
    if (dp > tank - pc) {
        warnings.push_back(fmt::format(
            "pressure drop {:.1f} bar exceeds the available tank-to-chamber drop {:.1f} bar",
            dp / constants::kPascalPerBar, (tank - pc) / constants::kPascalPerBar));
    }
    const Oxidizer& ox = performance.oxidizer;
    if (ox.phase == OxidizerPhase::LIQUID && pc < ox.vapor_pressure && dp < 0.2 * (ox.vapor_pressure - pc)) {
        warnings.push_back("liquid oxidizer enters below its vapor pressure; flash boiling likely");
    }
    return warnings;
}

InjectorDesign sizeInjector(const MotorPerformance& performance, const InjectorSpec& spec) {
    if (performance.kind != PropellantKind::HYBRID) {
        throw InfeasibleGeometryError("solid motors have no oxidizer injector");
    }
    if (!utils::isPositiveFinite(performance.oxidizer_mass_flow)) {
        throw InfeasibleGeometryError("operating point has no oxidizer flow to inject");
    }

    const InjectorFlowConditions flow = resolveFlowConditions(performance, spec);
    InjectorDesign design = std::visit(FamilySizer{flow}, spec.params);

    applyFootprintClamp(design, performance.chamber_diameter);

    auto advisories = advisoryWarnings(design, performance);
    design.warnings.insert(design.warnings.end(), advisories.begin(), advisories.end());
    return design;
}

} // namespace motor_design
