#include "physics/propulsion/grain.hpp"

#include <algorithm>
#include <cmath>

namespace motor_design {
namespace propulsion {

double BatesGrain::burning_area(const SolidGrain &grain) {
    if (burned_out(grain)) return 0.0;
    const double core = constants::kPi * grain.core_diameter * grain.segment_length;
    const double ends = 0.5 * constants::kPi *
                        (grain.outer_diameter * grain.outer_diameter - grain.core_diameter * grain.core_diameter);
    return grain.segment_count * (core + ends);
}

double BatesGrain::propellant_volume(const SolidGrain &grain) {
    if (burned_out(grain)) return 0.0;
    const double annulus = utils::areaFromDiameter(grain.outer_diameter) - utils::areaFromDiameter(grain.core_diameter);
    return grain.segment_count * annulus * grain.segment_length;
}

double BatesGrain::total_length(const SolidGrain &grain) {
    return grain.segment_count * std::max(0.0, grain.segment_length);
}

SolidGrain BatesGrain::regress(const SolidGrain &grain, double depth) {
    SolidGrain next = grain;
    next.core_diameter = std::min(grain.outer_diameter, grain.core_diameter + 2.0 * depth);
    next.segment_length = std::max(0.0, grain.segment_length - 2.0 * depth);
    return next;
}

bool BatesGrain::burned_out(const SolidGrain &grain) {
    return grain.core_diameter >= grain.outer_diameter || grain.segment_length <= 0.0;
}

double hybrid_final_port(double initial_port, double oxidizer_mass_flow, double regression_a,
                         double regression_n, double temperature_factor, double burn_time, int steps) {
    const double dt = burn_time / steps;
    double port = initial_port;
    for (int i = 0; i < steps; ++i) {
        const double flux = oxidizer_mass_flow / utils::areaFromDiameter(port);
        port += 2.0 * regression_a * std::pow(flux, regression_n) * temperature_factor * dt;
    }
    return port;
}

} // namespace propulsion
} // namespace motor_design
