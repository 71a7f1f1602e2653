#pragma once

#include "physics/types.hpp"

namespace motor_design {
namespace propulsion {

// BATES grain geometry: every segment burns on its core and both end faces.
class BatesGrain {
public:
    // Burning surface of all segments, m^2
    static double burning_area(const SolidGrain &grain);

    // Propellant volume of all segments, m^3
    static double propellant_volume(const SolidGrain &grain);

    // Total stacked length, m
    static double total_length(const SolidGrain &grain);

    // Grain after a surface recession of `depth` on every burning face.
    // The core grows by 2*depth and each segment shortens by 2*depth.
    static SolidGrain regress(const SolidGrain &grain, double depth);

    static bool burned_out(const SolidGrain &grain);
};

// Hybrid port growth at constant oxidizer flow, integrated with explicit
// Euler steps over the burn. Returns the final port diameter, m.
double hybrid_final_port(double initial_port, double oxidizer_mass_flow, double regression_a,
                         double regression_n, double temperature_factor, double burn_time, int steps = 100);

} // namespace propulsion
} // namespace motor_design
