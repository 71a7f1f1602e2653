#pragma once

#include <vector>

namespace motor_design {
namespace environment {

struct AmbientState {
    double temperature;    // K
    double pressure;       // Pa
    double density;        // kg/m^3
};

struct IsaLayer {
    double base_altitude;     // m
    double base_temperature;  // K
    double base_pressure;     // Pa
    double lapse_rate;        // K/m
};

// 1976 standard atmosphere, used to turn a nozzle design altitude into the
// ambient back-pressure the exit plane expands against.
class IsaAtmosphere {
public:
    static constexpr double kMinAltitude = -500.0;   // m
    static constexpr double kMaxAltitude = 86000.0;  // m

    // Throws std::invalid_argument outside [kMinAltitude, kMaxAltitude].
    static AmbientState computeProperties(double altitude_m);

    // Ambient pressure [Pa] at altitude [m]
    static double pressureAt(double altitude_m);

    static bool inRange(double altitude_m);

private:
    static const std::vector<IsaLayer> kLayers;
};

} // namespace environment
} // namespace motor_design
