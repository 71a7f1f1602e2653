#include "physics/environment/isa_atmosphere.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace motor_design {
namespace environment {

static constexpr double kAirGasConstant = 287.05287;   // J/(kg*K)
static constexpr double kG0 = 9.80665;                  // m/s^2

const std::vector<IsaLayer> IsaAtmosphere::kLayers = {
    // base_alt [m], T_base [K], P_base [Pa], lapse [K/m]
    {     0.0, 288.15, 101325.0,   -0.0065},
    { 11000.0, 216.65,  22632.1,    0.0   },
    { 20000.0, 216.65,   5474.89,   0.001 },
    { 32000.0, 228.65,    868.019,  0.0028},
    { 47000.0, 270.65,    110.906,  0.0   },
    { 51000.0, 270.65,     66.9389, -0.0028},
    { 71000.0, 214.65,      3.9564, -0.002 }
};

bool IsaAtmosphere::inRange(double altitude_m) {
    return std::isfinite(altitude_m) && altitude_m >= kMinAltitude && altitude_m <= kMaxAltitude;
}

AmbientState IsaAtmosphere::computeProperties(double altitude_m) {
    if (!inRange(altitude_m)) {
        throw std::invalid_argument("ISA altitude out of range: " + std::to_string(altitude_m) + " m");
    }

    // Below sea level the tropospheric lapse rate is extrapolated
    size_t idx = 0;
    for (size_t i = 0; i + 1 < kLayers.size(); ++i) {
        if (altitude_m >= kLayers[i + 1].base_altitude) idx = i + 1; else break;
    }
    const IsaLayer &layer = kLayers[idx];

    const double dh = altitude_m - layer.base_altitude;
    double T;
    double P;
    if (std::abs(layer.lapse_rate) > 1e-12) {
        T = layer.base_temperature + layer.lapse_rate * dh;
        P = layer.base_pressure * std::pow(layer.base_temperature / T, kG0 / (kAirGasConstant * layer.lapse_rate));
    } else {
        T = layer.base_temperature;
        P = layer.base_pressure * std::exp(-kG0 * dh / (kAirGasConstant * T));
    }

    return {T, P, P / (kAirGasConstant * T)};
}

double IsaAtmosphere::pressureAt(double altitude_m) {
    return computeProperties(altitude_m).pressure;
}

} // namespace environment
} // namespace motor_design
