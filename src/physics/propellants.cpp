#include "propellants.hpp"
#include "nozzle.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace motor_design {

namespace {

// Saint-Robert law defaults for the tabulated solid propellants [m/s per bar^n]
constexpr double kSolidBurnRateA = 0.005;
constexpr double kSolidBurnRateN = 0.35;

const std::vector<HybridFuel>& hybridFuelTable() {
    static const std::vector<HybridFuel> table = {
        // name, rho, a, n, Tc, R
        {"htpb",     920.0,  0.00030, 0.50, 3200.0, 415.0},
        {"pe",       950.0,  0.00025, 0.62, 3100.0, 420.0},
        {"pmma",     1180.0, 0.00015, 0.55, 2900.0, 380.0},
        {"paraffin", 900.0,  0.00050, 0.62, 3000.0, 450.0},
        {"abs",      1040.0, 0.00018, 0.58, 2800.0, 390.0},
        {"pla",      1250.0, 0.00012, 0.52, 2700.0, 370.0},
    };
    return table;
}

const std::vector<SolidPropellant>& solidPropellantTable() {
    static const std::vector<SolidPropellant> table = {
        // name, rho, c*, gamma, Tc, eta_nozzle, a_bar, n, sigma_p
        {"apcp",         1810.0, 1598.2, 1.1986, 3241.7, 0.985, kSolidBurnRateA, kSolidBurnRateN, 0.0042},
        {"black_powder", 1650.0,  945.3, 1.2510, 2216.4, 0.975, kSolidBurnRateA, kSolidBurnRateN, 0.0038},
        {"sugar",        1689.0, 1087.6, 1.2441, 2394.2, 0.978, kSolidBurnRateA, kSolidBurnRateN, 0.0041},
        {"knsu",         1841.0, 1523.4, 1.2134, 3104.8, 0.983, kSolidBurnRateA, kSolidBurnRateN, 0.0045},
        {"double_base",  1580.0, 1186.7, 1.2612, 2789.3, 0.981, kSolidBurnRateA, kSolidBurnRateN, 0.0036},
    };
    return table;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

double SolidPropellant::gasConstant() const {
    // c* = sqrt(R·Tc)/Γ  =>  R = (c*·Γ)²/Tc
    double product = characteristic_velocity * nozzle::gammaFunction(gamma);
    return product * product / chamber_temperature;
}

double SolidPropellant::burnRateCoefficientSI() const {
    return convertBurnRateCoefficient(burn_rate_a_bar, burn_rate_n);
}

double convertBurnRateCoefficient(double a_bar, double n) {
    return a_bar * std::pow(constants::kPascalPerBar, -n);
}

std::optional<HybridFuel> findHybridFuel(const std::string& name) {
    const std::string key = toLower(name);
    for (const auto& fuel : hybridFuelTable()) {
        if (fuel.name == key) return fuel;
    }
    return std::nullopt;
}

std::optional<SolidPropellant> findSolidPropellant(const std::string& name) {
    const std::string key = toLower(name);
    for (const auto& propellant : solidPropellantTable()) {
        if (propellant.name == key) return propellant;
    }
    return std::nullopt;
}

std::vector<std::string> hybridFuelNames() {
    std::vector<std::string> names;
    for (const auto& fuel : hybridFuelTable()) names.push_back(fuel.name);
    return names;
}

std::vector<std::string> solidPropellantNames() {
    std::vector<std::string> names;
    for (const auto& propellant : solidPropellantTable()) names.push_back(propellant.name);
    return names;
}

} // namespace motor_design
