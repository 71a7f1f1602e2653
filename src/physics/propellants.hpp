#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace motor_design {

/**
 * @brief Hybrid fuel properties
 *
 * Regression law r = a·G_ox^n with r in m/s and G_ox in kg/(m²⋅s).
 */
struct HybridFuel {
    std::string name;
    double density;             // [kg/m³]
    double regression_a;        // [m/s per (kg/(m²⋅s))^n]
    double regression_n;
    double chamber_temperature; // [K]
    double gas_constant;        // [J/(kg⋅K)]
};

/**
 * @brief Solid propellant properties
 *
 * Burn-rate coefficients are tabulated for pressure in bar and converted
 * to pascals once, by burnRateCoefficientSI().
 */
struct SolidPropellant {
    std::string name;
    double density;                 // [kg/m³]
    double characteristic_velocity; // [m/s]
    double gamma;
    double chamber_temperature;     // [K]
    double nozzle_efficiency;
    double burn_rate_a_bar;         // [m/s per bar^n]
    double burn_rate_n;
    double temperature_coefficient; // [1/K]

    /**
     * @brief Gas constant consistent with the tabulated c*, γ and Tc
     * @return R [J/(kg⋅K)]
     */
    double gasConstant() const;

    /**
     * @brief Burn-rate coefficient for pressure in Pa
     * @return a [m/s per Pa^n]
     */
    double burnRateCoefficientSI() const;
};

/**
 * @brief Look up a hybrid fuel (case-insensitive)
 * @param name Fuel name, e.g. "htpb"
 * @return Properties, or std::nullopt for unknown names
 */
std::optional<HybridFuel> findHybridFuel(const std::string& name);

/**
 * @brief Look up a solid propellant (case-insensitive)
 * @param name Propellant name, e.g. "apcp"
 * @return Properties, or std::nullopt for unknown names
 */
std::optional<SolidPropellant> findSolidPropellant(const std::string& name);

std::vector<std::string> hybridFuelNames();
std::vector<std::string> solidPropellantNames();

/**
 * @brief Convert a burn-rate coefficient from bar-based to Pa-based units
 * @param a_bar Coefficient for pressure in bar
 * @param n Pressure exponent
 * @return Coefficient for pressure in Pa
 */
double convertBurnRateCoefficient(double a_bar, double n);

} // namespace motor_design
