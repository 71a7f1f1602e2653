#pragma once

#include "types.hpp"

namespace motor_design {

/**
 * @brief Quasi-1D isentropic nozzle relations
 *
 * Pressures are in Pa. Functions that need a root find use the solver
 * tolerance and iteration cap and throw InfeasibleDesignError when the
 * requested state does not exist.
 */
namespace nozzle {

    /**
     * @brief Vandenkerckhove function Γ(γ)
     * @param gamma Ratio of specific heats
     * @return sqrt(γ)·(2/(γ+1))^((γ+1)/(2(γ-1)))
     */
    double gammaFunction(double gamma);

    /**
     * @brief Characteristic velocity
     * @param gamma Ratio of specific heats
     * @param gas_constant Specific gas constant [J/(kg⋅K)]
     * @param chamber_temperature Chamber temperature [K]
     * @return c* [m/s]
     */
    double characteristicVelocity(double gamma, double gas_constant, double chamber_temperature);

    /**
     * @brief Choked mass flow through the throat
     * @param chamber_pressure [Pa]
     * @param throat_area [m²]
     * @param characteristic_velocity [m/s]
     * @return Mass flow [kg/s], strictly increasing in chamber pressure
     */
    double throatMassFlow(double chamber_pressure, double throat_area, double characteristic_velocity);

    /**
     * @brief Static-to-stagnation pressure ratio at the sonic throat
     */
    double criticalPressureRatio(double gamma);

    /**
     * @brief Area ratio A/A* at Mach number M
     */
    double areaRatioFromMach(double mach, double gamma);

    /**
     * @brief Static-to-stagnation pressure ratio at Mach number M
     */
    double pressureRatioFromMach(double mach, double gamma);

    /**
     * @brief Supersonic Mach number for a given area ratio
     * @param area_ratio A/A* (>= 1)
     * @param gamma Ratio of specific heats
     * @return Mach number >= 1
     */
    double supersonicMach(double area_ratio, double gamma);

    /**
     * @brief Subsonic Mach number for a given area ratio
     * @param area_ratio A/A* (>= 1)
     * @param gamma Ratio of specific heats
     * @return Mach number <= 1
     */
    double subsonicMach(double area_ratio, double gamma);

    /**
     * @brief Exit-to-chamber pressure ratio for a given expansion ratio
     */
    double exitPressureRatio(double expansion_ratio, double gamma);

    /**
     * @brief Expansion ratio that expands exactly to ambient pressure
     *
     * Root find on ε whose residual evaluates exitPressureRatio(), itself a
     * Mach root find.
     *
     * @param chamber_pressure [Pa]
     * @param ambient_pressure [Pa]
     * @param gamma Ratio of specific heats
     * @return Optimum expansion ratio
     */
    double optimumExpansionRatio(double chamber_pressure, double ambient_pressure, double gamma);

    /**
     * @brief Ideal exit velocity from the energy balance
     * @param pressure_ratio Pe/Pc
     * @return Exit velocity [m/s]
     */
    double exitVelocity(double gamma, double gas_constant, double chamber_temperature, double pressure_ratio);

    /**
     * @brief Ideal thrust coefficient (momentum plus pressure term)
     * @param gamma Ratio of specific heats
     * @param exit_pressure_ratio Pe/Pc
     * @param ambient_pressure_ratio Pa/Pc
     * @param expansion_ratio Ae/At
     */
    double idealThrustCoefficient(double gamma, double exit_pressure_ratio,
                                  double ambient_pressure_ratio, double expansion_ratio);

    /**
     * @brief Default efficiency for a nozzle contour
     */
    double nozzleEfficiency(NozzleType type);

    /**
     * @brief Divergent section length
     *
     * Conical nozzles use a 15° half angle; bell and parabolic contours are
     * 80% and 90% of that cone.
     */
    double divergentLength(double throat_diameter, double exit_diameter, NozzleType type);

    /**
     * @brief Head-end to nozzle stagnation pressure ratio of a constant-area
     *        heated chamber (Rayleigh line) at chamber Mach number M
     */
    double rayleighStagnationRatio(double mach, double gamma);

} // namespace nozzle
} // namespace motor_design
