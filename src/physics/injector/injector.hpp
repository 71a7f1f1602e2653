#pragma once

#include "physics/types.hpp"
#include "physics/errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace motor_design {

/**
 * @brief Hydraulic inputs shared by every injector family
 */
struct InjectorFlowConditions {
    double mass_flow;           // Oxidizer mass flow [kg/s]
    double density;             // [kg/m³]
    double viscosity;           // [Pa⋅s]
    double discharge_coefficient;
    double pressure_drop;       // [Pa]
    double required_area;       // Geometric area delivering mass_flow at pressure_drop [m²]
};

/**
 * @brief Size the oxidizer injector of a solved hybrid motor
 *
 * Dispatches once on the family held in @p spec, then applies the footprint
 * clamp against the chamber and the advisory warning rules.
 *
 * @param performance Solved operating point (hybrid)
 * @param spec Injector request
 * @return Sized injector with diagnostics and warnings
 * @throws InfeasibleGeometryError for solid motors, which have no oxidizer injector
 * @throws InfeasibleGeometryError when no geometry satisfies the bounds
 */
InjectorDesign sizeInjector(const MotorPerformance& performance, const InjectorSpec& spec);

/**
 * @brief Family default discharge coefficient
 * @param family Injector family
 * @return Cd (showerhead 0.70, pintle 0.75, swirl 0.65)
 */
double defaultDischargeCoefficient(InjectorFamily family);

/**
 * @brief Orifice area from the incompressible orifice equation
 * @return A = ṁ / (Cd·sqrt(2·ρ·ΔP)) [m²]
 */
double requiredFlowArea(double mass_flow, double discharge_coefficient, double density, double pressure_drop);

/**
 * @brief Resolve the hydraulic conditions for a request
 *
 * Pressure drop is the supplied value, else the showerhead target-velocity
 * drop, else the tank-to-chamber drop.
 */
InjectorFlowConditions resolveFlowConditions(const MotorPerformance& performance, const InjectorSpec& spec);

InjectorDesign sizeShowerhead(const InjectorFlowConditions& flow, const ShowerheadParams& params);
InjectorDesign sizePintle(const InjectorFlowConditions& flow, const PintleParams& params);
InjectorDesign sizeSwirl(const InjectorFlowConditions& flow, const SwirlParams& params);

/**
 * @brief Shrink the injector footprint to fit 0.9 of the chamber diameter
 *
 * Showerhead pitch goes from 3·d down to 1.5·d, pintle diameters scale down
 * together, the swirl-chamber ratio goes from 3 down to 1.5. Every
 * adjustment is recorded as a design-assist warning.
 *
 * @param design Sized injector, modified in place
 * @param chamber_diameter Chamber inner diameter [m]
 * @throws InfeasibleGeometryError when the smallest footprint still does not fit
 */
void applyFootprintClamp(InjectorDesign& design, double chamber_diameter);

/**
 * @brief Advisory warnings on stiffness, cavitation, velocity, turbulence and flashing
 * @param design Sized injector
 * @param performance Operating point the injector feeds
 * @return Warnings in rule order
 */
std::vector<std::string> advisoryWarnings(const InjectorDesign& design, const MotorPerformance& performance);

} // namespace motor_design
