#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace motor_design {

/**
 * @brief Physical constants shared by the solver and the sizing code
 */
namespace constants {
    constexpr double kG0 = 9.80665;                   // Standard gravity [m/s²]
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kReferenceTemperature = 298.15;  // Burn-rate reference temperature [K]
    constexpr double kSeaLevelPressure = 101325.0;    // [Pa]
    constexpr double kPascalPerBar = 1e5;
    constexpr double kSolverTolerance = 1e-6;         // Relative residual
    constexpr int kSolverMaxIterations = 1000;
    constexpr double kLinerThickness = 3e-3;          // Solid motor thermal liner [m]
}

/**
 * @brief Motor configuration families
 */
enum class PropellantKind {
    HYBRID,
    SOLID
};

enum class NozzleType {
    CONICAL,
    BELL,
    PARABOLIC
};

enum class OxidizerPhase {
    LIQUID,
    GAS
};

/**
 * @brief Combustion chamber model
 *
 * INFINITE_AREA treats the chamber as a stagnation reservoir, FINITE_AREA
 * sizes the chamber cross-section from a contraction ratio or a mass flux.
 */
enum class CombustionMode {
    INFINITE_AREA,
    FINITE_AREA
};

enum class InjectorFamily {
    SHOWERHEAD,
    PINTLE,
    SWIRL
};

/**
 * @brief Oxidizer feed properties
 */
struct Oxidizer {
    OxidizerPhase phase;    // Liquid or gaseous injection
    double density;         // [kg/m³]
    double viscosity;       // Dynamic viscosity [Pa⋅s]
    double vapor_pressure;  // Saturation pressure at storage temperature [Pa]

    // Default constructor (liquid N2O at 20 °C)
    Oxidizer() : phase(OxidizerPhase::LIQUID), density(1220.0), viscosity(2e-4), vapor_pressure(51e5) {}
};

/**
 * @brief Showerhead injector parameters
 */
struct ShowerheadParams {
    double target_velocity;     // Desired orifice exit velocity [m/s]
    int hole_count;             // 0 = automatic search
    double min_hole_diameter;   // [m]
    double max_hole_diameter;   // [m]
    double plate_thickness;     // [m]

    ShowerheadParams() : target_velocity(30.0), hole_count(0), min_hole_diameter(0.3e-3),
                         max_hole_diameter(2.0e-3), plate_thickness(3e-3) {}
};

/**
 * @brief Pintle injector parameters
 */
struct PintleParams {
    double outer_diameter;      // Injector body diameter [m]
    double pintle_diameter;     // Pintle shaft diameter [m]

    PintleParams() : outer_diameter(50e-3), pintle_diameter(25e-3) {}
};

/**
 * @brief Swirl injector parameters
 */
struct SwirlParams {
    int slot_count;             // Tangential inlet slots
    double spray_half_angle;    // [rad]

    SwirlParams() : slot_count(6), spray_half_angle(constants::kPi / 4.0) {}
};

using InjectorGeometryParams = std::variant<ShowerheadParams, PintleParams, SwirlParams>;

/**
 * @brief Injector request
 *
 * The family is the active alternative of @c params and is dispatched once
 * by sizeInjector().
 */
struct InjectorSpec {
    std::optional<double> discharge_coefficient;    // Default depends on family
    std::optional<double> pressure_drop;            // [Pa]
    InjectorGeometryParams params;

    InjectorSpec() : params(ShowerheadParams()) {}
    explicit InjectorSpec(const InjectorGeometryParams& p) : params(p) {}

    InjectorFamily family() const {
        return static_cast<InjectorFamily>(params.index());
    }
};

/**
 * @brief BATES solid grain (cylindrical segments with burning core and ends)
 */
struct SolidGrain {
    double outer_diameter;      // [m]
    double core_diameter;       // [m]
    double segment_length;      // [m]
    int segment_count;

    SolidGrain() : outer_diameter(0.0), core_diameter(0.0), segment_length(0.0), segment_count(1) {}
    SolidGrain(double outer, double core, double length, int count)
        : outer_diameter(outer), core_diameter(core), segment_length(length), segment_count(count) {}

    // Remaining web before the casing or an end face is reached
    double web() const {
        return std::min(0.5 * (outer_diameter - core_diameter), 0.5 * segment_length);
    }
};

/**
 * @brief Frozen as-built hardware
 *
 * When a configuration carries a geometry the solver evaluates that
 * hardware instead of sizing new hardware from the design targets.
 */
struct MotorGeometry {
    double throat_area;                 // [m²]
    double expansion_ratio;             // Resolved Ae/At
    double chamber_diameter;            // [m]
    double chamber_length;              // [m]

    // Hybrid
    double injector_effective_area;     // Cd⋅A of the oxidizer feed [m²]
    double port_diameter;               // [m]
    double grain_length;                // [m]
    double oxidizer_load;               // Oxidizer mass for the burn [kg]

    // Solid
    SolidGrain grain;

    MotorGeometry() : throat_area(0.0), expansion_ratio(0.0), chamber_diameter(0.0), chamber_length(0.0),
                      injector_effective_area(0.0), port_diameter(0.0), grain_length(0.0),
                      oxidizer_load(0.0), grain() {}
};

/**
 * @brief Validated, fully defaulted motor configuration
 *
 * Created by validate() and never mutated afterwards; regression stepping
 * and Monte Carlo sampling work on copies.
 */
struct MotorConfiguration {
    PropellantKind kind;
    std::string propellant;             // Fuel (hybrid) or propellant (solid) name

    // Design targets
    double thrust;                      // [N]
    double burn_time;                   // [s]
    double of_ratio;                    // Oxidizer/fuel mass ratio (hybrid)
    double chamber_pressure;            // [Pa]
    double atmospheric_pressure;        // [Pa]

    // Combustion gas
    double chamber_temperature;         // [K]
    double gamma;                       // Ratio of specific heats
    double gas_constant;                // [J/(kg⋅K)]
    double characteristic_length;       // L* [m]

    // Nozzle
    double expansion_ratio;             // 0 = match exit pressure to ambient
    NozzleType nozzle_type;
    double nozzle_efficiency;

    // Propellant
    double burn_rate_coefficient;       // a, SI (hybrid: G in kg/(m²⋅s), solid: Pc in Pa) [m/s]
    double burn_rate_exponent;          // n
    double propellant_density;          // [kg/m³]
    double initial_temperature;         // [K]
    double temperature_coefficient;     // Linear burn-rate sensitivity [1/K]

    // Oxidizer feed (hybrid)
    Oxidizer oxidizer;
    double tank_pressure;               // [Pa]
    double initial_oxidizer_flux;       // Port sizing flux [kg/(m²⋅s)]

    // Chamber
    CombustionMode combustion_mode;
    std::optional<double> contraction_ratio;    // Ac/At (finite area)
    std::optional<double> chamber_mass_flux;    // [kg/(m²⋅s)] (finite area)
    std::optional<double> chamber_diameter;     // [m]

    // Solid grain, sized automatically when unset
    std::optional<SolidGrain> grain;

    double burnthrough_margin;          // Port/chamber diameter structural limit

    InjectorSpec injector;

    // As-built hardware; unset means design mode
    std::optional<MotorGeometry> geometry;

    MotorConfiguration()
        : kind(PropellantKind::HYBRID), propellant("htpb"),
          thrust(1000.0), burn_time(10.0), of_ratio(6.5), chamber_pressure(20e5),
          atmospheric_pressure(constants::kSeaLevelPressure),
          chamber_temperature(3200.0), gamma(1.25), gas_constant(415.0), characteristic_length(1.0),
          expansion_ratio(0.0), nozzle_type(NozzleType::CONICAL), nozzle_efficiency(0.955),
          burn_rate_coefficient(3e-4), burn_rate_exponent(0.5), propellant_density(920.0),
          initial_temperature(constants::kReferenceTemperature), temperature_coefficient(0.002),
          oxidizer(), tank_pressure(30e5), initial_oxidizer_flux(350.0),
          combustion_mode(CombustionMode::INFINITE_AREA), burnthrough_margin(0.8), injector() {}
};

/**
 * @brief Raw user input; unset fields receive documented defaults
 */
struct RawMotorConfiguration {
    std::optional<PropellantKind> kind;
    std::optional<std::string> propellant;

    std::optional<double> thrust;
    std::optional<double> burn_time;
    std::optional<double> total_impulse;        // [N⋅s], derives thrust or burn time
    std::optional<double> of_ratio;
    std::optional<double> chamber_pressure;
    std::optional<double> atmospheric_pressure;
    std::optional<double> altitude;             // [m], ISA ambient pressure

    std::optional<double> chamber_temperature;
    std::optional<double> gamma;
    std::optional<double> gas_constant;
    std::optional<double> characteristic_length;

    std::optional<double> expansion_ratio;
    std::optional<NozzleType> nozzle_type;
    std::optional<double> nozzle_efficiency;

    std::optional<double> burn_rate_coefficient;
    std::optional<double> burn_rate_exponent;
    std::optional<double> propellant_density;
    std::optional<double> initial_temperature;
    std::optional<double> temperature_coefficient;

    std::optional<OxidizerPhase> oxidizer_phase;
    std::optional<double> oxidizer_density;
    std::optional<double> oxidizer_viscosity;
    std::optional<double> oxidizer_vapor_pressure;
    std::optional<double> tank_pressure;
    std::optional<double> initial_oxidizer_flux;

    std::optional<CombustionMode> combustion_mode;
    std::optional<double> contraction_ratio;
    std::optional<double> chamber_mass_flux;
    std::optional<double> chamber_diameter;

    std::optional<SolidGrain> grain;
    std::optional<double> burnthrough_margin;

    std::optional<InjectorSpec> injector;
    std::optional<MotorGeometry> geometry;
};

/**
 * @brief Scratch state of one chamber-pressure convergence run
 */
struct SolverState {
    double pressure;        // Current estimate [Pa]
    double mass_flow;       // Mass generation at the current estimate [kg/s]
    int iterations;
    bool converged;
    double residual;        // |P_new - P| / P
    double relaxation;      // Under-relaxation factor

    SolverState() : pressure(0.0), mass_flow(0.0), iterations(0), converged(false),
                    residual(0.0), relaxation(0.5) {}
    explicit SolverState(double initial_pressure)
        : pressure(initial_pressure), mass_flow(0.0), iterations(0), converged(false),
          residual(0.0), relaxation(0.5) {}
};

/**
 * @brief Steady-state operating point
 */
struct MotorPerformance {
    PropellantKind kind;

    double chamber_pressure;            // [Pa]
    double mass_flow_rate;              // Total [kg/s]
    double oxidizer_mass_flow;          // [kg/s]
    double fuel_mass_flow;              // [kg/s]
    double of_ratio;

    double thrust;                      // [N]
    double specific_impulse;            // [s]
    double characteristic_velocity;     // c* [m/s]
    double thrust_coefficient;          // CF
    double exit_velocity;               // [m/s]
    double exit_pressure;               // [Pa]
    double burn_time;                   // [s]
    double total_impulse;               // [N⋅s]

    double throat_area;                 // [m²]
    double throat_diameter;             // [m]
    double exit_area;                   // [m²]
    double exit_diameter;               // [m]
    double expansion_ratio;
    double nozzle_divergent_length;     // [m]

    double chamber_diameter;            // [m]
    double chamber_length;              // [m]
    double chamber_volume;              // [m³]
    double chamber_mach;                // Finite-area mode only
    double stagnation_pressure_ratio;   // Nozzle/head-end stagnation pressure

    double port_diameter_initial;       // [m]
    double port_diameter_final;         // [m]
    double regression_rate;             // [m/s]
    double oxidizer_mass_flux;          // [kg/(m²⋅s)]
    double burning_area;                // [m²]

    double oxidizer_mass;               // [kg]
    double fuel_mass;                   // [kg]
    double propellant_mass;             // [kg]

    int solver_iterations;
    double solver_residual;

    // Feed conditions the point was solved at
    double tank_pressure;               // [Pa]
    Oxidizer oxidizer;

    MotorGeometry geometry;

    MotorPerformance()
        : kind(PropellantKind::HYBRID), chamber_pressure(0.0), mass_flow_rate(0.0), oxidizer_mass_flow(0.0),
          fuel_mass_flow(0.0), of_ratio(0.0), thrust(0.0), specific_impulse(0.0),
          characteristic_velocity(0.0), thrust_coefficient(0.0), exit_velocity(0.0), exit_pressure(0.0),
          burn_time(0.0), total_impulse(0.0), throat_area(0.0), throat_diameter(0.0), exit_area(0.0),
          exit_diameter(0.0), expansion_ratio(0.0), nozzle_divergent_length(0.0), chamber_diameter(0.0),
          chamber_length(0.0), chamber_volume(0.0), chamber_mach(0.0), stagnation_pressure_ratio(1.0),
          port_diameter_initial(0.0), port_diameter_final(0.0), regression_rate(0.0),
          oxidizer_mass_flux(0.0), burning_area(0.0), oxidizer_mass(0.0), fuel_mass(0.0),
          propellant_mass(0.0), solver_iterations(0), solver_residual(0.0), tank_pressure(0.0),
          oxidizer(), geometry() {}
};

/**
 * @brief Family-specific injector geometry
 */
struct ShowerheadGeometry {
    int hole_count;
    double hole_diameter;       // [m]
    double plate_thickness;     // [m]
    double length_to_diameter;  // L/D
    double hole_pitch;          // Center-to-center spacing [m]
};

struct PintleGeometry {
    double outer_diameter;      // [m]
    double pintle_diameter;     // [m]
    double gap;                 // Annular gap [m]
};

struct SwirlGeometry {
    int slot_count;
    double slot_width;          // [m]
    double slot_height;         // [m]
    double spray_half_angle;    // [rad]
    double orifice_diameter;    // [m]
    double swirl_chamber_diameter;  // [m]
};

using InjectorGeometry = std::variant<ShowerheadGeometry, PintleGeometry, SwirlGeometry>;

/**
 * @brief Sized injector with hydraulic diagnostics
 */
struct InjectorDesign {
    InjectorFamily family;
    double exit_velocity;           // [m/s]
    double reynolds_number;
    double pressure_drop;           // [Pa]
    double discharge_coefficient;
    double flow_area;               // Total geometric orifice area [m²]
    double footprint_diameter;      // [m]
    std::vector<std::string> warnings;
    InjectorGeometry geometry;

    InjectorDesign() : family(InjectorFamily::SHOWERHEAD), exit_velocity(0.0), reynolds_number(0.0),
                       pressure_drop(0.0), discharge_coefficient(0.0), flow_area(0.0),
                       footprint_diameter(0.0), warnings(), geometry(ShowerheadGeometry{}) {}
};

/**
 * @brief One regression time step
 */
struct TimelineSample {
    double time;                // [s]
    double port_diameter;       // Hybrid port or solid core [m]
    double of_ratio;
    double chamber_pressure;    // [Pa]
    double thrust;              // [N]
    double mass_flow_rate;      // [kg/s]
    bool burnthrough_risk;
    MotorPerformance performance;

    TimelineSample() : time(0.0), port_diameter(0.0), of_ratio(0.0), chamber_pressure(0.0),
                       thrust(0.0), mass_flow_rate(0.0), burnthrough_risk(false), performance() {}
};

/**
 * @brief Burn history produced by simulateRegression()
 */
struct RegressionTimeline {
    std::vector<TimelineSample> samples;
    std::optional<size_t> burnthrough_index;    // First frozen sample
    double total_impulse;                       // Trapezoidal [N⋅s]
    double average_thrust;                      // [N]
    std::vector<std::string> warnings;

    RegressionTimeline() : samples(), burnthrough_index(), total_impulse(0.0), average_thrust(0.0), warnings() {}

    bool hasBurnthroughRisk() const { return burnthrough_index.has_value(); }

    // Convert to Eigen matrix (rows: samples, columns: t, D_port, O/F, Pc, F, mdot)
    Eigen::MatrixXd toMatrix() const {
        Eigen::MatrixXd m(static_cast<Eigen::Index>(samples.size()), 6);
        for (size_t i = 0; i < samples.size(); ++i) {
            const auto& s = samples[i];
            Eigen::Index row = static_cast<Eigen::Index>(i);
            m(row, 0) = s.time;
            m(row, 1) = s.port_diameter;
            m(row, 2) = s.of_ratio;
            m(row, 3) = s.chamber_pressure;
            m(row, 4) = s.thrust;
            m(row, 5) = s.mass_flow_rate;
        }
        return m;
    }
};

/**
 * @brief Relative 1-sigma perturbation per parameter name
 */
using UncertaintySpec = std::map<std::string, double>;

/**
 * @brief Why a Monte Carlo sample did not produce an outcome
 */
enum class FailureReason {
    VALIDATION,
    CONVERGENCE,
    INFEASIBLE_DESIGN,
    INFEASIBLE_GEOMETRY
};

/**
 * @brief One evaluated Monte Carlo draw
 */
struct MonteCarloSample {
    size_t index;
    std::map<std::string, double> factors;      // Applied multiplicative factors
    std::map<std::string, double> outputs;      // Empty on failure
    std::optional<FailureReason> failure;

    MonteCarloSample() : index(0), factors(), outputs(), failure() {}
};

/**
 * @brief Aggregate statistics of one tracked output
 */
struct OutputStatistics {
    size_t count;
    double mean;
    double std_dev;
    double coefficient_of_variation;
    double min;
    double max;
    double p05;
    double p95;

    OutputStatistics() : count(0), mean(0.0), std_dev(0.0), coefficient_of_variation(0.0),
                         min(0.0), max(0.0), p05(0.0), p95(0.0) {}
};

/**
 * @brief Monte Carlo run result
 */
struct StatisticalSummary {
    size_t requested;
    size_t completed;
    size_t succeeded;
    size_t failed;
    std::map<FailureReason, size_t> failures;
    double success_rate;        // succeeded / completed
    bool stopped_early;
    std::map<std::string, OutputStatistics> outputs;

    StatisticalSummary() : requested(0), completed(0), succeeded(0), failed(0), failures(),
                           success_rate(0.0), stopped_early(false), outputs() {}
};

/**
 * @brief Enum name helpers
 */
namespace utils {

    inline std::string toString(PropellantKind kind) {
        return kind == PropellantKind::HYBRID ? "hybrid" : "solid";
    }

    inline std::string toString(NozzleType type) {
        switch (type) {
            case NozzleType::BELL: return "bell";
            case NozzleType::PARABOLIC: return "parabolic";
            default: return "conical";
        }
    }

    inline std::string toString(InjectorFamily family) {
        switch (family) {
            case InjectorFamily::PINTLE: return "pintle";
            case InjectorFamily::SWIRL: return "swirl";
            default: return "showerhead";
        }
    }

    inline std::string toString(FailureReason reason) {
        switch (reason) {
            case FailureReason::VALIDATION: return "validation";
            case FailureReason::CONVERGENCE: return "convergence";
            case FailureReason::INFEASIBLE_DESIGN: return "infeasible_design";
            default: return "infeasible_geometry";
        }
    }

    /**
     * @brief Circle diameter from area
     */
    inline double diameterFromArea(double area) {
        return 2.0 * std::sqrt(area / constants::kPi);
    }

    /**
     * @brief Circle area from diameter
     */
    inline double areaFromDiameter(double diameter) {
        return 0.25 * constants::kPi * diameter * diameter;
    }

    /**
     * @brief Check that a value is finite and strictly positive
     */
    inline bool isPositiveFinite(double value) {
        return std::isfinite(value) && value > 0.0;
    }
}

} // namespace motor_design
