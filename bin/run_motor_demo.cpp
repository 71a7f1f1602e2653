#include <algorithm>
#include <iostream>
#include <iomanip>
#include <string>
#include <variant>
#include "../src/physics/types.hpp"
#include "../src/physics/validation.hpp"
#include "../src/physics/performance_solver.hpp"
#include "../src/physics/regression.hpp"
#include "../src/physics/injector/injector.hpp"
#include "../src/utils/config_loader.hpp"
#include "../src/utils/logging.hpp"

using namespace motor_design;

namespace {

void printWarnings(const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        std::cout << "  ! " << warning << std::endl;
    }
}

void printPerformance(const MotorPerformance& perf) {
    std::cout << "\n=== Steady-State Performance (" << utils::toString(perf.kind) << ") ===" << std::endl;
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Chamber pressure:      " << perf.chamber_pressure / 1e5 << " bar" << std::endl;
    std::cout << "Thrust:                " << perf.thrust << " N" << std::endl;
    std::cout << "Specific impulse:      " << perf.specific_impulse << " s" << std::endl;
    std::cout << "Thrust coefficient:    " << perf.thrust_coefficient << std::endl;
    std::cout << "c*:                    " << perf.characteristic_velocity << " m/s" << std::endl;
    std::cout << "Mass flow:             " << perf.mass_flow_rate << " kg/s" << std::endl;
    if (perf.kind == PropellantKind::HYBRID) {
        std::cout << "Oxidizer / fuel flow:  " << perf.oxidizer_mass_flow << " / " << perf.fuel_mass_flow
                  << " kg/s (O/F " << perf.of_ratio << ")" << std::endl;
    }
    std::cout << "Burn time:             " << perf.burn_time << " s" << std::endl;
    std::cout << "Total impulse:         " << perf.total_impulse << " N*s" << std::endl;
    std::cout << "Throat / exit diameter:" << perf.throat_diameter * 1e3 << " / " << perf.exit_diameter * 1e3
              << " mm (eps " << perf.expansion_ratio << ")" << std::endl;
    std::cout << "Chamber D x L:         " << perf.chamber_diameter * 1e3 << " x " << perf.chamber_length * 1e3
              << " mm" << std::endl;
    std::cout << "Port initial / final:  " << perf.port_diameter_initial * 1e3 << " / "
              << perf.port_diameter_final * 1e3 << " mm" << std::endl;
    if (perf.chamber_mach > 0.0) {
        std::cout << "Chamber Mach:          " << perf.chamber_mach
                  << " (stagnation ratio " << perf.stagnation_pressure_ratio << ")" << std::endl;
    }
    std::cout << "Solver:                " << perf.solver_iterations << " iterations, residual "
              << std::scientific << perf.solver_residual << std::fixed << std::endl;
}

void printInjector(const InjectorDesign& design) {
    std::cout << "\n=== Injector (" << utils::toString(design.family) << ") ===" << std::endl;
    std::cout << "Pressure drop:         " << design.pressure_drop / 1e5 << " bar" << std::endl;
    std::cout << "Exit velocity:         " << design.exit_velocity << " m/s" << std::endl;
    std::cout << "Reynolds number:       " << std::setprecision(0) << design.reynolds_number
              << std::setprecision(3) << std::endl;
    std::cout << "Flow area:             " << design.flow_area * 1e6 << " mm^2" << std::endl;
    if (const auto* shower = std::get_if<ShowerheadGeometry>(&design.geometry)) {
        std::cout << "Holes:                 " << shower->hole_count << " x " << shower->hole_diameter * 1e3
                  << " mm (L/D " << shower->length_to_diameter << ")" << std::endl;
    } else if (const auto* pintle = std::get_if<PintleGeometry>(&design.geometry)) {
        std::cout << "Pintle gap:            " << pintle->gap * 1e3 << " mm" << std::endl;
    } else if (const auto* swirl = std::get_if<SwirlGeometry>(&design.geometry)) {
        std::cout << "Slots:                 " << swirl->slot_count << " x " << swirl->slot_width * 1e3 << " x "
                  << swirl->slot_height * 1e3 << " mm, orifice " << swirl->orifice_diameter * 1e3 << " mm"
                  << std::endl;
    }
    std::cout << "Footprint:             " << design.footprint_diameter * 1e3 << " mm" << std::endl;
    printWarnings(design.warnings);
}

void printTimeline(const RegressionTimeline& timeline) {
    std::cout << "\n=== Burn History ===" << std::endl;
    std::cout << std::setw(8) << "t [s]" << std::setw(12) << "port [mm]" << std::setw(8) << "O/F"
              << std::setw(11) << "Pc [bar]" << std::setw(11) << "F [N]" << std::endl;
    const size_t stride = std::max<size_t>(1, timeline.samples.size() / 10);
    for (size_t i = 0; i < timeline.samples.size(); i += stride) {
        const auto& s = timeline.samples[i];
        std::cout << std::setw(8) << std::setprecision(2) << s.time
                  << std::setw(12) << s.port_diameter * 1e3
                  << std::setw(8) << s.of_ratio
                  << std::setw(11) << s.chamber_pressure / 1e5
                  << std::setw(11) << std::setprecision(1) << s.thrust
                  << (s.burnthrough_risk ? "  burnthrough" : "") << std::endl;
    }
    std::cout << std::setprecision(3);
    std::cout << "Total impulse:         " << timeline.total_impulse << " N*s" << std::endl;
    std::cout << "Average thrust:        " << timeline.average_thrust << " N" << std::endl;
    printWarnings(timeline.warnings);
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string path = argc > 1 ? argv[1] : "configs/hybrid_htpb.yaml";

    try {
        auto settings = utils::loadAnalysisSettings(path);
        utils::initLogging(settings.log_level.value_or(spdlog::level::info));

        std::cout << "=== Motor Design: " << path << " ===" << std::endl;
        auto validated = validate(utils::loadConfiguration(path));
        printWarnings(validated.warnings);

        const MotorConfiguration& config = validated.configuration;
        MotorPerformance perf = solve(config);
        printPerformance(perf);

        if (config.kind == PropellantKind::HYBRID) {
            printInjector(sizeInjector(perf, config.injector));
        }

        printTimeline(simulateRegression(config, settings.regression_steps));
    } catch (const MotorError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
