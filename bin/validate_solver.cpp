#include <iostream>
#include <iomanip>
#include <cmath>
#include "../src/physics/types.hpp"
#include "../src/physics/validation.hpp"
#include "../src/physics/nozzle.hpp"
#include "../src/physics/performance_solver.hpp"
#include "../src/physics/regression.hpp"
#include "../src/analysis/monte_carlo.hpp"
#include "../src/utils/logging.hpp"

using namespace motor_design;

namespace {
    int failures = 0;

    void report(bool pass, const std::string& label) {
        std::cout << (pass ? "✓ PASS: " : "✗ FAIL: ") << label << std::endl;
        if (!pass) ++failures;
    }
}

/**
 * @brief Validate steady-state balance and design targets
 */
void validateSteadyState() {
    std::cout << "=== Task 1: Steady-State Operating Point ===" << std::endl;

    MotorConfiguration config = validate(RawMotorConfiguration()).configuration;
    PerformanceSolver solver(config);
    MotorPerformance perf = solver.solve();

    double discharge = nozzle::throatMassFlow(perf.chamber_pressure, perf.throat_area,
                                              perf.characteristic_velocity);
    double balance = std::abs(discharge - perf.mass_flow_rate) / perf.mass_flow_rate;
    double thrust_error = std::abs(perf.thrust - config.thrust) / config.thrust;
    double pressure_error = std::abs(perf.chamber_pressure - config.chamber_pressure) / config.chamber_pressure;

    std::cout << std::scientific << std::setprecision(3);
    std::cout << "Mass balance residual: " << balance << " (target: < 1e-5)" << std::endl;
    std::cout << "Thrust error:          " << thrust_error << " (target: < 1e-3)" << std::endl;
    std::cout << "Pressure error:        " << pressure_error << " (target: < 1e-3)" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Isp:                   " << perf.specific_impulse << " s (target: 150-250 s)" << std::endl;

    report(balance < 1e-5, "mass generation matches nozzle discharge");
    report(thrust_error < 1e-3 && pressure_error < 1e-3, "design mode meets thrust and pressure targets");
    report(perf.specific_impulse > 150.0 && perf.specific_impulse < 250.0, "specific impulse is plausible");
    report(std::abs(perf.of_ratio - config.of_ratio) < 1e-6, "nominal O/F reproduced");
}

/**
 * @brief Validate as-built evaluation away from the design point
 */
void validateAsBuilt() {
    std::cout << "\n=== Task 2: As-Built Hardware Response ===" << std::endl;

    MotorConfiguration config = validate(RawMotorConfiguration()).configuration;
    PerformanceSolver solver(config);
    MotorGeometry geometry = solver.designGeometry();

    double previous = 0.0;
    bool monotonic = true;
    for (double tank_bar : {25.0, 30.0, 40.0, 60.0}) {
        MotorConfiguration variant = config;
        variant.tank_pressure = tank_bar * 1e5;
        MotorPerformance perf = PerformanceSolver(variant).evaluate(geometry);
        std::cout << "Tank " << tank_bar << " bar -> Pc " << perf.chamber_pressure / 1e5 << " bar, "
                  << perf.solver_iterations << " iterations" << std::endl;
        monotonic = monotonic && perf.chamber_pressure > previous;
        previous = perf.chamber_pressure;
    }
    report(monotonic, "chamber pressure rises with tank pressure");
}

/**
 * @brief Validate burn history trends
 */
void validateRegression() {
    std::cout << "\n=== Task 3: Regression History ===" << std::endl;

    MotorConfiguration config = validate(RawMotorConfiguration()).configuration;
    RegressionTimeline timeline = simulateRegression(config, 50);

    bool port_grows = true;
    for (size_t i = 1; i < timeline.samples.size(); ++i) {
        port_grows = port_grows && timeline.samples[i].port_diameter >= timeline.samples[i - 1].port_diameter;
    }
    double of_drift = std::abs(timeline.samples.back().of_ratio - timeline.samples.front().of_ratio);

    std::cout << "Samples:        " << timeline.samples.size() << std::endl;
    std::cout << "O/F drift:      " << of_drift << " (n = 0.5: constant)" << std::endl;
    std::cout << "Total impulse:  " << timeline.total_impulse << " N*s" << std::endl;

    report(timeline.samples.size() == 51, "steps + 1 samples");
    report(port_grows, "port diameter never shrinks");
    report(of_drift < 1e-3, "O/F constant for n = 0.5");
    report(!timeline.hasBurnthroughRisk(), "nominal burn stays inside the structural margin");
}

/**
 * @brief Validate Monte Carlo reproducibility
 */
void validateMonteCarlo() {
    std::cout << "\n=== Task 4: Monte Carlo Reproducibility ===" << std::endl;

    MotorConfiguration config = validate(RawMotorConfiguration()).configuration;
    UncertaintySpec uncertainty = {{"chamber_temperature", 0.01}, {"oxidizer_density", 0.01}};

    MonteCarloOptions serial;
    serial.worker_count = 1;
    MonteCarloOptions parallel;
    parallel.worker_count = 4;

    StatisticalSummary a = runMonteCarlo(config, uncertainty, 400, serial);
    StatisticalSummary b = runMonteCarlo(config, uncertainty, 400, parallel);

    double mean_a = a.outputs.at("thrust").mean;
    double mean_b = b.outputs.at("thrust").mean;
    std::cout << "Success rate:       " << 100.0 * a.success_rate << "%" << std::endl;
    std::cout << "Thrust mean (1/4):  " << mean_a << " / " << mean_b << " N" << std::endl;

    report(a.success_rate > 0.95, "success rate above 95% at 1% scatter");
    report(std::abs(mean_a - mean_b) < 1e-9 * mean_a && a.outputs.at("thrust").p95 == b.outputs.at("thrust").p95,
           "statistics independent of worker count");
}

int main() {
    utils::initLogging(spdlog::level::warn);

    try {
        validateSteadyState();
        validateAsBuilt();
        validateRegression();
        validateMonteCarlo();
    } catch (const MotorError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== Summary: " << (failures == 0 ? "all checks passed" : std::to_string(failures) + " failed")
              << " ===" << std::endl;
    return failures == 0 ? 0 : 1;
}
