#include <atomic>
#include <csignal>
#include <iostream>
#include <iomanip>
#include <string>
#include "../src/physics/validation.hpp"
#include "../src/analysis/monte_carlo.hpp"
#include "../src/utils/config_loader.hpp"
#include "../src/utils/logging.hpp"

using namespace motor_design;

namespace {
    std::atomic<bool> stop_requested{false};

    extern "C" void handleInterrupt(int) {
        stop_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    const std::string path = argc > 1 ? argv[1] : "configs/monte_carlo.yaml";

    try {
        auto analysis = utils::loadAnalysisSettings(path);
        utils::initLogging(analysis.log_level.value_or(spdlog::level::info));

        auto settings = utils::loadMonteCarloSettings(path);
        auto validated = validate(utils::loadConfiguration(path));

        // Ctrl-C finishes the samples in flight and reports what completed
        std::signal(SIGINT, handleInterrupt);
        settings.options.stop = &stop_requested;

        std::cout << "=== Monte Carlo: " << settings.samples << " samples, seed " << settings.options.seed
                  << " ===" << std::endl;
        StatisticalSummary summary = runMonteCarlo(validated.configuration, settings.uncertainty,
                                                   settings.samples, settings.options);

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "Completed: " << summary.completed << "/" << summary.requested
                  << (summary.stopped_early ? " (stopped early)" : "") << std::endl;
        std::cout << "Success rate: " << 100.0 * summary.success_rate << "%" << std::endl;
        for (const auto& [reason, count] : summary.failures) {
            std::cout << "  " << utils::toString(reason) << ": " << count << std::endl;
        }

        std::cout << "\n" << std::left << std::setw(20) << "output" << std::right
                  << std::setw(14) << "mean" << std::setw(12) << "std" << std::setw(9) << "CV %"
                  << std::setw(14) << "p05" << std::setw(14) << "p95" << std::endl;
        std::cout << std::setprecision(4);
        for (const auto& [name, stats] : summary.outputs) {
            std::cout << std::left << std::setw(20) << name << std::right
                      << std::setw(14) << stats.mean << std::setw(12) << stats.std_dev
                      << std::setw(9) << std::setprecision(2) << 100.0 * stats.coefficient_of_variation
                      << std::setprecision(4)
                      << std::setw(14) << stats.p05 << std::setw(14) << stats.p95 << std::endl;
        }
    } catch (const MotorError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
