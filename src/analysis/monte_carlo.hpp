#pragma once

#include "../physics/types.hpp"
#include "../physics/errors.hpp"
#include "statistics.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace motor_design {

/**
 * @brief Monte Carlo run options
 */
struct MonteCarloOptions {
    uint64_t seed;
    size_t worker_count;                // 0 = hardware concurrency
    bool include_injector;              // Also size the injector per sample (hybrid)
    const std::atomic<bool>* stop;      // Polled between samples, may be null

    MonteCarloOptions() : seed(42), worker_count(0), include_injector(false), stop(nullptr) {}
};

/**
 * @brief Maps a perturbed configuration to named scalar outputs
 *
 * Domain errors (ValidationError, ConvergenceError, InfeasibleDesignError,
 * InfeasibleGeometryError) mark the sample as failed; anything else aborts
 * the run.
 */
using SampleEvaluator = std::function<std::map<std::string, double>(const MotorConfiguration&)>;

/**
 * @brief Monte Carlo uncertainty engine
 *
 * Every sample multiplies the named parameters of the nominal configuration
 * by max(1 + σ·z, 0.5) with z standard normal. Sample i draws from its own
 * generator seeded by (seed, i), so results do not depend on how samples
 * are spread over workers.
 */
class MonteCarloEngine {
public:
    /**
     * @brief Constructor
     * @param nominal Nominal configuration (normally with frozen geometry)
     * @param uncertainty Relative 1-sigma per parameter name
     * @param evaluator Per-sample evaluation
     * @throws ValidationError for unknown names or invalid sigmas
     */
    MonteCarloEngine(const MotorConfiguration& nominal, const UncertaintySpec& uncertainty,
                     SampleEvaluator evaluator);

    /**
     * @brief Run samples on worker threads and merge their statistics
     * @param sample_count Number of samples requested
     * @param options Seed, workers and stop flag
     * @return Summary over the completed samples
     * @throws std::invalid_argument when sample_count is zero
     */
    StatisticalSummary run(size_t sample_count, const MonteCarloOptions& options = MonteCarloOptions()) const;

    /**
     * @brief Draw and evaluate one sample
     * @param index Sample index
     * @param seed Run seed
     * @return Sample with factors and outputs, or its failure reason
     */
    MonteCarloSample evaluateSample(size_t index, uint64_t seed) const;

    /**
     * @brief Multiplicative factors for one sample
     */
    std::map<std::string, double> drawFactors(size_t index, uint64_t seed) const;

    /**
     * @brief Apply factors to a copy of the nominal configuration
     */
    MotorConfiguration perturb(const std::map<std::string, double>& factors) const;

    /**
     * @brief Names accepted in an UncertaintySpec
     */
    static std::vector<std::string> parameterNames();

    /**
     * @brief Reject unknown names and negative or non-finite sigmas
     * @throws ValidationError
     */
    static void checkUncertainty(const UncertaintySpec& uncertainty);

    const MotorConfiguration& getNominal() const { return nominal_; }

private:
    MotorConfiguration nominal_;
    UncertaintySpec uncertainty_;
    SampleEvaluator evaluator_;
};

/**
 * @brief Default evaluator: solve, optionally size the injector
 * @param include_injector Track injector_velocity for hybrid motors
 */
SampleEvaluator createPerformanceEvaluator(bool include_injector);

/**
 * @brief Run a Monte Carlo study around a configuration
 *
 * The nominal hardware is sized once in design mode and frozen, so samples
 * show how fixed hardware responds to property scatter.
 *
 * @param config Validated configuration
 * @param uncertainty Relative 1-sigma per parameter name
 * @param sample_count Number of samples
 * @param options Seed, workers, injector and stop flag
 * @return Statistical summary
 */
StatisticalSummary runMonteCarlo(const MotorConfiguration& config, const UncertaintySpec& uncertainty,
                                 size_t sample_count, const MonteCarloOptions& options = MonteCarloOptions());

} // namespace motor_design
