#include "monte_carlo.hpp"
#include "../physics/performance_solver.hpp"
#include "../physics/validation.hpp"
#include "../physics/injector/injector.hpp"
#include "../utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <random>
#include <stdexcept>
#include <thread>

namespace motor_design {

namespace {
    constexpr double kMinFactor = 0.5;

    using Perturbation = std::function<void(MotorConfiguration&, double)>;

    // Geometry-scaled parameters act on the frozen hardware
    void scaleGeometry(MotorConfiguration& config, double MotorGeometry::*field, double factor) {
        if (config.geometry) (*config.geometry).*field *= factor;
    }

    const std::map<std::string, Perturbation>& perturbations() {
        static const std::map<std::string, Perturbation> table = {
            {"chamber_temperature",   [](MotorConfiguration& c, double f) { c.chamber_temperature *= f; }},
            {"gamma",                 [](MotorConfiguration& c, double f) { c.gamma *= f; }},
            {"gas_constant",          [](MotorConfiguration& c, double f) { c.gas_constant *= f; }},
            {"burn_rate_coefficient", [](MotorConfiguration& c, double f) { c.burn_rate_coefficient *= f; }},
            {"burn_rate_exponent",    [](MotorConfiguration& c, double f) { c.burn_rate_exponent *= f; }},
            {"propellant_density",    [](MotorConfiguration& c, double f) { c.propellant_density *= f; }},
            {"oxidizer_density",      [](MotorConfiguration& c, double f) { c.oxidizer.density *= f; }},
            {"oxidizer_viscosity",    [](MotorConfiguration& c, double f) { c.oxidizer.viscosity *= f; }},
            {"tank_pressure",         [](MotorConfiguration& c, double f) { c.tank_pressure *= f; }},
            {"atmospheric_pressure",  [](MotorConfiguration& c, double f) { c.atmospheric_pressure *= f; }},
            {"nozzle_efficiency",     [](MotorConfiguration& c, double f) { c.nozzle_efficiency *= f; }},
            {"initial_temperature",   [](MotorConfiguration& c, double f) { c.initial_temperature *= f; }},
            {"discharge_coefficient", [](MotorConfiguration& c, double f) {
                scaleGeometry(c, &MotorGeometry::injector_effective_area, f);
            }},
            {"throat_area",           [](MotorConfiguration& c, double f) {
                scaleGeometry(c, &MotorGeometry::throat_area, f);
            }},
        };
        return table;
    }

    // Uniform (0, 1] from the top 53 bits
    double nextUnit(std::mt19937_64& rng) {
        return (static_cast<double>(rng() >> 11) + 1.0) * (1.0 / 9007199254740992.0);
    }

    double standardNormal(std::mt19937_64& rng) {
        const double u1 = nextUnit(rng);
        const double u2 = nextUnit(rng);
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * constants::kPi * u2);
    }

    std::mt19937_64 sampleGenerator(uint64_t seed, size_t index) {
        const uint64_t i = static_cast<uint64_t>(index);
        std::seed_seq sequence{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                               static_cast<uint32_t>(i), static_cast<uint32_t>(i >> 32)};
        return std::mt19937_64(sequence);
    }

    // Per-worker share of the reduction
    struct PartialResult {
        size_t completed = 0;
        size_t succeeded = 0;
        bool stopped = false;
        std::map<FailureReason, size_t> failures;
        std::map<std::string, OutputSeries> outputs;
    };
}

MonteCarloEngine::MonteCarloEngine(const MotorConfiguration& nominal, const UncertaintySpec& uncertainty,
                                   SampleEvaluator evaluator)
    : nominal_(nominal), uncertainty_(uncertainty), evaluator_(std::move(evaluator)) {
    checkUncertainty(uncertainty_);
    if (!evaluator_) {
        throw std::invalid_argument("Monte Carlo engine needs an evaluator");
    }
}

std::vector<std::string> MonteCarloEngine::parameterNames() {
    std::vector<std::string> names;
    for (const auto& entry : perturbations()) names.push_back(entry.first);
    return names;
}

void MonteCarloEngine::checkUncertainty(const UncertaintySpec& uncertainty) {
    std::vector<ConstraintViolation> violations;
    for (const auto& [name, sigma] : uncertainty) {
        if (perturbations().count(name) == 0) {
            violations.emplace_back(ConstraintType::UNCERTAINTY_PARAMETER, name, sigma, 0.0, 0.0, true,
                                    fmt::format("unknown uncertainty parameter '{}'", name));
        } else if (!std::isfinite(sigma) || sigma < 0.0) {
            violations.emplace_back(ConstraintType::UNCERTAINTY_PARAMETER, name, sigma, 0.0, std::abs(sigma), true,
                                    fmt::format("uncertainty of '{}' must be a non-negative fraction", name));
        }
    }
    if (!violations.empty()) {
        throw ValidationError(std::move(violations));
    }
}

std::map<std::string, double> MonteCarloEngine::drawFactors(size_t index, uint64_t seed) const {
    std::mt19937_64 rng = sampleGenerator(seed, index);
    std::map<std::string, double> factors;
    for (const auto& [name, sigma] : uncertainty_) {
        factors[name] = std::max(1.0 + sigma * standardNormal(rng), kMinFactor);
    }
    return factors;
}

MotorConfiguration MonteCarloEngine::perturb(const std::map<std::string, double>& factors) const {
    MotorConfiguration config = nominal_;
    for (const auto& [name, factor] : factors) {
        perturbations().at(name)(config, factor);
    }
    return config;
}

MonteCarloSample MonteCarloEngine::evaluateSample(size_t index, uint64_t seed) const {
    MonteCarloSample sample;
    sample.index = index;
    sample.factors = drawFactors(index, seed);

    const MotorConfiguration config = perturb(sample.factors);
    try {
        requireValid(config);
        sample.outputs = evaluator_(config);
    } catch (const ValidationError&) {
        sample.failure = FailureReason::VALIDATION;
    } catch (const ConvergenceError&) {
        sample.failure = FailureReason::CONVERGENCE;
    } catch (const InfeasibleGeometryError&) {
        sample.failure = FailureReason::INFEASIBLE_GEOMETRY;
    } catch (const InfeasibleDesignError&) {
        sample.failure = FailureReason::INFEASIBLE_DESIGN;
    }
    if (sample.failure) {
        sample.outputs.clear();
    }
    return sample;
}

StatisticalSummary MonteCarloEngine::run(size_t sample_count, const MonteCarloOptions& options) const {
    if (sample_count == 0) {
        throw std::invalid_argument("Monte Carlo run needs at least one sample");
    }

    size_t workers = options.worker_count;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, sample_count);

    std::vector<PartialResult> partials(workers);
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([this, w, workers, sample_count, &options, &partials, &errors]() {
            PartialResult& partial = partials[w];
            try {
                for (size_t i = w; i < sample_count; i += workers) {
                    if (options.stop && options.stop->load()) {
                        partial.stopped = true;
                        break;
                    }
                    MonteCarloSample sample = evaluateSample(i, options.seed);
                    ++partial.completed;
                    if (sample.failure) {
                        ++partial.failures[*sample.failure];
                        utils::logger()->debug("sample {} failed: {}", i, utils::toString(*sample.failure));
                        continue;
                    }
                    ++partial.succeeded;
                    for (const auto& [name, value] : sample.outputs) {
                        partial.outputs[name].push(value);
                    }
                }
            } catch (...) {
                // Rethrown on the calling thread after join
                errors[w] = std::current_exception();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    // Merge partials in worker order
    PartialResult merged;
    for (const auto& partial : partials) {
        merged.completed += partial.completed;
        merged.succeeded += partial.succeeded;
        merged.stopped = merged.stopped || partial.stopped;
        for (const auto& [reason, count] : partial.failures) {
            merged.failures[reason] += count;
        }
        for (const auto& [name, series] : partial.outputs) {
            merged.outputs[name].merge(series);
        }
    }

    StatisticalSummary summary;
    summary.requested = sample_count;
    summary.completed = merged.completed;
    summary.succeeded = merged.succeeded;
    summary.failed = merged.completed - merged.succeeded;
    summary.failures = merged.failures;
    summary.success_rate = merged.completed > 0
                         ? static_cast<double>(merged.succeeded) / static_cast<double>(merged.completed)
                         : 0.0;
    summary.stopped_early = merged.completed < sample_count;
    for (const auto& [name, series] : merged.outputs) {
        summary.outputs[name] = series.summarize();
    }

    utils::logger()->info("Monte Carlo: {}/{} samples completed, {} succeeded ({:.1f}%) on {} workers",
                          summary.completed, summary.requested, summary.succeeded,
                          100.0 * summary.success_rate, workers);
    return summary;
}

SampleEvaluator createPerformanceEvaluator(bool include_injector) {
    return [include_injector](const MotorConfiguration& config) {
        const MotorPerformance perf = solve(config);
        std::map<std::string, double> outputs = {
            {"thrust", perf.thrust},
            {"specific_impulse", perf.specific_impulse},
            {"burn_time", perf.burn_time},
            {"chamber_pressure", perf.chamber_pressure},
            {"mass_flow_rate", perf.mass_flow_rate},
            {"of_ratio", perf.of_ratio},
        };
        if (include_injector && config.kind == PropellantKind::HYBRID) {
            outputs["injector_velocity"] = sizeInjector(perf, config.injector).exit_velocity;
        }
        return outputs;
    };
}

StatisticalSummary runMonteCarlo(const MotorConfiguration& config, const UncertaintySpec& uncertainty,
                                 size_t sample_count, const MonteCarloOptions& options) {
    if (sample_count == 0) {
        throw std::invalid_argument("Monte Carlo run needs at least one sample");
    }
    MonteCarloEngine::checkUncertainty(uncertainty);

    MotorConfiguration nominal = config;
    if (!nominal.geometry) {
        nominal.geometry = PerformanceSolver(config).designGeometry();
    }

    MonteCarloEngine engine(nominal, uncertainty, createPerformanceEvaluator(options.include_injector));
    return engine.run(sample_count, options);
}

} // namespace motor_design
