#include <gtest/gtest.h>
#include "../src/physics/types.hpp"
#include "../src/physics/errors.hpp"
#include "../src/physics/validation.hpp"
#include "../src/physics/performance_solver.hpp"
#include "../src/analysis/monte_carlo.hpp"
#include <atomic>
#include <cmath>
#include <stdexcept>

using namespace motor_design;

class MonteCarloTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = validate(RawMotorConfiguration()).configuration;
        nominal_ = config_;
        nominal_.geometry = PerformanceSolver(config_).designGeometry();

        uncertainty_ = {
            {"chamber_temperature", 0.01},
            {"oxidizer_density", 0.01},
            {"tank_pressure", 0.01},
            {"discharge_coefficient", 0.01},
        };
    }

    MotorConfiguration config_;
    MotorConfiguration nominal_;
    UncertaintySpec uncertainty_;
};

TEST_F(MonteCarloTest, HighSuccessRateAtSmallScatter) {
    MonteCarloOptions options;
    options.worker_count = 4;
    StatisticalSummary summary = runMonteCarlo(config_, uncertainty_, 10000, options);

    EXPECT_EQ(summary.requested, 10000u);
    EXPECT_EQ(summary.completed, 10000u);
    EXPECT_FALSE(summary.stopped_early);
    EXPECT_GT(summary.success_rate, 0.95);
    EXPECT_EQ(summary.succeeded + summary.failed, summary.completed);

    const OutputStatistics& thrust = summary.outputs.at("thrust");
    EXPECT_EQ(thrust.count, summary.succeeded);
    EXPECT_NEAR(thrust.mean, 1000.0, 20.0);
    EXPECT_GT(thrust.std_dev, 0.0);
    EXPECT_LT(thrust.p05, thrust.mean);
    EXPECT_GT(thrust.p95, thrust.mean);
}

TEST_F(MonteCarloTest, ResultsIndependentOfWorkerCount) {
    MonteCarloOptions serial;
    serial.worker_count = 1;
    serial.seed = 7;
    MonteCarloOptions parallel = serial;
    parallel.worker_count = 4;

    StatisticalSummary a = runMonteCarlo(config_, uncertainty_, 500, serial);
    StatisticalSummary b = runMonteCarlo(config_, uncertainty_, 500, parallel);

    EXPECT_EQ(a.succeeded, b.succeeded);
    ASSERT_EQ(a.outputs.size(), b.outputs.size());
    for (const auto& [name, stats] : a.outputs) {
        const OutputStatistics& other = b.outputs.at(name);
        EXPECT_EQ(stats.count, other.count) << name;
        EXPECT_NEAR(stats.mean, other.mean, 1e-9 * std::abs(stats.mean)) << name;
        EXPECT_NEAR(stats.std_dev, other.std_dev, 1e-6 * stats.std_dev + 1e-12) << name;
        EXPECT_DOUBLE_EQ(stats.p05, other.p05) << name;
        EXPECT_DOUBLE_EQ(stats.p95, other.p95) << name;
    }
}

TEST_F(MonteCarloTest, SeedChangesDraws) {
    MonteCarloEngine engine(nominal_, uncertainty_, createPerformanceEvaluator(false));
    auto first = engine.drawFactors(3, 42);
    auto again = engine.drawFactors(3, 42);
    auto other = engine.drawFactors(3, 43);

    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    EXPECT_EQ(first.size(), uncertainty_.size());
}

TEST_F(MonteCarloTest, FactorsAreClampedAtHalf) {
    UncertaintySpec wide = {{"chamber_temperature", 5.0}};
    MonteCarloEngine engine(nominal_, wide, createPerformanceEvaluator(false));

    bool clamped = false;
    for (size_t i = 0; i < 200; ++i) {
        double factor = engine.drawFactors(i, 1).at("chamber_temperature");
        EXPECT_GE(factor, 0.5);
        clamped = clamped || factor == 0.5;
    }
    EXPECT_TRUE(clamped);
}

TEST_F(MonteCarloTest, PerturbScalesNamedParameters) {
    MonteCarloEngine engine(nominal_, uncertainty_, createPerformanceEvaluator(false));
    MotorConfiguration perturbed = engine.perturb({{"chamber_temperature", 1.1}, {"throat_area", 0.9}});

    EXPECT_NEAR(perturbed.chamber_temperature, 1.1 * nominal_.chamber_temperature, 1e-9);
    EXPECT_NEAR(perturbed.geometry->throat_area, 0.9 * nominal_.geometry->throat_area, 1e-15);
    EXPECT_DOUBLE_EQ(perturbed.tank_pressure, nominal_.tank_pressure);
}

TEST_F(MonteCarloTest, UnknownParameterRejected) {
    UncertaintySpec bad = {{"flux_capacitor", 0.01}, {"gamma", -0.1}};
    try {
        runMonteCarlo(config_, bad, 10);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.violations().size(), 2u);
        EXPECT_TRUE(e.hasViolation(ConstraintType::UNCERTAINTY_PARAMETER));
    }
    EXPECT_EQ(MonteCarloEngine::parameterNames().size(), 14u);
}

TEST_F(MonteCarloTest, ZeroSamplesRejected) {
    EXPECT_THROW(runMonteCarlo(config_, uncertainty_, 0), std::invalid_argument);
}

TEST_F(MonteCarloTest, FailuresAreCountedByReason) {
    // Tank pressure scatter large enough to fall below chamber pressure
    UncertaintySpec risky = {{"tank_pressure", 0.3}};
    MonteCarloOptions options;
    options.worker_count = 2;
    StatisticalSummary summary = runMonteCarlo(config_, risky, 400, options);

    EXPECT_GT(summary.failed, 0u);
    EXPECT_LT(summary.success_rate, 1.0);
    size_t counted = 0;
    for (const auto& [reason, count] : summary.failures) counted += count;
    EXPECT_EQ(counted, summary.failed);
    EXPECT_GT(summary.failures.count(FailureReason::VALIDATION), 0u);
}

TEST_F(MonteCarloTest, StopFlagEndsRunEarly) {
    std::atomic<bool> stop{true};
    MonteCarloOptions options;
    options.worker_count = 2;
    options.stop = &stop;

    StatisticalSummary summary = runMonteCarlo(config_, uncertainty_, 1000, options);
    EXPECT_TRUE(summary.stopped_early);
    EXPECT_LT(summary.completed, 1000u);
}

TEST_F(MonteCarloTest, CustomEvaluator) {
    SampleEvaluator evaluator = [](const MotorConfiguration& config) {
        return std::map<std::string, double>{{"temperature", config.chamber_temperature}};
    };
    MonteCarloEngine engine(nominal_, {{"chamber_temperature", 0.02}}, evaluator);
    MonteCarloOptions options;
    options.worker_count = 3;
    StatisticalSummary summary = engine.run(3000, options);

    const OutputStatistics& temperature = summary.outputs.at("temperature");
    EXPECT_NEAR(temperature.mean, nominal_.chamber_temperature, 0.005 * nominal_.chamber_temperature);
    EXPECT_NEAR(temperature.coefficient_of_variation, 0.02, 0.002);
}

TEST_F(MonteCarloTest, EvaluatorErrorsOutsideDomainPropagate) {
    SampleEvaluator evaluator = [](const MotorConfiguration&) -> std::map<std::string, double> {
        throw std::logic_error("evaluator bug");
    };
    MonteCarloEngine engine(nominal_, uncertainty_, evaluator);
    MonteCarloOptions options;
    options.worker_count = 2;
    EXPECT_THROW(engine.run(10, options), std::logic_error);
}

TEST_F(MonteCarloTest, InjectorVelocityTracked) {
    MonteCarloOptions options;
    options.worker_count = 2;
    options.include_injector = true;
    StatisticalSummary summary = runMonteCarlo(config_, uncertainty_, 200, options);

    ASSERT_EQ(summary.outputs.count("injector_velocity"), 1u);
    EXPECT_NEAR(summary.outputs.at("injector_velocity").mean, 30.0, 3.0);
}
