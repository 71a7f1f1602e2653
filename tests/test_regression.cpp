#include <gtest/gtest.h>
#include <Eigen/Dense>
#include "../src/physics/types.hpp"
#include "../src/physics/errors.hpp"
#include "../src/physics/validation.hpp"
#include "../src/physics/performance_solver.hpp"
#include "../src/physics/regression.hpp"
#include <cmath>
#include <stdexcept>

using namespace motor_design;

class RegressionTest : public ::testing::Test {
protected:
    void SetUp() override {
        htpb_ = validate(RawMotorConfiguration()).configuration;

        RawMotorConfiguration paraffin;
        paraffin.propellant = "paraffin";
        paraffin_ = validate(paraffin).configuration;

        RawMotorConfiguration solid;
        solid.kind = PropellantKind::SOLID;
        solid.propellant = "apcp";
        solid.burn_time = 2.0;
        solid_ = validate(solid).configuration;
    }

    MotorConfiguration htpb_;
    MotorConfiguration paraffin_;
    MotorConfiguration solid_;
};

TEST_F(RegressionTest, SampleCountAndSpacing) {
    RegressionTimeline timeline = simulateRegression(htpb_, 40);
    ASSERT_EQ(timeline.samples.size(), 41u);
    EXPECT_DOUBLE_EQ(timeline.samples.front().time, 0.0);
    EXPECT_NEAR(timeline.samples.back().time, 10.0, 1e-6);
    EXPECT_NEAR(timeline.samples[1].time - timeline.samples[0].time, 0.25, 1e-6);
}

TEST_F(RegressionTest, ZeroStepsRejected) {
    EXPECT_THROW(simulateRegression(htpb_, 0), std::invalid_argument);
    RegressionSimulator simulator(htpb_);
    EXPECT_THROW(simulator.run(0), std::invalid_argument);
}

TEST_F(RegressionTest, PortGrowsMonotonically) {
    RegressionTimeline timeline = simulateRegression(htpb_, 100);
    for (size_t i = 1; i < timeline.samples.size(); ++i) {
        EXPECT_GT(timeline.samples[i].port_diameter, timeline.samples[i - 1].port_diameter) << "sample " << i;
    }
    EXPECT_FALSE(timeline.hasBurnthroughRisk());
    EXPECT_TRUE(timeline.warnings.empty());
}

TEST_F(RegressionTest, SquareRootLawKeepsMixtureRatio) {
    // Fuel flow ∝ D^(1 - 2n) is independent of the port at n = 0.5
    RegressionTimeline timeline = simulateRegression(htpb_, 100);
    for (const auto& sample : timeline.samples) {
        EXPECT_NEAR(sample.of_ratio, 6.5, 1e-3);
        EXPECT_NEAR(sample.chamber_pressure, 20e5, 50.0);
    }
    EXPECT_NEAR(timeline.total_impulse, 10000.0, 5.0);
    EXPECT_NEAR(timeline.average_thrust, 1000.0, 0.5);
}

TEST_F(RegressionTest, ParaffinShiftsOxidizerRich) {
    RegressionTimeline timeline = simulateRegression(paraffin_, 100);
    ASSERT_FALSE(timeline.hasBurnthroughRisk());

    for (size_t i = 1; i < timeline.samples.size(); ++i) {
        EXPECT_GT(timeline.samples[i].of_ratio, timeline.samples[i - 1].of_ratio) << "sample " << i;
    }
    EXPECT_GT(timeline.samples.back().of_ratio, 6.6);
    EXPECT_LT(timeline.samples.back().thrust, timeline.samples.front().thrust);
}

TEST_F(RegressionTest, BurnthroughFreezesState) {
    MotorConfiguration config = htpb_;
    config.burnthrough_margin = 0.5;

    RegressionTimeline timeline = simulateRegression(config, 100);
    ASSERT_TRUE(timeline.hasBurnthroughRisk());
    const size_t frozen = *timeline.burnthrough_index;
    ASSERT_GT(frozen, 0u);
    ASSERT_LT(frozen, timeline.samples.size());
    ASSERT_EQ(timeline.warnings.size(), 1u);

    const double limit = 0.5 * timeline.samples.front().performance.chamber_diameter;
    for (size_t i = 0; i < timeline.samples.size(); ++i) {
        const auto& sample = timeline.samples[i];
        EXPECT_LE(sample.port_diameter, limit);
        EXPECT_EQ(sample.burnthrough_risk, i >= frozen) << "sample " << i;
        if (i >= frozen) {
            EXPECT_DOUBLE_EQ(sample.port_diameter, timeline.samples[frozen - 1].port_diameter);
            EXPECT_DOUBLE_EQ(sample.thrust, timeline.samples[frozen - 1].thrust);
        }
    }
}

TEST_F(RegressionTest, SolidCoreGrowsAndPressureFalls) {
    RegressionTimeline timeline = simulateRegression(solid_, 100);
    ASSERT_EQ(timeline.samples.size(), 101u);

    const auto& first = timeline.samples.front();
    const auto& last = timeline.samples.back();
    EXPECT_GT(last.port_diameter, first.port_diameter);
    EXPECT_LT(last.chamber_pressure, first.chamber_pressure);
    EXPECT_NEAR(first.thrust, 1000.0, 0.5);
    EXPECT_DOUBLE_EQ(first.of_ratio, 0.0);
    EXPECT_GT(timeline.total_impulse, 0.0);
    EXPECT_LT(timeline.total_impulse, 2000.0);
}

TEST_F(RegressionTest, SolidTimelineReportsUnburnedWeb) {
    // Pressure falls as the core grows, so the grain is not burned out at the initial burn time
    RegressionTimeline timeline = simulateRegression(solid_, 100);
    EXPECT_FALSE(timeline.hasBurnthroughRisk());
    ASSERT_EQ(timeline.warnings.size(), 1u);
    EXPECT_NE(timeline.warnings[0].find("web unburned"), std::string::npos);

    const SolidGrain& last = timeline.samples.back().performance.geometry.grain;
    EXPECT_GT(last.web(), 0.0);
    EXPECT_NEAR(timeline.samples.back().time, timeline.samples.front().performance.burn_time, 1e-9);
}

TEST_F(RegressionTest, SimulatorKeepsSuppliedGeometry) {
    MotorGeometry geometry = PerformanceSolver(htpb_).designGeometry();
    geometry.port_diameter *= 1.2;
    MotorConfiguration config = htpb_;
    config.geometry = geometry;

    RegressionSimulator simulator(config);
    EXPECT_DOUBLE_EQ(simulator.getInitialGeometry().port_diameter, geometry.port_diameter);

    RegressionTimeline timeline = simulator.run(10);
    EXPECT_DOUBLE_EQ(timeline.samples.front().port_diameter, geometry.port_diameter);
}

TEST_F(RegressionTest, TimelineMatrixExport) {
    RegressionTimeline timeline = simulateRegression(htpb_, 20);
    Eigen::MatrixXd m = timeline.toMatrix();
    ASSERT_EQ(m.rows(), 21);
    EXPECT_DOUBLE_EQ(m(20, 4), timeline.samples.back().thrust);
    EXPECT_TRUE((m.col(1).tail(20) - m.col(1).head(20)).minCoeff() > 0.0);
}
