#include <gtest/gtest.h>
#include <Eigen/Dense>
#include "../src/physics/types.hpp"
#include "../src/physics/propulsion/grain.hpp"

using namespace motor_design;

class TypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Two-segment BATES grain
        test_grain = SolidGrain(0.08, 0.03, 0.12, 2);

        for (int i = 0; i <= 4; ++i) {
            TimelineSample sample;
            sample.time = 0.5 * i;
            sample.port_diameter = 0.03 + 0.001 * i;
            sample.of_ratio = 6.5;
            sample.chamber_pressure = 20e5;
            sample.thrust = 1000.0 - 10.0 * i;
            sample.mass_flow_rate = 0.43;
            test_timeline.samples.push_back(sample);
        }
    }

    SolidGrain test_grain;
    RegressionTimeline test_timeline;
};

// Test MotorConfiguration defaults
TEST_F(TypesTest, ConfigurationDefaultConstructor) {
    MotorConfiguration config;

    EXPECT_EQ(config.kind, PropellantKind::HYBRID);
    EXPECT_EQ(config.propellant, "htpb");
    EXPECT_DOUBLE_EQ(config.thrust, 1000.0);
    EXPECT_DOUBLE_EQ(config.burn_time, 10.0);
    EXPECT_DOUBLE_EQ(config.chamber_pressure, 20e5);
    EXPECT_DOUBLE_EQ(config.tank_pressure, 30e5);
    EXPECT_DOUBLE_EQ(config.atmospheric_pressure, constants::kSeaLevelPressure);
    EXPECT_EQ(config.combustion_mode, CombustionMode::INFINITE_AREA);
    EXPECT_FALSE(config.geometry.has_value());
    EXPECT_FALSE(config.grain.has_value());
}

TEST_F(TypesTest, InjectorSpecFamilyFollowsParams) {
    EXPECT_EQ(InjectorSpec().family(), InjectorFamily::SHOWERHEAD);
    EXPECT_EQ(InjectorSpec(PintleParams()).family(), InjectorFamily::PINTLE);
    EXPECT_EQ(InjectorSpec(SwirlParams()).family(), InjectorFamily::SWIRL);
}

TEST_F(TypesTest, GrainWebIsSmallerOfRadialAndAxial) {
    EXPECT_NEAR(test_grain.web(), 0.025, 1e-12);

    SolidGrain short_segment(0.08, 0.03, 0.02, 1);
    EXPECT_NEAR(short_segment.web(), 0.01, 1e-12);
}

TEST_F(TypesTest, BatesBurningArea) {
    const double core = constants::kPi * 0.03 * 0.12;
    const double ends = 2.0 * 0.25 * constants::kPi * (0.08 * 0.08 - 0.03 * 0.03);
    EXPECT_NEAR(propulsion::BatesGrain::burning_area(test_grain), 2.0 * (core + ends), 1e-12);
    EXPECT_NEAR(propulsion::BatesGrain::total_length(test_grain), 0.24, 1e-12);
}

TEST_F(TypesTest, BatesRegressionConsumesWeb) {
    SolidGrain regressed = propulsion::BatesGrain::regress(test_grain, 0.01);
    EXPECT_NEAR(regressed.core_diameter, 0.05, 1e-12);
    EXPECT_NEAR(regressed.segment_length, 0.10, 1e-12);
    EXPECT_FALSE(propulsion::BatesGrain::burned_out(regressed));

    SolidGrain spent = propulsion::BatesGrain::regress(test_grain, test_grain.web() + 1e-6);
    EXPECT_TRUE(propulsion::BatesGrain::burned_out(spent));
    EXPECT_NEAR(propulsion::BatesGrain::propellant_volume(spent), 0.0, 1e-12);
}

TEST_F(TypesTest, TimelineToMatrixConversion) {
    Eigen::MatrixXd m = test_timeline.toMatrix();

    EXPECT_EQ(m.rows(), 5);
    EXPECT_EQ(m.cols(), 6);
    EXPECT_DOUBLE_EQ(m(2, 0), 1.0);
    EXPECT_NEAR(m(4, 1), 0.034, 1e-12);
    EXPECT_DOUBLE_EQ(m(3, 4), 970.0);
    EXPECT_FALSE(test_timeline.hasBurnthroughRisk());
}

TEST_F(TypesTest, AreaDiameterHelpers) {
    double area = utils::areaFromDiameter(0.05);
    EXPECT_NEAR(utils::diameterFromArea(area), 0.05, 1e-12);
    EXPECT_TRUE(utils::isPositiveFinite(1.0));
    EXPECT_FALSE(utils::isPositiveFinite(0.0));
    EXPECT_FALSE(utils::isPositiveFinite(std::nan("")));
}

TEST_F(TypesTest, EnumNames) {
    EXPECT_EQ(utils::toString(PropellantKind::SOLID), "solid");
    EXPECT_EQ(utils::toString(NozzleType::BELL), "bell");
    EXPECT_EQ(utils::toString(InjectorFamily::SWIRL), "swirl");
    EXPECT_EQ(utils::toString(FailureReason::CONVERGENCE), "convergence");
}
