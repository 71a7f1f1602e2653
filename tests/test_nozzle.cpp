#include <gtest/gtest.h>
#include "../src/physics/types.hpp"
#include "../src/physics/errors.hpp"
#include "../src/physics/nozzle.hpp"
#include "../src/physics/core/root_finding.hpp"
#include "../src/physics/environment/isa_atmosphere.hpp"
#include <cmath>

using namespace motor_design;

class NozzleTest : public ::testing::Test {
protected:
    void SetUp() override {
        gamma_ = 1.25;
        gas_constant_ = 415.0;
        chamber_temperature_ = 3200.0;
        chamber_pressure_ = 20e5;
        ambient_pressure_ = constants::kSeaLevelPressure;
    }

    double gamma_;
    double gas_constant_;
    double chamber_temperature_;
    double chamber_pressure_;
    double ambient_pressure_;
};

TEST_F(NozzleTest, CharacteristicVelocityReference) {
    double cstar = nozzle::characteristicVelocity(gamma_, gas_constant_, chamber_temperature_);
    EXPECT_NEAR(cstar, 1751.18, 0.5);
}

TEST_F(NozzleTest, ThroatMassFlowIncreasesWithPressure) {
    double cstar = nozzle::characteristicVelocity(gamma_, gas_constant_, chamber_temperature_);
    double previous = 0.0;
    for (double pc = 5e5; pc <= 100e5; pc += 5e5) {
        double mdot = nozzle::throatMassFlow(pc, 3.75e-4, cstar);
        EXPECT_GT(mdot, previous);
        previous = mdot;
    }
}

TEST_F(NozzleTest, MachAreaRelationInverts) {
    for (double eps : {1.5, 3.0, 10.0, 50.0}) {
        double mach = nozzle::supersonicMach(eps, gamma_);
        EXPECT_GT(mach, 1.0);
        EXPECT_NEAR(nozzle::areaRatioFromMach(mach, gamma_), eps, 1e-5 * eps);

        double sub = nozzle::subsonicMach(eps, gamma_);
        EXPECT_LT(sub, 1.0);
        EXPECT_NEAR(nozzle::areaRatioFromMach(sub, gamma_), eps, 1e-5 * eps);
    }
}

TEST_F(NozzleTest, LargeContractionRatioKeepsRelativeAccuracy) {
    // Chamber Mach of a few thousandths
    for (double contraction : {60.0, 200.0, 1000.0}) {
        double mach = nozzle::subsonicMach(contraction, gamma_);
        EXPECT_LT(mach, 0.02);
        EXPECT_NEAR(nozzle::areaRatioFromMach(mach, gamma_), contraction, 1e-5 * contraction) << contraction;
    }
}

TEST_F(NozzleTest, UnitAreaRatioIsSonic) {
    EXPECT_DOUBLE_EQ(nozzle::supersonicMach(1.0, gamma_), 1.0);
    EXPECT_NEAR(nozzle::exitPressureRatio(1.0, gamma_), nozzle::criticalPressureRatio(gamma_), 1e-12);
}

TEST_F(NozzleTest, AreaRatioBelowOneRejected) {
    EXPECT_THROW(nozzle::supersonicMach(0.8, gamma_), InfeasibleDesignError);
    EXPECT_THROW(nozzle::subsonicMach(0.5, gamma_), InfeasibleDesignError);
}

TEST_F(NozzleTest, OptimumExpansionMatchesAmbient) {
    double eps = nozzle::optimumExpansionRatio(chamber_pressure_, ambient_pressure_, gamma_);
    EXPECT_NEAR(eps, 3.3749, 1e-3);

    double pe = nozzle::exitPressureRatio(eps, gamma_) * chamber_pressure_;
    EXPECT_NEAR(pe, ambient_pressure_, 1e-4 * ambient_pressure_);
}

TEST_F(NozzleTest, OptimumExpansionRequiresChokedFlow) {
    EXPECT_THROW(nozzle::optimumExpansionRatio(1.2e5, ambient_pressure_, gamma_), InfeasibleDesignError);
    EXPECT_THROW(nozzle::optimumExpansionRatio(chamber_pressure_, 0.0, gamma_), InfeasibleDesignError);
}

TEST_F(NozzleTest, ThrustCoefficientAtOptimumExpansion) {
    double eps = nozzle::optimumExpansionRatio(chamber_pressure_, ambient_pressure_, gamma_);
    double pe_ratio = nozzle::exitPressureRatio(eps, gamma_);
    double cf = nozzle::idealThrustCoefficient(gamma_, pe_ratio, ambient_pressure_ / chamber_pressure_, eps);
    EXPECT_NEAR(cf, 1.3948, 1e-3);

    // At matched expansion CF·c* equals the exit velocity
    double cstar = nozzle::characteristicVelocity(gamma_, gas_constant_, chamber_temperature_);
    double ve = nozzle::exitVelocity(gamma_, gas_constant_, chamber_temperature_, pe_ratio);
    EXPECT_NEAR(cf * cstar, ve, 1e-3 * ve);
}

TEST_F(NozzleTest, NozzleEfficiencyAndLength) {
    EXPECT_DOUBLE_EQ(nozzle::nozzleEfficiency(NozzleType::CONICAL), 0.955);
    EXPECT_DOUBLE_EQ(nozzle::nozzleEfficiency(NozzleType::BELL), 0.985);

    double cone = nozzle::divergentLength(0.02, 0.04, NozzleType::CONICAL);
    EXPECT_NEAR(cone, 0.01 / std::tan(15.0 * constants::kPi / 180.0), 1e-12);
    EXPECT_NEAR(nozzle::divergentLength(0.02, 0.04, NozzleType::BELL), 0.8 * cone, 1e-12);
}

TEST_F(NozzleTest, RayleighStagnationLoss) {
    EXPECT_NEAR(nozzle::rayleighStagnationRatio(0.0, gamma_), 1.0, 1e-12);
    double low = nozzle::rayleighStagnationRatio(0.1, gamma_);
    double high = nozzle::rayleighStagnationRatio(0.4, gamma_);
    EXPECT_LT(low, 1.0);
    EXPECT_LT(high, low);
}

TEST(RootFindingTest, BisectionFindsRoot) {
    auto result = core::bisect([](double x) { return x * x - 2.0; }, 0.0, 2.0, 200, 1e-10);
    EXPECT_TRUE(result.bracketed);
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.root, std::sqrt(2.0), 1e-8);
}

TEST(RootFindingTest, ReportsMissingBracket) {
    auto result = core::bisect([](double x) { return x * x + 1.0; }, -1.0, 1.0);
    EXPECT_FALSE(result.bracketed);
    EXPECT_FALSE(result.converged);
}

TEST(IsaAtmosphereTest, SeaLevelAndTropopause) {
    EXPECT_NEAR(environment::IsaAtmosphere::pressureAt(0.0), 101325.0, 1.0);
    EXPECT_NEAR(environment::IsaAtmosphere::pressureAt(11000.0), 22632.0, 5.0);
    EXPECT_TRUE(environment::IsaAtmosphere::inRange(20000.0));
    EXPECT_FALSE(environment::IsaAtmosphere::inRange(100000.0));
    EXPECT_THROW(environment::IsaAtmosphere::computeProperties(100000.0), std::invalid_argument);
}
