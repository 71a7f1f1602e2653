#include <gtest/gtest.h>
#include "../src/physics/types.hpp"
#include "../src/physics/errors.hpp"
#include "../src/physics/validation.hpp"
#include "../src/physics/performance_solver.hpp"
#include "../src/physics/injector/injector.hpp"
#include <cmath>
#include <variant>

using namespace motor_design;

class InjectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = validate(RawMotorConfiguration()).configuration;
        perf_ = solve(config_);
    }

    bool hasWarning(const InjectorDesign& design, const std::string& fragment) const {
        for (const auto& warning : design.warnings) {
            if (warning.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    MotorConfiguration config_;
    MotorPerformance perf_;
};

TEST_F(InjectorTest, DefaultDischargeCoefficients) {
    EXPECT_DOUBLE_EQ(defaultDischargeCoefficient(InjectorFamily::SHOWERHEAD), 0.70);
    EXPECT_DOUBLE_EQ(defaultDischargeCoefficient(InjectorFamily::PINTLE), 0.75);
    EXPECT_DOUBLE_EQ(defaultDischargeCoefficient(InjectorFamily::SWIRL), 0.65);
}

TEST_F(InjectorTest, ShowerheadDefaultDesign) {
    InjectorDesign design = sizeInjector(perf_, InjectorSpec());
    ASSERT_TRUE(std::holds_alternative<ShowerheadGeometry>(design.geometry));
    const auto& holes = std::get<ShowerheadGeometry>(design.geometry);

    EXPECT_EQ(design.family, InjectorFamily::SHOWERHEAD);
    EXPECT_EQ(holes.hole_count, 23);
    EXPECT_NEAR(holes.hole_diameter * 1e3, 0.7496, 1e-3);
    EXPECT_NEAR(holes.length_to_diameter, 4.002, 1e-2);
    EXPECT_NEAR(design.pressure_drop / 1e5, 11.204, 0.02);
    EXPECT_NEAR(design.exit_velocity, 30.0, 0.1);
    EXPECT_NEAR(design.footprint_diameter * 1e3, 12.2, 0.1);
    EXPECT_GT(design.reynolds_number, 4000.0);

    // Target velocity asks for more drop than the tank provides
    EXPECT_TRUE(hasWarning(design, "tank-to-chamber"));
    EXPECT_EQ(design.warnings.size(), 1u);
}

TEST_F(InjectorTest, ShowerheadDeliveredAreaCoversRequirement) {
    InjectorFlowConditions flow = resolveFlowConditions(perf_, InjectorSpec());
    EXPECT_NEAR(flow.required_area, 1.0151e-5, 1e-8);

    InjectorDesign design = sizeShowerhead(flow, ShowerheadParams());
    EXPECT_GE(design.flow_area, flow.required_area * (1.0 - 1e-9));
    EXPECT_LE(design.flow_area, 1.1 * flow.required_area);
}

TEST_F(InjectorTest, ShowerheadFixedHoleCount) {
    ShowerheadParams params;
    params.hole_count = 4;
    InjectorDesign design = sizeInjector(perf_, InjectorSpec(params));
    const auto& holes = std::get<ShowerheadGeometry>(design.geometry);

    EXPECT_EQ(holes.hole_count, 4);
    EXPECT_NEAR(holes.hole_diameter * 1e3, 1.798, 0.01);
    EXPECT_FALSE(hasWarning(design, "for 4 holes"));
    EXPECT_NEAR(design.flow_area, resolveFlowConditions(perf_, InjectorSpec(params)).required_area, 1e-12);
}

TEST_F(InjectorTest, ShowerheadInfeasibleBounds) {
    MotorPerformance heavy = perf_;
    heavy.oxidizer_mass_flow = 10.0;
    heavy.chamber_diameter = 0.3;

    ShowerheadParams params;
    params.min_hole_diameter = 0.3e-3;
    params.max_hole_diameter = 0.3e-3;
    EXPECT_THROW(sizeInjector(heavy, InjectorSpec(params)), InfeasibleGeometryError);
}

TEST_F(InjectorTest, ExplicitPressureDropOverridesTarget) {
    InjectorSpec spec;
    spec.pressure_drop = 8e5;
    InjectorFlowConditions flow = resolveFlowConditions(perf_, spec);
    EXPECT_DOUBLE_EQ(flow.pressure_drop, 8e5);
    EXPECT_NEAR(flow.required_area, requiredFlowArea(perf_.oxidizer_mass_flow, 0.70, 1220.0, 8e5), 1e-15);
}

TEST_F(InjectorTest, PintleAnnulusArea) {
    InjectorDesign design = sizeInjector(perf_, InjectorSpec(PintleParams()));
    ASSERT_TRUE(std::holds_alternative<PintleGeometry>(design.geometry));
    const auto& pintle = std::get<PintleGeometry>(design.geometry);

    // Tank-to-chamber drop with Cd 0.75
    EXPECT_NEAR(design.pressure_drop, perf_.tank_pressure - perf_.chamber_pressure, 1e-6);
    double annulus = 0.25 * constants::kPi *
                     (std::pow(pintle.pintle_diameter + 2.0 * pintle.gap, 2) - std::pow(pintle.pintle_diameter, 2));
    EXPECT_NEAR(annulus, design.flow_area, 1e-12);
    EXPECT_NEAR(design.flow_area, 1.0029e-5, 1e-8);

    // Sub-0.3 mm gap is flagged
    EXPECT_LT(pintle.gap, 0.3e-3);
    EXPECT_TRUE(hasWarning(design, "pintle gap"));
}

TEST_F(InjectorTest, PintleBodyTooSmall) {
    PintleParams params;
    params.outer_diameter = 25.1e-3;
    params.pintle_diameter = 25e-3;
    EXPECT_THROW(sizeInjector(perf_, InjectorSpec(params)), InfeasibleGeometryError);
}

TEST_F(InjectorTest, SwirlSlotGeometry) {
    SwirlParams params;
    params.slot_count = 4;
    params.spray_half_angle = 40.0 * constants::kPi / 180.0;
    InjectorDesign design = sizeInjector(perf_, InjectorSpec(params));
    ASSERT_TRUE(std::holds_alternative<SwirlGeometry>(design.geometry));
    const auto& swirl = std::get<SwirlGeometry>(design.geometry);

    double slot_area = swirl.slot_count * swirl.slot_width * swirl.slot_height;
    EXPECT_NEAR(slot_area, design.flow_area / std::tan(params.spray_half_angle), 1e-12);
    EXPECT_DOUBLE_EQ(swirl.slot_width, 2.0 * swirl.slot_height);
    EXPECT_NEAR(swirl.swirl_chamber_diameter, 3.0 * swirl.orifice_diameter, 1e-12);

    double axial = perf_.oxidizer_mass_flow / (1220.0 * design.flow_area);
    EXPECT_NEAR(design.exit_velocity, axial / std::cos(params.spray_half_angle), 1e-9);
}

TEST_F(InjectorTest, ShowerheadFootprintClamp) {
    InjectorDesign design = sizeInjector(perf_, InjectorSpec());
    const double hole = std::get<ShowerheadGeometry>(design.geometry).hole_diameter;

    InjectorDesign tight = design;
    applyFootprintClamp(tight, 0.012);
    EXPECT_LE(tight.footprint_diameter, 0.9 * 0.012 + 1e-12);
    EXPECT_GE(std::get<ShowerheadGeometry>(tight.geometry).hole_pitch, 1.5 * hole);
    EXPECT_TRUE(hasWarning(tight, "design assist"));

    InjectorDesign impossible = design;
    EXPECT_THROW(applyFootprintClamp(impossible, 0.006), InfeasibleGeometryError);

    InjectorDesign roomy = design;
    applyFootprintClamp(roomy, 0.15);
    EXPECT_DOUBLE_EQ(roomy.footprint_diameter, design.footprint_diameter);
}

TEST_F(InjectorTest, SolidMotorHasNoInjector) {
    RawMotorConfiguration raw;
    raw.kind = PropellantKind::SOLID;
    raw.burn_time = 2.0;
    MotorPerformance solid = solve(validate(raw).configuration);

    EXPECT_THROW(sizeInjector(solid, InjectorSpec()), InfeasibleGeometryError);
    EXPECT_THROW(sizeInjector(solid, InjectorSpec(PintleParams())), InfeasibleGeometryError);
}

TEST_F(InjectorTest, AdvisoryRules) {
    InjectorDesign design;
    design.family = InjectorFamily::PINTLE;
    design.geometry = PintleGeometry();
    design.pressure_drop = 2e5;
    design.exit_velocity = 60.0;
    design.reynolds_number = 1000.0;

    auto warnings = advisoryWarnings(design, perf_);
    ASSERT_EQ(warnings.size(), 4u);
    EXPECT_NE(warnings[0].find("20% of chamber pressure"), std::string::npos);
    EXPECT_NE(warnings[1].find("injection velocity"), std::string::npos);
    EXPECT_NE(warnings[2].find("Reynolds"), std::string::npos);
    EXPECT_NE(warnings[3].find("flash boiling"), std::string::npos);
}
