#undef NDEBUG
#include <iostream>
#include <cassert>
#include <cmath>
#include "../src/physics/types.hpp"
#include "../src/physics/nozzle.hpp"
#include "../src/physics/propellants.hpp"
#include "../src/physics/validation.hpp"
#include "../src/physics/performance_solver.hpp"

using namespace motor_design;

int main() {
    std::cout << "=== Simple Motor Test ===" << std::endl;

    // Propellant database
    auto htpb = findHybridFuel("HTPB");
    assert(htpb.has_value());
    assert(std::abs(htpb->density - 920.0) < 1e-9);
    std::cout << "✓ Hybrid fuel lookup: " << htpb->name << std::endl;

    auto apcp = findSolidPropellant("apcp");
    assert(apcp.has_value());
    assert(!findSolidPropellant("unobtainium").has_value());
    std::cout << "✓ Solid propellant lookup: " << apcp->name << std::endl;

    // Nozzle relations
    double cstar = nozzle::characteristicVelocity(1.25, 415.0, 3200.0);
    assert(cstar > 1700.0 && cstar < 1800.0);
    std::cout << "✓ Characteristic velocity: " << cstar << " m/s" << std::endl;

    double eps = nozzle::optimumExpansionRatio(20e5, 101325.0, 1.25);
    double pe = nozzle::exitPressureRatio(eps, 1.25) * 20e5;
    assert(std::abs(pe - 101325.0) / 101325.0 < 1e-4);
    std::cout << "✓ Optimum expansion ratio: " << eps << std::endl;

    // Default configuration validates and solves
    ValidatedConfiguration validated = validate(RawMotorConfiguration());
    MotorPerformance perf = solve(validated.configuration);
    assert(std::abs(perf.thrust - 1000.0) < 1.0);
    assert(std::abs(perf.chamber_pressure - 20e5) < 20.0);
    assert(perf.specific_impulse > 150.0 && perf.specific_impulse < 250.0);
    std::cout << "✓ Default hybrid: Isp " << perf.specific_impulse << " s, O/F " << perf.of_ratio << std::endl;

    // Tank pressure below chamber pressure is rejected
    RawMotorConfiguration raw;
    raw.tank_pressure = 19e5;
    bool rejected = false;
    try {
        validate(raw);
    } catch (const ValidationError& e) {
        rejected = e.hasViolation(ConstraintType::TANK_PRESSURE);
    }
    assert(rejected);
    std::cout << "✓ Tank pressure below chamber pressure rejected" << std::endl;

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
