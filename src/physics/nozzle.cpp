#include "nozzle.hpp"
#include "errors.hpp"
#include "core/root_finding.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace motor_design {
namespace nozzle {

namespace {
    constexpr double kMaxExitMach = 50.0;
    constexpr double kMinSubsonicMach = 1e-8;
    constexpr double kMaxExpansionRatio = 1e4;
    constexpr double kConicalHalfAngle = 15.0 * constants::kPi / 180.0;
}

double gammaFunction(double gamma) {
    return std::sqrt(gamma) * std::pow(2.0 / (gamma + 1.0), (gamma + 1.0) / (2.0 * (gamma - 1.0)));
}

double characteristicVelocity(double gamma, double gas_constant, double chamber_temperature) {
    // c* = sqrt(γRT) / (γ·sqrt((2/(γ+1))^((γ+1)/(γ-1)))), identical to sqrt(RT)/Γ
    return std::sqrt(gas_constant * chamber_temperature) / gammaFunction(gamma);
}

double throatMassFlow(double chamber_pressure, double throat_area, double characteristic_velocity) {
    return chamber_pressure * throat_area / characteristic_velocity;
}

double criticalPressureRatio(double gamma) {
    return std::pow(2.0 / (gamma + 1.0), gamma / (gamma - 1.0));
}

double areaRatioFromMach(double mach, double gamma) {
    double term = (2.0 / (gamma + 1.0)) * (1.0 + 0.5 * (gamma - 1.0) * mach * mach);
    return std::pow(term, (gamma + 1.0) / (2.0 * (gamma - 1.0))) / mach;
}

double pressureRatioFromMach(double mach, double gamma) {
    return std::pow(1.0 + 0.5 * (gamma - 1.0) * mach * mach, -gamma / (gamma - 1.0));
}

double supersonicMach(double area_ratio, double gamma) {
    if (!(area_ratio >= 1.0)) {
        throw InfeasibleDesignError(fmt::format("expansion ratio {:.4f} is below 1", area_ratio));
    }
    if (area_ratio == 1.0) return 1.0;

    auto residual = [&](double mach) {
        return areaRatioFromMach(mach, gamma) / area_ratio - 1.0;
    };
    auto result = core::bisect(residual, 1.0, kMaxExitMach,
                               constants::kSolverMaxIterations, constants::kSolverTolerance);
    if (!result.bracketed || !result.converged) {
        throw InfeasibleDesignError(fmt::format(
            "no supersonic solution for expansion ratio {:.4f} (gamma {:.4f})", area_ratio, gamma));
    }
    return result.root;
}

double subsonicMach(double area_ratio, double gamma) {
    if (!(area_ratio >= 1.0)) {
        throw InfeasibleDesignError(fmt::format("contraction ratio {:.4f} is below 1", area_ratio));
    }
    if (area_ratio == 1.0) return 1.0;

    // Chamber Mach is small; search ln(M) so the tolerance is relative to M
    auto residual = [&](double log_mach) {
        return std::log(areaRatioFromMach(std::exp(log_mach), gamma) / area_ratio);
    };
    auto result = core::bisect(residual, std::log(kMinSubsonicMach), 0.0,
                               constants::kSolverMaxIterations, constants::kSolverTolerance);
    if (!result.bracketed || !result.converged) {
        throw InfeasibleDesignError(fmt::format(
            "no subsonic solution for contraction ratio {:.4f} (gamma {:.4f})", area_ratio, gamma));
    }
    return std::exp(result.root);
}

double exitPressureRatio(double expansion_ratio, double gamma) {
    return pressureRatioFromMach(supersonicMach(expansion_ratio, gamma), gamma);
}

double optimumExpansionRatio(double chamber_pressure, double ambient_pressure, double gamma) {
    if (!(ambient_pressure > 0.0) || !(chamber_pressure > ambient_pressure)) {
        throw InfeasibleDesignError(fmt::format(
            "cannot match exit pressure: Pc = {:.0f} Pa, Pa = {:.0f} Pa", chamber_pressure, ambient_pressure));
    }
    const double target = ambient_pressure / chamber_pressure;
    if (target >= criticalPressureRatio(gamma)) {
        throw InfeasibleDesignError(fmt::format(
            "ambient/chamber pressure ratio {:.4f} does not choke the throat", target));
    }

    // Work in ln(ε) so the tolerance acts as a relative one on ε
    auto residual = [&](double log_eps) {
        return std::log(exitPressureRatio(std::exp(log_eps), gamma) / target);
    };
    auto result = core::bisect(residual, 0.0, std::log(kMaxExpansionRatio),
                               constants::kSolverMaxIterations, constants::kSolverTolerance);
    if (!result.bracketed) {
        throw InfeasibleDesignError(fmt::format(
            "optimum expansion ratio exceeds {:.0f} for Pa/Pc = {:.3e}", kMaxExpansionRatio, target));
    }
    if (!result.converged) {
        throw InfeasibleDesignError("optimum expansion ratio search did not converge");
    }
    return std::exp(result.root);
}

double exitVelocity(double gamma, double gas_constant, double chamber_temperature, double pressure_ratio) {
    double expansion = 1.0 - std::pow(pressure_ratio, (gamma - 1.0) / gamma);
    return std::sqrt(2.0 * gamma / (gamma - 1.0) * gas_constant * chamber_temperature * expansion);
}

double idealThrustCoefficient(double gamma, double exit_pressure_ratio,
                              double ambient_pressure_ratio, double expansion_ratio) {
    double momentum = 2.0 * gamma * gamma / (gamma - 1.0)
                    * std::pow(2.0 / (gamma + 1.0), (gamma + 1.0) / (gamma - 1.0))
                    * (1.0 - std::pow(exit_pressure_ratio, (gamma - 1.0) / gamma));
    return std::sqrt(momentum) + (exit_pressure_ratio - ambient_pressure_ratio) * expansion_ratio;
}

double nozzleEfficiency(NozzleType type) {
    switch (type) {
        case NozzleType::BELL: return 0.985;
        case NozzleType::PARABOLIC: return 0.975;
        case NozzleType::CONICAL: return 0.955;
        default: return 0.955;
    }
}

double divergentLength(double throat_diameter, double exit_diameter, NozzleType type) {
    double cone = 0.5 * std::max(0.0, exit_diameter - throat_diameter) / std::tan(kConicalHalfAngle);
    switch (type) {
        case NozzleType::BELL: return 0.8 * cone;
        case NozzleType::PARABOLIC: return 0.9 * cone;
        default: return cone;
    }
}

double rayleighStagnationRatio(double mach, double gamma) {
    double m2 = mach * mach;
    return std::pow(1.0 + 0.5 * (gamma - 1.0) * m2, gamma / (gamma - 1.0)) / (1.0 + gamma * m2);
}

} // namespace nozzle
} // namespace motor_design
