#include "physics/core/root_finding.hpp"

#include <algorithm>
#include <cmath>

namespace motor_design {
namespace core {

RootResult bisect(
    const std::function<double(double)> &g,
    double a,
    double b,
    int max_iter,
    double tol
) {
    double ga = g(a);
    double gb = g(b);
    if (ga == 0.0) return {true, true, a, 0};
    if (gb == 0.0) return {true, true, b, 0};
    if (!std::isfinite(ga) || !std::isfinite(gb) || ga * gb > 0.0) {
        return {false, false, b, 0};
    }

    for (int i = 1; i <= max_iter; ++i) {
        double m = 0.5 * (a + b);
        double gm = g(m);
        if (!std::isfinite(gm)) {
            return {true, false, m, i};
        }
        if (std::abs(gm) < tol || 0.5 * (b - a) < tol * std::max(1.0, std::abs(m))) {
            return {true, true, m, i};
        }
        if (ga * gm <= 0.0) {
            b = m;
            gb = gm;
        } else {
            a = m;
            ga = gm;
        }
    }
    return {true, false, 0.5 * (a + b), max_iter};
}

} // namespace core
} // namespace motor_design
