#pragma once

#include <functional>

namespace motor_design {
namespace core {

// Outcome of a bracketed scalar root search.
struct RootResult {
    bool bracketed;     // g(a) and g(b) differ in sign (or one is zero)
    bool converged;     // |g| or half-interval fell below tolerance
    double root;
    int iterations;
};

// Find x in [a, b] where g(x) crosses zero by bisection.
// Stops when |g(x)| < tol or the half-interval is below tol * max(1, |x|).
RootResult bisect(
    const std::function<double(double)> &g,
    double a,
    double b,
    int max_iter = 1000,
    double tol = 1e-6
);

} // namespace core
} // namespace motor_design
