#ifndef PRD_GEOMETRY_ROOT_FINDER_HPP
#define PRD_GEOMETRY_ROOT_FINDER_HPP

#include <algorithm>
#include <cmath>

#include "constants.hpp"

namespace prd {

/**
 * @brief Outcome of a bracketed inversion.
 *
 * Never thrown; callers decide whether a failed inversion is fatal.
 */
struct RootResult {
    double value = 0.0;     // abscissa of the last midpoint
    bool converged = false;
    int iterations = 0;
    double lower = 0.0;     // last bracket
    double upper = 0.0;
    double residual = 0.0;  // f(value) - target
};

/**
 * @brief Solve f(x) = target for a continuous, non-decreasing f on [lower, upper] by bisection.
 *
 * Converges when |f(x) - target| <= max(rtol * |target|, atol), or when the bracket has
 * collapsed to adjacent doubles. A zero target converges at the lower bound when
 * f(lower) == 0.
 *
 * @param f Monotonic function of one variable.
 * @param target Value to invert.
 * @param lower Lower end of the bracket.
 * @param upper Upper end of the bracket.
 * @param rtol Relative tolerance on the function value.
 * @param max_iter Iteration cap.
 * @param atol Absolute floor on the tolerance, in units of f.
 */
template <typename Function>
RootResult bisect_increasing(const Function& f, double target, double lower, double upper,
                             double rtol = VOLUME_RTOL, int max_iter = MAX_BISECTION_ITERS, double atol = 0.0) {
    RootResult result;
    result.lower = lower;
    result.upper = upper;

    const double tol = std::max(rtol * std::abs(target), atol);

    // Bracket ends are accepted without iterating
    double f_lo = f(lower) - target;
    if (std::abs(f_lo) <= tol) {
        result.value = lower;
        result.residual = f_lo;
        result.converged = true;
        return result;
    }
    double f_hi = f(upper) - target;
    if (std::abs(f_hi) <= tol) {
        result.value = upper;
        result.residual = f_hi;
        result.converged = true;
        return result;
    }

    double lo = lower;
    double hi = upper;
    for (int iter = 1; iter <= max_iter; ++iter) {
        double mid = 0.5 * (lo + hi);
        double f_mid = f(mid) - target;

        result.value = mid;
        result.residual = f_mid;
        result.iterations = iter;

        if (std::abs(f_mid) <= tol) {
            result.converged = true;
            break;
        }
        if (mid <= lo || mid >= hi) {
            // adjacent doubles: the root is resolved to machine precision
            result.converged = true;
            break;
        }

        if (f_mid < 0.0) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    result.lower = lo;
    result.upper = hi;
    return result;
}

} // namespace prd

#endif // PRD_GEOMETRY_ROOT_FINDER_HPP
