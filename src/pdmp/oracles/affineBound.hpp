#ifndef PDMP_AFFINE_BOUND_HPP
#define PDMP_AFFINE_BOUND_HPP

#include <cmath>
#include <limits>

namespace pdmp::oracles {

/**
 * @brief Intensity majorant g(t) = c0 + c1 t, c0 >= 0, c1 >= 0.
 */
struct AffineBound {
    double c0 = 0.0;
    double c1 = 0.0;

    double rate(double t) const { return c0 + c1 * t; }

    /// integral of g over [0, t]
    double cumulative(double t) const { return c0 * t + 0.5 * c1 * t * t; }

    /// Same bound seen from time t on.
    AffineBound shifted(double t) const { return AffineBound{c0 + c1 * t, c1}; }

    /**
     * @brief Positive root s of cumulative(s) = e.
     *
     * Uses 2e / (c0 + sqrt(c0^2 + 2 c1 e)), which equals the quadratic-formula
     * root without its cancellation and reduces to e / c0 when c1 = 0.
     * Returns infinity when the bound is identically zero.
     */
    double invert(double e) const
    {
        const double den = c0 + std::sqrt(c0 * c0 + 2.0 * c1 * e);
        if (!(den > 0.0))
            return std::numeric_limits<double>::infinity();
        return 2.0 * e / den;
    }
};

} // namespace pdmp::oracles

#endif // PDMP_AFFINE_BOUND_HPP
