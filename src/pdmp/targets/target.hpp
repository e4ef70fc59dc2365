#ifndef PDMP_TARGET_HPP
#define PDMP_TARGET_HPP

#include <cstddef>

#include "../geometry.hpp"

namespace pdmp::targets {

/**
 * @brief Target density pi(x) ∝ exp(-U(x)) seen by the sampler.
 * @tparam dim Dimensionality.
 *
 * Implementations must be safe to call concurrently through the const
 * interface (independent chains share one target).
 */
template <std::size_t dim>
class Target
{
public:
    virtual ~Target() = default;

    // Gradient of the potential U = -log pi at x
    virtual geom::Point<dim> gradient(const geom::Point<dim>& x) const = 0;

    // log pi(x) up to an additive constant
    virtual double logDensity(const geom::Point<dim>& x) const = 0;

    // L such that |grad U(x) - grad U(y)| <= L |x - y| for all x, y
    virtual double lipschitz() const = 0;
};

} // namespace pdmp::targets

#endif // PDMP_TARGET_HPP
