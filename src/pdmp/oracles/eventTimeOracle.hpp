/**
 * @file eventTimeOracle.hpp
 * @brief Interface for drawing the next target-driven event time along a ray.
 *
 * The oracle is selected when the sampler is built; the engine only talks to
 * it through this interface. An oracle carries per-run state (e.g. a
 * reference point), so each chain owns its own instance.
 */

#ifndef PDMP_EVENT_TIME_ORACLE_HPP
#define PDMP_EVENT_TIME_ORACLE_HPP

#include "../geometry.hpp"

#include <cstddef>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

namespace pdmp::oracles {

/**
 * @brief Observed event intensity exceeded the supplied majorant.
 *
 * Means the target's Lipschitz constant (or another bound input) is wrong.
 * Fatal: the run cannot be trusted and is never retried.
 */
class IntensityBoundViolation : public std::runtime_error {
public:
    IntensityBoundViolation(double observed, double bound, double time)
        : std::runtime_error("Event intensity " + std::to_string(observed) +
                             " exceeds its bound " + std::to_string(bound) +
                             " at ray time " + std::to_string(time) +
                             " (invalid Lipschitz constant?)")
        , observed_rate(observed)
        , bound_rate(bound)
    {}

    double observed() const noexcept { return observed_rate; }
    double bound() const noexcept { return bound_rate; }

private:
    double observed_rate;
    double bound_rate;
};

/**
 * @brief Result of one oracle query.
 * @tparam dim Dimensionality.
 */
template <std::size_t dim>
struct EventCandidate {
    /** Ray time of the event; infinity when none occurs before the horizon. */
    double time = std::numeric_limits<double>::infinity();
    /** True if a target event was accepted at `time`. */
    bool occurred = false;
    /** Gradient of U at the event point (valid when occurred). */
    geom::Point<dim> gradient{};
    /** Gradient evaluations spent by this query. */
    std::size_t gradient_evaluations = 0;
    /** The evaluation budget ran out; `time` is the last trial time. */
    bool budget_exhausted = false;
};

template <std::size_t dim>
class EventTimeOracle {
public:
    virtual ~EventTimeOracle() = default;

    /**
     * @brief Reset per-run state for a chain starting at x0.
     * @return Number of gradient evaluations spent.
     */
    virtual std::size_t prepare(const geom::Point<dim>& x0) = 0;

    /**
     * @brief Next target event along x + t v.
     * @param horizon Events after this time are not needed (another event wins first).
     * @param budget Maximum gradient evaluations this query may spend.
     * @param rng Chain-owned random engine.
     */
    virtual EventCandidate<dim> nextEvent(const geom::Point<dim>& x,
                                          const geom::Point<dim>& v,
                                          double horizon,
                                          std::size_t budget,
                                          std::mt19937& rng) = 0;

    /// Called by the engine after it applied an accepted target event at x.
    virtual void onTargetEvent(const geom::Point<dim>& x, const geom::Point<dim>& gradient)
    {
        (void)x;
        (void)gradient;
    }
};

} // namespace pdmp::oracles

#endif // PDMP_EVENT_TIME_ORACLE_HPP
