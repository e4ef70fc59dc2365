/**
 * @file thinningOracle.hpp
 * @brief Event times of the bouncy particle intensity by Poisson thinning.
 *
 * Along a ray x + t v the event intensity is
 *   lambda(t) = max(0, grad U(x + t v) · v).
 * With a reference point x_ref whose exact gradient g_ref is cached (the
 * control variate) and a Lipschitz constant L for grad U:
 *   lambda(t) <= g(t) = max(0, g_ref·v + L |x - x_ref| |v|) + L |v|^2 t.
 *
 * Candidate times are drawn from the Poisson process of rate g by inverting
 * its cumulative intensity, then accepted with probability lambda/g. Every
 * trial costs one gradient evaluation. A rejected trial restarts thinning
 * from the trial time with the same bound.
 *
 * Reference policy: the reference is anchored at x0 by prepare() and moved to
 * the event point after every `reanchor_every` accepted events (the gradient
 * there is already known, so re-anchoring is free). reanchor_every = 0 keeps
 * x0 as the reference for the whole run.
 */

#ifndef PDMP_THINNING_ORACLE_HPP
#define PDMP_THINNING_ORACLE_HPP

#include "eventTimeOracle.hpp"
#include "affineBound.hpp"
#include "../targets/target.hpp"

#include <cstddef>
#include <random>

namespace pdmp::oracles {

struct ThinningConfig {
    std::size_t reanchor_every = 1;   // 0: never move the reference point
    double bound_tolerance = 1e-9;    // relative slack before a bound violation is reported
};

template <std::size_t dim>
class ThinningOracle : public EventTimeOracle<dim> {
public:
    explicit ThinningOracle(const targets::Target<dim>& t,
                            const ThinningConfig& config = ThinningConfig{});

    std::size_t prepare(const geom::Point<dim>& x0) override;

    /**
     * @throws IntensityBoundViolation if lambda(t) > g(t) at a trial.
     * @throws std::logic_error if prepare() was not called.
     */
    EventCandidate<dim> nextEvent(const geom::Point<dim>& x,
                                  const geom::Point<dim>& v,
                                  double horizon,
                                  std::size_t budget,
                                  std::mt19937& rng) override;

    void onTargetEvent(const geom::Point<dim>& x, const geom::Point<dim>& gradient) override;

    /// Majorant along x + t v for the current reference point.
    AffineBound boundAlong(const geom::Point<dim>& x, const geom::Point<dim>& v) const;

    const geom::Point<dim>& referencePoint() const { return x_ref; }

private:
    const targets::Target<dim>& target;
    ThinningConfig cfg;

    bool prepared = false;
    geom::Point<dim> x_ref{};
    geom::Point<dim> g_ref{};
    std::size_t events_since_anchor = 0;

    std::exponential_distribution<double> expo{1.0};
    std::uniform_real_distribution<double> uni{0.0, 1.0};
};

} // namespace pdmp::oracles

#include "thinningOracle.tpp"

#endif // PDMP_THINNING_ORACLE_HPP
