#ifndef PDMP_THINNING_ORACLE_TPP
#define PDMP_THINNING_ORACLE_TPP

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pdmp::oracles {

template <std::size_t dim>
ThinningOracle<dim>::ThinningOracle(const targets::Target<dim>& t,
                                    const ThinningConfig& config)
    : target(t)
    , cfg(config)
{
    const double L = target.lipschitz();
    if (!(L >= 0.0) || !std::isfinite(L))
        throw std::invalid_argument("ThinningOracle: the target's Lipschitz constant must be finite and >= 0.");
    if (!(cfg.bound_tolerance >= 0.0))
        throw std::invalid_argument("ThinningOracle: bound_tolerance must be >= 0.");
}

template <std::size_t dim>
std::size_t ThinningOracle<dim>::prepare(const geom::Point<dim>& x0)
{
    x_ref = x0;
    g_ref = target.gradient(x0);
    events_since_anchor = 0;
    expo.reset();
    uni.reset();
    prepared = true;
    return 1;
}

template <std::size_t dim>
AffineBound ThinningOracle<dim>::boundAlong(const geom::Point<dim>& x,
                                            const geom::Point<dim>& v) const
{
    const double L = target.lipschitz();
    const double speed = geom::norm(v);
    const double drift = geom::norm(x - x_ref);

    AffineBound b;
    b.c0 = std::max(0.0, geom::dot(g_ref, v) + L * drift * speed);
    b.c1 = L * speed * speed;
    return b;
}

template <std::size_t dim>
EventCandidate<dim> ThinningOracle<dim>::nextEvent(const geom::Point<dim>& x,
                                                   const geom::Point<dim>& v,
                                                   double horizon,
                                                   std::size_t budget,
                                                   std::mt19937& rng)
{
    if (!prepared)
        throw std::logic_error("ThinningOracle: prepare() must be called before nextEvent().");

    const AffineBound bound = boundAlong(x, v);
    EventCandidate<dim> out;

    double t = 0.0;
    for (;;) {
        const double s = bound.shifted(t).invert(expo(rng));
        const double trial = t + s;

        // next candidate lies beyond anything the caller needs
        if (!std::isfinite(trial) || trial > horizon)
            return out;

        if (out.gradient_evaluations >= budget) {
            out.budget_exhausted = true;
            out.time = t;
            return out;
        }

        t = trial;
        const geom::Point<dim> grad = target.gradient(geom::moveAlong(x, v, t));
        ++out.gradient_evaluations;

        const double rate = std::max(0.0, geom::dot(grad, v));
        const double g = bound.rate(t);
        if (rate > g * (1.0 + cfg.bound_tolerance) + cfg.bound_tolerance)
            throw IntensityBoundViolation(rate, g, t);

        if (uni(rng) * g < rate) {
            out.time = t;
            out.occurred = true;
            out.gradient = grad;
            return out;
        }
    }
}

template <std::size_t dim>
void ThinningOracle<dim>::onTargetEvent(const geom::Point<dim>& x, const geom::Point<dim>& gradient)
{
    if (cfg.reanchor_every == 0)
        return;
    if (++events_since_anchor >= cfg.reanchor_every) {
        x_ref = x;
        g_ref = gradient;
        events_since_anchor = 0;
    }
}

} // namespace pdmp::oracles

#endif // PDMP_THINNING_ORACLE_TPP
