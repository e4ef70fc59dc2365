#ifndef PDMP_BOUNCY_PARTICLE_SAMPLER_TPP
#define PDMP_BOUNCY_PARTICLE_SAMPLER_TPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace pdmp::engine {

template <std::size_t dim>
BouncyParticleSampler<dim>::BouncyParticleSampler(const domains::Domain<dim>& d,
                                                  const targets::Target<dim>& target,
                                                  const SimulationConfig<dim>& config,
                                                  const oracles::ThinningConfig& thinning)
    : BouncyParticleSampler(d, config,
                            std::make_unique<oracles::ThinningOracle<dim>>(target, thinning))
{}

template <std::size_t dim>
BouncyParticleSampler<dim>::BouncyParticleSampler(const domains::Domain<dim>& d,
                                                  const SimulationConfig<dim>& config,
                                                  std::unique_ptr<oracles::EventTimeOracle<dim>> event_oracle)
    : domain(d)
    , cfg(config)
    , oracle(std::move(event_oracle))
{
    validate();
}

template <std::size_t dim>
void BouncyParticleSampler<dim>::validate() const
{
    if (!oracle)
        throw std::invalid_argument("BouncyParticleSampler: an event-time oracle is required.");
    cfg.validate();
    if (!domain.isInside(cfg.x0))
        throw std::invalid_argument("BouncyParticleSampler: x0 is outside the domain.");
}

template <std::size_t dim>
geom::Point<dim> BouncyParticleSampler<dim>::drawVelocity(std::mt19937& rng)
{
    geom::Point<dim> v;
    double nn = 0.0;
    do {
        for (std::size_t i = 0; i < dim; ++i)
            v[i] = normal(rng);
        nn = geom::squaredNorm(v);
    } while (!(nn > 0.0));

    if (cfg.refresh_distribution == RefreshDistribution::UnitSphere)
        v *= 1.0 / std::sqrt(nn);
    return v;
}

template <std::size_t dim>
Path<dim> BouncyParticleSampler<dim>::run(std::mt19937& rng)
{
    const auto start = std::chrono::high_resolution_clock::now();
    constexpr double inf = std::numeric_limits<double>::infinity();

    Diagnostics diag;
    Path<dim> path(cfg.x0);

    geom::Point<dim> x = cfg.x0;
    geom::Point<dim> v = cfg.v0;
    double elapsed = 0.0;

    std::exponential_distribution<double> refresh_clock(cfg.refresh_rate > 0.0 ? cfg.refresh_rate : 1.0);
    normal.reset();

    diag.gradient_evaluations = oracle->prepare(x);

    // move along the current ray, recording the segment
    auto advance = [&](double dt) {
        if (dt > 0.0) {
            path.append(Segment<dim>{elapsed, elapsed + dt, x, v});
            x = geom::moveAlong(x, v, dt);
            elapsed += dt;
        }
    };

    auto notify = [&](EventKind kind, std::size_t face, const geom::Point<dim>& v_before) {
        if (callback)
            callback(StepEvent<dim>{kind, elapsed, face, x, v_before, v});
    };

    while (elapsed < cfg.max_time && diag.gradient_evaluations < cfg.max_gradient_evaluations) {
        ++diag.iterations;

        const double t_horizon = cfg.max_time - elapsed;
        const std::optional<domains::BoundaryHit> hit = domain.nextBoundary(x, v, t_horizon);
        const double t_boundary = hit ? hit->time : inf;
        const double t_refresh = (cfg.refresh_rate > 0.0) ? refresh_clock(rng) : inf;
        const double horizon = std::min({t_boundary, t_refresh, t_horizon});

        const std::size_t budget = cfg.max_gradient_evaluations - diag.gradient_evaluations;
        const oracles::EventCandidate<dim> cand = oracle->nextEvent(x, v, horizon, budget, rng);
        diag.gradient_evaluations += cand.gradient_evaluations;

        if (cand.budget_exhausted) {
            advance(cand.time);
            break;
        }

        if (!cand.occurred && std::isinf(horizon)) {
            throw std::runtime_error(
                "BouncyParticleSampler: the particle would move forever without an event "
                "(improper target along the current direction?)");
        }

        const geom::Point<dim> v_before = v;

        if (hit && t_boundary <= cand.time && t_boundary <= t_refresh && t_boundary <= t_horizon) {
            advance(t_boundary);
            x = domain.projectOntoFace(hit->face, x);
            v = domain.reflect(hit->face, v);
            ++diag.boundary_hits;
            notify(EventKind::Boundary, hit->face, v_before);
        } else if (cand.occurred && cand.time <= t_refresh && cand.time <= t_horizon) {
            advance(cand.time);
            v = geom::reflect(v, cand.gradient);
            oracle->onTargetEvent(x, cand.gradient);
            ++diag.bounces;
            notify(EventKind::TargetEvent, 0, v_before);
        } else if (t_refresh <= t_horizon) {
            advance(t_refresh);
            v = drawVelocity(rng);
            ++diag.refreshments;
            notify(EventKind::Refresh, 0, v_before);
        } else {
            // last segment ends exactly at max_time
            if (t_horizon > 0.0) {
                path.append(Segment<dim>{elapsed, cfg.max_time, x, v});
                x = geom::moveAlong(x, v, t_horizon);
            }
            elapsed = cfg.max_time;
        }
    }

    diag.simulated_time = path.totalTime();
    const auto stop = std::chrono::high_resolution_clock::now();
    diag.wall_clock_seconds = std::chrono::duration<double>(stop - start).count();

    path.freeze(diag);
    return path;
}

} // namespace pdmp::engine

#endif // PDMP_BOUNCY_PARTICLE_SAMPLER_TPP
