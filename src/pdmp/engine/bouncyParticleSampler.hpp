/**
 * @file bouncyParticleSampler.hpp
 * @brief Bouncy particle sampler restricted to a convex domain.
 *
 * The particle moves in straight lines. Each iteration races three clocks:
 *   - the first boundary face on the ray (specular reflection),
 *   - the next target event from the event-time oracle (reflection across
 *     the level set of U: v - 2 (grad U·v / |grad U|^2) grad U),
 *   - an exponential refreshment clock (new velocity),
 * plus the remaining time budget. The earliest wins; ties go to the boundary,
 * then the target event, then the refreshment.
 *
 * The run stops when the simulated time reaches max_time or the gradient
 * evaluations reach max_gradient_evaluations.
 */

#ifndef PDMP_BOUNCY_PARTICLE_SAMPLER_HPP
#define PDMP_BOUNCY_PARTICLE_SAMPLER_HPP

#include "simulationConfig.hpp"
#include "../domains/domain.hpp"
#include "../targets/target.hpp"
#include "../oracles/eventTimeOracle.hpp"
#include "../oracles/thinningOracle.hpp"
#include "../path/path.hpp"
#include "../geometry.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <random>

namespace pdmp::engine {

enum class EventKind {
    Boundary,
    TargetEvent,
    Refresh
};

/**
 * @brief Transition applied by the engine, reported to the step callback.
 */
template <std::size_t dim>
struct StepEvent {
    EventKind kind = EventKind::Boundary;
    double time = 0.0;                 // simulation time of the event
    std::size_t face = 0;              // hit face (Boundary only)
    geom::Point<dim> position{};
    geom::Point<dim> velocity_before{};
    geom::Point<dim> velocity_after{};
};

template <std::size_t dim>
class BouncyParticleSampler {
public:
    using StepCallback = std::function<void(const StepEvent<dim>&)>;

    /**
     * @brief Sampler with a thinning oracle built on the target.
     * @throws std::invalid_argument if the configuration is invalid or x0 is infeasible.
     */
    BouncyParticleSampler(const domains::Domain<dim>& d,
                          const targets::Target<dim>& target,
                          const SimulationConfig<dim>& config,
                          const oracles::ThinningConfig& thinning = oracles::ThinningConfig{});

    /**
     * @brief Sampler with a caller-supplied event-time oracle.
     * @throws std::invalid_argument if the configuration is invalid, x0 is
     *         infeasible or the oracle is null.
     */
    BouncyParticleSampler(const domains::Domain<dim>& d,
                          const SimulationConfig<dim>& config,
                          std::unique_ptr<oracles::EventTimeOracle<dim>> event_oracle);

    /// Invoked after every boundary, target or refresh transition.
    void setCallback(StepCallback cb) { callback = std::move(cb); }

    /**
     * @brief Simulate one chain from config().x0.
     * @param rng Chain-owned engine.
     * @return Frozen path with its diagnostics.
     * @throws oracles::IntensityBoundViolation if the target's bound is wrong.
     * @throws std::runtime_error if the particle would travel forever without any event.
     */
    Path<dim> run(std::mt19937& rng);

    const SimulationConfig<dim>& config() const { return cfg; }

private:
    void validate() const;

    geom::Point<dim> drawVelocity(std::mt19937& rng);

    const domains::Domain<dim>& domain;
    SimulationConfig<dim> cfg;
    std::unique_ptr<oracles::EventTimeOracle<dim>> oracle;
    StepCallback callback;

    std::normal_distribution<double> normal{0.0, 1.0};
};

} // namespace pdmp::engine

#include "bouncyParticleSampler.tpp"

#endif // PDMP_BOUNCY_PARTICLE_SAMPLER_HPP
