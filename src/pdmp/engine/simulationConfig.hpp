/**
 * @file simulationConfig.hpp
 * @brief Run configuration of a single PDMP chain.
 */

#ifndef PDMP_SIMULATION_CONFIG_HPP
#define PDMP_SIMULATION_CONFIG_HPP

#include "../geometry.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace pdmp::engine {

/// No limit on gradient evaluations.
constexpr std::size_t kUnlimited = std::numeric_limits<std::size_t>::max();

/// Distribution new velocities are drawn from at a refreshment.
enum class RefreshDistribution {
    UnitSphere,   // uniform direction, |v| = 1
    Gaussian      // standard normal components
};

template <std::size_t dim>
struct SimulationConfig {
    /** Initial position, must be feasible. */
    geom::Point<dim> x0{};
    /** Initial velocity, non-zero. */
    geom::Point<dim> v0{};
    /** Maximum simulated time T (may be infinite). */
    double max_time = std::numeric_limits<double>::infinity();
    /** Maximum number of gradient evaluations (may be kUnlimited, not together with T = inf). */
    std::size_t max_gradient_evaluations = kUnlimited;
    /** Rate of the homogeneous refreshment process; 0 disables it. */
    double refresh_rate = 1.0;
    RefreshDistribution refresh_distribution = RefreshDistribution::UnitSphere;

    /**
     * @brief Check everything that does not need the domain.
     * @throws std::invalid_argument on an unusable configuration.
     */
    void validate() const
    {
        if (!geom::isFinite(x0))
            throw std::invalid_argument("SimulationConfig: x0 must be finite.");
        if (!geom::isFinite(v0) || !(geom::squaredNorm(v0) > 0.0))
            throw std::invalid_argument("SimulationConfig: v0 must be finite and non-zero.");
        if (std::isnan(max_time) || !(max_time > 0.0))
            throw std::invalid_argument("SimulationConfig: max_time must be > 0.");
        if (max_gradient_evaluations == 0)
            throw std::invalid_argument("SimulationConfig: max_gradient_evaluations must be > 0.");
        if (std::isinf(max_time) && max_gradient_evaluations == kUnlimited)
            throw std::invalid_argument(
                "SimulationConfig: max_time and max_gradient_evaluations cannot both be unlimited.");
        if (!(refresh_rate >= 0.0) || !std::isfinite(refresh_rate))
            throw std::invalid_argument("SimulationConfig: refresh_rate must be finite and >= 0.");
    }
};

} // namespace pdmp::engine

#endif // PDMP_SIMULATION_CONFIG_HPP
