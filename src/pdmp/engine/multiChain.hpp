/**
 * @file multiChain.hpp
 * @brief Independent chains run concurrently with OpenMP.
 *
 * Chain i owns its sampler, oracle, path and random engine
 * (rng::make_engine_with_seed(seed, i)); only the domain and the target are
 * shared, through their const interfaces. Results do not depend on the
 * number of threads or on scheduling.
 */

#ifndef PDMP_MULTI_CHAIN_HPP
#define PDMP_MULTI_CHAIN_HPP

#include "bouncyParticleSampler.hpp"
#include "../path/diagnostics.hpp"

#include <cstdint>
#include <vector>

namespace pdmp::engine {

/**
 * @brief Run one chain per configuration.
 * @param configs One configuration per chain (each validated).
 * @param seed Master seed shared by all chains.
 * @return Paths in the order of configs.
 * @throws The first exception raised by any chain, after all chains finished.
 */
template <std::size_t dim>
std::vector<Path<dim>> runChains(const domains::Domain<dim>& domain,
                                 const targets::Target<dim>& target,
                                 const std::vector<SimulationConfig<dim>>& configs,
                                 std::uint32_t seed,
                                 const oracles::ThinningConfig& thinning = oracles::ThinningConfig{});

/// Counters summed over chains.
template <std::size_t dim>
Diagnostics combinedDiagnostics(const std::vector<Path<dim>>& paths);

} // namespace pdmp::engine

#include "multiChain.tpp"

#endif // PDMP_MULTI_CHAIN_HPP
