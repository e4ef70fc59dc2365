#ifndef PDMP_MULTI_CHAIN_TPP
#define PDMP_MULTI_CHAIN_TPP

#include <exception>
#include <optional>

#include <omp.h>

#include "../rng/rng_factory.hpp"

namespace pdmp::engine {

template <std::size_t dim>
std::vector<Path<dim>> runChains(const domains::Domain<dim>& domain,
                                 const targets::Target<dim>& target,
                                 const std::vector<SimulationConfig<dim>>& configs,
                                 std::uint32_t seed,
                                 const oracles::ThinningConfig& thinning)
{
    const int n_chains = static_cast<int>(configs.size());
    std::vector<Path<dim>> paths(configs.size());
    std::vector<std::exception_ptr> errors(configs.size());

#pragma omp parallel for schedule(dynamic, 1)
    for (int c = 0; c < n_chains; ++c) {
        const auto idx = static_cast<std::size_t>(c);
        // exceptions must not leave the parallel region
        try {
            auto rng = rng::make_engine_with_seed(std::optional<std::uint32_t>{seed},
                                                  static_cast<std::uint64_t>(c));
            BouncyParticleSampler<dim> sampler(domain, target, configs[idx], thinning);
            paths[idx] = sampler.run(rng);
        } catch (...) {
            errors[idx] = std::current_exception();
        }
    }

    for (const auto& e : errors) {
        if (e)
            std::rethrow_exception(e);
    }
    return paths;
}

template <std::size_t dim>
Diagnostics combinedDiagnostics(const std::vector<Path<dim>>& paths)
{
    Diagnostics total;
    for (const auto& p : paths)
        total += p.diagnostics();
    return total;
}

} // namespace pdmp::engine

#endif // PDMP_MULTI_CHAIN_TPP
