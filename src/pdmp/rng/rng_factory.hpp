/**
 * @file rng_factory.hpp
 * @brief Deterministic random engine factory.
 *
 * Every chain owns its engine; no engine or seed is shared between chains.
 * A (seed, stream id) pair always yields the same engine, independently of
 * thread scheduling.
 */

#ifndef PDMP_RNG_FACTORY_HPP
#define PDMP_RNG_FACTORY_HPP

#include <cstdint>
#include <optional>
#include <random>

namespace pdmp::rng {

/// Seed used when the caller does not provide one.
constexpr std::uint32_t kDefaultSeed = 12345u;

/**
 * @brief Engine for a given stream, seeded from kDefaultSeed.
 * @param stream_id Stream identifier (chain index, thread id, ...).
 */
std::mt19937 make_engine(std::uint64_t stream_id);

/**
 * @brief Engine for a given stream and seed.
 * @param seed Master seed; std::nullopt draws one from std::random_device.
 * @param stream_id Stream identifier.
 */
std::mt19937 make_engine_with_seed(std::optional<std::uint32_t> seed,
                                   std::uint64_t stream_id);

} // namespace pdmp::rng

#endif // PDMP_RNG_FACTORY_HPP
