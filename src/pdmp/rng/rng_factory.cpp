/**
 * @file rng_factory.cpp
 * @brief seed_seq based stream derivation.
 */

#include "rng_factory.hpp"

namespace pdmp::rng {

std::mt19937 make_engine(std::uint64_t stream_id)
{
    return make_engine_with_seed(std::optional<std::uint32_t>{kDefaultSeed}, stream_id);
}

std::mt19937 make_engine_with_seed(std::optional<std::uint32_t> seed,
                                   std::uint64_t stream_id)
{
    std::uint32_t master = 0;
    if (seed) {
        master = *seed;
    } else {
        std::random_device rd;
        master = rd();
    }

    // Split the 64-bit stream id so distinct high words give distinct streams.
    std::seed_seq seq{
        master,
        static_cast<std::uint32_t>(stream_id & 0xffffffffULL),
        static_cast<std::uint32_t>(stream_id >> 32)
    };
    return std::mt19937(seq);
}

} // namespace pdmp::rng
