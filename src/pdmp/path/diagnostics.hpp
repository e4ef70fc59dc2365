/**
 * @file diagnostics.hpp
 * @brief Counters reported by a finished run.
 */

#ifndef PDMP_DIAGNOSTICS_HPP
#define PDMP_DIAGNOSTICS_HPP

#include <cstddef>
#include <iosfwd>

namespace pdmp {

struct Diagnostics {
    /** Specular reflections off domain faces. */
    std::size_t boundary_hits = 0;
    /** Accepted target events (gradient-driven bounces). */
    std::size_t bounces = 0;
    /** Velocity refreshments. */
    std::size_t refreshments = 0;
    /** Gradient evaluations, including rejected thinning trials and setup. */
    std::size_t gradient_evaluations = 0;
    /** Loop iterations of the simulation engine. */
    std::size_t iterations = 0;
    /** Total simulated (continuous) time. */
    double simulated_time = 0.0;
    /** Wall-clock duration of the run. */
    double wall_clock_seconds = 0.0;

    /// Sum of per-chain counters; times add up too.
    Diagnostics& operator+=(const Diagnostics& other);
};

/// One "name: value" line per field.
std::ostream& operator<<(std::ostream& os, const Diagnostics& d);

} // namespace pdmp

#endif // PDMP_DIAGNOSTICS_HPP
