#include "diagnostics.hpp"

#include <iomanip>
#include <ostream>

namespace pdmp {

Diagnostics& Diagnostics::operator+=(const Diagnostics& other)
{
    boundary_hits        += other.boundary_hits;
    bounces              += other.bounces;
    refreshments         += other.refreshments;
    gradient_evaluations += other.gradient_evaluations;
    iterations           += other.iterations;
    simulated_time       += other.simulated_time;
    wall_clock_seconds   += other.wall_clock_seconds;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Diagnostics& d)
{
    os << std::left
       << std::setw(22) << "boundary_hits"        << ": " << d.boundary_hits << '\n'
       << std::setw(22) << "bounces"              << ": " << d.bounces << '\n'
       << std::setw(22) << "refreshments"         << ": " << d.refreshments << '\n'
       << std::setw(22) << "gradient_evaluations" << ": " << d.gradient_evaluations << '\n'
       << std::setw(22) << "iterations"           << ": " << d.iterations << '\n'
       << std::setw(22) << "simulated_time"       << ": " << d.simulated_time << '\n'
       << std::setw(22) << "wall_clock_seconds"   << ": " << d.wall_clock_seconds << '\n'
       << std::right;
    return os;
}

} // namespace pdmp
