/**
 * @file path.hpp
 * @brief Piecewise-linear skeleton of a PDMP trajectory.
 *
 * A path is an ordered list of segments (t_start, t_end, x_start, v) where the
 * position is x_start + (t - t_start) v on [t_start, t_end]. Segments are
 * contiguous in time and position. The engine appends to a path while it
 * runs and freezes it at termination; afterwards it is read-only.
 */

#ifndef PDMP_PATH_HPP
#define PDMP_PATH_HPP

#include "diagnostics.hpp"
#include "../geometry.hpp"

#include <cstddef>
#include <vector>

namespace pdmp {

template <std::size_t dim>
struct Segment {
    double t_start = 0.0;
    double t_end = 0.0;
    geom::Point<dim> x_start{};
    geom::Point<dim> v{};

    double duration() const { return t_end - t_start; }

    geom::Point<dim> positionAt(double t) const { return geom::moveAlong(x_start, v, t - t_start); }

    geom::Point<dim> endPoint() const { return positionAt(t_end); }
};

template <std::size_t dim>
class Path {
public:
    Path() = default;

    /// Empty path whose trajectory starts at `origin` at time 0.
    explicit Path(const geom::Point<dim>& origin);

    /**
     * @brief Append the next segment.
     * @throws std::logic_error if the path is frozen, or the segment does not
     *         start where the previous one ended, or has negative duration.
     */
    void append(const Segment<dim>& s);

    /// Ends the construction phase; further appends throw.
    void freeze(const Diagnostics& d);

    bool frozen() const { return is_frozen; }

    bool empty() const { return segs.empty(); }

    std::size_t size() const { return segs.size(); }

    const std::vector<Segment<dim>>& segments() const { return segs; }

    const Segment<dim>& operator[](std::size_t i) const { return segs[i]; }

    const Diagnostics& diagnostics() const { return diag; }

    /// End time of the last segment (0 for an empty path).
    double totalTime() const { return segs.empty() ? 0.0 : segs.back().t_end; }

    const geom::Point<dim>& origin() const { return start; }

    /// Position at the end of the path.
    geom::Point<dim> finalPosition() const { return segs.empty() ? start : segs.back().endPoint(); }

    /**
     * @brief Position at time t in [0, totalTime()].
     * @throws std::out_of_range outside that interval.
     */
    geom::Point<dim> positionAt(double t) const;

    /// Index of the segment containing t (the later one at a breakpoint).
    std::size_t segmentIndex(double t) const;

private:
    std::vector<Segment<dim>> segs;
    geom::Point<dim> start{};
    Diagnostics diag{};
    bool is_frozen = false;
};

} // namespace pdmp

#include "path.tpp"

#endif // PDMP_PATH_HPP
