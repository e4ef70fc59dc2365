#ifndef PDMP_PATH_TPP
#define PDMP_PATH_TPP

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pdmp {

namespace detail {
constexpr double kContiguityTolerance = 1e-9;
}

template <std::size_t dim>
Path<dim>::Path(const geom::Point<dim>& origin)
    : start(origin)
{}

template <std::size_t dim>
void Path<dim>::append(const Segment<dim>& s)
{
    if (is_frozen)
        throw std::logic_error("Path: cannot append to a frozen path.");
    if (!(s.t_end >= s.t_start))
        throw std::logic_error("Path: segment has negative duration.");

    if (segs.empty()) {
        if (std::abs(s.t_start) > detail::kContiguityTolerance)
            throw std::logic_error("Path: the first segment must start at time 0.");
        start = s.x_start;
    } else {
        const Segment<dim>& last = segs.back();
        const double scale = 1.0 + std::abs(last.t_end);
        if (std::abs(s.t_start - last.t_end) > detail::kContiguityTolerance * scale)
            throw std::logic_error("Path: segment at t=" + std::to_string(s.t_start) +
                                   " does not continue the path ending at t=" + std::to_string(last.t_end));
        const geom::Point<dim> gap = s.x_start - last.endPoint();
        if (geom::norm(gap) > detail::kContiguityTolerance * (1.0 + geom::norm(s.x_start)))
            throw std::logic_error("Path: segment does not start at the previous end point.");
    }
    segs.push_back(s);
}

template <std::size_t dim>
void Path<dim>::freeze(const Diagnostics& d)
{
    diag = d;
    is_frozen = true;
}

template <std::size_t dim>
std::size_t Path<dim>::segmentIndex(double t) const
{
    if (segs.empty() || t < 0.0 || t > totalTime())
        throw std::out_of_range("Path: time " + std::to_string(t) + " outside [0, " +
                                std::to_string(totalTime()) + "].");

    auto it = std::upper_bound(segs.begin(), segs.end(), t,
                               [](double value, const Segment<dim>& s) { return value < s.t_end; });
    if (it == segs.end())
        return segs.size() - 1;
    return static_cast<std::size_t>(it - segs.begin());
}

template <std::size_t dim>
geom::Point<dim> Path<dim>::positionAt(double t) const
{
    if (segs.empty() && t == 0.0)
        return start;
    return segs[segmentIndex(t)].positionAt(t);
}

} // namespace pdmp

#endif // PDMP_PATH_TPP
