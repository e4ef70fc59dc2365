#ifndef PDMP_PATH_ANALYTICS_TPP
#define PDMP_PATH_ANALYTICS_TPP

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace pdmp::analytics {

template <std::size_t dim>
std::vector<geom::Point<dim>> sample(const Path<dim>& path, const std::vector<double>& times)
{
    std::vector<geom::Point<dim>> out;
    out.reserve(times.size());
    if (times.empty())
        return out;

    const double T = path.totalTime();
    if (times.front() < 0.0 || times.back() > T)
        throw std::invalid_argument("sample: requested times must lie in [0, " + std::to_string(T) + "].");

    const auto& segs = path.segments();
    std::size_t k = 0;
    double previous = times.front();
    for (double t : times) {
        if (t < previous)
            throw std::invalid_argument("sample: requested times must be non-decreasing.");
        previous = t;

        if (segs.empty()) {
            out.push_back(path.origin());
            continue;
        }
        while (k + 1 < segs.size() && t >= segs[k].t_end)
            ++k;
        out.push_back(segs[k].positionAt(t));
    }
    return out;
}

template <std::size_t dim>
geom::Point<dim> mean(const Path<dim>& path)
{
    const double T = path.totalTime();
    if (!(T > 0.0))
        throw std::invalid_argument("mean: the path has zero duration.");

    geom::Point<dim> acc;
    for (const auto& s : path.segments()) {
        const double tau = s.duration();
        // ∫_0^tau (x + v u) du = x tau + v tau^2 / 2
        for (std::size_t i = 0; i < dim; ++i)
            acc[i] += s.x_start[i] * tau + 0.5 * s.v[i] * tau * tau;
    }
    acc *= 1.0 / T;
    return acc;
}

template <std::size_t dim>
geom::Point<dim> variance(const Path<dim>& path)
{
    const geom::Point<dim> m = mean(path);

    geom::Point<dim> acc;
    for (const auto& s : path.segments()) {
        const double tau = s.duration();
        for (std::size_t i = 0; i < dim; ++i) {
            // ∫_0^tau (a + b u)^2 du with a centred on the mean
            const double a = s.x_start[i] - m[i];
            const double b = s.v[i];
            acc[i] += a * a * tau + a * b * tau * tau + b * b * tau * tau * tau / 3.0;
        }
    }
    acc *= 1.0 / path.totalTime();
    return acc;
}

template <std::size_t dim>
std::vector<geom::Point<dim>> discretize(const Path<dim>& path, std::size_t n)
{
    if (n == 0)
        throw std::invalid_argument("discretize: n must be > 0.");
    const double T = path.totalTime();
    if (!(T > 0.0))
        throw std::invalid_argument("discretize: the path has zero duration.");

    std::vector<double> grid(n);
    const double h = T / static_cast<double>(n);
    for (std::size_t k = 0; k < n; ++k)
        grid[k] = std::min(T, (static_cast<double>(k) + 0.5) * h);
    return sample(path, grid);
}

inline double effectiveSampleSize(const std::vector<double>& series)
{
    const std::size_t n = series.size();
    if (n < 4)
        throw std::invalid_argument("effectiveSampleSize: at least 4 values are required.");

    double m = 0.0;
    for (double x : series) m += x;
    m /= static_cast<double>(n);

    auto autocov = [&](std::size_t lag) {
        double s = 0.0;
        for (std::size_t i = 0; i + lag < n; ++i)
            s += (series[i] - m) * (series[i + lag] - m);
        return s / static_cast<double>(n);
    };

    const double c0 = autocov(0);
    if (!(c0 > 0.0))
        return std::numeric_limits<double>::quiet_NaN();

    // tau = -1 + 2 sum_m Gamma_m,  Gamma_m = rho_{2m} + rho_{2m+1}
    double tau = -1.0;
    double previous_pair = std::numeric_limits<double>::infinity();
    for (std::size_t lag = 0; lag + 1 < n; lag += 2) {
        double pair = (autocov(lag) + autocov(lag + 1)) / c0;
        if (!(pair > 0.0))
            break;
        pair = std::min(pair, previous_pair);
        tau += 2.0 * pair;
        previous_pair = pair;
    }

    const double nd = static_cast<double>(n);
    const double cap = nd * std::log10(nd);
    if (!(tau > 0.0))
        return cap;
    return std::min(nd / tau, cap);
}

template <std::size_t dim>
std::array<double, dim> effectiveSampleSize(const Path<dim>& path, std::size_t n_grid)
{
    const std::vector<geom::Point<dim>> grid = discretize(path, n_grid);

    std::array<double, dim> ess{};
    std::vector<double> series(grid.size());
    for (std::size_t i = 0; i < dim; ++i) {
        for (std::size_t k = 0; k < grid.size(); ++k)
            series[k] = grid[k][i];
        ess[i] = effectiveSampleSize(series);
    }
    return ess;
}

template <std::size_t dim>
geom::Point<dim> pooledMean(const std::vector<Path<dim>>& paths)
{
    geom::Point<dim> acc;
    double total = 0.0;
    for (const auto& p : paths) {
        const double T = p.totalTime();
        if (!(T > 0.0))
            continue;
        acc += T * mean(p);
        total += T;
    }
    if (!(total > 0.0))
        throw std::invalid_argument("pooledMean: no path with positive duration.");
    acc *= 1.0 / total;
    return acc;
}

} // namespace pdmp::analytics

#endif // PDMP_PATH_ANALYTICS_TPP
