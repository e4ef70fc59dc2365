/**
 * @file pathAnalytics.hpp
 * @brief Estimators computed from a continuous-time path.
 *
 * Expectations under the target are time averages along the path:
 *   E[f] ≈ (1/T) ∫_0^T f(x(t)) dt.
 * For the mean and variance the integral is exact per segment since x(t) is
 * affine. Autocorrelation based quantities use a uniform time grid.
 */

#ifndef PDMP_PATH_ANALYTICS_HPP
#define PDMP_PATH_ANALYTICS_HPP

#include "path.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace pdmp::analytics {

/**
 * @brief Positions at the requested times.
 * @param times Non-decreasing times in [0, path.totalTime()].
 * @throws std::invalid_argument if times decrease or leave the path's time range.
 *
 * Pure: repeated calls with the same times return the same positions.
 */
template <std::size_t dim>
std::vector<geom::Point<dim>> sample(const Path<dim>& path, const std::vector<double>& times);

/**
 * @brief Time-weighted mean position (1/T) ∫ x(t) dt.
 * @throws std::invalid_argument for a path with zero total time.
 */
template <std::size_t dim>
geom::Point<dim> mean(const Path<dim>& path);

/// Time-weighted per-coordinate variance (1/T) ∫ (x(t) - mean)^2 dt.
template <std::size_t dim>
geom::Point<dim> variance(const Path<dim>& path);

/// Positions at the grid midpoints t_k = (k + 1/2) T / n, k = 0..n-1.
template <std::size_t dim>
std::vector<geom::Point<dim>> discretize(const Path<dim>& path, std::size_t n);

/**
 * @brief Effective sample size of a scalar series.
 *
 * Geyer's initial monotone positive sequence: pair sums of autocorrelations
 * are accumulated while positive and forced non-increasing. The result is
 * capped at n log10(n). Returns NaN for a constant series.
 * @throws std::invalid_argument if the series has fewer than 4 values.
 */
inline double effectiveSampleSize(const std::vector<double>& series);

/**
 * @brief Per-coordinate ESS of the path resampled on n_grid uniform points.
 */
template <std::size_t dim>
std::array<double, dim> effectiveSampleSize(const Path<dim>& path, std::size_t n_grid = 1000);

/// Mean over several chains, each weighted by its simulated time.
template <std::size_t dim>
geom::Point<dim> pooledMean(const std::vector<Path<dim>>& paths);

} // namespace pdmp::analytics

#include "pathAnalytics.tpp"

#endif // PDMP_PATH_ANALYTICS_HPP
