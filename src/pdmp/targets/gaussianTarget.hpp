/**
 * @file gaussianTarget.hpp
 * @brief Diagonal multivariate Gaussian target N(mu, diag(sigma^2)).
 *
 * U(x) = 0.5 * sum_i (x_i - mu_i)^2 / sigma_i^2, so grad U is Lipschitz with
 * constant max_i 1/sigma_i^2. Restricted to a domain this gives a truncated
 * Gaussian, whose moments are known in simple cases (half-normal, ...).
 */

#ifndef PDMP_GAUSSIAN_TARGET_HPP
#define PDMP_GAUSSIAN_TARGET_HPP

#include "target.hpp"

#include <array>
#include <cstddef>

namespace pdmp::targets {

template <std::size_t dim>
class GaussianTarget : public Target<dim>
{
public:
    /**
     * @param mean Mean vector (mu)
     * @param sigma Standard deviations per dimension (sigma_i > 0)
     * @throws std::invalid_argument if some sigma_i is not > 0.
     */
    GaussianTarget(const std::array<double, dim>& mean,
                   const std::array<double, dim>& sigma);

    geom::Point<dim> gradient(const geom::Point<dim>& x) const override;

    double logDensity(const geom::Point<dim>& x) const override;

    double lipschitz() const override { return lip; }

private:
    geom::Point<dim> mu;
    std::array<double, dim> inv_sig2{};   // 1/sigma^2 for each dimension
    double log_norm_const = 0.0;          // log((2pi)^(-d/2) * prod(1/sigma_i))
    double lip = 0.0;
};

} // namespace pdmp::targets

#include "gaussianTarget.tpp"

#endif // PDMP_GAUSSIAN_TARGET_HPP
