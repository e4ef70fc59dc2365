#ifndef PDMP_GAUSSIAN_TARGET_TPP
#define PDMP_GAUSSIAN_TARGET_TPP

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pdmp::targets {

template <std::size_t dim>
GaussianTarget<dim>::GaussianTarget(const std::array<double, dim>& mean,
                                    const std::array<double, dim>& sigma)
    : mu(mean)
{
    double sum_log_inv_sigma = 0.0;
    for (std::size_t i = 0; i < dim; ++i) {
        if (!(sigma[i] > 0.0) || !std::isfinite(sigma[i])) {
            throw std::invalid_argument("GaussianTarget: sigma must be > 0 for every dimension.");
        }
        inv_sig2[i] = 1.0 / (sigma[i] * sigma[i]);
        lip = std::max(lip, inv_sig2[i]);
        sum_log_inv_sigma += std::log(1.0 / sigma[i]);
    }

    const double log_2pi = std::log(2.0 * M_PI);
    log_norm_const = -0.5 * static_cast<double>(dim) * log_2pi + sum_log_inv_sigma;
}

template <std::size_t dim>
geom::Point<dim> GaussianTarget<dim>::gradient(const geom::Point<dim>& x) const
{
    geom::Point<dim> g;
    for (std::size_t i = 0; i < dim; ++i)
        g[i] = (x[i] - mu[i]) * inv_sig2[i];
    return g;
}

template <std::size_t dim>
double GaussianTarget<dim>::logDensity(const geom::Point<dim>& x) const
{
    double quad = 0.0;
    for (std::size_t i = 0; i < dim; ++i) {
        const double diff = x[i] - mu[i];
        quad += diff * diff * inv_sig2[i];
    }
    return log_norm_const - 0.5 * quad;
}

} // namespace pdmp::targets

#endif // PDMP_GAUSSIAN_TARGET_TPP
