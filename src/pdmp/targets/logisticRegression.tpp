#ifndef PDMP_LOGISTIC_REGRESSION_TPP
#define PDMP_LOGISTIC_REGRESSION_TPP

#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <omp.h>

namespace pdmp::targets {

namespace detail {

inline double sigmoid(double z)
{
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

// log(1 + exp(z)) without overflow
inline double log1pExp(double z)
{
    return (z > 0.0) ? z + std::log1p(std::exp(-z)) : std::log1p(std::exp(z));
}

} // namespace detail

template <std::size_t dim>
LogisticRegression<dim>::LogisticRegression(std::vector<geom::Point<dim>> features,
                                            std::vector<int> labels,
                                            double prior_scale)
    : a(std::move(features))
    , y(std::move(labels))
    , inv_prior_var(0.0)
{
    if (a.empty())
        throw std::invalid_argument("LogisticRegression: no observations.");
    if (a.size() != y.size())
        throw std::invalid_argument("LogisticRegression: features and labels must have the same size.");
    if (!(prior_scale > 0.0) || !std::isfinite(prior_scale))
        throw std::invalid_argument("LogisticRegression: prior_scale must be finite and > 0.");

    for (int label : y) {
        if (label != 0 && label != 1)
            throw std::invalid_argument("LogisticRegression: labels must be 0 or 1.");
    }

    inv_prior_var = 1.0 / (prior_scale * prior_scale);

    double trace = 0.0;
    for (const auto& ai : a)
        trace += geom::squaredNorm(ai);
    lip = 0.25 * trace + inv_prior_var;
}

template <std::size_t dim>
geom::Point<dim> LogisticRegression<dim>::gradient(const geom::Point<dim>& beta) const
{
    std::array<double, dim> acc{};
    double* g = acc.data();
    const long n = static_cast<long>(a.size());

#pragma omp parallel for reduction(+:g[:dim]) schedule(static)
    for (long i = 0; i < n; ++i) {
        const auto& ai = a[static_cast<std::size_t>(i)];
        const double r = detail::sigmoid(geom::dot(ai, beta)) - static_cast<double>(y[static_cast<std::size_t>(i)]);
        for (std::size_t k = 0; k < dim; ++k)
            g[k] += r * ai[k];
    }

    geom::Point<dim> out(acc);
    for (std::size_t k = 0; k < dim; ++k)
        out[k] += beta[k] * inv_prior_var;
    return out;
}

template <std::size_t dim>
double LogisticRegression<dim>::logDensity(const geom::Point<dim>& beta) const
{
    double loglik = 0.0;
    const long n = static_cast<long>(a.size());

#pragma omp parallel for reduction(+:loglik) schedule(static)
    for (long i = 0; i < n; ++i) {
        const double eta = geom::dot(a[static_cast<std::size_t>(i)], beta);
        loglik += static_cast<double>(y[static_cast<std::size_t>(i)]) * eta - detail::log1pExp(eta);
    }

    return loglik - 0.5 * inv_prior_var * geom::squaredNorm(beta);
}

} // namespace pdmp::targets

#endif // PDMP_LOGISTIC_REGRESSION_TPP
