/**
 * @file logisticRegression.hpp
 * @brief Bayesian logistic regression posterior with an isotropic Gaussian prior.
 *
 * For observations (a_i, y_i), y_i in {0, 1}, and coefficients beta:
 *   U(beta) = sum_i [ log(1 + exp(a_i·beta)) - y_i a_i·beta ] + |beta|^2 / (2 s^2)
 *   grad U  = sum_i (sigmoid(a_i·beta) - y_i) a_i + beta / s^2
 *
 * The Hessian is bounded by (1/4) sum_i a_i a_i^T + I/s^2, so
 *   L = (1/4) sum_i |a_i|^2 + 1/s^2
 * is a valid (trace) Lipschitz constant for grad U.
 *
 * Gradient and log-density sum over observations with OpenMP.
 */

#ifndef PDMP_LOGISTIC_REGRESSION_HPP
#define PDMP_LOGISTIC_REGRESSION_HPP

#include "target.hpp"

#include <cstddef>
#include <vector>

namespace pdmp::targets {

template <std::size_t dim>
class LogisticRegression : public Target<dim>
{
public:
    /**
     * @param features Design matrix rows a_i.
     * @param labels Responses y_i in {0, 1}.
     * @param prior_scale Prior standard deviation s > 0.
     * @throws std::invalid_argument on size mismatch, empty data, labels not in {0,1}
     *         or non-positive prior scale.
     */
    LogisticRegression(std::vector<geom::Point<dim>> features,
                       std::vector<int> labels,
                       double prior_scale);

    geom::Point<dim> gradient(const geom::Point<dim>& beta) const override;

    double logDensity(const geom::Point<dim>& beta) const override;

    double lipschitz() const override { return lip; }

    std::size_t numObservations() const { return a.size(); }

private:
    std::vector<geom::Point<dim>> a;
    std::vector<int> y;
    double inv_prior_var;
    double lip = 0.0;
};

} // namespace pdmp::targets

#include "logisticRegression.tpp"

#endif // PDMP_LOGISTIC_REGRESSION_HPP
