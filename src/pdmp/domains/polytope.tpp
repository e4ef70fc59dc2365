#ifndef PDMP_POLYTOPE_TPP
#define PDMP_POLYTOPE_TPP

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pdmp::domains {

namespace detail {
// relative tolerance for membership and parallel-ray tests
constexpr double kFaceTolerance = 1e-9;
}

template <std::size_t dim>
Polytope<dim>::Polytope(const std::vector<std::array<double, dim>>& norms,
                        const std::vector<double>& intercepts)
    : offsets(intercepts)
{
    if (norms.size() != intercepts.size()) {
        throw std::invalid_argument(
            "Polytope: normals and intercepts must have the same size.");
    }
    if (norms.empty()) {
        throw std::invalid_argument("Polytope: at least one half-space is required.");
    }

    normals.reserve(norms.size());
    normal_norms.reserve(norms.size());
    for (std::size_t i = 0; i < norms.size(); ++i) {
        geom::Point<dim> n(norms[i]);
        const double len = geom::norm(n);
        if (!(len > 0.0) || !std::isfinite(len) || !std::isfinite(offsets[i])) {
            throw std::invalid_argument(
                "Polytope: face " + std::to_string(i) + " has a zero or non-finite normal/intercept.");
        }
        normals.push_back(n);
        normal_norms.push_back(len);
    }
}

template <std::size_t dim>
Polytope<dim> Polytope<dim>::nonNegativeOrthant()
{
    std::vector<std::array<double, dim>> norms(dim);
    for (std::size_t k = 0; k < dim; ++k) {
        norms[k].fill(0.0);
        norms[k][k] = 1.0;
    }
    return Polytope(norms, std::vector<double>(dim, 0.0));
}

template <std::size_t dim>
Polytope<dim> Polytope<dim>::box(const std::array<double, dim>& lower,
                                 const std::array<double, dim>& upper)
{
    std::vector<std::array<double, dim>> norms;
    std::vector<double> offs;
    for (std::size_t k = 0; k < dim; ++k) {
        if (!(lower[k] < upper[k])) {
            throw std::invalid_argument("Polytope::box: lower must be < upper in every dimension.");
        }
        std::array<double, dim> lo{};
        lo[k] = 1.0;                 //  x_k >= lower_k
        std::array<double, dim> hi{};
        hi[k] = -1.0;                // -x_k >= -upper_k
        norms.push_back(lo);
        offs.push_back(lower[k]);
        norms.push_back(hi);
        offs.push_back(-upper[k]);
    }
    return Polytope(norms, offs);
}

template <std::size_t dim>
double Polytope<dim>::slack(std::size_t face, const geom::Point<dim>& x) const
{
    return geom::dot(normals[face], x) - offsets[face];
}

template <std::size_t dim>
bool Polytope<dim>::isInside(const geom::Point<dim>& x) const
{
    for (std::size_t i = 0; i < normals.size(); ++i) {
        const double tol = detail::kFaceTolerance * normal_norms[i] * (1.0 + std::abs(offsets[i]));
        if (slack(i, x) < -tol)
            return false;
    }
    return true;
}

template <std::size_t dim>
std::optional<BoundaryHit>
Polytope<dim>::nextBoundary(const geom::Point<dim>& x,
                            const geom::Point<dim>& v,
                            double horizon) const
{
    const double speed = geom::norm(v);
    if (speed == 0.0) return std::nullopt;

    std::optional<BoundaryHit> best;
    for (std::size_t i = 0; i < normals.size(); ++i) {
        const double nv = geom::dot(normals[i], v);
        // moving away from, or parallel to, this face
        if (nv >= -detail::kFaceTolerance * normal_norms[i] * speed)
            continue;

        const double t = std::max(0.0, slack(i, x) / (-nv));
        if (t > horizon)
            continue;
        if (!best || t < best->time)
            best = BoundaryHit{t, i};
    }
    return best;
}

template <std::size_t dim>
geom::Point<dim> Polytope<dim>::normal(std::size_t face) const
{
    if (face >= normals.size())
        throw std::out_of_range("Polytope: face index out of range.");
    return normals[face];
}

template <std::size_t dim>
geom::Point<dim> Polytope<dim>::projectOntoFace(std::size_t face, const geom::Point<dim>& x) const
{
    const geom::Point<dim> n = normal(face);
    return geom::moveAlong(x, n, -slack(face, x) / (normal_norms[face] * normal_norms[face]));
}

} // namespace pdmp::domains

#endif // PDMP_POLYTOPE_TPP
