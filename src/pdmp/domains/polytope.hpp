/**
 * @file polytope.hpp
 * @brief Convex polytope described as an intersection of half-spaces.
 *
 * The feasible region is { x : n_i · x >= b_i  for every face i }.
 * Normals point into the feasible region and need not be unit length.
 * The polytope may be unbounded (e.g. the non-negative orthant).
 */

#ifndef PDMP_POLYTOPE_HPP
#define PDMP_POLYTOPE_HPP

#include "domain.hpp"
#include "../geometry.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace pdmp::domains {

template <std::size_t dim>
class Polytope : public Domain<dim> {
public:
    /**
     * @param norms Inward normals n_i (non-zero).
     * @param intercepts Offsets b_i, same length as norms.
     * @throws std::invalid_argument on size mismatch, empty face list or zero normal.
     */
    Polytope(const std::vector<std::array<double, dim>>& norms,
             const std::vector<double>& intercepts);

    /// { x : x_k >= 0 for all k }
    static Polytope nonNegativeOrthant();

    /// { x : lower_k <= x_k <= upper_k }; faces 2k (lower) and 2k+1 (upper)
    static Polytope box(const std::array<double, dim>& lower,
                        const std::array<double, dim>& upper);

    bool isInside(const geom::Point<dim>& x) const override;

    /**
     * @brief First face crossed by x + t v for t in [0, horizon].
     *
     * Only faces the ray moves towards (n·v < 0) are candidates; a ray
     * (numerically) parallel to a face never reaches it. A point already on
     * or marginally past a face it moves towards gets hit time 0.
     */
    std::optional<BoundaryHit>
    nextBoundary(const geom::Point<dim>& x,
                 const geom::Point<dim>& v,
                 double horizon = std::numeric_limits<double>::infinity()) const override;

    geom::Point<dim> normal(std::size_t face) const override;

    geom::Point<dim> projectOntoFace(std::size_t face, const geom::Point<dim>& x) const override;

    std::size_t numFaces() const override { return normals.size(); }

    /// n_i · x - b_i, non-negative inside
    double slack(std::size_t face, const geom::Point<dim>& x) const;

private:
    std::vector<geom::Point<dim>> normals;
    std::vector<double> offsets;
    std::vector<double> normal_norms;
};

} // namespace pdmp::domains

#include "polytope.tpp"

#endif // PDMP_POLYTOPE_HPP
