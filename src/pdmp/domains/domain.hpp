#ifndef PDMP_DOMAIN_HPP
#define PDMP_DOMAIN_HPP

#include <cstddef>
#include <limits>
#include <optional>

#include "../geometry.hpp"

namespace pdmp::domains {

/**
 * @brief First face crossed by a ray x + t v.
 */
struct BoundaryHit {
    double time = std::numeric_limits<double>::infinity();
    std::size_t face = 0;
};

/**
 * @brief Convex feasible region the sampler is restricted to.
 * @tparam dim Dimensionality.
 */
template <std::size_t dim>
class Domain {
public:
    virtual ~Domain() = default;

    // returns true if the given point satisfies every constraint (within tolerance)
    virtual bool isInside(const geom::Point<dim>& x) const = 0;

    // first face the ray x + t v leaves through, std::nullopt if none before horizon
    virtual std::optional<BoundaryHit>
    nextBoundary(const geom::Point<dim>& x,
                 const geom::Point<dim>& v,
                 double horizon = std::numeric_limits<double>::infinity()) const = 0;

    // inward normal of a face
    virtual geom::Point<dim> normal(std::size_t face) const = 0;

    // velocity after a specular bounce off a face
    virtual geom::Point<dim> reflect(std::size_t face, const geom::Point<dim>& v) const
    {
        return geom::reflect(v, normal(face));
    }

    // x moved onto the plane of a face; used to remove drift after a hit
    virtual geom::Point<dim> projectOntoFace(std::size_t face, const geom::Point<dim>& x) const = 0;

    virtual std::size_t numFaces() const = 0;
};

} // namespace pdmp::domains

#endif // PDMP_DOMAIN_HPP
