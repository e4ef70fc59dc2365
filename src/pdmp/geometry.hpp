/**
 * @file geometry.hpp
 * @brief Fixed-dimension points/vectors and the linear algebra used by the sampler.
 */

#ifndef PDMP_GEOMETRY_HPP
#define PDMP_GEOMETRY_HPP

#include <array>
#include <cmath>
#include <cstddef>

namespace pdmp::geom {

/**
 * @brief Point (or vector) in R^dim.
 * @tparam dim Dimensionality.
 *
 * Used both for positions and for velocities/gradients.
 */
template <std::size_t dim>
class Point
{
public:
    Point() { coords.fill(0.0); }

    explicit Point(const std::array<double, dim>& c) : coords(c) {}

    double& operator[](std::size_t i)       { return coords[i]; }
    double  operator[](std::size_t i) const { return coords[i]; }

    std::size_t dimension() const { return dim; }

    const std::array<double, dim>& data() const { return coords; }

    Point& operator+=(const Point& o)
    {
        for (std::size_t i = 0; i < dim; ++i) coords[i] += o.coords[i];
        return *this;
    }

    Point& operator-=(const Point& o)
    {
        for (std::size_t i = 0; i < dim; ++i) coords[i] -= o.coords[i];
        return *this;
    }

    Point& operator*=(double s)
    {
        for (auto& c : coords) c *= s;
        return *this;
    }

private:
    std::array<double, dim> coords;
};

template <std::size_t dim>
Point<dim> operator+(Point<dim> a, const Point<dim>& b) { return a += b; }

template <std::size_t dim>
Point<dim> operator-(Point<dim> a, const Point<dim>& b) { return a -= b; }

template <std::size_t dim>
Point<dim> operator*(double s, Point<dim> a) { return a *= s; }

template <std::size_t dim>
double dot(const Point<dim>& a, const Point<dim>& b)
{
    double s = 0.0;
    for (std::size_t i = 0; i < dim; ++i) s += a[i] * b[i];
    return s;
}

template <std::size_t dim>
double squaredNorm(const Point<dim>& a) { return dot(a, a); }

template <std::size_t dim>
double norm(const Point<dim>& a) { return std::sqrt(dot(a, a)); }

// x + t * v
template <std::size_t dim>
Point<dim> moveAlong(const Point<dim>& x, const Point<dim>& v, double t)
{
    Point<dim> out = x;
    for (std::size_t i = 0; i < dim; ++i) out[i] += t * v[i];
    return out;
}

/**
 * @brief Reflect v across the hyperplane orthogonal to n.
 *
 * v' = v - 2 (n·v / |n|^2) n. Preserves |v| and flips the component along n.
 * A zero n leaves v unchanged.
 */
template <std::size_t dim>
Point<dim> reflect(const Point<dim>& v, const Point<dim>& n)
{
    const double nn = squaredNorm(n);
    if (nn == 0.0) return v;
    return moveAlong(v, n, -2.0 * dot(n, v) / nn);
}

template <std::size_t dim>
bool isFinite(const Point<dim>& a)
{
    for (std::size_t i = 0; i < dim; ++i)
        if (!std::isfinite(a[i])) return false;
    return true;
}

} // namespace pdmp::geom

#endif // PDMP_GEOMETRY_HPP
