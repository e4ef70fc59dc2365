/// @file tests/test_targets.hpp
/// @brief Small analytic targets shared by the unit tests.

#ifndef PDMP_TESTS_TEST_TARGETS_HPP
#define PDMP_TESTS_TEST_TARGETS_HPP

#include "pdmp/targets/target.hpp"

#include <cstddef>

namespace pdmp::test_support {

/// U = 0: uniform density on the domain, never produces target events.
template <std::size_t dim>
class FlatTarget : public targets::Target<dim> {
public:
    geom::Point<dim> gradient(const geom::Point<dim>&) const override { return {}; }
    double logDensity(const geom::Point<dim>&) const override { return 0.0; }
    double lipschitz() const override { return 0.0; }
};

/// U = c·x: constant gradient, so the intensity along a ray is constant.
template <std::size_t dim>
class LinearTarget : public targets::Target<dim> {
public:
    explicit LinearTarget(const geom::Point<dim>& slope) : c(slope) {}
    geom::Point<dim> gradient(const geom::Point<dim>&) const override { return c; }
    double logDensity(const geom::Point<dim>& x) const override { return -geom::dot(c, x); }
    double lipschitz() const override { return 0.0; }

private:
    geom::Point<dim> c;
};

/// U = |x|^2 / 2 but claims L = 0: its intensity outgrows the bound.
template <std::size_t dim>
class MisreportedQuadratic : public targets::Target<dim> {
public:
    geom::Point<dim> gradient(const geom::Point<dim>& x) const override { return x; }
    double logDensity(const geom::Point<dim>& x) const override { return -0.5 * geom::squaredNorm(x); }
    double lipschitz() const override { return 0.0; }
};

/// Counts gradient calls (not thread-safe, single-chain tests only).
template <std::size_t dim>
class CountingTarget : public targets::Target<dim> {
public:
    explicit CountingTarget(const targets::Target<dim>& inner) : base(inner) {}
    geom::Point<dim> gradient(const geom::Point<dim>& x) const override { ++calls; return base.gradient(x); }
    double logDensity(const geom::Point<dim>& x) const override { return base.logDensity(x); }
    double lipschitz() const override { return base.lipschitz(); }

    mutable std::size_t calls = 0;

private:
    const targets::Target<dim>& base;
};

} // namespace pdmp::test_support

#endif // PDMP_TESTS_TEST_TARGETS_HPP
