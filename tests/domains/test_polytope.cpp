/// @file tests/domains/test_polytope.cpp
/// @brief Unit tests for the half-space polytope.
///
/// Test categories:
///   - Construction errors (size mismatch, zero normal, empty, bad box)
///   - Membership with tolerance
///   - First boundary hit time and face, horizon cut-off
///   - Rays parallel to a face are never reported
///   - Points marginally outside a face hit it immediately
///   - Specular reflection law and face projection
///   - qhull normals loader

#include <gtest/gtest.h>
#include "pdmp/domains/polytope.hpp"
#include "pdmp/utils/dataLoader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

using namespace pdmp;
using namespace pdmp::domains;

using P2 = geom::Point<2>;

static P2 pt(double a, double b) { return P2({a, b}); }

// ─── Construction ────────────────────────────────────────────────────────────

TEST(Polytope, RejectsMismatchedSizes) {
    std::vector<std::array<double, 2>> n = {{1.0, 0.0}, {0.0, 1.0}};
    EXPECT_THROW(Polytope<2>(n, {0.0}), std::invalid_argument);
}

TEST(Polytope, RejectsZeroNormal) {
    std::vector<std::array<double, 2>> n = {{1.0, 0.0}, {0.0, 0.0}};
    EXPECT_THROW(Polytope<2>(n, {0.0, 0.0}), std::invalid_argument);
}

TEST(Polytope, RejectsEmptyFaceList) {
    EXPECT_THROW(Polytope<2>({}, {}), std::invalid_argument);
}

TEST(Polytope, BoxRejectsInvertedBounds) {
    EXPECT_THROW(Polytope<2>::box({0.0, 1.0}, {1.0, 1.0}), std::invalid_argument);
}

TEST(Polytope, OrthantAndBoxFaceCounts) {
    EXPECT_EQ(Polytope<3>::nonNegativeOrthant().numFaces(), 3u);
    EXPECT_EQ(Polytope<3>::box({0, 0, 0}, {1, 1, 1}).numFaces(), 6u);
}

// ─── Membership ──────────────────────────────────────────────────────────────

TEST(Polytope, OrthantMembership) {
    auto q = Polytope<2>::nonNegativeOrthant();
    EXPECT_TRUE(q.isInside(pt(1.0, 2.0)));
    EXPECT_TRUE(q.isInside(pt(0.0, 0.0)));
    EXPECT_TRUE(q.isInside(pt(-1e-13, 1.0)));   // within tolerance
    EXPECT_FALSE(q.isInside(pt(-1e-3, 1.0)));
}

TEST(Polytope, BoxMembership) {
    auto b = Polytope<2>::box({0.0, 0.0}, {1.0, 2.0});
    EXPECT_TRUE(b.isInside(pt(0.5, 1.5)));
    EXPECT_FALSE(b.isInside(pt(0.5, 2.5)));
    EXPECT_FALSE(b.isInside(pt(1.1, 0.5)));
}

// ─── Boundary hits ───────────────────────────────────────────────────────────

TEST(Polytope, HitTimeAndFaceInOrthant) {
    auto q = Polytope<2>::nonNegativeOrthant();
    auto hit = q.nextBoundary(pt(1.0, 2.0), pt(-1.0, 0.0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_DOUBLE_EQ(hit->time, 1.0);
    EXPECT_EQ(hit->face, 0u);
}

TEST(Polytope, ClosestFaceWins) {
    auto q = Polytope<2>::nonNegativeOrthant();
    // reaches x=0 at t=2 and y=0 at t=1
    auto hit = q.nextBoundary(pt(2.0, 1.0), pt(-1.0, -1.0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_DOUBLE_EQ(hit->time, 1.0);
    EXPECT_EQ(hit->face, 1u);
}

TEST(Polytope, HitTimeScalesWithSpeed) {
    auto b = Polytope<2>::box({0.0, 0.0}, {1.0, 1.0});
    auto hit = b.nextBoundary(pt(0.25, 0.5), pt(3.0, 0.0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->time, 0.25, 1e-15);
    EXPECT_EQ(hit->face, 1u);   // upper x face
}

TEST(Polytope, NoHitWhenMovingAway) {
    auto q = Polytope<2>::nonNegativeOrthant();
    EXPECT_FALSE(q.nextBoundary(pt(1.0, 1.0), pt(1.0, 2.0)).has_value());
}

TEST(Polytope, ParallelRayNeverHitsFace) {
    auto q = Polytope<2>::nonNegativeOrthant();
    // parallel to x = 0 and moving away from y = 0
    EXPECT_FALSE(q.nextBoundary(pt(1.0, 1.0), pt(0.0, 1.0)).has_value());
    // numerically parallel
    EXPECT_FALSE(q.nextBoundary(pt(1.0, 1.0), pt(-1e-300, 1.0)).has_value());
}

TEST(Polytope, ParallelRayOnFaceDoesNotFault) {
    auto q = Polytope<2>::nonNegativeOrthant();
    auto hit = q.nextBoundary(pt(0.0, 5.0), pt(0.0, -1.0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->face, 1u);
    EXPECT_TRUE(std::isfinite(hit->time));
    EXPECT_DOUBLE_EQ(hit->time, 5.0);
}

TEST(Polytope, HorizonCutsOffDistantFaces) {
    auto q = Polytope<2>::nonNegativeOrthant();
    EXPECT_FALSE(q.nextBoundary(pt(1.0, 1.0), pt(-1.0, 0.0), 0.5).has_value());
    EXPECT_TRUE(q.nextBoundary(pt(1.0, 1.0), pt(-1.0, 0.0), 1.5).has_value());
}

TEST(Polytope, MarginallyOutsidePointHitsImmediately) {
    auto q = Polytope<2>::nonNegativeOrthant();
    auto hit = q.nextBoundary(pt(-1e-14, 1.0), pt(-1.0, 0.0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->time, 0.0);
    EXPECT_EQ(hit->face, 0u);
}

TEST(Polytope, ZeroVelocityHasNoHit) {
    auto q = Polytope<2>::nonNegativeOrthant();
    EXPECT_FALSE(q.nextBoundary(pt(1.0, 1.0), pt(0.0, 0.0)).has_value());
}

// ─── Reflection and projection ───────────────────────────────────────────────

TEST(Polytope, ReflectionFlipsNormalComponentOnly) {
    std::vector<std::array<double, 2>> n = {{1.0, 2.0}};
    Polytope<2> half(n, {0.0});
    const P2 v = pt(-0.3, -0.8);
    const P2 w = half.reflect(0, v);
    const P2 nn = half.normal(0);
    EXPECT_NEAR(geom::dot(nn, w), -geom::dot(nn, v), 1e-14);
    EXPECT_NEAR(geom::norm(w), geom::norm(v), 1e-14);
    // tangential component unchanged
    const P2 tangent = pt(2.0, -1.0);
    EXPECT_NEAR(geom::dot(tangent, w), geom::dot(tangent, v), 1e-14);
}

TEST(Polytope, ProjectOntoFaceLandsOnPlane) {
    std::vector<std::array<double, 2>> n = {{1.0, 1.0}};
    Polytope<2> half(n, {1.0});
    const P2 x = pt(0.3, 0.6);
    const P2 y = half.projectOntoFace(0, x);
    EXPECT_NEAR(half.slack(0, y), 0.0, 1e-15);
}

TEST(Polytope, NormalIndexOutOfRangeThrows) {
    auto q = Polytope<2>::nonNegativeOrthant();
    EXPECT_THROW(q.normal(2), std::out_of_range);
}

// ─── qhull loader ────────────────────────────────────────────────────────────

TEST(Polytope, ReadsQhullNormals) {
    const auto file = std::filesystem::temp_directory_path() / "pdmp_unit_square_hull.txt";
    {
        std::ofstream out(file);
        // unit square, qhull convention n·x + d <= 0 inside
        out << "3\n4\n"
            << "-1 0 0\n"
            << "1 0 -1\n"
            << "0 -1 0\n"
            << "0 1 -1\n";
    }
    auto square = utils::readHalfSpacesFromQhull<2>(file.string());
    std::filesystem::remove(file);

    EXPECT_EQ(square.numFaces(), 4u);
    EXPECT_TRUE(square.isInside(pt(0.5, 0.5)));
    EXPECT_FALSE(square.isInside(pt(1.5, 0.5)));
    EXPECT_FALSE(square.isInside(pt(0.5, -0.5)));

    auto hit = square.nextBoundary(pt(0.5, 0.5), pt(1.0, 0.0));
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->time, 0.5, 1e-15);
    EXPECT_EQ(hit->face, 1u);
}

TEST(Polytope, QhullLoaderRejectsWrongDimension) {
    const auto file = std::filesystem::temp_directory_path() / "pdmp_bad_hull.txt";
    {
        std::ofstream out(file);
        out << "4\n1\n1 0 0 0\n";
    }
    EXPECT_THROW(utils::readHalfSpacesFromQhull<2>(file.string()), std::runtime_error);
    std::filesystem::remove(file);
}

TEST(Polytope, QhullLoaderMissingFileThrows) {
    EXPECT_THROW(utils::readHalfSpacesFromQhull<2>("/nonexistent/pdmp_hull.txt"), std::runtime_error);
}
