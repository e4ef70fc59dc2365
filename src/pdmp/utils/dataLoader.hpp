/**
 * @file dataLoader.hpp
 * @brief Plain-text readers for observations and half-space descriptions.
 *
 * Observation files:
 *   <num_rows> <dim>
 *   a_1 ... a_dim y        (one row per observation, y in {0, 1})
 *
 * Half-space files are the output of `qhull n` / `qhull Fn`:
 *   <dim + 1>
 *   <num_facets>
 *   n_1 ... n_dim d        (facet n·x + d = 0, interior n·x + d <= 0)
 */

#ifndef PDMP_DATA_LOADER_HPP
#define PDMP_DATA_LOADER_HPP

#include "../domains/polytope.hpp"
#include "../geometry.hpp"

#include <array>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdmp::utils {

template <std::size_t dim>
void readObservations(const std::string& filename,
                      std::vector<geom::Point<dim>>& features,
                      std::vector<int>& labels)
{
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open observations file: " + filename);
    }

    std::size_t num_rows = 0;
    std::size_t file_dim = 0;
    in >> num_rows >> file_dim;
    if (!in.good()) {
        throw std::runtime_error("Error reading header from file: " + filename);
    }
    if (file_dim != dim) {
        throw std::runtime_error(
            "Dimension mismatch: file has dim = " + std::to_string(file_dim) +
            " but template expects dim = " + std::to_string(dim));
    }

    features.clear();
    labels.clear();
    features.reserve(num_rows);
    labels.reserve(num_rows);

    for (std::size_t i = 0; i < num_rows; ++i) {
        geom::Point<dim> a;
        for (std::size_t k = 0; k < dim; ++k) {
            if (!(in >> a[k])) {
                throw std::runtime_error(
                    "Error reading feature " + std::to_string(k) +
                    " of row " + std::to_string(i) + " from file: " + filename);
            }
        }
        int y = 0;
        if (!(in >> y) || (y != 0 && y != 1)) {
            throw std::runtime_error(
                "Error reading label of row " + std::to_string(i) +
                " from file: " + filename + " (expected 0 or 1)");
        }
        features.push_back(a);
        labels.push_back(y);
    }
}

/**
 * @brief Polytope from qhull normals: the facet n·x + d <= 0 becomes (-n)·x >= d.
 */
template <std::size_t dim>
domains::Polytope<dim> readHalfSpacesFromQhull(const std::string& filename)
{
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open normals file: " + filename);
    }

    std::size_t file_dim = 0;
    std::size_t num_facets = 0;
    in >> file_dim >> num_facets;
    if (!in.good()) {
        throw std::runtime_error("Error reading header (dim, num_facets) from: " + filename);
    }
    if (file_dim != dim + 1) {
        throw std::runtime_error(
            "Dimension mismatch in normals file: file has dim = " +
            std::to_string(file_dim) + " but template expects dim = " +
            std::to_string(dim));
    }

    std::vector<std::array<double, dim>> normals;
    std::vector<double> intercepts;
    normals.reserve(num_facets);
    intercepts.reserve(num_facets);

    for (std::size_t f = 0; f < num_facets; ++f) {
        std::array<double, dim> n{};
        for (std::size_t k = 0; k < dim; ++k) {
            if (!(in >> n[k])) {
                throw std::runtime_error(
                    "Error reading normal component " + std::to_string(k) +
                    " for facet " + std::to_string(f) + " from: " + filename);
            }
            n[k] = -n[k];
        }

        double d = 0.0;
        if (!(in >> d)) {
            throw std::runtime_error(
                "Error reading offset d for facet " + std::to_string(f) +
                " from: " + filename);
        }

        normals.push_back(n);
        intercepts.push_back(d);
    }

    return domains::Polytope<dim>(normals, intercepts);
}

} // namespace pdmp::utils

#endif // PDMP_DATA_LOADER_HPP
