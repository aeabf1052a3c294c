/**
 * @file vectors.hpp
 * @brief Array aliases shared by the crystal, detector and simulation
 * modules.
 */
#pragma once

#include <Eigen/Dense>
#include <vector>

/// n x 3 array of vectors, one vector per row
using Vectors3d = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;

/// Per navigation position (rows) flags of every vector (columns)
using Mask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Rows of `vectors` where `mask` is set, in order
inline Vectors3d select_rows(const Vectors3d &vectors, const std::vector<bool> &mask) {
    Eigen::Index n = 0;
    for (bool keep : mask) n += keep;
    Vectors3d selected(n, 3);
    Eigen::Index row = 0;
    for (Eigen::Index i = 0; i < vectors.rows(); ++i) {
        if (mask[i]) selected.row(row++) = vectors.row(i);
    }
    return selected;
}

/// Absolute tolerance of every hemisphere, degeneracy and null-vector test
constexpr double HEMISPHERE_ATOL = 1e-8;
