/**
 * @file zone_axes.hpp
 * @brief Direct lattice directions shared by pairs of reflectors.
 */
#pragma once

#include <Eigen/Dense>
#include <string>

#include "reflectors.hpp"
#include "vectors.hpp"

/// Largest angular deviation (radians) of an accepted integer reduction
constexpr double REDUCTION_ATOL = 1e-6;

/**
 * @brief Reduce a real valued direction to its smallest integer triplet.
 *
 * Candidates are tried in order of increasing largest index, and the
 * first one whose direction matches `uvw` within REDUCTION_ATOL is
 * returned. If no candidate up to `max_index` matches, the closest one
 * is returned and a warning is logged.
 *
 * @param uvw Non-null direction
 * @param max_index Largest absolute index to try
 */
Eigen::RowVector3d reduce_to_smallest_integers(const Eigen::RowVector3d &uvw,
                                               int max_index = 20);

/**
 * @brief Zone axes of all pairs of reflectors.
 *
 * Forms the cross product of every pair of hkl triplets, drops null
 * vectors, reduces the rest to smallest integers and returns the unique
 * triplets sorted lexicographically, one per row.
 */
Vectors3d zone_axes_from_reflectors(const Reflectors &reflectors);

/// Crystallographic notation with overbars, e.g. "[1\bar{1}0]"
std::string miller_label(const Eigen::RowVector3d &uvw);
