/**
 * @file visibility.hpp
 * @brief Decide which Kikuchi lines and zone axes appear in which
 * patterns of a batch.
 *
 * Vectors in the detector frame are given per navigation position. A
 * vector is in the upper hemisphere where z > HEMISPHERE_ATOL, and a
 * zone axis is on the detector where its gnomonic projection lies in
 * the detector bounds widened by one pixel.
 */
#pragma once

#include <vector>

#include "ebsd_detector.hpp"
#include "vectors.hpp"

/// Detector navigation position to use with rotation position `flat`
inline size_t detector_position(const EBSDDetector &detector, size_t flat) {
    return detector.navigation_shape().size() == 1 ? 0 : flat;
}

/**
 * @brief Upper hemisphere flags from the z components only.
 *
 * @param z One row of z components per navigation position
 */
Mask upper_hemisphere(const Eigen::MatrixXd &z);

/// Upper hemisphere flags of full detector frame vectors
Mask upper_hemisphere(const std::vector<Vectors3d> &vectors);

/**
 * @brief Flags of vectors whose gnomonic projection lies on the
 * detector, widened by one pixel in x and y.
 *
 * A vector with z at or below HEMISPHERE_ATOL is never on the detector.
 */
Mask within_gnomonic_bounds(const std::vector<Vectors3d> &vectors,
                            const EBSDDetector &detector);

/// Vectors flagged in at least one navigation position
std::vector<bool> in_some_pattern(const Mask &in_pattern);

/// Columns of `in_pattern` where `keep` is set, in order
Mask select_columns(const Mask &in_pattern, const std::vector<bool> &keep);
