/**
 * @file frame_transforms.hpp
 * @brief Rotation chain carrying lattice vectors from the crystal frame
 * into the detector frame.
 *
 * All vectors are row vectors, so a chain is applied as `v * U`. For a
 * crystal orientation U_o (sample to crystal) the chain is
 *
 *     U_s  = R_z(-90 about -z) * R_sample(tilt) * R_detector(euler)^T
 *     U_os = U_o * U_s
 *     hkl -> hkl * (recbase^T * U_os)
 *     uvw -> uvw * (base * U_os)
 */
#pragma once

#include <Eigen/Dense>
#include <vector>

#include "ebsd_detector.hpp"
#include "phase.hpp"
#include "rotations.hpp"
#include "vectors.hpp"

using Eigen::Matrix3d;

/// Detector to sample transformation including the axis correction
Matrix3d detector_to_sample(const EBSDDetector &detector);

/// U_os for every navigation position of the rotations, row-major
std::vector<Matrix3d> crystal_to_detector(const Rotations &rotations,
                                          const Matrix3d &detector_to_sample);

/// Transformation of reciprocal lattice indices hkl into the detector frame
inline Matrix3d reciprocal_to_detector(const Phase &phase, const Matrix3d &u_os) {
    return phase.recbase().transpose() * u_os;
}

/// Transformation of direct lattice indices uvw into the detector frame
inline Matrix3d direct_to_detector(const Phase &phase, const Matrix3d &u_os) {
    return phase.base() * u_os;
}

/// Apply `transform` to every row of `vectors`
inline Vectors3d transform_rows(const Vectors3d &vectors, const Matrix3d &transform) {
    return vectors * transform;
}
