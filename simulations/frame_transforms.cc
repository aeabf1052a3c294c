/**
 * @file frame_transforms.cc
 * @brief Rotations from the crystal and sample frames to the detector frame
 */

#include "frame_transforms.hpp"

#include <numbers>

#include "common.hpp"

Matrix3d detector_to_sample(const EBSDDetector &detector) {
    Matrix3d sample = bunge_euler_to_matrix(0.0, detector.sample_tilt() * DEG2RAD, 0.0);
    Vector3d euler = detector.euler() * DEG2RAD;
    Matrix3d det = bunge_euler_to_matrix(euler[0], euler[1], euler[2]);
    // Fixed -90 deg turn about the detector normal (-z)
    Matrix3d correction =
      Eigen::AngleAxisd(-std::numbers::pi / 2, -Vector3d::UnitZ()).toRotationMatrix();
    return correction * sample * det.transpose();
}

std::vector<Matrix3d> crystal_to_detector(const Rotations &rotations,
                                          const Matrix3d &detector_to_sample) {
    std::vector<Matrix3d> u_os;
    u_os.reserve(rotations.size());
    for (const auto &u_o : rotations.matrices()) {
        u_os.push_back(u_o * detector_to_sample);
    }
    return u_os;
}
