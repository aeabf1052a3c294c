/**
 * @file rotations.cc
 * @brief Batches of crystal orientations from Euler angles or axis-angle pairs
 */

#include "rotations.hpp"

#include <fmt/core.h>

#include <stdexcept>

#include "common.hpp"

using Eigen::AngleAxisd;

Matrix3d bunge_euler_to_matrix(double phi1, double Phi, double phi2) {
    // The passive rotation is the transpose of the active Z-X-Z product
    Matrix3d active = (AngleAxisd(phi1, Vector3d::UnitZ())
                       * AngleAxisd(Phi, Vector3d::UnitX())
                       * AngleAxisd(phi2, Vector3d::UnitZ()))
                        .toRotationMatrix();
    return active.transpose();
}

Rotations::Rotations() : Rotations(Matrix3d::Identity()) {}

Rotations::Rotations(const Matrix3d &matrix) : shape_(1), matrices_{matrix} {}

Rotations::Rotations(NavigationShape shape, std::vector<Matrix3d> matrices)
    : shape_(shape), matrices_(std::move(matrices)) {
    if (shape_.size() == 0) {
        throw std::invalid_argument("Rotations need a non-empty navigation shape");
    }
    if (matrices_.size() != shape_.size()) {
        throw std::invalid_argument(
          fmt::format("Got {} rotation matrices for navigation shape {}",
                      matrices_.size(),
                      shape_.to_string()));
    }
}

Rotations::Rotations(const json &rotation_data) {
    std::vector<Matrix3d> matrices;
    if (rotation_data.contains("euler")) {
        for (const auto &e : rotation_data["euler"]) {
            if (e.size() != 3) {
                throw std::invalid_argument("Each Euler angle entry must have three values");
            }
            matrices.push_back(bunge_euler_to_matrix(e[0].get<double>() * DEG2RAD,
                                                     e[1].get<double>() * DEG2RAD,
                                                     e[2].get<double>() * DEG2RAD));
        }
    } else if (rotation_data.contains("axes_angles")) {
        for (const auto &a : rotation_data["axes_angles"]) {
            if (a.size() != 4) {
                throw std::invalid_argument(
                  "Each axis-angle entry must have four values [x, y, z, angle]");
            }
            Vector3d axis{a[0].get<double>(), a[1].get<double>(), a[2].get<double>()};
            if (axis.norm() == 0.0) {
                throw std::invalid_argument("Rotation axis cannot be the null vector");
            }
            matrices.push_back(
              AngleAxisd(a[3].get<double>() * DEG2RAD, axis.normalized()).toRotationMatrix());
        }
    } else {
        throw std::invalid_argument(
          "Key euler or axes_angles is missing from the input rotations JSON");
    }

    NavigationShape shape(matrices.size());
    if (rotation_data.contains("shape")) {
        auto dims = rotation_data["shape"].get<std::vector<size_t>>();
        if (dims.size() == 1) {
            shape = NavigationShape(dims[0]);
        } else if (dims.size() == 2) {
            shape = NavigationShape(dims[0], dims[1]);
        } else {
            throw std::invalid_argument("Rotations shape must have one or two dimensions");
        }
    }
    *this = Rotations(shape, std::move(matrices));
}

Rotations Rotations::from_axis_angle(const Vector3d &axis, double angle) {
    return Rotations(AngleAxisd(angle, axis.normalized()).toRotationMatrix());
}

Rotations Rotations::from_axes_angle(const std::vector<Vector3d> &axes, double angle) {
    std::vector<Matrix3d> matrices;
    matrices.reserve(axes.size());
    for (const auto &axis : axes) {
        matrices.push_back(AngleAxisd(angle, axis.normalized()).toRotationMatrix());
    }
    return Rotations(NavigationShape(axes.size()), std::move(matrices));
}

Rotations Rotations::from_euler(const Vector3d &euler, bool degrees) {
    Vector3d e = degrees ? Vector3d(euler * DEG2RAD) : euler;
    return Rotations(bunge_euler_to_matrix(e[0], e[1], e[2]));
}

Rotations Rotations::stack(const std::vector<Rotations> &batches) {
    if (batches.empty()) {
        throw std::invalid_argument("Cannot stack an empty list of rotations");
    }
    const NavigationShape &first = batches.front().shape();
    if (first.ndim() != 1) {
        throw std::invalid_argument("Only rotations of shape (n,) can be stacked");
    }
    for (const auto &batch : batches) {
        if (batch.shape() != first) {
            throw std::invalid_argument(
              fmt::format("Cannot stack rotations of shapes {} and {}",
                          first.to_string(),
                          batch.shape().to_string()));
        }
    }
    size_t n = first[0];
    size_t count = batches.size();
    std::vector<Matrix3d> matrices(n * count);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < count; ++j) {
            matrices[i * count + j] = batches[j].matrix(i);
        }
    }
    return Rotations(NavigationShape(n, count), std::move(matrices));
}

Rotations Rotations::reshape(NavigationShape shape) const {
    return Rotations(shape, matrices_);
}
