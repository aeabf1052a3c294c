/**
 * @file rotations.hpp
 * @brief Batch of crystal orientations over a navigation shape.
 *
 * Each rotation maps the sample reference frame (RD-TD-ND, Bunge
 * convention) to the crystal reference frame. Rotations are stored as
 * orthonormal matrices in row-major navigation order.
 */
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "navigation.hpp"

using Eigen::Matrix3d;
using Eigen::Vector3d;
using json = nlohmann::json;

class Rotations {
  public:
    /// A single identity rotation, shape (1,)
    Rotations();
    /// A single rotation, shape (1,)
    explicit Rotations(const Matrix3d &matrix);
    /**
     * @throws std::invalid_argument if the number of matrices does not
     * match the shape, or the shape is empty.
     */
    Rotations(NavigationShape shape, std::vector<Matrix3d> matrices);
    /**
     * @brief Construct from JSON.
     *
     * Expects "euler" (list of Bunge Euler angle triplets in degrees) or
     * "axes_angles" (list of [x, y, z, angle in degrees]), and an
     * optional "shape" with one or two entries.
     */
    explicit Rotations(const json &rotation_data);

    /// Rotation by `angle` radians about `axis`
    static Rotations from_axis_angle(const Vector3d &axis, double angle);
    /// One rotation per axis, all by the same angle, shape (n,)
    static Rotations from_axes_angle(const std::vector<Vector3d> &axes, double angle);
    /// Bunge (ZXZ, passive) Euler angles
    static Rotations from_euler(const Vector3d &euler, bool degrees = false);
    /**
     * @brief Stack rotation batches of equal one-dimensional shape (n,)
     * into shape (n, count): entry (i, j) is rotation i of batch j.
     */
    static Rotations stack(const std::vector<Rotations> &batches);

    const NavigationShape &shape() const {
        return shape_;
    }
    size_t size() const {
        return matrices_.size();
    }
    size_t ndim() const {
        return shape_.ndim();
    }
    const Matrix3d &matrix(size_t flat) const {
        return matrices_.at(flat);
    }
    const Matrix3d &operator[](const NavigationIndex &index) const {
        return matrices_[shape_.flat_index(index)];
    }
    const std::vector<Matrix3d> &matrices() const {
        return matrices_;
    }

    /// Same rotations with a new shape of equal size
    Rotations reshape(NavigationShape shape) const;

  private:
    NavigationShape shape_{1};
    std::vector<Matrix3d> matrices_;
};

/// Passive Bunge rotation matrix from Euler angles in radians
Matrix3d bunge_euler_to_matrix(double phi1, double Phi, double phi2);
