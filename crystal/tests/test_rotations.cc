#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <numbers>
#include <stdexcept>

#include "common.hpp"
#include "rotations.hpp"

using Eigen::AngleAxisd;

TEST(Rotations, single_rotation_has_shape_one) {
    Rotations identity;
    EXPECT_EQ(identity.shape(), NavigationShape(1));
    EXPECT_EQ(identity.size(), 1);
    EXPECT_TRUE(identity.matrix(0).isApprox(Matrix3d::Identity()));

    Rotations r = Rotations::from_axis_angle(Vector3d(0, 0, 1), 80 * DEG2RAD);
    EXPECT_EQ(r.shape().to_string(), "(1,)");
    Matrix3d expected = AngleAxisd(80 * DEG2RAD, Vector3d::UnitZ()).toRotationMatrix();
    EXPECT_TRUE(r[NavigationIndex(0)].isApprox(expected));
}

TEST(Rotations, bunge_euler_is_passive) {
    // A passive rotation about z is the transpose of the active one
    double phi1 = 30 * DEG2RAD;
    Matrix3d active = AngleAxisd(phi1, Vector3d::UnitZ()).toRotationMatrix();
    EXPECT_TRUE(bunge_euler_to_matrix(phi1, 0, 0).isApprox(active.transpose()));

    Matrix3d g = bunge_euler_to_matrix(0.3, 1.1, -0.7);
    EXPECT_TRUE((g * g.transpose()).isApprox(Matrix3d::Identity()));
    EXPECT_NEAR(g.determinant(), 1.0, 1e-12);

    Rotations r = Rotations::from_euler(Vector3d(30, 0, 0), true);
    EXPECT_TRUE(r.matrix(0).isApprox(active.transpose()));
}

TEST(Rotations, stack_pairs_batches_along_second_axis) {
    Rotations batch = Rotations::from_axes_angle(
      {Vector3d(0, 0, 1), Vector3d(0, 0, -1)}, 80 * DEG2RAD);
    EXPECT_EQ(batch.shape(), NavigationShape(2));

    Rotations stacked = Rotations::stack({batch, batch});
    EXPECT_EQ(stacked.shape(), NavigationShape(2, 2));
    EXPECT_TRUE(stacked[NavigationIndex(0, 0)].isApprox(stacked[NavigationIndex(0, 1)]));
    EXPECT_TRUE(stacked[NavigationIndex(1, 0)].isApprox(stacked[NavigationIndex(1, 1)]));
    EXPECT_FALSE(stacked[NavigationIndex(0, 0)].isApprox(stacked[NavigationIndex(1, 0)]));
    // 80 deg about -z is -80 deg about z
    Matrix3d minus80 = AngleAxisd(-80 * DEG2RAD, Vector3d::UnitZ()).toRotationMatrix();
    EXPECT_TRUE(stacked[NavigationIndex(1, 1)].isApprox(minus80));
}

TEST(Rotations, shape_mismatch_throws) {
    std::vector<Matrix3d> three(3, Matrix3d::Identity());
    EXPECT_THROW(Rotations(NavigationShape(2, 2), three), std::invalid_argument);
    EXPECT_THROW(Rotations::stack({}), std::invalid_argument);
    Rotations a = Rotations::from_axes_angle({Vector3d::UnitX()}, 0.1);
    Rotations b = Rotations::from_axes_angle({Vector3d::UnitX(), Vector3d::UnitY()}, 0.1);
    EXPECT_THROW(Rotations::stack({a, b}), std::invalid_argument);
    EXPECT_THROW(a.reshape(NavigationShape(2)), std::invalid_argument);
}

TEST(Rotations, from_json) {
    json data = {{"euler", {{0, 0, 0}, {90, 0, 0}, {0, 45, 0}, {10, 20, 30}}},
                 {"shape", {2, 2}}};
    Rotations r(data);
    EXPECT_EQ(r.shape(), NavigationShape(2, 2));
    EXPECT_TRUE(r[NavigationIndex(0, 0)].isApprox(Matrix3d::Identity()));
    EXPECT_TRUE(r[NavigationIndex(1, 1)].isApprox(
      bunge_euler_to_matrix(10 * DEG2RAD, 20 * DEG2RAD, 30 * DEG2RAD)));

    json axes = {{"axes_angles", {{0, 0, 1, 80}}}};
    Rotations r2(axes);
    EXPECT_EQ(r2.shape(), NavigationShape(1));
    EXPECT_TRUE(r2.matrix(0).isApprox(
      AngleAxisd(80 * DEG2RAD, Vector3d::UnitZ()).toRotationMatrix()));

    EXPECT_THROW(Rotations(json{{"quaternions", {{1, 0, 0, 0}}}}), std::invalid_argument);
    EXPECT_THROW(Rotations(json{{"euler", {{0, 0}}}}), std::invalid_argument);
    EXPECT_THROW(Rotations(json{{"euler", {{0, 0, 0}}}, {"shape", json::array({2})}}),
                 std::invalid_argument);
}
