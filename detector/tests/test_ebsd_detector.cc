#include <gtest/gtest.h>

#include <cmath>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "ebsd_detector.hpp"

TEST(EBSDDetector, centred_gnomonic_bounds) {
    EBSDDetector det(60, 60);
    EXPECT_EQ(det.size(), 3600);
    EXPECT_EQ(det.navigation_shape(), NavigationShape(1));
    GnomonicBounds b = det.gnomonic_bounds(0);
    EXPECT_DOUBLE_EQ(b.x_min, -1.0);
    EXPECT_DOUBLE_EQ(b.x_max, 1.0);
    EXPECT_DOUBLE_EQ(b.y_min, -1.0);
    EXPECT_DOUBLE_EQ(b.y_max, 1.0);
    EXPECT_DOUBLE_EQ(det.x_scale(0), 2.0 / 59);
    EXPECT_DOUBLE_EQ(det.y_scale(0), 2.0 / 59);
    EXPECT_DOUBLE_EQ(det.r_max(0), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(det.max_r_max(), std::sqrt(2.0));
    EXPECT_TRUE(det.euler().isApprox(Vector3d(0, 90, 0)));
}

TEST(EBSDDetector, off_centre_rectangular_detector) {
    EBSDDetector det(60, 80, {Vector3d(0.4, 0.6, 0.5)}, NavigationShape(1), 70, 5, 2);
    EXPECT_DOUBLE_EQ(det.aspect_ratio(), 80.0 / 60);
    GnomonicBounds b = det.gnomonic_bounds(0);
    EXPECT_NEAR(b.x_min, -16.0 / 15, 1e-12);
    EXPECT_NEAR(b.x_max, 1.6, 1e-12);
    EXPECT_NEAR(b.y_min, -0.8, 1e-12);
    EXPECT_NEAR(b.y_max, 1.2, 1e-12);
    EXPECT_NEAR(det.r_max(0), 2.0, 1e-12);
    EXPECT_TRUE(det.euler().isApprox(Vector3d(2, 95, 0)));
}

TEST(EBSDDetector, one_projection_centre_per_position) {
    std::vector<Vector3d> pcs = {Vector3d(0.5, 0.5, 0.5),
                                 Vector3d(0.5, 0.5, 0.4),
                                 Vector3d(0.4, 0.5, 0.5),
                                 Vector3d(0.6, 0.5, 0.5)};
    EBSDDetector det(60, 60, pcs, NavigationShape(2, 2));
    EXPECT_EQ(det.navigation_shape().size(), 4);
    EXPECT_NEAR(det.r_max(1), std::sqrt(2.0) / 0.8, 1e-12);
    EXPECT_NEAR(det.max_r_max(), std::sqrt(2.0) / 0.8, 1e-12);
    EXPECT_TRUE(det.pc_average().isApprox(Vector3d(0.5, 0.5, 0.475)));
    EXPECT_TRUE(det.pc(3).isApprox(Vector3d(0.6, 0.5, 0.5)));
}

TEST(EBSDDetector, invalid_input_throws) {
    EXPECT_THROW(EBSDDetector(1, 60), std::invalid_argument);
    EXPECT_THROW(EBSDDetector(60, 60, {Vector3d(0.5, 0.5, 0.5)}, NavigationShape(2)),
                 std::invalid_argument);
    EXPECT_THROW(EBSDDetector(60, 60, {Vector3d(0.5, 0.5, 0.0)}), std::invalid_argument);
    EXPECT_THROW(EBSDDetector(60, 60, {Vector3d(0.5, 0.5, 0.5)}, NavigationShape(1), 70,
                              0, 0, -1.0),
                 std::invalid_argument);
}

TEST(EBSDDetector, from_json) {
    EBSDDetector det(json{{"shape", {60, 60}}, {"pc", {0.4, 0.5, 0.6}}, {"tilt", 10}});
    EXPECT_EQ(det.nrows(), 60);
    EXPECT_TRUE(det.pc(0).isApprox(Vector3d(0.4, 0.5, 0.6)));
    EXPECT_DOUBLE_EQ(det.tilt(), 10.0);
    EXPECT_DOUBLE_EQ(det.sample_tilt(), 70.0);

    EBSDDetector batch(json{{"shape", {40, 50}},
                            {"pc", {{0.5, 0.5, 0.5}, {0.5, 0.5, 0.6}}},
                            {"navigation_shape", {1, 2}}});
    EXPECT_EQ(batch.navigation_shape(), NavigationShape(1, 2));

    EBSDDetector copy(batch.to_json());
    EXPECT_EQ(copy.navigation_shape(), batch.navigation_shape());
    EXPECT_EQ(copy.ncols(), 50);
    EXPECT_TRUE(copy.pc(1).isApprox(batch.pc(1)));

    EXPECT_THROW(EBSDDetector(json{{"pc", {0.5, 0.5, 0.5}}}), std::invalid_argument);
    EXPECT_THROW(EBSDDetector(json{{"shape", {60, 60}}, {"navigation_shape", json::array({3})}}),
                 std::invalid_argument);
}
