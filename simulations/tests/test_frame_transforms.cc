#include <gtest/gtest.h>

#include <cmath>

#include "aluminium.hpp"
#include "frame_transforms.hpp"
#include "visibility.hpp"

TEST(FrameTransforms, detector_to_sample) {
    Matrix3d u_s = detector_to_sample(square_detector());
    EXPECT_TRUE((u_s * u_s.transpose()).isApprox(Matrix3d::Identity()));
    EXPECT_NEAR(u_s.determinant(), 1.0, 1e-12);

    // Rows are the sample axes in the detector frame, tilted by 90 - 70 deg
    double c = std::cos(20 * DEG2RAD);
    double s = std::sin(20 * DEG2RAD);
    Matrix3d expected;
    expected << 0, -c, s, 1, 0, 0, 0, s, c;
    EXPECT_TRUE(u_s.isApprox(expected, 1e-12));
}

TEST(FrameTransforms, crystal_to_detector) {
    Matrix3d u_s = detector_to_sample(square_detector());
    Rotations rotations = stacked_rotations();
    std::vector<Matrix3d> u_os = crystal_to_detector(rotations, u_s);
    ASSERT_EQ(u_os.size(), 4);
    EXPECT_TRUE(u_os[3].isApprox(rotations.matrix(3) * u_s));

    // The sample normal [001] of an unrotated cubic crystal
    Phase phase = aluminium();
    Vectors3d uvw(1, 3);
    uvw << 0, 0, 1;
    Vectors3d v = transform_rows(uvw, direct_to_detector(phase, u_s));
    EXPECT_NEAR(v(0, 0) / v(0, 2), 0.0, 1e-12);
    EXPECT_NEAR(v(0, 1) / v(0, 2), std::tan(20 * DEG2RAD), 1e-12);

    // Plane normals of a cubic crystal are parallel to the directions
    Vectors3d g = transform_rows(uvw, reciprocal_to_detector(phase, u_s));
    EXPECT_TRUE(g.row(0).normalized().isApprox(v.row(0).normalized()));
}

TEST(Visibility, hemisphere_and_bounds) {
    EBSDDetector detector = square_detector();
    Vectors3d v(4, 3);
    v << 0, 0, 1,   // PC
      0.9, 0, 1,    // inside
      1.02, 0, 1,   // within one pixel of the edge
      0.5, 0.5, -1; // lower hemisphere
    std::vector<Vectors3d> vectors = {v};
    Mask upper = upper_hemisphere(vectors);
    EXPECT_TRUE(upper(0, 0) && upper(0, 1) && upper(0, 2));
    EXPECT_FALSE(upper(0, 3));

    Mask inside = within_gnomonic_bounds(vectors, detector);
    EXPECT_TRUE(inside(0, 0) && inside(0, 1) && inside(0, 2));
    EXPECT_FALSE(inside(0, 3));
    v(2, 0) = 1.1;
    EXPECT_FALSE(within_gnomonic_bounds({v}, detector)(0, 2));

    Mask both(2, 3);
    both << true, false, false, false, false, true;
    EXPECT_EQ(in_some_pattern(both), (std::vector<bool>{true, false, true}));
    Mask kept = select_columns(both, {true, false, true});
    ASSERT_EQ(kept.cols(), 2);
    EXPECT_TRUE(kept(0, 0) && kept(1, 1));
    EXPECT_FALSE(kept(0, 1) || kept(1, 0));
}

TEST(Visibility, zone_axis_survivors_need_a_position_on_the_detector) {
    EBSDDetector detector = square_detector();
    // Axis 0 is upper at position 0 but off the detector, and below the
    // pattern at position 1 where its projection would fall on the PC.
    // Axis 1 is on the detector at position 1 only.
    Vectors3d p0(2, 3);
    p0 << 5, 0, 1, 0, 0, -1;
    Vectors3d p1(2, 3);
    p1 << 0, 0, -1, 0.2, 0.1, 1;
    std::vector<Vectors3d> vectors = {p0, p1};

    Mask upper = upper_hemisphere(vectors);
    Mask inside = within_gnomonic_bounds(vectors, detector);
    EXPECT_FALSE(inside(1, 0));
    for (Eigen::Index p = 0; p < inside.rows(); ++p) {
        for (Eigen::Index i = 0; i < inside.cols(); ++i) {
            EXPECT_TRUE(!inside(p, i) || upper(p, i));
        }
    }

    std::vector<bool> any_upper = in_some_pattern(upper);
    std::vector<bool> any_inside = in_some_pattern(inside);
    std::vector<bool> survivors = in_some_pattern(upper && inside);
    EXPECT_EQ(survivors, (std::vector<bool>{false, true}));
    for (size_t i = 0; i < survivors.size(); ++i) {
        EXPECT_EQ(survivors[i], any_upper[i] && any_inside[i]);
    }
}
