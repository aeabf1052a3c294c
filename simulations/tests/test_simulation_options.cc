#include <gtest/gtest.h>

#include <stdexcept>

#include "overlays.hpp"
#include "simulation_options.hpp"

TEST(SimulationOptions, parse_names) {
    EXPECT_EQ(parse_scaling("linear"), Scaling::linear);
    EXPECT_EQ(parse_scaling("square"), Scaling::square);
    EXPECT_EQ(parse_scaling("none"), Scaling::none);
    EXPECT_EQ(parse_hemisphere("both"), Hemisphere::both);
    EXPECT_EQ(parse_projection("spherical"), Projection::spherical);
    EXPECT_EQ(parse_trace_mode("bands"), TraceMode::bands);
    EXPECT_EQ(parse_coordinate_space("gnomonic"), CoordinateSpace::gnomonic);

    EXPECT_THROW(parse_scaling("log"), std::invalid_argument);
    EXPECT_THROW(parse_hemisphere("north"), std::invalid_argument);
    EXPECT_THROW(parse_projection("gnomonic"), std::invalid_argument);
    EXPECT_THROW(parse_trace_mode("band"), std::invalid_argument);
    EXPECT_THROW(parse_coordinate_space("pixels"), std::invalid_argument);

    EXPECT_EQ(to_string(Scaling::square), "square");
    EXPECT_EQ(to_string(Hemisphere::lower), "lower");
    EXPECT_EQ(to_string(Projection::stereographic), "stereographic");
    EXPECT_EQ(to_string(CoordinateSpace::gnomonic), "gnomonic");
}

TEST(Overlays, merge_style) {
    json style = merge_style(default_lines_style(), {{"linewidth", 3}, {"ls", "--"}});
    EXPECT_EQ(style["linewidth"], 3);
    EXPECT_EQ(style["ls"], "--");
    EXPECT_EQ(style["color"], "r");
    EXPECT_EQ(merge_style(default_pc_style(), json()), default_pc_style());
    EXPECT_EQ(default_zone_axes_labels_style()["bbox"]["fc"], "w");
}

TEST(Overlays, rows_to_json) {
    Eigen::Matrix<double, 2, 3> rows;
    rows << 1, 2, 3, 4.5, 5, 6;
    EXPECT_EQ(rows_to_json(rows), json::parse("[[1.0, 2.0, 3.0], [4.5, 5.0, 6.0]]"));
    EXPECT_EQ(rows_to_json(Eigen::MatrixXd(0, 2)), json::array());
    Eigen::Matrix<int, 1, 2> ints(3, -1);
    EXPECT_EQ(rows_to_json(ints), json::parse("[[3, -1]]"));
}

TEST(Overlays, collections_to_json) {
    OverlayCollections empty;
    EXPECT_EQ(empty.size(), 0);
    EXPECT_EQ(empty.to_json(), json::object());

    OverlayCollections collections;
    LineCoordinates segments(1, 4);
    segments << 0, 1, 2, 3;
    collections.lines = LineSegments{segments, default_lines_style()};
    PointCoordinates pc(1, 2);
    pc << 29.5, 29.5;
    collections.pc = Points{pc, default_pc_style()};
    EXPECT_EQ(collections.size(), 2);

    json data = collections.to_json();
    EXPECT_EQ(data["lines"]["segments"], json::parse("[[0.0, 1.0, 2.0, 3.0]]"));
    EXPECT_EQ(data["pc"]["offsets"], json::parse("[[29.5, 29.5]]"));
    EXPECT_FALSE(data.contains("zone_axes"));
}

TEST(Overlays, marker_to_json) {
    Marker marker{MarkerKind::texts, NavigationShape(2)};
    PointCoordinates a(1, 2);
    a << 1, 2;
    marker.offsets = {a, PointCoordinates(0, 2)};
    marker.texts = {{"[001]"}, {}};
    marker.style = default_zone_axes_labels_style();

    json data = marker.to_json();
    EXPECT_EQ(data["kind"], "texts");
    EXPECT_EQ(data["navigation_shape"], json::array({2}));
    EXPECT_EQ(data["offsets"][0], json::parse("[[1.0, 2.0]]"));
    EXPECT_TRUE(data["offsets"][1].empty());
    EXPECT_EQ(data["texts"][0][0], "[001]");
    EXPECT_FALSE(data.contains("segments"));
    EXPECT_EQ(to_string(MarkerKind::line_segments), "line_segments");
}
