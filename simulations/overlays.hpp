/**
 * @file overlays.hpp
 * @brief Renderer-agnostic overlay descriptors of a geometrical
 * simulation.
 *
 * Overlays carry plain coordinate arrays and a JSON style dictionary. A
 * style given by the caller is merged over the defaults, so only the
 * keys to change need to be passed.
 */
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "kikuchi_pattern_features.hpp"
#include "navigation.hpp"
#include "simulation_options.hpp"

using json = nlohmann::json;

/// Nested JSON arrays of the rows of a matrix
template <typename Derived>
json rows_to_json(const Eigen::MatrixBase<Derived> &array) {
    json rows = json::array();
    for (Eigen::Index i = 0; i < array.rows(); ++i) {
        json row = json::array();
        for (Eigen::Index j = 0; j < array.cols(); ++j) {
            row.push_back(array(i, j));
        }
        rows.push_back(row);
    }
    return rows;
}

/// Default style of Kikuchi line overlays
json default_lines_style();
/// Default style of zone axis overlays
json default_zone_axes_style();
/// Default style of zone axis label overlays
json default_zone_axes_labels_style();
/// Default style of the projection centre overlay
json default_pc_style();

/// `style` merged over `defaults`, keys in `style` win
json merge_style(json defaults, const json &style);

/// Which features to include in overlays, and how to style them
struct OverlayOptions {
    bool lines = true;
    bool zone_axes = false;
    bool zone_axes_labels = false;
    bool pc = false;
    /// Ignored by markers, which are always in detector coordinates
    CoordinateSpace coordinates = CoordinateSpace::detector;
    json lines_style = json::object();
    json zone_axes_style = json::object();
    json zone_axes_labels_style = json::object();
    json pc_style = json::object();
};

struct LineSegments {
    LineCoordinates segments;
    json style;
};

struct Points {
    PointCoordinates offsets;
    json style;
};

struct Texts {
    PointCoordinates offsets;
    std::vector<std::string> texts;
    json style;
};

/// Overlays of one pattern, in the order lines, zone axes, labels, PC
struct OverlayCollections {
    std::optional<LineSegments> lines;
    std::optional<Points> zone_axes;
    std::optional<Texts> zone_axes_labels;
    std::optional<Points> pc;

    /// Number of requested overlays
    size_t size() const;
    json to_json() const;
};

enum class MarkerKind { line_segments, points, texts };

/**
 * @brief Overlay of one feature kind for every pattern of a batch.
 *
 * `segments` (line segments) or `offsets` (points and texts) hold one
 * array per navigation position in row-major order, `texts` one list of
 * strings per position.
 */
struct Marker {
    MarkerKind kind;
    NavigationShape navigation_shape;
    std::vector<LineCoordinates> segments;
    std::vector<PointCoordinates> offsets;
    std::vector<std::vector<std::string>> texts;
    json style;

    json to_json() const;
};

std::string to_string(MarkerKind kind);
