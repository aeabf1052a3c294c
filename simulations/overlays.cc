/**
 * @file overlays.cc
 * @brief Default styles and JSON output of overlay descriptors
 */

#include "overlays.hpp"

namespace {
json shape_to_json(const NavigationShape &shape) {
    json dims = json::array();
    for (size_t axis = 0; axis < shape.ndim(); ++axis) {
        dims.push_back(shape[axis]);
    }
    return dims;
}
}  // namespace

json default_lines_style() {
    return {{"color", "r"}, {"linewidth", 1}, {"alpha", 1}, {"zorder", 1}};
}

json default_zone_axes_style() {
    return {{"marker", "o"}, {"fc", "k"}, {"ec", "w"}, {"size", 40}, {"zorder", 1}};
}

json default_zone_axes_labels_style() {
    return {{"color", "k"},
            {"fontsize", 10},
            {"ha", "center"},
            {"va", "bottom"},
            {"bbox", {{"boxstyle", "square"}, {"fc", "w"}, {"pad", 0.1}}},
            {"zorder", 1}};
}

json default_pc_style() {
    return {{"marker", "*"}, {"fc", "gold"}, {"ec", "k"}, {"size", 300}, {"zorder", 1}};
}

json merge_style(json defaults, const json &style) {
    if (!style.is_null()) {
        defaults.update(style);
    }
    return defaults;
}

size_t OverlayCollections::size() const {
    return static_cast<size_t>(lines.has_value()) + zone_axes.has_value()
           + zone_axes_labels.has_value() + pc.has_value();
}

json OverlayCollections::to_json() const {
    json collections = json::object();
    if (lines) {
        collections["lines"] = {{"segments", rows_to_json(lines->segments)},
                                {"style", lines->style}};
    }
    if (zone_axes) {
        collections["zone_axes"] = {{"offsets", rows_to_json(zone_axes->offsets)},
                                    {"style", zone_axes->style}};
    }
    if (zone_axes_labels) {
        collections["zone_axes_labels"] = {
          {"offsets", rows_to_json(zone_axes_labels->offsets)},
          {"texts", zone_axes_labels->texts},
          {"style", zone_axes_labels->style}};
    }
    if (pc) {
        collections["pc"] = {{"offsets", rows_to_json(pc->offsets)},
                             {"style", pc->style}};
    }
    return collections;
}

json Marker::to_json() const {
    json marker = {{"kind", ::to_string(kind)},
                   {"navigation_shape", shape_to_json(navigation_shape)},
                   {"style", style}};
    if (kind == MarkerKind::line_segments) {
        json per_position = json::array();
        for (const auto &lines : segments) {
            per_position.push_back(rows_to_json(lines));
        }
        marker["segments"] = per_position;
    } else {
        json per_position = json::array();
        for (const auto &points : offsets) {
            per_position.push_back(rows_to_json(points));
        }
        marker["offsets"] = per_position;
        if (kind == MarkerKind::texts) {
            marker["texts"] = texts;
        }
    }
    return marker;
}

std::string to_string(MarkerKind kind) {
    switch (kind) {
    case MarkerKind::line_segments:
        return "line_segments";
    case MarkerKind::points:
        return "points";
    case MarkerKind::texts:
        return "texts";
    }
    return "";
}
