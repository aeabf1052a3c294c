/**
 * @file geometrical_simulation.cc
 * @brief Coordinates, labels and overlays of a geometrical simulation
 */

#include "geometrical_simulation.hpp"

#include <fmt/core.h>

#include <cmath>
#include <limits>

#include "visibility.hpp"
#include "zone_axes.hpp"

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Label offset above a zone axis as a fraction of the detector height
constexpr double LABEL_OFFSET = 0.03;

template <typename Coordinates>
Coordinates drop_nan_rows(const Coordinates &array) {
    std::vector<bool> keep(array.rows());
    Eigen::Index n = 0;
    for (Eigen::Index i = 0; i < array.rows(); ++i) {
        keep[i] = !array.row(i).array().isNaN().any();
        n += keep[i];
    }
    Coordinates kept(n, array.cols());
    Eigen::Index row = 0;
    for (Eigen::Index i = 0; i < array.rows(); ++i) {
        if (keep[i]) kept.row(row++) = array.row(i);
    }
    return kept;
}

/// Pixel position of a gnomonic point; the pixel y axis points down
struct GnomonicToPixels {
    double x_scale;
    double y_scale;
    double x_offset;
    double y_offset;

    double x(double x_gnomonic) const {
        return x_gnomonic / x_scale + x_offset;
    }
    double y(double y_gnomonic) const {
        return -y_gnomonic / y_scale + y_offset;
    }
};

GnomonicToPixels gnomonic_to_pixels(const EBSDDetector &detector, size_t d) {
    const Vector3d &pc = detector.pc(d);
    return {detector.x_scale(d),
            detector.y_scale(d),
            pc[0] * static_cast<double>(detector.ncols() - 1),
            pc[1] * static_cast<double>(detector.nrows() - 1)};
}
}  // namespace

GeometricalKikuchiPatternSimulation::GeometricalKikuchiPatternSimulation(
  EBSDDetector detector,
  Rotations rotations,
  Reflectors reflectors,
  KikuchiPatternLines lines,
  KikuchiPatternZoneAxes zone_axes)
    : detector_(std::move(detector)),
      rotations_(std::move(rotations)),
      reflectors_(std::move(reflectors)),
      lines_(std::move(lines)),
      zone_axes_(std::move(zone_axes)),
      max_r_gnomonic_(detector_.max_r_max()) {}

LineCoordinates GeometricalKikuchiPatternSimulation::lines_coordinates(
  const NavigationIndex &index,
  CoordinateSpace coordinates,
  bool exclude_nan) const {
    return lines_at(navigation_shape().flat_index(index), coordinates, exclude_nan);
}

PointCoordinates GeometricalKikuchiPatternSimulation::zone_axes_coordinates(
  const NavigationIndex &index,
  CoordinateSpace coordinates,
  bool exclude_nan) const {
    return zone_axes_at(navigation_shape().flat_index(index), coordinates, exclude_nan);
}

std::vector<std::string> GeometricalKikuchiPatternSimulation::zone_axes_labels(
  const NavigationIndex &index) const {
    return labels_at(navigation_shape().flat_index(index));
}

LineCoordinates GeometricalKikuchiPatternSimulation::lines_at(size_t flat,
                                                              CoordinateSpace coordinates,
                                                              bool exclude_nan) const {
    LineCoordinates lines = lines_.plane_trace_coordinates(flat, max_r_gnomonic_);
    if (coordinates == CoordinateSpace::detector) {
        GnomonicToPixels to_pixels =
          gnomonic_to_pixels(detector_, detector_position(detector_, flat));
        for (Eigen::Index i = 0; i < lines.rows(); ++i) {
            lines(i, 0) = to_pixels.x(lines(i, 0));
            lines(i, 1) = to_pixels.y(lines(i, 1));
            lines(i, 2) = to_pixels.x(lines(i, 2));
            lines(i, 3) = to_pixels.y(lines(i, 3));
        }
    }
    return exclude_nan ? drop_nan_rows(lines) : lines;
}

PointCoordinates GeometricalKikuchiPatternSimulation::zone_axes_at(
  size_t flat,
  CoordinateSpace coordinates,
  bool exclude_nan) const {
    PointCoordinates xy = zone_axes_.xy_gnomonic(flat);
    for (Eigen::Index i = 0; i < xy.rows(); ++i) {
        if (std::hypot(xy(i, 0), xy(i, 1)) > max_r_gnomonic_) {
            xy.row(i).setConstant(NaN);
        }
    }
    if (coordinates == CoordinateSpace::detector) {
        GnomonicToPixels to_pixels =
          gnomonic_to_pixels(detector_, detector_position(detector_, flat));
        for (Eigen::Index i = 0; i < xy.rows(); ++i) {
            xy(i, 0) = to_pixels.x(xy(i, 0));
            xy(i, 1) = to_pixels.y(xy(i, 1));
        }
    }
    return exclude_nan ? drop_nan_rows(xy) : xy;
}

std::vector<std::string> GeometricalKikuchiPatternSimulation::labels_at(size_t flat) const {
    PointCoordinates xy = zone_axes_at(flat, CoordinateSpace::gnomonic, false);
    std::vector<std::string> labels;
    for (Eigen::Index i = 0; i < xy.rows(); ++i) {
        if (xy.row(i).array().isNaN().any()) continue;
        labels.push_back(miller_label(zone_axes_.uvw().row(i)));
    }
    return labels;
}

PointCoordinates GeometricalKikuchiPatternSimulation::label_positions(
  const PointCoordinates &zone_axes,
  size_t flat,
  CoordinateSpace coordinates) const {
    PointCoordinates positions = zone_axes;
    if (coordinates == CoordinateSpace::detector) {
        positions.col(1).array() -=
          LABEL_OFFSET * static_cast<double>(detector_.nrows() - 1);
    } else {
        GnomonicBounds bounds =
          detector_.gnomonic_bounds(detector_position(detector_, flat));
        positions.col(1).array() += LABEL_OFFSET * (bounds.y_max - bounds.y_min);
    }
    return positions;
}

PointCoordinates GeometricalKikuchiPatternSimulation::pc_at(
  size_t flat,
  CoordinateSpace coordinates) const {
    PointCoordinates pc(1, 2);
    if (coordinates == CoordinateSpace::gnomonic) {
        // The PC is the origin of the gnomonic plane
        pc << 0.0, 0.0;
    } else {
        pc = pc_xy_offsets().row(detector_position(detector_, flat));
    }
    return pc;
}

OverlayCollections GeometricalKikuchiPatternSimulation::as_collections(
  const NavigationIndex &index,
  const OverlayOptions &options) const {
    size_t flat = navigation_shape().flat_index(index);
    OverlayCollections collections;
    if (options.lines) {
        collections.lines =
          LineSegments{lines_at(flat, options.coordinates, true),
                       merge_style(default_lines_style(), options.lines_style)};
    }
    if (options.zone_axes || options.zone_axes_labels) {
        PointCoordinates xy = zone_axes_at(flat, options.coordinates, true);
        if (options.zone_axes) {
            collections.zone_axes =
              Points{xy, merge_style(default_zone_axes_style(), options.zone_axes_style)};
        }
        if (options.zone_axes_labels) {
            collections.zone_axes_labels =
              Texts{label_positions(xy, flat, options.coordinates),
                    labels_at(flat),
                    merge_style(default_zone_axes_labels_style(),
                                options.zone_axes_labels_style)};
        }
    }
    if (options.pc) {
        collections.pc = Points{pc_at(flat, options.coordinates),
                                merge_style(default_pc_style(), options.pc_style)};
    }
    return collections;
}

std::vector<Marker> GeometricalKikuchiPatternSimulation::as_markers(
  const OverlayOptions &options) const {
    const NavigationShape &shape = navigation_shape();
    size_t n = shape.size();
    const CoordinateSpace pixels = CoordinateSpace::detector;
    std::vector<Marker> markers;

    if (options.lines) {
        Marker marker{MarkerKind::line_segments, shape};
        for (size_t flat = 0; flat < n; ++flat) {
            marker.segments.push_back(lines_at(flat, pixels, true));
        }
        marker.style = merge_style(default_lines_style(), options.lines_style);
        markers.push_back(std::move(marker));
    }
    if (options.zone_axes) {
        Marker marker{MarkerKind::points, shape};
        for (size_t flat = 0; flat < n; ++flat) {
            marker.offsets.push_back(zone_axes_at(flat, pixels, true));
        }
        marker.style = merge_style(default_zone_axes_style(), options.zone_axes_style);
        markers.push_back(std::move(marker));
    }
    if (options.zone_axes_labels) {
        Marker marker{MarkerKind::texts, shape};
        for (size_t flat = 0; flat < n; ++flat) {
            PointCoordinates xy = zone_axes_at(flat, pixels, true);
            marker.offsets.push_back(label_positions(xy, flat, pixels));
            marker.texts.push_back(labels_at(flat));
        }
        marker.style = merge_style(default_zone_axes_labels_style(),
                                   options.zone_axes_labels_style);
        markers.push_back(std::move(marker));
    }
    if (options.pc) {
        Marker marker{MarkerKind::points, shape};
        for (size_t flat = 0; flat < n; ++flat) {
            marker.offsets.push_back(pc_at(flat, pixels));
        }
        marker.style = merge_style(default_pc_style(), options.pc_style);
        markers.push_back(std::move(marker));
    }
    return markers;
}

PointCoordinates GeometricalKikuchiPatternSimulation::pc_xy_offsets() const {
    size_t n = detector_.navigation_shape().size();
    PointCoordinates offsets(n, 2);
    for (size_t d = 0; d < n; ++d) {
        const Vector3d &pc = detector_.pc(d);
        offsets.row(d) << pc[0] * static_cast<double>(detector_.ncols() - 1),
          pc[1] * static_cast<double>(detector_.nrows() - 1);
    }
    return offsets;
}

std::string GeometricalKikuchiPatternSimulation::to_string() const {
    return fmt::format("GeometricalKikuchiPatternSimulation {}:\n{}",
                       navigation_shape().to_string(),
                       reflectors_.to_string());
}
