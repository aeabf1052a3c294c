/**
 * @file kikuchi_pattern_features.cc
 * @brief Kikuchi line and zone axis positions on the detector
 */

#include "kikuchi_pattern_features.hpp"

#include <fmt/core.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

#include "visibility.hpp"

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

KikuchiPatternFeature::KikuchiPatternFeature(NavigationShape navigation_shape,
                                             std::vector<Vectors3d> vectors_detector,
                                             Mask in_pattern)
    : navigation_shape_(navigation_shape),
      vectors_detector_(std::move(vectors_detector)),
      in_pattern_(std::move(in_pattern)) {
    if (vectors_detector_.size() != navigation_shape_.size()
        || static_cast<size_t>(in_pattern_.rows()) != navigation_shape_.size()) {
        throw std::invalid_argument(
          fmt::format("Feature arrays for {} and {} positions do not match navigation "
                      "shape {}",
                      vectors_detector_.size(),
                      in_pattern_.rows(),
                      navigation_shape_.to_string()));
    }
    for (const auto &vectors : vectors_detector_) {
        if (vectors.rows() != in_pattern_.cols()) {
            throw std::invalid_argument(
              "Every navigation position must hold one vector per feature");
        }
    }
}

std::vector<bool> KikuchiPatternFeature::in_some_pattern() const {
    return ::in_some_pattern(in_pattern_);
}

KikuchiPatternLines::KikuchiPatternLines(Reflectors reflectors,
                                         NavigationShape navigation_shape,
                                         std::vector<Vectors3d> vectors_detector,
                                         Mask in_pattern)
    : KikuchiPatternFeature(
      navigation_shape, std::move(vectors_detector), std::move(in_pattern)),
      reflectors_(std::move(reflectors)) {
    if (reflectors_.size() != size()) {
        throw std::invalid_argument("Kikuchi lines need one reflector per line");
    }
}

LineCoordinates KikuchiPatternLines::plane_trace_coordinates(size_t flat,
                                                             double r_max) const {
    const Vectors3d &v = vectors_detector(flat);
    LineCoordinates lines(size(), 4);
    for (size_t i = 0; i < size(); ++i) {
        double rho = std::hypot(v(i, 0), v(i, 1));
        // Distance from the PC to the trace, the Hesse normal form of the line
        double hesse = rho > HEMISPHERE_ATOL ? v(i, 2) / rho
                                             : std::numeric_limits<double>::infinity();
        if (!in_pattern(flat, i) || hesse >= r_max) {
            lines.row(i).setConstant(NaN);
            continue;
        }
        double alpha = std::acos(hesse / r_max);
        double azimuth = std::atan2(v(i, 1), v(i, 0));
        double a1 = azimuth - std::numbers::pi + alpha;
        double a2 = azimuth - std::numbers::pi - alpha;
        lines.row(i) << r_max * std::cos(a1), r_max * std::sin(a1),
          r_max * std::cos(a2), r_max * std::sin(a2);
    }
    return lines;
}

KikuchiPatternZoneAxes::KikuchiPatternZoneAxes(Vectors3d uvw,
                                               NavigationShape navigation_shape,
                                               std::vector<Vectors3d> vectors_detector,
                                               Mask in_pattern)
    : KikuchiPatternFeature(
      navigation_shape, std::move(vectors_detector), std::move(in_pattern)),
      uvw_(std::move(uvw)) {
    if (static_cast<size_t>(uvw_.rows()) != size()) {
        throw std::invalid_argument("Zone axes need one uvw triplet per axis");
    }
}

PointCoordinates KikuchiPatternZoneAxes::xy_gnomonic(size_t flat) const {
    const Vectors3d &v = vectors_detector(flat);
    PointCoordinates xy(size(), 2);
    for (size_t i = 0; i < size(); ++i) {
        if (!in_pattern(flat, i) || v(i, 2) <= HEMISPHERE_ATOL) {
            xy.row(i).setConstant(NaN);
            continue;
        }
        xy.row(i) << v(i, 0) / v(i, 2), v(i, 1) / v(i, 2);
    }
    return xy;
}
