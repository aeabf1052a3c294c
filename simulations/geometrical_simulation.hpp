/**
 * @file geometrical_simulation.hpp
 * @brief Kikuchi lines and zone axes projected onto a detector for a
 * batch of crystal orientations.
 */
#pragma once

#include <string>
#include <vector>

#include "ebsd_detector.hpp"
#include "kikuchi_pattern_features.hpp"
#include "overlays.hpp"
#include "reflectors.hpp"
#include "rotations.hpp"
#include "simulation_options.hpp"

/**
 * @brief Result of KikuchiPatternSimulator::on_detector.
 *
 * Holds copies of the detector, the rotations, the reflectors visible in
 * at least one pattern and the lines and zone axes derived from them.
 * Nothing changes after construction, so every query is a pure function
 * of the stored arrays.
 *
 * Queries take a navigation index whose rank matches the navigation
 * shape. The default index addresses the first pattern.
 */
class GeometricalKikuchiPatternSimulation {
  public:
    GeometricalKikuchiPatternSimulation(EBSDDetector detector,
                                        Rotations rotations,
                                        Reflectors reflectors,
                                        KikuchiPatternLines lines,
                                        KikuchiPatternZoneAxes zone_axes);

    const NavigationShape &navigation_shape() const {
        return rotations_.shape();
    }
    const EBSDDetector &detector() const {
        return detector_;
    }
    const Rotations &rotations() const {
        return rotations_;
    }
    const Reflectors &reflectors() const {
        return reflectors_;
    }
    const KikuchiPatternLines &lines() const {
        return lines_;
    }
    const KikuchiPatternZoneAxes &zone_axes() const {
        return zone_axes_;
    }
    /// Gnomonic radius lines are cut at and zone axes are kept within
    double max_r_gnomonic() const {
        return max_r_gnomonic_;
    }

    /**
     * @brief Start and end points of the Kikuchi lines in one pattern.
     *
     * A line is the chord of its plane trace with the circle of radius
     * max_r_gnomonic(). Rows of lines not in the pattern, or whose trace
     * misses the circle, are NaN.
     *
     * @param index Pattern to get lines of
     * @param coordinates Detector pixels or gnomonic units
     * @param exclude_nan Drop NaN rows
     * @throws std::out_of_range if the index does not fit the navigation shape
     */
    LineCoordinates lines_coordinates(const NavigationIndex &index = {},
                                      CoordinateSpace coordinates = CoordinateSpace::detector,
                                      bool exclude_nan = true) const;

    /**
     * @brief Zone axis positions in one pattern.
     *
     * Rows of zone axes not in the pattern or outside max_r_gnomonic()
     * are NaN.
     */
    PointCoordinates zone_axes_coordinates(
      const NavigationIndex &index = {},
      CoordinateSpace coordinates = CoordinateSpace::detector,
      bool exclude_nan = true) const;

    /// Labels of the zone axes returned by zone_axes_coordinates(index)
    std::vector<std::string> zone_axes_labels(const NavigationIndex &index = {}) const;

    /// Overlays of the features in one pattern
    OverlayCollections as_collections(const NavigationIndex &index = {},
                                      const OverlayOptions &options = {}) const;

    /// Overlays of the features in every pattern, one marker per feature kind
    std::vector<Marker> as_markers(const OverlayOptions &options = {}) const;

    /// PC in pixels, one row (x, y) per detector navigation position
    PointCoordinates pc_xy_offsets() const;

    /// "GeometricalKikuchiPatternSimulation (2, 3):" and the reflectors
    std::string to_string() const;

  private:
    LineCoordinates lines_at(size_t flat, CoordinateSpace coordinates, bool exclude_nan) const;
    PointCoordinates zone_axes_at(size_t flat,
                                  CoordinateSpace coordinates,
                                  bool exclude_nan) const;
    std::vector<std::string> labels_at(size_t flat) const;
    /// Zone axis label anchors, 3 % of the detector height above the axes
    PointCoordinates label_positions(const PointCoordinates &zone_axes,
                                     size_t flat,
                                     CoordinateSpace coordinates) const;
    PointCoordinates pc_at(size_t flat, CoordinateSpace coordinates) const;

    EBSDDetector detector_;
    Rotations rotations_;
    Reflectors reflectors_;
    KikuchiPatternLines lines_;
    KikuchiPatternZoneAxes zone_axes_;
    double max_r_gnomonic_;
};
