/**
 * @file kikuchi_pattern_features.hpp
 * @brief Kikuchi lines and zone axes in the detector frame of every
 * pattern in a batch.
 */
#pragma once

#include <Eigen/Dense>
#include <vector>

#include "navigation.hpp"
#include "reflectors.hpp"
#include "vectors.hpp"

/// n x 4 start and end points (x0, y0, x1, y1), one line per row
using LineCoordinates = Eigen::Matrix<double, Eigen::Dynamic, 4, Eigen::RowMajor>;
/// n x 2 points, one per row
using PointCoordinates = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;

/**
 * @brief Vectors in the detector frame with per-pattern visibility.
 *
 * Holds one n x 3 array per navigation position and an in-pattern flag
 * per position and vector.
 */
class KikuchiPatternFeature {
  public:
    KikuchiPatternFeature(NavigationShape navigation_shape,
                          std::vector<Vectors3d> vectors_detector,
                          Mask in_pattern);

    const NavigationShape &navigation_shape() const {
        return navigation_shape_;
    }
    size_t size() const {
        return static_cast<size_t>(in_pattern_.cols());
    }
    const Vectors3d &vectors_detector(size_t flat) const {
        return vectors_detector_.at(flat);
    }
    const Mask &in_pattern() const {
        return in_pattern_;
    }
    bool in_pattern(size_t flat, size_t i) const {
        return in_pattern_(flat, i);
    }
    /// Flags of vectors in at least one pattern
    std::vector<bool> in_some_pattern() const;

  protected:
    NavigationShape navigation_shape_;
    std::vector<Vectors3d> vectors_detector_;
    Mask in_pattern_;
};

/// Kikuchi lines, the plane traces of reflectors on the detector
class KikuchiPatternLines : public KikuchiPatternFeature {
  public:
    KikuchiPatternLines(Reflectors reflectors,
                        NavigationShape navigation_shape,
                        std::vector<Vectors3d> vectors_detector,
                        Mask in_pattern);

    const Reflectors &reflectors() const {
        return reflectors_;
    }

    /**
     * @brief Gnomonic chords of the plane traces with the circle of
     * radius `r_max` at one navigation position.
     *
     * A row is NaN where the line is not in the pattern or its trace
     * does not cut the circle.
     */
    LineCoordinates plane_trace_coordinates(size_t flat, double r_max) const;

  private:
    Reflectors reflectors_;
};

/// Zone axes, the gnomonic projections of direct lattice directions
class KikuchiPatternZoneAxes : public KikuchiPatternFeature {
  public:
    KikuchiPatternZoneAxes(Vectors3d uvw,
                           NavigationShape navigation_shape,
                           std::vector<Vectors3d> vectors_detector,
                           Mask in_pattern);

    const Vectors3d &uvw() const {
        return uvw_;
    }

    /**
     * @brief Gnomonic coordinates at one navigation position.
     *
     * A row is NaN where the zone axis is not in the pattern.
     */
    PointCoordinates xy_gnomonic(size_t flat) const;

  private:
    Vectors3d uvw_;
};
