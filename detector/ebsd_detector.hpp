/**
 * @file ebsd_detector.hpp
 * @brief EBSD detector geometry with one projection centre per
 * navigation position.
 */
#pragma once

#include <Eigen/Dense>
#include <array>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "navigation.hpp"

using Eigen::Vector3d;
using json = nlohmann::json;

/// Detector extent on the gnomonic plane at one navigation position
struct GnomonicBounds {
    double x_min;
    double x_max;
    double y_min;
    double y_max;
};

/**
 * @brief Flat EBSD detector.
 *
 * Projection centres (PCs) follow the Bruker convention: pcx and pcy are
 * fractions of the detector width and height measured from the top
 * left corner, pcz is the sample-detector distance as a fraction of the
 * height. Angles are in degrees.
 */
class EBSDDetector {
  public:
    /**
     * @param nrows Number of pixel rows (at least 2)
     * @param ncols Number of pixel columns (at least 2)
     * @param pc Projection centres, one per navigation position
     * @param navigation_shape Shape of the PC array, (1,) for one PC
     * @throws std::invalid_argument for a bad shape or PC array
     */
    EBSDDetector(size_t nrows,
                 size_t ncols,
                 std::vector<Vector3d> pc = {Vector3d(0.5, 0.5, 0.5)},
                 NavigationShape navigation_shape = NavigationShape(1),
                 double sample_tilt = 70.0,
                 double tilt = 0.0,
                 double azimuthal = 0.0,
                 double px_size = 1.0,
                 int binning = 1);
    /**
     * @brief Construct from JSON.
     *
     * Required key "shape" ([nrows, ncols]). Optional keys "pc" (one
     * [pcx, pcy, pcz] or a list of them), "navigation_shape",
     * "sample_tilt", "tilt", "azimuthal", "px_size" and "binning".
     */
    explicit EBSDDetector(const json &detector_data);
    json to_json() const;

    size_t nrows() const {
        return nrows_;
    }
    size_t ncols() const {
        return ncols_;
    }
    /// Number of pixels
    size_t size() const {
        return nrows_ * ncols_;
    }
    double aspect_ratio() const {
        return static_cast<double>(ncols_) / static_cast<double>(nrows_);
    }
    double sample_tilt() const {
        return sample_tilt_;
    }
    double tilt() const {
        return tilt_;
    }
    double azimuthal() const {
        return azimuthal_;
    }
    double px_size() const {
        return px_size_;
    }
    int binning() const {
        return binning_;
    }
    /// Bunge Euler angles (degrees) of the detector in the sample frame
    Vector3d euler() const {
        return {azimuthal_, 90.0 + tilt_, 0.0};
    }

    const NavigationShape &navigation_shape() const {
        return navigation_shape_;
    }
    const std::vector<Vector3d> &pc() const {
        return pc_;
    }
    const Vector3d &pc(size_t flat) const {
        return pc_.at(flat);
    }
    Vector3d pc_average() const;

    GnomonicBounds gnomonic_bounds(size_t flat) const;
    /// Width of one pixel in gnomonic units
    double x_scale(size_t flat) const;
    /// Height of one pixel in gnomonic units
    double y_scale(size_t flat) const;
    /// Largest gnomonic radius of the four detector corners
    double r_max(size_t flat) const;
    /// Largest r_max over all navigation positions
    double max_r_max() const;

    std::string to_string() const;

  private:
    void validate() const;

    size_t nrows_;
    size_t ncols_;
    std::vector<Vector3d> pc_;
    NavigationShape navigation_shape_;
    double sample_tilt_;
    double tilt_;
    double azimuthal_;
    double px_size_;
    int binning_;
};
