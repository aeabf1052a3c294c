/**
 * @file kikuchi_pattern_simulator.cc
 * @brief Projection onto a detector, master patterns and reflector traces
 */

#include "kikuchi_pattern_simulator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>
#include <stdexcept>

#include "common.hpp"
#include "fkp_logger.hpp"
#include "frame_transforms.hpp"
#include "master_pattern_kernel.hpp"
#include "visibility.hpp"
#include "zone_axes.hpp"

namespace {
/// steps x 3 points on the circle at `opening_angle` from the unit vector g
Eigen::MatrixXd circle(const Eigen::Vector3d &g, double opening_angle, size_t steps) {
    // Any axis not parallel to g spans the circle plane with it
    Eigen::Index least;
    g.cwiseAbs().minCoeff(&least);
    Eigen::Vector3d e1 = g.cross(Eigen::Vector3d::Unit(least)).normalized();
    Eigen::Vector3d e2 = g.cross(e1);

    Eigen::MatrixXd points(steps, 3);
    double c = std::cos(opening_angle);
    double s = std::sin(opening_angle);
    for (size_t k = 0; k < steps; ++k) {
        double t = steps > 1 ? 2 * std::numbers::pi * k / (steps - 1) : 0.0;
        Eigen::Vector3d v = c * g + s * (std::cos(t) * e1 + std::sin(t) * e2);
        points.row(k) = v.transpose();
    }
    return points;
}

Eigen::MatrixXd stereographic(const Eigen::MatrixXd &sphere, Hemisphere hemisphere) {
    double sign = hemisphere == Hemisphere::upper ? 1.0 : -1.0;
    Eigen::MatrixXd xy(sphere.rows(), 2);
    for (Eigen::Index k = 0; k < sphere.rows(); ++k) {
        double z = sign * sphere(k, 2);
        if (z < -HEMISPHERE_ATOL) {
            xy.row(k).setConstant(std::numeric_limits<double>::quiet_NaN());
        } else {
            xy.row(k) << sphere(k, 0) / (1 + z), sphere(k, 1) / (1 + z);
        }
    }
    return xy;
}
}  // namespace

KikuchiPatternSimulator::KikuchiPatternSimulator(const Reflectors &reflectors,
                                                 size_t nthreads)
    : reflectors_(reflectors), nthreads_(std::max<size_t>(1, nthreads)) {}

std::string KikuchiPatternSimulator::to_string() const {
    return "KikuchiPatternSimulator:\n" + reflectors_.to_string();
}

std::vector<double> KikuchiPatternSimulator::intensities(Scaling scaling) const {
    std::vector<double> intensity(reflectors_.size(), 1.0);
    if (scaling == Scaling::none) return intensity;
    const auto &factors = reflectors_.structure_factor();
    for (size_t i = 0; i < intensity.size(); ++i) {
        double magnitude = std::abs(factors[i]);
        intensity[i] = scaling == Scaling::square ? magnitude * magnitude : magnitude;
    }
    return intensity;
}

GeometricalKikuchiPatternSimulation KikuchiPatternSimulator::on_detector(
  const EBSDDetector &detector,
  const Rotations &rotations) const {
    const NavigationShape &det_shape = detector.navigation_shape();
    if (det_shape != NavigationShape(1) && det_shape != rotations.shape()) {
        throw std::invalid_argument(fmt::format(
          "Detector navigation shape {} must be (1,) or equal to the rotations' "
          "navigation shape {}",
          det_shape.to_string(),
          rotations.shape().to_string()));
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    const Phase &phase = reflectors_.phase();
    size_t n_nav = rotations.size();
    std::vector<Matrix3d> u_os = crystal_to_detector(rotations, detector_to_sample(detector));
    logger.info("Projecting {} reflectors onto {} pattern(s) with {} thread(s)",
                reflectors_.size(),
                n_nav,
                nthreads_);

    // Existence test on the z components alone
    const Vectors3d &hkl = reflectors_.hkl();
    Eigen::MatrixXd z_hkl(n_nav, hkl.rows());
    parallel_for_blocks(n_nav, nthreads_, [&](size_t begin, size_t end) {
        for (size_t p = begin; p < end; ++p) {
            Eigen::Vector3d z_axis = reciprocal_to_detector(phase, u_os[p]).col(2);
            z_hkl.row(p) = (hkl * z_axis).transpose();
        }
    });
    std::vector<bool> keep_lines = in_some_pattern(upper_hemisphere(z_hkl));
    Reflectors visible = reflectors_.subset(keep_lines);
    logger.debug("{} of {} reflectors are in some pattern", visible.size(), reflectors_.size());

    Vectors3d uvw = zone_axes_from_reflectors(visible);
    std::vector<Vectors3d> uvw_detector(n_nav);
    parallel_for_blocks(n_nav, nthreads_, [&](size_t begin, size_t end) {
        for (size_t p = begin; p < end; ++p) {
            uvw_detector[p] = transform_rows(uvw, direct_to_detector(phase, u_os[p]));
        }
    });
    // On the detector implies upper, so this is also any(upper) && any(within)
    Mask zone_axes_in_pattern =
      upper_hemisphere(uvw_detector) && within_gnomonic_bounds(uvw_detector, detector);
    std::vector<bool> keep_zone_axes = in_some_pattern(zone_axes_in_pattern);
    for (auto &vectors : uvw_detector) {
        vectors = select_rows(vectors, keep_zone_axes);
    }
    Vectors3d visible_uvw = select_rows(uvw, keep_zone_axes);
    logger.debug("{} of {} zone axes are in some pattern", visible_uvw.rows(), uvw.rows());

    // Full coordinates of the surviving reflectors only
    const Vectors3d &visible_hkl = visible.hkl();
    std::vector<Vectors3d> hkl_detector(n_nav);
    parallel_for_blocks(n_nav, nthreads_, [&](size_t begin, size_t end) {
        for (size_t p = begin; p < end; ++p) {
            hkl_detector[p] =
              transform_rows(visible_hkl, reciprocal_to_detector(phase, u_os[p]));
        }
    });
    Mask lines_in_pattern = upper_hemisphere(hkl_detector);

    KikuchiPatternLines lines(
      visible, rotations.shape(), std::move(hkl_detector), std::move(lines_in_pattern));
    KikuchiPatternZoneAxes zone_axes(visible_uvw,
                                     rotations.shape(),
                                     std::move(uvw_detector),
                                     select_columns(zone_axes_in_pattern, keep_zone_axes));

    double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(
                       std::chrono::high_resolution_clock::now() - start_time)
                       .count();
    logger.info("Projected {} lines and {} zone axes in {}",
                lines.size(),
                zone_axes.size(),
                format_seconds(elapsed));
    return GeometricalKikuchiPatternSimulation(
      detector, rotations, std::move(visible), std::move(lines), std::move(zone_axes));
}

MasterPattern KikuchiPatternSimulator::calculate_master_pattern(size_t half_size,
                                                                Hemisphere hemisphere,
                                                                Scaling scaling) const {
    if (!reflectors_.has_structure_factor()) {
        throw std::invalid_argument(
          "Master pattern needs structure factors, calculate them with "
          "Reflectors::calculate_structure_factor()");
    }
    const std::vector<double> &theta = reflectors_.theta();
    std::vector<double> intensity = intensities(scaling);
    Vectors3d unit = reflectors_.unit_vectors();

    size_t size = 2 * half_size + 1;
    std::vector<Hemisphere> hemispheres;
    if (hemisphere == Hemisphere::both) {
        hemispheres = {Hemisphere::upper, Hemisphere::lower};
    } else {
        hemispheres = {hemisphere};
    }
    logger.info(
      "Calculating {} master pattern(s) of size ({}, {}) from {} reflectors, scaling {}",
      hemispheres.size(),
      size,
      size,
      reflectors_.size(),
      ::to_string(scaling));

    auto start_time = std::chrono::high_resolution_clock::now();
    std::vector<double> data;
    data.reserve(hemispheres.size() * size * size);
    for (Hemisphere h : hemispheres) {
        Vectors3d grid = inverse_stereographic_grid(half_size, h);
        std::vector<double> pattern =
          kinematical_band_intensities(grid, unit, theta, intensity, nthreads_);
        data.insert(data.end(), pattern.begin(), pattern.end());
        logger.debug("Finished {} hemisphere", ::to_string(h));
    }
    double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(
                       std::chrono::high_resolution_clock::now() - start_time)
                       .count();
    logger.info("Master pattern done in {}", format_seconds(elapsed));
    return MasterPattern(std::move(data), size, hemisphere, phase().name());
}

std::vector<ReflectorTrace> KikuchiPatternSimulator::reflector_traces(
  Projection projection,
  TraceMode mode,
  Hemisphere hemisphere,
  Scaling scaling,
  size_t steps,
  std::array<double, 3> color) const {
    if (mode == TraceMode::bands && !reflectors_.has_theta()) {
        throw std::invalid_argument(
          "Bands need Bragg angles, calculate them with Reflectors::calculate_theta()");
    }
    if (steps < 2) {
        throw std::invalid_argument("A trace needs at least two steps");
    }
    std::vector<double> intensity = intensities(scaling);
    double maximum = intensity.empty()
                       ? 1.0
                       : *std::max_element(intensity.begin(), intensity.end());

    std::vector<size_t> order(reflectors_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return intensity[a] < intensity[b];
    });

    std::vector<Hemisphere> hemispheres;
    if (projection == Projection::spherical) {
        hemispheres = {Hemisphere::both};
    } else if (hemisphere == Hemisphere::both) {
        hemispheres = {Hemisphere::upper, Hemisphere::lower};
    } else {
        hemispheres = {hemisphere};
    }

    Vectors3d unit = reflectors_.unit_vectors();
    std::vector<ReflectorTrace> traces;
    for (Hemisphere h : hemispheres) {
        for (size_t i : order) {
            double alpha = maximum > 0 ? intensity[i] / maximum : 0.0;
            std::vector<double> opening_angles;
            if (mode == TraceMode::lines) {
                opening_angles = {std::numbers::pi / 2};
            } else {
                double theta = reflectors_.theta()[i];
                opening_angles = {std::numbers::pi / 2 - theta, std::numbers::pi / 2 + theta};
            }
            for (double angle : opening_angles) {
                Eigen::MatrixXd points = circle(unit.row(i).transpose(), angle, steps);
                if (projection == Projection::stereographic) {
                    points = stereographic(points, h);
                }
                traces.push_back(ReflectorTrace{reflectors_.miller(i),
                                                h,
                                                std::move(points),
                                                {color[0], color[1], color[2], alpha}});
            }
        }
    }
    logger.debug("{} traces of {} reflectors", traces.size(), reflectors_.size());
    return traces;
}
