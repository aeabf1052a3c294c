/**
 * @file zone_axes.cc
 * @brief Zone axes from pairs of reflectors, reduced to smallest integers
 */

#include "zone_axes.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

#include "common.hpp"
#include "fkp_logger.hpp"

Eigen::RowVector3d reduce_to_smallest_integers(const Eigen::RowVector3d &uvw,
                                               int max_index) {
    double largest = uvw.cwiseAbs().maxCoeff();
    if (largest < HEMISPHERE_ATOL) {
        throw std::invalid_argument("Cannot reduce the null vector to integers");
    }
    Eigen::RowVector3d direction = uvw / largest;
    Eigen::RowVector3d unit = uvw.normalized();

    Eigen::RowVector3d best = direction.array().round();
    double best_deviation = std::numeric_limits<double>::infinity();
    for (int n = 1; n <= max_index; ++n) {
        Eigen::RowVector3d candidate = (direction * n).array().round();
        if (candidate.squaredNorm() == 0) continue;
        double cosine = std::clamp(candidate.normalized().dot(unit), -1.0, 1.0);
        double deviation = std::acos(cosine);
        if (deviation < REDUCTION_ATOL) {
            return candidate;
        }
        if (deviation < best_deviation) {
            best = candidate;
            best_deviation = deviation;
        }
    }
    logger.warn(
      "Direction [{:.4f} {:.4f} {:.4f}] has no integer form with indices up to {}, "
      "using [{} {} {}] which deviates by {:.3g} deg",
      uvw[0],
      uvw[1],
      uvw[2],
      max_index,
      best[0],
      best[1],
      best[2],
      best_deviation * RAD2DEG);
    return best;
}

Vectors3d zone_axes_from_reflectors(const Reflectors &reflectors) {
    const Vectors3d &hkl = reflectors.hkl();
    std::set<std::array<double, 3>> unique;
    for (Eigen::Index i = 0; i < hkl.rows(); ++i) {
        Eigen::Vector3d a = hkl.row(i).transpose();
        for (Eigen::Index j = i + 1; j < hkl.rows(); ++j) {
            Eigen::Vector3d b = hkl.row(j).transpose();
            Eigen::RowVector3d uvw = a.cross(b).transpose();
            if (uvw.cwiseAbs().maxCoeff() < HEMISPHERE_ATOL) continue;
            // b x a is the opposite direction of a x b
            Eigen::RowVector3d reduced = reduce_to_smallest_integers(uvw);
            // Adding 0.0 turns negative zeros positive
            unique.insert({reduced[0] + 0.0, reduced[1] + 0.0, reduced[2] + 0.0});
            unique.insert({0.0 - reduced[0], 0.0 - reduced[1], 0.0 - reduced[2]});
        }
    }
    Vectors3d zone_axes(unique.size(), 3);
    Eigen::Index row = 0;
    for (const auto &uvw : unique) {
        zone_axes.row(row++) << uvw[0], uvw[1], uvw[2];
    }
    logger.debug("{} unique zone axes from {} reflectors", unique.size(), hkl.rows());
    return zone_axes;
}

std::string miller_label(const Eigen::RowVector3d &uvw) {
    std::string label = "[";
    for (int i = 0; i < 3; ++i) {
        long index = std::lround(uvw[i]);
        if (index < 0) {
            label += fmt::format("\\bar{{{}}}", -index);
        } else {
            label += fmt::format("{}", index);
        }
    }
    return label + "]";
}
