/**
 * @file ebsd_detector.cc
 * @brief EBSD detector geometry, projection centres and gnomonic bounds
 */

#include "ebsd_detector.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

EBSDDetector::EBSDDetector(size_t nrows,
                           size_t ncols,
                           std::vector<Vector3d> pc,
                           NavigationShape navigation_shape,
                           double sample_tilt,
                           double tilt,
                           double azimuthal,
                           double px_size,
                           int binning)
    : nrows_(nrows),
      ncols_(ncols),
      pc_(std::move(pc)),
      navigation_shape_(navigation_shape),
      sample_tilt_(sample_tilt),
      tilt_(tilt),
      azimuthal_(azimuthal),
      px_size_(px_size),
      binning_(binning) {
    validate();
}

EBSDDetector::EBSDDetector(const json &detector_data)
    : nrows_(0),
      ncols_(0),
      pc_{Vector3d(0.5, 0.5, 0.5)},
      navigation_shape_(1),
      sample_tilt_(70.0),
      tilt_(0.0),
      azimuthal_(0.0),
      px_size_(1.0),
      binning_(1) {
    if (detector_data.find("shape") == detector_data.end()) {
        throw std::invalid_argument("Key shape is missing from the input detector JSON");
    }
    auto shape = detector_data["shape"].get<std::vector<size_t>>();
    if (shape.size() != 2) {
        throw std::invalid_argument("Detector shape must be [nrows, ncols]");
    }
    nrows_ = shape[0];
    ncols_ = shape[1];

    if (detector_data.contains("pc")) {
        const json &pc_data = detector_data["pc"];
        pc_.clear();
        if (!pc_data.empty() && pc_data[0].is_number()) {
            auto pc = pc_data.get<std::array<double, 3>>();
            pc_.emplace_back(pc[0], pc[1], pc[2]);
        } else {
            for (const auto &row : pc_data) {
                auto pc = row.get<std::array<double, 3>>();
                pc_.emplace_back(pc[0], pc[1], pc[2]);
            }
        }
        navigation_shape_ = NavigationShape(pc_.size());
    }
    if (detector_data.contains("navigation_shape")) {
        auto dims = detector_data["navigation_shape"].get<std::vector<size_t>>();
        if (dims.size() == 1) {
            navigation_shape_ = NavigationShape(dims[0]);
        } else if (dims.size() == 2) {
            navigation_shape_ = NavigationShape(dims[0], dims[1]);
        } else {
            throw std::invalid_argument(
              "Detector navigation_shape must have one or two dimensions");
        }
    }
    sample_tilt_ = detector_data.value("sample_tilt", sample_tilt_);
    tilt_ = detector_data.value("tilt", tilt_);
    azimuthal_ = detector_data.value("azimuthal", azimuthal_);
    px_size_ = detector_data.value("px_size", px_size_);
    binning_ = detector_data.value("binning", binning_);
    validate();
}

json EBSDDetector::to_json() const {
    json detector_data;
    detector_data["shape"] = {nrows_, ncols_};
    json pc_data = json::array();
    for (const auto &pc : pc_) {
        pc_data.push_back({pc[0], pc[1], pc[2]});
    }
    detector_data["pc"] = pc_data;
    std::vector<size_t> dims;
    for (size_t axis = 0; axis < navigation_shape_.ndim(); ++axis) {
        dims.push_back(navigation_shape_[axis]);
    }
    detector_data["navigation_shape"] = dims;
    detector_data["sample_tilt"] = sample_tilt_;
    detector_data["tilt"] = tilt_;
    detector_data["azimuthal"] = azimuthal_;
    detector_data["px_size"] = px_size_;
    detector_data["binning"] = binning_;
    return detector_data;
}

void EBSDDetector::validate() const {
    if (nrows_ < 2 || ncols_ < 2) {
        throw std::invalid_argument(fmt::format(
          "Detector shape ({}, {}) must have at least two rows and columns",
          nrows_,
          ncols_));
    }
    if (pc_.empty() || pc_.size() != navigation_shape_.size()) {
        throw std::invalid_argument(
          fmt::format("{} projection centres do not fill the navigation shape {}",
                      pc_.size(),
                      navigation_shape_.to_string()));
    }
    for (const auto &pc : pc_) {
        if (!(pc[2] > 0)) {
            throw std::invalid_argument(
              fmt::format("Projection centre distance pcz must be positive, got {}",
                          pc[2]));
        }
    }
    if (px_size_ <= 0 || binning_ < 1) {
        throw std::invalid_argument(
          "Detector pixel size must be positive and binning at least 1");
    }
}

Vector3d EBSDDetector::pc_average() const {
    Vector3d sum = Vector3d::Zero();
    for (const auto &pc : pc_) sum += pc;
    return sum / static_cast<double>(pc_.size());
}

GnomonicBounds EBSDDetector::gnomonic_bounds(size_t flat) const {
    const Vector3d &pc = pc_.at(flat);
    double a = aspect_ratio();
    return {-a * pc[0] / pc[2],
            a * (1.0 - pc[0]) / pc[2],
            -(1.0 - pc[1]) / pc[2],
            pc[1] / pc[2]};
}

double EBSDDetector::x_scale(size_t flat) const {
    GnomonicBounds bounds = gnomonic_bounds(flat);
    return (bounds.x_max - bounds.x_min) / static_cast<double>(ncols_ - 1);
}

double EBSDDetector::y_scale(size_t flat) const {
    GnomonicBounds bounds = gnomonic_bounds(flat);
    return (bounds.y_max - bounds.y_min) / static_cast<double>(nrows_ - 1);
}

double EBSDDetector::r_max(size_t flat) const {
    GnomonicBounds b = gnomonic_bounds(flat);
    double corners[4] = {std::hypot(b.x_min, b.y_min),
                         std::hypot(b.x_min, b.y_max),
                         std::hypot(b.x_max, b.y_min),
                         std::hypot(b.x_max, b.y_max)};
    return *std::max_element(std::begin(corners), std::end(corners));
}

double EBSDDetector::max_r_max() const {
    double largest = 0.0;
    for (size_t i = 0; i < pc_.size(); ++i) {
        largest = std::max(largest, r_max(i));
    }
    return largest;
}

std::string EBSDDetector::to_string() const {
    Vector3d pc = pc_average();
    return fmt::format(
      "EBSDDetector ({}, {}), px_size {} um, binning {}, tilt {}, azimuthal {}, "
      "pc ({:.3g}, {:.3g}, {:.3g})",
      nrows_,
      ncols_,
      px_size_,
      binning_,
      tilt_,
      azimuthal_,
      pc[0],
      pc[1],
      pc[2]);
}
