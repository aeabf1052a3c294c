/**
 * @file master_pattern.cc
 * @brief Master pattern storage and the HDF5 and PNG writers
 */

#include "master_pattern.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#ifdef HAS_HDF5
#include <hdf5.h>
#endif
#ifdef HAS_LODEPNG
#include <lodepng.h>
#endif

#include "fkp_logger.hpp"

MasterPattern::MasterPattern(std::vector<double> data,
                             size_t size,
                             Hemisphere hemisphere,
                             std::string phase_name)
    : data_(std::move(data)),
      size_(size),
      hemisphere_(hemisphere),
      phase_name_(std::move(phase_name)) {
    if (data_.size() != n_hemispheres() * size_ * size_) {
        throw std::invalid_argument(
          fmt::format("Master pattern of {} hemisphere(s) and size {} needs {} values, got {}",
                      n_hemispheres(),
                      size_,
                      n_hemispheres() * size_ * size_,
                      data_.size()));
    }
}

double MasterPattern::max() const {
    if (data_.empty()) return 0.0;
    return *std::max_element(data_.begin(), data_.end());
}

#ifdef HAS_HDF5
namespace {
herr_t write_string_attribute(hid_t object, const char *name, const std::string &value) {
    hid_t type = H5Tcopy(H5T_C_S1);
    H5Tset_size(type, value.size() + 1);
    H5Tset_strpad(type, H5T_STR_NULLTERM);
    hid_t space = H5Screate(H5S_SCALAR);
    hid_t attribute = H5Acreate2(object, name, type, space, H5P_DEFAULT, H5P_DEFAULT);
    herr_t status = attribute < 0 ? -1 : H5Awrite(attribute, type, value.c_str());
    if (attribute >= 0) H5Aclose(attribute);
    H5Sclose(space);
    H5Tclose(type);
    return status;
}
}  // namespace
#endif

void MasterPattern::write_h5(const std::string &path) const {
#ifdef HAS_HDF5
    hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file < 0) {
        throw std::runtime_error(fmt::format("Could not create HDF5 file {}", path));
    }
    hsize_t dims[3] = {n_hemispheres(), size_, size_};
    hid_t space = H5Screate_simple(3, dims, nullptr);
    hid_t dataset = H5Dcreate2(file,
                               "/master_pattern",
                               H5T_NATIVE_DOUBLE,
                               space,
                               H5P_DEFAULT,
                               H5P_DEFAULT,
                               H5P_DEFAULT);
    herr_t status = dataset < 0 ? -1
                                : H5Dwrite(dataset,
                                           H5T_NATIVE_DOUBLE,
                                           H5S_ALL,
                                           H5S_ALL,
                                           H5P_DEFAULT,
                                           data_.data());
    if (status >= 0) {
        status = write_string_attribute(dataset, "hemisphere", to_string(hemisphere_));
    }
    if (status >= 0) {
        status = write_string_attribute(dataset, "projection", to_string(projection()));
    }
    if (status >= 0) {
        status = write_string_attribute(dataset, "phase", phase_name_);
    }
    if (dataset >= 0) H5Dclose(dataset);
    H5Sclose(space);
    H5Fclose(file);
    if (status < 0) {
        throw std::runtime_error(fmt::format("Failed to write master pattern to {}", path));
    }
    logger.info("Wrote master pattern of shape ({}, {}, {}) to {}",
                n_hemispheres(),
                size_,
                size_,
                path);
#else
    throw std::runtime_error(fmt::format(
      "Cannot write {}: HDF5 support was not compiled into this build", path));
#endif
}

void MasterPattern::write_png(const std::string &path) const {
#ifdef HAS_LODEPNG
    size_t width = size_ * n_hemispheres();
    std::vector<unsigned char> image(width * size_);
    double maximum = max();
    double scale = maximum > 0 ? 255.0 / maximum : 0.0;
    for (size_t h = 0; h < n_hemispheres(); ++h) {
        for (size_t row = 0; row < size_; ++row) {
            for (size_t col = 0; col < size_; ++col) {
                double value = std::clamp((*this)(h, row, col) * scale, 0.0, 255.0);
                image[row * width + h * size_ + col] =
                  static_cast<unsigned char>(std::lround(value));
            }
        }
    }
    unsigned error = lodepng::encode(path,
                                     image,
                                     static_cast<unsigned>(width),
                                     static_cast<unsigned>(size_),
                                     LCT_GREY,
                                     8);
    if (error) {
        throw std::runtime_error(
          fmt::format("Failed to write {}: {}", path, lodepng_error_text(error)));
    }
    logger.info("Wrote {}x{} master pattern image to {}", width, size_, path);
#else
    throw std::runtime_error(fmt::format(
      "Cannot write {}: PNG support was not compiled into this build", path));
#endif
}
