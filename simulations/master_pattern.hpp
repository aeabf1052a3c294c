/**
 * @file master_pattern.hpp
 * @brief Kinematical master pattern in the stereographic projection.
 */
#pragma once

#include <string>
#include <vector>

#include "simulation_options.hpp"

/**
 * @brief Square intensity images of one or both hemispheres.
 *
 * Intensities are stored as (n_hemispheres, size, size) in row-major
 * order, upper hemisphere first. Pixel (row, col) is the point
 * (x[col], y[row]) of the stereographic grid, so the image centre is
 * the pole and the axes are offset by -size / 2 pixels.
 */
class MasterPattern {
  public:
    /**
     * @throws std::invalid_argument if `data` does not hold
     * n_hemispheres * size * size values
     */
    MasterPattern(std::vector<double> data,
                  size_t size,
                  Hemisphere hemisphere,
                  std::string phase_name);

    size_t n_hemispheres() const {
        return hemisphere_ == Hemisphere::both ? 2 : 1;
    }
    size_t size() const {
        return size_;
    }
    Hemisphere hemisphere() const {
        return hemisphere_;
    }
    Projection projection() const {
        return Projection::stereographic;
    }
    const std::string &phase_name() const {
        return phase_name_;
    }
    /// Offset of the pixel axes, -size / 2 rounded towards negative infinity
    int axis_offset() const {
        return -static_cast<int>((size_ + 1) / 2);
    }
    const std::vector<double> &data() const {
        return data_;
    }
    double operator()(size_t hemisphere, size_t row, size_t col) const {
        return data_[(hemisphere * size_ + row) * size_ + col];
    }
    double max() const;

    /**
     * @brief Write the intensities to the dataset /master_pattern of a
     * new HDF5 file, with hemisphere, projection and phase attributes.
     *
     * @throws std::runtime_error if the file cannot be written or HDF5
     * support was not compiled in
     */
    void write_h5(const std::string &path) const;

    /**
     * @brief Write an 8-bit greyscale PNG scaled to the maximum
     * intensity. Both hemispheres are placed side by side.
     *
     * @throws std::runtime_error if the file cannot be written or PNG
     * support was not compiled in
     */
    void write_png(const std::string &path) const;

  private:
    std::vector<double> data_;
    size_t size_;
    Hemisphere hemisphere_;
    std::string phase_name_;
};
