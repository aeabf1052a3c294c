/**
 * @file master_pattern_kernel.cc
 * @brief Stereographic grid and the kinematical band intensity kernel
 */

#include "master_pattern_kernel.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "threadpool.hpp"

Vectors3d inverse_stereographic_grid(size_t half_size, Hemisphere hemisphere) {
    if (hemisphere == Hemisphere::both) {
        throw std::invalid_argument(
          "A stereographic grid covers one hemisphere, 'upper' or 'lower'");
    }
    double pole = hemisphere == Hemisphere::upper ? -1.0 : 1.0;
    size_t size = 2 * half_size + 1;
    std::vector<double> arr(size);
    for (size_t i = 0; i < size; ++i) {
        arr[i] = size == 1 ? -1.0 : -1.0 + 2.0 * static_cast<double>(i) / (size - 1);
    }

    Vectors3d grid(size * size, 3);
    for (size_t row = 0; row < size; ++row) {
        double y = arr[row];
        for (size_t col = 0; col < size; ++col) {
            double x = arr[col];
            double r2 = x * x + y * y;
            grid.row(row * size + col) << 2 * x / (1 + r2), 2 * y / (1 + r2),
              -pole * (1 - r2) / (1 + r2);
        }
    }
    return grid;
}

std::vector<double> kinematical_band_intensities(const Vectors3d &directions,
                                                 const Vectors3d &reflectors,
                                                 const std::vector<double> &theta,
                                                 const std::vector<double> &intensity,
                                                 size_t nthreads) {
    size_t n_reflectors = static_cast<size_t>(reflectors.rows());
    if (theta.size() != n_reflectors || intensity.size() != n_reflectors) {
        throw std::invalid_argument(
          "Need one Bragg angle and one intensity per reflector");
    }
    constexpr double half_pi = std::numbers::pi / 2;
    std::vector<double> band_start(n_reflectors);
    for (size_t i = 0; i < n_reflectors; ++i) {
        band_start[i] = half_pi - theta[i];
    }

    std::vector<double> pattern(directions.rows(), 0.0);
    parallel_for_blocks(
      pattern.size(), nthreads, [&](size_t begin, size_t end) {
          for (size_t j = begin; j < end; ++j) {
              double value = 0.0;
              for (size_t i = 0; i < n_reflectors; ++i) {
                  double D = reflectors.row(i).dot(directions.row(j));
                  if (std::abs(D) <= BAND_EDGE_ATOL) {
                      value += 0.5 * intensity[i];
                  } else {
                      double angle = std::acos(std::clamp(D, -1.0, 1.0));
                      if (angle <= half_pi && angle >= band_start[i]) {
                          value += intensity[i];
                      }
                  }
              }
              pattern[j] = value;
          }
      },
      4096);
    return pattern;
}
