/**
 * @file master_pattern_kernel.hpp
 * @brief Kinematical band intensities on a grid of directions covering
 * the diffraction sphere.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "simulation_options.hpp"
#include "vectors.hpp"

/// Largest |cos| of a direction counted as lying on a band edge
constexpr double BAND_EDGE_ATOL = 1e-7;

/**
 * @brief Unit vectors of a square stereographic grid on one hemisphere.
 *
 * The grid has 2 * half_size + 1 points along x (columns) and y (rows),
 * evenly spaced over [-1, 1], mapped to the sphere with the inverse
 * stereographic projection
 *
 *     v = (2x, 2y, -p (1 - x^2 - y^2)) / (1 + x^2 + y^2)
 *
 * with pole p = -1 for the upper and p = 1 for the lower hemisphere.
 * Rows of the result follow the pixels in row-major order.
 *
 * @param hemisphere Hemisphere::upper or Hemisphere::lower
 */
Vectors3d inverse_stereographic_grid(size_t half_size, Hemisphere hemisphere);

/**
 * @brief Sum of the intensities of the Kikuchi bands containing each
 * direction.
 *
 * A direction v lies in the band of reflector g with Bragg angle theta
 * when the angle between them is in [pi/2 - theta, pi/2]. Directions
 * within BAND_EDGE_ATOL of perpendicular to g get half the intensity.
 *
 * Work is split over blocks of directions. Each direction accumulates
 * the reflectors in their stored order on one thread, so the result
 * does not depend on the number of threads.
 *
 * @param directions Unit vectors on the sphere
 * @param reflectors Unit vectors of the reflectors
 * @param theta Bragg angle of each reflector (radians)
 * @param intensity Intensity of each reflector
 * @param nthreads Number of worker threads
 */
std::vector<double> kinematical_band_intensities(const Vectors3d &directions,
                                                 const Vectors3d &reflectors,
                                                 const std::vector<double> &theta,
                                                 const std::vector<double> &intensity,
                                                 size_t nthreads);
