/**
 * @file simulation_options.hpp
 * @brief Closed option sets of the simulator, parsed once from strings
 * at the API boundary.
 */
#pragma once

#include <string>

/// Kinematical intensity of a band: |F|, |F|^2 or 1
enum class Scaling { linear, square, none };

/// Stereographic hemisphere(s) of a master pattern or trace
enum class Hemisphere { upper, lower, both };

/// Projection of reflector traces
enum class Projection { stereographic, spherical };

/// Trace of the band centre line or of both band edges
enum class TraceMode { lines, bands };

/// Where to report coordinates of the geometrical simulation
enum class CoordinateSpace { detector, gnomonic };

/// @throws std::invalid_argument listing the options
Scaling parse_scaling(const std::string &name);
Hemisphere parse_hemisphere(const std::string &name);
Projection parse_projection(const std::string &name);
TraceMode parse_trace_mode(const std::string &name);
CoordinateSpace parse_coordinate_space(const std::string &name);

std::string to_string(Scaling scaling);
std::string to_string(Hemisphere hemisphere);
std::string to_string(Projection projection);
std::string to_string(CoordinateSpace coordinates);
