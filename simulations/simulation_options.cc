/**
 * @file simulation_options.cc
 * @brief Parsing and naming of the simulator options
 */

#include "simulation_options.hpp"

#include <fmt/core.h>

#include <stdexcept>

Scaling parse_scaling(const std::string &name) {
    if (name == "linear") return Scaling::linear;
    if (name == "square") return Scaling::square;
    if (name == "none") return Scaling::none;
    throw std::invalid_argument(
      fmt::format("Unknown scaling '{}', options are 'linear', 'square' or 'none'", name));
}

Hemisphere parse_hemisphere(const std::string &name) {
    if (name == "upper") return Hemisphere::upper;
    if (name == "lower") return Hemisphere::lower;
    if (name == "both") return Hemisphere::both;
    throw std::invalid_argument(fmt::format(
      "Unknown hemisphere '{}', options are 'upper', 'lower' or 'both'", name));
}

Projection parse_projection(const std::string &name) {
    if (name == "stereographic") return Projection::stereographic;
    if (name == "spherical") return Projection::spherical;
    throw std::invalid_argument(fmt::format(
      "Unknown projection '{}', options are 'stereographic' and 'spherical'", name));
}

TraceMode parse_trace_mode(const std::string &name) {
    if (name == "lines") return TraceMode::lines;
    if (name == "bands") return TraceMode::bands;
    throw std::invalid_argument(
      fmt::format("Unknown mode '{}', options are 'lines' and 'bands'", name));
}

CoordinateSpace parse_coordinate_space(const std::string &name) {
    if (name == "detector") return CoordinateSpace::detector;
    if (name == "gnomonic") return CoordinateSpace::gnomonic;
    throw std::invalid_argument(fmt::format(
      "Unknown coordinates '{}', options are 'detector' and 'gnomonic'", name));
}

std::string to_string(Scaling scaling) {
    switch (scaling) {
    case Scaling::linear:
        return "linear";
    case Scaling::square:
        return "square";
    case Scaling::none:
        return "none";
    }
    return "";
}

std::string to_string(Hemisphere hemisphere) {
    switch (hemisphere) {
    case Hemisphere::upper:
        return "upper";
    case Hemisphere::lower:
        return "lower";
    case Hemisphere::both:
        return "both";
    }
    return "";
}

std::string to_string(Projection projection) {
    return projection == Projection::stereographic ? "stereographic" : "spherical";
}

std::string to_string(CoordinateSpace coordinates) {
    return coordinates == CoordinateSpace::detector ? "detector" : "gnomonic";
}
