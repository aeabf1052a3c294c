/**
 * @file kikuchi_sim_args.hpp
 * @brief Argument parser for the kikuchi_sim application.
 */
#ifndef KIKUCHI_SIM_ARGS_HPP
#define KIKUCHI_SIM_ARGS_HPP

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "arg_parser.hpp"
#include "fkp_logger.hpp"
#include "simulation_options.hpp"
#include "threadpool.hpp"

/**
 * @brief Argument parser for the kikuchi_sim application.
 *
 * Adds the master pattern and geometrical simulation outputs, their
 * options and the thread count to the shared arguments.
 */
class SimulationArgumentParser : public FKPArgumentParser {
  public:
    SimulationArgumentParser(std::string version)
        : FKPArgumentParser("kikuchi_sim", version) {
        add_master_pattern_arguments();
        add_geometrical_arguments();

        add_argument("-n", "--nthreads")
          .help("Number of threads for parallelisation")
          .metavar("NUM")
          .scan<'u', size_t>();
    }

    void add_master_pattern_arguments() {
        add_argument("--master-pattern")
          .help("Write a kinematical master pattern to this HDF5 file")
          .metavar("FILE.h5");

        add_argument("--png")
          .help("Write the kinematical master pattern as a greyscale image")
          .metavar("FILE.png");

        add_argument("--half-size")
          .help("Master pattern half size, the width is 2 * N + 1 pixels")
          .metavar("N")
          .default_value<size_t>(500)
          .scan<'u', size_t>();

        add_argument("--hemisphere")
          .help("Master pattern hemisphere: upper, lower or both")
          .default_value(std::string("upper"));

        add_argument("--scaling")
          .help("Band intensity scaling: linear (|F|), square (|F|^2) or none")
          .default_value(std::string("linear"));
    }

    void add_geometrical_arguments() {
        add_argument("--geometrical")
          .help("Write Kikuchi lines, zone axes and overlays to this JSON file")
          .metavar("FILE.json");

        add_argument("--index")
          .help("Navigation index of the pattern to report (default: first)")
          .metavar("I")
          .nargs(1, 2)
          .scan<'u', size_t>();

        add_argument("--coordinates")
          .help("Coordinates of reported features: detector or gnomonic")
          .default_value(std::string("detector"));

        add_argument("--zone-axes")
          .help("Include zone axes and their labels in the overlays")
          .default_value(false)
          .implicit_value(true);

        add_argument("--pc")
          .help("Include the projection centre in the overlays")
          .default_value(false)
          .implicit_value(true);
    }

    auto nthreads() const -> size_t {
        if (is_used("--nthreads")) {
            return std::max<size_t>(1, get<size_t>("--nthreads"));
        }
        return default_thread_count();
    }

    auto coordinates() const -> CoordinateSpace {
        return _coordinates;
    }
    auto hemisphere() const -> Hemisphere {
        return _hemisphere;
    }
    auto scaling() const -> Scaling {
        return _scaling;
    }

  protected:
    /// Rejects a missing output and unknown option names before any work starts
    void post_parse() override {
        if (!is_used("--master-pattern") && !is_used("--png")
            && !is_used("--geometrical")) {
            logger.error("Nothing to do, give --master-pattern, --png or --geometrical");
            std::exit(1);
        }
        try {
            _coordinates = parse_coordinate_space(get<std::string>("--coordinates"));
            _hemisphere = parse_hemisphere(get<std::string>("--hemisphere"));
            _scaling = parse_scaling(get<std::string>("--scaling"));
        } catch (const std::invalid_argument &ex) {
            logger.error("{}", ex.what());
            std::exit(1);
        }
    }

  private:
    CoordinateSpace _coordinates = CoordinateSpace::detector;
    Hemisphere _hemisphere = Hemisphere::upper;
    Scaling _scaling = Scaling::linear;
};

#endif
