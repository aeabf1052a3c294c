/**
 * @file kikuchi_pattern_simulator.hpp
 * @brief Geometrical and kinematical Kikuchi pattern simulations from
 * one set of reflectors.
 */
#pragma once

#include <Eigen/Dense>
#include <array>
#include <string>
#include <vector>

#include "ebsd_detector.hpp"
#include "geometrical_simulation.hpp"
#include "master_pattern.hpp"
#include "reflectors.hpp"
#include "rotations.hpp"
#include "simulation_options.hpp"
#include "threadpool.hpp"

/// Trace of a Kikuchi line or band edge on the sphere or in a projection
struct ReflectorTrace {
    Miller hkl;
    /// Hemisphere of a stereographic trace, Hemisphere::both for spherical
    Hemisphere hemisphere;
    /// steps x 2 stereographic points, NaN off the hemisphere, or steps x 3 unit vectors
    Eigen::MatrixXd points;
    /// Colour with the scaled intensity as alpha
    std::array<double, 4> rgba;
};

class KikuchiPatternSimulator {
  public:
    /**
     * @param reflectors Reflectors to simulate, copied
     * @param nthreads Worker threads of the projector and the kernel
     */
    explicit KikuchiPatternSimulator(const Reflectors &reflectors,
                                     size_t nthreads = default_thread_count());

    const Reflectors &reflectors() const {
        return reflectors_;
    }
    const Phase &phase() const {
        return reflectors_.phase();
    }
    size_t nthreads() const {
        return nthreads_;
    }

    std::string to_string() const;

    /**
     * @brief Project Kikuchi lines and zone axes onto the detector for
     * every rotation.
     *
     * Reflectors in the upper hemisphere of no pattern are dropped before
     * zone axes are formed from the rest. Zone axes are kept where they
     * are in the upper hemisphere and on the detector (widened by one
     * pixel) in at least one pattern.
     *
     * @param detector Detector with navigation shape (1,) or that of the
     * rotations
     * @param rotations Crystal orientations
     * @throws std::invalid_argument if the navigation shapes do not match
     */
    GeometricalKikuchiPatternSimulation on_detector(const EBSDDetector &detector,
                                                    const Rotations &rotations) const;

    /**
     * @brief Kinematical master pattern in the stereographic projection.
     *
     * Needs structure factors and Bragg angles of the reflectors.
     *
     * @param half_size The pattern is 2 * half_size + 1 pixels wide
     * @throws std::invalid_argument if structure factors or Bragg angles
     * are missing
     */
    MasterPattern calculate_master_pattern(size_t half_size = 500,
                                           Hemisphere hemisphere = Hemisphere::upper,
                                           Scaling scaling = Scaling::linear) const;

    /**
     * @brief Traces of all reflectors, weakest first.
     *
     * In lines mode each reflector gives its band centre line, in bands
     * mode the two band edges at pi/2 -+ theta from the reflector.
     *
     * @throws std::invalid_argument if bands mode lacks Bragg angles or
     * scaling lacks structure factors
     */
    std::vector<ReflectorTrace> reflector_traces(
      Projection projection = Projection::stereographic,
      TraceMode mode = TraceMode::lines,
      Hemisphere hemisphere = Hemisphere::upper,
      Scaling scaling = Scaling::linear,
      size_t steps = 101,
      std::array<double, 3> color = {0.0, 0.0, 0.0}) const;

  private:
    /// Intensity of each reflector for a scaling
    std::vector<double> intensities(Scaling scaling) const;

    Reflectors reflectors_;
    size_t nthreads_;
};
