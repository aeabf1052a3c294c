/**
 * @file reflectors.hpp
 * @brief Reciprocal lattice vectors (reflectors) of one crystal phase.
 */
#pragma once

#include <array>
#include <complex>
#include <optional>
#include <string>
#include <vector>

#include "phase.hpp"
#include "vectors.hpp"

using Miller = std::array<int, 3>;

/**
 * @brief Ordered set of reflectors {hkl} belonging to a single phase.
 *
 * Structure factors and Bragg angles are optional until calculated.
 * Copies are deep: a Reflectors object never shares storage with
 * another one, so data handed to a simulator cannot be changed behind
 * its back.
 */
class Reflectors {
  public:
    Reflectors(Phase phase, Vectors3d hkl);
    Reflectors(Phase phase, const std::vector<Miller> &hkl);

    const Phase &phase() const {
        return phase_;
    }
    size_t size() const {
        return static_cast<size_t>(hkl_.rows());
    }
    const Vectors3d &hkl() const {
        return hkl_;
    }
    Miller miller(size_t i) const;

    /// Cartesian reciprocal lattice vectors in the crystal frame (1/Å)
    Vectors3d cartesian() const;
    Vectors3d unit_vectors() const;
    /// Length of each reciprocal lattice vector (1/Å)
    std::vector<double> gspacing() const;
    /// Interplanar spacing of each reflector (Å)
    std::vector<double> dspacing() const;

    bool has_structure_factor() const {
        return structure_factor_.has_value();
    }
    bool has_theta() const {
        return theta_.has_value();
    }
    /// @throws std::invalid_argument if not yet calculated
    const std::vector<std::complex<double>> &structure_factor() const;
    /// Bragg angles in radians. @throws std::invalid_argument if not yet calculated
    const std::vector<double> &theta() const;

    /**
     * @brief Kinematical electron structure factors of all reflectors.
     *
     * Sums the International Tables C 4.3.2.2 electron scattering
     * factors of every atom in the unit cell, attenuated by its
     * isotropic displacement parameter.
     */
    void calculate_structure_factor();
    /**
     * @brief Bragg angles for electrons accelerated by `voltage` volts.
     * @throws std::invalid_argument if the voltage is not positive
     */
    void calculate_theta(double voltage);

    /// All symmetrically equivalent vectors, one family after the other
    Reflectors symmetrise() const;
    /// Vectors equivalent to `hkl` under the point group, in stored order
    Reflectors select_family(const Miller &hkl) const;
    /// Vectors where `mask` is set, with their calculated fields
    Reflectors subset(const std::vector<bool> &mask) const;

    /// Summary like "Reflectors (25,), al (m-3m)" followed by the indices
    std::string to_string(size_t max_rows = 10) const;

  private:
    Phase phase_;
    Vectors3d hkl_;
    std::optional<std::vector<std::complex<double>>> structure_factor_;
    std::optional<std::vector<double>> theta_;
};

/// Relativistic electron wavelength in Å for an accelerating voltage in V
double electron_wavelength(double voltage);
