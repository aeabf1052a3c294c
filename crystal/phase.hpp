/**
 * @file phase.hpp
 * @brief Crystal phase: unit cell, space group and asymmetric unit.
 */
#pragma once

#include <Eigen/Dense>
#include <array>
#include <gemmi/symmetry.hpp>
#include <gemmi/unitcell.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using Eigen::Matrix3d;
using json = nlohmann::json;

/// One atom of the asymmetric unit
struct Atom {
    std::string element;         ///< Element symbol, e.g. "Al"
    std::array<double, 3> xyz;   ///< Fractional coordinates
    double occupancy = 1.0;
    double b_iso = 0.0;          ///< Isotropic displacement parameter B (Å²)
};

class Phase {
  public:
    /**
     * @param name Phase name used in summaries
     * @param cell Unit cell, lengths in Å and angles in degrees
     * @param space_group_number International Tables number (1-230)
     * @param atoms Asymmetric unit
     * @throws std::invalid_argument for an unknown space group or element
     */
    Phase(std::string name,
          const gemmi::UnitCell &cell,
          int space_group_number,
          std::vector<Atom> atoms = {});
    /**
     * @brief Construct from JSON.
     *
     * Required keys: "name", "lattice" ([a, b, c, alpha, beta, gamma]) and
     * "space_group" (number or Hermann-Mauguin symbol). Optional "atoms",
     * a list of {"element", "xyz", "occupancy", "b_iso"}.
     */
    explicit Phase(const json &phase_data);

    const std::string &name() const {
        return name_;
    }
    const gemmi::UnitCell &cell() const {
        return cell_;
    }
    const gemmi::SpaceGroup &space_group() const {
        return *space_group_;
    }
    const std::vector<Atom> &atoms() const {
        return atoms_;
    }
    /// Point group in Hermann-Mauguin notation, e.g. "m-3m"
    std::string point_group() const;

    /// Rows are the direct lattice vectors a, b, c in the crystal frame (Å)
    const Matrix3d &base() const {
        return base_;
    }
    /// Inverse of base(); columns are the reciprocal lattice vectors (1/Å)
    const Matrix3d &recbase() const {
        return recbase_;
    }

    /// Rotation parts of the point group in the hkl basis
    std::vector<gemmi::Op> point_group_operations() const;

    /// All atom positions in the unit cell, symmetry expanded and wrapped
    std::vector<Atom> unit_cell_atoms() const;

  private:
    void validate_atoms() const;
    void set_bases();

    std::string name_;
    gemmi::UnitCell cell_;
    const gemmi::SpaceGroup *space_group_ = nullptr;
    std::vector<Atom> atoms_;
    Matrix3d base_;
    Matrix3d recbase_;
};
