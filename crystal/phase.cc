/**
 * @file phase.cc
 * @brief Crystal phase from JSON: lattice, point group and atom sites
 */

#include "phase.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <gemmi/elem.hpp>
#include <stdexcept>

namespace {
const gemmi::SpaceGroup *space_group_from_number(int number) {
    const gemmi::SpaceGroup *sg = gemmi::find_spacegroup_by_number(number);
    if (sg == nullptr) {
        throw std::invalid_argument(
          fmt::format("Unknown space group number {}, options are 1-230", number));
    }
    return sg;
}

double wrap_fractional(double x) {
    double wrapped = x - std::floor(x);
    // Positions within rounding of 1 are the same site as 0
    if (std::abs(wrapped - 1.0) < 1e-6) wrapped = 0.0;
    return wrapped;
}
}  // namespace

Phase::Phase(std::string name,
             const gemmi::UnitCell &cell,
             int space_group_number,
             std::vector<Atom> atoms)
    : name_(std::move(name)),
      cell_(cell),
      space_group_(space_group_from_number(space_group_number)),
      atoms_(std::move(atoms)) {
    validate_atoms();
    set_bases();
}

Phase::Phase(const json &phase_data) {
    std::vector<std::string> required_keys = {"name", "lattice", "space_group"};
    for (const auto &key : required_keys) {
        if (phase_data.find(key) == phase_data.end()) {
            throw std::invalid_argument("Key " + key
                                        + " is missing from the input phase JSON");
        }
    }
    name_ = phase_data["name"].get<std::string>();
    auto lattice = phase_data["lattice"].get<std::vector<double>>();
    if (lattice.size() != 6) {
        throw std::invalid_argument(
          "Phase lattice must be [a, b, c, alpha, beta, gamma]");
    }
    cell_ = gemmi::UnitCell(
      lattice[0], lattice[1], lattice[2], lattice[3], lattice[4], lattice[5]);

    const json &sg = phase_data["space_group"];
    if (sg.is_number_integer()) {
        space_group_ = space_group_from_number(sg.get<int>());
    } else {
        std::string symbol = sg.get<std::string>();
        space_group_ = gemmi::find_spacegroup_by_name(symbol);
        if (space_group_ == nullptr) {
            throw std::invalid_argument(fmt::format("Unknown space group '{}'", symbol));
        }
    }

    if (phase_data.contains("atoms")) {
        for (const auto &atom_data : phase_data["atoms"]) {
            if (!atom_data.contains("element") || !atom_data.contains("xyz")) {
                throw std::invalid_argument(
                  "Each atom in the input phase JSON needs element and xyz");
            }
            Atom atom;
            atom.element = atom_data["element"].get<std::string>();
            atom.xyz = atom_data["xyz"].get<std::array<double, 3>>();
            atom.occupancy = atom_data.value("occupancy", 1.0);
            atom.b_iso = atom_data.value("b_iso", 0.0);
            atoms_.push_back(atom);
        }
    }
    validate_atoms();
    set_bases();
}

void Phase::validate_atoms() const {
    for (const auto &atom : atoms_) {
        if (gemmi::find_element(atom.element.c_str()) == gemmi::El::X) {
            throw std::invalid_argument(
              fmt::format("Unknown element '{}' in phase {}", atom.element, name_));
        }
    }
}

void Phase::set_bases() {
    // gemmi's orthogonalisation matrix has a, b, c as columns, a along x
    const gemmi::Mat33 &orth = cell_.orth.mat;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            base_(i, j) = orth.a[j][i];
        }
    }
    recbase_ = base_.inverse();
}

std::string Phase::point_group() const {
    return space_group_->point_group_hm();
}

std::vector<gemmi::Op> Phase::point_group_operations() const {
    std::vector<gemmi::Op> operations;
    for (gemmi::Op op : space_group_->operations().sym_ops) {
        op.tran = {0, 0, 0};
        if (std::find(operations.begin(), operations.end(), op) == operations.end()) {
            operations.push_back(op);
        }
    }
    return operations;
}

std::vector<Atom> Phase::unit_cell_atoms() const {
    std::vector<Atom> expanded;
    gemmi::GroupOps ops = space_group_->operations();
    for (const auto &atom : atoms_) {
        std::vector<std::array<double, 3>> sites;
        for (const gemmi::Op &op : ops) {
            std::array<double, 3> xyz = op.apply_to_xyz(atom.xyz);
            for (auto &x : xyz) x = wrap_fractional(x);
            bool seen = std::any_of(sites.begin(), sites.end(), [&](const auto &site) {
                return std::abs(site[0] - xyz[0]) < 1e-6
                       && std::abs(site[1] - xyz[1]) < 1e-6
                       && std::abs(site[2] - xyz[2]) < 1e-6;
            });
            if (!seen) sites.push_back(xyz);
        }
        for (const auto &site : sites) {
            Atom copy = atom;
            copy.xyz = site;
            expanded.push_back(copy);
        }
    }
    return expanded;
}
