/**
 * @file reflectors.cc
 * @brief Reflector sets: symmetrisation, structure factors and Bragg angles
 */

#include "reflectors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <gemmi/c4322.hpp>
#include <gemmi/elem.hpp>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace {
constexpr double PLANCK = 6.62607015e-34;          // J s
constexpr double ELECTRON_MASS = 9.1093837015e-31;  // kg
constexpr double ELEMENTARY_CHARGE = 1.602176634e-19;  // C
constexpr double SPEED_OF_LIGHT = 299792458.0;      // m/s

Miller to_miller(const Eigen::RowVector3d &v) {
    return {static_cast<int>(std::lround(v[0])),
            static_cast<int>(std::lround(v[1])),
            static_cast<int>(std::lround(v[2]))};
}

Vectors3d to_vectors(const std::vector<Miller> &hkl) {
    Vectors3d v(hkl.size(), 3);
    for (size_t i = 0; i < hkl.size(); ++i) {
        v.row(i) << hkl[i][0], hkl[i][1], hkl[i][2];
    }
    return v;
}
}  // namespace

double electron_wavelength(double voltage) {
    double eV = ELEMENTARY_CHARGE * voltage;
    double momentum = std::sqrt(
      2 * ELECTRON_MASS * eV * (1 + eV / (2 * ELECTRON_MASS * SPEED_OF_LIGHT * SPEED_OF_LIGHT)));
    return PLANCK / momentum * 1e10;
}

Reflectors::Reflectors(Phase phase, Vectors3d hkl)
    : phase_(std::move(phase)), hkl_(std::move(hkl)) {}

Reflectors::Reflectors(Phase phase, const std::vector<Miller> &hkl)
    : Reflectors(std::move(phase), to_vectors(hkl)) {}

Miller Reflectors::miller(size_t i) const {
    return to_miller(hkl_.row(i));
}

Vectors3d Reflectors::cartesian() const {
    // Row convention: g = hkl . recbase^T
    return hkl_ * phase_.recbase().transpose();
}

Vectors3d Reflectors::unit_vectors() const {
    Vectors3d g = cartesian();
    for (Eigen::Index i = 0; i < g.rows(); ++i) {
        double norm = g.row(i).norm();
        if (norm > HEMISPHERE_ATOL) g.row(i) /= norm;
    }
    return g;
}

std::vector<double> Reflectors::gspacing() const {
    Vectors3d g = cartesian();
    std::vector<double> lengths(size());
    for (size_t i = 0; i < size(); ++i) {
        lengths[i] = g.row(i).norm();
    }
    return lengths;
}

std::vector<double> Reflectors::dspacing() const {
    std::vector<double> d = gspacing();
    for (auto &x : d) {
        x = x > 0 ? 1.0 / x : std::numeric_limits<double>::infinity();
    }
    return d;
}

const std::vector<std::complex<double>> &Reflectors::structure_factor() const {
    if (!structure_factor_) {
        throw std::invalid_argument(
          "Reflectors have no structure factors. Calculate with "
          "Reflectors::calculate_structure_factor().");
    }
    return *structure_factor_;
}

const std::vector<double> &Reflectors::theta() const {
    if (!theta_) {
        throw std::invalid_argument(
          "Reflectors have no Bragg angles. Calculate with "
          "Reflectors::calculate_theta().");
    }
    return *theta_;
}

void Reflectors::calculate_structure_factor() {
    std::vector<Atom> atoms = phase_.unit_cell_atoms();
    std::vector<double> g = gspacing();
    std::vector<std::complex<double>> factors(size());
    for (size_t i = 0; i < size(); ++i) {
        // (sin(theta) / lambda)^2 = 1 / (4 d^2)
        double stol2 = 0.25 * g[i] * g[i];
        std::complex<double> F{0.0, 0.0};
        for (const auto &atom : atoms) {
            gemmi::El el = gemmi::find_element(atom.element.c_str());
            double f = gemmi::C4322<double>::get(el).calculate_sf(stol2);
            double attenuation = std::exp(-atom.b_iso * stol2);
            double phase = 2 * std::numbers::pi
                           * (hkl_(i, 0) * atom.xyz[0] + hkl_(i, 1) * atom.xyz[1]
                              + hkl_(i, 2) * atom.xyz[2]);
            F += atom.occupancy * f * attenuation * std::polar(1.0, phase);
        }
        factors[i] = F;
    }
    structure_factor_ = std::move(factors);
}

void Reflectors::calculate_theta(double voltage) {
    if (!(voltage > 0)) {
        throw std::invalid_argument(
          fmt::format("Accelerating voltage must be positive, got {} V", voltage));
    }
    double wavelength = electron_wavelength(voltage);
    std::vector<double> g = gspacing();
    std::vector<double> theta(size());
    for (size_t i = 0; i < size(); ++i) {
        double sin_theta = 0.5 * wavelength * g[i];
        if (sin_theta > 1.0) {
            throw std::invalid_argument(
              fmt::format("Reflector ({} {} {}) cannot diffract at {} V",
                          hkl_(i, 0),
                          hkl_(i, 1),
                          hkl_(i, 2),
                          voltage));
        }
        theta[i] = std::asin(sin_theta);
    }
    theta_ = std::move(theta);
}

Reflectors Reflectors::symmetrise() const {
    std::vector<gemmi::Op> operations = phase_.point_group_operations();
    std::vector<Miller> expanded;
    for (size_t i = 0; i < size(); ++i) {
        Miller hkl = miller(i);
        if (std::find(expanded.begin(), expanded.end(), hkl) != expanded.end()) {
            continue;
        }
        for (const auto &op : operations) {
            Miller equivalent = op.apply_to_hkl(hkl);
            if (std::find(expanded.begin(), expanded.end(), equivalent) == expanded.end()) {
                expanded.push_back(equivalent);
            }
        }
    }
    return Reflectors(phase_, expanded);
}

Reflectors Reflectors::select_family(const Miller &hkl) const {
    std::vector<Miller> family;
    for (const auto &op : phase_.point_group_operations()) {
        family.push_back(op.apply_to_hkl(hkl));
    }
    std::vector<bool> mask(size());
    for (size_t i = 0; i < size(); ++i) {
        mask[i] = std::find(family.begin(), family.end(), miller(i)) != family.end();
    }
    return subset(mask);
}

Reflectors Reflectors::subset(const std::vector<bool> &mask) const {
    if (mask.size() != size()) {
        throw std::invalid_argument(fmt::format(
          "Mask of size {} does not match {} reflectors", mask.size(), size()));
    }
    Reflectors selected(phase_, select_rows(hkl_, mask));
    if (structure_factor_) {
        std::vector<std::complex<double>> factors;
        for (size_t i = 0; i < size(); ++i) {
            if (mask[i]) factors.push_back((*structure_factor_)[i]);
        }
        selected.structure_factor_ = std::move(factors);
    }
    if (theta_) {
        std::vector<double> theta;
        for (size_t i = 0; i < size(); ++i) {
            if (mask[i]) theta.push_back((*theta_)[i]);
        }
        selected.theta_ = std::move(theta);
    }
    return selected;
}

std::string Reflectors::to_string(size_t max_rows) const {
    std::string out = fmt::format(
      "Reflectors ({},), {} ({})", size(), phase_.name(), phase_.point_group());
    size_t n = std::min(size(), max_rows);
    for (size_t i = 0; i < n; ++i) {
        out += fmt::format("\n{}[{:2g} {:2g} {:2g}]{}",
                           i == 0 ? "[" : " ",
                           hkl_(i, 0),
                           hkl_(i, 1),
                           hkl_(i, 2),
                           i + 1 == size() ? "]" : "");
    }
    if (n < size()) {
        out += "\n ...]";
    }
    return out;
}
