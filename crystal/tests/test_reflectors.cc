#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <gemmi/c4322.hpp>
#include <gemmi/elem.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "reflectors.hpp"

namespace {
Phase aluminium() {
    return Phase(json{{"name", "al"},
                      {"lattice", {4.05, 4.05, 4.05, 90, 90, 90}},
                      {"space_group", 225},
                      {"atoms", {{{"element", "Al"}, {"xyz", {0, 0, 0}}}}}});
}

bool contains(const Reflectors &reflectors, const Miller &hkl) {
    for (size_t i = 0; i < reflectors.size(); ++i) {
        if (reflectors.miller(i) == hkl) return true;
    }
    return false;
}
}  // namespace

TEST(Reflectors, symmetrise_families) {
    Reflectors g(aluminium(), std::vector<Miller>{{1, 1, 1}, {2, 0, 0}, {2, 2, 0}, {3, 1, 1}});
    Reflectors all = g.symmetrise();
    EXPECT_EQ(all.size(), 50);
    EXPECT_EQ(all.miller(0), (Miller{1, 1, 1}));
    EXPECT_TRUE(contains(all, {-3, 1, -1}));
    EXPECT_TRUE(contains(all, {0, -2, -2}));

    // Families follow each other in input order
    for (size_t i = 0; i < 8; ++i) {
        Miller hkl = all.miller(i);
        EXPECT_EQ(std::abs(hkl[0]) + std::abs(hkl[1]) + std::abs(hkl[2]), 3);
    }

    Reflectors family = all.select_family({2, 0, 0});
    EXPECT_EQ(family.size(), 6);
    for (size_t i = 0; i < family.size(); ++i) {
        Miller hkl = family.miller(i);
        EXPECT_EQ(std::abs(hkl[0]) + std::abs(hkl[1]) + std::abs(hkl[2]), 2);
        EXPECT_EQ(std::count(hkl.begin(), hkl.end(), 0), 2);
    }
}

TEST(Reflectors, spacings) {
    Reflectors g(aluminium(), std::vector<Miller>{{1, 1, 1}, {2, 0, 0}});
    std::vector<double> d = g.dspacing();
    EXPECT_NEAR(d[0], 4.05 / std::sqrt(3.0), 1e-12);
    EXPECT_NEAR(d[1], 4.05 / 2, 1e-12);
    Vectors3d unit = g.unit_vectors();
    EXPECT_NEAR(unit.row(0).norm(), 1.0, 1e-12);
    EXPECT_NEAR(unit(1, 0), 1.0, 1e-12);
}

TEST(Reflectors, electron_wavelength_and_bragg_angles) {
    EXPECT_NEAR(electron_wavelength(20e3), 0.085885, 1e-5);

    Reflectors g(aluminium(), std::vector<Miller>{{1, 1, 1}, {2, 0, 0}});
    EXPECT_FALSE(g.has_theta());
    EXPECT_THROW(g.theta(), std::invalid_argument);
    g.calculate_theta(20e3);
    ASSERT_TRUE(g.has_theta());
    EXPECT_NEAR(g.theta()[0], 0.0183661, 1e-6);
    EXPECT_NEAR(g.theta()[1], 0.0212078, 1e-6);

    EXPECT_THROW(g.calculate_theta(0), std::invalid_argument);
    EXPECT_THROW(g.calculate_theta(-20e3), std::invalid_argument);
}

TEST(Reflectors, structure_factor_of_fcc) {
    Reflectors g(aluminium(), std::vector<Miller>{{1, 1, 1}, {1, 1, 0}, {2, 0, 0}});
    EXPECT_FALSE(g.has_structure_factor());
    EXPECT_THROW(g.structure_factor(), std::invalid_argument);
    g.calculate_structure_factor();

    const auto &F = g.structure_factor();
    // Four atoms in phase for unmixed indices, cancelling for mixed ones
    double stol2 = 3.0 / (4 * 4.05 * 4.05);
    double f = gemmi::C4322<double>::get(gemmi::El::Al).calculate_sf(stol2);
    EXPECT_NEAR(F[0].real(), 4 * f, 1e-9);
    EXPECT_NEAR(F[0].imag(), 0.0, 1e-9);
    EXPECT_NEAR(std::abs(F[1]), 0.0, 1e-9);
    EXPECT_GT(std::abs(F[0]), std::abs(F[2]));
}

TEST(Reflectors, copies_and_subsets_are_independent) {
    Reflectors g(aluminium(), std::vector<Miller>{{1, 1, 1}, {2, 0, 0}, {2, 2, 0}});
    Reflectors copy = g;
    copy.calculate_theta(20e3);
    EXPECT_FALSE(g.has_theta());
    EXPECT_TRUE(copy.has_theta());

    Reflectors subset = copy.subset({true, false, true});
    ASSERT_EQ(subset.size(), 2);
    EXPECT_EQ(subset.miller(1), (Miller{2, 2, 0}));
    ASSERT_TRUE(subset.has_theta());
    EXPECT_DOUBLE_EQ(subset.theta()[1], copy.theta()[2]);
    EXPECT_FALSE(subset.has_structure_factor());

    EXPECT_THROW(g.subset({true}), std::invalid_argument);
}

TEST(Reflectors, to_string) {
    Reflectors g(aluminium(), std::vector<Miller>{{1, 1, 1}, {-1, 1, 1}});
    EXPECT_EQ(g.to_string(), "Reflectors (2,), al (m-3m)\n[[ 1  1  1]\n [-1  1  1]]");
}
