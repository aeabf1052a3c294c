#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "phase.hpp"

namespace {
json aluminium() {
    return {{"name", "al"},
            {"lattice", {4.05, 4.05, 4.05, 90, 90, 90}},
            {"space_group", 225},
            {"atoms", {{{"element", "Al"}, {"xyz", {0, 0, 0}}}}}};
}
}  // namespace

TEST(Phase, from_json) {
    Phase phase(aluminium());
    EXPECT_EQ(phase.name(), "al");
    EXPECT_EQ(phase.space_group().number, 225);
    EXPECT_EQ(phase.point_group(), "m-3m");
    ASSERT_EQ(phase.atoms().size(), 1);
    EXPECT_EQ(phase.atoms()[0].element, "Al");
    EXPECT_DOUBLE_EQ(phase.atoms()[0].occupancy, 1.0);

    json by_name = aluminium();
    by_name["space_group"] = "F m -3 m";
    EXPECT_EQ(Phase(by_name).space_group().number, 225);
}

TEST(Phase, cubic_bases) {
    Phase phase(aluminium());
    EXPECT_TRUE(phase.base().isApprox(4.05 * Matrix3d::Identity()));
    EXPECT_TRUE(phase.recbase().isApprox(Matrix3d::Identity() / 4.05));
}

TEST(Phase, hexagonal_base_has_a_along_x) {
    json ti = {{"name", "ti"},
               {"lattice", {2.95, 2.95, 4.68, 90, 90, 120}},
               {"space_group", 194}};
    Phase phase(ti);
    Matrix3d base = phase.base();
    EXPECT_NEAR(base(0, 0), 2.95, 1e-12);
    EXPECT_NEAR(base(0, 1), 0.0, 1e-12);
    EXPECT_NEAR(base(0, 2), 0.0, 1e-12);
    EXPECT_NEAR(base.row(1).norm(), 2.95, 1e-12);
    EXPECT_NEAR(base.row(2).norm(), 4.68, 1e-12);
    EXPECT_NEAR(base.row(0).dot(base.row(1)) / (2.95 * 2.95), -0.5, 1e-12);
    EXPECT_TRUE((phase.base() * phase.recbase()).isApprox(Matrix3d::Identity()));
    EXPECT_EQ(phase.point_group(), "6/mmm");
}

TEST(Phase, symmetry_expansion) {
    Phase phase(aluminium());
    EXPECT_EQ(phase.point_group_operations().size(), 48);
    // Face centring puts four atoms in the cell
    std::vector<Atom> atoms = phase.unit_cell_atoms();
    ASSERT_EQ(atoms.size(), 4);
    for (const auto &atom : atoms) {
        for (double x : atom.xyz) {
            EXPECT_GE(x, 0.0);
            EXPECT_LT(x, 1.0);
        }
    }
}

TEST(Phase, bad_input_throws) {
    json missing = aluminium();
    missing.erase("lattice");
    EXPECT_THROW(Phase{missing}, std::invalid_argument);

    json bad_group = aluminium();
    bad_group["space_group"] = 231;
    EXPECT_THROW(Phase{bad_group}, std::invalid_argument);

    json bad_element = aluminium();
    bad_element["atoms"][0]["element"] = "Xx";
    EXPECT_THROW(Phase{bad_element}, std::invalid_argument);

    json short_lattice = aluminium();
    short_lattice["lattice"] = {4.05, 4.05, 4.05};
    EXPECT_THROW(Phase{short_lattice}, std::invalid_argument);
}
