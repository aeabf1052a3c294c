#include <gtest/gtest.h>

#include <stdexcept>

#include "navigation.hpp"

TEST(Navigation, flat_index_row_major) {
    NavigationShape shape(2, 3);
    EXPECT_EQ(shape.size(), 6);
    EXPECT_EQ(shape.ndim(), 2);
    EXPECT_EQ(shape.flat_index(NavigationIndex(0, 0)), 0);
    EXPECT_EQ(shape.flat_index(NavigationIndex(0, 2)), 2);
    EXPECT_EQ(shape.flat_index(NavigationIndex(1, 2)), 5);
    // A rank 0 index addresses the first position
    EXPECT_EQ(shape.flat_index(NavigationIndex()), 0);

    for (size_t flat = 0; flat < shape.size(); ++flat) {
        EXPECT_EQ(shape.flat_index(shape.unravel(flat)), flat);
    }
    EXPECT_EQ(shape.unravel(4), NavigationIndex(1, 1));
}

TEST(Navigation, bad_index_throws) {
    NavigationShape shape(2, 3);
    EXPECT_THROW(shape.flat_index(NavigationIndex(2, 0)), std::out_of_range);
    EXPECT_THROW(shape.flat_index(NavigationIndex(0, 3)), std::out_of_range);
    // Rank must match
    EXPECT_THROW(shape.flat_index(NavigationIndex(1)), std::out_of_range);
    EXPECT_THROW(shape.unravel(6), std::out_of_range);

    NavigationShape single(1);
    EXPECT_EQ(single.flat_index(NavigationIndex(0)), 0);
    EXPECT_THROW(single.flat_index(NavigationIndex(1)), std::out_of_range);
    EXPECT_THROW(single.flat_index(NavigationIndex(0, 0)), std::out_of_range);
}

TEST(Navigation, to_string_and_equality) {
    EXPECT_EQ(NavigationShape(1).to_string(), "(1,)");
    EXPECT_EQ(NavigationShape(2, 3).to_string(), "(2, 3)");
    EXPECT_EQ(NavigationShape().to_string(), "()");
    EXPECT_EQ(NavigationShape().size(), 1);
    EXPECT_EQ(NavigationIndex(1, 0).to_string(), "(1, 0)");

    EXPECT_EQ(NavigationShape(2, 2), NavigationShape(2, 2));
    EXPECT_NE(NavigationShape(4), NavigationShape(2, 2));
    EXPECT_NE(NavigationShape(1), NavigationShape());
}
