/**
 * @file navigation.cc
 * @brief Navigation shapes and indices of pattern batches
 */

#include "navigation.hpp"

#include <fmt/core.h>

#include <stdexcept>

std::string NavigationIndex::to_string() const {
    switch (ndim_) {
    case 0:
        return "()";
    case 1:
        return fmt::format("({},)", idx_[0]);
    default:
        return fmt::format("({}, {})", idx_[0], idx_[1]);
    }
}

size_t NavigationShape::flat_index(const NavigationIndex &index) const {
    if (index.ndim() == 0) {
        return 0;
    }
    if (index.ndim() != ndim_) {
        throw std::out_of_range(
          fmt::format("Index {} has {} dimension(s) but the navigation shape {} has {}",
                      index.to_string(),
                      index.ndim(),
                      to_string(),
                      ndim_));
    }
    for (size_t axis = 0; axis < ndim_; ++axis) {
        if (index[axis] >= dims_[axis]) {
            throw std::out_of_range(fmt::format(
              "Index {} is out of bounds for navigation shape {}", index.to_string(), to_string()));
        }
    }
    if (ndim_ == 1) {
        return index[0];
    }
    return index[0] * dims_[1] + index[1];
}

NavigationIndex NavigationShape::unravel(size_t flat) const {
    if (flat >= size()) {
        throw std::out_of_range(fmt::format(
          "Flat index {} is out of bounds for navigation shape {}", flat, to_string()));
    }
    switch (ndim_) {
    case 0:
        return NavigationIndex();
    case 1:
        return NavigationIndex(flat);
    default:
        return NavigationIndex(flat / dims_[1], flat % dims_[1]);
    }
}

std::string NavigationShape::to_string() const {
    switch (ndim_) {
    case 0:
        return "()";
    case 1:
        return fmt::format("({},)", dims_[0]);
    default:
        return fmt::format("({}, {})", dims_[0], dims_[1]);
    }
}
