/**
 * @file navigation.hpp
 * @brief Shape and index types for the navigation (scan) dimensions of
 * orientation maps and detector projection centres.
 *
 * A navigation shape has rank 0, 1 or 2. Batched data is stored flat in
 * row-major order, and every conversion from an index to a flat offset
 * goes through NavigationShape::flat_index so that a bad index is caught
 * before any array access.
 */
#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <string>

/// Multi-dimensional position in a navigation shape (rank 0, 1 or 2)
class NavigationIndex {
  public:
    NavigationIndex() = default;
    NavigationIndex(size_t i) : ndim_(1), idx_{i, 0} {}
    NavigationIndex(size_t i, size_t j) : ndim_(2), idx_{i, j} {}

    size_t ndim() const {
        return ndim_;
    }
    size_t operator[](size_t axis) const {
        return idx_[axis];
    }
    bool operator==(const NavigationIndex &other) const = default;

    std::string to_string() const;

  private:
    size_t ndim_ = 0;
    std::array<size_t, 2> idx_{0, 0};
};

class NavigationShape {
  public:
    static constexpr size_t max_ndim = 2;

    /// Rank 0 shape holding a single position
    NavigationShape() = default;
    explicit NavigationShape(size_t n) : ndim_(1), dims_{n, 1} {}
    NavigationShape(size_t rows, size_t cols) : ndim_(2), dims_{rows, cols} {}

    size_t ndim() const {
        return ndim_;
    }
    size_t operator[](size_t axis) const {
        return dims_[axis];
    }
    /// Number of positions
    size_t size() const {
        return dims_[0] * dims_[1];
    }
    bool operator==(const NavigationShape &other) const = default;

    /**
     * @brief Row-major flat offset of an index.
     *
     * A rank 0 index addresses the first position of any shape. Any
     * other index must have the rank of the shape and lie inside it.
     *
     * @throws std::out_of_range if the index does not fit the shape.
     */
    size_t flat_index(const NavigationIndex &index) const;

    /// Inverse of flat_index
    NavigationIndex unravel(size_t flat) const;

    /// Python-like notation, e.g. "(1,)" or "(2, 3)"
    std::string to_string() const;

  private:
    size_t ndim_ = 0;
    std::array<size_t, 2> dims_{1, 1};
};
