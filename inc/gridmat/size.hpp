#pragma once

#include <cstddef>

namespace gridmat {

/**
 * @brief Dimensions of a matrix as a (rows, columns) pair
 */
struct Size {
    std::size_t rows = 0;
    std::size_t columns = 0;

    [[nodiscard]] constexpr bool operator==(const Size&) const = default;

    /**
     * @brief Dimensions with rows and columns swapped
     */
    [[nodiscard]] constexpr Size swapped() const { return Size{columns, rows}; }

    [[nodiscard]] constexpr bool is_square() const { return rows == columns; }

    // A valid matrix never has a zero dimension
    [[nodiscard]] constexpr bool is_empty() const { return rows == 0 || columns == 0; }
};

} // namespace gridmat
