#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "gridmat/size.hpp"

// ============================================================================
// Size and Matrix formatting for fmt::format

namespace gridmat {
template<typename T>
class Matrix;
} // namespace gridmat

template<>
struct fmt::formatter<gridmat::Size> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const gridmat::Size& size, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "(rows: {}, columns: {})", size.rows, size.columns);
    }
};

/**
 * @brief Renders one line per row, cells right-aligned to the widest cell
 *
 * The element type must itself be formattable by fmt.
 */
template<typename T>
struct fmt::formatter<gridmat::Matrix<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const gridmat::Matrix<T>& mat, fmt::format_context& ctx) const {
        std::vector<std::string> cells;
        cells.reserve(mat.rows() * mat.cols());
        std::size_t width = 0;
        for (const auto& row : mat.storage()) {
            for (const auto& value : row) {
                cells.push_back(fmt::format("{}", value));
                width = std::max(width, cells.back().size());
            }
        }

        auto out = ctx.out();
        for (std::size_t r = 0; r < mat.rows(); ++r) {
            if (r != 0) {
                *out++ = '\n';
            }
            for (std::size_t c = 0; c < mat.cols(); ++c) {
                if (c != 0) {
                    *out++ = ' ';
                }
                out = fmt::format_to(out, "{:>{}}", cells[r * mat.cols() + c], width);
            }
        }
        return out;
    }
};
