#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace gridmat {

/**
 * @brief Category of a rejected matrix operation
 */
enum class ErrorKind {
    MalformedInput,   ///< Empty or ragged row data, or a zero dimension
    ShapeMismatch,    ///< Operand sizes incompatible for +, - or *
    EmptySelection,   ///< Empty index set passed to choose/remove
    IndexOutOfBounds, ///< Row or column index outside the matrix
    NotSquare,        ///< Operation defined only for square matrices
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:
            return "MalformedInput";
        case ErrorKind::ShapeMismatch:
            return "ShapeMismatch";
        case ErrorKind::EmptySelection:
            return "EmptySelection";
        case ErrorKind::IndexOutOfBounds:
            return "IndexOutOfBounds";
        case ErrorKind::NotSquare:
            return "NotSquare";
    }
    return "Unknown";
}

/**
 * @brief Exception thrown by every recoverable matrix failure
 *
 * The kind lets callers tell a bad shape apart from a bad index without
 * parsing the message.
 */
class MatrixError : public std::invalid_argument {
public:
    MatrixError(ErrorKind kind, const std::string& message) : std::invalid_argument(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace gridmat
