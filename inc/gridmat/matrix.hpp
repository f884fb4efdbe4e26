#pragma once

#include <algorithm>
#include <complex>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "gridmat/diagnostics.hpp"
#include "gridmat/error.hpp"
#include "gridmat/format.hpp"
#include "gridmat/size.hpp"

namespace gridmat {

// Element types need T{0}, T{1}, +, -, * and ==. Specialise for custom ring types.
template<typename T>
struct is_matrix_element : std::bool_constant<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>> {};

template<typename T>
struct is_matrix_element<std::complex<T>> : std::bool_constant<std::is_floating_point_v<T>> {};

template<typename T>
inline constexpr bool is_matrix_element_v = is_matrix_element<T>::value;

template<typename T>
struct is_matrix_type : std::false_type {};

/**
 * @brief Set of row or column indices; order and duplicates are irrelevant
 */
using Indices = std::vector<std::size_t>;

namespace detail {

template<typename... Args>
[[noreturn]] void fail(ErrorKind kind, fmt::format_string<Args...> format, Args&&... args) {
    const std::string message = fmt::format(format, std::forward<Args>(args)...);
    diagnostics::note("{}: {}", to_string(kind), message);
    throw MatrixError(kind, message);
}

// Ascending, duplicate-free copy of an index set
inline Indices normalized(Indices indices) {
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

// Indices in [0, count) that are not in the sorted set `excluded`
inline Indices complement(const Indices& excluded, std::size_t count) {
    Indices result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        if (!std::binary_search(excluded.begin(), excluded.end(), i)) {
            result.push_back(i);
        }
    }
    return result;
}

} // namespace detail

/**
 * @ingroup linear_algebra
 * @brief Heap-allocated matrix whose dimensions are chosen at run time
 *
 * Stores rows of equal length and provides arithmetic, transposition,
 * submatrix selection and a cofactor-expansion determinant. Every instance
 * has at least one row and one column. Rejected operations throw
 * MatrixError; nothing is downgraded to a placeholder result.
 *
 * @tparam T Element type (see is_matrix_element)
 */
template<typename T = double>
class Matrix {
public:
    static_assert(is_matrix_element_v<T>, "Matrix element type must be a numeric ring type");

    using value_type = T;
    using Storage = std::vector<std::vector<T>>;

    /**
     * @brief Constructor from a sequence of rows
     * @throws MatrixError MalformedInput if there are no rows, the rows are empty, or their lengths differ
     */
    explicit Matrix(Storage rows) : storage_(std::move(rows)) { size_ = validated_size(storage_); }

    /**
     * @brief Constructor from nested initializer list, one inner list per row
     */
    Matrix(std::initializer_list<std::initializer_list<T>> init) : Matrix(Storage(init.begin(), init.end())) {}

    Matrix(const Matrix&) = default;
    Matrix& operator=(const Matrix&) = default;
    Matrix(Matrix&&) noexcept = default;
    Matrix& operator=(Matrix&&) noexcept = default;
    ~Matrix() = default;

    /**
     * @brief Create a matrix with every element equal to T{0}
     * @throws MatrixError MalformedInput if either dimension is zero
     */
    [[nodiscard]] static Matrix zeros(Size size) {
        if (size.is_empty()) {
            detail::fail(ErrorKind::MalformedInput, "zero matrix of size {} has no elements", size);
        }
        return Matrix(size);
    }

    /**
     * @brief Create a square matrix with T{1} on the diagonal and T{0} elsewhere
     * @throws MatrixError MalformedInput if order is zero
     */
    [[nodiscard]] static Matrix identity(std::size_t order) {
        if (order == 0) {
            detail::fail(ErrorKind::MalformedInput, "identity matrix must have a positive order");
        }
        Matrix result(Size{order, order});
        for (std::size_t i = 0; i < order; ++i) {
            result.storage_[i][i] = T{1};
        }
        return result;
    }

    [[nodiscard]] const Size& size() const { return size_; }
    [[nodiscard]] std::size_t rows() const { return size_.rows; }
    [[nodiscard]] std::size_t cols() const { return size_.columns; }

    /**
     * @brief Rows of the matrix, each of length cols()
     */
    [[nodiscard]] const Storage& storage() const { return storage_; }

    /**
     * @brief True after transpose() has been applied an odd number of times
     *
     * Reflects this instance only; transposed() leaves it unchanged.
     */
    [[nodiscard]] bool is_transposed() const { return transposed_; }

    /**
     * @brief Bounds-checked element access
     * @param row Row index
     * @param col Column index
     * @return Reference to element at (row, col)
     * @throws MatrixError IndexOutOfBounds if either index is outside the matrix
     */
    T& operator()(std::size_t row, std::size_t col) {
        check_index(row, col);
        return storage_[row][col];
    }

    /**
     * @brief Bounds-checked element access (const)
     */
    const T& operator()(std::size_t row, std::size_t col) const {
        check_index(row, col);
        return storage_[row][col];
    }

    [[nodiscard]] T get(std::size_t row, std::size_t col) const { return (*this)(row, col); }

    void set(std::size_t row, std::size_t col, T value) { (*this)(row, col) = std::move(value); }

    /**
     * @brief Equality comparison operator
     *
     * Matrices of different sizes are not equal; a note is emitted through
     * the diagnostics channel in that case.
     */
    [[nodiscard]] bool operator==(const Matrix& other) const {
        if (size_ != other.size_) {
            diagnostics::note("matrices of sizes {} and {} compared for equality", size_, other.size_);
            return false;
        }
        return storage_ == other.storage_;
    }

    [[nodiscard]] bool operator!=(const Matrix& other) const { return !(*this == other); }

    /**
     * @brief Binary addition operator
     * @throws MatrixError ShapeMismatch if the sizes differ
     */
    [[nodiscard]] Matrix operator+(const Matrix& other) const {
        require_same_size(other, "addition");
        Matrix result(size_);
        for (std::size_t r = 0; r < rows(); ++r) {
            for (std::size_t c = 0; c < cols(); ++c) {
                result.storage_[r][c] = storage_[r][c] + other.storage_[r][c];
            }
        }
        return result;
    }

    /**
     * @brief Binary subtraction operator
     * @throws MatrixError ShapeMismatch if the sizes differ
     */
    [[nodiscard]] Matrix operator-(const Matrix& other) const {
        require_same_size(other, "subtraction");
        Matrix result(size_);
        for (std::size_t r = 0; r < rows(); ++r) {
            for (std::size_t c = 0; c < cols(); ++c) {
                result.storage_[r][c] = storage_[r][c] - other.storage_[r][c];
            }
        }
        return result;
    }

    /**
     * @brief Compound addition operator, leaves *this untouched on failure
     */
    Matrix& operator+=(const Matrix& other) {
        Matrix sum = *this + other;
        storage_ = std::move(sum.storage_);
        return *this;
    }

    /**
     * @brief Compound subtraction operator, leaves *this untouched on failure
     */
    Matrix& operator-=(const Matrix& other) {
        Matrix difference = *this - other;
        storage_ = std::move(difference.storage_);
        return *this;
    }

    /**
     * @brief Matrix multiplication operator
     * @param rhs Right-hand matrix (cols() × P)
     * @return Result matrix (rows() × P)
     * @throws MatrixError ShapeMismatch if cols() != rhs.rows()
     */
    [[nodiscard]] Matrix operator*(const Matrix& rhs) const {
        if (cols() != rhs.rows()) {
            detail::fail(ErrorKind::ShapeMismatch,
                         "multiplication needs left columns == right rows, got {} * {}",
                         size_,
                         rhs.size_);
        }
        Matrix result(Size{rows(), rhs.cols()});
        for (std::size_t r = 0; r < rows(); ++r) {
            for (std::size_t c = 0; c < rhs.cols(); ++c) {
                T accum = T{0};
                for (std::size_t k = 0; k < cols(); ++k) {
                    accum += storage_[r][k] * rhs.storage_[k][c];
                }
                result.storage_[r][c] = accum;
            }
        }
        return result;
    }

    /**
     * @brief Compound matrix multiplication, may change the number of columns
     */
    Matrix& operator*=(const Matrix& rhs) {
        Matrix product = *this * rhs;
        storage_ = std::move(product.storage_);
        size_ = product.size_;
        return *this;
    }

    /**
     * @brief Compound scalar multiplication operator
     */
    Matrix& operator*=(const T& scalar) {
        for (auto& row : storage_) {
            for (auto& value : row) {
                value = value * scalar;
            }
        }
        return *this;
    }

    // Scalar multiplication (scalar * matrix)
    [[nodiscard]] friend Matrix operator*(const T& scalar, const Matrix& mat) {
        Matrix result(mat.size_);
        for (std::size_t r = 0; r < mat.rows(); ++r) {
            for (std::size_t c = 0; c < mat.cols(); ++c) {
                result.storage_[r][c] = scalar * mat.storage_[r][c];
            }
        }
        return result;
    }

    // Scalar multiplication (matrix * scalar), operand order kept for non-commutative elements
    [[nodiscard]] friend Matrix operator*(const Matrix& mat, const T& scalar) {
        Matrix result(mat.size_);
        for (std::size_t r = 0; r < mat.rows(); ++r) {
            for (std::size_t c = 0; c < mat.cols(); ++c) {
                result.storage_[r][c] = mat.storage_[r][c] * scalar;
            }
        }
        return result;
    }

    /**
     * @brief Unary negation operator, scales by the additive inverse of T{1}
     */
    [[nodiscard]] Matrix operator-() const { return (T{0} - T{1}) * *this; }

    /**
     * @brief Matrix transpose
     * @return New (cols() × rows()) matrix; *this and its transposed flag are unchanged
     */
    [[nodiscard]] Matrix transposed() const {
        Matrix result(size_.swapped());
        for (std::size_t r = 0; r < rows(); ++r) {
            for (std::size_t c = 0; c < cols(); ++c) {
                result.storage_[c][r] = storage_[r][c];
            }
        }
        return result;
    }

    /**
     * @brief Transpose in place and flip is_transposed()
     *
     * The new rows are built before anything is replaced, so a failed
     * allocation leaves the matrix as it was.
     */
    void transpose() {
        Matrix result = transposed();
        storage_ = std::move(result.storage_);
        size_ = result.size_;
        transposed_ = !transposed_;
    }

    /**
     * @brief Matrix formed by the intersection of the given rows and columns
     *
     * Indices are deduplicated and sorted, so choose({2, 1}, {1, 0}) equals
     * choose({1, 2}, {0, 1}).
     *
     * @param row_indices Rows to keep
     * @param col_indices Columns to keep
     * @throws MatrixError EmptySelection if either set is empty
     * @throws MatrixError IndexOutOfBounds if an index is outside the matrix
     */
    [[nodiscard]] Matrix choose(const Indices& row_indices, const Indices& col_indices) const {
        require_selection(row_indices, col_indices);
        const Indices chosen_rows = detail::normalized(row_indices);
        const Indices chosen_cols = detail::normalized(col_indices);
        check_indices(chosen_rows, chosen_cols);
        return choose_sorted(chosen_rows, chosen_cols);
    }

    /**
     * @brief Matrix left after deleting the given rows and columns
     *
     * remove(R, C) equals choose of the complements of R and C.
     *
     * @param row_indices Rows to delete
     * @param col_indices Columns to delete
     * @throws MatrixError EmptySelection if either set is empty or nothing would remain
     * @throws MatrixError IndexOutOfBounds if an index is outside the matrix
     */
    [[nodiscard]] Matrix remove(const Indices& row_indices, const Indices& col_indices) const {
        require_selection(row_indices, col_indices);
        const Indices removed_rows = detail::normalized(row_indices);
        const Indices removed_cols = detail::normalized(col_indices);
        check_indices(removed_rows, removed_cols);
        return choose(detail::complement(removed_rows, rows()), detail::complement(removed_cols, cols()));
    }

    /**
     * @brief Determinant by Laplace expansion along the first row
     *
     * Runs in factorial time; intended for small matrices and exact element
     * types.
     *
     * @return Determinant, or nullopt if the matrix is not square
     */
    [[nodiscard]] std::optional<T> determinant() const {
        if (!is_square()) {
            diagnostics::note("determinant of non-square matrix of size {} is undefined", size_);
            return std::nullopt;
        }
        return cofactor_expansion();
    }

    [[nodiscard]] bool is_square() const { return size_.is_square(); }

    /**
     * @brief True if the determinant is T{0}
     * @throws MatrixError NotSquare if the matrix is not square
     */
    [[nodiscard]] bool is_degenerate() const {
        if (!is_square()) {
            detail::fail(ErrorKind::NotSquare, "degeneracy needs a square matrix, got size {}", size_);
        }
        return cofactor_expansion() == T{0};
    }

    [[nodiscard]] bool is_symmetric() const { return is_square() && transposed() == *this; }

    [[nodiscard]] bool is_antisymmetric() const { return is_square() && -transposed() == *this; }

private:
    Storage storage_;
    Size    size_;
    bool    transposed_ = false;

    // Zero-filled matrix of a size already known to be non-empty
    explicit Matrix(Size size) : storage_(size.rows, std::vector<T>(size.columns, T{0})), size_(size) {}

    static Size validated_size(const Storage& rows) {
        if (rows.empty()) {
            detail::fail(ErrorKind::MalformedInput, "matrix needs at least one row");
        }
        const std::size_t columns = rows.front().size();
        if (columns == 0) {
            detail::fail(ErrorKind::MalformedInput, "matrix rows must not be empty");
        }
        for (std::size_t r = 1; r < rows.size(); ++r) {
            if (rows[r].size() != columns) {
                detail::fail(ErrorKind::MalformedInput, "row {} has {} values, expected {}", r, rows[r].size(), columns);
            }
        }
        return Size{rows.size(), columns};
    }

    void check_index(std::size_t row, std::size_t col) const {
        if (row >= rows()) {
            detail::fail(ErrorKind::IndexOutOfBounds, "row index {} out of range for size {}", row, size_);
        }
        if (col >= cols()) {
            detail::fail(ErrorKind::IndexOutOfBounds, "column index {} out of range for size {}", col, size_);
        }
    }

    void require_same_size(const Matrix& other, const char* operation) const {
        if (size_ != other.size_) {
            detail::fail(ErrorKind::ShapeMismatch, "{} needs equal sizes, got {} and {}", operation, size_, other.size_);
        }
    }

    static void require_selection(const Indices& row_indices, const Indices& col_indices) {
        if (row_indices.empty() || col_indices.empty()) {
            detail::fail(ErrorKind::EmptySelection,
                         "selection needs at least one row and one column, got {} rows and {} columns",
                         row_indices.size(),
                         col_indices.size());
        }
    }

    // Both sets sorted, so only the last index can be out of range
    void check_indices(const Indices& sorted_rows, const Indices& sorted_cols) const {
        if (sorted_rows.back() >= rows()) {
            detail::fail(ErrorKind::IndexOutOfBounds, "row index {} out of range for size {}", sorted_rows.back(), size_);
        }
        if (sorted_cols.back() >= cols()) {
            detail::fail(ErrorKind::IndexOutOfBounds, "column index {} out of range for size {}", sorted_cols.back(), size_);
        }
    }

    [[nodiscard]] Matrix choose_sorted(const Indices& sorted_rows, const Indices& sorted_cols) const {
        Matrix result(Size{sorted_rows.size(), sorted_cols.size()});
        for (std::size_t i = 0; i < sorted_rows.size(); ++i) {
            for (std::size_t j = 0; j < sorted_cols.size(); ++j) {
                result.storage_[i][j] = storage_[sorted_rows[i]][sorted_cols[j]];
            }
        }
        return result;
    }

    // Unchecked variants of choose/remove for the determinant; callers guarantee
    // non-empty, in-range index sets.
    [[nodiscard]] Matrix choose_unchecked(const Indices& row_indices, const Indices& col_indices) const {
        return choose_sorted(detail::normalized(row_indices), detail::normalized(col_indices));
    }

    [[nodiscard]] Matrix remove_unchecked(const Indices& row_indices, const Indices& col_indices) const {
        return choose_unchecked(detail::complement(detail::normalized(row_indices), rows()),
                                detail::complement(detail::normalized(col_indices), cols()));
    }

    // Requires a square matrix
    [[nodiscard]] T cofactor_expansion() const {
        if (rows() == 1) {
            return storage_[0][0];
        }
        const T minus_one = T{0} - T{1};
        T       result = T{0};
        for (std::size_t j = 0; j < cols(); ++j) {
            const T      sign = (j % 2 == 1) ? minus_one : T{1};
            const Matrix minor = remove_unchecked({0}, {j});
            result += storage_[0][j] * (sign * minor.cofactor_expansion());
        }
        return result;
    }
};

template<typename T>
struct is_matrix_type<Matrix<T>> : std::true_type {};

} // namespace gridmat
