#include "fmt/core.h"
#include "gridmat/format.hpp"
#include "gridmat/matrix.hpp"

int main() {
    using namespace gridmat;

    fmt::print("=== Matrix Construction ===\n\n");

    const Matrix<int> mat{{1, 4, 2, 3}, {8, 0, 0, 1}, {-6, -10, 4, 7}};
    fmt::print("Matrix of size {}:\n{}\n\n", mat.size(), mat);

    const auto identity = Matrix<int>::identity(4);
    fmt::print("Identity of order 4:\n{}\n\n", identity);

    fmt::print("=== Arithmetic ===\n\n");

    const auto product = mat * identity;
    fmt::print("mat * I == mat: {}\n", product == mat);
    fmt::print("mat * mat^T:\n{}\n\n", mat * mat.transposed());
    fmt::print("-2 * mat:\n{}\n\n", -2 * mat);

    // Mismatched shapes are reported, never turned into a placeholder result
    try {
        const auto sum = mat + mat.transposed();
        fmt::print("unexpected sum:\n{}\n", sum);
    } catch (const MatrixError& err) {
        fmt::print("mat + mat^T rejected ({}): {}\n\n", to_string(err.kind()), err.what());
    }

    fmt::print("=== Selection ===\n\n");

    const Matrix<int> grid{{1, 3, -5, 4}, {3, 2, 7, 6}, {-8, 4, 5, 2}};
    fmt::print("Rows {{1, 2}}, columns {{0, 2, 3}}:\n{}\n\n", grid.choose({1, 2}, {0, 2, 3}));
    fmt::print("Without row 0 and column 1:\n{}\n\n", grid.remove({0}, {1}));

    fmt::print("=== Determinant ===\n\n");

    const Matrix<int> non_degenerate{{2, -5, 4, 3}, {3, -4, 7, 5}, {4, -9, 8, 5}, {-3, 2, -5, 3}};
    const Matrix<int> degenerate{{0, 0, 0}, {1, 2, 3}, {4, 7, 8}};

    fmt::print("det =\n{}\n= {}\n", non_degenerate, non_degenerate.determinant().value());
    fmt::print("degenerate: {} / {}\n", non_degenerate.is_degenerate(), degenerate.is_degenerate());

    const Matrix<int> antisymmetric{{0, -7, -4, 6}, {7, 0, 1, -4}, {4, -1, 0, 5}, {-6, 4, -5, 0}};
    fmt::print("symmetric: {}, antisymmetric: {}\n", antisymmetric.is_symmetric(), antisymmetric.is_antisymmetric());

    if (!grid.determinant()) {
        fmt::print("{} matrix has no determinant\n", grid.size());
    }

    return 0;
}
