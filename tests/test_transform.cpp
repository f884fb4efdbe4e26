#include <doctest/doctest.h>

#include "gridmat/matrix.hpp"

using namespace gridmat;

TEST_CASE("Matrix transposed") {
    const Matrix<int> mat{{12, 65, 3}, {29, 40, 22}, {33, 76, 99}};
    const Matrix<int> expected{{12, 29, 33}, {65, 40, 76}, {3, 22, 99}};

    auto trans = mat.transposed();
    CHECK(trans == expected);
    CHECK_FALSE(mat.is_transposed());
    CHECK_FALSE(trans.is_transposed());

    SUBCASE("Non-square") {
        const Matrix<int> tall{{12, 65, 3}, {29, 40, 22}, {33, 76, 99}, {123, 0, 2}};
        const Matrix<int> wide{{12, 29, 33, 123}, {65, 40, 76, 0}, {3, 22, 99, 2}};

        auto result = tall.transposed();
        CHECK(result.size() == Size{3, 4});
        CHECK(result.storage().size() == 3);
        CHECK(result.storage().front().size() == 4);
        CHECK(result == wide);
    }
}

TEST_CASE("Matrix transpose in place") {
    Matrix<int>       mat{{12, 65, 3, 5}, {29, 40, 22, 678}, {33, 76, 99, 33}};
    const Matrix<int> original = mat;
    const Matrix<int> expected{{12, 29, 33}, {65, 40, 76}, {3, 22, 99}, {5, 678, 33}};

    mat.transpose();
    CHECK(mat.is_transposed());
    CHECK(mat.size() == Size{4, 3});
    CHECK(mat == expected);

    mat.transpose();
    CHECK_FALSE(mat.is_transposed());
    CHECK(mat == original);
}

TEST_CASE("Matrix transpose is an involution") {
    const Matrix<double> mat{{1.5, -2.0}, {0.0, 3.25}, {7.0, 8.0}};
    CHECK(mat.transposed().transposed() == mat);

    Matrix<double> copy = mat;
    copy.transpose();
    copy.transpose();
    CHECK(copy == mat);
}

TEST_CASE("Matrix choose") {
    const Matrix<int> mat{{1, 3, -5, 4}, {3, 2, 7, 6}, {-8, 4, 5, 2}};
    const Matrix<int> expected{{3, 7, 6}, {-8, 5, 2}};

    auto chosen = mat.choose({1, 2}, {0, 2, 3});
    CHECK(chosen.size() == Size{2, 3});
    CHECK(chosen == expected);

    SUBCASE("Order and duplicates are irrelevant") {
        CHECK(mat.choose({2, 1}, {3, 0, 2}) == chosen);
        CHECK(mat.choose({2, 1, 2, 1}, {3, 3, 0, 2, 0}) == chosen);
        CHECK(mat.choose({2, 1}, {1, 0}) == mat.choose({1, 2}, {0, 1}));
    }

    SUBCASE("Whole matrix") {
        CHECK(mat.choose({0, 1, 2}, {0, 1, 2, 3}) == mat);
    }
}

TEST_CASE("Matrix choose rejects invalid selections") {
    const Matrix<int> mat{{1, 3, -5, 4}, {3, 2, 7, 6}, {-8, 4, 5, 2}};

    auto failure_kind = [&](const Indices& rows, const Indices& cols) {
        try {
            (void)mat.choose(rows, cols);
        } catch (const MatrixError& err) {
            return err.kind();
        }
        FAIL("invalid selection accepted");
        return ErrorKind::MalformedInput;
    };

    CHECK(failure_kind({}, {0}) == ErrorKind::EmptySelection);
    CHECK(failure_kind({0}, {}) == ErrorKind::EmptySelection);
    CHECK(failure_kind({0, 3}, {0}) == ErrorKind::IndexOutOfBounds);
    CHECK(failure_kind({0}, {0, 4}) == ErrorKind::IndexOutOfBounds);
}

TEST_CASE("Matrix remove") {
    const Matrix<int> mat{
        {1, 2, 3, 4, 5},
        {6, 7, 8, 9, 10},
        {11, 12, 13, 14, 15},
        {16, 17, 18, 19, 20},
        {21, 22, 23, 24, 25},
    };
    const Matrix<int> expected{{6, 8, 9, 10}, {11, 13, 14, 15}, {16, 18, 19, 20}, {21, 23, 24, 25}};

    auto remaining = mat.remove({0}, {1});
    CHECK(remaining.size() == Size{4, 4});
    CHECK(remaining == expected);

    SUBCASE("Order is irrelevant") {
        CHECK(mat.remove({1, 2, 4}, {0, 3}) == mat.remove({2, 4, 1}, {3, 0}));
        CHECK(mat.remove({1, 1, 2}, {0}) == mat.remove({2, 1}, {0, 0}));
    }

    SUBCASE("Remove is the complement of choose") {
        CHECK(mat.remove({1, 2, 4}, {0, 3}) == mat.choose({0, 3}, {1, 2, 4}));
        CHECK(mat.remove({4}, {4}) == mat.choose({0, 1, 2, 3}, {0, 1, 2, 3}));
    }
}

TEST_CASE("Matrix remove rejects invalid selections") {
    const Matrix<int> mat{{1, 2, 3}, {4, 5, 6}};

    auto failure_kind = [&](const Indices& rows, const Indices& cols) {
        try {
            (void)mat.remove(rows, cols);
        } catch (const MatrixError& err) {
            return err.kind();
        }
        FAIL("invalid removal accepted");
        return ErrorKind::MalformedInput;
    };

    CHECK(failure_kind({}, {0}) == ErrorKind::EmptySelection);
    CHECK(failure_kind({0}, {}) == ErrorKind::EmptySelection);
    CHECK(failure_kind({0, 4}, {0}) == ErrorKind::IndexOutOfBounds);
    CHECK(failure_kind({0}, {0, 5}) == ErrorKind::IndexOutOfBounds);
    // Nothing would be left
    CHECK(failure_kind({0, 1}, {0}) == ErrorKind::EmptySelection);
    CHECK(failure_kind({0}, {2, 1, 0}) == ErrorKind::EmptySelection);
}
