#include "linear_sys.h"
#include "analysis.h"

#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <string>

namespace {

Matrix diagonallyDominant(int n, unsigned seed) {
    std::mt19937 engine(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    Matrix A(n, Vector(n, 0.0));
    for (int i = 0; i < n; i++) {
        double row_sum = 0.0;
        for (int j = 0; j < n; j++) {
            if (i == j)
                continue;
            A[i][j] = dist(engine);
            row_sum += std::abs(A[i][j]);
        }
        A[i][i] = row_sum + 1.0;
    }
    return A;
}

} // namespace

TEST(LUDecomposition, FactorsTwoByTwoExample) {
    Matrix A = {{2, 1}, {1, 1}};

    LUFactors f = luDecomposition(A);

    EXPECT_DOUBLE_EQ(f.L[0][0], 1.0);
    EXPECT_DOUBLE_EQ(f.L[0][1], 0.0);
    EXPECT_DOUBLE_EQ(f.L[1][0], 0.5);
    EXPECT_DOUBLE_EQ(f.L[1][1], 1.0);

    EXPECT_DOUBLE_EQ(f.U[0][0], 2.0);
    EXPECT_DOUBLE_EQ(f.U[0][1], 1.0);
    EXPECT_DOUBLE_EQ(f.U[1][0], 0.0);
    EXPECT_DOUBLE_EQ(f.U[1][1], 0.5);
}

TEST(LUDecomposition, FactorsHaveTriangularStructure) {
    const int n = 6;
    Matrix A = diagonallyDominant(n, 7);

    LUFactors f = luDecomposition(A);

    for (int i = 0; i < n; i++) {
        EXPECT_EQ(f.L[i][i], 1.0);
        for (int j = i + 1; j < n; j++) {
            EXPECT_EQ(f.L[i][j], 0.0) << "L[" << i << "][" << j << "]";
        }
        for (int j = 0; j < i; j++) {
            EXPECT_EQ(f.U[i][j], 0.0) << "U[" << i << "][" << j << "]";
        }
    }
}

TEST(LUDecomposition, ReconstructsInput) {
    for (int n : {2, 3, 5, 10}) {
        Matrix A = diagonallyDominant(n, 100 + n);
        LUFactors f = luDecomposition(A);
        EXPECT_LT(reconstructionError(A, f.L, f.U), 1e-12 * n) << "n = " << n;
    }
}

TEST(LUDecomposition, ReconstructsLargeInput) {
    // Large enough to take the parallel row update path
    const int n = 150;
    Matrix A = diagonallyDominant(n, 3);

    LUFactors f = luDecomposition(A);

    EXPECT_LT(reconstructionError(A, f.L, f.U), 1e-10);
}

TEST(LUDecomposition, DoesNotModifyInput) {
    Matrix A = {{4, 3}, {6, 3}};
    const Matrix copy = A;

    luDecomposition(A);

    EXPECT_EQ(A, copy);
}

TEST(LUDecomposition, ZeroLeadingPivotIsSingular) {
    Matrix A = {{0, 1}, {1, 1}};

    try {
        luDecomposition(A);
        FAIL() << "expected SingularMatrixError";
    } catch (const SingularMatrixError& e) {
        EXPECT_EQ(e.row(), 0);
        EXPECT_EQ(e.col(), 0);
        EXPECT_NE(std::string(e.what()).find("(0, 0)"), std::string::npos);
    }
}

TEST(LUDecomposition, ZeroedRowOfIdentityFailsAtThatPivot) {
    const int n = 5;
    for (int k = 0; k < n; k++) {
        Matrix A(n, Vector(n, 0.0));
        for (int i = 0; i < n; i++) {
            A[i][i] = 1.0;
        }
        A[k][k] = 0.0;

        try {
            luDecomposition(A);
            ADD_FAILURE() << "expected SingularMatrixError for k = " << k;
        } catch (const SingularMatrixError& e) {
            EXPECT_EQ(e.row(), k);
            EXPECT_EQ(e.col(), k);
        }
    }
}

TEST(LUDecomposition, PivotBelowThresholdIsSingular) {
    Matrix A = {{1e-11, 1}, {1, 1}};
    EXPECT_THROW(luDecomposition(A), SingularMatrixError);

    Matrix B = {{1e-9, 1}, {1, 1}};
    EXPECT_NO_THROW(luDecomposition(B));
}

TEST(LUDecomposition, NonSingularMatrixNeedingRowExchangeFails) {
    // Permutation matrix: invertible, but the first pivot is zero
    Matrix A = {{0, 1}, {1, 0}};
    EXPECT_THROW(luDecomposition(A), SingularMatrixError);
}

TEST(LUDecomposition, RankDeficientMatrixFailsAtLastPivot) {
    Matrix A = {{1, 2}, {2, 4}};

    try {
        luDecomposition(A);
        FAIL() << "expected SingularMatrixError";
    } catch (const SingularMatrixError& e) {
        EXPECT_EQ(e.row(), 1);
        EXPECT_EQ(e.col(), 1);
    }
}

TEST(LUDecomposition, OneByOne) {
    LUFactors f = luDecomposition({{3.0}});
    EXPECT_DOUBLE_EQ(f.L[0][0], 1.0);
    EXPECT_DOUBLE_EQ(f.U[0][0], 3.0);

    EXPECT_THROW(luDecomposition({{0.0}}), SingularMatrixError);
}

TEST(LUDecomposition, RejectsNonSquareInput) {
    Matrix wide = {{1, 2, 3}, {4, 5, 6}};
    EXPECT_THROW(luDecomposition(wide), DimensionError);

    Matrix ragged = {{1, 2}, {3}};
    EXPECT_THROW(luDecomposition(ragged), DimensionError);

    EXPECT_THROW(luDecomposition(Matrix{}), DimensionError);
}

TEST(LUDecomposition, NonSquareCheckedBeforePivots) {
    // Zero first pivot, but the shape error must win
    Matrix A = {{0, 1, 2}, {1, 1, 1}};
    EXPECT_THROW(luDecomposition(A), DimensionError);
}
