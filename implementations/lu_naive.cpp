#include "../linear_sys.h"
#include "../log.h"
#include <cmath>
#include <string>
#include <omp.h>

namespace {

// Below this many rows per level the OpenMP fork costs more than the update
const int OMP_MIN_ROWS = 64;

void checkLength(const Matrix& M, const Vector& v, const char* what) {
    if (v.size() != M.size()) {
        throw DimensionError(std::string(what) + " has length " + std::to_string(v.size())
                             + ", expected " + std::to_string(M.size()));
    }
}

} // namespace

LUFactors luDecomposition(const Matrix& A) {
    checkSquare(A, "Matrix");
    int n = A.size();

    // L starts as the identity, U as a copy of A
    LUFactors f;
    f.L.assign(n, Vector(n, 0.0));
    for (int i = 0; i < n; i++) {
        f.L[i][i] = 1.0;
    }
    f.U = A;

    Matrix& L = f.L;
    Matrix& U = f.U;

    for (int k = 0; k < n - 1; k++) {
        LUSOLVE_LOG_VERBOSE << "pivot " << k << ": " << U[k][k] << "\n";
        if (std::abs(U[k][k]) < PIVOT_TOLERANCE) {
            throw SingularMatrixError(k, k);
        }

        // Rows below the pivot are independent of each other. The implicit
        // barrier at the end of the loop keeps level k+1 from starting early.
        #pragma omp parallel for if (n - k - 1 > OMP_MIN_ROWS)
        for (int i = k + 1; i < n; i++) {
            double multiplier = U[i][k] / U[k][k];
            L[i][k] = multiplier;
            U[i][k] = 0.0;
            for (int j = k + 1; j < n; j++) {
                U[i][j] -= multiplier * U[k][j];
            }
        }
    }

    LUSOLVE_LOG_VERBOSE << "pivot " << n - 1 << ": " << U[n - 1][n - 1] << "\n";
    if (std::abs(U[n - 1][n - 1]) < PIVOT_TOLERANCE) {
        throw SingularMatrixError(n - 1, n - 1);
    }

    return f;
}

Vector forwardSubstitution(const Matrix& L, const Vector& b) {
    checkSquare(L, "Lower factor");
    checkLength(L, b, "Right-hand side");
    int n = L.size();

    Vector y(n, 0.0);
    y[0] = b[0];
    for (int i = 1; i < n; i++) {
        double sum = 0.0;
        for (int j = 0; j < i; j++) {
            sum += L[i][j] * y[j];
        }
        // No need to divide by L[i][i] since it's 1
        y[i] = b[i] - sum;
    }

    return y;
}

Vector backwardSubstitution(const Matrix& U, const Vector& y) {
    checkSquare(U, "Upper factor");
    checkLength(U, y, "Intermediate vector");
    int n = U.size();

    Vector x(n, 0.0);
    for (int i = n - 1; i >= 0; i--) {
        double sum = 0.0;
        for (int j = i + 1; j < n; j++) {
            sum += U[i][j] * x[j];
        }
        if (U[i][i] == 0.0) {
            throw DivisionByZeroError(i);
        }
        x[i] = (y[i] - sum) / U[i][i];
    }

    return x;
}

Vector solveLU(const Matrix& L, const Matrix& U, const Vector& B) {
    // Forward substitution to solve Ly = B
    Vector y = forwardSubstitution(L, B);

    // Back substitution to solve Ux = y
    return backwardSubstitution(U, y);
}
