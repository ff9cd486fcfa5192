#include "linear_sys.h"
#include <string>
#include <utility>

SingularMatrixError::SingularMatrixError(int row, int col)
    : std::runtime_error("Matrix is singular or ill-conditioned. Zero pivot at position ("
                         + std::to_string(row) + ", " + std::to_string(col) + ")"),
      row_(row), col_(col) {}

DivisionByZeroError::DivisionByZeroError(int row)
    : std::runtime_error("Division by zero in backward substitution: U["
                         + std::to_string(row) + "][" + std::to_string(row) + "] is zero"),
      row_(row) {}

void checkSquare(const Matrix& A, const char* what) {
    if (A.empty()) {
        throw DimensionError(std::string(what) + " must not be empty");
    }
    const size_t n = A.size();
    for (size_t i = 0; i < n; i++) {
        if (A[i].size() != n) {
            throw DimensionError(std::string(what) + " must be square. Rows: " + std::to_string(n)
                                 + ", row " + std::to_string(i) + " has " + std::to_string(A[i].size())
                                 + " columns");
        }
    }
}

SystemSolution solveSystem(const Matrix& A, const Vector& b) {
    checkSquare(A, "Coefficient matrix");
    if (b.size() != A.size()) {
        throw DimensionError("Right-hand side has length " + std::to_string(b.size())
                             + ", expected " + std::to_string(A.size()));
    }

    LUFactors factors = luDecomposition(A);
    Vector x = solveLU(factors.L, factors.U, b);

    SystemSolution solution;
    solution.x = std::move(x);
    solution.L = std::move(factors.L);
    solution.U = std::move(factors.U);
    return solution;
}
