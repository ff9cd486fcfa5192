#ifndef LINEAR_SYS_H
#define LINEAR_SYS_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

using Matrix = std::vector<std::vector<double>>;
using Vector = std::vector<double>;

// Pivots with a magnitude below this value are treated as zero
const double PIVOT_TOLERANCE = 1e-10;

// Matrix is not square, or a vector does not match the matrix dimension
class DimensionError : public std::invalid_argument {
public:
    explicit DimensionError(const std::string& what) : std::invalid_argument(what) {}
};

// A pivot fell below PIVOT_TOLERANCE during or after elimination
class SingularMatrixError : public std::runtime_error {
public:
    SingularMatrixError(int row, int col);

    int row() const { return row_; }
    int col() const { return col_; }

private:
    int row_;
    int col_;
};

// Zero on the diagonal of U during backward substitution
class DivisionByZeroError : public std::runtime_error {
public:
    explicit DivisionByZeroError(int row);

    int row() const { return row_; }

private:
    int row_;
};

struct LUFactors {
    Matrix L;
    Matrix U;
};

struct SystemSolution {
    Vector x;
    Matrix L;
    Matrix U;
};

/**
 * Factors A into a unit lower triangular L and an upper triangular U
 * using Gaussian elimination without pivoting.
 *
 * @param A Square coefficient matrix
 * @return The factors L and U with A = LU
 * @throws DimensionError if A is empty or not square
 * @throws SingularMatrixError if a pivot magnitude is below PIVOT_TOLERANCE
 */
LUFactors luDecomposition(const Matrix& A);

// Solves Ly = b for unit lower triangular L. The diagonal of L is not read.
Vector forwardSubstitution(const Matrix& L, const Vector& b);

// Solves Ux = y for upper triangular U. Throws DivisionByZeroError on a zero diagonal.
Vector backwardSubstitution(const Matrix& U, const Vector& y);

// Solve Ax = B using the LU decomposition
Vector solveLU(const Matrix& L, const Matrix& U, const Vector& B);

/**
 * Solves Ax = b: factors A, then runs forward and backward substitution.
 * Errors from either stage are propagated unchanged.
 *
 * @param A Square coefficient matrix
 * @param b Right-hand side, length must equal the dimension of A
 * @return The solution x together with the factors L and U
 */
SystemSolution solveSystem(const Matrix& A, const Vector& b);

// Throws DimensionError unless A is non-empty and every row has A.size() entries
void checkSquare(const Matrix& A, const char* what);

#endif // LINEAR_SYS_H
