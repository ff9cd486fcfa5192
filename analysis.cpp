#include "analysis.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

Eigen::Map<const Eigen::VectorXd> asEigen(const Vector& v) {
    return Eigen::Map<const Eigen::VectorXd>(v.data(), v.size());
}

Eigen::MatrixXd toEigen(const Matrix& A) {
    const Eigen::Index rows = A.size();
    const Eigen::Index cols = A.empty() ? 0 : A[0].size();
    Eigen::MatrixXd M(rows, cols);
    for (Eigen::Index i = 0; i < rows; i++) {
        if (static_cast<Eigen::Index>(A[i].size()) != cols) {
            throw DimensionError("Matrix rows have different lengths");
        }
        M.row(i) = asEigen(A[i]).transpose();
    }
    return M;
}

void checkSameLength(const Vector& a, const Vector& b, const char* what) {
    if (a.size() != b.size()) {
        throw DimensionError(std::string(what) + ": vector lengths differ (" + std::to_string(a.size())
                             + " vs " + std::to_string(b.size()) + ")");
    }
}

double maxAbs(const Vector& v) {
    if (v.empty()) {
        return 0.0;
    }
    auto map = asEigen(v);
    // maxCoeff may skip NaN entries
    if (map.hasNaN()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return map.cwiseAbs().maxCoeff();
}

} // namespace

double vectorNorm(const Vector& v, double p) {
    if (std::isnan(p)) {
        throw std::invalid_argument("Norm order must be a number");
    }
    if (v.empty()) {
        return 0.0;
    }

    auto map = asEigen(v);
    if (p == 2.0) {
        return map.norm();
    }
    if (p == 1.0) {
        return map.lpNorm<1>();
    }
    if (std::isinf(p)) {
        if (map.hasNaN()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return p > 0 ? map.lpNorm<Eigen::Infinity>() : map.cwiseAbs().minCoeff();
    }
    if (p == 0.0) {
        // Number of non-zero entries
        return static_cast<double>((map.array() != 0.0).count());
    }
    return std::pow(map.cwiseAbs().array().pow(p).sum(), 1.0 / p);
}

Vector matrixVectorProduct(const Matrix& A, const Vector& x) {
    Vector result(A.size(), 0.0);
    for (size_t i = 0; i < A.size(); i++) {
        if (A[i].size() != x.size()) {
            throw DimensionError("Matrix row " + std::to_string(i) + " has " + std::to_string(A[i].size())
                                 + " columns, vector has length " + std::to_string(x.size()));
        }
        for (size_t j = 0; j < x.size(); j++) {
            result[i] += A[i][j] * x[j];
        }
    }
    return result;
}

Matrix matrixProduct(const Matrix& A, const Matrix& B) {
    checkSquare(A, "Left operand");
    checkSquare(B, "Right operand");
    const size_t n = A.size();
    if (B.size() != n) {
        throw DimensionError("Cannot multiply " + std::to_string(n) + "x" + std::to_string(n) + " by "
                             + std::to_string(B.size()) + "x" + std::to_string(B.size()));
    }

    Matrix C(n, Vector(n, 0.0));
    for (size_t i = 0; i < n; i++) {
        for (size_t k = 0; k < n; k++) {
            const double aik = A[i][k];
            for (size_t j = 0; j < n; j++) {
                C[i][j] += aik * B[k][j];
            }
        }
    }
    return C;
}

double calculateRelativeError(const Matrix& A, const Vector& x_calc, const Vector& b) {
    Vector residual = matrixVectorProduct(A, x_calc);
    checkSameLength(residual, b, "Relative error");
    for (size_t i = 0; i < residual.size(); i++) {
        residual[i] -= b[i];
    }

    double norm_residual = vectorNorm(residual);
    double norm_b = vectorNorm(b);

    // Avoid dividing by a (near) zero right-hand side
    if (norm_b < NORM_TOLERANCE) {
        return norm_residual;
    }
    return norm_residual / norm_b;
}

SolutionComparison compareSolutions(const Vector& x_calc, const Vector& x_expected) {
    checkSameLength(x_calc, x_expected, "Solution comparison");

    SolutionComparison cmp;
    cmp.difference.resize(x_calc.size());
    for (size_t i = 0; i < x_calc.size(); i++) {
        cmp.difference[i] = x_calc[i] - x_expected[i];
    }

    cmp.absolute_error = vectorNorm(cmp.difference);

    double norm_expected = vectorNorm(x_expected);
    if (norm_expected < NORM_TOLERANCE) {
        cmp.relative_error = cmp.absolute_error;
    } else {
        cmp.relative_error = cmp.absolute_error / norm_expected;
    }

    cmp.max_error = maxAbs(cmp.difference);
    return cmp;
}

double calculateConditionNumber(const Matrix& A) {
    const double inf = std::numeric_limits<double>::infinity();
    if (A.empty() || A[0].size() != A.size()) {
        return inf;
    }

    Eigen::MatrixXd M;
    try {
        M = toEigen(A);
    } catch (const DimensionError&) {
        return inf;
    }
    if (!M.allFinite()) {
        return inf;
    }

    // Singular values come back sorted in decreasing order
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(M);
    const Eigen::VectorXd& sigma = svd.singularValues();
    double sigma_max = sigma(0);
    double sigma_min = sigma(sigma.size() - 1);

    if (sigma_min == 0.0 || !std::isfinite(sigma_max) || !std::isfinite(sigma_min)) {
        return inf;
    }
    return sigma_max / sigma_min;
}

SolutionValidation validateSolution(const Matrix& A, const Vector& x, const Vector& b, double tolerance) {
    SolutionValidation result;
    result.residual = matrixVectorProduct(A, x);
    checkSameLength(result.residual, b, "Solution validation");
    for (size_t i = 0; i < b.size(); i++) {
        result.residual[i] -= b[i];
    }

    result.max_residual = maxAbs(result.residual);
    result.is_valid = result.max_residual < tolerance;
    return result;
}

double reconstructionError(const Matrix& A, const Matrix& L, const Matrix& U) {
    Matrix LU = matrixProduct(L, U);
    checkSquare(A, "Matrix");
    if (A.size() != LU.size()) {
        throw DimensionError("Factors do not match the matrix dimension");
    }

    double max_error = 0.0;
    for (size_t i = 0; i < A.size(); i++) {
        for (size_t j = 0; j < A.size(); j++) {
            max_error = std::max(max_error, std::abs(LU[i][j] - A[i][j]));
        }
    }
    return max_error;
}

ConditionClass classifyCondition(double condition_number) {
    if (condition_number > SEVERELY_ILL_CONDITIONED_THRESHOLD) {
        return ConditionClass::SeverelyIllConditioned;
    }
    if (condition_number > ILL_CONDITIONED_THRESHOLD) {
        return ConditionClass::IllConditioned;
    }
    return ConditionClass::WellConditioned;
}

std::string conditionClassName(ConditionClass c) {
    switch (c) {
    case ConditionClass::WellConditioned:
        return "well-conditioned";
    case ConditionClass::IllConditioned:
        return "ill-conditioned";
    case ConditionClass::SeverelyIllConditioned:
        return "severely ill-conditioned";
    }
    return "unknown";
}
