#ifndef ANALYSIS_H
#define ANALYSIS_H

#include "linear_sys.h"
#include <string>

// Norms below this value are treated as zero when normalizing errors
const double NORM_TOLERANCE = 1e-10;
const double DEFAULT_VALIDATION_TOLERANCE = 1e-6;

const double ILL_CONDITIONED_THRESHOLD = 1e8;
const double SEVERELY_ILL_CONDITIONED_THRESHOLD = 1e12;

struct SolutionComparison {
    Vector difference;
    double absolute_error;
    double relative_error;
    double max_error;
};

struct SolutionValidation {
    bool is_valid;
    Vector residual;
    double max_residual;
};

enum class ConditionClass { WellConditioned, IllConditioned, SeverelyIllConditioned };

/**
 * Calculates the p-norm of a vector.
 *
 * @param v Input vector
 * @param p Norm order. +infinity gives the largest and -infinity the smallest absolute
 *          entry, 0 the number of non-zero entries, any other p (sum |v_i|^p)^(1/p).
 * @return The norm, 0 for an empty vector
 */
double vectorNorm(const Vector& v, double p = 2.0);

// Computes A * x
Vector matrixVectorProduct(const Matrix& A, const Vector& x);

// Computes A * B for square matrices of equal dimension
Matrix matrixProduct(const Matrix& A, const Matrix& B);

/**
 * Calculates the relative residual ||A x_calc - b|| / ||b||.
 * If ||b|| is below NORM_TOLERANCE the unnormalized residual norm is returned.
 *
 * @param A Coefficient matrix
 * @param x_calc Computed solution
 * @param b Right-hand side
 * @return Relative error
 */
double calculateRelativeError(const Matrix& A, const Vector& x_calc, const Vector& b);

/**
 * Compares a computed solution with a reference solution.
 *
 * @param x_calc Computed solution
 * @param x_expected Reference solution
 * @return Difference vector, 2-norm of the difference, the difference normalized
 *         by ||x_expected|| (unnormalized if that is below NORM_TOLERANCE), and
 *         the largest componentwise error
 */
SolutionComparison compareSolutions(const Vector& x_calc, const Vector& x_expected);

// 2-norm condition number sigma_max / sigma_min. Infinity if it cannot be computed.
double calculateConditionNumber(const Matrix& A);

/**
 * Checks that x satisfies Ax = b within a tolerance on the largest residual component.
 */
SolutionValidation validateSolution(const Matrix& A, const Vector& x, const Vector& b,
                                    double tolerance = DEFAULT_VALIDATION_TOLERANCE);

// Largest entry of |LU - A|
double reconstructionError(const Matrix& A, const Matrix& L, const Matrix& U);

ConditionClass classifyCondition(double condition_number);
std::string conditionClassName(ConditionClass c);

#endif // ANALYSIS_H
