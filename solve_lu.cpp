#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <chrono>
#include "linear_sys.h"
#include "analysis.h"
#include "log.h"
#include "utils.h"

namespace {

void printSection(const std::string& title) {
    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(80, '=') << std::endl;
}

bool hasNonZero(const Vector& v) {
    for (double value : v) {
        if (value != 0.0) {
            return true;
        }
    }
    return false;
}

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <matrix_file> <rhs_file> [expected_file] [solution_file]" << std::endl;
    std::cerr << "  matrix_file: COO text file, first line \"rows cols nnz\", then \"row col value\" (0-based)" << std::endl;
    std::cerr << "  rhs_file: whitespace separated right-hand side values" << std::endl;
    std::cerr << "  expected_file: known solution to compare against (optional)" << std::endl;
    std::cerr << "  solution_file: where to write the computed solution (optional)" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 5) {
        printUsage(argv[0]);
        return 1;
    }

    std::string matrixFile = argv[1];
    std::string rhsFile = argv[2];
    std::string expectedFile = argc > 3 ? argv[3] : "";
    std::string solnFile = argc > 4 ? argv[4] : "";

    Matrix A;
    Vector b;
    Vector expected;
    try {
        A = readMatrix(matrixFile);
        b = readVector(rhsFile);
        if (!expectedFile.empty()) {
            expected = readVector(expectedFile);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    LUSOLVE_LOG << "Matrix A dimensions: " << A.size() << " x " << A[0].size() << "\n";
    LUSOLVE_LOG << "Vector b size: " << b.size() << "\n";

    SystemSolution solution;
    auto start = std::chrono::high_resolution_clock::now();
    try {
        solution = solveSystem(A, b);
    } catch (const DimensionError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Check that A is square and b has one entry per row of A." << std::endl;
        return 1;
    } catch (const SingularMatrixError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Check that A is non-singular and well conditioned. "
                  << "This solver does not pivot, so a zero leading entry also fails." << std::endl;
        return 1;
    } catch (const DivisionByZeroError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end - start;

    const Vector& x = solution.x;
    int n = x.size();

    printSection("LU DECOMPOSITION");
    std::cout << "Matrix A:" << std::endl << formatMatrix(A);
    std::cout << "Matrix L (unit lower triangular):" << std::endl << formatMatrix(solution.L);
    std::cout << "Matrix U (upper triangular):" << std::endl << formatMatrix(solution.U);
    std::cout << "max |LU - A|: " << std::scientific << std::setprecision(6)
              << reconstructionError(A, solution.L, solution.U) << std::endl;

    printSection("SOLUTION");
    std::cout << formatVector(x);

    SolutionValidation validation = validateSolution(A, x, b);
    std::cout << "Validation: " << (validation.is_valid ? "solution is valid" : "residual is high") << std::endl;
    std::cout << "Max residual: " << std::scientific << std::setprecision(2) << validation.max_residual << std::endl;

    printSection("ERROR ANALYSIS");
    double relativeError = calculateRelativeError(A, x, b);
    std::cout << "Relative error (||Ax_calc - b|| / ||b||): " << std::scientific << std::setprecision(2)
              << relativeError << std::endl;

    double cond = calculateConditionNumber(A);
    ConditionClass condClass = classifyCondition(cond);
    std::cout << "Condition number: " << std::scientific << std::setprecision(2) << cond
              << " (" << conditionClassName(condClass) << ")" << std::endl;
    if (condClass == ConditionClass::SeverelyIllConditioned) {
        std::cout << "Warning: matrix is severely ill-conditioned, results may be inaccurate." << std::endl;
    } else if (condClass == ConditionClass::IllConditioned) {
        std::cout << "Note: matrix is ill-conditioned, results may lose some accuracy." << std::endl;
    }

    bool compared = false;
    SolutionComparison comparison;
    if (hasNonZero(expected)) {
        printSection("COMPARISON WITH EXPECTED SOLUTION");
        try {
            comparison = compareSolutions(x, expected);
        } catch (const DimensionError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        compared = true;

        std::cout << "Difference (x_calc - x_expected):" << std::endl << formatVector(comparison.difference, "d");
        std::cout << "Absolute error: " << std::scientific << std::setprecision(2) << comparison.absolute_error << std::endl;
        std::cout << "Relative error: " << std::scientific << std::setprecision(2) << comparison.relative_error << std::endl;
        std::cout << "Max error: " << std::scientific << std::setprecision(2) << comparison.max_error << std::endl;
    }

    printSection("SUMMARY");
    std::cout << "  Dimension: " << n << std::endl;
    std::cout << "  Relative error: " << std::scientific << std::setprecision(2) << relativeError << std::endl;
    std::cout << "  Condition number: " << std::scientific << std::setprecision(2) << cond << std::endl;
    std::cout << "  Valid solution: " << (validation.is_valid ? "Yes" : "No") << std::endl;
    if (compared) {
        std::cout << "  Relative error vs expected: " << std::scientific << std::setprecision(2)
                  << comparison.relative_error << std::endl;
    }
    std::cout << "  Time (ms): " << std::fixed << std::setprecision(3) << duration.count() << std::endl;

    if (!solnFile.empty()) {
        try {
            writeVectorToFile(x, solnFile);
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        std::cout << "Solution written to " << solnFile << std::endl;
    }

    return 0;
}
