#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <chrono>

#include <Eigen/Dense>

#include "linear_sys.h"
#include "analysis.h"
#include "utils.h"

using namespace std;

// Matrix analysis structure
struct MatrixAnalysis
{
    int dimension;
    bool is_symmetric;
    bool is_diagonally_dominant;
    double diagonal_dominance_ratio;
    double min_diagonal;
    double max_diagonal;
    double max_off_diagonal;
    double frobenius_norm;
    double one_norm;
    double infinity_norm;
    double condition_number;
    ConditionClass condition_class;
    bool factorizable;          // LU without pivoting succeeds
    int failing_pivot;          // -1 when factorizable
    double reconstruction_error;
};

/**
 * Analyzes matrix properties relevant to LU factorization without pivoting
 */
MatrixAnalysis analyzeMatrix(const Matrix &A)
{
    checkSquare(A, "Matrix");

    MatrixAnalysis analysis;
    analysis.dimension = A.size();

    Eigen::MatrixXd M(analysis.dimension, analysis.dimension);
    for (int i = 0; i < analysis.dimension; i++)
    {
        for (int j = 0; j < analysis.dimension; j++)
        {
            M(i, j) = A[i][j];
        }
    }

    // Check symmetry
    analysis.is_symmetric = (M - M.transpose()).norm() < 1e-12;

    // Analyze diagonal dominance
    analysis.is_diagonally_dominant = true;
    analysis.min_diagonal = numeric_limits<double>::max();
    analysis.max_diagonal = numeric_limits<double>::lowest();
    analysis.max_off_diagonal = 0.0;

    double total_diagonal_sum = 0.0;
    double total_off_diagonal_sum = 0.0;

    for (int i = 0; i < analysis.dimension; i++)
    {
        double row_diagonal = abs(M(i, i));
        double row_off_diagonal = M.row(i).cwiseAbs().sum() - row_diagonal;

        analysis.min_diagonal = min(analysis.min_diagonal, row_diagonal);
        analysis.max_diagonal = max(analysis.max_diagonal, row_diagonal);
        for (int j = 0; j < analysis.dimension; j++)
        {
            if (j != i)
            {
                analysis.max_off_diagonal = max(analysis.max_off_diagonal, abs(M(i, j)));
            }
        }

        total_diagonal_sum += row_diagonal;
        total_off_diagonal_sum += row_off_diagonal;

        if (row_off_diagonal > row_diagonal)
        {
            analysis.is_diagonally_dominant = false;
        }
    }

    double total = total_diagonal_sum + total_off_diagonal_sum;
    analysis.diagonal_dominance_ratio = total > 0.0 ? total_diagonal_sum / total : 0.0;

    // Calculate matrix norms
    analysis.frobenius_norm = M.norm();
    analysis.one_norm = M.cwiseAbs().colwise().sum().maxCoeff();
    analysis.infinity_norm = M.cwiseAbs().rowwise().sum().maxCoeff();

    analysis.condition_number = calculateConditionNumber(A);
    analysis.condition_class = classifyCondition(analysis.condition_number);

    // Try the factorization itself to see whether pivoting would be needed
    analysis.failing_pivot = -1;
    analysis.reconstruction_error = numeric_limits<double>::quiet_NaN();
    try
    {
        LUFactors factors = luDecomposition(A);
        analysis.factorizable = true;
        analysis.reconstruction_error = reconstructionError(A, factors.L, factors.U);
    }
    catch (const SingularMatrixError &e)
    {
        analysis.factorizable = false;
        analysis.failing_pivot = e.row();
    }

    return analysis;
}

void writeAnalysis(ostream &out, const MatrixAnalysis &analysis, const string &matrix_name)
{
    out << "\n" << string(80, '=') << endl;
    out << "MATRIX ANALYSIS: " << matrix_name << endl;
    out << string(80, '=') << endl;

    out << "\nBASIC PROPERTIES:" << endl;
    out << "  Dimension: " << analysis.dimension << " x " << analysis.dimension << endl;
    out << "  Symmetric: " << (analysis.is_symmetric ? "Yes" : "No") << endl;
    out << "  Diagonally dominant: " << (analysis.is_diagonally_dominant ? "Yes" : "No") << endl;
    out << "  Diagonal dominance ratio: " << fixed << setprecision(6) << analysis.diagonal_dominance_ratio << endl;

    out << "\nDIAGONAL ANALYSIS:" << endl;
    out << "  Min diagonal element: " << scientific << setprecision(6) << analysis.min_diagonal << endl;
    out << "  Max diagonal element: " << scientific << setprecision(6) << analysis.max_diagonal << endl;
    out << "  Max off-diagonal element: " << scientific << setprecision(6) << analysis.max_off_diagonal << endl;

    out << "\nMATRIX NORMS:" << endl;
    out << "  Frobenius norm: " << scientific << setprecision(6) << analysis.frobenius_norm << endl;
    out << "  1-norm: " << scientific << setprecision(6) << analysis.one_norm << endl;
    out << "  Infinity norm: " << scientific << setprecision(6) << analysis.infinity_norm << endl;

    out << "\nCONDITIONING:" << endl;
    out << "  Condition number (2-norm): " << scientific << setprecision(6) << analysis.condition_number << endl;
    out << "  Classification: " << conditionClassName(analysis.condition_class) << endl;

    out << "\nLU WITHOUT PIVOTING:" << endl;
    if (analysis.factorizable)
    {
        out << "  Factorization: succeeds" << endl;
        out << "  max |LU - A|: " << scientific << setprecision(6) << analysis.reconstruction_error << endl;
    }
    else
    {
        out << "  Factorization: fails at pivot (" << analysis.failing_pivot << ", " << analysis.failing_pivot
            << ")" << endl;
        if (analysis.condition_class == ConditionClass::WellConditioned)
        {
            out << "  The matrix is not singular; a row exchange would be required." << endl;
        }
    }

    out << "\n" << string(80, '=') << endl;
}

int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 3)
    {
        cerr << "Usage: " << argv[0] << " <matrix_file> [output_file]" << endl;
        return 1;
    }

    string matrix_file = argv[1];
    string output_file = argc == 3 ? argv[2] : "";

    Matrix A;
    try
    {
        A = readMatrix(matrix_file);
    }
    catch (const runtime_error &e)
    {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    MatrixAnalysis analysis;
    auto start_time = chrono::high_resolution_clock::now();
    try
    {
        analysis = analyzeMatrix(A);
    }
    catch (const DimensionError &e)
    {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
    auto end_time = chrono::high_resolution_clock::now();
    auto analysis_time = chrono::duration_cast<chrono::microseconds>(end_time - start_time);

    writeAnalysis(cout, analysis, matrix_file);
    cout << "Analysis completed in " << analysis_time.count() << " us" << endl;

    if (!output_file.empty())
    {
        ofstream file(output_file);
        if (!file.is_open())
        {
            cerr << "Error: Could not open file " << output_file << " for writing" << endl;
            return 1;
        }
        writeAnalysis(file, analysis, matrix_file);
        cout << "Analysis results saved to: " << output_file << endl;
    }

    return 0;
}
