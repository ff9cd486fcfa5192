#pragma once

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "linear_sys.h"

/**
 * Reads a dense matrix stored in COO format.
 *
 * The first line holds "rows cols nnz", followed by nnz triplets
 * "row col value" with 0-based indices. Entries that are not listed are zero.
 *
 * @param filename Path to the input file
 * @return The matrix as rows x cols nested vectors
 */
inline Matrix readMatrix(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file " + filename);
    }

    // First line contains dimensions and nnz (non-zero entries)
    int rows, cols, nnz;
    if (!(file >> rows >> cols >> nnz) || rows <= 0 || cols <= 0 || nnz < 0) {
        throw std::runtime_error("Invalid COO header in " + filename);
    }

    Matrix matrix(rows, Vector(cols, 0.0));

    int row, col;
    double value;
    for (int i = 0; i < nnz; i++) {
        if (!(file >> row >> col >> value)) {
            throw std::runtime_error("Error reading COO triplet at line " + std::to_string(i + 2) + " of "
                                     + filename);
        }
        if (row < 0 || row >= rows || col < 0 || col >= cols) {
            throw std::runtime_error("COO triplet at line " + std::to_string(i + 2) + " of " + filename
                                     + " is out of range");
        }
        matrix[row][col] = value;
    }

    return matrix;
}

/**
 * Reads a vector from a file.
 *
 * @param filename Path to the input file containing whitespace separated values
 * @return Vector of double values
 */
inline Vector readVector(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file " + filename);
    }

    Vector values;
    double value;

    // Read all values from the file
    while (file >> value) {
        values.push_back(value);
    }
    if (!file.eof()) {
        throw std::runtime_error("Non-numeric data in " + filename);
    }

    return values;
}

/**
 * Writes a vector to a file, one value per line in scientific notation.
 *
 * @param vector Vector of double values to write
 * @param filename Path to the output file
 */
inline void writeVectorToFile(const Vector& vector, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file " + filename + " for writing");
    }

    // Set precision for output
    file.precision(16);
    file << std::scientific;

    for (size_t i = 0; i < vector.size(); i++) {
        file << vector[i] << std::endl;
    }
}

// Formats a matrix as aligned rows for console output
inline std::string formatMatrix(const Matrix& M, int precision = 6) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision);
    for (const auto& row : M) {
        out << "  [";
        for (size_t j = 0; j < row.size(); j++) {
            out << std::setw(precision + 6) << row[j];
            if (j + 1 < row.size()) {
                out << ", ";
            }
        }
        out << " ]\n";
    }
    return out.str();
}

inline std::string formatVector(const Vector& v, const std::string& name = "x", int precision = 6) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision);
    for (size_t i = 0; i < v.size(); i++) {
        out << "  " << name << "[" << i << "] = " << std::setw(precision + 6) << v[i] << "\n";
    }
    return out.str();
}
