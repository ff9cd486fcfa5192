#include <iostream>
#include <vector>
#include <chrono>
#include <random>
#include <string>
#include <cmath>
#include <Eigen/Dense>
#include "linear_sys.h"
#include "analysis.h"
#include "log.h"
#include <omp.h>

// Random symmetric positive definite matrix T * T^T + n * I. LU without
// pivoting never meets a zero pivot on such a matrix.
Matrix generateSPDMatrix(int n) {
    std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(0.1, 1.0);

    Eigen::MatrixXd T(n, n);
    for (Eigen::Index i = 0; i < T.size(); i++) {
        T(i) = dis(gen);
    }
    Eigen::MatrixXd S = T * T.transpose();
    S.diagonal().array() += n;

    Matrix A(n, Vector(n));
    for (int i = 0; i < n; i++) {
        Eigen::VectorXd::Map(A[i].data(), n) = S.row(i).transpose();
    }
    return A;
}

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <matrix_size> <num_threads>" << std::endl;
        return 1;
    }

    int n, num_threads;
    try {
        n = std::stoi(argv[1]);
        num_threads = std::stoi(argv[2]);
    } catch (const std::logic_error&) {
        std::cerr << "Error: matrix_size and num_threads must be integers" << std::endl;
        return 1;
    }
    if (n <= 0 || num_threads <= 0) {
        std::cerr << "Error: matrix_size and num_threads must be positive" << std::endl;
        return 1;
    }

    omp_set_num_threads(num_threads);
    LUSOLVE_LOG << "Solving a random " << n << " x " << n << " SPD system with " << num_threads
                << " threads\n";

    Matrix A = generateSPDMatrix(n);

    // b = A * 1 so the exact solution is known
    Vector knownSolution(n, 1.0);
    Vector B = matrixVectorProduct(A, knownSolution);

    auto start = std::chrono::high_resolution_clock::now();

    SystemSolution solution;
    try {
        solution = solveSystem(A, B);
    } catch (const SingularMatrixError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end - start;

    const Vector& X = solution.x;
    SolutionComparison cmp = compareSolutions(X, knownSolution);

    double error = 0.0;
    for (int i = 0; i < n; i++) {
        error += std::abs(cmp.difference[i]);
    }

    // Output first and last elements for verification, plus error
    std::cout << X[0] << std::endl;
    std::cout << X[n - 1] << std::endl;
    std::cout << "Error: " << error / n << std::endl;
    std::cout << "Relative Error: " << cmp.relative_error << std::endl;
    std::cout << duration.count() << std::endl;

    return 0;
}
