/**
 * @file bench_pca_solvers.cpp
 * @brief Benchmark: covariance-eigen vs SVD PCA solver
 *
 * Reports for each data shape:
 * 1. Time per fit for both solvers
 * 2. Max relative disagreement of the fitted variances
 * and, on an ill-conditioned matrix, how much of the small-variance
 * spectrum each solver recovers.
 *
 * Usage: bench_pca_solvers [repeats]
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>

#include <Eigen/Dense>

#include "decomposition/pca.h"

using namespace std::chrono;
using pcalix::PCA;
using pcalix::PCASolver;

// Helper: Generate random Eigen matrix
Eigen::MatrixXd random_eigen_matrix(int rows, int cols, std::mt19937 &gen) {
  std::normal_distribution<> dist(0.0, 1.0);
  Eigen::MatrixXd m(rows, cols);
  for (int i = 0; i < rows; ++i)
    for (int j = 0; j < cols; ++j)
      m(i, j) = dist(gen);
  return m;
}

double time_fit(const Eigen::MatrixXd &X, PCASolver solver, int repeats) {
  PCA pca(1, solver);
  pca.fit(X); // warm up

  auto start = high_resolution_clock::now();
  for (int r = 0; r < repeats; ++r) {
    pca.fit(X);
  }
  auto end = high_resolution_clock::now();
  return duration_cast<microseconds>(end - start).count() / 1000.0 / repeats;
}

// ===========================================================================
// Benchmark 1: speed and agreement on well-conditioned data
// ===========================================================================

void bench_shape(int n, int d, int repeats) {
  std::mt19937 gen(42);
  Eigen::MatrixXd X = random_eigen_matrix(n, d, gen);

  std::cout << "\n=== n=" << n << ", d=" << d << " (repeats=" << repeats
            << ") ===" << std::endl;

  double ms_cov = time_fit(X, PCASolver::Covariance, repeats);
  double ms_svd = time_fit(X, PCASolver::SVD, repeats);

  PCA cov(1, PCASolver::Covariance), svd(1, PCASolver::SVD);
  cov.fit(X);
  svd.fit(X);
  const Eigen::VectorXd &vc = cov.explained_variance();
  const Eigen::VectorXd &vs = svd.explained_variance();
  const Eigen::Index m = vs.size();
  // relative to the leading variance; trailing ones may be ~0 when n < d
  double max_rel = (vc.head(m) - vs).cwiseAbs().maxCoeff() / vs(0);

  std::cout << std::fixed << std::setprecision(3);
  std::cout << "Covariance: " << ms_cov << " ms/fit" << std::endl;
  std::cout << "SVD:        " << ms_svd << " ms/fit" << std::endl;
  std::cout << std::scientific << std::setprecision(2)
            << "Max relative variance difference: " << max_rel << std::endl;
}

// ===========================================================================
// Benchmark 2: ill-conditioned data
// ===========================================================================

void bench_ill_conditioned() {
  std::mt19937 gen(7);
  const int n = 500, d = 6;

  // column scales spanning 1e0 .. 1e-10
  Eigen::VectorXd scale(d);
  for (int j = 0; j < d; ++j)
    scale(j) = std::pow(10.0, -2.0 * j);

  Eigen::MatrixXd Q = random_eigen_matrix(d, d, gen).householderQr().householderQ();
  Eigen::MatrixXd X = random_eigen_matrix(n, d, gen) * scale.asDiagonal() * Q;

  PCA cov(d, PCASolver::Covariance), svd(d, PCASolver::SVD);
  cov.fit(X);
  svd.fit(X);

  // reference: variances of the generating data along Q
  Eigen::MatrixXd Xc = X.rowwise() - X.colwise().mean();
  Eigen::MatrixXd Z = Xc * Q.transpose();
  Eigen::VectorXd ref = Z.colwise().squaredNorm().transpose() / (n - 1);

  std::cout << "\n=== Ill-conditioned (scales 1 .. 1e-10) ===" << std::endl;
  std::cout << std::scientific << std::setprecision(3);
  std::cout << "  i   reference    covariance   svd" << std::endl;
  for (int i = 0; i < d; ++i) {
    std::cout << "  " << i << "   " << ref(i) << "   "
              << cov.explained_variance()(i) << "   "
              << svd.explained_variance()(i) << std::endl;
  }
  if (!cov.warning().empty()) {
    std::cout << "  covariance warning: " << cov.warning() << std::endl;
  }
}

int main(int argc, char **argv) {
  int repeats = 20;
  if (argc > 1) {
    repeats = std::atoi(argv[1]);
    if (repeats <= 0) {
      std::cerr << "repeats must be positive" << std::endl;
      return 1;
    }
  }

  std::cout << "PCA solver benchmark (Eigen " << EIGEN_WORLD_VERSION << "."
            << EIGEN_MAJOR_VERSION << "." << EIGEN_MINOR_VERSION << ")"
            << std::endl;

  try {
    bench_shape(1000, 10, repeats);
    bench_shape(1000, 100, repeats);
    bench_shape(200, 400, std::max(1, repeats / 4));
    bench_ill_conditioned();
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
