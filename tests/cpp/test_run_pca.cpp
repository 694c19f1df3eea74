#include "decomposition/pca.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace pcalix;

namespace {

Eigen::MatrixXd make_data(int n, int d, unsigned seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<> dist(0.0, 1.0);
  Eigen::MatrixXd m(n, d);
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < d; ++j)
      m(i, j) = dist(gen) * (d - j) + j;
  return m;
}

void test_sliced_result(PCASolver solver) {
  std::cout << "run_pca (" << solver_name(solver) << ")..." << std::endl;
  Eigen::MatrixXd X = make_data(120, 6, 17);
  PCAResult res = run_pca(X, 2, solver);

  assert(res.components.rows() == 2 && res.components.cols() == 6);
  assert(res.explained_variance.size() == 2);
  assert(res.explained_variance_ratio.size() == 2);
  assert(res.scores.rows() == 120 && res.scores.cols() == 2);
  assert(res.mean.size() == 6);
  assert(res.warning.empty());
  assert(std::abs(res.explained_variance_ratio.sum() -
                  res.total_explained_variance_ratio) < 1e-12);

  PCA pca(2, solver);
  pca.fit(X);
  assert((res.scores - pca.transform(X).leftCols(2)).cwiseAbs().maxCoeff() < 1e-12);
  assert(std::abs(res.total_explained_variance_ratio - pca.explained_variance_ratio()) < 1e-12);

  std::cout << "  ratio(k=2) = " << res.total_explained_variance_ratio << std::endl;
}

void test_solvers_give_same_result() {
  std::cout << "run_pca covariance vs svd..." << std::endl;
  Eigen::MatrixXd X = make_data(200, 4, 23);
  PCAResult a = run_pca(X, 3, PCASolver::Covariance);
  PCAResult b = run_pca(X, 3, PCASolver::SVD);
  for (int i = 0; i < 3; ++i) {
    assert(std::abs(a.explained_variance(i) - b.explained_variance(i)) <
           1e-6 * b.explained_variance(i));
    // same sign convention on both paths
    assert((a.components.row(i) - b.components.row(i)).cwiseAbs().maxCoeff() < 1e-6);
  }
  assert((a.scores - b.scores).cwiseAbs().maxCoeff() < 1e-6 * b.scores.cwiseAbs().maxCoeff());
}

void test_k_clamped() {
  std::cout << "run_pca with k > available..." << std::endl;
  Eigen::MatrixXd X = make_data(5, 3, 29);
  PCAResult res = run_pca(X, 8);
  assert(res.components.rows() == 3);
  assert(res.scores.cols() == 3);
  assert(res.total_explained_variance_ratio == 1.0);
  assert(!res.warning.empty());
}

void test_constant_data() {
  std::cout << "run_pca on constant data..." << std::endl;
  Eigen::MatrixXd X = Eigen::MatrixXd::Constant(5, 3, 2.5);
  for (PCASolver solver : {PCASolver::Covariance, PCASolver::SVD}) {
    PCAResult res = run_pca(X, 2, solver);
    assert(res.scores.rows() == 5 && res.scores.cols() == 2);
    assert(res.scores.cwiseAbs().maxCoeff() == 0.0);
    assert(res.components.rows() == 2);
    assert(res.explained_variance_ratio.size() == 0);
    assert(res.total_explained_variance_ratio == 0.0);
    assert(res.warning.find("total variance is zero") != std::string::npos);
  }
}

} // namespace

int main() {
  std::cout << "--- run_pca Test ---" << std::endl;
  test_sliced_result(PCASolver::Covariance);
  test_sliced_result(PCASolver::SVD);
  test_solvers_give_same_result();
  test_k_clamped();
  test_constant_data();
  std::cout << "run_pca Test Passed!" << std::endl;
  return 0;
}
