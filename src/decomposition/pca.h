#ifndef PCALIX_PCA_H
#define PCALIX_PCA_H

#include <Eigen/Dense>
#include <string>
#include "principal_solver.h"

namespace pcalix {

/**
 * @brief Principal Component Analysis
 *
 * fit() centers X by its per-feature mean, hands the centered copy to the
 * selected solver and stores (variances, directions, mean) together.
 * transform() always re-centers with the mean from fit, never with the
 * mean of the data being projected.
 *
 * Projections are not truncated: transform() returns one column per fitted
 * direction in descending-variance order, and keeping the first
 * n_components columns is the caller's slice (see run_pca).
 *
 * A fitted model is safe to share between threads for transform(); fit()
 * must not run concurrently with anything else on the same object.
 *
 * Usage:
 *   PCA pca(2);                 // SVD solver
 *   pca.fit(X);
 *   Eigen::MatrixXd Z = pca.transform(X).leftCols(2);
 *   double r = pca.explained_variance_ratio();
 */
class PCA {
public:
    explicit PCA(int n_components, PCASolver solver = PCASolver::SVD);

    // Re-fitting overwrites the previous state; on failure the previous
    // state is kept.
    void fit(const Eigen::MatrixXd& X);

    // (n, m) scores, m = number of fitted directions
    Eigen::MatrixXd transform(const Eigen::MatrixXd& X) const;

    Eigen::MatrixXd fit_transform(const Eigen::MatrixXd& X);

    // Z holds the leading Z.cols() component coordinates.
    Eigen::MatrixXd inverse_transform(const Eigen::MatrixXd& Z) const;

    /**
     * @brief Fraction of total variance captured by the top n_components
     *
     * n_components larger than the number of fitted directions is clamped
     * (the ratio is then 1). Throws DegenerateVarianceError when the total
     * variance is zero.
     */
    double explained_variance_ratio() const;

    // Per-component ratios, descending, summing to 1
    Eigen::VectorXd explained_variance_ratios() const;

    // --- accessors ---
    bool is_fitted() const { return fitted_; }
    int n_components() const { return n_components_; }
    PCASolver solver() const { return solver_; }
    int n_features() const;
    int n_samples() const;

    const Eigen::MatrixXd& components() const;
    const Eigen::VectorXd& explained_variance() const;
    const Eigen::VectorXd& singular_values() const;
    const Eigen::VectorXd& mean() const;

    // Soft diagnostics from the last fit (empty if none)
    const std::string& warning() const { return warning_; }

private:
    int n_components_;
    PCASolver solver_;

    bool fitted_ = false;
    int n_samples_ = 0;
    Eigen::VectorXd mean_;             // (d) fitMean
    Eigen::MatrixXd components_;       // (m, d) rows = directions
    Eigen::VectorXd variances_;        // (m) descending
    Eigen::VectorXd singular_values_;  // (m)
    std::string warning_;

    void require_fitted(const char* op) const;
    int effective_components() const;
};

/**
 * @brief Result of the one-shot run_pca()
 *
 * Everything is already sliced to k' = min(k, available components).
 * When the total variance is zero the ratio fields are left empty / 0
 * and `warning` says so; scores and components are still filled.
 */
struct PCAResult {
    Eigen::MatrixXd components;                 // (k', d)
    Eigen::VectorXd explained_variance;         // (k')
    Eigen::VectorXd explained_variance_ratio;   // (k')
    double total_explained_variance_ratio = 0.0;
    Eigen::VectorXd mean;                       // (d)
    Eigen::MatrixXd scores;                     // (n, k')
    std::string warning;
};

PCAResult run_pca(const Eigen::MatrixXd& X, int k, PCASolver solver = PCASolver::SVD);

} // namespace pcalix

#endif // PCALIX_PCA_H
