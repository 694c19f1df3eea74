/**
 * @file principal_solver.h
 * @brief Solver strategies that turn a centered data matrix into ranked
 *        principal directions.
 *
 * Provides:
 *   - PCASolver: closed set of strategies (Covariance, SVD)
 *   - PrincipalSolver: abstract base, one subclass per strategy
 *   - make_principal_solver(): factory over PCASolver
 *
 * Accuracy:
 * ---------
 * The covariance path forms X^T X / (n-1) explicitly, which squares the
 * condition number of X. Variances far below eps * max_variance are lost
 * there. The SVD path works on X directly and keeps them, so it is the
 * one to use for ill-conditioned or rank-deficient data. The choice is
 * left to the caller.
 */
#ifndef PCALIX_PRINCIPAL_SOLVER_H
#define PCALIX_PRINCIPAL_SOLVER_H

#include <Eigen/Dense>
#include <memory>
#include <string>

namespace pcalix {

enum class PCASolver {
    Covariance,  // eigen-decompose the sample covariance matrix
    SVD          // singular value decomposition of the centered data
};

std::string solver_name(PCASolver solver);

// "covariance" / "cov" / "eig" -> Covariance, "svd" -> SVD
PCASolver parse_solver(const std::string& name);

/**
 * @brief Output of a solver: directions ranked by the variance they explain
 *
 * Rows of `directions` are unit-norm principal directions in feature space,
 * in the same (descending) order as `variances`.
 */
struct PrincipalBasis {
    Eigen::VectorXd variances;        // (m)
    Eigen::MatrixXd directions;       // (m, d)
    Eigen::VectorXd singular_values;  // (m), sqrt((n-1) * variance) on the covariance path
    bool clamped_negative = false;    // negative eigenvalue residues were set to 0
};

/**
 * @brief Abstract base class for PCA solver strategies
 *
 * Input must already be centered (zero column means). Solvers never
 * re-center; they throw DecompositionError on non-finite input or when
 * the underlying decomposition fails.
 */
class PrincipalSolver {
public:
    virtual ~PrincipalSolver() = default;

    virtual PrincipalBasis solve(const Eigen::MatrixXd& centered) const = 0;

    virtual PCASolver kind() const = 0;

    std::string name() const { return solver_name(kind()); }
};

class CovarianceEigenSolver : public PrincipalSolver {
public:
    // Relative tolerance for treating a negative eigenvalue as round-off.
    static constexpr double kNegativeEigenTol = 1e-10;

    PrincipalBasis solve(const Eigen::MatrixXd& centered) const override;
    PCASolver kind() const override { return PCASolver::Covariance; }

    // Unbiased sample covariance (divisor n-1) of already-centered data
    static Eigen::MatrixXd covariance(const Eigen::MatrixXd& centered);
};

class SVDSolver : public PrincipalSolver {
public:
    PrincipalBasis solve(const Eigen::MatrixXd& centered) const override;
    PCASolver kind() const override { return PCASolver::SVD; }
};

std::unique_ptr<PrincipalSolver> make_principal_solver(PCASolver solver);

namespace detail {

// Stable permutation of indices sorting `values` in descending order.
Eigen::VectorXi descending_order(const Eigen::VectorXd& values);

bool is_non_increasing(const Eigen::VectorXd& values);

// Flip each row so that its largest-magnitude entry is positive.
void normalize_signs(Eigen::MatrixXd& directions);

} // namespace detail

} // namespace pcalix

#endif // PCALIX_PRINCIPAL_SOLVER_H
