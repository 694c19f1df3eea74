#include "principal_solver.h"
#include "errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace pcalix {

std::string solver_name(PCASolver solver) {
    switch (solver) {
        case PCASolver::Covariance: return "covariance";
        case PCASolver::SVD: return "svd";
    }
    return "unknown";
}

PCASolver parse_solver(const std::string& name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "svd") return PCASolver::SVD;
    if (key == "covariance" || key == "cov" || key == "eig") return PCASolver::Covariance;
    throw std::invalid_argument("Unknown PCA solver: '" + name + "' (expected 'svd' or 'covariance')");
}

namespace detail {

Eigen::VectorXi descending_order(const Eigen::VectorXd& values) {
    std::vector<int> idx(static_cast<size_t>(values.size()));
    std::iota(idx.begin(), idx.end(), 0);
    // stable: tied values keep the decomposition's own order
    std::stable_sort(idx.begin(), idx.end(),
                     [&values](int a, int b) { return values(a) > values(b); });
    return Eigen::Map<Eigen::VectorXi>(idx.data(), static_cast<Eigen::Index>(idx.size()));
}

bool is_non_increasing(const Eigen::VectorXd& values) {
    for (Eigen::Index i = 1; i < values.size(); ++i) {
        if (values(i) > values(i - 1)) return false;
    }
    return true;
}

void normalize_signs(Eigen::MatrixXd& directions) {
    for (Eigen::Index i = 0; i < directions.rows(); ++i) {
        Eigen::Index pivot = 0;
        double best = -1.0;
        for (Eigen::Index j = 0; j < directions.cols(); ++j) {
            double a = std::abs(directions(i, j));
            if (a > best) {
                best = a;
                pivot = j;
            }
        }
        if (directions.cols() > 0 && directions(i, pivot) < 0.0) {
            directions.row(i) *= -1.0;
        }
    }
}

} // namespace detail

namespace {

void check_input(const Eigen::MatrixXd& centered, const char* who) {
    if (centered.cols() == 0) {
        throw std::invalid_argument(std::string(who) + ": data has no features");
    }
    if (centered.rows() < 2) {
        throw std::invalid_argument(std::string(who) + ": at least 2 observations are required");
    }
    if (!centered.allFinite()) {
        throw DecompositionError(std::string(who) + ": input contains NaN or Inf");
    }
}

} // namespace

// =============================================================================
// Covariance-Eigen
// =============================================================================

Eigen::MatrixXd CovarianceEigenSolver::covariance(const Eigen::MatrixXd& centered) {
    const double denom = static_cast<double>(centered.rows() - 1);
    Eigen::MatrixXd cov = (centered.transpose() * centered) / denom;
    // 数値誤差で非対称になるのを防ぐ
    return 0.5 * (cov + cov.transpose());
}

PrincipalBasis CovarianceEigenSolver::solve(const Eigen::MatrixXd& centered) const {
    check_input(centered, "covariance solver");
    const Eigen::Index n = centered.rows();
    const Eigen::Index d = centered.cols();

    Eigen::MatrixXd cov = covariance(centered);
    // finite data can still overflow in X^T X
    if (!cov.allFinite()) {
        throw DecompositionError("Covariance matrix contains NaN or Inf (input magnitude too large)");
    }

    // Real symmetric input: eigenpairs are real, no imaginary part to drop.
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(cov);
    if (es.info() != Eigen::Success) {
        throw DecompositionError("Eigen decomposition of the covariance matrix did not converge");
    }

    // SelfAdjointEigenSolver returns ascending eigenvalues, eigenvectors as columns
    const Eigen::VectorXd& evals = es.eigenvalues();
    const Eigen::MatrixXd& evecs = es.eigenvectors();
    if (!evals.allFinite() || !evecs.allFinite()) {
        throw DecompositionError("Eigen decomposition of the covariance matrix produced non-finite values");
    }
    Eigen::VectorXi order = detail::descending_order(evals);

    PrincipalBasis basis;
    basis.variances.resize(d);
    basis.directions.resize(d, d);
    for (Eigen::Index i = 0; i < d; ++i) {
        basis.variances(i) = evals(order(i));
        basis.directions.row(i) = evecs.col(order(i)).transpose();
    }

    // PSD in exact arithmetic; small negative values are round-off
    const double tol = kNegativeEigenTol * evals.cwiseAbs().maxCoeff();
    for (Eigen::Index i = 0; i < d; ++i) {
        if (basis.variances(i) < 0.0) {
            if (basis.variances(i) < -tol) {
                throw DecompositionError("Covariance matrix has a significantly negative eigenvalue: " +
                                         std::to_string(basis.variances(i)));
            }
            basis.variances(i) = 0.0;
            basis.clamped_negative = true;
        }
    }

    if (!std::isfinite(basis.variances.sum())) {
        throw DecompositionError("Total variance overflows (input magnitude too large)");
    }

    detail::normalize_signs(basis.directions);
    basis.singular_values = (basis.variances * static_cast<double>(n - 1)).cwiseSqrt();
    return basis;
}

// =============================================================================
// SVD
// =============================================================================

PrincipalBasis SVDSolver::solve(const Eigen::MatrixXd& centered) const {
    check_input(centered, "svd solver");
    const Eigen::Index n = centered.rows();

    // X = U S V^T, only V is needed
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(centered, Eigen::ComputeThinV);
    if (svd.info() != Eigen::Success) {
        throw DecompositionError("Singular value decomposition did not converge");
    }

    Eigen::VectorXd sigma = svd.singularValues();
    Eigen::MatrixXd directions = svd.matrixV().transpose();  // (min(n,d), d)

    // Eigen sorts singular values in decreasing order; check rather than rely on it.
    if (!detail::is_non_increasing(sigma)) {
        Eigen::VectorXi order = detail::descending_order(sigma);
        Eigen::VectorXd sorted_sigma(sigma.size());
        Eigen::MatrixXd sorted_dirs(directions.rows(), directions.cols());
        for (Eigen::Index i = 0; i < sigma.size(); ++i) {
            sorted_sigma(i) = sigma(order(i));
            sorted_dirs.row(i) = directions.row(order(i));
        }
        sigma = sorted_sigma;
        directions = sorted_dirs;
    }

    PrincipalBasis basis;
    basis.singular_values = sigma;
    basis.variances = sigma.array().square() / static_cast<double>(n - 1);
    // sigma^2 overflows for very large inputs
    if (!std::isfinite(basis.variances.sum()) || !directions.allFinite()) {
        throw DecompositionError("SVD variances are not finite (input magnitude too large)");
    }
    basis.directions = directions;
    detail::normalize_signs(basis.directions);
    return basis;
}

std::unique_ptr<PrincipalSolver> make_principal_solver(PCASolver solver) {
    switch (solver) {
        case PCASolver::Covariance: return std::make_unique<CovarianceEigenSolver>();
        case PCASolver::SVD: return std::make_unique<SVDSolver>();
    }
    throw std::invalid_argument("Unknown PCASolver value");
}

} // namespace pcalix
