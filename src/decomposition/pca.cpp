#include "pca.h"
#include "errors.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pcalix {

PCA::PCA(int n_components, PCASolver solver)
    : n_components_(n_components), solver_(solver) {
    if (n_components <= 0) {
        throw std::invalid_argument("n_components must be positive");
    }
}

void PCA::require_fitted(const char* op) const {
    if (!fitted_) {
        throw InvalidStateError(std::string(op) + " called before fit");
    }
}

int PCA::effective_components() const {
    return std::min(n_components_, static_cast<int>(variances_.size()));
}

void PCA::fit(const Eigen::MatrixXd& X) {
    if (X.rows() < 2) {
        throw std::invalid_argument("PCA requires at least 2 observations, got " +
                                    std::to_string(X.rows()));
    }
    if (X.cols() == 0) {
        throw std::invalid_argument("PCA requires at least 1 feature");
    }

    // per-feature mean; X itself is never modified
    Eigen::VectorXd mean = X.colwise().mean().transpose();
    Eigen::MatrixXd centered = X.rowwise() - mean.transpose();

    auto strategy = make_principal_solver(solver_);
    PrincipalBasis basis = strategy->solve(centered);

    std::string warning;
    if (n_components_ > basis.variances.size()) {
        warning = "n_components=" + std::to_string(n_components_) + " exceeds the " +
                  std::to_string(basis.variances.size()) +
                  " available components; explained_variance_ratio is clamped";
    }
    if (basis.clamped_negative) {
        if (!warning.empty()) warning += "; ";
        warning += "negative eigenvalue residues clamped to 0";
    }

    // commit only after the solver succeeded
    n_samples_ = static_cast<int>(X.rows());
    mean_ = std::move(mean);
    components_ = std::move(basis.directions);
    variances_ = std::move(basis.variances);
    singular_values_ = std::move(basis.singular_values);
    warning_ = std::move(warning);
    fitted_ = true;
}

Eigen::MatrixXd PCA::transform(const Eigen::MatrixXd& X) const {
    require_fitted("transform");
    if (X.cols() != mean_.size()) {
        throw ShapeMismatchError("transform: X has " + std::to_string(X.cols()) +
                                 " features, model was fitted with " + std::to_string(mean_.size()));
    }
    return (X.rowwise() - mean_.transpose()) * components_.transpose();
}

Eigen::MatrixXd PCA::fit_transform(const Eigen::MatrixXd& X) {
    fit(X);
    return transform(X);
}

Eigen::MatrixXd PCA::inverse_transform(const Eigen::MatrixXd& Z) const {
    require_fitted("inverse_transform");
    if (Z.cols() > components_.rows()) {
        throw ShapeMismatchError("inverse_transform: Z has " + std::to_string(Z.cols()) +
                                 " columns, only " + std::to_string(components_.rows()) +
                                 " components were fitted");
    }
    Eigen::MatrixXd X = Z * components_.topRows(Z.cols());
    X.rowwise() += mean_.transpose();
    return X;
}

double PCA::explained_variance_ratio() const {
    require_fitted("explained_variance_ratio");
    const double total = variances_.sum();
    if (!(total > 0.0)) {
        throw DegenerateVarianceError("Total variance is zero; explained variance ratio is undefined");
    }
    return variances_.head(effective_components()).sum() / total;
}

Eigen::VectorXd PCA::explained_variance_ratios() const {
    require_fitted("explained_variance_ratios");
    const double total = variances_.sum();
    if (!(total > 0.0)) {
        throw DegenerateVarianceError("Total variance is zero; explained variance ratio is undefined");
    }
    return variances_ / total;
}

int PCA::n_features() const {
    require_fitted("n_features");
    return static_cast<int>(mean_.size());
}

int PCA::n_samples() const {
    require_fitted("n_samples");
    return n_samples_;
}

const Eigen::MatrixXd& PCA::components() const {
    require_fitted("components");
    return components_;
}

const Eigen::VectorXd& PCA::explained_variance() const {
    require_fitted("explained_variance");
    return variances_;
}

const Eigen::VectorXd& PCA::singular_values() const {
    require_fitted("singular_values");
    return singular_values_;
}

const Eigen::VectorXd& PCA::mean() const {
    require_fitted("mean");
    return mean_;
}

PCAResult run_pca(const Eigen::MatrixXd& X, int k, PCASolver solver) {
    PCA pca(k, solver);
    Eigen::MatrixXd scores = pca.fit_transform(X);
    const int kk = std::min(k, static_cast<int>(pca.explained_variance().size()));

    PCAResult res;
    res.components = pca.components().topRows(kk);
    res.explained_variance = pca.explained_variance().head(kk);
    res.mean = pca.mean();
    res.scores = scores.leftCols(kk);
    res.warning = pca.warning();
    if (pca.explained_variance().sum() > 0.0) {
        res.explained_variance_ratio = pca.explained_variance_ratios().head(kk);
        res.total_explained_variance_ratio = pca.explained_variance_ratio();
    } else {
        // constant data: scores are still valid, ratios are left empty
        res.explained_variance_ratio = Eigen::VectorXd::Zero(0);
        res.total_explained_variance_ratio = 0.0;
        if (!res.warning.empty()) res.warning += "; ";
        res.warning += "total variance is zero; explained variance ratios not computed";
    }
    return res;
}

} // namespace pcalix
