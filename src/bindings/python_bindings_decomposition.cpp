#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "../decomposition/errors.h"
#include "../decomposition/pca.h"

namespace py = pybind11;
using namespace pcalix;

// Python-facing wrapper: fit() returns self so calls can be chained
class FitPCA {
public:
    PCA model;

    FitPCA(int n_components, const std::string& solver)
        : model(n_components, parse_solver(solver)) {}

    FitPCA& fit(const Eigen::MatrixXd& X) {
        model.fit(X);
        return *this;
    }

    Eigen::MatrixXd transform(const Eigen::MatrixXd& X) const { return model.transform(X); }
    Eigen::MatrixXd fit_transform(const Eigen::MatrixXd& X) { return model.fit_transform(X); }
    Eigen::MatrixXd inverse_transform(const Eigen::MatrixXd& Z) const { return model.inverse_transform(Z); }
};

PYBIND11_MODULE(pcalix_decomposition, m) {
    m.doc() = "pcalix Principal Component Analysis";

    py::register_exception<DecompositionError>(m, "DecompositionError", PyExc_RuntimeError);
    py::register_exception<InvalidStateError>(m, "InvalidStateError", PyExc_RuntimeError);
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_ValueError);
    py::register_exception<DegenerateVarianceError>(m, "DegenerateVarianceError", PyExc_ZeroDivisionError);

    py::class_<FitPCA>(m, "PCA")
        .def(py::init<int, const std::string&>(),
             py::arg("n_components"), py::arg("solver") = "svd")
        .def("fit", &FitPCA::fit, py::return_value_policy::reference, py::arg("X"))
        .def("transform", &FitPCA::transform, py::arg("X"))
        .def("fit_transform", &FitPCA::fit_transform, py::arg("X"))
        .def("inverse_transform", &FitPCA::inverse_transform, py::arg("Z"))
        .def_property_readonly("explained_variance_ratio",
                               [](const FitPCA& self) { return self.model.explained_variance_ratio(); })
        .def_property_readonly("explained_variance_ratios",
                               [](const FitPCA& self) { return self.model.explained_variance_ratios(); })
        .def_property_readonly("explained_variance_",
                               [](const FitPCA& self) { return self.model.explained_variance(); })
        .def_property_readonly("components_",
                               [](const FitPCA& self) { return self.model.components(); })
        .def_property_readonly("mean_", [](const FitPCA& self) { return self.model.mean(); })
        .def_property_readonly("singular_values_",
                               [](const FitPCA& self) { return self.model.singular_values(); })
        .def_property_readonly("n_components", [](const FitPCA& self) { return self.model.n_components(); })
        .def_property_readonly("solver", [](const FitPCA& self) { return solver_name(self.model.solver()); })
        .def_property_readonly("is_fitted", [](const FitPCA& self) { return self.model.is_fitted(); })
        .def_property_readonly("warning", [](const FitPCA& self) { return self.model.warning(); });

    py::class_<PCAResult>(m, "PCAResult")
        .def_readonly("components", &PCAResult::components)
        .def_readonly("explained_variance", &PCAResult::explained_variance)
        .def_readonly("explained_variance_ratio", &PCAResult::explained_variance_ratio)
        .def_readonly("total_explained_variance_ratio", &PCAResult::total_explained_variance_ratio)
        .def_readonly("mean", &PCAResult::mean)
        .def_readonly("scores", &PCAResult::scores)
        .def_readonly("warning", &PCAResult::warning);

    m.def("run_pca",
          [](const Eigen::MatrixXd& X, int k, const std::string& solver) {
              return run_pca(X, k, parse_solver(solver));
          },
          py::arg("X"), py::arg("k"), py::arg("solver") = "svd");
}
