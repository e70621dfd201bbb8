// pybind11 bindings for sparse-rvr
#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <carma>

#include "relevance_regression.hpp"
#include "report.hpp"

namespace py = pybind11;

namespace sparse_rvr {

PYBIND11_MODULE(_sparse_rvr_bindings, m) {
  m.doc() = "sparse-rvr C++ core bindings";

  py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError",
                                             PyExc_ValueError);
  py::register_exception<SingularSystemError>(m, "SingularSystemError",
                                              PyExc_ArithmeticError);
  py::register_exception<UnfittedModelError>(m, "UnfittedModelError",
                                             PyExc_RuntimeError);

  py::enum_<FitStatus>(m, "FitStatus")
      .value("NotFitted", FitStatus::kNotFitted)
      .value("Converged", FitStatus::kConverged)
      .value("MaxIterations", FitStatus::kMaxIterations)
      .value("Singular", FitStatus::kSingular)
      .export_values();

  py::class_<RelevanceVectorRegression>(m, "RVR")
      .def(py::init([](int n_iter, double tol, double alpha,
                       double threshold_alpha, double beta, bool beta_fixed,
                       bool bias_used, bool verbose, int verb_freq) {
             FitOptions options;
             options.n_iter = n_iter;
             options.tol = tol;
             options.alpha = alpha;
             options.threshold_alpha = threshold_alpha;
             options.beta = beta;
             options.beta_fixed = beta_fixed;
             options.bias_used = bias_used;
             options.verbose = verbose;
             options.verb_freq = verb_freq;
             return new RelevanceVectorRegression(options);
           }),
           py::arg("n_iter") = 3000, py::arg("tol") = 1e-3,
           py::arg("alpha") = 1e-6, py::arg("threshold_alpha") = 1e9,
           py::arg("beta") = 1e-6, py::arg("beta_fixed") = false,
           py::arg("bias_used") = true, py::arg("verbose") = true,
           py::arg("verb_freq") = 10)
      .def("fit",
           [](RelevanceVectorRegression &self, const py::array_t<double> &X,
              const py::array_t<double> &y,
              const std::vector<std::string> &labels) {
             // convert incoming numpy arrays to arma types via carma
             arma::mat BASIS = carma::arr_to_mat(X);
             arma::vec Targets = carma::arr_to_col(y);
             self.Fit(BASIS, Targets, labels);
             py::dict result;
             result["mean"] = carma::col_to_arr(self.mean());
             result["covariance"] = carma::mat_to_arr(self.covariance());
             result["relevant_idx"] = carma::col_to_arr(self.relevant_idx());
             result["labels"] = self.labels();
             result["alpha"] = carma::col_to_arr(self.alpha());
             result["gamma"] = carma::col_to_arr(self.gamma());
             result["beta"] = self.beta();
             result["bias"] = self.bias();
             result["n_iter"] = self.n_iter();
             result["status"] = self.status();
             result["log_marginal_likelihood_trace"] =
                 carma::col_to_arr(self.log_marginal_likelihood_trace());
             return result;
           },
           py::arg("X"), py::arg("y"),
           py::arg("labels") = std::vector<std::string>{})
      .def("predict",
           [](const RelevanceVectorRegression &self,
              const py::array_t<double> &X, bool return_variance) -> py::object {
             arma::mat BASIS = carma::arr_to_mat(X);
             if (!return_variance) {
               return carma::col_to_arr(self.Predict(BASIS));
             }
             arma::vec variance;
             arma::vec mean = self.Predict(BASIS, variance);
             return py::make_tuple(carma::col_to_arr(mean),
                                   carma::col_to_arr(variance));
           },
           py::arg("X"), py::arg("return_variance") = false)
      .def("select_relevant",
           [](const RelevanceVectorRegression &self,
              const py::array_t<double> &X) {
             return carma::mat_to_arr(
                 self.SelectRelevant(carma::arr_to_mat(X)));
           })
      .def("set_diagnostic_sink",
           [](RelevanceVectorRegression &self, py::function callback) {
             self.set_diagnostic_sink([callback](const FitDiagnostic &d) {
               py::dict event;
               event["event"] = static_cast<int>(d.event);
               event["iteration"] = d.iteration;
               event["alpha"] = carma::col_to_arr(d.alpha);
               event["beta"] = d.beta;
               event["gamma"] = carma::col_to_arr(d.gamma);
               event["m"] = carma::col_to_arr(d.mean);
               event["n_relevant"] = d.n_relevant;
               event["delta"] = d.delta;
               event["pruned_labels"] = d.pruned_labels;
               callback(event);
             });
           })
      .def("report", [](const RelevanceVectorRegression &self) {
        return FormatSparseModel(self);
      });
}

}  // namespace sparse_rvr
