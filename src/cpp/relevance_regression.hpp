// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_RELEVANCE_REGRESSION_HPP
#define SPARSE_RVR_RELEVANCE_REGRESSION_HPP

#include <armadillo>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "diagnostics.hpp"
#include "errors.hpp"

namespace sparse_rvr {

// Outcome of the last call to Fit.
enum class FitStatus : int {
  kNotFitted = -1,
  kConverged = 0,
  kMaxIterations = 1,
  kSingular = 2,
};

// Configuration of the evidence-approximation loop.
struct FitOptions {
  // Maximum number of iterations.
  int n_iter = 3000;

  // Stop when the largest change in alpha drops below this value.
  double tol = 1e-3;

  // Initial precision of every weight prior.
  double alpha = 1e-6;

  // Basis functions with alpha at or above this value are pruned.
  double threshold_alpha = 1e9;

  // Initial (or fixed) noise precision.
  double beta = 1e-6;

  // If true, beta is not re-estimated during fitting.
  bool beta_fixed = false;

  // Treat the last column of the basis as the intercept.
  bool bias_used = true;

  // Emit diagnostic events every `verb_freq` iterations.
  bool verbose = true;
  int verb_freq = 10;
};

// Throws std::invalid_argument if any option is out of range.
void ValidateOptions(const FitOptions& options);

class RelevanceVectorRegression {
 public:
  // With `verbose` set and no sink given, events go to PrintDiagnostic.
  explicit RelevanceVectorRegression(const FitOptions& options = FitOptions(),
                                     DiagnosticSink sink = nullptr);

  virtual ~RelevanceVectorRegression() = default;

  // Fit the model. Each column of `basis` is one basis function evaluated at
  // the N samples; `labels` names the non-bias columns (may be empty, in
  // which case names are generated). On SingularSystemError the last valid
  // state is kept and the error is rethrown.
  void Fit(const arma::mat& basis, const arma::vec& targets,
           const std::vector<std::string>& labels = {});

  // Predictive mean for a basis holding exactly the relevant columns, in the
  // order of relevant_idx().
  arma::vec Predict(const arma::mat& basis) const;

  // As above, also filling the predictive variance of each sample.
  arma::vec Predict(const arma::mat& basis, arma::vec& variance) const;

  // Pick the relevant columns out of a basis shaped like the training basis.
  arma::mat SelectRelevant(const arma::mat& full_basis) const;

  void set_diagnostic_sink(DiagnosticSink sink) { sink_ = std::move(sink); }

  // Accessors for model parameters after fitting.
  const FitOptions& options() const { return options_; }
  bool is_fitted() const { return fitted_; }
  const arma::uvec& relevant_idx() const { return relevant_idx_; }
  const std::vector<std::string>& labels() const { return labels_; }
  const arma::vec& mean() const { return mean_; }
  const arma::mat& covariance() const { return covariance_; }
  const arma::vec& alpha() const { return alpha_; }
  const arma::vec& gamma() const { return gamma_; }
  double beta() const { return beta_; }
  bool bias_used() const { return bias_used_; }
  const std::optional<double>& bias() const { return bias_; }
  arma::uword n_basis() const { return n_basis_; }
  int n_iter() const { return n_iter_; }
  FitStatus status() const { return status_; }
  const arma::vec& log_marginal_likelihood_trace() const {
    return log_marginal_likelihood_trace_;
  }
  const arma::uvec& relevance_trace() const { return relevance_trace_; }

 private:
  // Check shapes of the training inputs.
  void ValidateInputs(const arma::mat& basis, const arma::vec& targets,
                      const std::vector<std::string>& labels) const;

  // Throws UnfittedModelError / ShapeMismatchError for bad predict calls.
  void CheckPredictable(const arma::mat& basis) const;

  FitOptions options_;
  DiagnosticSink sink_;

  bool fitted_ = false;

  // Number of columns of the training basis.
  arma::uword n_basis_ = 0;

  // Indices of retained basis functions (intercept included).
  arma::uvec relevant_idx_;

  // Labels of retained non-intercept basis functions.
  std::vector<std::string> labels_;

  // Posterior mean of the model weights.
  arma::vec mean_;

  // Posterior covariance of the model weights.
  arma::mat covariance_;

  // Precisions of the (Gaussian) weights priors.
  arma::vec alpha_;

  // Well-determinedness factors of the retained weights.
  arma::vec gamma_;

  // Noise precision.
  double beta_ = 0.0;

  // Whether the intercept survived the fit, and its weight.
  bool bias_used_ = false;
  std::optional<double> bias_;

  // Number of iterations completed.
  int n_iter_ = 0;

  FitStatus status_ = FitStatus::kNotFitted;

  // Log marginal likelihood and number of relevant basis functions per
  // iteration.
  arma::vec log_marginal_likelihood_trace_;
  arma::uvec relevance_trace_;
};

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_RELEVANCE_REGRESSION_HPP
