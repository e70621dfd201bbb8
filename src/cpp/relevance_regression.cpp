// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "relevance_regression.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "convergence.hpp"
#include "fit_state.hpp"
#include "posterior.hpp"

namespace sparse_rvr {

namespace {

FitDiagnostic MakeDiagnostic(FitEvent event, int iter, const FitState& state) {
  FitDiagnostic diagnostic;
  diagnostic.event = event;
  diagnostic.iteration = iter;
  diagnostic.alpha = state.alpha;
  diagnostic.beta = state.beta;
  diagnostic.gamma = state.Gamma;
  diagnostic.mean = state.weights;
  diagnostic.n_relevant = state.alpha.n_elem;
  return diagnostic;
}

std::string ShapeString(arma::uword rows, arma::uword cols) {
  return std::to_string(rows) + "x" + std::to_string(cols);
}

}  // namespace

void ValidateOptions(const FitOptions& options) {
  if (options.n_iter < 1) {
    throw std::invalid_argument("Error: n_iter must be at least 1");
  }
  if (!(options.tol > 0.0)) {
    throw std::invalid_argument("Error: tol must be positive");
  }
  if (!(options.alpha > 0.0) || !std::isfinite(options.alpha)) {
    throw std::invalid_argument("Error: alpha must be positive and finite");
  }
  if (!(options.threshold_alpha > 0.0) ||
      !std::isfinite(options.threshold_alpha)) {
    throw std::invalid_argument(
        "Error: threshold_alpha must be positive and finite");
  }
  if (!(options.beta > 0.0) || !std::isfinite(options.beta)) {
    throw std::invalid_argument("Error: beta must be positive and finite");
  }
  if (options.verb_freq < 1) {
    throw std::invalid_argument("Error: verb_freq must be at least 1");
  }
}

RelevanceVectorRegression::RelevanceVectorRegression(const FitOptions& options,
                                                     DiagnosticSink sink)
    : options_(options), sink_(std::move(sink)) {
  ValidateOptions(options_);
}

void RelevanceVectorRegression::ValidateInputs(
    const arma::mat& basis, const arma::vec& targets,
    const std::vector<std::string>& labels) const {
  if (basis.n_rows == 0 || basis.n_cols == 0) {
    throw ShapeMismatchError("Error: basis must have at least one row and "
                             "one column, got " +
                             ShapeString(basis.n_rows, basis.n_cols));
  }
  if (basis.n_rows != targets.n_elem) {
    throw ShapeMismatchError(
        "Error: basis has " + std::to_string(basis.n_rows) +
        " rows but targets has " + std::to_string(targets.n_elem) +
        " elements");
  }
  arma::uword n_labeled =
      options_.bias_used ? basis.n_cols - 1 : basis.n_cols;
  if (!labels.empty() && labels.size() != n_labeled) {
    throw ShapeMismatchError(
        "Error: expected " + std::to_string(n_labeled) +
        " basis labels (bias column unlabeled), got " +
        std::to_string(labels.size()));
  }
  if (!basis.is_finite() || !targets.is_finite()) {
    throw std::invalid_argument("Error: basis and targets must be finite");
  }
}

void RelevanceVectorRegression::Fit(const arma::mat& basis,
                                    const arma::vec& targets,
                                    const std::vector<std::string>& labels) {
  ValidateOptions(options_);
  ValidateInputs(basis, targets, labels);

  // Initialize the model.
  FitState state;
  state.Phi = basis;
  state.bias_used = options_.bias_used;
  state.beta = options_.beta;
  state.alpha = options_.alpha * arma::ones<arma::vec>(basis.n_cols);
  state.weights = arma::zeros<arma::vec>(basis.n_cols);
  state.Gamma = arma::zeros<arma::vec>(basis.n_cols);
  state.Sigma = arma::diagmat(1.0 / state.alpha);
  state.relevant_idx = arma::regspace<arma::uvec>(0, basis.n_cols - 1);

  arma::uword n_labeled = state.bias_used ? basis.n_cols - 1 : basis.n_cols;
  if (labels.empty()) {
    for (arma::uword i = 0; i < n_labeled; ++i) {
      state.labels.push_back("phi_" + std::to_string(i));
    }
  } else {
    state.labels = labels;
  }

  DiagnosticSink sink;
  if (options_.verbose) {
    sink = sink_ ? sink_ : DiagnosticSink(PrintDiagnostic);
  }

  fitted_ = false;
  n_basis_ = basis.n_cols;
  status_ = FitStatus::kNotFitted;

  ConvergenceMonitor monitor(options_.tol);
  monitor.Reset(state.alpha);

  std::vector<double> log_ml_trace;
  std::vector<arma::uword> relevance_trace;
  FitStatus status = FitStatus::kMaxIterations;

  // Freeze the current state as the fitted model.
  auto store = [&](int n_iter, FitStatus final_status) {
    relevant_idx_ = state.relevant_idx;
    labels_ = state.labels;
    mean_ = state.weights;
    covariance_ = state.Sigma;
    alpha_ = state.alpha;
    gamma_ = state.Gamma;
    beta_ = state.beta;
    bias_used_ = state.bias_used;
    if (bias_used_) {
      bias_ = mean_(mean_.n_elem - 1);
    } else {
      bias_.reset();
    }
    n_iter_ = n_iter;
    status_ = final_status;
    log_marginal_likelihood_trace_ = arma::vec(log_ml_trace);
    relevance_trace_ = arma::uvec(relevance_trace);
    fitted_ = true;
  };

  int iter = 0;
  while (iter < options_.n_iter) {
    PosteriorResult posterior;
    try {
      posterior = ComputePosterior(state.Phi, targets, state.alpha, state.beta);
    } catch (const SingularSystemError&) {
      // Keep the last state whose posterior was computed, then report.
      if (iter > 0) {
        store(iter, FitStatus::kSingular);
      }
      throw;
    }

    state.weights = posterior.mean;
    state.Sigma = posterior.Sigma;
    log_ml_trace.push_back(posterior.logML);

    HyperparameterUpdate update =
        UpdateHyperparameters(posterior, state.alpha, state.beta,
                              options_.beta_fixed, state.Phi, targets);
    state.alpha = update.alpha;
    state.Gamma = update.Gamma;
    state.beta = update.beta;

    if (sink && ((iter + 1) % options_.verb_freq == 0)) {
      sink(MakeDiagnostic(FitEvent::kIteration, iter, state));
    }

    PruneResult pruned = Prune(state, options_.threshold_alpha);
    monitor.Compact(pruned.keep);
    relevance_trace.push_back(state.alpha.n_elem);

    if (sink && !pruned.pruned_labels.empty()) {
      FitDiagnostic diagnostic =
          MakeDiagnostic(FitEvent::kPruned, iter, state);
      diagnostic.pruned_labels = pruned.pruned_labels;
      sink(diagnostic);
    }

    if (monitor.Check(state.alpha, iter)) {
      status = FitStatus::kConverged;
      if (sink) {
        FitDiagnostic diagnostic =
            MakeDiagnostic(FitEvent::kConverged, iter, state);
        diagnostic.delta = monitor.delta();
        sink(diagnostic);
      }
      iter++;
      break;
    }

    iter++;
  }

  if (status == FitStatus::kMaxIterations && sink) {
    FitDiagnostic diagnostic =
        MakeDiagnostic(FitEvent::kExhausted, iter - 1, state);
    diagnostic.delta = monitor.delta();
    sink(diagnostic);
  }

  store(iter, status);
}

void RelevanceVectorRegression::CheckPredictable(const arma::mat& basis) const {
  if (!fitted_) {
    throw UnfittedModelError("Error: Predict called before Fit");
  }
  if (basis.n_cols != mean_.n_elem) {
    throw ShapeMismatchError(
        "Error: basis has " + std::to_string(basis.n_cols) +
        " columns but the model retains " + std::to_string(mean_.n_elem) +
        " basis functions");
  }
}

arma::vec RelevanceVectorRegression::Predict(const arma::mat& basis) const {
  CheckPredictable(basis);
  return basis * mean_;
}

arma::vec RelevanceVectorRegression::Predict(const arma::mat& basis,
                                             arma::vec& variance) const {
  CheckPredictable(basis);
  // diag(basis * Sigma * basis') without forming the N x N product.
  variance = 1.0 / beta_ + arma::sum((basis * covariance_) % basis, 1);
  return basis * mean_;
}

arma::mat RelevanceVectorRegression::SelectRelevant(
    const arma::mat& full_basis) const {
  if (!fitted_) {
    throw UnfittedModelError("Error: SelectRelevant called before Fit");
  }
  if (full_basis.n_cols != n_basis_) {
    throw ShapeMismatchError(
        "Error: expected " + std::to_string(n_basis_) +
        " columns as in the training basis, got " +
        std::to_string(full_basis.n_cols));
  }
  return full_basis.cols(relevant_idx_);
}

}  // namespace sparse_rvr
