// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_FIT_STATE_HPP
#define SPARSE_RVR_FIT_STATE_HPP

#include <armadillo>
#include <string>
#include <vector>

#include "posterior.hpp"

namespace sparse_rvr {

// Label reported when the intercept column is pruned.
inline constexpr const char* kBiasLabel = "bias";

// Per-basis-function state shared by the steps of one fit. All containers are
// index-aligned with the columns of `Phi`; if `bias_used` is set, the last
// column is the intercept and `labels` has one entry less.
struct FitState {
  arma::mat Phi;
  arma::vec alpha;
  arma::mat Sigma;
  arma::vec weights;
  arma::vec Gamma;
  double beta = 0.0;
  arma::uvec relevant_idx;  // Column indices into the training basis.
  std::vector<std::string> labels;
  bool bias_used = false;
};

// Result of one hyperparameter re-estimation step.
struct HyperparameterUpdate {
  arma::vec alpha;
  arma::vec Gamma;
  double beta;
};

// Re-estimate alpha (and beta unless `beta_fixed`) from the posterior.
// A zero weight or a non-positive gamma yields an infinite alpha; beta is left unchanged when the
// residual is zero or the effective number of parameters reaches N.
HyperparameterUpdate UpdateHyperparameters(const PosteriorResult& posterior,
                                           const arma::vec& alpha, double beta,
                                           bool beta_fixed,
                                           const arma::mat& Phi,
                                           const arma::vec& targets);

// Result of one pruning pass.
struct PruneResult {
  arma::uvec keep;                          // Kept positions, ascending.
  std::vector<std::string> pruned_labels;   // Labels of removed columns.
};

// Remove every basis function with alpha >= threshold_alpha and compact all
// per-basis state in `state`. Never leaves the state empty.
PruneResult Prune(FitState& state, double threshold_alpha);

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_FIT_STATE_HPP
