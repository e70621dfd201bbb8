// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <utility>

#include "fit_state.hpp"

namespace sparse_rvr {

PruneResult Prune(FitState& state, double threshold_alpha) {
  PruneResult out;
  arma::uword M = state.alpha.n_elem;

  arma::uvec keep_mask =
      arma::conv_to<arma::uvec>::from(state.alpha < threshold_alpha);

  // Never throw away every basis function.
  if (!arma::any(keep_mask)) {
    keep_mask(0) = 1;
    if (state.bias_used) {
      keep_mask(M - 1) = 1;
    }
  }

  bool had_bias = state.bias_used;
  if (had_bias && keep_mask(M - 1) == 0) {
    state.bias_used = false;
  }

  arma::uword n_labeled = had_bias ? M - 1 : M;
  std::vector<std::string> labels;
  labels.reserve(n_labeled);
  for (arma::uword i = 0; i < n_labeled; ++i) {
    if (keep_mask(i)) {
      labels.push_back(state.labels[i]);
    } else {
      out.pruned_labels.push_back(state.labels[i]);
    }
  }
  if (had_bias && !state.bias_used) {
    out.pruned_labels.push_back(kBiasLabel);
  }

  out.keep = arma::find(keep_mask);

  state.labels = std::move(labels);
  state.alpha = state.alpha.elem(out.keep);
  state.Gamma = state.Gamma.elem(out.keep);
  state.weights = state.weights.elem(out.keep);
  state.Phi = state.Phi.cols(out.keep);
  state.relevant_idx = state.relevant_idx.elem(out.keep);
  state.Sigma = state.Sigma.submat(out.keep, out.keep);

  // A force-retained column may carry an infinite alpha (zero weight).
  arma::uvec non_finite = arma::find_nonfinite(state.alpha);
  if (non_finite.n_elem > 0) {
    state.alpha.elem(non_finite).fill(threshold_alpha);
  }

  return out;
}

}  // namespace sparse_rvr
