// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <cmath>
#include <limits>

#include "fit_state.hpp"

namespace sparse_rvr {

HyperparameterUpdate UpdateHyperparameters(const PosteriorResult& posterior,
                                           const arma::vec& alpha, double beta,
                                           bool beta_fixed,
                                           const arma::mat& Phi,
                                           const arma::vec& targets) {
  HyperparameterUpdate out;
  out.Gamma = arma::ones<arma::vec>(alpha.n_elem) -
              alpha % arma::diagvec(posterior.Sigma);

  out.alpha = arma::vec(alpha.n_elem);
  for (arma::uword i = 0; i < alpha.n_elem; ++i) {
    double w2 = posterior.mean(i) * posterior.mean(i);
    double new_alpha = out.Gamma(i) / w2;
    if (w2 == 0.0 || out.Gamma(i) <= 0.0 || !std::isfinite(new_alpha) ||
        new_alpha <= 0.0) {
      // Zero weight or fully prior-determined weight: irrelevant.
      new_alpha = std::numeric_limits<double>::infinity();
    }
    out.alpha(i) = new_alpha;
  }

  out.beta = beta;
  if (beta_fixed) {
    return out;
  }

  arma::uword N = Phi.n_rows;
  arma::vec e = targets - Phi * posterior.mean;
  double ED = arma::dot(e, e);
  double numer = static_cast<double>(N) - arma::sum(out.Gamma);

  if (ED > 0.0 && std::isfinite(ED) && numer > 0.0) {
    out.beta = numer / ED;
  }

  return out;
}

}  // namespace sparse_rvr
