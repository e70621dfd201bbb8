// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_POSTERIOR_HPP
#define SPARSE_RVR_POSTERIOR_HPP

#include <armadillo>

namespace sparse_rvr {

/// Gaussian posterior over the weights of the retained basis functions.
struct PosteriorResult {
  arma::vec mean;           ///< Posterior mean m
  arma::mat Sigma;          ///< Posterior covariance (symmetric)
  double logML = 0.0;       ///< Log marginal likelihood (without 2*pi term)
  bool regularized = false; ///< True if a jittered factorization was needed
};

/// Compute the posterior for `Phi` (N x M), `targets` (N), prior precisions
/// `alpha` (M, finite and positive) and noise precision `beta`.
///
/// The precision matrix diag(alpha) + beta * Phi' Phi is factorized by
/// Cholesky. If the factorization fails, increasing diagonal jitter is added
/// before giving up with SingularSystemError.
PosteriorResult ComputePosterior(const arma::mat& Phi, const arma::vec& targets,
                                 const arma::vec& alpha, double beta);

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_POSTERIOR_HPP
