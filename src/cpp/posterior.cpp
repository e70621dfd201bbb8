// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "posterior.hpp"

#include <algorithm>
#include <cmath>

#include "errors.hpp"

namespace sparse_rvr {

namespace {

constexpr double kJitterInit = 1e-10;
constexpr double kJitterGrowth = 10.0;
constexpr int kMaxJitterTries = 6;

}  // namespace

PosteriorResult ComputePosterior(const arma::mat& Phi, const arma::vec& targets,
                                 const arma::vec& alpha, double beta) {
  PosteriorResult out;

  arma::uword N = Phi.n_rows;
  arma::uword M = Phi.n_cols;

  arma::mat H = Phi.t() * Phi * beta + arma::diagmat(alpha);
  H = arma::symmatu(H);
  if (!H.is_finite()) {
    throw SingularSystemError(
        "Error: posterior precision matrix has non-finite entries");
  }

  arma::mat U;
  bool ok = arma::chol(U, H);
  if (!ok) {
    // Near-duplicate basis functions: retry on a jittered diagonal.
    arma::vec H_diag = H.diag();
    double jitter = kJitterInit * std::max(arma::mean(H_diag), 1.0);
    for (int attempt = 0; attempt < kMaxJitterTries && !ok; ++attempt) {
      ok = arma::chol(U, H + jitter * arma::eye<arma::mat>(M, M));
      jitter *= kJitterGrowth;
    }
    if (!ok) {
      throw SingularSystemError(
          "Error: posterior precision matrix is not positive definite");
    }
    out.regularized = true;
  }

  arma::mat Ui;
  if (!arma::inv(Ui, arma::trimatu(U))) {
    throw SingularSystemError("Error: Cholesky factor is not invertible");
  }
  out.Sigma = Ui * Ui.t();
  out.Sigma = arma::symmatu(out.Sigma);

  out.mean = (out.Sigma * (Phi.t() * targets)) * beta;

  if (!out.Sigma.is_finite() || !out.mean.is_finite()) {
    throw SingularSystemError("Error: posterior contains non-finite values");
  }

  arma::vec e = targets - Phi * out.mean;
  double ED = arma::dot(e, e);
  double data_likelihood =
      (static_cast<double>(N) * std::log(beta) - beta * ED) / 2.0;

  out.logML =
      data_likelihood - arma::dot(arma::square(out.mean), alpha) / 2.0 +
      arma::sum(arma::log(alpha)) / 2.0 - arma::sum(arma::log(U.diag()));

  return out;
}

}  // namespace sparse_rvr
