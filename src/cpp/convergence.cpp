// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "convergence.hpp"

#include <stdexcept>

namespace sparse_rvr {

void ConvergenceMonitor::Reset(const arma::vec& alpha) {
  alpha_old_ = alpha;
  delta_ = arma::datum::inf;
}

void ConvergenceMonitor::Compact(const arma::uvec& keep) {
  alpha_old_ = alpha_old_.elem(keep);
}

bool ConvergenceMonitor::Check(const arma::vec& alpha, int iteration) {
  if (alpha.n_elem != alpha_old_.n_elem) {
    throw std::logic_error(
        "ConvergenceMonitor::Check got alpha of mismatched length");
  }

  delta_ = arma::max(arma::abs(alpha - alpha_old_));

  if (delta_ < tol_ && iteration >= kWarmupIterations) {
    return true;
  }

  alpha_old_ = alpha;
  return false;
}

}  // namespace sparse_rvr
