// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_CONVERGENCE_HPP
#define SPARSE_RVR_CONVERGENCE_HPP

#include <armadillo>

namespace sparse_rvr {

// Tracks the change in alpha between iterations.
class ConvergenceMonitor {
 public:
  explicit ConvergenceMonitor(double tol) : tol_(tol) {}

  // Start tracking from the initial alpha.
  void Reset(const arma::vec& alpha);

  // Apply a pruning mask (kept positions) to the previous alpha.
  void Compact(const arma::uvec& keep);

  // Returns true when max|alpha - alpha_old| < tol after the warm-up
  // iterations. Otherwise remembers `alpha` for the next call.
  bool Check(const arma::vec& alpha, int iteration);

  double delta() const { return delta_; }
  const arma::vec& alpha_old() const { return alpha_old_; }

 private:
  // Iterations (zero-based) that must complete before stopping is allowed.
  static constexpr int kWarmupIterations = 2;

  double tol_;
  double delta_ = arma::datum::inf;
  arma::vec alpha_old_;
};

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_CONVERGENCE_HPP
