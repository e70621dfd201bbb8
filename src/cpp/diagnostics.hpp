// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_DIAGNOSTICS_HPP
#define SPARSE_RVR_DIAGNOSTICS_HPP

#include <armadillo>
#include <functional>
#include <string>
#include <vector>

namespace sparse_rvr {

// Kinds of events emitted by the fit loop.
enum class FitEvent : int {
  kIteration = 0,
  kPruned = 1,
  kConverged = 2,
  kExhausted = 3,
};

/// Snapshot of the fit state at the moment an event is emitted.
struct FitDiagnostic {
  FitEvent event = FitEvent::kIteration;
  int iteration = 0;               ///< Zero-based iteration index
  arma::vec alpha;                 ///< Weight precisions
  double beta = 0.0;               ///< Noise precision
  arma::vec gamma;                 ///< Well-determinedness factors
  arma::vec mean;                  ///< Posterior mean of the weights
  arma::uword n_relevant = 0;      ///< Retained basis functions
  double delta = 0.0;              ///< Max alpha change (convergence events)
  std::vector<std::string> pruned_labels;  ///< Set for kPruned events
};

using DiagnosticSink = std::function<void(const FitDiagnostic&)>;

// Default sink: renders events to stdout.
void PrintDiagnostic(const FitDiagnostic& diagnostic);

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_DIAGNOSTICS_HPP
