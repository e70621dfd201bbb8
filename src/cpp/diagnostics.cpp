// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "diagnostics.hpp"

#include <cstdio>

namespace sparse_rvr {

namespace {

void PrintVector(const char* name, const arma::vec& v) {
  printf("--%s [", name);
  for (arma::uword i = 0; i < v.n_elem; ++i) {
    printf(i == 0 ? "%g" : " %g", v(i));
  }
  printf("]\n");
}

}  // namespace

void PrintDiagnostic(const FitDiagnostic& diagnostic) {
  switch (diagnostic.event) {
    case FitEvent::kIteration:
      printf("Fit @ iteration %d:\n", diagnostic.iteration);
      PrintVector("Alpha", diagnostic.alpha);
      printf("--Beta %g\n", diagnostic.beta);
      PrintVector("Gamma", diagnostic.gamma);
      PrintVector("m", diagnostic.mean);
      printf("--Relevance Vectors %d\n\n",
             static_cast<int>(diagnostic.n_relevant));
      break;
    case FitEvent::kPruned:
      printf("Iter %3d: pruned", diagnostic.iteration);
      for (const std::string& label : diagnostic.pruned_labels) {
        printf(" %s", label.c_str());
      }
      printf(" (M=%d)\n", static_cast<int>(diagnostic.n_relevant));
      break;
    case FitEvent::kConverged:
      printf("Stopping at iteration %d (delta = %g < tol)\n",
             diagnostic.iteration, diagnostic.delta);
      break;
    case FitEvent::kExhausted:
      printf("Reached maximum iterations (%d), delta = %g\n",
             diagnostic.iteration + 1, diagnostic.delta);
      break;
  }
}

}  // namespace sparse_rvr
