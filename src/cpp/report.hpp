// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_REPORT_HPP
#define SPARSE_RVR_REPORT_HPP

#include <string>

#include "relevance_regression.hpp"

namespace sparse_rvr {

/// Human-readable listing of the retained basis functions and their weights,
/// one per line, followed by the intercept if it survived the fit.
/// Throws UnfittedModelError for a model that was never fitted.
std::string FormatSparseModel(const RelevanceVectorRegression& model);

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_REPORT_HPP
