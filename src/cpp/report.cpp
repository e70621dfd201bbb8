// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

#include "fit_state.hpp"

namespace sparse_rvr {

std::string FormatSparseModel(const RelevanceVectorRegression& model) {
  if (!model.is_fitted()) {
    throw UnfittedModelError("Error: FormatSparseModel called before Fit");
  }

  const std::vector<std::string>& labels = model.labels();
  const arma::vec& mean = model.mean();

  std::size_t width = std::char_traits<char>::length(kBiasLabel);
  for (const std::string& label : labels) {
    width = std::max(width, label.size());
  }

  std::ostringstream os;
  os << "Sparse model: " << mean.n_elem << " of " << model.n_basis()
     << " basis functions retained\n";
  for (std::size_t i = 0; i < labels.size(); ++i) {
    os << "  " << std::left << std::setw(static_cast<int>(width)) << labels[i]
       << " : " << std::right << std::setprecision(6) << mean(i) << "\n";
  }
  if (model.bias()) {
    os << "  " << std::left << std::setw(static_cast<int>(width)) << kBiasLabel
       << " : " << std::right << std::setprecision(6) << *model.bias() << "\n";
  }
  return os.str();
}

}  // namespace sparse_rvr
