// Copyright 2025 brdav

// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SPARSE_RVR_ERRORS_HPP
#define SPARSE_RVR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sparse_rvr {

// Input dimensions are inconsistent. Raised before any iteration starts.
class ShapeMismatchError : public std::invalid_argument {
 public:
  explicit ShapeMismatchError(const std::string& message)
      : std::invalid_argument(message) {}
};

// The posterior precision matrix could not be factorized, even after
// regularization.
class SingularSystemError : public std::runtime_error {
 public:
  explicit SingularSystemError(const std::string& message)
      : std::runtime_error(message) {}
};

// Prediction or reporting was requested before a successful fit.
class UnfittedModelError : public std::logic_error {
 public:
  explicit UnfittedModelError(const std::string& message)
      : std::logic_error(message) {}
};

}  // namespace sparse_rvr

#endif  // SPARSE_RVR_ERRORS_HPP
