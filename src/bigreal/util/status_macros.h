// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BIGREAL_UTIL_STATUS_MACROS_H_
#define BIGREAL_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/status/status.h"

#define BIGREAL_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define BIGREAL_STATUS_MACROS_CONCAT_(x, y) \
  BIGREAL_STATUS_MACROS_CONCAT_INNER_(x, y)

// Evaluates an expression returning absl::Status and returns it from the
// enclosing function if it is not OK.
#define BIGREAL_RETURN_IF_ERROR(expr)                 \
  do {                                                \
    if (absl::Status _status = (expr); !_status.ok()) \
      return _status;                                 \
  } while (false)

// Executes an expression that returns a StatusOr, extracting its value
// into the variable defined by lhs (or returning the status on error).
// May be used several times in one scope.
//
// Example:
//   absl::StatusOr<Real> Twice(const Real& x) {
//     BIGREAL_ASSIGN_OR_RETURN(Real half, Divide(x, Real(2)));
//     ...
//   }
#define BIGREAL_ASSIGN_OR_RETURN(lhs, rhs) \
  BIGREAL_ASSIGN_OR_RETURN_IMPL_(          \
      BIGREAL_STATUS_MACROS_CONCAT_(_status_or_value, __LINE__), lhs, rhs)

#define BIGREAL_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rhs) \
  auto statusor = (rhs);                                   \
  if (!statusor.ok()) return std::move(statusor).status(); \
  lhs = *std::move(statusor)

#endif  // BIGREAL_UTIL_STATUS_MACROS_H_
