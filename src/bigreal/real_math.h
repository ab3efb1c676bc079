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

// Transcendental functions of Real values.
//
// Each function evaluates at the precision of its argument plus a number of
// guard bits (see MathOptions), and truncates to the argument's precision
// only at the end.  With the default options the result is within a few
// units in the last place of the exact value, i.e. it compares equal to a
// correctly computed reference at the same precision.
//
// Errors:
//   OUT_OF_RANGE  The argument is outside the domain (Log(0), Sqrt(-1),
//                 Pow(-2, 0.5)), or the result exponent is out of range.
//   INTERNAL      An iteration did not converge within the allowed number
//                 of steps.  This is logged as a warning.

#ifndef BIGREAL_REAL_MATH_H_
#define BIGREAL_REAL_MATH_H_

#include <cstdint>

#include "absl/flags/declare.h"
#include "absl/status/statusor.h"
#include "bigreal/real.h"

ABSL_DECLARE_FLAG(int32_t, bigreal_guard_bits);

namespace bigreal {

class RealConstants;

// Parameters shared by the transcendental functions.
class MathOptions {
 public:
  MathOptions();

  // The number of bits carried beyond the argument's precision while
  // evaluating.  Larger values make the result more accurate at the cost of
  // speed.
  //
  // DEFAULT: --bigreal_guard_bits (32)
  int guard_bits() const { return guard_bits_; }
  void set_guard_bits(int guard_bits);

  // The maximum number of steps taken by any series or iteration before the
  // function gives up with an INTERNAL error.  Zero selects a limit derived
  // from the working precision, which is never reached in practice.
  //
  // DEFAULT: 0
  int max_iterations() const { return max_iterations_; }
  void set_max_iterations(int max_iterations);

  // The constants (pi and ln2) used for argument reduction.
  //
  // DEFAULT: &RealConstants::Default()
  RealConstants* constants() const { return constants_; }
  void set_constants(RealConstants* constants);

 private:
  int guard_bits_;
  int max_iterations_ = 0;
  RealConstants* constants_;
};

// The natural logarithm.  Requires x > 0.
absl::StatusOr<Real> Log(const Real& x,
                         const MathOptions& options = MathOptions());

// e**x.  Fails with OUT_OF_RANGE when the result exponent would exceed
// Real::kMaxExponent in magnitude.
absl::StatusOr<Real> Exp(const Real& x,
                         const MathOptions& options = MathOptions());

// The square root.  Requires x >= 0.
absl::StatusOr<Real> Sqrt(const Real& x,
                          const MathOptions& options = MathOptions());

// The real n-th root.  Requires n >= 1, and x >= 0 when n is even.  Odd
// roots of negative values are negative.
absl::StatusOr<Real> Root(const Real& x, int n,
                          const MathOptions& options = MathOptions());

// Trigonometric functions of an angle in radians.
absl::StatusOr<Real> Sin(const Real& x,
                         const MathOptions& options = MathOptions());
absl::StatusOr<Real> Cos(const Real& x,
                         const MathOptions& options = MathOptions());

// x**y.  The result has the smaller of the two precisions.
//
//   * x**0 is exactly 1 for every x, including zero.
//   * 0**y is 0 for y > 0 and fails with OUT_OF_RANGE for y < 0.
//   * Integer exponents use repeated squaring, so negative bases are allowed.
//   * Otherwise the base must be positive and the result is exp(y * log(x)).
absl::StatusOr<Real> Pow(const Real& x, const Real& y,
                         const MathOptions& options = MathOptions());

}  // namespace bigreal

#endif  // BIGREAL_REAL_MATH_H_
