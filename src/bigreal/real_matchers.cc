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

#include "bigreal/real_matchers.h"

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "bigreal/real.h"

namespace bigreal {

void PrintTo(const Real& x, std::ostream* os) {
  *os << x << " (precision " << x.precision() << ")";
}

bool RealMatcher::MatchAndExplain(
    const Real& actual, ::testing::MatchResultListener* listener) const {
  Real expected;
  if (expected_.has_value()) {
    expected = *expected_;
  } else {
    absl::StatusOr<Real> parsed = Real::FromString(text_, actual.precision());
    if (!parsed.ok()) {
      *listener << "expected value does not parse: " << parsed.status();
      return false;
    }
    expected = *std::move(parsed);
  }

  if (bits_ < 0) {
    if (actual == expected) return true;
    *listener << "which differs from " << expected;
    return false;
  }

  // Measure the error at a precision where the subtraction is exact enough
  // not to hide a mismatch.
  const int precision =
      std::max({actual.precision(), expected.precision(), bits_ + 64});
  const Real error =
      abs(actual.WithPrecision(precision) - expected.WithPrecision(precision));
  if (error.is_zero()) return true;
  // The reference magnitude is the expected value, or 1 when it is zero.
  const int64_t scale = expected.is_zero() ? 0 : ilogb(expected);
  const int64_t error_log2 = ilogb(error);
  if (error_log2 < scale - bits_) return true;
  *listener << "which has an error of about 2**" << error_log2 - scale
            << " relative to " << expected;
  return false;
}

void RealMatcher::DescribeTo(std::ostream* os) const {
  if (bits_ < 0) {
    *os << "== " << text_;
  } else {
    *os << "is within 2**-" << bits_ << " relative error of " << text_;
  }
}

void RealMatcher::DescribeNegationTo(std::ostream* os) const {
  if (bits_ < 0) {
    *os << "!= " << text_;
  } else {
    *os << "is not within 2**-" << bits_ << " relative error of " << text_;
  }
}

::testing::PolymorphicMatcher<RealMatcher> RealEq(const Real& expected) {
  return ::testing::MakePolymorphicMatcher(RealMatcher(expected, -1));
}

::testing::PolymorphicMatcher<RealMatcher> RealEq(absl::string_view expected) {
  return ::testing::MakePolymorphicMatcher(RealMatcher(expected, -1));
}

::testing::PolymorphicMatcher<RealMatcher> RealNear(const Real& expected,
                                                    int bits) {
  return ::testing::MakePolymorphicMatcher(RealMatcher(expected, bits));
}

::testing::PolymorphicMatcher<RealMatcher> RealNear(absl::string_view expected,
                                                    int bits) {
  return ::testing::MakePolymorphicMatcher(RealMatcher(expected, bits));
}

}  // namespace bigreal
