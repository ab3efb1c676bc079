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

#ifndef BIGREAL_REAL_MATCHERS_H_
#define BIGREAL_REAL_MATCHERS_H_

#include <optional>
#include <ostream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/strings/string_view.h"
#include "bigreal/real.h"

// GMock matchers for Real.
//
// The expected value may be given as a Real or as a decimal literal.  A
// literal is parsed at the precision of the value being matched, so the same
// reference digits can be used at any precision as long as they carry enough
// of them.
//
// Matchers:
//   * RealEq: defined as Real::operator==, i.e. equal up to the comparison
//     tolerance of a few units in the last place.
//   * RealNear: the relative error is at most 2**-bits, i.e. the two values
//     agree to about `bits` significant bits.
//
// Examples:
//   EXPECT_THAT(x, bigreal::RealEq("0.5"));
//   EXPECT_THAT(*Sqrt(two), bigreal::RealNear(kSqrt2Digits, 250));

namespace bigreal {

// Print method used by gmock for values of Real.
void PrintTo(const Real& x, std::ostream* os);

class RealMatcher {
 public:
  // `bits < 0` selects tolerant equality.
  RealMatcher(const Real& expected, int bits)
      : expected_(expected), text_(expected.ToString()), bits_(bits) {}

  RealMatcher(absl::string_view expected, int bits)
      : text_(expected), bits_(bits) {}

  bool MatchAndExplain(const Real& actual,
                       ::testing::MatchResultListener* listener) const;

  void DescribeTo(std::ostream* os) const;
  void DescribeNegationTo(std::ostream* os) const;

 private:
  std::optional<Real> expected_;
  std::string text_;
  int bits_;
};

::testing::PolymorphicMatcher<RealMatcher> RealEq(const Real& expected);
::testing::PolymorphicMatcher<RealMatcher> RealEq(absl::string_view expected);

::testing::PolymorphicMatcher<RealMatcher> RealNear(const Real& expected,
                                                    int bits);
::testing::PolymorphicMatcher<RealMatcher> RealNear(absl::string_view expected,
                                                    int bits);

}  // namespace bigreal

#endif  // BIGREAL_REAL_MATCHERS_H_
