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

#include "bigreal/real_constants.h"

#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "bigreal/real.h"
#include "bigreal/real_math.h"
#include "bigreal/real_matchers.h"

namespace bigreal {
namespace {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;

constexpr absl::string_view kPi =
    "3.14159265358979323846264338327950288419716939937510582097494459230781640"
    "628620899862803482534211706";
constexpr absl::string_view kE =
    "2.71828182845904523536028747135266249775724709369995957496696762772407663"
    "03535475945713821785251664274";
constexpr absl::string_view kLn2 =
    "0.69314718055994530941723212145817656807550013436025525412068000949339362"
    "19696947156058633269964186875";
constexpr absl::string_view kLn10 = "2.302585092994045684017991454684364207601";

TEST(RealConstantsTest, DefaultFunctions) {
  EXPECT_THAT(Pi(), IsOkAndHolds(RealNear(kPi, 250)));
  EXPECT_THAT(E(), IsOkAndHolds(RealNear(kE, 250)));
  EXPECT_THAT(Ln2(), IsOkAndHolds(RealNear(kLn2, 250)));
  EXPECT_THAT(Ln10(128), IsOkAndHolds(RealNear(kLn10, 120)));
}

TEST(RealConstantsTest, ManyPrecisions) {
  for (int precision : {1, 2, 10, 53, 64, 100, 300}) {
    const int bits = precision > 8 ? precision - 4 : 1;
    EXPECT_THAT(Pi(precision), IsOkAndHolds(RealNear(kPi, bits))) << precision;
    EXPECT_THAT(E(precision), IsOkAndHolds(RealNear(kE, bits))) << precision;
    EXPECT_THAT(Ln2(precision), IsOkAndHolds(RealNear(kLn2, bits)))
        << precision;
  }
}

TEST(RealConstantsTest, ResultHasRequestedPrecision) {
  absl::StatusOr<Real> pi = Pi(77);
  ASSERT_THAT(pi, IsOk());
  EXPECT_EQ(pi->precision(), 77);
}

TEST(RealConstantsTest, HighPrecisionAgreesWithIdentities) {
  constexpr int kPrecision = 3000;
  const Real pi = *Pi(kPrecision);
  // sin(pi/6) = 1/2 and ln(e) = 1 at a precision far beyond the reference
  // digits above.
  EXPECT_THAT(Sin(*Divide(pi, *Real::FromInt(6, kPrecision))),
              IsOkAndHolds(RealNear("0.5", kPrecision - 16)));
  EXPECT_THAT(Log(*E(kPrecision)),
              IsOkAndHolds(RealNear("1", kPrecision - 16)));
  EXPECT_THAT(Exp(*Ln2(kPrecision)),
              IsOkAndHolds(RealNear("2", kPrecision - 16)));
  EXPECT_THAT(Exp(*Ln10(kPrecision)),
              IsOkAndHolds(RealNear("10", kPrecision - 16)));
}

TEST(RealConstantsTest, InvalidPrecision) {
  EXPECT_THAT(Pi(0), StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(E(-5), StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(Ln2(Real::kMaxPrecision + 1),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(Ln10(0), StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ConstantProviderTest, CachesTheMostPreciseValue) {
  RealConstants constants;
  ConstantProvider& pi = constants.pi();
  EXPECT_EQ(pi.cached_precision(), 0);

  ASSERT_THAT(pi.Get(100), IsOk());
  EXPECT_EQ(pi.cached_precision(), 100 + ConstantProvider::kCacheGuardBits);

  // Lower precisions are served from the cache.
  ASSERT_THAT(pi.Get(50), IsOk());
  ASSERT_THAT(pi.Get(100 + ConstantProvider::kCacheGuardBits), IsOk());
  EXPECT_EQ(pi.cached_precision(), 100 + ConstantProvider::kCacheGuardBits);

  ASSERT_THAT(pi.Get(200), IsOk());
  EXPECT_EQ(pi.cached_precision(), 200 + ConstantProvider::kCacheGuardBits);
}

TEST(ConstantProviderTest, CachedValueMatchesFreshValue) {
  RealConstants warm;
  ASSERT_THAT(warm.e().Get(1000), IsOk());
  RealConstants cold;
  EXPECT_THAT(warm.e().Get(64), IsOkAndHolds(RealEq(*cold.e().Get(64))));
}

TEST(ConstantProviderTest, Names) {
  RealConstants constants;
  EXPECT_EQ(constants.pi().name(), "pi");
  EXPECT_EQ(constants.e().name(), "e");
  EXPECT_EQ(constants.ln2().name(), "ln2");
  EXPECT_EQ(constants.ln10().name(), "ln10");
}

TEST(ConstantProviderTest, DerivedConstantsUseTheirOwnSet) {
  RealConstants constants;
  ASSERT_THAT(constants.ln10().Get(128), IsOk());
  EXPECT_GT(constants.ln2().cached_precision(), 128);
  EXPECT_EQ(constants.pi().cached_precision(), 0);
}

TEST(ConstantProviderTest, DefaultIsASingleton) {
  EXPECT_EQ(&RealConstants::Default(), &RealConstants::Default());
}

TEST(ConstantProviderTest, ConcurrentRequests) {
  RealConstants constants;
  constexpr int kNumThreads = 8;
  std::vector<absl::StatusOr<Real>> pi(kNumThreads);
  std::vector<absl::StatusOr<Real>> e(kNumThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back([&constants, &pi, &e, i] {
      // Interleave growing and shrinking requests across threads.
      const int precision = 64 + 40 * ((i * 5) % kNumThreads);
      pi[i] = constants.pi().Get(precision);
      e[i] = constants.e().Get(precision);
    });
  }
  for (std::thread& thread : threads) thread.join();

  for (int i = 0; i < kNumThreads; ++i) {
    ASSERT_THAT(pi[i], IsOk());
    ASSERT_THAT(e[i], IsOk());
    EXPECT_THAT(*pi[i], RealNear(kPi, pi[i]->precision() - 4));
    EXPECT_THAT(*e[i], RealNear(kE, e[i]->precision() - 4));
  }
}

}  // namespace
}  // namespace bigreal
