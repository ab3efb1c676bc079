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

#include "bigreal/bignum.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include "absl/log/absl_check.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "openssl/bn.h"
#include "openssl/crypto.h"

namespace bigreal_internal {
namespace {

using ::testing::TestWithParam;

constexpr uint64_t kU64max = std::numeric_limits<uint64_t>::max();
constexpr int64_t kI64max = std::numeric_limits<int64_t>::max();
constexpr int64_t kI64min = std::numeric_limits<int64_t>::min();

inline Bignum Bn(absl::string_view str) {
  std::optional<Bignum> b = Bignum::FromString(str);
  ABSL_CHECK(b.has_value()) << str;
  return *std::move(b);
}

TEST(BignumTest, ParsesSignsAndLeadingZeros) {
  EXPECT_EQ(Bignum::FromString(""), Bignum(0));
  EXPECT_EQ(Bignum::FromString("-0"), Bignum(0));
  EXPECT_EQ(Bignum::FromString("+0000"), Bignum(0));
  EXPECT_EQ(Bignum::FromString("42"), Bignum(42));
  EXPECT_EQ(Bignum::FromString("-17"), Bignum(-17));
  EXPECT_EQ(Bignum::FromString("+000123"), Bignum(123));
  EXPECT_EQ(Bignum::FromString("18446744073709551615"), Bignum(kU64max));
  EXPECT_EQ(Bn("18446744073709551616"), Bignum(1) << 64);
  EXPECT_EQ(Bn("-0000340282366920938463463374607431768211456"),
            -(Bignum(1) << 128));
}

TEST(BignumTest, RejectsMalformedStrings) {
  EXPECT_EQ(Bignum::FromString("++1"), std::nullopt);
  EXPECT_EQ(Bignum::FromString("+-1"), std::nullopt);
  EXPECT_EQ(Bignum::FromString("12-"), std::nullopt);
  EXPECT_EQ(Bignum::FromString("1.5"), std::nullopt);
  EXPECT_EQ(Bignum::FromString("1e5"), std::nullopt);
  EXPECT_EQ(Bignum::FromString(" 1"), std::nullopt);
  EXPECT_EQ(Bignum::FromString("12345678901234567890x"), std::nullopt);
}

TEST(BignumTest, FormatsDecimal) {
  EXPECT_EQ(Bignum(0).ToString(), "0");
  EXPECT_EQ(Bignum(-42).ToString(), "-42");
  EXPECT_EQ(Bignum(kI64min).ToString(), "-9223372036854775808");
  // Chunks after the first are zero padded to 19 digits.
  EXPECT_EQ((Bignum(1) << 64).ToString(), "18446744073709551616");
  EXPECT_EQ(Bignum(10).Pow(40).ToString(),
            "10000000000000000000000000000000000000000");
  EXPECT_EQ(absl::StrCat(Bn("-123456789012345678901234567890")),
            "-123456789012345678901234567890");
}

TEST(BignumTest, CastWraps) {
  EXPECT_EQ(Bignum(300).Cast<uint8_t>(), 44);
  EXPECT_EQ(Bignum(-1).Cast<uint32_t>(), 0xFFFFFFFFu);
  EXPECT_EQ(((Bignum(1) << 64) + Bignum(5)).Cast<uint64_t>(), 5u);
  EXPECT_EQ(Bignum(kI64min).Cast<int64_t>(), kI64min);
  EXPECT_EQ(Bignum(kI64max).Cast<int64_t>(), kI64max);
  EXPECT_EQ(Bignum(-7).Cast<int32_t>(), -7);
}

TEST(BignumTest, AddAndSubtract) {
  EXPECT_EQ(Bignum(5) + Bignum(3), Bignum(8));
  EXPECT_EQ(Bignum(-5) + Bignum(-3), Bignum(-8));
  EXPECT_EQ(Bignum(5) + Bignum(-8), Bignum(-3));
  EXPECT_EQ(Bignum(-5) + Bignum(8), Bignum(3));
  EXPECT_EQ(Bignum(5) - Bignum(5), Bignum(0));
  EXPECT_FALSE((Bignum(5) - Bignum(5)).is_negative());
  EXPECT_EQ(Bignum(kU64max) + Bignum(1), Bignum(1) << 64);
  EXPECT_EQ((Bignum(1) << 128) - Bignum(1),
            Bn("340282366920938463463374607431768211455"));
  EXPECT_EQ(Bignum(1) - (Bignum(1) << 128),
            Bn("-340282366920938463463374607431768211455"));

  Bignum a(kU64max);
  a += a;
  EXPECT_EQ(a, Bn("36893488147419103230"));
  a -= a;
  EXPECT_EQ(a, Bignum(0));
}

TEST(BignumTest, Multiply) {
  EXPECT_EQ(Bignum(-6) * Bignum(7), Bignum(-42));
  EXPECT_EQ(Bignum(-6) * Bignum(-7), Bignum(42));
  EXPECT_EQ(Bignum(0) * Bignum(-7), Bignum(0));
  EXPECT_FALSE((Bignum(0) * Bignum(-7)).is_negative());
  EXPECT_EQ(Bignum(kU64max) * Bignum(kU64max),
            Bn("340282366920938463426481119284349108225"));

  // Large enough to exercise the Karatsuba path, balanced and unbalanced.
  const Bignum big = (Bignum(1) << 4000) - Bignum(1);
  EXPECT_EQ(big * big, (Bignum(1) << 8000) - (Bignum(1) << 4001) + Bignum(1));
  const Bignum small = (Bignum(1) << 2100) + Bignum(3);
  EXPECT_EQ(big * small,
            (Bignum(1) << 6100) + (Bignum(3) << 4000) - small);
}

TEST(BignumTest, Shifts) {
  EXPECT_EQ(Bignum(1) << 64, Bn("18446744073709551616"));
  EXPECT_EQ(Bignum(-1) << 65, Bn("-36893488147419103232"));
  EXPECT_EQ(Bignum(kU64max) << 64,
            Bn("340282366920938463444927863358058659840"));
  EXPECT_EQ(Bignum(0) << 100, Bignum(0));

  EXPECT_EQ(Bignum(8) >> 3, Bignum(1));
  EXPECT_EQ(Bignum(8) >> 4, Bignum(0));
  EXPECT_EQ((Bignum(1) << 200) >> 199, Bignum(2));
  EXPECT_EQ(Bn("340282366920938463463374607431768211455") >> 64,
            Bignum(kU64max));

  // Right shifts act on the magnitude, truncating toward zero.
  EXPECT_EQ(Bignum(-5) >> 1, Bignum(-2));
  EXPECT_EQ(Bignum(-1) >> 1, Bignum(0));
  EXPECT_FALSE((Bignum(-1) >> 1).is_negative());
}

TEST(BignumTest, BitQueries) {
  EXPECT_EQ(bit_width(Bignum(0)), 0);
  EXPECT_EQ(bit_width(Bignum(1)), 1);
  EXPECT_EQ(bit_width(Bignum(-255)), 8);
  EXPECT_EQ(bit_width(Bignum(1) << 64), 65);
  EXPECT_EQ(countr_zero(Bignum(0)), 0);
  EXPECT_EQ(countr_zero(Bignum(12)), 2);
  EXPECT_EQ(countr_zero(Bignum(-3) << 130), 130);

  const Bignum b = (Bignum(1) << 100) + Bignum(5);
  EXPECT_TRUE(b.is_bit_set(0));
  EXPECT_FALSE(b.is_bit_set(1));
  EXPECT_TRUE(b.is_bit_set(2));
  EXPECT_TRUE(b.is_bit_set(100));
  EXPECT_FALSE(b.is_bit_set(1000));
  EXPECT_TRUE(b.is_odd());
  EXPECT_FALSE(Bignum(0).is_odd());
}

TEST(BignumTest, SignAccessors) {
  EXPECT_EQ(Bignum(0).sign(), 0);
  EXPECT_EQ(Bignum(-3).sign(), -1);
  EXPECT_EQ(Bignum(3).sign(), 1);
  EXPECT_EQ(abs(Bignum(-3)), Bignum(3));

  Bignum zero;
  zero.set_negative();
  EXPECT_FALSE(zero.is_negative());
  zero.negate();
  EXPECT_FALSE(zero.is_negative());
}

TEST(BignumTest, Pow) {
  EXPECT_EQ(Bignum(0).Pow(0), Bignum(1));
  EXPECT_EQ(Bignum(0).Pow(5), Bignum(0));
  EXPECT_EQ(Bignum(-2).Pow(3), Bignum(-8));
  EXPECT_EQ(Bignum(3).Pow(5), Bignum(243));
  EXPECT_EQ(Bignum(2).Pow(100), Bignum(1) << 100);
  EXPECT_EQ(Bignum(5).Pow(27), Bn("7450580596923828125"));
}

TEST(BignumTest, Comparisons) {
  EXPECT_LT(Bignum(-5), Bignum(3));
  EXPECT_LT(Bignum(-5), Bignum(-3));
  EXPECT_GT(Bignum(1) << 64, Bignum(kU64max));
  EXPECT_LT(-(Bignum(1) << 64), Bignum(kI64min));
  EXPECT_LE(Bignum(0), Bignum(0));
  EXPECT_EQ(Bignum(-5).CompareAbs(Bignum(3)), 1);
  EXPECT_EQ(Bignum(-5).Compare(Bignum(3)), -1);
}

TEST(BignumTest, DivModTruncatesTowardZero) {
  const std::vector<std::pair<int64_t, int64_t>> cases = {
      {7, 2}, {-7, 2}, {7, -2}, {-7, -2}, {6, 3}, {1, 5}, {-1, 5}, {0, 9}};
  for (const auto& [a, b] : cases) {
    Bignum q, r;
    Bignum::DivMod(Bignum(a), Bignum(b), &q, &r);
    EXPECT_EQ(q, Bignum(a / b)) << a << " / " << b;
    EXPECT_EQ(r, Bignum(a % b)) << a << " % " << b;
  }
}

TEST(BignumTest, DivModMultiBigit) {
  const Bignum two_64 = Bignum(1) << 64;
  EXPECT_EQ((Bignum(1) << 128) / two_64, two_64);
  EXPECT_EQ(((Bignum(1) << 128) - Bignum(1)) / Bignum(kU64max),
            two_64 + Bignum(1));
  EXPECT_EQ(Bignum(10).Pow(40) / Bignum(10).Pow(20), Bignum(10).Pow(20));
  EXPECT_EQ((Bignum(10).Pow(40) + Bignum(17)) % Bignum(10).Pow(20),
            Bignum(17));

  // Quotient digits that need the add-back correction step.
  const Bignum u = Bn("340282366920938463463374607431768211455") << 64;
  const Bignum v = Bn("340282366920938463463374607431768211454");
  Bignum q, r;
  Bignum::DivMod(u, v, &q, &r);
  EXPECT_EQ(q * v + r, u);
  EXPECT_GE(r, Bignum(0));
  EXPECT_LT(r, v);

  // Only the quotient or only the remainder may be requested.
  Bignum only_q;
  Bignum::DivMod(Bignum(100), Bignum(7), &only_q, nullptr);
  EXPECT_EQ(only_q, Bignum(14));
  Bignum only_r;
  Bignum::DivMod(Bignum(100), Bignum(7), nullptr, &only_r);
  EXPECT_EQ(only_r, Bignum(2));
}

TEST(BignumDeathTest, DivideByZero) {
  EXPECT_DEATH(Bignum(1) / Bignum(0), "division by zero");
}

// RAII wrapper for an OpenSSL BIGNUM, used as a reference implementation.
class OpenSSLBignum {
 public:
  OpenSSLBignum() : bn_(BN_new()) {}

  explicit OpenSSLBignum(const std::string& decimal) : bn_(BN_new()) {
    BN_dec2bn(&bn_, decimal.c_str());
  }

  OpenSSLBignum(const OpenSSLBignum&) = delete;
  OpenSSLBignum& operator=(const OpenSSLBignum&) = delete;

  ~OpenSSLBignum() { BN_free(bn_); }

  BIGNUM* get() const { return bn_; }

  std::string ToString() const {
    char* str = BN_bn2dec(bn_);
    std::string out(str);
    OPENSSL_free(str);
    return out;
  }

 private:
  BIGNUM* bn_;
};

// Operand sizes in bits.
enum class NumberSizeClass : int {
  kSmall = 64,
  kMedium = 256,
  kLarge = 1024,
  kHuge = 4096,
  kMega = 18000
};

constexpr int kRandomBignumCount = 64;

std::vector<std::string> RandomNumberStrings(absl::BitGenRef bitgen,
                                             NumberSizeClass size_class) {
  // log10(2) ~= 0.3
  const int digits = static_cast<int>(size_class) * 3 / 10;
  std::vector<std::string> numbers;
  for (int i = 0; i < kRandomBignumCount; ++i) {
    std::string num = absl::Bernoulli(bitgen, 0.5) ? "-" : "";
    absl::StrAppend(&num,
                    absl::Uniform<int>(absl::IntervalClosed, bitgen, 1, 9));
    for (int j = 1; j < digits; ++j) {
      num += static_cast<char>('0' + absl::Uniform<int>(bitgen, 0, 10));
    }
    numbers.push_back(std::move(num));
  }
  return numbers;
}

class VsOpenSSLTest
    : public TestWithParam<std::pair<NumberSizeClass, NumberSizeClass>> {
 protected:
  std::vector<std::pair<std::string, std::string>> Numbers() {
    const auto lhs = RandomNumberStrings(bitgen_, GetParam().first);
    const auto rhs = RandomNumberStrings(bitgen_, GetParam().second);
    std::vector<std::pair<std::string, std::string>> numbers;
    for (size_t i = 0; i < lhs.size(); ++i) {
      numbers.emplace_back(lhs[i], rhs[i]);
    }
    return numbers;
  }

  BN_CTX* ctx() { return ctx_; }

  void TearDown() override { BN_CTX_free(ctx_); }

 private:
  absl::BitGen bitgen_;
  BN_CTX* ctx_ = BN_CTX_new();
};

TEST_P(VsOpenSSLTest, AddSubMulMatch) {
  for (const auto& [a, b] : Numbers()) {
    const Bignum x = Bn(a), y = Bn(b);
    const OpenSSLBignum ssl_x(a), ssl_y(b);
    OpenSSLBignum sum, diff, prod;
    BN_add(sum.get(), ssl_x.get(), ssl_y.get());
    BN_sub(diff.get(), ssl_x.get(), ssl_y.get());
    BN_mul(prod.get(), ssl_x.get(), ssl_y.get(), ctx());

    EXPECT_EQ((x + y).ToString(), sum.ToString()) << a << " + " << b;
    EXPECT_EQ((x - y).ToString(), diff.ToString()) << a << " - " << b;
    EXPECT_EQ((x * y).ToString(), prod.ToString()) << a << " * " << b;
  }
}

TEST_P(VsOpenSSLTest, DivModMatch) {
  for (const auto& [a, b] : Numbers()) {
    const Bignum x = Bn(a), y = Bn(b);
    const OpenSSLBignum ssl_x(a), ssl_y(b);
    OpenSSLBignum quot, rem;
    // BN_div truncates toward zero and gives the remainder the dividend's
    // sign, the same convention as DivMod.
    ASSERT_EQ(BN_div(quot.get(), rem.get(), ssl_x.get(), ssl_y.get(), ctx()),
              1);

    Bignum q, r;
    Bignum::DivMod(x, y, &q, &r);
    EXPECT_EQ(q.ToString(), quot.ToString()) << a << " / " << b;
    EXPECT_EQ(r.ToString(), rem.ToString()) << a << " % " << b;
  }
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(
    VsOpenSSL, VsOpenSSLTest, ::testing::Values(
      std::make_pair(NumberSizeClass::kSmall, NumberSizeClass::kSmall),
      std::make_pair(NumberSizeClass::kMedium, NumberSizeClass::kSmall),
      std::make_pair(NumberSizeClass::kSmall, NumberSizeClass::kHuge),
      std::make_pair(NumberSizeClass::kHuge, NumberSizeClass::kMedium),
      std::make_pair(NumberSizeClass::kLarge, NumberSizeClass::kLarge),
      std::make_pair(NumberSizeClass::kMega, NumberSizeClass::kHuge),
      std::make_pair(NumberSizeClass::kMega, NumberSizeClass::kMega)));
// clang-format on

}  // namespace
}  // namespace bigreal_internal
