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

#ifndef BIGREAL_BIGNUM_H_
#define BIGREAL_BIGNUM_H_

#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/base/nullability.h"
#include "absl/container/inlined_vector.h"
#include "absl/log/absl_check.h"
#include "absl/strings/string_view.h"

namespace bigreal_internal {

// A single 64-bit digit of a Bignum ("big digit").
using Bigit = uint64_t;

// Signed integers of unbounded size, used as the coefficient of a Real.
//
// The value is kept in sign-magnitude form: a vector of 64-bit bigits stored
// least significant first, plus a sign flag. Shifts act on the magnitude, so
// `-5 >> 1 == -2` (truncation toward zero), which is exactly the truncating
// normalization that Real relies on.
class Bignum {
 public:
  // Reals default to 256 bits of precision, and products of two coefficients
  // are twice that, so 8 bigits are kept inline before allocating.
  using BigitVector = absl::InlinedVector<Bigit, 8>;

  static constexpr int kBigitBits = std::numeric_limits<Bigit>::digits;

  Bignum() = default;

  // Constructs a bignum from any integral value.
  template <typename T,
            typename = std::enable_if_t<std::numeric_limits<T>::is_integer>>
  explicit Bignum(T value);

  // Parses an optional leading '+' or '-' followed by decimal digits. Returns
  // std::nullopt if any other character appears. An empty digit string parses
  // as zero.
  static std::optional<Bignum> FromString(absl::string_view s);

  // Returns the decimal representation, e.g. "-1234".
  std::string ToString() const;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Bignum& b) {
    sink.Append(b.ToString());
  }

  friend std::ostream& operator<<(std::ostream& os, const Bignum& b) {
    return os << b.ToString();
  }

  // Converts to T, wrapping modulo 2^digits like a static_cast would.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  T Cast() const;

  // Number of bits needed to hold the magnitude (0 for zero).
  friend int bit_width(const Bignum& a);

  // Number of trailing zero bits of the magnitude (0 for zero).
  friend int countr_zero(const Bignum& a);

  // Returns true if bit `nbit` of the magnitude is set.
  bool is_bit_set(int nbit) const;

  bool is_zero() const { return bigits_.empty(); }
  bool is_negative() const { return negative_; }
  bool is_odd() const { return is_bit_set(0); }

  // Returns -1, 0 or +1 according to the sign of the value.
  int sign() const {
    if (is_zero()) return 0;
    return negative_ ? -1 : +1;
  }

  Bignum& set_zero() {
    bigits_.clear();
    negative_ = false;
    return *this;
  }

  // Sets the sign. Zero always stays non-negative.
  Bignum& set_negative(bool negative = true) {
    negative_ = negative && !is_zero();
    return *this;
  }

  void negate() { set_negative(!negative_); }

  friend Bignum abs(Bignum a) { return a.set_negative(false); }

  // Returns -1, 0 or +1 comparing *this with b.
  int Compare(const Bignum& b) const;

  // Compares magnitudes only.
  int CompareAbs(const Bignum& b) const;

  bool operator==(const Bignum& b) const {
    return negative_ == b.negative_ && bigits_ == b.bigits_;
  }
  bool operator!=(const Bignum& b) const { return !(*this == b); }
  bool operator<(const Bignum& b) const { return Compare(b) < 0; }
  bool operator<=(const Bignum& b) const { return Compare(b) <= 0; }
  bool operator>(const Bignum& b) const { return Compare(b) > 0; }
  bool operator>=(const Bignum& b) const { return Compare(b) >= 0; }

  Bignum operator-() const {
    Bignum result = *this;
    result.negate();
    return result;
  }

  // Returns this value raised to a non-negative power.
  Bignum Pow(int32_t pow) const;

  // Computes the quotient and remainder of a / b with C++ integer semantics:
  // the quotient is truncated toward zero and the remainder has the sign of
  // the dividend. Either output may be null. Uses Knuth's Algorithm D.
  //
  // REQUIRES: !b.is_zero()
  static void DivMod(const Bignum& a, const Bignum& b,
                     Bignum* absl_nullable quotient,
                     Bignum* absl_nullable remainder);

  Bignum& operator+=(const Bignum& b);
  Bignum& operator-=(const Bignum& b);
  Bignum& operator*=(const Bignum& b);
  Bignum& operator/=(const Bignum& b);
  Bignum& operator%=(const Bignum& b);
  Bignum& operator<<=(int nbit);
  Bignum& operator>>=(int nbit);

  friend Bignum operator+(Bignum a, const Bignum& b) { return a += b; }
  friend Bignum operator-(Bignum a, const Bignum& b) { return a -= b; }
  friend Bignum operator*(Bignum a, const Bignum& b) { return a *= b; }
  friend Bignum operator/(Bignum a, const Bignum& b) { return a /= b; }
  friend Bignum operator%(Bignum a, const Bignum& b) { return a %= b; }
  friend Bignum operator<<(Bignum a, int nbit) { return a <<= nbit; }
  friend Bignum operator>>(Bignum a, int nbit) { return a >>= nbit; }

 private:
  Bignum(BigitVector bigits, bool negative)
      : bigits_(std::move(bigits)), negative_(negative) {
    Trim();
  }

  // Removes high zero bigits and clears the sign of zero.
  void Trim() {
    while (!bigits_.empty() && bigits_.back() == 0) bigits_.pop_back();
    if (bigits_.empty()) negative_ = false;
  }

  // Magnitude, least significant bigit first. Never has a zero high bigit.
  BigitVector bigits_;
  bool negative_ = false;
};

////////////////////////////////////////////////////////////////////////////////
//                           Implementation Details
////////////////////////////////////////////////////////////////////////////////

template <typename T, typename>
Bignum::Bignum(T value) {
  using UT = std::make_unsigned_t<T>;
  UT mag = static_cast<UT>(value);
  if constexpr (std::is_signed_v<T>) {
    if (value < 0) {
      negative_ = true;
      mag = UT(0) - mag;
    }
  }
  if constexpr (std::numeric_limits<UT>::digits <= kBigitBits) {
    if (mag != 0) bigits_.push_back(static_cast<Bigit>(mag));
  } else {
    for (; mag != 0; mag >>= kBigitBits) {
      bigits_.push_back(static_cast<Bigit>(mag));
    }
  }
}

template <typename T, typename>
T Bignum::Cast() const {
  using UT = std::make_unsigned_t<T>;
  constexpr int kUnsignedDigits = std::numeric_limits<UT>::digits;
  UT bits = 0;
  for (int i = 0; i * kBigitBits < kUnsignedDigits &&
                  i < static_cast<int>(bigits_.size());
       ++i) {
    bits |= static_cast<UT>(bigits_[i]) << (i * kBigitBits);
  }
  if (negative_) bits = UT(0) - bits;
  return static_cast<T>(bits);
}

}  // namespace bigreal_internal

#endif  // BIGREAL_BIGNUM_H_
