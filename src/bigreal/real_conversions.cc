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

// Conversions between Real and doubles, integers and decimal strings.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "absl/log/absl_check.h"
#include "absl/numeric/bits.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "bigreal/bignum.h"
#include "bigreal/real.h"
#include "bigreal/util/status_macros.h"

namespace bigreal {

namespace {

bool AllDigits(absl::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return absl::ascii_isdigit(static_cast<unsigned char>(c));
  });
}

absl::Status ParseError(absl::string_view str, absl::string_view reason) {
  return absl::InvalidArgumentError(absl::StrCat(
      "Invalid decimal literal \"", absl::CHexEscape(str), "\": ", reason));
}

// Decimal exponents up to this magnitude are converted with exact integer
// arithmetic.  Beyond it the powers of ten are too large to build exactly,
// and the conversions work with a rounded power instead.
constexpr int64_t kMaxExactDecimalExponent = 1 << 16;

// The same limit for binary exponents when formatting.
constexpr int64_t kMaxExactBinaryExponent = 1 << 16;

int BitWidth(int64_t n) {
  return static_cast<int>(
      absl::bit_width(n < 0 ? -static_cast<uint64_t>(n) : n));
}

// Returns 10**n for n >= 0.
Bignum PowerOfTen(int n) { return Bignum(10).Pow(n); }

// A positive number m * 2**e with 1 <= m < 2.  The exponent is not limited
// to the range of a Real.
struct ScaledReal {
  Real m;
  int64_t e = 0;
};

ScaledReal Scale(const Real& x, int64_t e) {
  const int64_t k = ilogb(x);
  return ScaledReal{ldexp(x, -k), e + k};
}

ScaledReal MultiplyScaled(const ScaledReal& a, const ScaledReal& b) {
  return Scale(a.m * b.m, a.e + b.e);
}

// Returns 10**n to `precision` bits, less about bit_width(|n|) bits lost to
// truncation in the repeated squaring.
ScaledReal ScaledPowerOfTen(int64_t n, int precision) {
  const uint64_t magnitude = n < 0 ? -static_cast<uint64_t>(n) : n;
  ScaledReal base = Scale(Real(10).WithPrecision(precision), 0);
  ScaledReal result = Scale(Real(1).WithPrecision(precision), 0);
  for (uint64_t k = magnitude; k != 0; k >>= 1) {
    if (k & 1) result = MultiplyScaled(result, base);
    if (k > 1) base = MultiplyScaled(base, base);
  }
  if (n < 0) {
    // 1 / (m * 2**e) == (1 / m) * 2**-e.
    result = Scale(Real(1).WithPrecision(precision) / result.m, -result.e);
  }
  return result;
}

}  // namespace

absl::StatusOr<Real> Real::FromDouble(double value, int precision) {
  if (!std::isfinite(value)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot convert ", value, " to a Real"));
  }
  if (value == 0) return FromParts(Bignum(0), 0, precision);
  // frexp() returns a mantissa in [0.5, 1), so scaling it by 2**53 yields an
  // integer that fits exactly in an int64_t.
  int exp;
  const double mantissa = std::frexp(value, &exp);
  const auto m = static_cast<int64_t>(
      std::ldexp(mantissa, std::numeric_limits<double>::digits));
  return FromParts(Bignum(m), exp - std::numeric_limits<double>::digits,
                   precision);
}

absl::StatusOr<Real> Real::FromString(absl::string_view str, int precision) {
  if (absl::Status status = CheckPrecision(precision); !status.ok()) {
    return status;
  }
  absl::string_view s = str;
  bool negative = false;
  if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
    negative = (s[0] == '-');
    s.remove_prefix(1);
  }

  // Split into "int.frac" and the optional exponent.
  const size_t exp_pos = s.find_first_of("eE");
  const absl::string_view mantissa = s.substr(0, exp_pos);
  const size_t point = mantissa.find('.');
  const absl::string_view int_digits = mantissa.substr(0, point);
  const absl::string_view frac_digits =
      point == absl::string_view::npos ? absl::string_view()
                                       : mantissa.substr(point + 1);
  if (int_digits.empty() && frac_digits.empty()) {
    return ParseError(str, "no digits");
  }
  if (!AllDigits(int_digits) || !AllDigits(frac_digits)) {
    return ParseError(str, "unexpected character");
  }

  int64_t exp10 = 0;
  if (exp_pos != absl::string_view::npos) {
    const absl::string_view exp_text = s.substr(exp_pos + 1);
    absl::string_view exp_digits = exp_text;
    if (!exp_digits.empty() && (exp_digits[0] == '+' || exp_digits[0] == '-')) {
      exp_digits.remove_prefix(1);
    }
    if (exp_digits.empty() || !AllDigits(exp_digits)) {
      return ParseError(str, "malformed exponent");
    }
    if (!absl::SimpleAtoi(exp_text, &exp10) ||
        std::abs(exp10) > kMaxDecimalExponent) {
      return absl::OutOfRangeError(
          absl::StrCat("Exponent of decimal literal \"", absl::CHexEscape(str),
                       "\" is out of range"));
    }
  }
  // The literal is now digits * 10**exp10.
  exp10 -= static_cast<int64_t>(frac_digits.size());
  std::optional<Bignum> digits =
      Bignum::FromString(absl::StrCat(int_digits, frac_digits));
  if (!digits.has_value()) return ParseError(str, "invalid digits");
  if (digits->is_zero()) return FromParts(Bignum(0), 0, precision);
  if (std::abs(exp10) > kMaxDecimalExponent + int64_t{kMaxPrecision}) {
    return absl::OutOfRangeError(
        absl::StrCat("Exponent of decimal literal \"", absl::CHexEscape(str),
                     "\" is out of range"));
  }

  if (std::abs(exp10) > kMaxExactDecimalExponent) {
    // digits * 10**exp10 with the power of ten rounded to enough bits to
    // cover both the precision and the error of computing it.
    const int wp = static_cast<int>(std::min<int64_t>(
        kMaxPrecision, int64_t{precision} + kParseGuardBits + BitWidth(exp10)));
    const ScaledReal power = ScaledPowerOfTen(exp10, wp);
    BIGREAL_ASSIGN_OR_RETURN(Real value, FromBignum(*std::move(digits), wp));
    value = value * power.m;
    Bignum coefficient = value.coefficient();
    coefficient.set_negative(negative);
    return FromParts(std::move(coefficient), value.exponent() + power.e,
                     precision);
  }

  Bignum coefficient;
  int64_t exponent;
  if (exp10 >= 0) {
    // digits * 10**k == (digits * 5**k) * 2**k, exactly.
    coefficient = *std::move(digits) * Bignum(5).Pow(static_cast<int>(exp10));
    exponent = exp10;
  } else {
    // digits / 10**m == (digits * 2**s / 5**m) * 2**(-m-s).  The shift s is
    // chosen so that the integer quotient carries kParseGuardBits more bits
    // than the precision.
    const int m = static_cast<int>(-exp10);
    const Bignum pow5 = Bignum(5).Pow(m);
    const int shift = std::max(0, precision + kParseGuardBits +
                                      bit_width(pow5) - bit_width(*digits));
    coefficient = (*std::move(digits) << shift) / pow5;
    exponent = exp10 - shift;
  }
  coefficient.set_negative(negative);
  return FromParts(std::move(coefficient), exponent, precision);
}

absl::StatusOr<Real> Real::Create(const RealInput& input, int precision) {
  struct Visitor {
    absl::StatusOr<Real> operator()(const Bignum& value) const {
      return FromBignum(value, precision);
    }
    absl::StatusOr<Real> operator()(double value) const {
      return FromDouble(value, precision);
    }
    absl::StatusOr<Real> operator()(const std::string& value) const {
      return FromString(value, precision);
    }
    absl::StatusOr<Real> operator()(const RawParts& value) const {
      return FromParts(value.coefficient, value.exponent, precision);
    }
    int precision;
  };
  return std::visit(Visitor{precision}, input);
}

int Real::NumSignificantDigitsForPrecision(int precision) {
  return static_cast<int>(1 + std::ceil(precision * (M_LN2 / M_LN10)));
}

std::string Real::ToString() const {
  return ToStringWithMaxDigits(NumSignificantDigitsForPrecision(precision_));
}

std::string Real::ToStringWithMaxDigits(int max_digits) const {
  ABSL_DCHECK_GT(max_digits, 0);
  if (is_zero()) return "0";
  int64_t exp10;
  const std::string digits = GetDecimalDigits(max_digits, &exp10);
  std::string str;
  if (is_negative()) str.push_back('-');
  str.push_back(digits[0]);
  if (digits.size() > 1) {
    str.push_back('.');
    str.append(digits.begin() + 1, digits.end());
  }
  // "exp10" corresponds to a mantissa in [0.1, 1), whereas the formatted
  // mantissa is in [1, 10).
  absl::StrAppendFormat(&str, "e%+d", exp10 - 1);
  return str;
}

std::string Real::GetDecimalDigits(int max_digits, int64_t* exp10) const {
  ABSL_DCHECK(!is_zero());
  // Drop trailing zero bits to keep the integers below as small as possible.
  // The magnitude is then mantissa * 2**bin_exp.
  const int tz = countr_zero(coefficient_);
  const Bignum mantissa = abs(coefficient_) >> tz;
  const int64_t bin_exp = exponent_ + tz;

  // Choose a decimal scale so that q = mantissa * 2**bin_exp / 10**scale has
  // exactly max_digits digits.  The estimate from the binary exponent can be
  // off by one in either direction, which the loop below corrects.
  const int64_t top = bin_exp + bit_width(mantissa) - 1;
  int64_t scale =
      static_cast<int64_t>(std::floor(static_cast<double>(top) * M_LN2 /
                                      M_LN10)) -
      max_digits + 1;
  const Bignum lower = PowerOfTen(max_digits - 1);
  const Bignum upper = lower * Bignum(10);

  Bignum q;
  bool round_up = false;
  if (std::abs(top) <= kMaxExactBinaryExponent) {
    Bignum r, den;
    for (int iteration = 0;; ++iteration) {
      ABSL_CHECK_LT(iteration, 8) << "Decimal scale estimate did not converge";
      // 10**scale == 2**scale * 5**scale, so the quotient is
      // mantissa * 2**(bin_exp - scale) / 5**scale.
      const int64_t twos = bin_exp - scale;
      Bignum num = mantissa;
      den = Bignum(1);
      if (twos >= 0) {
        num <<= static_cast<int>(twos);
      } else {
        den <<= static_cast<int>(-twos);
      }
      if (scale <= 0) {
        num *= Bignum(5).Pow(static_cast<int>(-scale));
      } else {
        den *= Bignum(5).Pow(static_cast<int>(scale));
      }
      Bignum::DivMod(num, den, &q, &r);
      if (q >= upper) {
        ++scale;
      } else if (q < lower) {
        --scale;
      } else {
        break;
      }
    }
    // Round half to even, like printf().
    const int cmp = (r << 1).Compare(den);
    round_up = cmp > 0 || (cmp == 0 && q.is_odd());
  } else {
    // |x| / 10**scale, computed with a rounded power of ten.  The working
    // precision covers the digits, the bits of x, and the error of the power.
    const int64_t digit_bits =
        static_cast<int64_t>(std::ceil(max_digits * (M_LN10 / M_LN2)));
    const int wp = static_cast<int>(std::min<int64_t>(
        kMaxPrecision, std::max<int64_t>(precision_, digit_bits) +
                           kParseGuardBits + BitWidth(scale)));
    const Real m = ldexp(abs(*this), -top).WithPrecision(wp);
    for (int iteration = 0;; ++iteration) {
      ABSL_CHECK_LT(iteration, 8) << "Decimal scale estimate did not converge";
      const ScaledReal power = ScaledPowerOfTen(-scale, wp);
      const Real t = ldexp(m * power.m, top + power.e);
      // floor(2t); its low bit is the first bit of the fraction.
      const int64_t shift = -1 - t.exponent_;
      const Bignum twice = shift >= 0
                               ? t.coefficient_ >> static_cast<int>(shift)
                               : t.coefficient_ << static_cast<int>(-shift);
      q = twice >> 1;
      if (q >= upper) {
        ++scale;
      } else if (q < lower) {
        --scale;
      } else {
        // The quotient is inexact, so ties cannot be detected; round half up.
        round_up = twice.is_odd();
        break;
      }
    }
  }

  if (round_up) {
    q += Bignum(1);
    if (q == upper) {
      q = lower;
      ++scale;
    }
  }

  std::string digits = q.ToString();
  ABSL_DCHECK_EQ(digits.size(), static_cast<size_t>(max_digits));
  digits.erase(digits.find_last_not_of('0') + 1);
  *exp10 = scale + max_digits;
  return digits;
}

double Real::ToDouble() const {
  if (is_zero()) return 0.0;
  constexpr int kDoubleBits = std::numeric_limits<double>::digits;
  const int shift = std::max(0, bit_width(coefficient_) - kDoubleBits);
  const auto top = (abs(coefficient_) >> shift).Cast<int64_t>();
  // Beyond this range ldexp() overflows or underflows for any 53-bit integer.
  constexpr int64_t kMaxDoubleExp = 2200;
  const int64_t exp =
      std::clamp<int64_t>(exponent_ + shift, -kMaxDoubleExp, kMaxDoubleExp);
  const double result = std::ldexp(static_cast<double>(top),
                                   static_cast<int>(exp));
  return is_negative() ? -result : result;
}

}  // namespace bigreal
