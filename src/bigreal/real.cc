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

#include "bigreal/real.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include "absl/log/absl_check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "bigreal/bignum.h"

namespace bigreal {

namespace {

// Returns floor(c / 2**shift), i.e. an arithmetic right shift.  Bignum shifts
// truncate the magnitude, so negative values that lose set bits need one more
// step down.
Bignum FloorShiftRight(const Bignum& c, int64_t shift) {
  // Shifting past the top bit gives the same answer for any larger shift.
  const int s = static_cast<int>(std::min<int64_t>(shift, bit_width(c) + 1));
  Bignum result = c >> s;
  if (c.is_negative() && countr_zero(c) < s) result -= Bignum(1);
  return result;
}

}  // namespace

Real::Real(int64_t value) : Real(Bignum(value), 0, kDefaultPrecision) {}

absl::Status Real::CheckPrecision(int precision) {
  if (!IsValidPrecision(precision)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Real precision must be in [1, ", kMaxPrecision, "], got ", precision));
  }
  return absl::OkStatus();
}

Real::Real(Bignum coefficient, int64_t exponent, int precision)
    : coefficient_(std::move(coefficient)),
      exponent_(exponent),
      precision_(precision) {
  ABSL_DCHECK(IsValidPrecision(precision_));
  Normalize();
}

void Real::Normalize() {
  if (coefficient_.is_zero()) {
    exponent_ = 0;
    return;
  }
  const int excess = bit_width(coefficient_) - precision_;
  if (excess > 0) {
    coefficient_ >>= excess;
  } else if (excess < 0) {
    coefficient_ <<= -excess;
  }
  exponent_ += excess;
  // Shifting keeps the leading bit in place, so ilogb() is unchanged.
  ABSL_DCHECK_LE(std::abs(ilogb(*this)), kMaxExponent);
}

absl::StatusOr<Real> Real::FromInt(int64_t value, int precision) {
  return FromParts(Bignum(value), 0, precision);
}

absl::StatusOr<Real> Real::FromBignum(Bignum value, int precision) {
  return FromParts(std::move(value), 0, precision);
}

absl::StatusOr<Real> Real::FromParts(Bignum coefficient, int64_t exponent,
                                     int precision) {
  if (absl::Status status = CheckPrecision(precision); !status.ok()) {
    return status;
  }
  if (coefficient.is_zero()) return Real(Bignum(0), 0, precision);
  // No coefficient is wide enough to bring an exponent this large back into
  // range, and rejecting it first keeps the sum below from overflowing.
  if (exponent > 2 * kMaxExponent || exponent < -2 * kMaxExponent) {
    return absl::OutOfRangeError(
        absl::StrCat("Real exponent ", exponent, " is out of range"));
  }
  const int64_t top = exponent + bit_width(coefficient) - 1;
  if (std::abs(top) > kMaxExponent) {
    return absl::OutOfRangeError(
        absl::StrCat("Real magnitude 2**", top, " is out of range"));
  }
  return Real(std::move(coefficient), exponent, precision);
}

bool Real::is_integer() const {
  return exponent_ >= 0 || countr_zero(coefficient_) >= -exponent_ ||
         is_zero();
}

absl::Status Real::set_precision(int precision) {
  if (absl::Status status = CheckPrecision(precision); !status.ok()) {
    return status;
  }
  precision_ = precision;
  Normalize();
  return absl::OkStatus();
}

Real Real::WithPrecision(int precision) const {
  return Real(coefficient_, exponent_, precision);
}

absl::StatusOr<Real> Real::Step(int direction) const {
  if (is_zero()) {
    return absl::OutOfRangeError("Zero has no adjacent representable value");
  }
  Bignum c = coefficient_;
  int64_t e = exponent_;
  // When the magnitude shrinks from an exact power of two the neighbor lies in
  // the next binade down, where the spacing is half as large.
  if (c.sign() != direction && countr_zero(c) == precision_ - 1) {
    c <<= 1;
    --e;
  }
  c += Bignum(direction);
  return FromParts(std::move(c), e, precision_);
}

absl::StatusOr<Real> Real::Next() const { return Step(+1); }

absl::StatusOr<Real> Real::Prev() const { return Step(-1); }

absl::StatusOr<Bignum> Real::ToBignum() const {
  if (exponent_ >= 0) {
    if (exponent_ > kMaxPrecision) {
      return absl::OutOfRangeError(absl::StrCat(
          "Integer part of a value of magnitude 2**", ilogb(*this),
          " is too large for a Bignum"));
    }
    return coefficient_ << static_cast<int>(exponent_);
  }
  if (-exponent_ >= bit_width(coefficient_)) return Bignum(0);
  return coefficient_ >> static_cast<int>(-exponent_);
}

Real Real::operator-() const {
  Real result = *this;
  result.coefficient_.negate();
  return result;
}

int Compare(const Real& x, const Real& y) {
  if (x.is_zero() || y.is_zero()) {
    // Zero has no unit in the last place to be tolerant about.
    return (x.sign() > y.sign()) - (x.sign() < y.sign());
  }

  // Scale the operand with the larger exponent so that both coefficients are
  // multiples of the same unit.
  const bool x_coarser = x.exponent_ >= y.exponent_;
  const Real& coarse = x_coarser ? x : y;
  const Real& fine = x_coarser ? y : x;
  const int64_t gap = coarse.exponent_ - fine.exponent_;

  // Once the gap reaches the width of the finer coefficient plus 3 bits, the
  // scaled coefficient is over 8 times larger in magnitude, so it decides the
  // sign and the difference is well outside the tolerance.
  int sign;
  if (gap >= bit_width(fine.coefficient_) + 3) {
    sign = coarse.sign();
  } else {
    const Bignum diff =
        (coarse.coefficient_ << static_cast<int>(gap)) - fine.coefficient_;
    if (abs(diff) <= Bignum(Real::kCompareEpsilon)) return 0;
    sign = diff.sign();
  }
  return x_coarser ? sign : -sign;
}

absl::StatusOr<Real> Add(const Real& x, const Real& y) {
  const int precision = std::min(x.precision_, y.precision_);
  if (x.is_zero()) return y.WithPrecision(precision);
  if (y.is_zero()) return x.WithPrecision(precision);

  const bool x_coarser = x.exponent_ >= y.exponent_;
  const Real& coarse = x_coarser ? x : y;
  const Real& fine = x_coarser ? y : x;
  const int64_t gap = coarse.exponent_ - fine.exponent_;

  // If the finer operand lies entirely below half a unit of the coarser
  // exponent, it can only influence the truncated sum through its sign.
  // Replacing it with a quarter unit of the same sign gives the same result
  // and avoids shifting by an arbitrarily large gap.  This needs the coarser
  // coefficient to have at least `precision` bits, which normalization
  // guarantees.
  if (gap >= bit_width(fine.coefficient_) + 2) {
    Bignum sum = (coarse.coefficient_ << 2) + Bignum(fine.sign());
    return Real::FromParts(std::move(sum), coarse.exponent_ - 2, precision);
  }
  Bignum sum =
      (coarse.coefficient_ << static_cast<int>(gap)) + fine.coefficient_;
  return Real::FromParts(std::move(sum), fine.exponent_, precision);
}

absl::StatusOr<Real> Subtract(const Real& x, const Real& y) {
  return Add(x, -y);
}

absl::StatusOr<Real> Multiply(const Real& x, const Real& y) {
  return Real::FromParts(x.coefficient_ * y.coefficient_,
                         x.exponent_ + y.exponent_,
                         std::min(x.precision_, y.precision_));
}

Real operator+(const Real& x, const Real& y) {
  absl::StatusOr<Real> sum = Add(x, y);
  ABSL_CHECK_OK(sum.status());
  return *std::move(sum);
}

Real operator-(const Real& x, const Real& y) {
  absl::StatusOr<Real> difference = Subtract(x, y);
  ABSL_CHECK_OK(difference.status());
  return *std::move(difference);
}

Real operator*(const Real& x, const Real& y) {
  absl::StatusOr<Real> product = Multiply(x, y);
  ABSL_CHECK_OK(product.status());
  return *std::move(product);
}

absl::StatusOr<Real> Divide(const Real& x, const Real& y) {
  if (y.is_zero()) {
    return absl::OutOfRangeError("Division by zero");
  }
  const int precision = std::min(x.precision_, y.precision_);
  const int extra = 2 * std::max(x.precision_, y.precision_) + 1;

  Bignum quotient, remainder;
  Bignum::DivMod(x.coefficient_ << extra, y.coefficient_, &quotient,
                 &remainder);
  // DivMod truncates; step down to the floor when the exact quotient is
  // negative and inexact.
  if (!remainder.is_zero() && x.is_negative() != y.is_negative()) {
    quotient -= Bignum(1);
  }
  return Real::FromParts(std::move(quotient),
                         x.exponent_ - y.exponent_ - extra, precision);
}

absl::StatusOr<Real> FloorDivide(const Real& x, const Real& y) {
  absl::StatusOr<Real> quotient = Divide(x, y);
  if (!quotient.ok()) return quotient.status();
  return floor(*quotient);
}

Real operator/(const Real& x, const Real& y) {
  absl::StatusOr<Real> quotient = Divide(x, y);
  ABSL_CHECK_OK(quotient.status());
  return *std::move(quotient);
}

Real abs(const Real& x) {
  Real result = x;
  result.coefficient_.set_negative(false);
  return result;
}

Real floor(const Real& x) {
  if (x.exponent_ >= 0) return x;
  if (x.is_negative()) return -ceil(-x);
  return Real(FloorShiftRight(x.coefficient_, -x.exponent_), 0, x.precision_);
}

Real ceil(const Real& x) {
  if (x.exponent_ >= 0) return x;
  if (x.is_negative()) return -floor(-x);
  Bignum result = FloorShiftRight(x.coefficient_, -x.exponent_);
  if (countr_zero(x.coefficient_) < -x.exponent_) result += Bignum(1);
  return Real(std::move(result), 0, x.precision_);
}

Real round(const Real& x) {
  if (x.exponent_ >= 0) return x;
  // floor(x + 1/2) = floor(floor(2x) / 2) + (floor(2x) is odd), computed with
  // arithmetic shifts so ties go toward positive infinity for either sign.
  Bignum twice = FloorShiftRight(x.coefficient_, -x.exponent_ - 1);
  if (twice.is_odd()) twice += Bignum(1);
  return Real(FloorShiftRight(twice, 1), 0, x.precision_);
}

absl::StatusOr<Real> Ldexp(const Real& x, int64_t exp) {
  if (x.is_zero()) return x;
  // Keeps the sum below from overflowing; such shifts are out of range for
  // every non-zero value anyway.
  if (exp > 2 * Real::kMaxExponent || exp < -2 * Real::kMaxExponent) {
    return absl::OutOfRangeError(
        absl::StrCat("Ldexp() shift ", exp, " is out of range"));
  }
  return Real::FromParts(x.coefficient_, x.exponent_ + exp, x.precision_);
}

Real ldexp(const Real& x, int64_t exp) {
  absl::StatusOr<Real> result = Ldexp(x, exp);
  ABSL_CHECK_OK(result.status());
  return *std::move(result);
}

int64_t ilogb(const Real& x) {
  ABSL_DCHECK(!x.is_zero());
  return x.exponent() + bit_width(x.coefficient()) - 1;
}

}  // namespace bigreal
