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

// Real is a binary floating-point number with a caller-selected precision.
// Each value is stored as
//
//     coefficient * (2 ** exponent)
//
// where the coefficient is a Bignum whose bit width always equals the
// precision of the value (zero is the exception; it is stored as 0 * 2**0).
// Results that need more bits than the precision allows are truncated toward
// zero, never rounded.  Truncation is fast but biased: a chain of operations
// drifts toward zero by up to one unit in the last place per step, so callers
// that need accurate results carry extra ("guard") bits and lower the
// precision only at the end.  The transcendental functions in real_math.h
// follow this discipline.
//
// The precision of the result of +, -, * and / is the smaller of the
// precisions of the operands, in the spirit of significant figures.
//
// Equality and ordering are tolerant: two values compare equal when they
// differ by at most kCompareEpsilon units in the last place of the finer of
// the two (see Compare() below).  This absorbs the noise that truncation
// introduces, so (1/3)*3 == 1 at any precision.
//
// Example:
//
//   Real third = *Divide(Real(1), Real(3));
//   std::cout << third;  // 3.3333...e-1, 79 significant digits.

#ifndef BIGREAL_REAL_H_
#define BIGREAL_REAL_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "bigreal/bignum.h"

namespace bigreal {

using bigreal_internal::Bignum;

// An explicit (coefficient, exponent) pair denoting coefficient * 2**exponent.
struct RawParts {
  Bignum coefficient;
  int64_t exponent = 0;
};

// The inputs a Real can be built from, resolved once by Real::Create().
// A std::string holds a decimal literal as accepted by Real::FromString().
using RealInput = std::variant<Bignum, double, std::string, RawParts>;

class Real {
 public:
  // Precision used when none is given.
  static constexpr int kDefaultPrecision = 256;

  // The largest supported precision, in bits.
  static constexpr int kMaxPrecision = 64 << 20;

  // Every non-zero value satisfies |ilogb(x)| <= kMaxExponent.  Operations
  // whose result would leave this range fail with an OUT_OF_RANGE status (or
  // a fatal error for the operator shorthands).  Keeping exponents this small
  // means that sums of two exponents and a precision never overflow an
  // int64_t.
  static constexpr int64_t kMaxExponent = int64_t{1} << 52;

  // Two values whose aligned difference is at most this many units of the
  // finer exponent compare equal.
  static constexpr int kCompareEpsilon = 4;

  // Extra bits used when converting a decimal string to binary.
  static constexpr int kParseGuardBits = 64;

  // Decimal exponents accepted by FromString() are limited to this magnitude,
  // which covers every value ToString() can produce.
  static constexpr int64_t kMaxDecimalExponent = kMaxExponent;

  // Zero at the default precision.
  Real() = default;

  // An integer at the default precision.
  explicit Real(int64_t value);

  // Factory methods.  All of them fail with INVALID_ARGUMENT unless
  // 1 <= precision <= kMaxPrecision.
  static absl::StatusOr<Real> FromInt(int64_t value,
                                      int precision = kDefaultPrecision);
  static absl::StatusOr<Real> FromBignum(Bignum value,
                                         int precision = kDefaultPrecision);

  // The exact binary value of a double, truncated to the precision.  NaN and
  // infinities are rejected with INVALID_ARGUMENT.
  static absl::StatusOr<Real> FromDouble(double value,
                                         int precision = kDefaultPrecision);

  // Parses a decimal literal of the form
  //
  //     [+-]digits[.digits][(e|E)[+-]digits]
  //
  // where either the integer or the fractional digits (but not both) may be
  // empty, e.g. "42", "-.5", "1.", "6.02214076e23".  Returns INVALID_ARGUMENT
  // for anything else, including empty strings and surrounding whitespace.
  static absl::StatusOr<Real> FromString(absl::string_view str,
                                         int precision = kDefaultPrecision);

  // coefficient * 2**exponent, truncated to the precision.
  static absl::StatusOr<Real> FromParts(Bignum coefficient, int64_t exponent,
                                        int precision = kDefaultPrecision);

  // Dispatches on the kind of input.
  static absl::StatusOr<Real> Create(const RealInput& input,
                                     int precision = kDefaultPrecision);

  // Returns true if `precision` is in the supported range.
  static bool IsValidPrecision(int precision) {
    return precision >= 1 && precision <= kMaxPrecision;
  }

  const Bignum& coefficient() const { return coefficient_; }
  int64_t exponent() const { return exponent_; }
  int precision() const { return precision_; }

  bool is_zero() const { return coefficient_.is_zero(); }
  bool is_negative() const { return coefficient_.is_negative(); }

  // Returns -1, 0 or +1.
  int sign() const { return coefficient_.sign(); }

  // Returns true if the value is an exact integer.
  bool is_integer() const;

  // Changes the precision in place, discarding low bits or zero-extending the
  // coefficient as needed.  Lowering and then raising the precision does not
  // restore the discarded bits.
  absl::Status set_precision(int precision);

  // Returns a copy with the given precision.
  //
  // REQUIRES: IsValidPrecision(precision)
  Real WithPrecision(int precision) const;

  // Returns the adjacent representable values at the same precision.  The
  // neighbors of zero are not representable (the exponent is unbounded), so
  // zero yields OUT_OF_RANGE.
  absl::StatusOr<Real> Next() const;
  absl::StatusOr<Real> Prev() const;

  // Scientific notation with enough significant digits to identify the value
  // at its precision, rounded half to even, with trailing zeros removed:
  // "1.5e+3", "-2e-7".  Zero is formatted as "0".
  std::string ToString() const;

  // The decimal form with at most `max_digits` significant digits.
  std::string ToStringWithMaxDigits(int max_digits) const;

  // Returns 1 + ceil(precision * log10(2)), the number of decimal digits that
  // ToString() uses for a value of the given precision.
  static int NumSignificantDigitsForPrecision(int precision);

  // The closest double below the value in magnitude.  Overflows to infinity
  // and underflows to zero.
  double ToDouble() const;

  // The integer part, truncated toward zero.  Returns OUT_OF_RANGE if the
  // exponent exceeds kMaxPrecision, which bounds the result to about
  // 2 * kMaxPrecision bits.
  absl::StatusOr<Bignum> ToBignum() const;

  Real operator-() const;

  friend std::ostream& operator<<(std::ostream& os, const Real& x) {
    return os << x.ToString();
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Real& x) {
    sink.Append(x.ToString());
  }

 private:
  friend int Compare(const Real& x, const Real& y);
  friend absl::StatusOr<Real> Add(const Real& x, const Real& y);
  friend absl::StatusOr<Real> Multiply(const Real& x, const Real& y);
  friend absl::StatusOr<Real> Divide(const Real& x, const Real& y);
  friend Real abs(const Real& x);
  friend Real floor(const Real& x);
  friend Real ceil(const Real& x);
  friend Real round(const Real& x);
  friend absl::StatusOr<Real> Ldexp(const Real& x, int64_t exp);

  // Returns INVALID_ARGUMENT unless IsValidPrecision(precision).
  static absl::Status CheckPrecision(int precision);

  // Builds a normalized value.  The precision must be valid.
  Real(Bignum coefficient, int64_t exponent, int precision);

  // Restores the invariant bit_width(coefficient_) == precision_ by shifting
  // the coefficient and compensating in the exponent.
  void Normalize();

  absl::StatusOr<Real> Step(int direction) const;

  // Returns the decimal digits of the value rounded to `max_digits`
  // significant digits, without trailing zeros, and sets *exp10 so that the
  // value is 0.DIGITS * 10**exp10.
  std::string GetDecimalDigits(int max_digits, int64_t* exp10) const;

  Bignum coefficient_;
  int64_t exponent_ = 0;
  int precision_ = kDefaultPrecision;
};

// Returns -1, 0 or +1.  Let D be the exact difference x - y expressed as an
// integer multiple of 2**min(x.exponent(), y.exponent()).  The values are
// equal when |D| <= kCompareEpsilon, otherwise the sign of D is returned.
// Zero is compared exactly: it equals only zero.
int Compare(const Real& x, const Real& y);

inline bool operator==(const Real& x, const Real& y) {
  return Compare(x, y) == 0;
}
inline bool operator!=(const Real& x, const Real& y) {
  return Compare(x, y) != 0;
}
inline bool operator<(const Real& x, const Real& y) {
  return Compare(x, y) < 0;
}
inline bool operator<=(const Real& x, const Real& y) {
  return Compare(x, y) <= 0;
}
inline bool operator>(const Real& x, const Real& y) {
  return Compare(x, y) > 0;
}
inline bool operator>=(const Real& x, const Real& y) {
  return Compare(x, y) >= 0;
}

// x + y, x - y and x * y.  Return OUT_OF_RANGE if the magnitude of the
// result is beyond 2**kMaxExponent or below 2**-kMaxExponent.
absl::StatusOr<Real> Add(const Real& x, const Real& y);
absl::StatusOr<Real> Subtract(const Real& x, const Real& y);
absl::StatusOr<Real> Multiply(const Real& x, const Real& y);

// Shorthands for Add(), Subtract() and Multiply() when the result is known
// to be in range.  Die otherwise.
Real operator+(const Real& x, const Real& y);
Real operator-(const Real& x, const Real& y);
Real operator*(const Real& x, const Real& y);

// x / y.  The quotient is computed with 2 * max(precision) + 1 extra bits,
// rounded toward negative infinity, and then truncated to the result
// precision.  Returns OUT_OF_RANGE if y is zero.
absl::StatusOr<Real> Divide(const Real& x, const Real& y);

// floor(x / y).  Returns OUT_OF_RANGE if y is zero.
absl::StatusOr<Real> FloorDivide(const Real& x, const Real& y);

// Shorthand for Divide() when y is known to be non-zero.  Dies otherwise.
Real operator/(const Real& x, const Real& y);

inline Real& operator+=(Real& x, const Real& y) { return x = x + y; }
inline Real& operator-=(Real& x, const Real& y) { return x = x - y; }
inline Real& operator*=(Real& x, const Real& y) { return x = x * y; }
inline Real& operator/=(Real& x, const Real& y) { return x = x / y; }

Real abs(const Real& x);

// Integer rounding.  The results keep the precision of x; since x has at most
// `precision` significant bits, so does its integer part.
Real floor(const Real& x);
Real ceil(const Real& x);

// Rounds half-way cases toward positive infinity, i.e. floor(x + 1/2), so
// round(2.5) == 3 and round(-2.5) == -2.
Real round(const Real& x);

// x * 2**exp, exactly.  Returns OUT_OF_RANGE if the result is out of range.
absl::StatusOr<Real> Ldexp(const Real& x, int64_t exp);

// Shorthand for Ldexp() when the result is known to be in range.  Dies
// otherwise.
Real ldexp(const Real& x, int64_t exp);

// floor(log2(|x|)).
//
// REQUIRES: !x.is_zero()
int64_t ilogb(const Real& x);

}  // namespace bigreal

#endif  // BIGREAL_REAL_H_
