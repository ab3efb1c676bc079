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

#include "bigreal/real_math.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"
#include "absl/numeric/bits.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "bigreal/bignum.h"
#include "bigreal/real.h"
#include "bigreal/real_constants.h"
#include "bigreal/util/status_macros.h"

ABSL_FLAG(int32_t, bigreal_guard_bits, 32,
          "Extra bits of precision carried by the bigreal transcendental "
          "functions");

namespace bigreal {

MathOptions::MathOptions()
    : guard_bits_(std::max(0, absl::GetFlag(FLAGS_bigreal_guard_bits))),
      constants_(&RealConstants::Default()) {}

void MathOptions::set_guard_bits(int guard_bits) {
  ABSL_DCHECK_GE(guard_bits, 0);
  guard_bits_ = guard_bits;
}

void MathOptions::set_max_iterations(int max_iterations) {
  ABSL_DCHECK_GE(max_iterations, 0);
  max_iterations_ = max_iterations;
}

void MathOptions::set_constants(RealConstants* constants) {
  ABSL_DCHECK(constants != nullptr);
  constants_ = constants;
}

namespace {

// Returns precision + extra, clamped to the supported range.
int WorkingPrecision(int precision, int64_t extra) {
  return static_cast<int>(
      std::clamp<int64_t>(int64_t{precision} + extra, 1, Real::kMaxPrecision));
}

int BitWidth(uint64_t n) { return static_cast<int>(absl::bit_width(n)); }

int IterationLimit(const MathOptions& options, int precision) {
  if (options.max_iterations() > 0) return options.max_iterations();
  return 2 * precision + 64;
}

absl::Status ConvergenceError(absl::string_view function, const Real& x,
                              int iterations) {
  ABSL_LOG(WARNING) << function << "(" << x << ") did not converge after "
                    << iterations << " iterations";
  return absl::InternalError(absl::StrCat(
      function, " did not converge after ", iterations, " iterations"));
}

absl::Status DomainError(absl::string_view function, const Real& x) {
  return absl::OutOfRangeError(absl::StrCat(function, " is undefined for ",
                                            x.ToStringWithMaxDigits(20)));
}

// An integer at the given precision.
Real Integer(int64_t value, int precision) {
  absl::StatusOr<Real> result = Real::FromInt(value, precision);
  ABSL_DCHECK_OK(result.status());
  return *std::move(result);
}

// Returns x**n by repeated squaring, at the precision of x.
Real IntegerPower(const Real& x, uint64_t n) {
  Real result = Integer(1, x.precision());
  Real base = x;
  for (; n != 0; n >>= 1) {
    if (n & 1) result *= base;
    if (n > 1) base *= base;
  }
  return result;
}

// Returns an approximation of x**(1/n) accurate to nearly double precision,
// as a starting point for Newton's method.  Requires x > 0.
absl::StatusOr<Real> RootEstimate(const Real& x, int n, int precision) {
  // x = m * 2**e with m in [1, 2), and e = q*n + r with 0 <= r < n, so
  // x**(1/n) = m**(1/n) * 2**(r/n) * 2**q.
  const int64_t e = ilogb(x);
  int64_t q = e / n;
  int64_t r = e % n;
  if (r < 0) {
    r += n;
    --q;
  }
  const double m = ldexp(x, -e).ToDouble();
  const double estimate =
      std::pow(m, 1.0 / n) * std::exp2(static_cast<double>(r) / n);
  BIGREAL_ASSIGN_OR_RETURN(Real y, Real::FromDouble(estimate, precision));
  return ldexp(y, q);
}

// Sums the Taylor series of sin(r) (odd = true) or cos(r) (odd = false) at
// the precision of r.  Requires |r| < 1.
absl::StatusOr<Real> SinCosSeries(const Real& r, bool odd,
                                  const MathOptions& options) {
  const int wp = r.precision();
  if (odd && r.is_zero()) return r;
  const Real r2 = r * r;
  Real term = odd ? r : Integer(1, wp);
  Real sum = term;
  // |sin r| > |r| / 2 and cos r > 1/2 on this interval, so terms below
  // these thresholds no longer affect the result.
  const int64_t threshold = (odd ? ilogb(r) : 0) - wp - 1;
  const int limit = IterationLimit(options, wp);
  for (int64_t i = odd ? 2 : 1, n = 0;; i += 2, ++n) {
    if (n >= limit) return ConvergenceError(odd ? "Sin" : "Cos", r, limit);
    term = -(term * r2 / Integer(i * (i + 1), wp));
    if (term.is_zero() || ilogb(term) < threshold) break;
    sum += term;
  }
  return sum;
}

struct ReducedAngle {
  Real r;        // The remainder, with |r| < 1.
  int quadrant;  // The number of quarter turns, modulo 4.
};

// Writes x = q * (pi/2) + r with q = round(x / (pi/2)).  The result carries
// the working precision of x.
absl::StatusOr<ReducedAngle> ReduceQuarterTurns(const Real& x,
                                                const MathOptions& options) {
  const int wp = x.precision();
  if (x.is_zero() || ilogb(x) < 0) return ReducedAngle{x, 0};
  // Subtracting q * (pi/2) cancels the leading bits of x, so pi needs as
  // many extra bits as the integer part of the quotient.
  if (ilogb(x) > Real::kMaxPrecision) {
    return absl::OutOfRangeError(
        absl::StrCat("Argument too large for trigonometric reduction: 2**",
                     ilogb(x)));
  }
  const int rp = WorkingPrecision(wp, ilogb(x) + 2);
  BIGREAL_ASSIGN_OR_RETURN(Real pi, options.constants()->pi().Get(rp));
  const Real half_pi = ldexp(pi, -1);
  const Real xr = x.WithPrecision(rp);
  BIGREAL_ASSIGN_OR_RETURN(const Bignum q, round(xr / half_pi).ToBignum());
  BIGREAL_ASSIGN_OR_RETURN(Real q_real, Real::FromBignum(q, rp));
  const Real r = xr - q_real * half_pi;
  Bignum quadrant = q % Bignum(4);
  if (quadrant.is_negative()) quadrant += Bignum(4);
  return ReducedAngle{r.WithPrecision(wp), quadrant.Cast<int>()};
}

}  // namespace

absl::StatusOr<Real> Log(const Real& x, const MathOptions& options) {
  if (x.sign() <= 0) return DomainError("Log", x);
  const int p = x.precision();
  const int wp = WorkingPrecision(p, options.guard_bits());

  // x = m * 2**k with m in [0.75, 1.5), so that u = m - 1 is in
  // [-0.25, 0.5) and the series below converges by at least one bit per
  // term.
  int64_t k = ilogb(x);
  Real m = ldexp(x.WithPrecision(wp), -k);
  // m >= 1.5 exactly when the bit after the leading one is set.
  if (wp >= 2 && m.coefficient().is_bit_set(wp - 2)) {
    m = ldexp(m, -1);
    ++k;
  }
  const Real u = m - Integer(1, wp);

  // ln(1 + u) = u - u**2/2 + u**3/3 - ...
  Real sum = u;
  if (!u.is_zero()) {
    const int64_t threshold = ilogb(u) - wp - 1;
    const int limit = IterationLimit(options, wp);
    Real power = u;
    for (int n = 2;; ++n) {
      if (n - 1 > limit) return ConvergenceError("Log", x, limit);
      power *= u;
      const Real term = power / Integer(n, wp);
      if (term.is_zero() || ilogb(term) < threshold) break;
      if (n % 2 == 0) {
        sum -= term;
      } else {
        sum += term;
      }
    }
  }

  if (k != 0) {
    // k * ln2 needs ln2 with as many extra bits as k has.
    const int lp = WorkingPrecision(wp, BitWidth(std::abs(k)));
    BIGREAL_ASSIGN_OR_RETURN(Real ln2, options.constants()->ln2().Get(lp));
    sum = sum.WithPrecision(lp) + Integer(k, lp) * ln2;
  }
  return sum.WithPrecision(p);
}

absl::StatusOr<Real> Exp(const Real& x, const MathOptions& options) {
  const int p = x.precision();
  if (x.is_zero()) return Integer(1, p);
  // |x| >= 2**54 gives a binary exponent beyond kMaxExponent.
  constexpr int kMaxLog2Argument = 54;
  if (ilogb(x) >= kMaxLog2Argument) {
    return absl::OutOfRangeError(
        absl::StrCat("Exp(", x.ToStringWithMaxDigits(20), ") is out of range"));
  }
  const int wp = WorkingPrecision(p, options.guard_bits());

  // x = n * ln2 + r with n = round(x / ln2) and |r| <= ln2 / 2.  Computing
  // r cancels the leading bits of x, which the extra bits of rp make up for.
  const int rp = WorkingPrecision(wp, std::max<int64_t>(ilogb(x), 0) + 2);
  BIGREAL_ASSIGN_OR_RETURN(Real ln2, options.constants()->ln2().Get(rp));
  const Real xr = x.WithPrecision(rp);
  BIGREAL_ASSIGN_OR_RETURN(const Bignum n_bignum, round(xr / ln2).ToBignum());
  const int64_t n = n_bignum.Cast<int64_t>();
  if (std::abs(n) > Real::kMaxExponent - 2 * int64_t{Real::kMaxPrecision}) {
    return absl::OutOfRangeError(
        absl::StrCat("Exp(", x.ToStringWithMaxDigits(20), ") is out of range"));
  }
  const Real r = xr - Integer(n, rp) * ln2;

  // exp(r) = exp(r / 2**s) ** (2**s).  Halving the argument s times makes
  // the series converge faster; each squaring costs one bit, which the
  // precision makes up for.
  const int s = static_cast<int>(std::sqrt(static_cast<double>(wp)));
  const int sp = WorkingPrecision(wp, s);
  const Real t = ldexp(r.WithPrecision(sp), -s);

  // exp(t) = 1 + t + t**2/2! + ...
  Real sum = Integer(1, sp);
  Real term = sum;
  const int limit = IterationLimit(options, sp);
  for (int i = 1;; ++i) {
    if (i > limit) return ConvergenceError("Exp", x, limit);
    term = term * t / Integer(i, sp);
    if (term.is_zero() || ilogb(term) < -sp - 1) break;
    sum += term;
  }
  for (int i = 0; i < s; ++i) sum *= sum;
  BIGREAL_ASSIGN_OR_RETURN(Real result, Ldexp(sum, n));
  return result.WithPrecision(p);
}

absl::StatusOr<Real> Sqrt(const Real& x, const MathOptions& options) {
  if (x.is_negative()) return DomainError("Sqrt", x);
  if (x.is_zero()) return x;
  const int p = x.precision();
  const int wp = WorkingPrecision(p, options.guard_bits());
  const Real xw = x.WithPrecision(wp);

  // Newton's method: y' = (y + x/y) / 2.
  BIGREAL_ASSIGN_OR_RETURN(Real y, RootEstimate(xw, 2, wp));
  const int limit = IterationLimit(options, wp);
  for (int i = 0;; ++i) {
    if (i >= limit) return ConvergenceError("Sqrt", x, limit);
    Real next = ldexp(y + xw / y, -1);
    const bool converged = (next == y);
    y = std::move(next);
    if (converged) break;
  }
  return y.WithPrecision(p);
}

absl::StatusOr<Real> Root(const Real& x, int n, const MathOptions& options) {
  if (n <= 0) {
    return absl::OutOfRangeError(absl::StrCat("Root of degree ", n));
  }
  if (x.is_negative()) {
    if (n % 2 == 0) return DomainError(absl::StrCat("Root(x, ", n, ")"), x);
    BIGREAL_ASSIGN_OR_RETURN(Real root, Root(-x, n, options));
    return -root;
  }
  if (x.is_zero() || n == 1) return x;
  const int p = x.precision();
  const int wp = WorkingPrecision(p, options.guard_bits() + BitWidth(n));
  const Real xw = x.WithPrecision(wp);
  const Real degree = Integer(n, wp);
  const Real degree_minus_one = Integer(n - 1, wp);

  // Newton's method: y' = ((n-1) y + x / y**(n-1)) / n.
  BIGREAL_ASSIGN_OR_RETURN(Real y, RootEstimate(xw, n, wp));
  const int limit = IterationLimit(options, wp);
  for (int i = 0;; ++i) {
    if (i >= limit) return ConvergenceError("Root", x, limit);
    Real next =
        (degree_minus_one * y + xw / IntegerPower(y, n - 1)) / degree;
    const bool converged = (next == y);
    y = std::move(next);
    if (converged) break;
  }
  return y.WithPrecision(p);
}

absl::StatusOr<Real> Sin(const Real& x, const MathOptions& options) {
  if (x.is_zero()) return x;
  const int p = x.precision();
  const int wp = WorkingPrecision(p, options.guard_bits());
  BIGREAL_ASSIGN_OR_RETURN(ReducedAngle a,
                           ReduceQuarterTurns(x.WithPrecision(wp), options));
  BIGREAL_ASSIGN_OR_RETURN(Real result,
                           SinCosSeries(a.r, a.quadrant % 2 == 0, options));
  if (a.quadrant >= 2) result = -result;
  return result.WithPrecision(p);
}

absl::StatusOr<Real> Cos(const Real& x, const MathOptions& options) {
  const int p = x.precision();
  const int wp = WorkingPrecision(p, options.guard_bits());
  BIGREAL_ASSIGN_OR_RETURN(ReducedAngle a,
                           ReduceQuarterTurns(x.WithPrecision(wp), options));
  BIGREAL_ASSIGN_OR_RETURN(Real result,
                           SinCosSeries(a.r, a.quadrant % 2 == 1, options));
  if (a.quadrant == 1 || a.quadrant == 2) result = -result;
  return result.WithPrecision(p);
}

absl::StatusOr<Real> Pow(const Real& x, const Real& y,
                         const MathOptions& options) {
  const int p = std::min(x.precision(), y.precision());
  if (y.is_zero()) return Integer(1, p);
  if (x.is_zero()) {
    if (y.is_negative()) return DomainError("Pow(0, y)", y);
    return x.WithPrecision(p);
  }

  if (y.is_integer()) {
    // Exponents this large overflow unless |x| is exactly 1.
    constexpr int kMaxExponentBits = 62;
    if (ilogb(y) >= kMaxExponentBits) {
      if (ilogb(x) == 0 &&
          countr_zero(x.coefficient()) == x.precision() - 1) {
        const bool odd =
            y.exponent() <= 0 &&
            y.coefficient().is_bit_set(static_cast<int>(-y.exponent()));
        return Integer(x.is_negative() && odd ? -1 : 1, p);
      }
      return absl::OutOfRangeError("Pow() exponent is out of range");
    }
    BIGREAL_ASSIGN_OR_RETURN(const Bignum y_bignum, y.ToBignum());
    const int64_t n = y_bignum.Cast<int64_t>();
    const uint64_t magnitude = n < 0 ? -static_cast<uint64_t>(n) : n;
    // The result exponent is about n * ilogb(x).
    const double log2_result =
        std::max(std::abs(static_cast<double>(ilogb(x))),
                 std::abs(ilogb(x) + 1.0)) *
        static_cast<double>(magnitude);
    if (log2_result > static_cast<double>(Real::kMaxExponent / 2)) {
      return absl::OutOfRangeError("Pow() result is out of range");
    }
    // Each multiplication truncates once, so the error grows with the
    // number of squarings.
    const int wp =
        WorkingPrecision(p, options.guard_bits() + BitWidth(magnitude));
    Real result = IntegerPower(x.WithPrecision(wp), magnitude);
    if (n < 0) {
      BIGREAL_ASSIGN_OR_RETURN(result, Divide(Integer(1, wp), result));
    }
    return result.WithPrecision(p);
  }

  if (x.is_negative()) {
    return absl::OutOfRangeError(absl::StrCat(
        "Pow() of negative base ", x.ToStringWithMaxDigits(20),
        " with non-integer exponent ", y.ToStringWithMaxDigits(20)));
  }
  // exp(y log x) amplifies the absolute error of y log x into a relative
  // error of the result, so carry as many extra bits as y log x has integer
  // bits.  |log x| < (|ilogb(x)| + 1) * ln 2.
  const int64_t extra =
      std::max<int64_t>(0, ilogb(y) + 1 + BitWidth(std::abs(ilogb(x)) + 1));
  const int wp = WorkingPrecision(p, extra);
  BIGREAL_ASSIGN_OR_RETURN(Real log_x, Log(x.WithPrecision(wp), options));
  BIGREAL_ASSIGN_OR_RETURN(Real result,
                           Exp(y.WithPrecision(wp) * log_x, options));
  return result.WithPrecision(p);
}

}  // namespace bigreal
