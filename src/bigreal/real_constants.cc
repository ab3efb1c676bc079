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

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>

#include "absl/base/no_destructor.h"
#include "absl/log/absl_log.h"
#include "absl/numeric/bits.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "bigreal/bignum.h"
#include "bigreal/real.h"
#include "bigreal/real_math.h"
#include "bigreal/util/status_macros.h"

namespace bigreal {

namespace {

// The number of fractional bits to use for a fixed-point series summed at
// the given precision.  Every term contributes an error of at most a couple
// of units, so the series needs about log2(terms) extra bits.
int FixedPointBits(int precision) {
  return precision + 8 +
         static_cast<int>(absl::bit_width(static_cast<uint32_t>(precision)));
}

// Returns floor(atan(1/m) * 2**bits) up to an error of one unit per term,
// using atan(1/m) = 1/m - 1/(3 m**3) + 1/(5 m**5) - ...
Bignum ArctanInverse(int64_t m, int bits) {
  const Bignum m2(m * m);
  // Each power is floor(2**bits / m**(2k+1)) exactly, since nested floor
  // divisions by integers do not accumulate error.
  Bignum power = (Bignum(1) << bits) / Bignum(m);
  Bignum sum = power;
  for (int64_t k = 1;; ++k) {
    power /= m2;
    if (power.is_zero()) break;
    const Bignum term = power / Bignum(2 * k + 1);
    if (k % 2 == 1) {
      sum -= term;
    } else {
      sum += term;
    }
  }
  return sum;
}

class PiProvider final : public ConstantProvider {
 public:
  absl::string_view name() const override { return "pi"; }

 protected:
  // Machin's formula: pi = 16 atan(1/5) - 4 atan(1/239).
  absl::StatusOr<Real> Compute(int precision) const override {
    const int bits = FixedPointBits(precision);
    Bignum pi = (ArctanInverse(5, bits) << 4) - (ArctanInverse(239, bits) << 2);
    return Real::FromParts(std::move(pi), -bits, precision);
  }
};

class Ln2Provider final : public ConstantProvider {
 public:
  absl::string_view name() const override { return "ln2"; }

 protected:
  // ln 2 = sum over k >= 1 of 1 / (k 2**k).
  absl::StatusOr<Real> Compute(int precision) const override {
    const int bits = FixedPointBits(precision);
    Bignum sum;
    for (int k = 1; k <= bits; ++k) {
      sum += (Bignum(1) << (bits - k)) / Bignum(k);
    }
    return Real::FromParts(std::move(sum), -bits, precision);
  }
};

// e = exp(1), evaluated with the constants of the owning set.
class EProvider final : public ConstantProvider {
 public:
  explicit EProvider(RealConstants* owner) : owner_(owner) {}

  absl::string_view name() const override { return "e"; }

 protected:
  absl::StatusOr<Real> Compute(int precision) const override {
    MathOptions options;
    options.set_constants(owner_);
    BIGREAL_ASSIGN_OR_RETURN(Real one, Real::FromInt(1, precision));
    return Exp(one, options);
  }

 private:
  RealConstants* const owner_;
};

// ln 10 = log(10), evaluated with the constants of the owning set.
class Ln10Provider final : public ConstantProvider {
 public:
  explicit Ln10Provider(RealConstants* owner) : owner_(owner) {}

  absl::string_view name() const override { return "ln10"; }

 protected:
  absl::StatusOr<Real> Compute(int precision) const override {
    MathOptions options;
    options.set_constants(owner_);
    BIGREAL_ASSIGN_OR_RETURN(Real ten, Real::FromInt(10, precision));
    return Log(ten, options);
  }

 private:
  RealConstants* const owner_;
};

}  // namespace

absl::StatusOr<Real> ConstantProvider::Get(int precision) {
  if (!Real::IsValidPrecision(precision)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid precision ", precision, " for ", name()));
  }
  absl::MutexLock lock(&mutex_);
  if (!cache_.has_value() || cache_->precision() < precision) {
    const int compute_precision =
        std::min(precision + kCacheGuardBits, Real::kMaxPrecision);
    ABSL_VLOG(1) << "Computing " << name() << " to " << compute_precision
                 << " bits";
    BIGREAL_ASSIGN_OR_RETURN(Real value, Compute(compute_precision));
    cache_ = std::move(value);
  }
  return cache_->WithPrecision(precision);
}

int ConstantProvider::cached_precision() const {
  absl::MutexLock lock(&mutex_);
  return cache_.has_value() ? cache_->precision() : 0;
}

RealConstants::RealConstants()
    : pi_(std::make_unique<PiProvider>()),
      e_(std::make_unique<EProvider>(this)),
      ln2_(std::make_unique<Ln2Provider>()),
      ln10_(std::make_unique<Ln10Provider>(this)) {}

RealConstants& RealConstants::Default() {
  static absl::NoDestructor<RealConstants> constants;
  return *constants;
}

absl::StatusOr<Real> Pi(int precision) {
  return RealConstants::Default().pi().Get(precision);
}

absl::StatusOr<Real> E(int precision) {
  return RealConstants::Default().e().Get(precision);
}

absl::StatusOr<Real> Ln2(int precision) {
  return RealConstants::Default().ln2().Get(precision);
}

absl::StatusOr<Real> Ln10(int precision) {
  return RealConstants::Default().ln10().Get(precision);
}

}  // namespace bigreal
