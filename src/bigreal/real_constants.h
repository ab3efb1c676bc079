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

#ifndef BIGREAL_REAL_CONSTANTS_H_
#define BIGREAL_REAL_CONSTANTS_H_

#include <memory>
#include <optional>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "bigreal/real.h"

namespace bigreal {

// A mathematical constant evaluated on demand.  The provider remembers the
// most precise value computed so far; requests at or below that precision
// are answered by truncating it, and larger requests recompute it (with a
// few spare bits) and replace the cached value.
//
// This class is thread-safe.
class ConstantProvider {
 public:
  // Number of bits computed beyond the requested precision, so that later
  // requests at slightly higher precision hit the cache.
  static constexpr int kCacheGuardBits = 32;

  virtual ~ConstantProvider() = default;

  ConstantProvider(const ConstantProvider&) = delete;
  ConstantProvider& operator=(const ConstantProvider&) = delete;

  // Returns the constant truncated to the given precision.  Fails with
  // INVALID_ARGUMENT if the precision is not valid.
  absl::StatusOr<Real> Get(int precision) ABSL_LOCKS_EXCLUDED(mutex_);

  // The precision of the cached value, or 0 if nothing has been computed.
  int cached_precision() const ABSL_LOCKS_EXCLUDED(mutex_);

  // A short name for log messages, e.g. "pi".
  virtual absl::string_view name() const = 0;

 protected:
  ConstantProvider() = default;

  // Returns the constant with an error of at most a few units in the last
  // place at the given precision.
  virtual absl::StatusOr<Real> Compute(int precision) const = 0;

 private:
  mutable absl::Mutex mutex_;
  std::optional<Real> cache_ ABSL_GUARDED_BY(mutex_);
};

// The set of constants used by the transcendental functions.  The
// constants that are defined in terms of Exp() and Log() (e and ln10) use
// the ln2 provider of the same set, so a set is self-contained.
class RealConstants {
 public:
  RealConstants();

  RealConstants(const RealConstants&) = delete;
  RealConstants& operator=(const RealConstants&) = delete;

  // The process-wide instance used by default.
  static RealConstants& Default();

  ConstantProvider& pi() { return *pi_; }
  ConstantProvider& e() { return *e_; }
  ConstantProvider& ln2() { return *ln2_; }
  ConstantProvider& ln10() { return *ln10_; }

 private:
  std::unique_ptr<ConstantProvider> pi_;
  std::unique_ptr<ConstantProvider> e_;
  std::unique_ptr<ConstantProvider> ln2_;
  std::unique_ptr<ConstantProvider> ln10_;
};

// Convenience functions that use RealConstants::Default().
absl::StatusOr<Real> Pi(int precision = Real::kDefaultPrecision);
absl::StatusOr<Real> E(int precision = Real::kDefaultPrecision);
absl::StatusOr<Real> Ln2(int precision = Real::kDefaultPrecision);
absl::StatusOr<Real> Ln10(int precision = Real::kDefaultPrecision);

}  // namespace bigreal

#endif  // BIGREAL_REAL_CONSTANTS_H_
