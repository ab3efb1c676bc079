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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/algorithm/container.h"
#include "absl/base/nullability.h"
#include "absl/log/absl_check.h"
#include "absl/numeric/bits.h"
#include "absl/numeric/int128.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace bigreal_internal {

namespace {

using BigitVector = Bignum::BigitVector;
constexpr int kBigitBits = Bignum::kBigitBits;

// Below this many bigits in the shorter operand Karatsuba recursion stops and
// long multiplication is used instead.
constexpr size_t kKaratsubaThreshold = 32;

// 10^19, the largest power of ten that fits in a bigit.
constexpr Bigit kDecimalChunk = 10'000'000'000'000'000'000u;
constexpr int kDecimalChunkDigits = 19;

// Returns a + b + *carry and stores the outgoing carry (0 or 1).
inline Bigit AddWithCarry(Bigit a, Bigit b, Bigit* absl_nonnull carry) {
  const absl::uint128 sum = absl::uint128(a) + b + *carry;
  *carry = absl::Uint128High64(sum);
  return absl::Uint128Low64(sum);
}

// Returns a - b - *borrow and stores the outgoing borrow (0 or 1).
inline Bigit SubWithBorrow(Bigit a, Bigit b, Bigit* absl_nonnull borrow) {
  ABSL_DCHECK_LE(*borrow, Bigit{1});
  const Bigit diff = a - b;
  const Bigit out = diff - *borrow;
  *borrow = static_cast<Bigit>(a < b) | static_cast<Bigit>(diff < *borrow);
  return out;
}

int CmpMagnitude(absl::Span<const Bigit> a, absl::Span<const Bigit> b) {
  if (a.size() != b.size()) return a.size() < b.size() ? -1 : +1;
  for (size_t i = a.size(); i-- > 0;) {
    if (a[i] != b[i]) return a[i] < b[i] ? -1 : +1;
  }
  return 0;
}

// a += b. a must be at least as long as b; returns the carry out of a.
Bigit AddTo(absl::Span<Bigit> a, absl::Span<const Bigit> b) {
  ABSL_DCHECK_GE(a.size(), b.size());
  Bigit carry = 0;
  size_t i = 0;
  for (; i < b.size(); ++i) a[i] = AddWithCarry(a[i], b[i], &carry);
  for (; carry != 0 && i < a.size(); ++i) a[i] = AddWithCarry(a[i], 0, &carry);
  return carry;
}

// a -= b.
//
// REQUIRES: |a| >= |b|
void SubFrom(absl::Span<Bigit> a, absl::Span<const Bigit> b) {
  ABSL_DCHECK_GE(a.size(), b.size());
  Bigit borrow = 0;
  size_t i = 0;
  for (; i < b.size(); ++i) a[i] = SubWithBorrow(a[i], b[i], &borrow);
  for (; borrow != 0 && i < a.size(); ++i) {
    a[i] = SubWithBorrow(a[i], 0, &borrow);
  }
  ABSL_DCHECK_EQ(borrow, 0u);
}

// dst[0, a.size()) += a * b. Returns the carry bigit.
Bigit MulAddRow(absl::Span<Bigit> dst, absl::Span<const Bigit> a, Bigit b) {
  ABSL_DCHECK_GE(dst.size(), a.size());
  Bigit carry = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    const absl::uint128 t = absl::uint128(a[i]) * b + dst[i] + carry;
    dst[i] = absl::Uint128Low64(t);
    carry = absl::Uint128High64(t);
  }
  return carry;
}

// dst = a * b by long multiplication. dst must hold a.size() + b.size()
// bigits and is fully overwritten.
void MulLong(absl::Span<Bigit> dst, absl::Span<const Bigit> a,
             absl::Span<const Bigit> b) {
  ABSL_DCHECK_GE(dst.size(), a.size() + b.size());
  absl::c_fill(dst, 0);
  for (size_t j = 0; j < b.size(); ++j) {
    if (b[j] == 0) continue;
    dst[j + a.size()] = MulAddRow(dst.subspan(j), a, b[j]);
  }
}

// Returns the span with high zero bigits removed.
absl::Span<const Bigit> TrimSpan(absl::Span<const Bigit> s) {
  while (!s.empty() && s.back() == 0) s.remove_suffix(1);
  return s;
}

// Returns a + b as a new vector.
BigitVector AddSpans(absl::Span<const Bigit> a, absl::Span<const Bigit> b) {
  if (a.size() < b.size()) std::swap(a, b);
  BigitVector sum(a.begin(), a.end());
  if (const Bigit carry = AddTo(absl::MakeSpan(sum), b); carry != 0) {
    sum.push_back(carry);
  }
  return sum;
}

// dst = a * b by Karatsuba's method. With a = a1*B + a0 and b = b1*B + b0,
//
//   a*b = a1*b1*B^2 + ((a0 + a1)*(b0 + b1) - a0*b0 - a1*b1)*B + a0*b0
//
// which needs three half-size products instead of four. dst must hold
// a.size() + b.size() bigits and is fully overwritten.
void MulKaratsuba(absl::Span<Bigit> dst, absl::Span<const Bigit> a,
                  absl::Span<const Bigit> b) {
  ABSL_DCHECK_GE(dst.size(), a.size() + b.size());
  if (std::min(a.size(), b.size()) < kKaratsubaThreshold) {
    MulLong(dst, a, b);
    return;
  }

  const size_t half = (std::max(a.size(), b.size()) + 1) / 2;
  if (std::min(a.size(), b.size()) <= half) {
    // Very unbalanced operands: split only the longer one.
    if (a.size() < b.size()) std::swap(a, b);
    absl::c_fill(dst, 0);
    BigitVector partial(half + b.size());
    for (size_t pos = 0; pos < a.size(); pos += half) {
      const auto chunk = a.subspan(pos, half);
      partial.assign(chunk.size() + b.size(), 0);
      MulKaratsuba(absl::MakeSpan(partial), chunk, b);
      AddTo(dst.subspan(pos), TrimSpan(partial));
    }
    return;
  }

  const auto a0 = TrimSpan(a.subspan(0, half)), a1 = a.subspan(half);
  const auto b0 = TrimSpan(b.subspan(0, half)), b1 = b.subspan(half);

  BigitVector z0(a0.size() + b0.size());
  BigitVector z2(a1.size() + b1.size());
  MulKaratsuba(absl::MakeSpan(z0), a0, b0);
  MulKaratsuba(absl::MakeSpan(z2), a1, b1);

  const BigitVector asum = AddSpans(a0, a1);
  const BigitVector bsum = AddSpans(b0, b1);
  BigitVector z1(asum.size() + bsum.size());
  MulKaratsuba(absl::MakeSpan(z1), asum, bsum);
  SubFrom(absl::MakeSpan(z1), TrimSpan(z0));
  SubFrom(absl::MakeSpan(z1), TrimSpan(z2));

  absl::c_fill(dst, 0);
  absl::c_copy(z0, dst.begin());
  absl::c_copy(z2, dst.begin() + 2 * half);
  AddTo(dst.subspan(half), TrimSpan(z1));
}

// Divides `digits` in place by a single bigit and returns the remainder.
Bigit DivModSmall(absl::Span<Bigit> digits, Bigit divisor) {
  ABSL_DCHECK_NE(divisor, 0u);
  absl::uint128 rem = 0;
  for (size_t i = digits.size(); i-- > 0;) {
    const absl::uint128 cur = (rem << kBigitBits) | digits[i];
    digits[i] = absl::Uint128Low64(cur / divisor);
    rem = cur % divisor;
  }
  return absl::Uint128Low64(rem);
}

// Knuth's Algorithm D (TAOCP vol. 2, 4.3.1) on 64-bit digits. Computes
// q = u / v and r = u % v for magnitudes with v.size() >= 2 and
// u.size() >= v.size().
void DivModLong(absl::Span<const Bigit> u_in, absl::Span<const Bigit> v_in,
                BigitVector* absl_nonnull q, BigitVector* absl_nonnull r) {
  const size_t n = v_in.size();
  const size_t m = u_in.size() - n;
  ABSL_DCHECK_GE(n, 2u);
  ABSL_DCHECK_NE(v_in.back(), 0u);

  // D1: scale both operands so the top bit of the divisor is set.
  const int shift = absl::countl_zero(v_in.back());
  auto high_part = [shift](Bigit lo) -> Bigit {
    return shift == 0 ? 0 : lo >> (kBigitBits - shift);
  };
  BigitVector v(n);
  for (size_t i = n; i-- > 0;) {
    v[i] = (v_in[i] << shift) | (i > 0 ? high_part(v_in[i - 1]) : 0);
  }
  BigitVector u(m + n + 1);
  u[m + n] = high_part(u_in[m + n - 1]);
  for (size_t i = m + n; i-- > 0;) {
    u[i] = (u_in[i] << shift) | (i > 0 ? high_part(u_in[i - 1]) : 0);
  }

  const absl::uint128 kBase = absl::uint128(1) << kBigitBits;
  q->assign(m + 1, 0);
  for (size_t j = m + 1; j-- > 0;) {
    // D3: estimate the quotient digit from the top two dividend digits; the
    // second divisor digit corrects it to within one of the true value.
    const absl::uint128 top = (absl::uint128(u[j + n]) << kBigitBits) |
                              u[j + n - 1];
    absl::uint128 qhat = top / v[n - 1];
    absl::uint128 rhat = top % v[n - 1];
    while (qhat >= kBase ||
           qhat * v[n - 2] > ((rhat << kBigitBits) | u[j + n - 2])) {
      --qhat;
      rhat += v[n - 1];
      if (rhat >= kBase) break;
    }

    // D4: u[j, j+n] -= qhat * v.
    const Bigit qdigit = absl::Uint128Low64(qhat);
    Bigit mul_carry = 0;
    Bigit borrow = 0;
    for (size_t i = 0; i < n; ++i) {
      const absl::uint128 p = absl::uint128(qdigit) * v[i] + mul_carry;
      mul_carry = absl::Uint128High64(p);
      u[i + j] = SubWithBorrow(u[i + j], absl::Uint128Low64(p), &borrow);
    }
    const Bigit top_digit = u[j + n];
    u[j + n] = top_digit - mul_carry - borrow;
    const bool negative = top_digit < mul_carry ||
                          top_digit - mul_carry < borrow;

    // D6: the estimate was one too large, so add the divisor back.
    if (negative) {
      Bigit carry = 0;
      for (size_t i = 0; i < n; ++i) {
        u[i + j] = AddWithCarry(u[i + j], v[i], &carry);
      }
      u[j + n] += carry;
      (*q)[j] = qdigit - 1;
    } else {
      (*q)[j] = qdigit;
    }
  }

  // D8: unscale the remainder.
  r->assign(n, 0);
  for (size_t i = 0; i < n; ++i) {
    (*r)[i] = u[i] >> shift;
    if (shift != 0) (*r)[i] |= u[i + 1] << (kBigitBits - shift);
  }
}

}  // namespace

std::optional<Bignum> Bignum::FromString(absl::string_view s) {
  bool negative = false;
  if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
    negative = (s.front() == '-');
    s.remove_prefix(1);
  }

  Bignum out;
  out.bigits_.reserve(s.size() / kDecimalChunkDigits + 1);

  // Horner's rule on chunks of up to 19 digits. The first chunk absorbs the
  // remainder so that every later chunk is full.
  size_t chunk_len = s.size() % kDecimalChunkDigits;
  if (chunk_len == 0) chunk_len = kDecimalChunkDigits;
  while (!s.empty()) {
    Bigit chunk = 0;
    Bigit scale = 1;
    for (char c : s.substr(0, chunk_len)) {
      if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
      chunk = chunk * 10 + static_cast<Bigit>(c - '0');
      scale *= 10;
    }
    s.remove_prefix(chunk_len);
    chunk_len = kDecimalChunkDigits;

    Bigit carry = chunk;
    for (Bigit& bigit : out.bigits_) {
      const absl::uint128 t = absl::uint128(bigit) * scale + carry;
      bigit = absl::Uint128Low64(t);
      carry = absl::Uint128High64(t);
    }
    if (carry != 0) out.bigits_.push_back(carry);
  }

  out.negative_ = negative;
  out.Trim();
  return out;
}

std::string Bignum::ToString() const {
  if (is_zero()) return "0";

  // Peel off base 10^19 chunks, least significant first.
  BigitVector mag = bigits_;
  BigitVector chunks;
  while (!mag.empty()) {
    chunks.push_back(DivModSmall(absl::MakeSpan(mag), kDecimalChunk));
    while (!mag.empty() && mag.back() == 0) mag.pop_back();
  }

  std::string out = negative_ ? "-" : "";
  absl::StrAppendFormat(&out, "%d", chunks.back());
  for (size_t i = chunks.size() - 1; i-- > 0;) {
    absl::StrAppendFormat(&out, "%019d", chunks[i]);
  }
  return out;
}

int bit_width(const Bignum& a) {
  if (a.is_zero()) return 0;
  return static_cast<int>(a.bigits_.size() - 1) * Bignum::kBigitBits +
         (Bignum::kBigitBits - absl::countl_zero(a.bigits_.back()));
}

int countr_zero(const Bignum& a) {
  int count = 0;
  for (Bigit bigit : a.bigits_) {
    if (bigit != 0) return count + absl::countr_zero(bigit);
    count += Bignum::kBigitBits;
  }
  return 0;
}

bool Bignum::is_bit_set(int nbit) const {
  ABSL_DCHECK_GE(nbit, 0);
  const size_t index = static_cast<size_t>(nbit) / kBigitBits;
  if (index >= bigits_.size()) return false;
  return (bigits_[index] >> (nbit % kBigitBits)) & 1;
}

int Bignum::CompareAbs(const Bignum& b) const {
  return CmpMagnitude(bigits_, b.bigits_);
}

int Bignum::Compare(const Bignum& b) const {
  if (negative_ != b.negative_) return negative_ ? -1 : +1;
  const int cmp = CompareAbs(b);
  return negative_ ? -cmp : cmp;
}

Bignum Bignum::Pow(int32_t pow) const {
  ABSL_DCHECK_GE(pow, 0);
  Bignum result(1);
  Bignum base = *this;
  for (uint32_t bits = static_cast<uint32_t>(pow); bits != 0; bits >>= 1) {
    if (bits & 1) result *= base;
    if (bits > 1) base *= base;
  }
  return result;
}

Bignum& Bignum::operator+=(const Bignum& b) {
  if (b.is_zero()) return *this;
  if (is_zero()) return *this = b;

  if (negative_ == b.negative_) {
    if (bigits_.size() < b.bigits_.size()) bigits_.resize(b.bigits_.size());
    if (const Bigit carry = AddTo(absl::MakeSpan(bigits_), b.bigits_);
        carry != 0) {
      bigits_.push_back(carry);
    }
    return *this;
  }

  // Opposite signs: subtract the smaller magnitude from the larger, and the
  // result takes the sign of the larger.
  if (CompareAbs(b) >= 0) {
    SubFrom(absl::MakeSpan(bigits_), b.bigits_);
  } else {
    BigitVector diff = b.bigits_;
    SubFrom(absl::MakeSpan(diff), bigits_);
    bigits_ = std::move(diff);
    negative_ = b.negative_;
  }
  Trim();
  return *this;
}

Bignum& Bignum::operator-=(const Bignum& b) {
  if (this == &b) return set_zero();
  negate();
  *this += b;
  negate();
  return *this;
}

Bignum& Bignum::operator*=(const Bignum& b) {
  if (is_zero() || b.is_zero()) return set_zero();
  const bool negative = negative_ != b.negative_;

  if (bigits_.size() == 1 && b.bigits_.size() == 1) {
    const absl::uint128 p = absl::uint128(bigits_[0]) * b.bigits_[0];
    bigits_ = {absl::Uint128Low64(p), absl::Uint128High64(p)};
  } else {
    BigitVector product(bigits_.size() + b.bigits_.size());
    MulKaratsuba(absl::MakeSpan(product), bigits_, b.bigits_);
    bigits_ = std::move(product);
  }
  negative_ = negative;
  Trim();
  return *this;
}

void Bignum::DivMod(const Bignum& a, const Bignum& b,
                    Bignum* absl_nullable quotient,
                    Bignum* absl_nullable remainder) {
  ABSL_CHECK(!b.is_zero()) << "Bignum division by zero";
  const bool quotient_negative = a.negative_ != b.negative_;
  const bool remainder_negative = a.negative_;

  BigitVector q, r;
  if (CmpMagnitude(a.bigits_, b.bigits_) < 0) {
    r = a.bigits_;
  } else if (b.bigits_.size() == 1) {
    q = a.bigits_;
    r = {DivModSmall(absl::MakeSpan(q), b.bigits_[0])};
  } else {
    DivModLong(a.bigits_, b.bigits_, &q, &r);
  }

  if (quotient != nullptr) *quotient = Bignum(std::move(q), quotient_negative);
  if (remainder != nullptr) {
    *remainder = Bignum(std::move(r), remainder_negative);
  }
}

Bignum& Bignum::operator/=(const Bignum& b) {
  DivMod(*this, b, this, nullptr);
  return *this;
}

Bignum& Bignum::operator%=(const Bignum& b) {
  DivMod(*this, b, nullptr, this);
  return *this;
}

Bignum& Bignum::operator<<=(int nbit) {
  ABSL_DCHECK_GE(nbit, 0);
  if (is_zero() || nbit == 0) return *this;

  const int words = nbit / kBigitBits;
  const int bits = nbit % kBigitBits;
  if (bits != 0) {
    Bigit carry = 0;
    for (Bigit& bigit : bigits_) {
      const Bigit next_carry = bigit >> (kBigitBits - bits);
      bigit = (bigit << bits) | carry;
      carry = next_carry;
    }
    if (carry != 0) bigits_.push_back(carry);
  }
  bigits_.insert(bigits_.begin(), words, 0);
  return *this;
}

Bignum& Bignum::operator>>=(int nbit) {
  ABSL_DCHECK_GE(nbit, 0);
  if (is_zero() || nbit == 0) return *this;
  if (nbit >= bit_width(*this)) return set_zero();

  const int words = nbit / kBigitBits;
  const int bits = nbit % kBigitBits;
  bigits_.erase(bigits_.begin(), bigits_.begin() + words);
  if (bits != 0) {
    for (size_t i = 0; i < bigits_.size(); ++i) {
      const Bigit next = i + 1 < bigits_.size() ? bigits_[i + 1] : 0;
      bigits_[i] = (bigits_[i] >> bits) | (next << (kBigitBits - bits));
    }
  }
  Trim();
  return *this;
}

}  // namespace bigreal_internal
