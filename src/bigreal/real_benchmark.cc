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

// Benchmarks for Real arithmetic and the transcendental functions.  The
// range argument is the precision in bits.

#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>
#include "absl/random/random.h"
#include "bigreal/real.h"
#include "bigreal/real_constants.h"
#include "bigreal/real_math.h"

namespace bigreal {
namespace {

constexpr int kNumOperands = 64;

// Random operands in [0.5, 4) at the given precision.
std::vector<Real> RandomOperands(int precision) {
  absl::BitGen bitgen;
  std::vector<Real> result;
  for (int i = 0; i < kNumOperands; ++i) {
    const double value = absl::Uniform(bitgen, 0.5, 4.0);
    result.push_back(*Real::FromDouble(value, precision));
  }
  return result;
}

template <typename BinaryOp>
void RealBinaryOpBenchmark(benchmark::State& state, BinaryOp op) {
  const std::vector<Real> operands =
      RandomOperands(static_cast<int>(state.range(0)));
  size_t idx = 0;
  for (auto _ : state) {
    const Real& a = operands[(idx + 0) % kNumOperands];
    const Real& b = operands[(idx + 1) % kNumOperands];
    Real result = op(a, b);
    benchmark::DoNotOptimize(result);
    ++idx;
  }
}

template <typename UnaryFunction>
void RealFunctionBenchmark(benchmark::State& state, UnaryFunction function) {
  const std::vector<Real> operands =
      RandomOperands(static_cast<int>(state.range(0)));
  size_t idx = 0;
  for (auto _ : state) {
    auto result = function(operands[idx % kNumOperands]);
    benchmark::DoNotOptimize(result);
    ++idx;
  }
}

void BM_Add(benchmark::State& state) {
  RealBinaryOpBenchmark(state,
                        [](const Real& a, const Real& b) { return a + b; });
}
BENCHMARK(BM_Add)->RangeMultiplier(4)->Range(64, 16384);

void BM_Multiply(benchmark::State& state) {
  RealBinaryOpBenchmark(state,
                        [](const Real& a, const Real& b) { return a * b; });
}
BENCHMARK(BM_Multiply)->RangeMultiplier(4)->Range(64, 16384);

void BM_Divide(benchmark::State& state) {
  RealBinaryOpBenchmark(state,
                        [](const Real& a, const Real& b) { return a / b; });
}
BENCHMARK(BM_Divide)->RangeMultiplier(4)->Range(64, 16384);

void BM_ToString(benchmark::State& state) {
  RealFunctionBenchmark(state, [](const Real& x) { return x.ToString(); });
}
BENCHMARK(BM_ToString)->RangeMultiplier(4)->Range(64, 4096);

void BM_Log(benchmark::State& state) {
  RealFunctionBenchmark(state, [](const Real& x) { return Log(x); });
}
BENCHMARK(BM_Log)->RangeMultiplier(4)->Range(64, 4096);

void BM_Exp(benchmark::State& state) {
  RealFunctionBenchmark(state, [](const Real& x) { return Exp(x); });
}
BENCHMARK(BM_Exp)->RangeMultiplier(4)->Range(64, 4096);

void BM_Sqrt(benchmark::State& state) {
  RealFunctionBenchmark(state, [](const Real& x) { return Sqrt(x); });
}
BENCHMARK(BM_Sqrt)->RangeMultiplier(4)->Range(64, 4096);

void BM_Sin(benchmark::State& state) {
  RealFunctionBenchmark(state, [](const Real& x) { return Sin(x); });
}
BENCHMARK(BM_Sin)->RangeMultiplier(4)->Range(64, 4096);

void BM_Pow(benchmark::State& state) {
  const Real y = *Real::FromDouble(2.5, static_cast<int>(state.range(0)));
  RealFunctionBenchmark(state, [&y](const Real& x) { return Pow(x, y); });
}
BENCHMARK(BM_Pow)->RangeMultiplier(4)->Range(64, 4096);

// Computes pi from scratch on every iteration.
void BM_ComputePi(benchmark::State& state) {
  const int precision = static_cast<int>(state.range(0));
  for (auto _ : state) {
    RealConstants constants;
    auto pi = constants.pi().Get(precision);
    benchmark::DoNotOptimize(pi);
  }
}
BENCHMARK(BM_ComputePi)->RangeMultiplier(4)->Range(64, 16384);

}  // namespace
}  // namespace bigreal

BENCHMARK_MAIN();
