/**
 * @file  bench/bench_kernels.cpp
 * @brief Google Benchmark suite for kernel generation and indicator post-processing.
 *
 * Benchmarks
 * ----------
 *   BM_Kernel_<Family>      kernel generation, L = 16 .. 4096
 *   BM_ZeroNorm             zero_norm over a synthetic series
 *   BM_RowNormalize         row_normalize on a (rows × 64) moving tensor
 *   BM_WindowArgmaxes       contiguous windows over an indicator array
 *   BM_TopK                 top-10 of n labelled scores
 *   BM_WeightingScoreAll    every built-in weighting function over one array
 *
 * Build (CMake):
 *   cmake --build build --target bench_kernels
 *   ./build/bench_kernels --benchmark_format=json
 *
 * Throughput units: items/second (samples produced or consumed).
 */

#include "benchmark/benchmark.h"

#include "shocklet/kernels.hpp"
#include "shocklet/normalize.hpp"
#include "shocklet/sequence_data.hpp"
#include "shocklet/weighting.hpp"
#include "shocklet/windows.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic noisy series with a handful of level shifts.
static std::vector<double> make_series(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        v[i] = std::sin(0.05 * t) + 0.3 * std::cos(1.7 * t) + static_cast<double>(i / 512);
    }
    return v;
}

static void set_items(benchmark::State& state, std::size_t per_iteration) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(per_iteration));
}

// ── Kernel generation ──────────────────────────────────────────────────────────

static void BM_Kernel(benchmark::State& state, shocklet::kernels::KernelShape shape) {
    const auto L = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto k = shocklet::kernels::generate_kernel(shape, L);
        benchmark::DoNotOptimize(k.data());
        benchmark::ClobberMemory();
    }
    set_items(state, L);
}

namespace sk = shocklet::kernels;

BENCHMARK_CAPTURE(BM_Kernel, Haar,             sk::KernelShape{sk::shape::Haar{}})
    ->RangeMultiplier(4)->Range(16, 4096);
BENCHMARK_CAPTURE(BM_Kernel, PowerLawCusp,     sk::KernelShape{sk::shape::PowerLawCusp{1.0}})
    ->RangeMultiplier(4)->Range(16, 4096);
BENCHMARK_CAPTURE(BM_Kernel, PowerCusp,        sk::KernelShape{sk::shape::PowerCusp{2.0}})
    ->RangeMultiplier(4)->Range(16, 4096);
BENCHMARK_CAPTURE(BM_Kernel, Pitchfork,        sk::KernelShape{sk::shape::Pitchfork{1.0}})
    ->RangeMultiplier(4)->Range(16, 4096);
BENCHMARK_CAPTURE(BM_Kernel, ExpCusp,          sk::KernelShape{sk::shape::ExpCusp{0.5}})
    ->RangeMultiplier(4)->Range(16, 4096);

// ── Normalization ──────────────────────────────────────────────────────────────

static void BM_ZeroNorm(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto series = make_series(n);
    for (auto _ : state) {
        auto out = shocklet::zero_norm(series);
        benchmark::DoNotOptimize(out.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_ZeroNorm)->RangeMultiplier(8)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_RowNormalize(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto X = shocklet::sequence::make_moving_tensor(make_series(n + 64), 64);
    for (auto _ : state) {
        auto out = shocklet::row_normalize(X);
        benchmark::DoNotOptimize(out.values.data());
    }
    set_items(state, n * 64);
}
BENCHMARK(BM_RowNormalize)->RangeMultiplier(8)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Post-processing ────────────────────────────────────────────────────────────

static void BM_WindowArgmaxes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto indicator = make_series(n);
    const auto windows   = shocklet::windows::contiguous_windows(n, 128, 64);
    for (auto _ : state) {
        auto peaks = shocklet::windows::window_argmaxes(windows, indicator);
        benchmark::DoNotOptimize(peaks.data());
    }
    set_items(state, 2 * n);
}
BENCHMARK(BM_WindowArgmaxes)->RangeMultiplier(8)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

static void BM_TopK(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto scores = make_series(n);
    std::vector<std::size_t> labels(n);
    for (std::size_t i = 0; i < n; ++i) labels[i] = i;
    for (auto _ : state) {
        auto top = shocklet::windows::top_k(scores, labels, 10);
        benchmark::DoNotOptimize(top.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_TopK)->RangeMultiplier(8)->Range(1024, 262144)->Unit(benchmark::kMicrosecond);

static void BM_WeightingScoreAll(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto arr = make_series(n);
    const auto& registry = shocklet::weighting::WeightingRegistry::builtin();
    for (auto _ : state) {
        auto scores = shocklet::weighting::score_all(registry, arr);
        benchmark::DoNotOptimize(scores.data());
    }
    set_items(state, n);
}
BENCHMARK(BM_WeightingScoreAll)->RangeMultiplier(8)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
