/**
 * @file  fuzz_kernels.cpp
 * @brief libFuzzer target for kernel generation by family name and parameters
 *
 * Build:
 *   cmake -DSHOCKLET_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_kernels
 *
 * Run for 60 seconds:
 *   ./fuzz_kernels -max_total_time=60
 *
 * Input layout:
 *   byte 0        family selector (mod family count)
 *   byte 1        kernel length L (0..255)
 *   byte 2        zero_norm flag (low bit)
 *   bytes 3..     up to three raw doubles: parameter, startpt, endpt
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB. Invalid input surfaces only as a shocklet::Error.
 *   2. A returned kernel has exactly L finite samples.
 *   3. A zero-normed kernel sums to 0 and lies in [-1, 1].
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

#include "shocklet/constants.hpp"
#include "shocklet/errors.hpp"
#include "shocklet/kernels.hpp"

using namespace shocklet;
using namespace shocklet::kernels;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3) return 0;

    const auto& families = all_families();
    const ShapeFamily family = families[data[0] % families.size()];
    const std::size_t L = data[1];

    KernelOptions options{};
    options.zero_norm = (data[2] & 1u) != 0;

    std::vector<double> doubles;
    for (size_t off = 3; off + sizeof(double) <= size && doubles.size() < 3; off += sizeof(double)) {
        double val{};
        __builtin_memcpy(&val, data + off, sizeof(double));
        doubles.push_back(val);
    }
    if (doubles.size() >= 3) {
        options.startpt = doubles[1];
        options.endpt   = doubles[2];
    }

    std::vector<double> params;
    if (parameter_count(family) > 0) {
        if (doubles.empty()) return 0;
        params.push_back(doubles[0]);
    }

    Series k;
    try {
        k = generate_kernel(to_string(family), L, params, options);
    } catch (const Error&) {
        return 0;
    }

    assert(k.size() == L);
    for (double v : k) assert(std::isfinite(v));

    if (options.zero_norm) {
        const double sum = std::accumulate(k.begin(), k.end(), 0.0);
        assert(std::abs(sum) <= constants::ZERO_SUM_TOLERANCE * static_cast<double>(L));
        for (double v : k) assert(std::abs(v) <= 1.0 + 1e-12);
    }
    return 0;
}
