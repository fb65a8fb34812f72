/**
 * @file  prop_kernel_invariants.cpp
 * @brief Property: every zero-normed kernel sums to 0 and lies in [-1, 1]
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_kernel_invariants
 *
 * Parameters are drawn from the ranges the kernels are used with in practice:
 *   L ∈ [4, 256], power exponents b ∈ [0.1, 3.0], exponential rates a ∈ [0.05, 2.0].
 * Inside those ranges no family is degenerate, so every call must succeed.
 */

#include <rapidcheck.h>
#include <cmath>
#include <numeric>

#include "shocklet/constants.hpp"
#include "shocklet/kernels.hpp"

using namespace shocklet;
using namespace shocklet::kernels;

namespace {

double draw_exponent() { return *rc::gen::inRange(10, 301) / 100.0; }
double draw_rate()     { return *rc::gen::inRange(5, 201) / 100.0; }

KernelShape draw_shape() {
    const auto& families = all_families();
    const auto family = families[static_cast<std::size_t>(
        *rc::gen::inRange<int>(0, static_cast<int>(families.size())))];

    switch (family) {
        case ShapeFamily::Haar:             return shape::Haar{};
        case ShapeFamily::PowerLawZeroCusp: return shape::PowerLawZeroCusp{draw_exponent()};
        case ShapeFamily::PowerLawCusp:     return shape::PowerLawCusp{draw_exponent()};
        case ShapeFamily::PowerZeroCusp:    return shape::PowerZeroCusp{draw_exponent()};
        case ShapeFamily::PowerCusp:        return shape::PowerCusp{draw_exponent()};
        case ShapeFamily::Pitchfork:        return shape::Pitchfork{draw_exponent()};
        case ShapeFamily::ExpZeroCusp:      return shape::ExpZeroCusp{draw_rate()};
        case ShapeFamily::ExpCusp:          return shape::ExpCusp{draw_rate()};
    }
    return shape::Haar{};
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: zero sum and unit range under zero_norm ──────────────────
    ok &= rc::check(
        "kernel_invariants: zero-normed kernels sum to 0 within [-1, 1]",
        []() {
            const auto L = static_cast<std::size_t>(*rc::gen::inRange(4, 257));
            const KernelShape s = draw_shape();
            RC_TAG(std::string(to_string(family_of(s))));

            const Series k = generate_kernel(s, L);
            RC_ASSERT(k.size() == L);

            const double sum = std::accumulate(k.begin(), k.end(), 0.0);
            RC_ASSERT(std::abs(sum) <= constants::ZERO_SUM_TOLERANCE);
            for (double v : k) {
                RC_ASSERT(std::isfinite(v));
                RC_ASSERT(std::abs(v) <= 1.0 + 1e-12);
            }
        }
    );

    // ── Property 2: raw double cusps are exact mirror sums ───────────────────
    ok &= rc::check(
        "kernel_invariants: raw power_law_cusp == half + reverse(half)",
        []() {
            const auto L = static_cast<std::size_t>(*rc::gen::inRange(2, 257));
            const double b = draw_exponent();
            const KernelOptions raw{.zero_norm = false};

            const Series half = power_law_zero_cusp(L, b, raw);
            const Series full = power_law_cusp(L, b, raw);
            RC_ASSERT(full.size() == L);
            for (std::size_t i = 0; i < L; ++i) {
                RC_ASSERT(full[i] == half[i] + half[L - 1 - i]);
            }
        }
    );

    // ── Property 3: the raw Haar kernel is a ±1 step at L / 2 ────────────────
    ok &= rc::check(
        "kernel_invariants: raw haar steps from -1 to +1 at L/2",
        []() {
            const auto L = static_cast<std::size_t>(*rc::gen::inRange(2, 513));
            const Series k = haar(L, KernelOptions{.zero_norm = false});
            for (std::size_t i = 0; i < L; ++i) {
                RC_ASSERT(k[i] == (i < L / 2 ? -1.0 : 1.0));
            }
        }
    );

    return ok ? 0 : 1;
}
