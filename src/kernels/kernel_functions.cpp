/// @file src/kernels/kernel_functions.cpp
/// @brief Family generators for the shocklet kernel library.
///
/// Each half cusp is sampled into an Eigen array, masked at L / 2 and handed
/// to normalized(), which rejects non-finite samples and applies zero_norm
/// when requested. Composed families add the normalized parts (and their
/// reversals) and normalize the sum once more. Only the kernel a public
/// generator returns goes through finish(), which scales a zero-normed
/// result into [-1, 1]. The parts of a composed kernel are never scaled.

#include "shocklet/kernels.hpp"
#include "shocklet/errors.hpp"
#include "shocklet/normalize.hpp"

#include <fmt/format.h>

#include <cmath>

namespace shocklet::kernels {

namespace {

[[nodiscard]] Eigen::Index midpoint(std::size_t L) noexcept {
    return static_cast<Eigen::Index>(L / 2);
}

[[nodiscard]] Eigen::Map<const Eigen::ArrayXd> as_array(const Series& v) noexcept {
    return Eigen::Map<const Eigen::ArrayXd>(v.data(),
                                            static_cast<Eigen::Index>(v.size()));
}

void require_length(std::size_t L, const char* op) {
    if (L < constants::MIN_KERNEL_LENGTH) {
        throw InvalidParameter(fmt::format(
            "{}: kernel length {} is below the minimum of {}",
            op, L, constants::MIN_KERNEL_LENGTH));
    }
}

void require_finite_param(double value, const char* name, const char* op) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(fmt::format("{}: parameter {} is {}", op, name, value));
    }
}

/// x = linspace(startpt, endpt, L), after validating the bounds.
[[nodiscard]] Eigen::ArrayXd sample(std::size_t L,
                                    const KernelOptions& options,
                                    const char* op) {
    require_finite_param(options.startpt, "startpt", op);
    require_finite_param(options.endpt, "endpt", op);
    if (options.startpt == options.endpt) {
        throw DegenerateInput(fmt::format(
            "{}: zero-width sampling range [{}, {}]",
            op, options.startpt, options.endpt));
    }
    return Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(L),
                                     options.startpt, options.endpt);
}

/// Validate the samples and optionally zero-normalize them.
[[nodiscard]] Series normalized(const Eigen::ArrayXd& values,
                                bool zero_norm_requested,
                                const char* op) {
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw DomainError(fmt::format(
                "{}: sample {} evaluates to {}", op, i, values[i]));
        }
    }
    Series out(values.data(), values.data() + values.size());
    if (zero_norm_requested) {
        return zero_norm(out);
    }
    return out;
}

/// Divide a zero-normed kernel by its peak magnitude when that exceeds 1.
[[nodiscard]] Series finish(Series kernel, bool zero_norm_requested) {
    if (!zero_norm_requested) return kernel;

    Eigen::Map<Eigen::ArrayXd> k(kernel.data(), static_cast<Eigen::Index>(kernel.size()));
    const double peak = k.abs().maxCoeff();
    if (peak > 1.0) {
        k /= peak;
    }
    return kernel;
}

/// half + reverse(half), the symmetric double cusp.
[[nodiscard]] Eigen::ArrayXd mirror_sum(const Series& half) {
    const auto h = as_array(half);
    return h + h.reverse();
}

// ─── Unscaled parts ───────────────────────────────────────────────────────────

[[nodiscard]] Series power_law_zero_cusp_part(std::size_t L, double b,
                                              const KernelOptions& options) {
    constexpr const char* op = "power_law_zero_cusp";
    require_length(L, op);
    require_finite_param(b, "b", op);

    Eigen::ArrayXd res = sample(L, options, op).pow(-b);
    res.head(midpoint(L)).setZero();
    return normalized(res, options.zero_norm, op);
}

[[nodiscard]] Series power_zero_cusp_part(std::size_t L, double b,
                                          const KernelOptions& options) {
    constexpr const char* op = "power_zero_cusp";
    require_length(L, op);
    require_finite_param(b, "b", op);

    Eigen::ArrayXd res = sample(L, options, op).pow(b);
    res.tail(res.size() - midpoint(L)).setZero();
    return normalized(res, options.zero_norm, op);
}

[[nodiscard]] Series exp_zero_cusp_part(std::size_t L, double a,
                                        const KernelOptions& options) {
    constexpr const char* op = "exp_zero_cusp";
    require_length(L, op);
    require_finite_param(a, "a", op);

    Eigen::ArrayXd res = (a * sample(L, options, op)).exp();
    res.tail(res.size() - midpoint(L)).setZero();
    return normalized(res, options.zero_norm, op);
}

[[nodiscard]] Series power_cusp_part(std::size_t L, double b,
                                     const KernelOptions& options) {
    const Series half = power_zero_cusp_part(L, b, options);
    return normalized(mirror_sum(half), options.zero_norm, "power_cusp");
}

}  // namespace

// ─── Step ─────────────────────────────────────────────────────────────────────

Series haar(std::size_t L, const KernelOptions& options) {
    require_length(L, "haar");

    Eigen::ArrayXd res = Eigen::ArrayXd::Constant(static_cast<Eigen::Index>(L), -1.0);
    res.tail(res.size() - midpoint(L)).setConstant(1.0);
    return finish(normalized(res, options.zero_norm, "haar"), options.zero_norm);
}

// ─── Half Cusps ───────────────────────────────────────────────────────────────

Series power_law_zero_cusp(std::size_t L, double b, const KernelOptions& options) {
    return finish(power_law_zero_cusp_part(L, b, options), options.zero_norm);
}

Series power_zero_cusp(std::size_t L, double b, const KernelOptions& options) {
    return finish(power_zero_cusp_part(L, b, options), options.zero_norm);
}

Series exp_zero_cusp(std::size_t L, double a, const KernelOptions& options) {
    return finish(exp_zero_cusp_part(L, a, options), options.zero_norm);
}

// ─── Double Cusps ─────────────────────────────────────────────────────────────

Series power_law_cusp(std::size_t L, double b, const KernelOptions& options) {
    const Series half = power_law_zero_cusp_part(L, b, options);
    return finish(normalized(mirror_sum(half), options.zero_norm, "power_law_cusp"),
                  options.zero_norm);
}

Series power_cusp(std::size_t L, double b, const KernelOptions& options) {
    return finish(power_cusp_part(L, b, options), options.zero_norm);
}

Series exp_cusp(std::size_t L, double a, const KernelOptions& options) {
    const Series half = exp_zero_cusp_part(L, a, options);
    return finish(normalized(mirror_sum(half), options.zero_norm, "exp_cusp"),
                  options.zero_norm);
}

// ─── Pitchfork ────────────────────────────────────────────────────────────────

Series pitchfork(std::size_t L, double b, const KernelOptions& options) {
    require_finite_param(b, "b", "pitchfork");

    const Series tail   = power_zero_cusp_part(L, 2.0 * b, options);
    const Series center = power_cusp_part(L, b, options);

    const auto t = as_array(tail);
    const Eigen::ArrayXd res = t.reverse() + as_array(center) + t;
    return finish(normalized(res, options.zero_norm, "pitchfork"), options.zero_norm);
}

}  // namespace shocklet::kernels
