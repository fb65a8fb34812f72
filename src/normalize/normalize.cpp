/// @file src/normalize/normalize.cpp
/// @brief zero_norm, z-score normalization and per-row normalization.
///
/// Series arguments are viewed through Eigen::Map so that the elementwise
/// arithmetic runs on Eigen arrays without copying the input.

#include "shocklet/normalize.hpp"
#include "shocklet/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <numeric>

namespace shocklet {

namespace {

using ConstArrayMap = Eigen::Map<const Eigen::ArrayXd>;

[[nodiscard]] ConstArrayMap as_array(std::span<const double> v) noexcept {
    return ConstArrayMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

template <typename Derived>
[[nodiscard]] Series to_series(const Eigen::ArrayBase<Derived>& expr) {
    const Eigen::ArrayXd a = expr;
    return Series(a.data(), a.data() + a.size());
}

/// Reject empty or non-finite input to `op`.
void require_finite(std::span<const double> v, const char* op) {
    if (v.empty()) {
        throw InvalidParameter(fmt::format("{}: input is empty", op));
    }
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) {
            throw InvalidParameter(
                fmt::format("{}: non-finite value {} at index {}", op, v[i], i));
        }
    }
}

void require_usable_stats(double mean, double stddev, const char* op) {
    if (!std::isfinite(mean) || !std::isfinite(stddev)) {
        throw DegenerateInput(fmt::format(
            "{}: non-finite statistics (mean={}, stddev={})", op, mean, stddev));
    }
    if (stddev == 0.0) {
        throw DegenerateInput(fmt::format("{}: stddev is zero", op));
    }
}

/// Mean of all values. Precondition: non-empty.
[[nodiscard]] double mean_of(std::span<const double> v) noexcept {
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

/// Population std-dev (n denominator).
[[nodiscard]] double population_stddev(std::span<const double> v,
                                       double mean) noexcept {
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size()));
}

}  // namespace

// ─── zero_norm ────────────────────────────────────────────────────────────────

Series zero_norm(std::span<const double> arr) {
    require_finite(arr, "zero_norm");

    const auto x = as_array(arr);
    const double lo = x.minCoeff();
    const double hi = x.maxCoeff();
    if (hi == lo) {
        throw DegenerateInput(fmt::format(
            "zero_norm: constant input (max == min == {}) over {} samples",
            hi, arr.size()));
    }
    if (!std::isfinite(hi - lo)) {
        throw DomainError(fmt::format(
            "zero_norm: range [{}, {}] overflows a double", lo, hi));
    }

    const Eigen::ArrayXd r = 2.0 * (x - lo) / (hi - lo) - 1.0;
    return to_series(r - r.mean());
}

// ─── normalize / renormalize / denormalize ────────────────────────────────────

NormalizedSeries normalize(std::span<const double> arr) {
    require_finite(arr, "normalize");

    const double m = mean_of(arr);
    const double s = population_stddev(arr, m);
    if (!std::isfinite(m) || !std::isfinite(s)) {
        throw DomainError(fmt::format(
            "normalize: statistics overflow (mean={}, stddev={})", m, s));
    }
    if (s == 0.0) {
        throw DegenerateInput(fmt::format(
            "normalize: zero variance over {} samples (value {})",
            arr.size(), m));
    }
    return NormalizedSeries{
        .values = to_series((as_array(arr) - m) / s),
        .mean   = m,
        .stddev = s,
    };
}

Series renormalize(std::span<const double> arr, double mean, double stddev) {
    require_finite(arr, "renormalize");
    require_usable_stats(mean, stddev, "renormalize");
    return to_series((as_array(arr) - mean) / stddev);
}

Series denormalize(std::span<const double> arr, double mean, double stddev) {
    require_finite(arr, "denormalize");
    require_usable_stats(mean, stddev, "denormalize");
    return to_series(as_array(arr) * stddev + mean);
}

// ─── row_normalize / row_unnormalize ──────────────────────────────────────────

RowNormalized row_normalize(const Matrix& X) {
    if (X.cols() == 0) {
        throw InvalidParameter("row_normalize: matrix has no columns");
    }

    RowNormalized out{
        .values  = X,
        .means   = Vector::Zero(X.rows()),
        .stddevs = Vector::Zero(X.rows()),
    };

    for (Eigen::Index row = 0; row < X.rows(); ++row) {
        const double m = X.row(row).mean();
        const double s = std::sqrt((X.row(row).array() - m).square().mean());
        if (!std::isfinite(s) || s == 0.0) {
            throw DegenerateInput(fmt::format(
                "row_normalize: row {} has stddev {} (mean {})", row, s, m));
        }
        out.values.row(row).array() = (X.row(row).array() - m) / s;
        out.means[row]   = m;
        out.stddevs[row] = s;
    }
    return out;
}

Matrix row_unnormalize(const Matrix& values,
                       const Vector& means,
                       const Vector& stddevs) {
    if (means.size() != values.rows() || stddevs.size() != values.rows()) {
        throw InvalidParameter(fmt::format(
            "row_unnormalize: {} rows but {} means and {} stddevs",
            values.rows(), means.size(), stddevs.size()));
    }

    Matrix out = values;
    for (Eigen::Index row = 0; row < out.rows(); ++row) {
        out.row(row).array() = out.row(row).array() * stddevs[row] + means[row];
    }
    return out;
}

Matrix row_unnormalize(const RowNormalized& normalized) {
    return row_unnormalize(normalized.values, normalized.means, normalized.stddevs);
}

}  // namespace shocklet
