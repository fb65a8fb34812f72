#pragma once

/// @file include/shocklet/normalize.hpp
/// @brief Array rescaling primitives that feed and post-process kernels.
///
/// # Module: Normalization Utilities
///
/// ## Responsibility
/// Elementwise rescaling of one-dimensional series and per-row rescaling of
/// matrices:
///   - zero_norm:      map to [-1, 1] and shift so the series sums to zero
///   - normalize:      z-score, returning the statistics needed to invert it
///   - renormalize:    z-score against externally supplied statistics
///   - denormalize:    inverse of renormalize
///   - row_normalize / row_unnormalize: per-row z-score and its inverse
///   - diff:           causal backward difference
///
/// ## Formulas
///   zero_norm(x) = s / max(1, max|s|),  s = r - mean(r),
///                  r = 2 (x - min x) / (max x - min x) - 1
///   normalize(x) = (x - μ) / σ,  σ the population standard deviation
///
/// ## Guarantees
/// - Inputs are never mutated; every function returns a new container
/// - Degenerate statistics (constant input, σ = 0) throw DegenerateInput
///   instead of dividing by zero
/// - row_unnormalize(row_normalize(X)) reproduces X to rounding error

#include "shocklet/types.hpp"

#include <span>

namespace shocklet {

// ─── Result Types ─────────────────────────────────────────────────────────────

/// A z-scored series together with the statistics that produced it.
struct NormalizedSeries {
    Series values;  ///< (x - mean) / stddev
    double mean;    ///< Mean of the input series
    double stddev;  ///< Population standard deviation of the input series
};

/// A row-wise z-scored matrix with one (mean, stddev) pair per row.
struct RowNormalized {
    Matrix values;
    Vector means;
    Vector stddevs;
};

// ─── One-Dimensional ──────────────────────────────────────────────────────────

/// 2 * (arr - min) / (max - min) - 1, minus its own mean, so that the result
/// sums to zero. The mean shift can carry one side of an asymmetric input
/// past ±1 (up to, but never reaching, ±2).
///
/// # Throws
/// - InvalidParameter if `arr` is empty or holds a non-finite value
/// - DegenerateInput  if max(arr) == min(arr)
/// - DomainError      if max(arr) - min(arr) overflows
[[nodiscard]] Series zero_norm(std::span<const double> arr);

/// Z-score `arr` and return the mean and population stddev used.
///
/// # Throws
/// - InvalidParameter if `arr` is empty or holds a non-finite value
/// - DegenerateInput  if the standard deviation is zero
/// - DomainError      if the mean or standard deviation overflows
[[nodiscard]] NormalizedSeries normalize(std::span<const double> arr);

/// Z-score `arr` with a previously fitted (mean, stddev).
///
/// # Throws
/// - InvalidParameter if `arr` is empty or holds a non-finite value
/// - DegenerateInput  if `stddev` is zero or either statistic is non-finite
[[nodiscard]] Series renormalize(std::span<const double> arr,
                                 double mean,
                                 double stddev);

/// Undo renormalize: `arr * stddev + mean`.
///
/// # Throws
/// - InvalidParameter if `arr` is empty or holds a non-finite value
/// - DegenerateInput  if `stddev` is zero or either statistic is non-finite
[[nodiscard]] Series denormalize(std::span<const double> arr,
                                 double mean,
                                 double stddev);

/// Backward difference x[n] - x[n-1].
///
/// With `ghost = true` a copy of x[0] is prepended first, so the result has
/// the same length as the input and starts with 0. With `ghost = false` the
/// result has length n - 1. Never looks ahead in time.
///
/// # Throws
/// - InvalidParameter if `sequence` is empty
[[nodiscard]] Series diff(std::span<const double> sequence, bool ghost = true);

// ─── Two-Dimensional ──────────────────────────────────────────────────────────

/// Z-score every row of `X` independently.
///
/// # Throws
/// - InvalidParameter if `X` has no columns
/// - DegenerateInput  if any row is constant
[[nodiscard]] RowNormalized row_normalize(const Matrix& X);

/// Inverse of row_normalize: row r becomes `values.row(r) * stddevs[r] + means[r]`.
///
/// # Throws
/// - InvalidParameter if `means` or `stddevs` does not have one entry per row
[[nodiscard]] Matrix row_unnormalize(const Matrix& values,
                                     const Vector& means,
                                     const Vector& stddevs);

[[nodiscard]] Matrix row_unnormalize(const RowNormalized& normalized);

}  // namespace shocklet
