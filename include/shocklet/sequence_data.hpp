#pragma once

/// @file include/shocklet/sequence_data.hpp
/// @brief Lagged moving-window tensors for sequence regression/classification.
///
/// # Module: Sequence Data
///
/// ## Responsibility
/// Turn a one-dimensional series into row-per-example matrices:
///
///   make_moving_tensor(s, lag)         row i = s[i .. i+lag),  n - lag rows
///   make_seq_prediction_data(s, p, q)  X row i = s[i .. i+p)
///                                      y row i = s[i+p .. i+p+q)
///                                      n - p - q rows each
///
/// Each y row is the continuation of the matching X row, so (X, y) pairs can
/// train a model that predicts the next q samples from the previous p.

#include "shocklet/types.hpp"

#include <cstddef>
#include <span>

namespace shocklet::sequence {

/// Paired input/target matrices with one example per row.
struct SequenceDataset {
    Matrix X;  ///< Inputs, (n - x_lag - y_lag) x x_lag
    Matrix y;  ///< Targets, (n - x_lag - y_lag) x y_lag
};

/// Stack the first n - lag windows of length `lag` as matrix rows.
///
/// # Throws
/// - InvalidParameter if lag == 0 or lag >= sequence.size()
[[nodiscard]] Matrix make_moving_tensor(std::span<const double> sequence,
                                        std::size_t lag);

/// Build (X, y) example pairs: X holds `x_lag` samples, y the `y_lag`
/// samples that follow.
///
/// # Throws
/// - InvalidParameter if either lag is zero or x_lag + y_lag >= sequence.size()
[[nodiscard]] SequenceDataset make_seq_prediction_data(std::span<const double> sequence,
                                                       std::size_t x_lag,
                                                       std::size_t y_lag);

} // namespace shocklet::sequence
