/// @file src/sequence/sequence_data.cpp
/// @brief Moving-window tensors and (X, y) prediction datasets.

#include "shocklet/sequence_data.hpp"
#include "shocklet/errors.hpp"

#include <fmt/format.h>

namespace shocklet::sequence {

Matrix make_moving_tensor(std::span<const double> sequence, std::size_t lag) {
    if (lag == 0 || lag >= sequence.size()) {
        throw InvalidParameter(fmt::format(
            "make_moving_tensor: lag {} must lie in [1, {})", lag, sequence.size()));
    }

    const auto rows = static_cast<Eigen::Index>(sequence.size() - lag);
    const auto cols = static_cast<Eigen::Index>(lag);

    Matrix out(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            out(r, c) = sequence[static_cast<std::size_t>(r + c)];
        }
    }
    return out;
}

SequenceDataset make_seq_prediction_data(std::span<const double> sequence,
                                         std::size_t x_lag,
                                         std::size_t y_lag) {
    if (x_lag == 0 || y_lag == 0 || x_lag + y_lag >= sequence.size()) {
        throw InvalidParameter(fmt::format(
            "make_seq_prediction_data: lags ({}, {}) leave no examples in {} samples",
            x_lag, y_lag, sequence.size()));
    }

    // Inputs never see the last y_lag samples; targets start after the first window.
    return SequenceDataset{
        .X = make_moving_tensor(sequence.first(sequence.size() - y_lag), x_lag),
        .y = make_moving_tensor(sequence.subspan(x_lag), y_lag),
    };
}

}  // namespace shocklet::sequence
