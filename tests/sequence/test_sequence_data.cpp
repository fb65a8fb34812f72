/// @file tests/sequence/test_sequence_data.cpp
/// @brief Unit tests for moving-window tensors and prediction datasets.

#include <gtest/gtest.h>
#include "shocklet/sequence_data.hpp"
#include "shocklet/errors.hpp"

#include <numeric>
#include <vector>

using namespace shocklet;
using namespace shocklet::sequence;

namespace {

/// {0, 1, 2, ..., n-1}
std::vector<double> ramp(std::size_t n) {
    std::vector<double> v(n);
    std::iota(v.begin(), v.end(), 0.0);
    return v;
}

} // anonymous namespace

// ─── make_moving_tensor ──────────────────────────────────────────────────────

TEST(MovingTensor, ShapeAndContents) {
    const auto seq = ramp(6);
    const Matrix M = make_moving_tensor(seq, 3);
    ASSERT_EQ(M.rows(), 3);
    ASSERT_EQ(M.cols(), 3);
    for (Eigen::Index r = 0; r < M.rows(); ++r) {
        for (Eigen::Index c = 0; c < M.cols(); ++c) {
            EXPECT_DOUBLE_EQ(M(r, c), static_cast<double>(r + c));
        }
    }
}

TEST(MovingTensor, LagOneIsAColumn) {
    const std::vector<double> seq = {4.0, 3.0, 2.0};
    const Matrix M = make_moving_tensor(seq, 1);
    ASSERT_EQ(M.rows(), 2);
    ASSERT_EQ(M.cols(), 1);
    EXPECT_DOUBLE_EQ(M(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(M(1, 0), 3.0);
}

TEST(MovingTensor, InvalidLag_ThrowsInvalidParameter) {
    const auto seq = ramp(4);
    EXPECT_THROW((void)make_moving_tensor(seq, 0), InvalidParameter);
    EXPECT_THROW((void)make_moving_tensor(seq, 4), InvalidParameter);
    EXPECT_THROW((void)make_moving_tensor(seq, 9), InvalidParameter);
}

// ─── make_seq_prediction_data ────────────────────────────────────────────────

TEST(SeqPredictionData, TargetsFollowInputs) {
    const auto seq = ramp(10);
    const auto data = make_seq_prediction_data(seq, 3, 2);
    ASSERT_EQ(data.X.rows(), 5);
    ASSERT_EQ(data.X.cols(), 3);
    ASSERT_EQ(data.y.rows(), 5);
    ASSERT_EQ(data.y.cols(), 2);
    for (Eigen::Index r = 0; r < data.X.rows(); ++r) {
        // The first target sample is the one right after the last input sample.
        EXPECT_DOUBLE_EQ(data.y(r, 0), data.X(r, 2) + 1.0);
        EXPECT_DOUBLE_EQ(data.X(r, 0), static_cast<double>(r));
        EXPECT_DOUBLE_EQ(data.y(r, 1), static_cast<double>(r + 4));
    }
}

TEST(SeqPredictionData, InvalidLags_ThrowInvalidParameter) {
    const auto seq = ramp(5);
    EXPECT_THROW((void)make_seq_prediction_data(seq, 0, 1), InvalidParameter);
    EXPECT_THROW((void)make_seq_prediction_data(seq, 1, 0), InvalidParameter);
    EXPECT_THROW((void)make_seq_prediction_data(seq, 3, 2), InvalidParameter);
}
