#pragma once

/// @file include/shocklet/windows.hpp
/// @brief Window-local extrema and global top-k ranking.
///
/// # Module: Window Extraction Utilities
///
/// ## Responsibility
/// Post-process an indicator array produced by a cusplet transform:
///   - window_argmaxes: the peak of each window, as a global data index
///   - top_k:           the k strongest labelled indicators, strongest first
///
/// ## Guarantees
/// - Windows are processed independently and may overlap or be sparse
/// - Ties inside a window resolve to the first index in window order
/// - top_k selects with std::nth_element (O(n)) and sorts only the k
///   selected items (O(k log k)); ties between equal values are ordered
///   arbitrarily

#include "shocklet/errors.hpp"
#include "shocklet/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <span>
#include <utility>
#include <vector>

namespace shocklet::windows {

/// For each window, the index into `data` of its largest selected value.
///
/// # Returns
/// One global index per window, in window order.
///
/// # Throws
/// - InvalidParameter if a window is empty or names an index >= data.size()
/// - DomainError      if `data` holds a NaN or infinite value
[[nodiscard]] std::vector<std::size_t>
window_argmaxes(const WindowSet& windows, std::span<const double> data);

/// Windows of `width` consecutive indices over [0, n), one starting every
/// `stride` indices. They overlap when stride < width and leave gaps when
/// stride > width. A window running past n is truncated at n.
///
/// # Throws
/// - InvalidParameter if `width` or `stride` is zero
[[nodiscard]] WindowSet contiguous_windows(std::size_t n,
                                           std::size_t width,
                                           std::size_t stride);

/// The `k` largest entries of `values`, paired with their labels and sorted
/// in descending order of value.
///
/// # Throws
/// - InvalidParameter if k == 0, k > values.size(), or the label count
///   differs from the value count
/// - DomainError      if a value is NaN or infinite
template <typename Label>
[[nodiscard]] std::vector<std::pair<Label, double>>
top_k(std::span<const double> values, std::span<const Label> labels, std::size_t k) {
    if (labels.size() != values.size()) {
        throw InvalidParameter(fmt::format(
            "top_k: {} values but {} labels", values.size(), labels.size()));
    }
    if (k == 0 || k > values.size()) {
        throw InvalidParameter(fmt::format(
            "top_k: k = {} must lie in [1, {}]", k, values.size()));
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw DomainError(fmt::format(
                "top_k: non-finite value {} at index {}", values[i], i));
        }
    }

    std::vector<std::size_t> order(values.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    const auto by_value_desc = [&values](std::size_t a, std::size_t b) {
        return values[a] > values[b];
    };
    std::nth_element(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k - 1),
                     order.end(), by_value_desc);
    std::sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), by_value_desc);

    std::vector<std::pair<Label, double>> top;
    top.reserve(k);
    for (std::size_t i = 0; i < k; ++i) {
        top.emplace_back(labels[order[i]], values[order[i]]);
    }
    return top;
}

/// Convenience overload for labels held in a vector.
template <typename Label>
[[nodiscard]] std::vector<std::pair<Label, double>>
top_k(std::span<const double> values, const std::vector<Label>& labels, std::size_t k) {
    return top_k<Label>(values, std::span<const Label>(labels), k);
}

} // namespace shocklet::windows
