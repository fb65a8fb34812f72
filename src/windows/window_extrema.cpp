/// @file src/windows/window_extrema.cpp
/// @brief window_argmaxes and contiguous_windows.

#include "shocklet/windows.hpp"

#include <cmath>

namespace shocklet::windows {

std::vector<std::size_t>
window_argmaxes(const WindowSet& windows, std::span<const double> data) {
    for (std::size_t i = 0; i < data.size(); ++i) {
        if (!std::isfinite(data[i])) {
            throw DomainError(fmt::format(
                "window_argmaxes: non-finite value {} at index {}", data[i], i));
        }
    }

    std::vector<std::size_t> argmaxes;
    argmaxes.reserve(windows.size());

    for (std::size_t w = 0; w < windows.size(); ++w) {
        const Window& window = windows[w];
        if (window.empty()) {
            throw InvalidParameter(fmt::format("window_argmaxes: window {} is empty", w));
        }

        std::size_t best = window.front();
        for (std::size_t idx : window) {
            if (idx >= data.size()) {
                throw InvalidParameter(fmt::format(
                    "window_argmaxes: window {} index {} is out of range for {} samples",
                    w, idx, data.size()));
            }
            // Strict comparison keeps the first occurrence of the maximum.
            if (data[idx] > data[best]) best = idx;
        }
        argmaxes.push_back(best);
    }
    return argmaxes;
}

WindowSet contiguous_windows(std::size_t n, std::size_t width, std::size_t stride) {
    if (width == 0 || stride == 0) {
        throw InvalidParameter(fmt::format(
            "contiguous_windows: width ({}) and stride ({}) must be positive",
            width, stride));
    }

    WindowSet windows;
    for (std::size_t start = 0; start < n; start += stride) {
        const std::size_t stop = std::min(n, start + width);
        Window window(stop - start);
        std::iota(window.begin(), window.end(), start);
        windows.push_back(std::move(window));
    }
    return windows;
}

}  // namespace shocklet::windows
