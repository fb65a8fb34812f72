/// @file src/weighting/weighting_functions.cpp
/// @brief Built-in weighting functions: max_change and max_rel_change.

#include "shocklet/weighting.hpp"
#include "shocklet/constants.hpp"
#include "shocklet/errors.hpp"
#include "shocklet/normalize.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace shocklet::weighting {

double max_change(std::span<const double> arr) {
    if (arr.empty()) {
        throw InvalidParameter("max_change: input is empty");
    }
    for (std::size_t i = 0; i < arr.size(); ++i) {
        if (!std::isfinite(arr[i])) {
            throw DomainError(fmt::format(
                "max_change: non-finite value {} at index {}", arr[i], i));
        }
    }
    const auto [lo, hi] = std::minmax_element(arr.begin(), arr.end());
    return *hi - *lo;
}

double max_rel_change(std::span<const double> arr, bool neg) {
    if (arr.size() < constants::MIN_WEIGHTING_LENGTH) {
        throw InvalidParameter(fmt::format(
            "max_rel_change: needs at least {} values, got {}",
            constants::MIN_WEIGHTING_LENGTH, arr.size()));
    }

    const double shift = neg ? 1.0 - *std::min_element(arr.begin(), arr.end()) : 0.0;

    Series logs;
    logs.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const double v = arr[i] + shift;
        // log10 is undefined here; refuse rather than return NaN or -Inf.
        if (!std::isfinite(v) || v <= 0.0) {
            throw DomainError(fmt::format(
                "max_rel_change: value {} at index {} is outside the domain of log10",
                v, i));
        }
        logs.push_back(std::log10(v));
    }

    const Series logret = diff(logs, false);
    const auto [lo, hi] = std::minmax_element(logret.begin(), logret.end());
    return *hi - *lo;
}

}  // namespace shocklet::weighting
