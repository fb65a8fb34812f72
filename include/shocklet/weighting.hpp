#pragma once

/// @file include/shocklet/weighting.hpp
/// @brief Weighting functions and the registry that catalogs them.
///
/// # Module: Weighting Function Registry
///
/// ## Responsibility
/// Score an indicator array (the response of a cusplet transform) with a
/// scalar, so that series or windows can be ranked by the strength of the
/// shocklets they contain.
///
/// ## Registry Model
/// A WeightingRegistry is an ordered list of (name, function) entries. It is
/// filled by add() while it is being built and handed to consumers as a
/// `const WeightingRegistry&` afterwards. The process-wide builtin() registry
/// is constructed once, on first use, from the static list of built-in
/// functions, and is never written again; concurrent reads need no locking.
///
/// ## Function Contract
/// A weighting function is pure: `span<const double> -> double`, no side
/// effects, and accepts arrays of length >= 2.

#include "shocklet/types.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shocklet::weighting {

using WeightingFunction = std::function<double(std::span<const double>)>;

/// A named scoring function as stored in the registry.
struct WeightingEntry {
    std::string       name;
    WeightingFunction function;
};

// ─── Built-in Functions ───────────────────────────────────────────────────────

/// max(arr) - min(arr).
///
/// # Throws
/// - InvalidParameter if `arr` is empty
/// - DomainError      if `arr` holds a non-finite value
[[nodiscard]] double max_change(std::span<const double> arr);

/// Spread of the log10 backward differences of `arr`.
///
/// If `neg` is set, `arr` is first shifted to `arr - min(arr) + 1` so that
/// every value is at least 1. Returns max(d) - min(d) with
/// d = diff(log10(arr), ghost = false).
///
/// # Throws
/// - InvalidParameter if `arr` has fewer than 2 values
/// - DomainError      if a (shifted) value is <= 0 or non-finite
[[nodiscard]] double max_rel_change(std::span<const double> arr, bool neg = true);

// ─── WeightingRegistry ────────────────────────────────────────────────────────

class WeightingRegistry {
public:
    using const_iterator = std::vector<WeightingEntry>::const_iterator;

    WeightingRegistry() = default;

    /// Append `function` under `name` and return it unchanged.
    ///
    /// # Throws
    /// - InvalidParameter if `name` is empty or already registered, or if
    ///   `function` is empty
    WeightingFunction add(std::string name, WeightingFunction function);

    /// Registered function for `name`, or nullptr.
    [[nodiscard]] const WeightingFunction* find(std::string_view name) const noexcept;

    /// Registered function for `name`.
    ///
    /// # Throws
    /// - InvalidParameter if `name` is not registered
    [[nodiscard]] const WeightingFunction& at(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// Names in registration order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] const std::vector<WeightingEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    /// The process-wide registry holding max_change and max_rel_change, in
    /// that order. Built on first call; read-only afterwards.
    [[nodiscard]] static const WeightingRegistry& builtin();

private:
    std::vector<WeightingEntry> entries_;
};

/// Score `arr` with every function in `registry`, in registration order.
[[nodiscard]] std::vector<std::pair<std::string, double>>
score_all(const WeightingRegistry& registry, std::span<const double> arr);

} // namespace shocklet::weighting
