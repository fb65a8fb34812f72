/// @file src/weighting/weighting_registry.cpp
/// @brief WeightingRegistry storage, lookup and the builtin instance.

#include "shocklet/weighting.hpp"
#include "shocklet/errors.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace shocklet::weighting {

namespace {

WeightingRegistry make_builtin_registry() {
    WeightingRegistry registry;
    registry.add("max_change", [](std::span<const double> arr) {
        return max_change(arr);
    });
    registry.add("max_rel_change", [](std::span<const double> arr) {
        return max_rel_change(arr);
    });
    return registry;
}

}  // namespace

// ─── add ──────────────────────────────────────────────────────────────────────

WeightingFunction WeightingRegistry::add(std::string name, WeightingFunction function) {
    if (name.empty()) {
        throw InvalidParameter("WeightingRegistry::add: name is empty");
    }
    if (!function) {
        throw InvalidParameter(fmt::format(
            "WeightingRegistry::add: '{}' has no callable target", name));
    }
    if (contains(name)) {
        throw InvalidParameter(fmt::format(
            "WeightingRegistry::add: '{}' is already registered", name));
    }

    entries_.push_back(WeightingEntry{std::move(name), function});
    return function;
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

const WeightingFunction* WeightingRegistry::find(std::string_view name) const noexcept {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [name](const WeightingEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &it->function;
}

const WeightingFunction& WeightingRegistry::at(std::string_view name) const {
    const WeightingFunction* fn = find(name);
    if (fn == nullptr) {
        throw InvalidParameter(fmt::format(
            "WeightingRegistry::at: no weighting function named '{}'", name));
    }
    return *fn;
}

bool WeightingRegistry::contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
}

std::vector<std::string> WeightingRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(e.name);
    }
    return out;
}

// ─── builtin ──────────────────────────────────────────────────────────────────

const WeightingRegistry& WeightingRegistry::builtin() {
    // Function-local static: initialized exactly once, thread-safe.
    static const WeightingRegistry registry = make_builtin_registry();
    return registry;
}

// ─── score_all ────────────────────────────────────────────────────────────────

std::vector<std::pair<std::string, double>>
score_all(const WeightingRegistry& registry, std::span<const double> arr) {
    std::vector<std::pair<std::string, double>> scores;
    scores.reserve(registry.size());
    for (const auto& entry : registry) {
        scores.emplace_back(entry.name, entry.function(arr));
    }
    return scores;
}

}  // namespace shocklet::weighting
