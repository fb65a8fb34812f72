/**
 * @file  prop_top_k_order.cpp
 * @brief Property: top_k returns the k largest values, strongest first
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_top_k_order
 *
 * Labels are the input positions, so every returned pair can be checked
 * against the input and no value may be reported twice.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <set>
#include <vector>

#include "shocklet/windows.hpp"

using namespace shocklet;

int main() {
    bool ok = true;

    ok &= rc::check(
        "top_k_order: k largest values, descending, each from its own label",
        []() {
            const auto n = static_cast<std::size_t>(*rc::gen::inRange(1, 300));
            const auto k = static_cast<std::size_t>(*rc::gen::inRange<int>(1, static_cast<int>(n) + 1));

            std::vector<double> values(n);
            std::vector<std::size_t> labels(n);
            for (std::size_t i = 0; i < n; ++i) {
                values[i] = *rc::gen::inRange(-1000, 1001) / 10.0;
                labels[i] = i;
            }

            const auto top = windows::top_k(values, labels, k);
            RC_ASSERT(top.size() == k);

            std::set<std::size_t> seen;
            for (std::size_t i = 0; i < k; ++i) {
                const auto& [label, value] = top[i];
                RC_ASSERT(values[label] == value);
                RC_ASSERT(seen.insert(label).second);
                if (i > 0) RC_ASSERT(top[i - 1].second >= value);
            }

            // Nothing left out beats the weakest value kept.
            const double weakest = top.back().second;
            for (std::size_t i = 0; i < n; ++i) {
                if (!seen.contains(i)) RC_ASSERT(values[i] <= weakest);
            }
        }
    );

    return ok ? 0 : 1;
}
