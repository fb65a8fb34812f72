/// @file src/normalize/diff.cpp
/// @brief Causal backward difference.

#include "shocklet/normalize.hpp"
#include "shocklet/errors.hpp"

namespace shocklet {

Series diff(std::span<const double> sequence, bool ghost) {
    if (sequence.empty()) {
        throw InvalidParameter("diff: input is empty");
    }

    Series out;
    out.reserve(ghost ? sequence.size() : sequence.size() - 1);

    // The ghost sample repeats x[0], so the first difference is exactly zero.
    if (ghost) {
        out.push_back(0.0);
    }
    for (std::size_t n = 1; n < sequence.size(); ++n) {
        out.push_back(sequence[n] - sequence[n - 1]);
    }
    return out;
}

}  // namespace shocklet
