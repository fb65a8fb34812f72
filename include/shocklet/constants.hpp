#pragma once

#include <cstddef>

/// @file include/shocklet/constants.hpp
/// @brief Numeric defaults and tolerances for the shocklet library.

namespace shocklet::constants {

// ─── Kernel Sampling ──────────────────────────────────────────────────────────

/// Default left end of the sampling interval for parametric half cusps.
static constexpr double DEFAULT_STARTPT = 1.0;

/// Default right end of the sampling interval for parametric half cusps.
static constexpr double DEFAULT_ENDPT = 4.0;

/// Smallest kernel length. Every family bisects the kernel at L / 2.
static constexpr std::size_t MIN_KERNEL_LENGTH = 2;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Per-element bound on |sum(kernel)| after zero-normalization.
/// A kernel of length L satisfies |sum| <= ZERO_SUM_TOLERANCE * L.
static constexpr double ZERO_SUM_TOLERANCE = 1e-9;

/// Minimum number of samples accepted by max_rel_change (one difference).
static constexpr std::size_t MIN_WEIGHTING_LENGTH = 2;

} // namespace shocklet::constants
