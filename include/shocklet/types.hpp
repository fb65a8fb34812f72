#pragma once

/// @file include/shocklet/types.hpp
/// @brief Shared value types for the shocklet library.
///
/// All modules include this file. One-dimensional series are plain
/// `std::vector<double>`; two-dimensional data uses Eigen's dynamic matrix.

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace shocklet {

/// A one-dimensional real-valued series: a time series, a kernel, or an
/// indicator (response) array.
using Series = std::vector<double>;

/// Row-major view of the world: each row is one observation sequence.
using Matrix = Eigen::MatrixXd;

/// Per-row statistics vector, one entry per Matrix row.
using Vector = Eigen::VectorXd;

/// Ordered indices into a data array over which a local extremum is sought.
/// Windows may be non-contiguous and may overlap other windows.
using Window = std::vector<std::size_t>;

/// Ordered, mutually independent collection of windows.
using WindowSet = std::vector<Window>;

} // namespace shocklet
