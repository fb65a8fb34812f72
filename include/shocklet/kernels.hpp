#pragma once

/// @file include/shocklet/kernels.hpp
/// @brief Shocklet kernel library: parametric template shapes.
///
/// # Module: Kernel Library
///
/// ## Responsibility
/// Synthesize fixed-length template arrays ("kernels") that a cusplet
/// transform correlates against a series to expose abrupt, asymmetric
/// transitions.
///
/// ## Families
/// Every family except `haar` is built from a half cusp sampled on
/// x = linspace(startpt, endpt, L) and bisected at m = L / 2:
///
///   power_zero_cusp(L, b)     = x^b,       zero for i >= m
///   power_law_zero_cusp(L, b) = x^(-b),    zero for i <  m
///   exp_zero_cusp(L, a)       = exp(a x),  zero for i >= m
///   power_law_cusp(L, b)      = plzc + reverse(plzc)
///   power_cusp(L, b)          = pzc  + reverse(pzc)
///   exp_cusp(L, a)            = ezc  + reverse(ezc)
///   pitchfork(L, b)           = reverse(pzc(2b)) + power_cusp(b) + pzc(2b)
///   haar(L)                   = -1 for i < m, +1 for i >= m
///
/// `power_law_cusp` is the only double cusp built on the inverse-power half;
/// `power_cusp` and `pitchfork` use the direct-power half.
///
/// ## Zero-Normalization
/// With `KernelOptions::zero_norm` set (default), every part of a composed
/// family is passed through zero_norm and the composed sum is passed through
/// it again, since the sum of two zero-sum parts is not itself confined to
/// [-1, 1]. The returned kernel alone is then divided by its peak magnitude
/// if that exceeds 1, so it lies in [-1, 1] and sums to zero within
/// ZERO_SUM_TOLERANCE * L.
///
/// ## Guarantees
/// - Output length is exactly L
/// - Deterministic: identical arguments give bit-identical kernels
/// - Invalid input throws (see errors.hpp); no NaN or Inf is ever returned

#include "shocklet/constants.hpp"
#include "shocklet/types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace shocklet::kernels {

// ─── KernelOptions ────────────────────────────────────────────────────────────

/// Construction options shared by all families.
struct KernelOptions {
    bool   zero_norm = true;                        ///< Apply zero_norm to the result
    double startpt   = constants::DEFAULT_STARTPT;  ///< Left sampling bound
    double endpt     = constants::DEFAULT_ENDPT;    ///< Right sampling bound
};

// ─── ShapeFamily ──────────────────────────────────────────────────────────────

enum class ShapeFamily : std::uint8_t {
    Haar,
    PowerLawZeroCusp,
    PowerLawCusp,
    PowerZeroCusp,
    PowerCusp,
    Pitchfork,
    ExpZeroCusp,
    ExpCusp,
};

/// Every family, in declaration order.
[[nodiscard]] const std::array<ShapeFamily, 8>& all_families() noexcept;

/// Canonical snake_case name, e.g. "power_law_cusp".
[[nodiscard]] std::string_view to_string(ShapeFamily family) noexcept;

/// Inverse of to_string. Returns nullopt for an unknown name.
[[nodiscard]] std::optional<ShapeFamily> parse_family(std::string_view name) noexcept;

/// Number of numeric shape parameters the family takes (0 or 1).
[[nodiscard]] std::size_t parameter_count(ShapeFamily family) noexcept;

// ─── KernelShape ──────────────────────────────────────────────────────────────

/// One struct per family, each carrying its own typed parameters.
namespace shape {

struct Haar {};
struct PowerLawZeroCusp { double b; };  ///< Inverse-power exponent
struct PowerLawCusp     { double b; };
struct PowerZeroCusp    { double b; };  ///< Direct-power exponent
struct PowerCusp        { double b; };
struct Pitchfork        { double b; };  ///< Central cusp degree; tails use 2b
struct ExpZeroCusp      { double a; };  ///< Exponential rate
struct ExpCusp          { double a; };

} // namespace shape

using KernelShape = std::variant<shape::Haar,
                                 shape::PowerLawZeroCusp,
                                 shape::PowerLawCusp,
                                 shape::PowerZeroCusp,
                                 shape::PowerCusp,
                                 shape::Pitchfork,
                                 shape::ExpZeroCusp,
                                 shape::ExpCusp>;

[[nodiscard]] ShapeFamily family_of(const KernelShape& shape) noexcept;

/// Build a shape from a family and its positional parameters.
///
/// # Throws
/// - InvalidParameter if `params.size() != parameter_count(family)`
[[nodiscard]] KernelShape make_shape(ShapeFamily family,
                                     std::span<const double> params);

/// Diagnostic rendering, e.g. "pitchfork(b=1.5)" or "haar()".
[[nodiscard]] std::string describe(const KernelShape& shape);

// ─── Family Generators ────────────────────────────────────────────────────────
//
// All generators throw:
//   InvalidParameter : L < 2, or a non-finite parameter / sampling bound
//   DegenerateInput  : startpt == endpt, or a composed result that is
//                      constant (zero_norm cannot rescale it)
//   DomainError      : a sampled value is non-finite (exp overflow, or
//                      x <= 0 raised to a negative or fractional power)

[[nodiscard]] Series haar(std::size_t L, const KernelOptions& options = {});

[[nodiscard]] Series power_law_zero_cusp(std::size_t L, double b,
                                         const KernelOptions& options = {});

[[nodiscard]] Series power_law_cusp(std::size_t L, double b,
                                    const KernelOptions& options = {});

[[nodiscard]] Series power_zero_cusp(std::size_t L, double b,
                                     const KernelOptions& options = {});

[[nodiscard]] Series power_cusp(std::size_t L, double b,
                                const KernelOptions& options = {});

[[nodiscard]] Series pitchfork(std::size_t L, double b,
                               const KernelOptions& options = {});

[[nodiscard]] Series exp_zero_cusp(std::size_t L, double a,
                                   const KernelOptions& options = {});

[[nodiscard]] Series exp_cusp(std::size_t L, double a,
                              const KernelOptions& options = {});

// ─── Dispatch ─────────────────────────────────────────────────────────────────

/// Generate a kernel of length `L` for `shape`.
[[nodiscard]] Series generate_kernel(const KernelShape& shape,
                                     std::size_t L,
                                     const KernelOptions& options = {});

/// Generate a kernel from a family name and positional parameters.
///
/// # Throws
/// - InvalidParameter for an unknown family name or a wrong parameter count,
///   plus everything the family generator throws
[[nodiscard]] Series generate_kernel(std::string_view family,
                                     std::size_t L,
                                     std::span<const double> params,
                                     const KernelOptions& options = {});

} // namespace shocklet::kernels
