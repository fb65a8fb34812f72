/// @file src/kernels/kernel_shape.cpp
/// @brief ShapeFamily names, KernelShape construction and dispatch.
///
/// Dispatch visits the KernelShape variant with one overload per family, so
/// adding an alternative without a generator fails to compile.

#include "shocklet/kernels.hpp"
#include "shocklet/errors.hpp"

#include <fmt/format.h>

namespace shocklet::kernels {

namespace {

/// Family name table, indexed by the ShapeFamily underlying value.
constexpr std::array<std::string_view, 8> FAMILY_NAMES = {
    "haar",
    "power_law_zero_cusp",
    "power_law_cusp",
    "power_zero_cusp",
    "power_cusp",
    "pitchfork",
    "exp_zero_cusp",
    "exp_cusp",
};

constexpr std::array<ShapeFamily, 8> FAMILIES = {
    ShapeFamily::Haar,
    ShapeFamily::PowerLawZeroCusp,
    ShapeFamily::PowerLawCusp,
    ShapeFamily::PowerZeroCusp,
    ShapeFamily::PowerCusp,
    ShapeFamily::Pitchfork,
    ShapeFamily::ExpZeroCusp,
    ShapeFamily::ExpCusp,
};

/// Runs the family generator for the visited alternative.
struct Generate {
    std::size_t          L;
    const KernelOptions& options;

    Series operator()(const shape::Haar&) const {
        return haar(L, options);
    }
    Series operator()(const shape::PowerLawZeroCusp& s) const {
        return power_law_zero_cusp(L, s.b, options);
    }
    Series operator()(const shape::PowerLawCusp& s) const {
        return power_law_cusp(L, s.b, options);
    }
    Series operator()(const shape::PowerZeroCusp& s) const {
        return power_zero_cusp(L, s.b, options);
    }
    Series operator()(const shape::PowerCusp& s) const {
        return power_cusp(L, s.b, options);
    }
    Series operator()(const shape::Pitchfork& s) const {
        return pitchfork(L, s.b, options);
    }
    Series operator()(const shape::ExpZeroCusp& s) const {
        return exp_zero_cusp(L, s.a, options);
    }
    Series operator()(const shape::ExpCusp& s) const {
        return exp_cusp(L, s.a, options);
    }
};

/// Renders the visited alternative's parameters.
struct Describe {
    std::string operator()(const shape::Haar&) const { return "haar()"; }
    std::string operator()(const shape::PowerLawZeroCusp& s) const {
        return fmt::format("power_law_zero_cusp(b={})", s.b);
    }
    std::string operator()(const shape::PowerLawCusp& s) const {
        return fmt::format("power_law_cusp(b={})", s.b);
    }
    std::string operator()(const shape::PowerZeroCusp& s) const {
        return fmt::format("power_zero_cusp(b={})", s.b);
    }
    std::string operator()(const shape::PowerCusp& s) const {
        return fmt::format("power_cusp(b={})", s.b);
    }
    std::string operator()(const shape::Pitchfork& s) const {
        return fmt::format("pitchfork(b={})", s.b);
    }
    std::string operator()(const shape::ExpZeroCusp& s) const {
        return fmt::format("exp_zero_cusp(a={})", s.a);
    }
    std::string operator()(const shape::ExpCusp& s) const {
        return fmt::format("exp_cusp(a={})", s.a);
    }
};

}  // namespace

// ─── ShapeFamily ──────────────────────────────────────────────────────────────

const std::array<ShapeFamily, 8>& all_families() noexcept {
    return FAMILIES;
}

std::string_view to_string(ShapeFamily family) noexcept {
    return FAMILY_NAMES[static_cast<std::size_t>(family)];
}

std::optional<ShapeFamily> parse_family(std::string_view name) noexcept {
    for (ShapeFamily family : FAMILIES) {
        if (to_string(family) == name) return family;
    }
    return std::nullopt;
}

std::size_t parameter_count(ShapeFamily family) noexcept {
    return family == ShapeFamily::Haar ? 0 : 1;
}

// ─── KernelShape ──────────────────────────────────────────────────────────────

ShapeFamily family_of(const KernelShape& shape) noexcept {
    // Variant alternatives are declared in ShapeFamily order.
    return FAMILIES[shape.index()];
}

KernelShape make_shape(ShapeFamily family, std::span<const double> params) {
    if (params.size() != parameter_count(family)) {
        throw InvalidParameter(fmt::format(
            "make_shape: {} takes {} parameter(s), got {}",
            to_string(family), parameter_count(family), params.size()));
    }

    switch (family) {
        case ShapeFamily::Haar:             return shape::Haar{};
        case ShapeFamily::PowerLawZeroCusp: return shape::PowerLawZeroCusp{params[0]};
        case ShapeFamily::PowerLawCusp:     return shape::PowerLawCusp{params[0]};
        case ShapeFamily::PowerZeroCusp:    return shape::PowerZeroCusp{params[0]};
        case ShapeFamily::PowerCusp:        return shape::PowerCusp{params[0]};
        case ShapeFamily::Pitchfork:        return shape::Pitchfork{params[0]};
        case ShapeFamily::ExpZeroCusp:      return shape::ExpZeroCusp{params[0]};
        case ShapeFamily::ExpCusp:          return shape::ExpCusp{params[0]};
    }
    throw InvalidParameter(fmt::format(
        "make_shape: unknown family value {}", static_cast<int>(family)));
}

std::string describe(const KernelShape& shape) {
    return std::visit(Describe{}, shape);
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

Series generate_kernel(const KernelShape& shape,
                       std::size_t L,
                       const KernelOptions& options) {
    return std::visit(Generate{L, options}, shape);
}

Series generate_kernel(std::string_view family,
                       std::size_t L,
                       std::span<const double> params,
                       const KernelOptions& options) {
    const auto parsed = parse_family(family);
    if (!parsed) {
        throw InvalidParameter(fmt::format(
            "generate_kernel: unknown shape family '{}'", family));
    }
    return generate_kernel(make_shape(*parsed, params), L, options);
}

}  // namespace shocklet::kernels
