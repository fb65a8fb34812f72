/// @file tests/kernels/test_kernel_shape.cpp
/// @brief Unit tests for ShapeFamily names and KernelShape dispatch.

#include <gtest/gtest.h>
#include "shocklet/kernels.hpp"
#include "shocklet/errors.hpp"

#include <string>
#include <vector>

using namespace shocklet;
using namespace shocklet::kernels;

// ─── Names ───────────────────────────────────────────────────────────────────

TEST(ShapeFamily, CanonicalNames) {
    EXPECT_EQ(to_string(ShapeFamily::Haar),             "haar");
    EXPECT_EQ(to_string(ShapeFamily::PowerLawZeroCusp), "power_law_zero_cusp");
    EXPECT_EQ(to_string(ShapeFamily::PowerLawCusp),     "power_law_cusp");
    EXPECT_EQ(to_string(ShapeFamily::PowerZeroCusp),    "power_zero_cusp");
    EXPECT_EQ(to_string(ShapeFamily::PowerCusp),        "power_cusp");
    EXPECT_EQ(to_string(ShapeFamily::Pitchfork),        "pitchfork");
    EXPECT_EQ(to_string(ShapeFamily::ExpZeroCusp),      "exp_zero_cusp");
    EXPECT_EQ(to_string(ShapeFamily::ExpCusp),          "exp_cusp");
}

TEST(ShapeFamily, ParseRoundTripsEveryFamily) {
    EXPECT_EQ(all_families().size(), 8u);
    for (ShapeFamily family : all_families()) {
        const auto parsed = parse_family(to_string(family));
        ASSERT_TRUE(parsed.has_value()) << to_string(family);
        EXPECT_EQ(*parsed, family);
    }
}

TEST(ShapeFamily, UnknownNameIsNullopt) {
    EXPECT_FALSE(parse_family("sawtooth").has_value());
    EXPECT_FALSE(parse_family("").has_value());
    EXPECT_FALSE(parse_family("Haar").has_value());
}

TEST(ShapeFamily, ParameterCounts) {
    EXPECT_EQ(parameter_count(ShapeFamily::Haar), 0u);
    for (ShapeFamily family : all_families()) {
        if (family != ShapeFamily::Haar) EXPECT_EQ(parameter_count(family), 1u);
    }
}

// ─── make_shape / family_of ──────────────────────────────────────────────────

TEST(KernelShape, MakeShapeCarriesParameter) {
    const std::vector<double> params = {2.5};
    const auto s = make_shape(ShapeFamily::Pitchfork, params);
    ASSERT_TRUE(std::holds_alternative<shape::Pitchfork>(s));
    EXPECT_DOUBLE_EQ(std::get<shape::Pitchfork>(s).b, 2.5);
    EXPECT_EQ(family_of(s), ShapeFamily::Pitchfork);
}

TEST(KernelShape, FamilyOfMatchesMakeShapeForAll) {
    const std::vector<double> one = {1.0};
    for (ShapeFamily family : all_families()) {
        const auto s = family == ShapeFamily::Haar
                     ? make_shape(family, std::span<const double>{})
                     : make_shape(family, one);
        EXPECT_EQ(family_of(s), family) << to_string(family);
    }
}

TEST(KernelShape, WrongParameterCount_ThrowsInvalidParameter) {
    const std::vector<double> two = {1.0, 2.0};
    const std::vector<double> one = {1.0};
    EXPECT_THROW((void)make_shape(ShapeFamily::PowerCusp, two), InvalidParameter);
    EXPECT_THROW((void)make_shape(ShapeFamily::ExpCusp, std::span<const double>{}),
                 InvalidParameter);
    EXPECT_THROW((void)make_shape(ShapeFamily::Haar, one), InvalidParameter);
}

TEST(KernelShape, Describe) {
    EXPECT_EQ(describe(shape::Haar{}), "haar()");
    EXPECT_EQ(describe(shape::PowerCusp{2.0}), "power_cusp(b=2)");
    EXPECT_EQ(describe(shape::ExpZeroCusp{0.5}), "exp_zero_cusp(a=0.5)");
}

// ─── generate_kernel ─────────────────────────────────────────────────────────

TEST(GenerateKernel, VariantDispatchMatchesFreeFunction) {
    EXPECT_EQ(generate_kernel(shape::Haar{}, 10), haar(10));
    EXPECT_EQ(generate_kernel(shape::PowerLawZeroCusp{1.2}, 10), power_law_zero_cusp(10, 1.2));
    EXPECT_EQ(generate_kernel(shape::PowerLawCusp{1.2}, 10), power_law_cusp(10, 1.2));
    EXPECT_EQ(generate_kernel(shape::PowerZeroCusp{1.2}, 10), power_zero_cusp(10, 1.2));
    EXPECT_EQ(generate_kernel(shape::PowerCusp{1.2}, 10), power_cusp(10, 1.2));
    EXPECT_EQ(generate_kernel(shape::Pitchfork{1.2}, 10), pitchfork(10, 1.2));
    EXPECT_EQ(generate_kernel(shape::ExpZeroCusp{0.3}, 10), exp_zero_cusp(10, 0.3));
    EXPECT_EQ(generate_kernel(shape::ExpCusp{0.3}, 10), exp_cusp(10, 0.3));
}

TEST(GenerateKernel, OptionsAreForwarded) {
    const KernelOptions opts{.zero_norm = false, .startpt = 0.5, .endpt = 2.0};
    EXPECT_EQ(generate_kernel(shape::PowerCusp{3.0}, 12, opts), power_cusp(12, 3.0, opts));
}

TEST(GenerateKernel, ByName) {
    const std::vector<double> params = {1.5};
    EXPECT_EQ(generate_kernel("power_law_cusp", 32, params), power_law_cusp(32, 1.5));
    EXPECT_EQ(generate_kernel("haar", 7, std::span<const double>{}), haar(7));
}

TEST(GenerateKernel, UnknownName_ThrowsInvalidParameter) {
    const std::vector<double> params = {1.0};
    EXPECT_THROW((void)generate_kernel("mexican_hat", 16, params), InvalidParameter);
}

TEST(GenerateKernel, ShortLength_ThrowsInvalidParameter) {
    EXPECT_THROW((void)generate_kernel(shape::ExpCusp{1.0}, 1), InvalidParameter);
}
