// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "plugins/StaticArithmetic.hpp"
#include "plugins/GeneratedArithmetic.hpp"
#include "plugins/ReflectionArithmetic.hpp"
#include "plugins/SlerpPlugin.hpp"
#include "ArithmeticMetaReg.hpp"
#include "mock/MockTargets.hpp"

using namespace eanim;
using namespace eanim::plugins;

namespace
{
    const entt::any no_data{};

    float quat_angle_between(const glm::quat& a, const glm::quat& b)
    {
        const float d = std::min(1.0f, std::abs(glm::dot(a, b)));
        return 2.0f * std::acos(d);
    }
}

TEST(ArithmeticTest, EndOfDiffIsEndForFloat)
{
    LinearArithmetic<float> arithmetic("StaticArithmetic");

    // Regression: end is reconstructed by addition
    const float diff = arithmetic.diff(2.0f, 5.0f, no_data);
    EXPECT_FLOAT_EQ(diff, 3.0f);
    EXPECT_FLOAT_EQ(arithmetic.end(2.0f, diff, no_data), 5.0f);
}

TEST(ArithmeticTest, EndOfDiffIsEndForDoubleAndVectors)
{
    LinearArithmetic<double> d;
    EXPECT_DOUBLE_EQ(d.end(-1.5, d.diff(-1.5, 4.25, no_data), no_data), 4.25);

    LinearArithmetic<glm::vec3> v;
    const glm::vec3 start{ 1.0f, 2.0f, 3.0f }, end{ -4.0f, 0.5f, 9.0f };
    const glm::vec3 result = v.end(start, v.diff(start, end, no_data), no_data);
    EXPECT_FLOAT_EQ(result.x, end.x);
    EXPECT_FLOAT_EQ(result.y, end.y);
    EXPECT_FLOAT_EQ(result.z, end.z);

    IntArithmetic i;
    EXPECT_EQ(i.end(3, i.diff(3, -8, no_data), no_data), -8);
}

TEST(ArithmeticTest, LinearEndpoints)
{
    LinearArithmetic<glm::vec2> v;
    const glm::vec2 start{ 1.0f, 1.0f }, end{ 3.0f, -1.0f };
    const glm::vec2 diff = v.diff(start, end, no_data);

    const glm::vec2 at0 = v.value_at_position(start, end, diff, 0.0f, no_data);
    const glm::vec2 at_half = v.value_at_position(start, end, diff, 0.5f, no_data);
    const glm::vec2 at1 = v.value_at_position(start, end, diff, 1.0f, no_data);

    EXPECT_EQ(at0, start);
    EXPECT_FLOAT_EQ(at_half.x, 2.0f);
    EXPECT_FLOAT_EQ(at_half.y, 0.0f);
    EXPECT_EQ(at1, end);
}

TEST(ArithmeticTest, IntInterpolationTruncates)
{
    IntArithmetic i;
    EXPECT_EQ(i.value_at_position(0, 10, 10, 0.55f, no_data), 5);
    EXPECT_EQ(i.value_at_position(0, 10, 10, 0.99f, no_data), 9);
    EXPECT_EQ(i.value_at_position(0, 10, 10, 1.0f, no_data), 10);
    EXPECT_EQ(i.value_at_position(10, 0, -10, 0.55f, no_data), 5);
}

TEST(ArithmeticTest, QuatDiffIsRelativeRotation)
{
    QuatArithmetic q;
    const glm::quat start = glm::angleAxis(glm::radians(30.0f), glm::vec3(0, 1, 0));
    const glm::quat end = glm::angleAxis(glm::radians(100.0f), glm::vec3(0, 1, 0));

    const glm::quat result = q.end(start, q.diff(start, end, no_data), no_data);
    EXPECT_NEAR(quat_angle_between(result, end), 0.0f, 1e-4f);
}

TEST(ArithmeticTest, SlerpTakesTheShortestArc)
{
    SlerpQuat slerp;
    const glm::quat start = glm::angleAxis(glm::radians(10.0f), glm::vec3(0, 0, 1));
    const glm::quat end = glm::angleAxis(glm::radians(350.0f), glm::vec3(0, 0, 1));
    const glm::quat diff = slerp.diff(start, end, no_data);

    // Distance to the end shrinks monotonically
    float previous = quat_angle_between(start, end);
    for (int i = 1; i <= 10; ++i)
    {
        const float position = i / 10.0f;
        const glm::quat value = slerp.value_at_position(start, end, diff, position, no_data);
        const float distance = quat_angle_between(value, end);
        EXPECT_LE(distance, previous + 1e-4f) << "at position " << position;
        previous = distance;
    }
    EXPECT_NEAR(previous, 0.0f, 1e-3f);

    // Halfway is at 0 degrees, not 180
    const glm::quat half = slerp.value_at_position(start, end, diff, 0.5f, no_data);
    EXPECT_NEAR(quat_angle_between(half, glm::quat(1, 0, 0, 0)), 0.0f, 1e-3f);
}

TEST(ArithmeticTest, SlerpEulerKeepsEndpoints)
{
    SlerpEuler slerp;
    const glm::vec3 start{ 0.0f, 0.0f, 10.0f }, end{ 0.0f, 0.0f, 80.0f };
    const glm::vec3 diff = slerp.diff(start, end, no_data);

    EXPECT_EQ(slerp.value_at_position(start, end, diff, 0.0f, no_data), start);
    EXPECT_EQ(slerp.value_at_position(start, end, diff, 1.0f, no_data), end);

    const glm::vec3 half = slerp.value_at_position(start, end, diff, 0.5f, no_data);
    EXPECT_NEAR(half.z, 45.0f, 1e-2f);
}

TEST(ArithmeticTest, StaticRegistryHasBuiltins)
{
    StaticArithmeticRegistry registry;
    EXPECT_TRUE(registry.knows(typeid(float)));
    EXPECT_TRUE(registry.knows(typeid(double)));
    EXPECT_TRUE(registry.knows(typeid(int)));
    EXPECT_TRUE(registry.knows(typeid(glm::vec2)));
    EXPECT_TRUE(registry.knows(typeid(glm::vec3)));
    EXPECT_TRUE(registry.knows(typeid(glm::vec4)));
    EXPECT_TRUE(registry.knows(typeid(glm::quat)));
    EXPECT_FALSE(registry.knows(typeid(mock::MockHue)));
}

TEST(ArithmeticTest, StaticRegistryTeachAndSeal)
{
    StaticArithmeticRegistry registry;
    registry.teach<mock::MockHue>(
        [](const mock::MockHue& s, const mock::MockHue& e) { return mock::MockHue{ e.degrees - s.degrees }; },
        [](const mock::MockHue& s, const mock::MockHue& d) { return mock::MockHue{ s.degrees + d.degrees }; },
        [](const mock::MockHue& s, const mock::MockHue&, const mock::MockHue& d, float p) { return mock::MockHue{ s.degrees + d.degrees * p }; });
    EXPECT_TRUE(registry.knows(typeid(mock::MockHue)));

    registry.seal();
    EXPECT_TRUE(registry.sealed());
    EXPECT_THROW(registry.add<glm::vec3>(std::make_shared<LinearArithmetic<glm::vec3>>()), std::logic_error);

    // Clearing drops taught entries but keeps the builtins
    registry.clear();
    EXPECT_FALSE(registry.sealed());
    EXPECT_FALSE(registry.knows(typeid(mock::MockHue)));
    EXPECT_TRUE(registry.knows(typeid(float)));
}

TEST(ArithmeticTest, TeachRejectsMissingFunctions)
{
    StaticArithmeticRegistry registry;
    EXPECT_THROW(registry.teach<float>(nullptr, nullptr, nullptr), std::invalid_argument);
}

TEST(ArithmeticTest, ReflectionArithmeticUsesMetaFunctions)
{
    mock::register_mock_meta();

    auto type = entt::resolve<mock::MockHue>();
    ArithmeticFuncs funcs{
        type.func(literals::add_hs),
        type.func(literals::sub_hs),
        type.func(literals::scale_hs) };
    ASSERT_TRUE(funcs.add && funcs.sub && funcs.scale);

    const entt::any user_data{ funcs };
    ReflectionArithmetic<mock::MockHue> arithmetic;

    const mock::MockHue start{ 20.0f }, end{ 60.0f };
    const mock::MockHue diff = arithmetic.diff(start, end, user_data);
    EXPECT_FLOAT_EQ(diff.degrees, 40.0f);
    EXPECT_FLOAT_EQ(arithmetic.end(start, diff, user_data).degrees, 60.0f);
    EXPECT_FLOAT_EQ(arithmetic.value_at_position(start, end, diff, 0.25f, user_data).degrees, 30.0f);
    EXPECT_FLOAT_EQ(arithmetic.value_at_position(start, end, diff, 1.0f, user_data).degrees, 60.0f);
}

TEST(ArithmeticTest, RegisteredGlmArithmetic)
{
    meta::register_glm_arithmetic();

    auto type = entt::resolve<glm::vec3>();
    ArithmeticFuncs funcs{
        type.func(literals::add_hs),
        type.func(literals::sub_hs),
        type.func(literals::scale_hs) };
    ASSERT_TRUE(funcs.add && funcs.sub && funcs.scale);

    const entt::any user_data{ funcs };
    ReflectionArithmetic<glm::vec3> arithmetic;

    const glm::vec3 start{ 1.0f, 2.0f, 3.0f }, end{ 3.0f, 2.0f, -1.0f };
    const glm::vec3 diff = arithmetic.diff(start, end, user_data);
    EXPECT_EQ(diff, glm::vec3(2.0f, 0.0f, -4.0f));
    EXPECT_EQ(arithmetic.end(start, diff, user_data), end);
    EXPECT_EQ(arithmetic.value_at_position(start, end, diff, 0.5f, user_data), glm::vec3(2.0f, 2.0f, 1.0f));
}

TEST(ArithmeticTest, RegisterArithmeticForUserType)
{
    meta::register_arithmetic<mock::MockVec2>();

    auto type = entt::resolve<mock::MockVec2>();
    EXPECT_TRUE(type.func(literals::add_hs));
    EXPECT_TRUE(type.func(literals::sub_hs));
    EXPECT_TRUE(type.func(literals::scale_hs));
}

TEST(ArithmeticTest, LinearValueConcept)
{
    static_assert(LinearValue<float>);
    static_assert(LinearValue<glm::vec3>);
    static_assert(LinearValue<mock::MockVec2>);
    static_assert(!LinearValue<mock::MockHue>);
    SUCCEED();
}
