// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef MockTargets_hpp
#define MockTargets_hpp

#include <string>
#include <sstream>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entt.hpp>

#include "MetaLiterals.h"

namespace eanim::mock
{
    // Plain target with one member per built-in value type

    struct MockTransform
    {
        float alpha = 0.0f;
        double weight = 0.0;
        int frame = 0;
        glm::vec2 offset{ 0.0f };
        glm::vec3 position{ 0.0f };
        glm::vec3 euler_angles{ 0.0f };
        glm::quat rotation{ 1.0f, 0.0f, 0.0f, 0.0f };
    };

    // Nested by-value types

    struct MockColor
    {
        float r = 0.0f, g = 0.0f, b = 0.0f;

        bool operator==(const MockColor& other) const {
            return r == other.r && g == other.g && b == other.b;
        }

        std::string to_string() const
        {
            std::ostringstream oss;
            oss << "MockColor(" << r << ", " << g << ", " << b << ")";
            return oss.str();
        }
    };

    struct MockSprite
    {
        MockColor tint;
        float opacity = 1.0f;
        int layer = 0;

        int id() const { return 7; }
    };

    // Value type with operators, tweened by the generated arithmetic

    struct MockVec2
    {
        float x = 0.0f, y = 0.0f;

        MockVec2 operator+(const MockVec2& other) const { return { x + other.x, y + other.y }; }
        MockVec2 operator-(const MockVec2& other) const { return { x - other.x, y - other.y }; }
        MockVec2 operator*(float factor) const { return { x * factor, y * factor }; }

        bool operator==(const MockVec2& other) const { return x == other.x && y == other.y; }
    };

    struct MockPanel
    {
        MockVec2 size;
    };

    // Value type without operators, only tweenable through meta functions

    struct MockHue
    {
        float degrees = 0.0f;
    };

    inline MockHue hue_add(const MockHue& self, const MockHue& other) { return { self.degrees + other.degrees }; }
    inline MockHue hue_sub(const MockHue& self, const MockHue& other) { return { self.degrees - other.degrees }; }
    inline MockHue hue_scale(const MockHue& self, float factor) { return { self.degrees * factor }; }

    struct MockLamp
    {
        MockHue hue;
    };

    /// Register the mock types with entt::meta
    inline void register_mock_meta()
    {
        using namespace entt::literals;

        entt::meta_factory<MockTransform>{}
            .type("MockTransform"_hs)
            .data<&MockTransform::alpha>("alpha"_hs)
            .data<&MockTransform::weight>("weight"_hs)
            .data<&MockTransform::frame>("frame"_hs)
            .data<&MockTransform::offset>("offset"_hs)
            .data<&MockTransform::position>("position"_hs)
            .data<&MockTransform::euler_angles>("euler_angles"_hs)
            .data<&MockTransform::rotation>("rotation"_hs);

        entt::meta_factory<MockColor>{}
            .type("MockColor"_hs)
            .data<&MockColor::r>("r"_hs)
            .data<&MockColor::g>("g"_hs)
            .data<&MockColor::b>("b"_hs);

        entt::meta_factory<MockSprite>{}
            .type("MockSprite"_hs)
            .data<&MockSprite::tint>("tint"_hs)
            .data<&MockSprite::opacity>("opacity"_hs)
            .data<&MockSprite::layer>("layer"_hs)
            .data<nullptr, &MockSprite::id>("id"_hs);

        entt::meta_factory<MockHue>{}
            .type("MockHue"_hs)
            .data<&MockHue::degrees>("degrees"_hs)
            .func<&hue_add>(literals::add_hs)
            .func<&hue_sub>(literals::sub_hs)
            .func<&hue_scale>(literals::scale_hs);

        entt::meta_factory<MockLamp>{}
            .type("MockLamp"_hs)
            .data<&MockLamp::hue>("hue"_hs);
    }

} // namespace eanim::mock

#endif // MockTargets_hpp
