// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef SlerpPlugin_hpp
#define SlerpPlugin_hpp

#include <memory>
#include <type_traits>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "core/Tween.hpp"
#include "plugins/PropertyPath.hpp"

namespace eanim::plugins
{
    /// Spherical interpolation of rotations
    class SlerpQuat final : public ITweenArithmetic<glm::quat>
    {
    public:
        const char* name() const override { return "Slerp"; }

        glm::quat diff(const glm::quat& start, const glm::quat& end, const entt::any&) override
        {
            return glm::inverse(start) * end;
        }

        glm::quat end(const glm::quat& start, const glm::quat& diff, const entt::any&) override
        {
            return start * diff;
        }

        glm::quat value_at_position(
            const glm::quat& start,
            const glm::quat& end,
            const glm::quat&,
            float position,
            const entt::any&) override
        {
            return glm::slerp(start, end, position);
        }
    };

    /// Euler angles in degrees, interpolated as rotations along the shortest arc
    class SlerpEuler final : public ITweenArithmetic<glm::vec3>
    {
    public:
        const char* name() const override { return "Slerp"; }

        glm::vec3 diff(const glm::vec3& start, const glm::vec3& end, const entt::any&) override
        {
            return end - start;
        }

        glm::vec3 end(const glm::vec3& start, const glm::vec3& diff, const entt::any&) override
        {
            return start + diff;
        }

        glm::vec3 value_at_position(
            const glm::vec3& start,
            const glm::vec3& end,
            const glm::vec3&,
            float position,
            const entt::any&) override
        {
            if (position <= 0.0f)
                return start;
            if (position >= 1.0f)
                return end;

            const glm::quat from{ glm::radians(start) };
            const glm::quat to{ glm::radians(end) };
            return glm::degrees(glm::eulerAngles(glm::slerp(from, to, position)));
        }
    };

    /// Quaternions always, vec3 when requested explicitly or when the
    /// property names euler angles
    template<class TValue>
    PluginResult slerp_probe(Tween& tween, TweenCapability capability, bool explicit_request)
    {
        if (capability != TweenCapability::Arithmetic)
            return PluginResult::none();

        if constexpr (std::is_same_v<TValue, glm::quat>)
        {
            return PluginResult::bound(std::make_shared<SlerpQuat>());
        }
        else if constexpr (std::is_same_v<TValue, glm::vec3>)
        {
            if (explicit_request || ends_with(tween.property(), "euler_angles"))
                return PluginResult::bound(std::make_shared<SlerpEuler>());
            return PluginResult::none();
        }
        else
        {
            if (explicit_request)
                return PluginResult::failed(ResolutionErrorCode::ArithmeticUnsupported,
                    "Slerp supports glm::quat and glm::vec3, not " + tween.type_info().value_name + ".");
            return PluginResult::none();
        }
    }

    /// Descriptor of the slerp plugin
    const PluginInfoPtr& slerp_plugin();

} // namespace eanim::plugins

#endif // SlerpPlugin_hpp
