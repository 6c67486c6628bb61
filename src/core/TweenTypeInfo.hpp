// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenTypeInfo_hpp
#define TweenTypeInfo_hpp

#include <string>
#include <typeindex>

#include "core/TweenPlugin.hpp"

namespace eanim
{
    /// Probe compiled for a concrete (target, value) type pair
    using TypedProbe = PluginResult(*)(Tween& tween, TweenCapability capability, bool explicit_request);

    /// Type identity of a tween plus the probes instantiated for its types.
    /// This is where type-specialized providers are reached from type-erased code.
    struct TweenTypeInfo
    {
        std::type_index target_type = typeid(void);
        std::type_index value_type = typeid(void);
        std::string target_name;
        std::string value_name;

        TypedProbe reflection_accessor = nullptr;
        TypedProbe reflection_arithmetic = nullptr;
        TypedProbe generated_arithmetic = nullptr;
        TypedProbe slerp = nullptr;
        TypedProbe struct_accessor = nullptr;

        // Defined in TypedTween.hpp
        template<class TTarget, class TValue>
        static TweenTypeInfo create();
    };

} // namespace eanim

#endif // TweenTypeInfo_hpp
