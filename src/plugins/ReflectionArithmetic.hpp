// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef ReflectionArithmetic_hpp
#define ReflectionArithmetic_hpp

#include <memory>
#include <string>
#include <entt/entt.hpp>

#include "core/Tween.hpp"
#include "MetaLiterals.h"

namespace eanim::plugins
{
    /// Meta functions resolved for a value type
    struct ArithmeticFuncs
    {
        entt::meta_func add;
        entt::meta_func sub;
        entt::meta_func scale;
    };

    /// Arithmetic through add/sub/scale meta functions of the value type
    template<class TValue>
    class ReflectionArithmetic final : public ITweenArithmetic<TValue>
    {
    public:
        const char* name() const override { return "ReflectionArithmetic"; }

        TValue diff(const TValue& start, const TValue& end, const entt::any& user_data) override
        {
            return call(funcs(user_data).sub, end, start);
        }

        TValue end(const TValue& start, const TValue& diff, const entt::any& user_data) override
        {
            return call(funcs(user_data).add, start, diff);
        }

        TValue value_at_position(
            const TValue& start,
            const TValue& end,
            const TValue& diff,
            float position,
            const entt::any& user_data) override
        {
            if (position >= 1.0f)
                return end;
            const auto& f = funcs(user_data);
            return call(f.add, start, call(f.scale, diff, position));
        }

    private:
        static const ArithmeticFuncs& funcs(const entt::any& user_data)
        {
            return entt::any_cast<const ArithmeticFuncs&>(user_data);
        }

        template<class TArg>
        static TValue call(const entt::meta_func& func, const TValue& self, const TArg& arg)
        {
            entt::meta_any instance = entt::forward_as_meta(self);
            entt::meta_any result = func.invoke(instance, entt::forward_as_meta(arg));
            if (!result)
                return self;
            return result.cast<TValue>();
        }
    };

    template<class TValue>
    PluginResult reflection_arithmetic_probe(Tween& tween, TweenCapability capability, bool)
    {
        if (capability != TweenCapability::Arithmetic)
            return PluginResult::none();

        entt::meta_type type = entt::resolve<TValue>();
        ArithmeticFuncs funcs{
            type.func(literals::add_hs),
            type.func(literals::sub_hs),
            type.func(literals::scale_hs) };

        if (!funcs.add || !funcs.sub || !funcs.scale)
        {
            return PluginResult::failed(ResolutionErrorCode::ArithmeticUnsupported,
                "Type " + tween.type_info().value_name
                + " does not support addition, subtraction or multiplication.");
        }

        return PluginResult::bound(std::make_shared<ReflectionArithmetic<TValue>>(), entt::any{ funcs });
    }

} // namespace eanim::plugins

#endif // ReflectionArithmetic_hpp
