// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef GeneratedArithmetic_hpp
#define GeneratedArithmetic_hpp

#include <concepts>
#include <memory>

#include "core/TweenPlugin.hpp"

namespace eanim::plugins
{
    /// Types with the operators needed for linear interpolation
    template<class T>
    concept LinearValue = std::default_initializable<T> && requires(const T & a, const T & b, float s)
    {
        { a + b } -> std::convertible_to<T>;
        { a - b } -> std::convertible_to<T>;
        { a * s } -> std::convertible_to<T>;
    };

    /// Linear arithmetic compiled from the value type's operators
    template<LinearValue TValue>
    class LinearArithmetic final : public ITweenArithmetic<TValue>
    {
    public:
        explicit LinearArithmetic(const char* name = "GeneratedArithmetic")
            : name_(name)
        {
        }

        const char* name() const override { return name_; }

        TValue diff(const TValue& start, const TValue& end, const entt::any&) override
        {
            return static_cast<TValue>(end - start);
        }

        TValue end(const TValue& start, const TValue& diff, const entt::any&) override
        {
            return static_cast<TValue>(start + diff);
        }

        TValue value_at_position(
            const TValue& start,
            const TValue& end,
            const TValue& diff,
            float position,
            const entt::any&) override
        {
            if (position >= 1.0f)
                return end;
            return static_cast<TValue>(start + diff * position);
        }

    private:
        const char* name_;
    };

    template<class TValue>
    PluginResult generated_arithmetic_probe(Tween&, TweenCapability capability, bool)
    {
        if (capability != TweenCapability::Arithmetic)
            return PluginResult::none();

        if constexpr (LinearValue<TValue>)
            return PluginResult::bound(std::make_shared<LinearArithmetic<TValue>>());
        else
            return PluginResult::none();
    }

} // namespace eanim::plugins

#endif // GeneratedArithmetic_hpp
