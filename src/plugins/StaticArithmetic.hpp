// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef StaticArithmetic_hpp
#define StaticArithmetic_hpp

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <typeindex>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "core/TweenPlugin.hpp"

namespace eanim::plugins
{
    /// Integers interpolate by truncating the scaled difference
    class IntArithmetic final : public ITweenArithmetic<int>
    {
    public:
        const char* name() const override { return "StaticArithmetic"; }

        int diff(const int& start, const int& end, const entt::any&) override { return end - start; }

        int end(const int& start, const int& diff, const entt::any&) override { return start + diff; }

        int value_at_position(const int& start, const int&, const int& diff, float position, const entt::any&) override
        {
            return start + static_cast<int>(diff * position);
        }
    };

    /// Rotations: diff is the relative rotation, interpolation along the shortest arc
    class QuatArithmetic final : public ITweenArithmetic<glm::quat>
    {
    public:
        const char* name() const override { return "StaticArithmetic"; }

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

    /// Arithmetic defined by taught functions
    template<class TValue>
    class TaughtArithmetic final : public ITweenArithmetic<TValue>
    {
    public:
        using DiffFn = std::function<TValue(const TValue&, const TValue&)>;
        using EndFn = std::function<TValue(const TValue&, const TValue&)>;
        using PositionFn = std::function<TValue(const TValue&, const TValue&, const TValue&, float)>;

        TaughtArithmetic(DiffFn diff, EndFn end, PositionFn value_at_position)
            : diff_(std::move(diff))
            , end_(std::move(end))
            , value_at_position_(std::move(value_at_position))
        {
        }

        const char* name() const override { return "StaticArithmetic"; }

        TValue diff(const TValue& start, const TValue& end, const entt::any&) override { return diff_(start, end); }

        TValue end(const TValue& start, const TValue& diff, const entt::any&) override { return end_(start, diff); }

        TValue value_at_position(
            const TValue& start,
            const TValue& end,
            const TValue& diff,
            float position,
            const entt::any&) override
        {
            return value_at_position_(start, end, diff, position);
        }

    private:
        DiffFn diff_;
        EndFn end_;
        PositionFn value_at_position_;
    };

    /// Precompiled arithmetic keyed by value type. Holds float, double, int,
    /// glm::vec2/3/4 and glm::quat out of the box.
    class StaticArithmeticRegistry
    {
    public:
        StaticArithmeticRegistry();

        template<class TValue>
        void teach(
            typename TaughtArithmetic<TValue>::DiffFn diff,
            typename TaughtArithmetic<TValue>::EndFn end,
            typename TaughtArithmetic<TValue>::PositionFn value_at_position)
        {
            if (!diff || !end || !value_at_position)
                throw std::invalid_argument("Static arithmetic needs diff, end and value_at_position");

            add<TValue>(std::make_shared<TaughtArithmetic<TValue>>(
                std::move(diff), std::move(end), std::move(value_at_position)));
        }

        template<class TValue>
        void add(std::shared_ptr<ITweenArithmetic<TValue>> arithmetic)
        {
            insert(typeid(TValue), std::move(arithmetic));
        }

        bool knows(std::type_index value_type) const { return table_.contains(value_type); }

        PluginResult probe(Tween& tween, TweenCapability capability) const;

        void seal() { sealed_ = true; }
        bool sealed() const { return sealed_; }

        /// Drop taught entries, keep the built-in ones, and unseal
        void clear();

    private:
        void register_builtins();
        void insert(std::type_index value_type, std::shared_ptr<ITweenPlugin> plugin);

        std::map<std::type_index, std::shared_ptr<ITweenPlugin>> table_;
        bool sealed_ = false;
    };

} // namespace eanim::plugins

#endif // StaticArithmetic_hpp
