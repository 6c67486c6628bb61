// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenPlugin_hpp
#define TweenPlugin_hpp

#include <string>
#include <memory>
#include <functional>
#include <entt/entt.hpp>

#include "core/TweenTypes.hpp"
#include "core/TweenErrors.hpp"

namespace eanim
{
    class Tween;

    /// Base of all providers. A provider implements one or more of the
    /// typed capability interfaces below.
    class ITweenPlugin
    {
    public:
        virtual ~ITweenPlugin() = default;

        virtual const char* name() const = 0;
    };

    template<class TTarget, class TValue>
    class ITweenGetter : public virtual ITweenPlugin
    {
    public:
        virtual TValue get_value(
            TTarget& target,
            const std::string& property,
            const entt::any& user_data) = 0;
    };

    template<class TTarget, class TValue>
    class ITweenSetter : public virtual ITweenPlugin
    {
    public:
        virtual void set_value(
            TTarget& target,
            const std::string& property,
            const TValue& value,
            const entt::any& user_data) = 0;
    };

    /// Arithmetic contract: end(start, diff(start, end)) == end,
    /// value_at_position(.., 0) == start and value_at_position(.., 1) == end
    template<class TValue>
    class ITweenArithmetic : public virtual ITweenPlugin
    {
    public:
        virtual TValue diff(const TValue& start, const TValue& end, const entt::any& user_data) = 0;

        virtual TValue end(const TValue& start, const TValue& diff, const entt::any& user_data) = 0;

        virtual TValue value_at_position(
            const TValue& start,
            const TValue& end,
            const TValue& diff,
            float position,
            const entt::any& user_data) = 0;
    };

    /// A provider bound to one capability of one tween
    struct ProviderBinding
    {
        std::shared_ptr<ITweenPlugin> plugin;
        entt::any user_data;                    // per-binding context owned by the provider
        BindingStrength strength = BindingStrength::Weak;
        bool overwritable = true;
        std::string source;                     // name of the descriptor that produced it

        explicit operator bool() const { return plugin != nullptr; }
    };

    /// Outcome of a probe
    struct PluginResult
    {
        enum class Kind : int { NotApplicable, Bound, Failed };

        Kind kind = Kind::NotApplicable;
        ProviderBinding binding;
        ResolutionError error;

        static PluginResult none()
        {
            return PluginResult{};
        }

        static PluginResult bound(std::shared_ptr<ITweenPlugin> plugin, entt::any user_data = {})
        {
            PluginResult result;
            result.kind = Kind::Bound;
            result.binding.plugin = std::move(plugin);
            result.binding.user_data = std::move(user_data);
            return result;
        }

        static PluginResult failed(ResolutionErrorCode code, std::string message)
        {
            PluginResult result;
            result.kind = Kind::Failed;
            result.error = ResolutionError{ code, std::move(message) };
            return result;
        }

        bool is_bound() const { return kind == Kind::Bound; }
        bool is_failed() const { return kind == Kind::Failed; }
    };

    using PluginProbe = std::function<PluginResult(Tween&, TweenCapability)>;

    /// Describes a provider and how it is activated
    struct PluginInfo
    {
        std::string name;
        TweenCapability capabilities = TweenCapability::None;

        // Whether a later strong request may replace this provider once bound
        bool overwritable = true;

        PluginProbe manual_probe;   // explicit request path
        PluginProbe auto_probe;     // automatic detection path
    };

    using PluginInfoPtr = std::shared_ptr<const PluginInfo>;

    /// Per-scope state of a plugin loader
    struct PluginState
    {
        PluginInfoPtr info;
        bool enabled = true;
        bool required = false;
    };

} // namespace eanim

#endif // TweenPlugin_hpp
