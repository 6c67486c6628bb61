// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenEngine_hpp
#define TweenEngine_hpp

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/TweenOptions.hpp"
#include "core/TweenGroup.hpp"
#include "core/TweenPool.hpp"
#include "core/PluginResolver.hpp"
#include "core/GroupWait.hpp"
#include "plugins/StaticAccessor.hpp"
#include "plugins/GeneratedAccessor.hpp"
#include "plugins/StaticArithmetic.hpp"
#include "ILogManager.hpp"

namespace eanim
{
    /// Root option scope, clocks and scheduler of all tween groups.
    ///
    /// The host calls tick() once per frame, or advance() followed by
    /// process() for each phase when it drives the phases itself.
    class TweenEngine : public TweenOptionsFluent<TweenEngine>
    {
    public:
        TweenEngine();
        ~TweenEngine() override;

        // ---- Clock ----

        /// Advance the clocks by delta_time seconds of unscaled time
        void advance(float delta_time);

        /// Time on the clock selected by timing
        double time(TweenTiming timing) const;

        TweenClock clock() const;

        float time_scale() const { return time_scale_; }
        void set_time_scale(float scale);

        // ---- Scheduling ----

        /// Update all groups for one phase and drop groups without tweens
        void process(TweenTiming phase);

        /// advance() and process() Update, FixedUpdate and LateUpdate
        void tick(float delta_time);

        void register_group(std::shared_ptr<TweenGroup> group);

        std::size_t group_count() const { return groups_.size(); }

        /// Group for tweens created without a group
        TweenGroup& singles() { return *singles_; }

        std::shared_ptr<TweenGroup> create_group();

        template<class TTarget>
        std::shared_ptr<TweenGroup> create_group(const std::shared_ptr<TTarget>& default_target)
        {
            auto group = acquire_group();
            group->use(default_target, this, this);
            return group;
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> to(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& end)
        {
            return singles_->to<TTarget, TValue>(target, property, end);
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> from(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& start)
        {
            return singles_->from<TTarget, TValue>(target, property, start);
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> from_to(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& start, const TValue& end)
        {
            return singles_->from_to<TTarget, TValue>(target, property, start, end);
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> by(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& diff)
        {
            return singles_->by<TTarget, TValue>(target, property, diff);
        }

        // ---- Queries across all groups ----

        bool has(const void* target, const std::string& property = {}) const;
        void stop(const void* target, const std::string& property = {});
        void finish(const void* target, const std::string& property = {});
        void cancel(const void* target, const std::string& property = {});

        /// Let tween overwrite others in all groups
        void overwrite(Tween& tween);

        // ---- Plugins ----

        PluginResolver& resolver() { return resolver_; }
        const PluginResolver& resolver() const { return resolver_; }

        plugins::StaticAccessorRegistry& static_accessors() { return static_accessors_; }
        plugins::GeneratedAccessorRegistry& generated_accessors() { return generated_accessors_; }
        plugins::StaticArithmeticRegistry& static_arithmetic() { return static_arithmetic_; }

        /// Allow the reflective providers (entt::meta) in the default chains
        void enable_reflection(bool enable) { reflection_enabled_ = enable; }
        bool reflection_enabled() const { return reflection_enabled_; }

        /// Make the registries read-only. Done automatically on the first process().
        void seal_registries();

        // ---- Pooling ----

        /// Pool used by groups, nullptr when pooling is disabled
        TweenPool* pool() { return pooling_enabled_ ? &pool_ : nullptr; }

        void enable_pooling(bool enable) { pooling_enabled_ = enable; }
        bool pooling_enabled() const { return pooling_enabled_; }

        // ---- Waiting ----

        /// Wait for group to run out of tweens, polled after each LateUpdate
        GroupWaitPtr wait_for(const std::shared_ptr<TweenGroup>& group, std::function<void()> on_complete = {});

        /// Poll a wait created elsewhere. The engine does not own it.
        void track(const GroupWaitPtr& wait);

        /// Install log sink as the global logger
        void set_logger(std::shared_ptr<ILogManager> logger);

    private:
        void install_default_plugins();
        std::shared_ptr<TweenGroup> acquire_group();
        void recycle_group(std::shared_ptr<TweenGroup> group);
        void poll_waits();

        // Clocks
        double scaled_time_ = 0.0;
        double unscaled_time_ = 0.0;
        float time_scale_ = 1.0f;
        std::chrono::steady_clock::time_point real_start_ = std::chrono::steady_clock::now();

        std::vector<std::shared_ptr<TweenGroup>> groups_;
        std::shared_ptr<TweenGroup> singles_;
        std::vector<std::weak_ptr<GroupWait>> waits_;

        PluginResolver resolver_;
        plugins::StaticAccessorRegistry static_accessors_;
        plugins::GeneratedAccessorRegistry generated_accessors_;
        plugins::StaticArithmeticRegistry static_arithmetic_;
        bool reflection_enabled_ = false;

        TweenPool pool_;
        bool pooling_enabled_ = true;

        std::shared_ptr<ILogManager> logger_;
    };

} // namespace eanim

#endif // TweenEngine_hpp
