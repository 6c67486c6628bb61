// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenOptions_hpp
#define TweenOptions_hpp

#include <array>
#include <optional>
#include <string>
#include <vector>
#include <functional>

#include "core/TweenTypes.hpp"
#include "core/TweenPlugin.hpp"

namespace eanim
{
    class Tween;

    struct TweenEventArgs
    {
        Tween* tween = nullptr;
        TweenEvent event = TweenEvent::Update;
        TweenCompletedBy completed_by = TweenCompletedBy::Undefined;
        std::string error;
    };

    using TweenEventHandler = std::function<void(const TweenEventArgs&)>;

    /// Option scope. Unset values cascade to the parent scope, i.e.
    /// tween -> group -> engine.
    class TweenOptions
    {
    public:
        TweenOptions() = default;
        virtual ~TweenOptions() = default;

        TweenOptions(const TweenOptions&) = delete;
        TweenOptions& operator=(const TweenOptions&) = delete;

        TweenOptions* parent_options() const { return parent_; }
        void set_parent_options(TweenOptions* parent);

        float get_duration() const;
        float get_delay() const;
        EasingMethod get_easing() const;
        TweenTiming get_timing() const;
        TweenOverwrite get_overwrite() const;
        TweenRecycle get_recycle() const;
        TweenLogLevel get_log_level() const;

        /// Effective plugin loaders, parent scopes first. A child scope's state
        /// for a plugin replaces the parent's state for the same plugin.
        std::vector<PluginState> collect_plugins() const;

        int retain_count() const { return retain_count_; }

        /// Fire event on this scope and all parent scopes
        void trigger(TweenEvent event, const TweenEventArgs& args) const;

        /// Emit message if level passes the effective log level
        void log(TweenLogLevel level, const char* fmt, ...) const;

        /// Copy the effective values of the parent chain into this scope and
        /// link to new_parent instead. Handlers of the old parents no longer fire.
        void flatten_options(TweenOptions* new_parent);

        /// Clear all options, handlers and the parent link
        virtual void reset();

    protected:
        void set_overwrite(TweenOverwrite overwrite);
        void set_plugin(PluginInfoPtr info, bool enabled, bool required);
        void add_handler(TweenEvent event, TweenEventHandler handler);

        TweenOptions* parent_ = nullptr;

        std::optional<float> duration_;
        std::optional<float> delay_;
        EasingMethod easing_;
        TweenTiming timing_ = TweenTiming::Undefined;
        TweenOverwrite overwrite_ = TweenOverwrite::Undefined;
        TweenRecycle recycle_ = TweenRecycle::Undefined;
        TweenLogLevel log_level_ = TweenLogLevel::Undefined;
        int retain_count_ = 0;

        std::vector<PluginState> plugins_;
        std::array<std::vector<TweenEventHandler>, 5> handlers_;
    };

    /// Fluent setters shared by tweens, groups and the engine
    template<class Derived>
    class TweenOptionsFluent : public TweenOptions
    {
    public:
        /// Duration in seconds
        Derived& over(float duration) { duration_ = duration; return self(); }

        /// Delay in seconds before the tween starts
        Derived& delay(float delay) { delay_ = delay; return self(); }

        Derived& ease(EasingMethod easing) { easing_ = std::move(easing); return self(); }

        Derived& timing(TweenTiming timing) { timing_ = timing; return self(); }

        Derived& overwrite_policy(TweenOverwrite overwrite) { set_overwrite(overwrite); return self(); }

        Derived& recycle(TweenRecycle recycle) { recycle_ = recycle; return self(); }

        Derived& log_level(TweenLogLevel level) { log_level_ = level; return self(); }

        /// Enable, disable or require a plugin for this scope.
        /// A required plugin is an explicit request and binds strongly.
        Derived& plugin(PluginInfoPtr info, bool enabled = true, bool required = true)
        {
            set_plugin(std::move(info), enabled, required);
            return self();
        }

        Derived& on_initialize(TweenEventHandler handler) { add_handler(TweenEvent::Initialize, std::move(handler)); return self(); }
        Derived& on_start(TweenEventHandler handler) { add_handler(TweenEvent::Start, std::move(handler)); return self(); }
        Derived& on_update(TweenEventHandler handler) { add_handler(TweenEvent::Update, std::move(handler)); return self(); }
        Derived& on_complete(TweenEventHandler handler) { add_handler(TweenEvent::Complete, std::move(handler)); return self(); }
        Derived& on_error(TweenEventHandler handler) { add_handler(TweenEvent::Error, std::move(handler)); return self(); }

        /// Prevent recycling while an external holder needs the instance
        Derived& retain() { ++retain_count_; return self(); }
        Derived& release() { if (retain_count_ > 0) --retain_count_; return self(); }

    private:
        Derived& self() { return static_cast<Derived&>(*this); }
    };

} // namespace eanim

#endif // TweenOptions_hpp
