// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/TweenOptions.hpp"
#include "LogMacros.h"
#include <algorithm>
#include <cstdarg>

namespace eanim
{
    namespace
    {
        // Built-in fallbacks when no scope in the chain sets a value
        constexpr float default_duration = 1.0f;
        constexpr TweenTiming default_timing = TweenTiming::Default;
        constexpr TweenOverwrite default_overwrite = TweenOverwrite::Default;
        constexpr TweenRecycle default_recycle = TweenRecycle::All;
        constexpr TweenLogLevel default_log_level = TweenLogLevel::Warning;

        // Count how many flags of a mutually exclusive set are present
        int count_flags(TweenOverwrite value, std::initializer_list<TweenOverwrite> flags)
        {
            int count = 0;
            for (auto flag : flags)
                if (has_flag(value, flag))
                    ++count;
            return count;
        }
    }

    void TweenOptions::set_parent_options(TweenOptions* parent)
    {
        for (auto p = parent; p; p = p->parent_)
        {
            if (p == this)
            {
                log(TweenLogLevel::Error, "Option scope cannot be its own parent.");
                return;
            }
        }
        parent_ = parent;
    }

    float TweenOptions::get_duration() const
    {
        if (duration_) return *duration_;
        return parent_ ? parent_->get_duration() : default_duration;
    }

    float TweenOptions::get_delay() const
    {
        if (delay_) return *delay_;
        return parent_ ? parent_->get_delay() : 0.0f;
    }

    EasingMethod TweenOptions::get_easing() const
    {
        if (easing_) return easing_;
        return parent_ ? parent_->get_easing() : EasingMethod{ easing::linear };
    }

    TweenTiming TweenOptions::get_timing() const
    {
        if (timing_ != TweenTiming::Undefined) return timing_;
        return parent_ ? parent_->get_timing() : default_timing;
    }

    TweenOverwrite TweenOptions::get_overwrite() const
    {
        if (overwrite_ != TweenOverwrite::Undefined) return overwrite_;
        return parent_ ? parent_->get_overwrite() : default_overwrite;
    }

    TweenRecycle TweenOptions::get_recycle() const
    {
        if (recycle_ != TweenRecycle::Undefined) return recycle_;
        return parent_ ? parent_->get_recycle() : default_recycle;
    }

    TweenLogLevel TweenOptions::get_log_level() const
    {
        if (log_level_ != TweenLogLevel::Undefined) return log_level_;
        return parent_ ? parent_->get_log_level() : default_log_level;
    }

    std::vector<PluginState> TweenOptions::collect_plugins() const
    {
        std::vector<PluginState> result;
        if (parent_)
            result = parent_->collect_plugins();

        for (const auto& state : plugins_)
        {
            auto it = std::find_if(result.begin(), result.end(), [&](const PluginState& s) {
                return s.info == state.info;
                });
            if (it != result.end())
                *it = state;
            else
                result.push_back(state);
        }
        return result;
    }

    void TweenOptions::trigger(TweenEvent event, const TweenEventArgs& args) const
    {
        for (const auto& handler : handlers_[static_cast<int>(event)])
        {
            if (handler)
                handler(args);
        }
        if (parent_)
            parent_->trigger(event, args);
    }

    void TweenOptions::log(TweenLogLevel level, const char* fmt, ...) const
    {
        if (level == TweenLogLevel::Undefined || level == TweenLogLevel::Silent)
            return;
        if (static_cast<int>(level) < static_cast<int>(get_log_level()))
            return;

        va_list args;
        va_start(args, fmt);
        std::string msg = LogGlobals::format_va(fmt, args);
        va_end(args);

        EANIM_LOG("[%s] %s", to_string(level), msg.c_str());
    }

    void TweenOptions::flatten_options(TweenOptions* new_parent)
    {
        duration_ = get_duration();
        delay_ = get_delay();
        easing_ = get_easing();
        timing_ = get_timing();
        overwrite_ = get_overwrite();
        recycle_ = get_recycle();
        log_level_ = get_log_level();
        plugins_ = collect_plugins();

        parent_ = nullptr;
        set_parent_options(new_parent);
    }

    void TweenOptions::reset()
    {
        parent_ = nullptr;
        duration_.reset();
        delay_.reset();
        easing_ = nullptr;
        timing_ = TweenTiming::Undefined;
        overwrite_ = TweenOverwrite::Undefined;
        recycle_ = TweenRecycle::Undefined;
        log_level_ = TweenLogLevel::Undefined;
        retain_count_ = 0;
        plugins_.clear();
        for (auto& list : handlers_)
            list.clear();
    }

    void TweenOptions::set_overwrite(TweenOverwrite overwrite)
    {
        using enum TweenOverwrite;

        const bool none_mixed = has_flag(overwrite, None) && overwrite != None;
        if (none_mixed
            || count_flags(overwrite, { OnInitialize, OnStart }) > 1
            || count_flags(overwrite, { Stop, Finish, Cancel }) > 1
            || count_flags(overwrite, { All, Overlapping }) > 1)
        {
            log(TweenLogLevel::Warning, "Invalid overwrite settings %u, flags are mutually exclusive.",
                static_cast<unsigned>(overwrite));
            return;
        }
        overwrite_ = overwrite;
    }

    void TweenOptions::set_plugin(PluginInfoPtr info, bool enabled, bool required)
    {
        if (!info)
        {
            log(TweenLogLevel::Error, "Cannot set a null plugin.");
            return;
        }

        for (auto& state : plugins_)
        {
            if (state.info == info)
            {
                state.enabled = enabled;
                state.required = required;
                return;
            }
        }
        plugins_.push_back(PluginState{ std::move(info), enabled, required });
    }

    void TweenOptions::add_handler(TweenEvent event, TweenEventHandler handler)
    {
        handlers_[static_cast<int>(event)].push_back(std::move(handler));
    }

} // namespace eanim
