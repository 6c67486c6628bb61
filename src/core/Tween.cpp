// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/Tween.hpp"
#include "core/TweenGroup.hpp"
#include "core/TweenEngine.hpp"
#include "core/PluginResolver.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace eanim
{
    namespace
    {
        // Positions this close to 1 are treated as 1 so that accumulated
        // float steps still end exactly on the end value
        constexpr float position_snap = 1e-6f;

        bool uses_unscaled_clock(TweenTiming timing)
        {
            return has_flag(timing, TweenTiming::UnscaledTime | TweenTiming::RealTime);
        }
    }

    Tween::Tween(TweenTypeInfo type_info)
        : type_info_(std::move(type_info))
    {
    }

    Tween::~Tween() = default;

    bool Tween::is_active() const
    {
        return state_ == TweenState::Uninitialized
            || state_ == TweenState::Waiting
            || state_ == TweenState::Tweening;
    }

    void Tween::use_base(TweenMethod method, const void* target_key, std::string property, TweenOptions* parent)
    {
        method_ = method;
        target_key_ = target_key;
        property_ = std::move(property);
        set_parent_options(parent);
        state_ = TweenState::Uninitialized;
    }

    void Tween::attach(TweenGroup* group, TweenEngine* engine, const TweenClock& creation)
    {
        group_ = group;
        engine_ = engine;
        creation_ = creation;
    }

    void Tween::detach(TweenOptions* fallback)
    {
        flatten_options(fallback);
        group_ = nullptr;
    }

    bool Tween::update()
    {
        switch (state_)
        {
        case TweenState::Unused:
            log(TweenLogLevel::Error, "Tween updated before it was configured.");
            return false;
        case TweenState::Complete:
        case TweenState::Error:
            return false;
        default:
            break;
        }

        if (!target_alive())
        {
            fail(ResolutionError{ ResolutionErrorCode::TargetNotFound,
                "Target of " + describe() + " has been destroyed." },
                TweenLogLevel::Debug);
            return false;
        }

        if (state_ == TweenState::Uninitialized && !initialize())
            return false;

        if (state_ == TweenState::Waiting)
        {
            if (tween_time() < start_time_)
                return true;

            start();
            if (state_ != TweenState::Tweening)
                return false;
        }

        float position = 1.0f;
        if (duration_ > 0.0f)
            position = static_cast<float>((tween_time() - start_time_) / duration_);
        position = std::clamp(position, 0.0f, 1.0f);
        if (position > 1.0f - position_snap)
            position = 1.0f;
        position_ = position;

        apply_position(easing_ ? easing_(position_) : position_);
        if (state_ != TweenState::Tweening)
            return false;
        trigger(TweenEvent::Update, TweenEventArgs{ this, TweenEvent::Update });

        if (state_ == TweenState::Tweening && position_ >= 1.0f)
            complete(TweenCompletedBy::Complete);

        return is_active();
    }

    bool Tween::initialize()
    {
        state_ = TweenState::Waiting;

        duration_ = get_duration();
        if (std::isnan(duration_) || duration_ < 0.0f)
        {
            fail(ResolutionError{ ResolutionErrorCode::ActivationFailed,
                "Invalid duration " + std::to_string(duration_) + " for " + describe() + "." });
            return false;
        }

        if (!engine_)
        {
            fail(ResolutionError{ ResolutionErrorCode::ActivationFailed,
                "Tween of " + describe() + " is not attached to an engine." });
            return false;
        }

        if (auto error = engine_->resolver().resolve_all(*this))
        {
            fail(*error);
            return false;
        }

        start_time_ = start_time();
        do_overwrite(true);

        trigger(TweenEvent::Initialize, TweenEventArgs{ this, TweenEvent::Initialize });
        return state_ == TweenState::Waiting;
    }

    void Tween::start()
    {
        prepare_values();
        if (state_ == TweenState::Error)
            return;
        easing_ = get_easing();
        state_ = TweenState::Tweening;

        do_overwrite(false);

        trigger(TweenEvent::Start, TweenEventArgs{ this, TweenEvent::Start });
    }

    void Tween::do_overwrite(bool initialize_phase)
    {
        const auto settings = get_overwrite();
        if (settings == TweenOverwrite::Undefined || settings == TweenOverwrite::None)
            return;

        // Overwrite either when initializing or when starting, never both
        if (has_flag(settings, TweenOverwrite::OnInitialize) != initialize_phase)
            return;

        if (engine_)
            engine_->overwrite(*this);
        else if (group_)
            group_->overwrite(*this);
    }

    void Tween::stop()
    {
        complete(TweenCompletedBy::Stop);
    }

    void Tween::finish()
    {
        complete(TweenCompletedBy::Finish);
    }

    void Tween::cancel()
    {
        complete(TweenCompletedBy::Cancel);
    }

    void Tween::complete(TweenCompletedBy by, bool from_overwrite)
    {
        if (!is_active())
            return;

        // Jump to start or end if the providers are in place
        const bool jump = by == TweenCompletedBy::Cancel || by == TweenCompletedBy::Finish;
        const bool can_write = state_ == TweenState::Waiting || state_ == TweenState::Tweening;
        if (jump && can_write && target_alive())
        {
            if (state_ == TweenState::Waiting)
                prepare_values();
            if (state_ != TweenState::Error)
            {
                position_ = by == TweenCompletedBy::Cancel ? 0.0f : 1.0f;
                apply_position(position_);
            }
            if (state_ == TweenState::Error)
                return;
        }

        state_ = TweenState::Complete;
        completed_by_ = by;
        if (from_overwrite)
            completed_by_ |= TweenCompletedBy::Overwrite;

        TweenEventArgs args{ this, TweenEvent::Complete, completed_by_ };
        trigger(TweenEvent::Complete, args);
    }

    void Tween::overwrite(Tween& other)
    {
        if (!is_active())
            return;

        if (this == &other)
            return;

        const auto settings = other.get_overwrite();

        if (has_flag(settings, TweenOverwrite::Overlapping) && !overlaps(other))
            return;

        if (has_flag(settings, TweenOverwrite::Cancel))
        {
            log(TweenLogLevel::Debug, "Overwrite %s with Cancel.", describe().c_str());
            complete(TweenCompletedBy::Cancel, true);
        }
        else if (has_flag(settings, TweenOverwrite::Finish))
        {
            log(TweenLogLevel::Debug, "Overwrite %s with Finish.", describe().c_str());
            complete(TweenCompletedBy::Finish, true);
        }
        else
        {
            log(TweenLogLevel::Debug, "Overwrite %s with Stop.", describe().c_str());
            complete(TweenCompletedBy::Stop, true);
        }
    }

    bool Tween::overlaps(const Tween& other) const
    {
        double start = 0.0, other_start = 0.0;
        float duration = 0.0f, other_duration = 0.0f;

        // Compare in unscaled time if either tween runs on an unscaled clock
        if (uses_unscaled_clock(get_timing() | other.get_timing()))
        {
            start = start_time_unscaled();
            duration = duration_unscaled();
            other_start = other.start_time_unscaled();
            other_duration = other.duration_unscaled();
        }
        else
        {
            start = start_time();
            duration = get_duration();
            other_start = other.start_time();
            other_duration = other.get_duration();
        }

        // Zero duration, e.g. when time scale is 0
        if (duration == 0.0f || other_duration == 0.0f)
            return true;

        const double end = start + duration;
        const double other_end = other_start + other_duration;
        return start < other_end && other_start < end;
    }

    double Tween::start_time() const
    {
        const auto timing = get_timing();
        double creation = creation_.scaled;
        if (has_flag(timing, TweenTiming::UnscaledTime))
            creation = creation_.unscaled;
        else if (has_flag(timing, TweenTiming::RealTime))
            creation = creation_.real;
        return creation + get_delay();
    }

    double Tween::start_time_unscaled() const
    {
        const float delay = get_delay();
        if (uses_unscaled_clock(get_timing()))
            return creation_.unscaled + delay;

        const float scale = engine_ ? engine_->time_scale() : 1.0f;
        return creation_.unscaled + (scale > 0.0f ? delay / scale : 0.0f);
    }

    float Tween::duration_unscaled() const
    {
        const float duration = get_duration();
        if (uses_unscaled_clock(get_timing()))
            return duration;

        const float scale = engine_ ? engine_->time_scale() : 1.0f;
        return scale > 0.0f ? duration / scale : 0.0f;
    }

    double Tween::tween_time() const
    {
        return engine_ ? engine_->time(get_timing()) : 0.0;
    }

    std::size_t Tween::slot(TweenCapability capability)
    {
        switch (capability)
        {
        case TweenCapability::Getter: return 0;
        case TweenCapability::Setter: return 1;
        case TweenCapability::Arithmetic: return 2;
        default:
            throw std::logic_error("Tween binding slot requires a single capability");
        }
    }

    const ProviderBinding& Tween::binding(TweenCapability capability) const
    {
        return bindings_[slot(capability)];
    }

    void Tween::install_binding(TweenCapability capability, ProviderBinding binding)
    {
        bindings_[slot(capability)] = std::move(binding);
        on_binding_installed(capability);
    }

    std::string Tween::describe() const
    {
        return property_ + " on " + type_info_.target_name;
    }

    void Tween::fail(ResolutionError error, TweenLogLevel level)
    {
        state_ = TweenState::Error;
        log(level, "%s: %s", to_string(error.code), error.message.c_str());

        TweenEventArgs args{ this, TweenEvent::Error, TweenCompletedBy::Undefined, error.message };
        error_ = std::move(error);
        trigger(TweenEvent::Error, args);
    }

    void Tween::hook_failed(const std::exception& e)
    {
        fail(ResolutionError{ ResolutionErrorCode::ActivationFailed,
            "Tween of " + describe() + " stopped because of exception: " + e.what() });
    }

    void Tween::reset()
    {
        TweenOptions::reset();

        method_ = TweenMethod::To;
        target_key_ = nullptr;
        property_.clear();
        state_ = TweenState::Unused;
        position_ = 0.0f;
        completed_by_ = TweenCompletedBy::Undefined;
        error_.reset();
        plugin_error_.reset();
        group_ = nullptr;
        engine_ = nullptr;
        creation_ = TweenClock{};
        duration_ = 0.0f;
        start_time_ = 0.0;
        easing_ = nullptr;
        for (auto& b : bindings_)
            b = ProviderBinding{};
        clear_values();
    }

} // namespace eanim
