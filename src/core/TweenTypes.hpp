// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenTypes_hpp
#define TweenTypes_hpp

#include <cstdint>
#include <functional>
#include <type_traits>

namespace eanim
{
    /// Enums that opt in to the bitwise flag operators below
    template<class E>
    struct is_flag_enum : std::false_type {};

    template<class E>
    concept FlagEnum = is_flag_enum<E>::value;

    template<FlagEnum E>
    constexpr E operator|(E lhs, E rhs)
    {
        return static_cast<E>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
    }

    template<FlagEnum E>
    constexpr E operator&(E lhs, E rhs)
    {
        return static_cast<E>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
    }

    template<FlagEnum E>
    constexpr E operator~(E flags)
    {
        return static_cast<E>(~static_cast<std::uint32_t>(flags));
    }

    template<FlagEnum E>
    constexpr E& operator|=(E& lhs, E rhs)
    {
        return lhs = lhs | rhs;
    }

    template<FlagEnum E>
    constexpr bool any(E flags)
    {
        return static_cast<std::uint32_t>(flags) != 0;
    }

    template<FlagEnum E>
    constexpr bool has_flag(E flags, E flag)
    {
        return any(flags & flag);
    }

    /// How start and end values are determined when a tween starts
    enum class TweenMethod : int { To, From, FromTo, By };

    enum class TweenState : int
    {
        Unused = 0,     // pooled, not yet configured
        Uninitialized,  // configured, waiting for first update
        Waiting,        // validated, start delay not elapsed
        Tweening,
        Complete,
        Error
    };

    enum class TweenEvent : int { Initialize, Start, Update, Complete, Error };

    enum class TweenLogLevel : int { Undefined = 0, Debug, Warning, Error, Silent };

    /// Reason a tween completed
    enum class TweenCompletedBy : std::uint32_t
    {
        Undefined = 0,
        Stop = 1 << 0,
        Finish = 1 << 1,
        Cancel = 1 << 2,
        Complete = 1 << 3,
        Overwrite = 1 << 4
    };
    template<> struct is_flag_enum<TweenCompletedBy> : std::true_type {};

    /// When a tween triggers overwrites and what happens to the overwritten tweens.
    /// None is its own bit so that it can be told apart from an unset value.
    enum class TweenOverwrite : std::uint32_t
    {
        Undefined = 0,
        OnInitialize = 1 << 0,
        OnStart = 1 << 1,
        Stop = 1 << 2,
        Finish = 1 << 3,
        Cancel = 1 << 4,
        All = 1 << 5,
        Overlapping = 1 << 6,
        None = 1 << 7,

        Default = OnStart | Stop | Overlapping,
        Immediate = OnInitialize | Stop | All
    };
    template<> struct is_flag_enum<TweenOverwrite> : std::true_type {};

    /// Update phase and clock a tween runs on
    enum class TweenTiming : std::uint32_t
    {
        Undefined = 0,
        Update = 1 << 1,
        FixedUpdate = 1 << 2,
        LateUpdate = 1 << 3,
        DefaultTime = 1 << 4,
        UnscaledTime = 1 << 5,
        RealTime = 1 << 6,

        Default = Update | DefaultTime,
        Physics = FixedUpdate | DefaultTime,
        Menu = Update | UnscaledTime
    };
    template<> struct is_flag_enum<TweenTiming> : std::true_type {};

    enum class TweenRecycle : std::uint32_t
    {
        Undefined = 0,
        Tweens = 1 << 1,
        Groups = 1 << 2,
        None = 1 << 3,

        All = Tweens | Groups
    };
    template<> struct is_flag_enum<TweenRecycle> : std::true_type {};

    /// Role a plugin fills for a tween
    enum class TweenCapability : std::uint32_t
    {
        None = 0,
        Getter = 1 << 0,
        Setter = 1 << 1,
        Arithmetic = 1 << 2,

        Accessor = Getter | Setter,
        All = Getter | Setter | Arithmetic
    };
    template<> struct is_flag_enum<TweenCapability> : std::true_type {};

    /// Weak bindings are auto-detected and replaceable, strong ones explicitly requested
    enum class BindingStrength : int { Weak, Strong };

    /// Maps linear position [0, 1] to eased position
    using EasingMethod = std::function<float(float)>;

    namespace easing
    {
        inline float linear(float position) { return position; }

        // Quadratic
        inline float ease_in(float position) { return position * position; }
        inline float ease_out(float position) { return position * (2.0f - position); }
        inline float ease_in_out(float position)
        {
            return position < 0.5f
                ? 2.0f * position * position
                : -1.0f + (4.0f - 2.0f * position) * position;
        }
    }

    inline const char* to_string(TweenCapability capability)
    {
        switch (capability)
        {
        case TweenCapability::Getter: return "Getter";
        case TweenCapability::Setter: return "Setter";
        case TweenCapability::Arithmetic: return "Arithmetic";
        default: return "Capability";
        }
    }

    inline const char* to_string(TweenState state)
    {
        switch (state)
        {
        case TweenState::Unused: return "Unused";
        case TweenState::Uninitialized: return "Uninitialized";
        case TweenState::Waiting: return "Waiting";
        case TweenState::Tweening: return "Tweening";
        case TweenState::Complete: return "Complete";
        case TweenState::Error: return "Error";
        }
        return "Unknown";
    }

    inline const char* to_string(TweenLogLevel level)
    {
        switch (level)
        {
        case TweenLogLevel::Debug: return "DEBUG";
        case TweenLogLevel::Warning: return "WARN";
        case TweenLogLevel::Error: return "ERROR";
        case TweenLogLevel::Silent: return "SILENT";
        default: return "UNDEFINED";
        }
    }
} // namespace eanim

#endif // TweenTypes_hpp
