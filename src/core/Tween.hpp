// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef Tween_hpp
#define Tween_hpp

#include <array>
#include <exception>
#include <optional>
#include <string>

#include "core/TweenTypes.hpp"
#include "core/TweenErrors.hpp"
#include "core/TweenPlugin.hpp"
#include "core/TweenTypeInfo.hpp"
#include "core/TweenOptions.hpp"

namespace eanim
{
    class TweenGroup;
    class TweenEngine;

    /// Engine clock readings
    struct TweenClock
    {
        double scaled = 0.0;
        double unscaled = 0.0;
        double real = 0.0;
    };

    /// Type-erased tween. Drives the lifecycle; value handling is done by TypedTween.
    class Tween : public TweenOptionsFluent<Tween>
    {
    public:
        explicit Tween(TweenTypeInfo type_info);
        ~Tween() override;

        const TweenTypeInfo& type_info() const { return type_info_; }
        std::type_index target_type() const { return type_info_.target_type; }
        std::type_index value_type() const { return type_info_.value_type; }

        /// Identity of the target, for comparisons only
        const void* target_key() const { return target_key_; }
        const std::string& property() const { return property_; }
        TweenMethod method() const { return method_; }

        TweenState state() const { return state_; }
        float position() const { return position_; }
        TweenCompletedBy completed_by() const { return completed_by_; }

        /// True while the tween has not completed or failed
        bool is_active() const;

        /// Error that put the tween in the Error state
        const std::optional<ResolutionError>& error() const { return error_; }

        /// Failure of an explicitly requested plugin
        const std::optional<ResolutionError>& plugin_error() const { return plugin_error_; }

        TweenGroup* group() const { return group_; }
        TweenEngine* engine() const { return engine_; }

        /// Called by the group that schedules the tween
        void attach(TweenGroup* group, TweenEngine* engine, const TweenClock& creation);

        /// Called by the group when the tween leaves it. Options stay as they
        /// were resolved through the group; fallback becomes the parent scope.
        void detach(TweenOptions* fallback);

        /// Step the tween. Returns false once the tween is no longer active.
        bool update();

        /// Freeze at the current value
        void stop();

        /// Jump to the end value
        void finish();

        /// Revert to the start value
        void cancel();

        void complete(TweenCompletedBy by, bool from_overwrite = false);

        /// Let other overwrite this tween, based on other's overwrite settings
        void overwrite(Tween& other);

        bool overlaps(const Tween& other) const;

        double start_time() const;
        double start_time_unscaled() const;
        float duration_unscaled() const;

        /// Current time on the clock selected by the timing option
        double tween_time() const;

        const ProviderBinding& binding(TweenCapability capability) const;
        void install_binding(TweenCapability capability, ProviderBinding binding);
        void set_plugin_error(const ResolutionError& error) { plugin_error_ = error; }

        /// Whether plugin implements capability for this tween's types
        virtual bool accepts(const ITweenPlugin& plugin, TweenCapability capability) const = 0;

        virtual bool target_alive() const = 0;

        /// "property on TargetType"
        std::string describe() const;

        void reset() override;

    protected:
        void use_base(TweenMethod method, const void* target_key, std::string property, TweenOptions* parent);

        void fail(ResolutionError error, TweenLogLevel level = TweenLogLevel::Error);

        /// Fails the tween when a getter, setter or arithmetic provider throws
        void hook_failed(const std::exception& e);

        /// Compute start, end and diff values according to the tween method
        virtual void prepare_values() = 0;

        /// Compute the value at (eased) position and write it to the target
        virtual void apply_position(float position) = 0;

        virtual void on_binding_installed(TweenCapability capability) = 0;

        virtual void clear_values() = 0;

    private:
        bool initialize();
        void start();
        void do_overwrite(bool initialize_phase);

        static std::size_t slot(TweenCapability capability);

        TweenTypeInfo type_info_;

        TweenMethod method_ = TweenMethod::To;
        const void* target_key_ = nullptr;
        std::string property_;

        TweenState state_ = TweenState::Unused;
        float position_ = 0.0f;
        TweenCompletedBy completed_by_ = TweenCompletedBy::Undefined;
        std::optional<ResolutionError> error_;
        std::optional<ResolutionError> plugin_error_;

        TweenGroup* group_ = nullptr;
        TweenEngine* engine_ = nullptr;
        TweenClock creation_;

        // Cached when the tween initializes/starts
        float duration_ = 0.0f;
        double start_time_ = 0.0;
        EasingMethod easing_;

        std::array<ProviderBinding, 3> bindings_;
    };

} // namespace eanim

#endif // Tween_hpp
