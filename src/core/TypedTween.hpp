// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TypedTween_hpp
#define TypedTween_hpp

#include <memory>
#include <string>

#include "core/Tween.hpp"
#include "plugins/ReflectionAccessor.hpp"
#include "plugins/ReflectionArithmetic.hpp"
#include "plugins/GeneratedArithmetic.hpp"
#include "plugins/SlerpPlugin.hpp"
#include "plugins/StructPlugin.hpp"

namespace eanim
{
    template<class TTarget, class TValue>
    TweenTypeInfo TweenTypeInfo::create()
    {
        TweenTypeInfo info;
        info.target_type = typeid(TTarget);
        info.value_type = typeid(TValue);
        info.target_name = std::string(entt::type_id<TTarget>().name());
        info.value_name = std::string(entt::type_id<TValue>().name());
        info.reflection_accessor = &plugins::reflection_accessor_probe<TTarget, TValue>;
        info.reflection_arithmetic = &plugins::reflection_arithmetic_probe<TValue>;
        info.generated_arithmetic = &plugins::generated_arithmetic_probe<TValue>;
        info.slerp = &plugins::slerp_probe<TValue>;
        info.struct_accessor = &plugins::struct_accessor_probe<TTarget, TValue>;
        return info;
    }

    /// Tween of a TValue property on a TTarget object.
    /// The target is not owned; an expired target fails the tween.
    template<class TTarget, class TValue>
    class TypedTween : public Tween
    {
    public:
        using Getter = ITweenGetter<TTarget, TValue>;
        using Setter = ITweenSetter<TTarget, TValue>;
        using Arithmetic = ITweenArithmetic<TValue>;

        TypedTween()
            : Tween(TweenTypeInfo::create<TTarget, TValue>())
        {
        }

        /// Configure a fresh or recycled instance
        void use(
            TweenMethod method,
            const std::shared_ptr<TTarget>& target,
            std::string property,
            const TValue& start_value,
            const TValue& end_value,
            const TValue& diff_value,
            TweenOptions* parent)
        {
            target_ = target;
            start_ = start_value;
            end_ = end_value;
            diff_ = diff_value;
            value_ = TValue{};
            use_base(method, target.get(), std::move(property), parent);
        }

        std::shared_ptr<TTarget> target() const { return target_.lock(); }

        const TValue& start_value() const { return start_; }
        const TValue& end_value() const { return end_; }
        const TValue& diff_value() const { return diff_; }

        /// Last value written to the target
        const TValue& value() const { return value_; }

        bool accepts(const ITweenPlugin& plugin, TweenCapability capability) const override
        {
            switch (capability)
            {
            case TweenCapability::Getter: return dynamic_cast<const Getter*>(&plugin) != nullptr;
            case TweenCapability::Setter: return dynamic_cast<const Setter*>(&plugin) != nullptr;
            case TweenCapability::Arithmetic: return dynamic_cast<const Arithmetic*>(&plugin) != nullptr;
            default: return false;
            }
        }

        bool target_alive() const override
        {
            return !target_.expired();
        }

    protected:
        void prepare_values() override
        {
            auto target = target_.lock();
            if (!target || !getter_ || !arithmetic_)
                return;

            const auto& arithmetic_data = binding(TweenCapability::Arithmetic).user_data;
            try
            {
                switch (method())
                {
                case TweenMethod::To:
                    start_ = get_value(*target);
                    diff_ = arithmetic_->diff(start_, end_, arithmetic_data);
                    break;
                case TweenMethod::From:
                    end_ = get_value(*target);
                    diff_ = arithmetic_->diff(start_, end_, arithmetic_data);
                    break;
                case TweenMethod::FromTo:
                    diff_ = arithmetic_->diff(start_, end_, arithmetic_data);
                    break;
                case TweenMethod::By:
                    start_ = get_value(*target);
                    end_ = arithmetic_->end(start_, diff_, arithmetic_data);
                    break;
                }
            }
            catch (const std::exception& e)
            {
                hook_failed(e);
            }
        }

        void apply_position(float position) override
        {
            auto target = target_.lock();
            if (!target || !setter_ || !arithmetic_)
                return;

            try
            {
                value_ = arithmetic_->value_at_position(start_, end_, diff_, position,
                    binding(TweenCapability::Arithmetic).user_data);
                setter_->set_value(*target, property(), value_, binding(TweenCapability::Setter).user_data);
            }
            catch (const std::exception& e)
            {
                hook_failed(e);
            }
        }

        void on_binding_installed(TweenCapability capability) override
        {
            const auto& plugin = binding(capability).plugin;
            switch (capability)
            {
            case TweenCapability::Getter: getter_ = std::dynamic_pointer_cast<Getter>(plugin).get(); break;
            case TweenCapability::Setter: setter_ = std::dynamic_pointer_cast<Setter>(plugin).get(); break;
            case TweenCapability::Arithmetic: arithmetic_ = std::dynamic_pointer_cast<Arithmetic>(plugin).get(); break;
            default: break;
            }
        }

        void clear_values() override
        {
            target_.reset();
            start_ = end_ = diff_ = value_ = TValue{};
            getter_ = nullptr;
            setter_ = nullptr;
            arithmetic_ = nullptr;
        }

    private:
        TValue get_value(TTarget& target)
        {
            return getter_->get_value(target, property(), binding(TweenCapability::Getter).user_data);
        }

        std::weak_ptr<TTarget> target_;
        TValue start_{};
        TValue end_{};
        TValue diff_{};
        TValue value_{};

        // Typed views of the bound providers, owned by the bindings
        Getter* getter_ = nullptr;
        Setter* setter_ = nullptr;
        Arithmetic* arithmetic_ = nullptr;
    };

} // namespace eanim

#endif // TypedTween_hpp
