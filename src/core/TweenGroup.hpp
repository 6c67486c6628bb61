// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenGroup_hpp
#define TweenGroup_hpp

#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <vector>

#include "core/Tween.hpp"
#include "core/TypedTween.hpp"
#include "core/TweenPool.hpp"

namespace eanim
{
    class TweenEngine;

    /// Collection scope for tweens, scheduled by the engine.
    ///
    /// New tweens wait in a pending bucket until the next update, where they
    /// are stepped once in reverse insertion order (so later tweens overwrite
    /// earlier ones) and moved to the bucket of their timing phase.
    class TweenGroup
        : public TweenOptionsFluent<TweenGroup>
        , public std::enable_shared_from_this<TweenGroup>
    {
    public:
        TweenGroup();
        ~TweenGroup() override;

        /// Prepare for use. Throws if the group is already in use.
        template<class TTarget>
        void use(const std::shared_ptr<TTarget>& default_target, TweenOptions* parent, TweenEngine* engine)
        {
            use_base(parent, engine);
            default_target_ = default_target;
            default_target_type_ = typeid(TTarget);
        }

        void use(TweenOptions* parent, TweenEngine* engine);

        bool in_use() const { return in_use_; }

        /// Clear all buckets and references so the group can be reused
        void reset() override;

        void add(std::shared_ptr<Tween> tween);

        /// Step pending tweens and the bucket of phase.
        /// Returns false when the group holds no tweens.
        bool update(TweenTiming phase);

        /// True while any bucket holds a tween
        bool has() const;

        /// Check for an active tween. Null target or empty property match any.
        bool has(const void* target, const std::string& property = {}) const;

        void stop(const void* target = nullptr, const std::string& property = {});
        void finish(const void* target = nullptr, const std::string& property = {});
        void cancel(const void* target = nullptr, const std::string& property = {});

        /// Let tween overwrite tweens in this group with the same target and property
        void overwrite(Tween& tween);

        std::size_t size() const;

        TweenEngine* engine() const { return engine_; }

        std::type_index default_target_type() const { return default_target_type_; }

        /// Default target if it is alive and of type TTarget
        template<class TTarget>
        std::shared_ptr<TTarget> default_target() const
        {
            if (default_target_type_ != typeid(TTarget))
                return nullptr;
            return std::static_pointer_cast<TTarget>(default_target_.lock());
        }

        bool registered() const { return registered_; }
        void set_registered(bool registered) { registered_ = registered; }

        // Creators

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> to(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& end)
        {
            return create<TTarget, TValue>(TweenMethod::To, target, property, TValue{}, end, TValue{});
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> from(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& start)
        {
            return create<TTarget, TValue>(TweenMethod::From, target, property, start, TValue{}, TValue{});
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> from_to(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& start, const TValue& end)
        {
            return create<TTarget, TValue>(TweenMethod::FromTo, target, property, start, end, TValue{});
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> by(const std::shared_ptr<TTarget>& target, const std::string& property, const TValue& diff)
        {
            return create<TTarget, TValue>(TweenMethod::By, target, property, TValue{}, TValue{}, diff);
        }

        // Creators using the default target

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> to(const std::string& property, const TValue& end)
        {
            return to<TTarget, TValue>(require_default_target<TTarget>(), property, end);
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> from(const std::string& property, const TValue& start)
        {
            return from<TTarget, TValue>(require_default_target<TTarget>(), property, start);
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> from_to(const std::string& property, const TValue& start, const TValue& end)
        {
            return from_to<TTarget, TValue>(require_default_target<TTarget>(), property, start, end);
        }

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> by(const std::string& property, const TValue& diff)
        {
            return by<TTarget, TValue>(require_default_target<TTarget>(), property, diff);
        }

    private:
        using TweenList = std::vector<std::shared_ptr<Tween>>;

        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> create(
            TweenMethod method,
            const std::shared_ptr<TTarget>& target,
            const std::string& property,
            const TValue& start,
            const TValue& end,
            const TValue& diff)
        {
            if (!target)
                throw std::invalid_argument("Trying to tween " + property + " on a null object");
            if (property.empty())
                throw std::invalid_argument("Property to tween is empty");

            auto* pool = current_pool();
            auto tween = pool
                ? pool->get_tween<TTarget, TValue>()
                : std::make_shared<TypedTween<TTarget, TValue>>();
            tween->use(method, target, property, start, end, diff, this);
            add(tween);
            return tween;
        }

        template<class TTarget>
        std::shared_ptr<TTarget> require_default_target() const
        {
            auto target = default_target<TTarget>();
            if (!target)
                throw std::logic_error("Tween group has no default target of the requested type");
            return target;
        }

        void use_base(TweenOptions* parent, TweenEngine* engine);
        TweenPool* current_pool() const;
        void promote(const std::shared_ptr<Tween>& tween);
        void finished(std::shared_ptr<Tween> tween);
        void detach_all();
        TweenList* bucket_for(TweenTiming phase);

        template<class F>
        void for_each_list(F&& f) const
        {
            f(pending_);
            f(promoting_);
            f(update_);
            f(fixed_update_);
            f(late_update_);
        }

        template<class F>
        void for_each_match(const void* target, const std::string& property, F&& f);

        TweenList pending_;
        TweenList promoting_;    // pending tweens being stepped this update
        TweenList update_;
        TweenList fixed_update_;
        TweenList late_update_;

        std::weak_ptr<void> default_target_;
        std::type_index default_target_type_ = typeid(void);
        TweenEngine* engine_ = nullptr;

        bool in_use_ = false;
        bool registered_ = false;
    };

} // namespace eanim

#endif // TweenGroup_hpp
