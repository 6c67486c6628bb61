// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenPool_hpp
#define TweenPool_hpp

#include <deque>
#include <map>
#include <memory>
#include <typeindex>
#include <utility>

#include "core/TypedTween.hpp"

namespace eanim
{
    class TweenGroup;

    /// Recycles tween and group instances. Instances are reset on return.
    class TweenPool
    {
    public:
        template<class TTarget, class TValue>
        std::shared_ptr<TypedTween<TTarget, TValue>> get_tween()
        {
            auto it = tweens_.find(Key{ typeid(TTarget), typeid(TValue) });
            if (it == tweens_.end() || it->second.empty())
            {
                ++created_tweens_;
                return std::make_shared<TypedTween<TTarget, TValue>>();
            }

            auto tween = std::static_pointer_cast<TypedTween<TTarget, TValue>>(std::move(it->second.front()));
            it->second.pop_front();
            return tween;
        }

        void return_tween(std::shared_ptr<Tween> tween);

        std::shared_ptr<TweenGroup> get_group();

        void return_group(std::shared_ptr<TweenGroup> group);

        std::size_t pooled_tweens() const;
        std::size_t pooled_groups() const { return groups_.size(); }
        std::size_t created_tweens() const { return created_tweens_; }
        std::size_t created_groups() const { return created_groups_; }

        void clear();

    private:
        using Key = std::pair<std::type_index, std::type_index>;

        std::map<Key, std::deque<std::shared_ptr<Tween>>> tweens_;
        std::deque<std::shared_ptr<TweenGroup>> groups_;
        std::size_t created_tweens_ = 0;
        std::size_t created_groups_ = 0;
    };

} // namespace eanim

#endif // TweenPool_hpp
