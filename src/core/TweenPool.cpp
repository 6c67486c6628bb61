// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/TweenPool.hpp"
#include "core/TweenGroup.hpp"

namespace eanim
{
    void TweenPool::return_tween(std::shared_ptr<Tween> tween)
    {
        if (!tween)
            return;

        tween->reset();
        tweens_[Key{ tween->target_type(), tween->value_type() }].push_back(std::move(tween));
    }

    std::shared_ptr<TweenGroup> TweenPool::get_group()
    {
        if (groups_.empty())
        {
            ++created_groups_;
            return std::make_shared<TweenGroup>();
        }

        auto group = std::move(groups_.front());
        groups_.pop_front();
        return group;
    }

    void TweenPool::return_group(std::shared_ptr<TweenGroup> group)
    {
        if (!group)
            return;

        group->reset();
        groups_.push_back(std::move(group));
    }

    std::size_t TweenPool::pooled_tweens() const
    {
        std::size_t count = 0;
        for (const auto& [key, queue] : tweens_)
            count += queue.size();
        return count;
    }

    void TweenPool::clear()
    {
        tweens_.clear();
        groups_.clear();
    }

} // namespace eanim
