// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <functional>
#include <memory>

namespace eanim
{
    class TweenGroup;

    enum class WaitStatus : int { Pending, Complete, Canceled };

    /// Cooperative wait for a group to run out of tweens.
    /// Polled once per tick; never blocks.
    class GroupWait
    {
    public:
        explicit GroupWait(std::weak_ptr<TweenGroup> group, std::function<void()> on_complete = {});

        /// Check the group. Completes once the group holds no tweens.
        WaitStatus poll();

        /// Stop waiting. The completion callback will not be called.
        void cancel();

        /// Wait again from the current state of the group
        void restart();

        WaitStatus status() const { return status_; }

    private:
        std::weak_ptr<TweenGroup> group_;
        std::function<void()> on_complete_;
        WaitStatus status_ = WaitStatus::Pending;
    };

    using GroupWaitPtr = std::shared_ptr<GroupWait>;
}
