// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/GroupWait.hpp"
#include "core/TweenGroup.hpp"

namespace eanim
{
    GroupWait::GroupWait(std::weak_ptr<TweenGroup> group, std::function<void()> on_complete)
        : group_(std::move(group))
        , on_complete_(std::move(on_complete))
    {
    }

    WaitStatus GroupWait::poll()
    {
        if (status_ != WaitStatus::Pending)
            return status_;

        auto group = group_.lock();
        if (group && group->has())
            return WaitStatus::Pending;

        status_ = WaitStatus::Complete;
        if (on_complete_)
            on_complete_();
        return status_;
    }

    void GroupWait::cancel()
    {
        if (status_ == WaitStatus::Pending)
            status_ = WaitStatus::Canceled;
    }

    void GroupWait::restart()
    {
        status_ = WaitStatus::Pending;
    }
}
