// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/TweenGroup.hpp"
#include "core/TweenEngine.hpp"
#include <iterator>

namespace eanim
{
    TweenGroup::TweenGroup() = default;

    TweenGroup::~TweenGroup()
    {
        detach_all();
    }

    void TweenGroup::use_base(TweenOptions* parent, TweenEngine* engine)
    {
        if (in_use_)
            throw std::logic_error("Tween group is already in use, reset it before reuse");

        in_use_ = true;
        set_parent_options(parent);
        engine_ = engine;
    }

    TweenPool* TweenGroup::current_pool() const
    {
        return engine_ ? engine_->pool() : nullptr;
    }

    void TweenGroup::use(TweenOptions* parent, TweenEngine* engine)
    {
        use_base(parent, engine);
        default_target_.reset();
        default_target_type_ = typeid(void);
    }

    void TweenGroup::reset()
    {
        detach_all();
        TweenOptions::reset();

        pending_.clear();
        promoting_.clear();
        update_.clear();
        fixed_update_.clear();
        late_update_.clear();

        default_target_.reset();
        default_target_type_ = typeid(void);
        engine_ = nullptr;
        in_use_ = false;
        registered_ = false;
    }

    void TweenGroup::add(std::shared_ptr<Tween> tween)
    {
        if (!tween)
            throw std::invalid_argument("Cannot add a null tween to a group");
        if (!in_use_)
            throw std::logic_error("Cannot add tweens to a group that is not in use");

        tween->set_parent_options(this);
        tween->attach(this, engine_, engine_ ? engine_->clock() : TweenClock{});
        pending_.push_back(std::move(tween));

        // Start receiving updates
        if (!registered_ && engine_)
        {
            registered_ = true;
            engine_->register_group(shared_from_this());
        }
    }

    bool TweenGroup::update(TweenTiming phase)
    {
        // ---- PROMOTE PENDING ----
        if (!pending_.empty())
        {
            promoting_.swap(pending_);

            // Last added first, giving later tweens the first chance to overwrite
            for (auto it = promoting_.rbegin(); it != promoting_.rend(); ++it)
            {
                if ((*it)->update())
                    promote(*it);
            }

            TweenList done;
            for (auto& tween : promoting_)
            {
                if (!tween->is_active())
                    done.push_back(std::move(tween));
            }
            promoting_.clear();

            for (auto& tween : done)
                finished(std::move(tween));
        }

        // ---- STEP PHASE BUCKET ----
        if (auto* bucket = bucket_for(phase))
        {
            std::size_t keep = 0;
            for (std::size_t i = 0; i < bucket->size(); ++i)
            {
                if ((*bucket)[i]->update())
                {
                    if (keep != i)
                        std::swap((*bucket)[keep], (*bucket)[i]);
                    ++keep;
                }
            }

            TweenList done(
                std::make_move_iterator(bucket->begin() + keep),
                std::make_move_iterator(bucket->end()));
            bucket->erase(bucket->begin() + keep, bucket->end());

            for (auto& tween : done)
                finished(std::move(tween));
        }

        return has();
    }

    void TweenGroup::promote(const std::shared_ptr<Tween>& tween)
    {
        const auto timing = tween->get_timing();
        if (has_flag(timing, TweenTiming::Update))
            update_.push_back(tween);
        else if (has_flag(timing, TweenTiming::LateUpdate))
            late_update_.push_back(tween);
        else if (has_flag(timing, TweenTiming::FixedUpdate))
            fixed_update_.push_back(tween);
        else
            update_.push_back(tween);
    }

    void TweenGroup::detach_all()
    {
        for_each_list([&](const TweenList& list) {
            for (const auto& tween : list)
            {
                if (tween->group() == this)
                    tween->detach(engine_);
            }
            });
    }

    void TweenGroup::finished(std::shared_ptr<Tween> tween)
    {
        if (!tween)
            return;

        // Callers may keep the tween after this group is destroyed or reused
        if (tween->group() == this)
            tween->detach(engine_);

        auto* pool = current_pool();
        if (!pool)
            return;

        // Held elsewhere, retained, or recycling disabled
        if (tween.use_count() > 1 || tween->retain_count() > 0)
            return;
        if (!has_flag(tween->get_recycle(), TweenRecycle::Tweens))
            return;

        pool->return_tween(std::move(tween));
    }

    TweenGroup::TweenList* TweenGroup::bucket_for(TweenTiming phase)
    {
        if (has_flag(phase, TweenTiming::Update))
            return &update_;
        if (has_flag(phase, TweenTiming::FixedUpdate))
            return &fixed_update_;
        if (has_flag(phase, TweenTiming::LateUpdate))
            return &late_update_;
        return nullptr;
    }

    bool TweenGroup::has() const
    {
        return size() > 0;
    }

    bool TweenGroup::has(const void* target, const std::string& property) const
    {
        bool found = false;
        for_each_list([&](const TweenList& list) {
            for (const auto& tween : list)
            {
                if (found || !tween->is_active())
                    continue;
                if (target && tween->target_key() != target)
                    continue;
                if (!property.empty() && tween->property() != property)
                    continue;
                found = true;
            }
            });
        return found;
    }

    template<class F>
    void TweenGroup::for_each_match(const void* target, const std::string& property, F&& f)
    {
        // Copy first, callbacks may add tweens to the group
        TweenList matches;
        for_each_list([&](const TweenList& list) {
            for (const auto& tween : list)
            {
                if (target && tween->target_key() != target)
                    continue;
                if (!property.empty() && tween->property() != property)
                    continue;
                matches.push_back(tween);
            }
            });

        for (const auto& tween : matches)
            f(*tween);
    }

    void TweenGroup::stop(const void* target, const std::string& property)
    {
        for_each_match(target, property, [](Tween& tween) { tween.stop(); });
    }

    void TweenGroup::finish(const void* target, const std::string& property)
    {
        for_each_match(target, property, [](Tween& tween) { tween.finish(); });
    }

    void TweenGroup::cancel(const void* target, const std::string& property)
    {
        for_each_match(target, property, [](Tween& tween) { tween.cancel(); });
    }

    void TweenGroup::overwrite(Tween& tween)
    {
        for_each_match(tween.target_key(), tween.property(), [&](Tween& other) {
            if (&other != &tween)
                other.overwrite(tween);
            });
    }

    std::size_t TweenGroup::size() const
    {
        std::size_t count = 0;
        for_each_list([&](const TweenList& list) { count += list.size(); });
        return count;
    }

} // namespace eanim
