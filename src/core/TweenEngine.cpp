// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/TweenEngine.hpp"
#include "plugins/SlerpPlugin.hpp"
#include "plugins/StructPlugin.hpp"
#include "LogGlobals.hpp"
#include <algorithm>

namespace eanim
{
    TweenEngine::TweenEngine()
    {
        over(1.0f)
            .delay(0.0f)
            .timing(TweenTiming::Default)
            .overwrite_policy(TweenOverwrite::Default)
            .recycle(TweenRecycle::All)
            .log_level(TweenLogLevel::Warning);

        install_default_plugins();

        singles_ = std::make_shared<TweenGroup>();
        singles_->use(this, this);
        singles_->recycle(TweenRecycle::Tweens);
    }

    TweenEngine::~TweenEngine() = default;

    void TweenEngine::install_default_plugins()
    {
        // Default chains, probed in order: static, generated, reflective

        resolver_.add_default(std::make_shared<const PluginInfo>(PluginInfo{
            .name = "StaticAccessor",
            .capabilities = TweenCapability::Accessor,
            .auto_probe = [this](Tween& tween, TweenCapability capability) {
                return static_accessors_.probe(tween, capability);
            } }));

        resolver_.add_default(std::make_shared<const PluginInfo>(PluginInfo{
            .name = "GeneratedAccessor",
            .capabilities = TweenCapability::Accessor,
            .auto_probe = [this](Tween& tween, TweenCapability capability) {
                return generated_accessors_.probe(tween, capability);
            } }));

        resolver_.add_default(std::make_shared<const PluginInfo>(PluginInfo{
            .name = "ReflectionAccessor",
            .capabilities = TweenCapability::Accessor,
            .auto_probe = [this](Tween& tween, TweenCapability capability) {
                if (!reflection_enabled_)
                    return PluginResult::none();
                return tween.type_info().reflection_accessor(tween, capability, false);
            } }));

        resolver_.add_default(std::make_shared<const PluginInfo>(PluginInfo{
            .name = "StaticArithmetic",
            .capabilities = TweenCapability::Arithmetic,
            .auto_probe = [this](Tween& tween, TweenCapability capability) {
                return static_arithmetic_.probe(tween, capability);
            } }));

        resolver_.add_default(std::make_shared<const PluginInfo>(PluginInfo{
            .name = "GeneratedArithmetic",
            .capabilities = TweenCapability::Arithmetic,
            .auto_probe = [](Tween& tween, TweenCapability capability) {
                return tween.type_info().generated_arithmetic(tween, capability, false);
            } }));

        resolver_.add_default(std::make_shared<const PluginInfo>(PluginInfo{
            .name = "ReflectionArithmetic",
            .capabilities = TweenCapability::Arithmetic,
            .auto_probe = [this](Tween& tween, TweenCapability capability) {
                if (!reflection_enabled_)
                    return PluginResult::none();
                return tween.type_info().reflection_arithmetic(tween, capability, false);
            } }));

        // Detection-only loaders for every tween
        plugin(plugins::slerp_plugin(), true, false);
        plugin(plugins::struct_plugin(), true, false);
    }

    void TweenEngine::advance(float delta_time)
    {
        if (delta_time < 0.0f)
        {
            log(TweenLogLevel::Warning, "Ignoring negative delta time %f.", delta_time);
            return;
        }
        unscaled_time_ += delta_time;
        scaled_time_ += static_cast<double>(delta_time) * time_scale_;
    }

    double TweenEngine::time(TweenTiming timing) const
    {
        if (has_flag(timing, TweenTiming::UnscaledTime))
            return unscaled_time_;
        if (has_flag(timing, TweenTiming::RealTime))
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - real_start_).count();
        return scaled_time_;
    }

    TweenClock TweenEngine::clock() const
    {
        return TweenClock{
            scaled_time_,
            unscaled_time_,
            time(TweenTiming::RealTime) };
    }

    void TweenEngine::set_time_scale(float scale)
    {
        if (scale < 0.0f)
        {
            log(TweenLogLevel::Warning, "Time scale must not be negative, got %f.", scale);
            return;
        }
        time_scale_ = scale;
    }

    void TweenEngine::process(TweenTiming phase)
    {
        seal_registries();

        for (std::size_t i = 0; i < groups_.size();)
        {
            auto group = groups_[i];
            if (group->update(phase))
            {
                ++i;
                continue;
            }

            groups_.erase(groups_.begin() + i);
            group->set_registered(false);
            recycle_group(std::move(group));
        }

        if (has_flag(phase, TweenTiming::LateUpdate))
            poll_waits();
    }

    void TweenEngine::tick(float delta_time)
    {
        advance(delta_time);
        process(TweenTiming::Update);
        process(TweenTiming::FixedUpdate);
        process(TweenTiming::LateUpdate);
    }

    void TweenEngine::register_group(std::shared_ptr<TweenGroup> group)
    {
        if (!group)
            return;
        if (std::find(groups_.begin(), groups_.end(), group) != groups_.end())
            return;
        groups_.push_back(std::move(group));
    }

    std::shared_ptr<TweenGroup> TweenEngine::create_group()
    {
        auto group = acquire_group();
        group->use(this, this);
        return group;
    }

    std::shared_ptr<TweenGroup> TweenEngine::acquire_group()
    {
        return pooling_enabled_ ? pool_.get_group() : std::make_shared<TweenGroup>();
    }

    void TweenEngine::recycle_group(std::shared_ptr<TweenGroup> group)
    {
        if (!pooling_enabled_ || group == singles_)
            return;

        // Held by the caller or retained
        if (group.use_count() > 1 || group->retain_count() > 0)
            return;
        if (!has_flag(group->get_recycle(), TweenRecycle::Groups))
            return;

        pool_.return_group(std::move(group));
    }

    bool TweenEngine::has(const void* target, const std::string& property) const
    {
        if (!target)
        {
            log(TweenLogLevel::Warning, "has() called with null target.");
            return false;
        }

        for (const auto& group : groups_)
        {
            if (group->has(target, property))
                return true;
        }
        return false;
    }

    void TweenEngine::stop(const void* target, const std::string& property)
    {
        if (!target)
        {
            log(TweenLogLevel::Warning, "stop() called with null target.");
            return;
        }

        for (const auto& group : std::vector(groups_))
            group->stop(target, property);
    }

    void TweenEngine::finish(const void* target, const std::string& property)
    {
        if (!target)
        {
            log(TweenLogLevel::Warning, "finish() called with null target.");
            return;
        }

        for (const auto& group : std::vector(groups_))
            group->finish(target, property);
    }

    void TweenEngine::cancel(const void* target, const std::string& property)
    {
        if (!target)
        {
            log(TweenLogLevel::Warning, "cancel() called with null target.");
            return;
        }

        for (const auto& group : std::vector(groups_))
            group->cancel(target, property);
    }

    void TweenEngine::overwrite(Tween& tween)
    {
        // The tween's own group may not be registered yet
        bool own_group_visited = false;
        for (const auto& group : std::vector(groups_))
        {
            own_group_visited |= group.get() == tween.group();
            group->overwrite(tween);
        }
        if (!own_group_visited && tween.group())
            tween.group()->overwrite(tween);
    }

    void TweenEngine::seal_registries()
    {
        static_accessors_.seal();
        generated_accessors_.seal();
        static_arithmetic_.seal();
    }

    GroupWaitPtr TweenEngine::wait_for(const std::shared_ptr<TweenGroup>& group, std::function<void()> on_complete)
    {
        auto wait = std::make_shared<GroupWait>(group, std::move(on_complete));
        track(wait);
        return wait;
    }

    void TweenEngine::track(const GroupWaitPtr& wait)
    {
        if (wait)
            waits_.push_back(wait);
    }

    void TweenEngine::poll_waits()
    {
        // Copy first, completion callbacks may create new waits
        auto waits = waits_;
        for (const auto& weak_wait : waits)
        {
            if (auto wait = weak_wait.lock())
                wait->poll();
        }

        // Restarted waits stay tracked as long as their owner holds them
        std::erase_if(waits_, [](const std::weak_ptr<GroupWait>& w) { return w.expired(); });
    }

    void TweenEngine::set_logger(std::shared_ptr<ILogManager> logger)
    {
        logger_ = std::move(logger);
        LogGlobals::set_logger(logger_);
    }

} // namespace eanim
