// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "plugins/StaticAccessor.hpp"
#include "core/Tween.hpp"

namespace eanim::plugins
{
    bool StaticAccessorRegistry::knows(
        std::type_index target_type,
        std::type_index value_type,
        const std::string& property) const
    {
        return lessons_.contains(Key{ target_type, value_type, property });
    }

    PluginResult StaticAccessorRegistry::probe(Tween& tween, TweenCapability capability) const
    {
        if (!any(capability & TweenCapability::Accessor))
            return PluginResult::none();

        auto it = lessons_.find(Key{ tween.target_type(), tween.value_type(), tween.property() });
        if (it == lessons_.end())
            return PluginResult::none();

        return PluginResult::bound(it->second);
    }

    void StaticAccessorRegistry::clear()
    {
        lessons_.clear();
        sealed_ = false;
    }

    void StaticAccessorRegistry::insert(Key key, std::shared_ptr<ITweenPlugin> plugin)
    {
        if (sealed_)
            throw std::logic_error("Cannot teach property " + std::get<2>(key) + " after the static accessor table was sealed");

        lessons_[std::move(key)] = std::move(plugin);
    }

} // namespace eanim::plugins
