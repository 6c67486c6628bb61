// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "plugins/GeneratedAccessor.hpp"
#include "core/Tween.hpp"

namespace eanim::plugins
{
    PluginResult GeneratedAccessorRegistry::probe(Tween& tween, TweenCapability capability) const
    {
        if (!any(capability & TweenCapability::Accessor))
            return PluginResult::none();

        auto it = members_.find(Key{ tween.target_type(), tween.property() });
        if (it == members_.end())
            return PluginResult::none();

        const auto& entry = it->second;
        if (entry.value_type != tween.value_type())
        {
            const auto& info = tween.type_info();
            return PluginResult::failed(ResolutionErrorCode::TypeMismatch,
                "Mismatching types: Property type is " + entry.value_name
                + " but tween type is " + info.value_name
                + " for tween of " + tween.property() + " on " + info.target_name + ".");
        }

        return PluginResult::bound(entry.plugin);
    }

    void GeneratedAccessorRegistry::clear()
    {
        members_.clear();
        sealed_ = false;
    }

    void GeneratedAccessorRegistry::insert(Key key, Entry entry)
    {
        if (sealed_)
            throw std::logic_error("Cannot expose property " + key.second + " after the accessor table was sealed");

        members_.insert_or_assign(std::move(key), std::move(entry));
    }

} // namespace eanim::plugins
