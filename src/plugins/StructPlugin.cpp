// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "plugins/StructPlugin.hpp"
#include "core/TweenEngine.hpp"

namespace eanim::plugins
{
    entt::meta_any read_meta_path(entt::meta_any& obj, const MetaDataPath& path)
    {
        entt::meta_any current = obj.as_ref();
        for (const auto& field : path)
        {
            entt::meta_any next = field.get(current);
            if (!next)
                return {};
            current = std::move(next);
        }
        return current;
    }

    bool assign_meta_path_recursive(
        entt::meta_any& obj,
        const MetaDataPath& path,
        std::size_t idx,
        const entt::meta_any& leaf_value)
    {
        const auto& field = path[idx];

        // ---- LEAF CASE ----
        if (idx + 1 == path.size())
            return field.set(obj, leaf_value);

        // ---- NON-LEAF CASE ----

        // Get a VALUE copy of the subobject
        entt::meta_any sub = field.get(obj);
        if (!sub)
            return false;

        // Recurse into subobject
        if (!assign_meta_path_recursive(sub, path, idx + 1, leaf_value))
            return false;

        // Write updated subobject back into obj
        return field.set(obj, sub);
    }

    const PluginInfoPtr& struct_plugin()
    {
        static const PluginInfoPtr info = std::make_shared<const PluginInfo>(PluginInfo{
            .name = "Struct",
            .capabilities = TweenCapability::Accessor,
            .overwritable = true,
            .manual_probe = [](Tween& tween, TweenCapability capability) {
                return tween.type_info().struct_accessor(tween, capability, true);
            },
            .auto_probe = [](Tween& tween, TweenCapability capability) {
                auto* engine = tween.engine();
                if (!engine || !engine->reflection_enabled())
                    return PluginResult::none();
                if (tween.property().find('.') == std::string::npos)
                    return PluginResult::none();
                return tween.type_info().struct_accessor(tween, capability, false);
            } });
        return info;
    }
}
