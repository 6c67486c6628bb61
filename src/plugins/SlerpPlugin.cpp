// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "plugins/SlerpPlugin.hpp"

namespace eanim::plugins
{
    const PluginInfoPtr& slerp_plugin()
    {
        static const PluginInfoPtr info = std::make_shared<const PluginInfo>(PluginInfo{
            .name = "Slerp",
            .capabilities = TweenCapability::Arithmetic,
            .overwritable = true,
            .manual_probe = [](Tween& tween, TweenCapability capability) {
                return tween.type_info().slerp(tween, capability, true);
            },
            .auto_probe = [](Tween& tween, TweenCapability capability) {
                return tween.type_info().slerp(tween, capability, false);
            } });
        return info;
    }
}
