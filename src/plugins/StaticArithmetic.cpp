// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "plugins/StaticArithmetic.hpp"
#include "plugins/GeneratedArithmetic.hpp"
#include "core/Tween.hpp"

namespace eanim::plugins
{
    StaticArithmeticRegistry::StaticArithmeticRegistry()
    {
        register_builtins();
    }

    void StaticArithmeticRegistry::register_builtins()
    {
        // All endpoints are reconstructed by addition: end(start, diff(start, end)) == end
        add<float>(std::make_shared<LinearArithmetic<float>>("StaticArithmetic"));
        add<double>(std::make_shared<LinearArithmetic<double>>("StaticArithmetic"));
        add<int>(std::make_shared<IntArithmetic>());
        add<glm::vec2>(std::make_shared<LinearArithmetic<glm::vec2>>("StaticArithmetic"));
        add<glm::vec3>(std::make_shared<LinearArithmetic<glm::vec3>>("StaticArithmetic"));
        add<glm::vec4>(std::make_shared<LinearArithmetic<glm::vec4>>("StaticArithmetic"));
        add<glm::quat>(std::make_shared<QuatArithmetic>());
    }

    PluginResult StaticArithmeticRegistry::probe(Tween& tween, TweenCapability capability) const
    {
        if (capability != TweenCapability::Arithmetic)
            return PluginResult::none();

        auto it = table_.find(tween.value_type());
        if (it == table_.end())
            return PluginResult::none();

        return PluginResult::bound(it->second);
    }

    void StaticArithmeticRegistry::clear()
    {
        table_.clear();
        sealed_ = false;
        register_builtins();
    }

    void StaticArithmeticRegistry::insert(std::type_index value_type, std::shared_ptr<ITweenPlugin> plugin)
    {
        if (sealed_)
            throw std::logic_error("Cannot teach arithmetic after the static arithmetic table was sealed");

        table_[value_type] = std::move(plugin);
    }

} // namespace eanim::plugins
