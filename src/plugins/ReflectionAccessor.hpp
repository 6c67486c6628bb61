// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef ReflectionAccessor_hpp
#define ReflectionAccessor_hpp

#include <memory>
#include <string>
#include <entt/entt.hpp>

#include "core/Tween.hpp"
#include "plugins/PropertyPath.hpp"
#include "LogMacros.h"

namespace eanim::plugins
{
    /// Accessor going through entt::meta data members
    template<class TTarget, class TValue>
    class ReflectionAccessor final
        : public ITweenGetter<TTarget, TValue>
        , public ITweenSetter<TTarget, TValue>
    {
    public:
        const char* name() const override { return "ReflectionAccessor"; }

        TValue get_value(TTarget& target, const std::string&, const entt::any& user_data) override
        {
            const auto* field = entt::any_cast<entt::meta_data>(&user_data);
            if (!field)
                return TValue{};

            entt::meta_any handle = entt::forward_as_meta(target);
            entt::meta_any value = field->get(handle);
            if (!value)
                return TValue{};
            return value.cast<TValue>();
        }

        void set_value(TTarget& target, const std::string& property, const TValue& value, const entt::any& user_data) override
        {
            const auto* field = entt::any_cast<entt::meta_data>(&user_data);
            if (!field)
                return;

            entt::meta_any handle = entt::forward_as_meta(target);
            if (!field->set(handle, value))
                EANIM_LOG_WARN("Failed to set %s via reflection", property.c_str());
        }
    };

    /// Finds the data member named by the tween's property.
    /// Dotted paths are rejected since nested members are copies.
    template<class TTarget, class TValue>
    PluginResult reflection_accessor_probe(Tween& tween, TweenCapability capability, bool)
    {
        if (!any(capability & TweenCapability::Accessor))
            return PluginResult::none();

        const auto& property = tween.property();
        const auto& info = tween.type_info();

        entt::meta_type type = entt::resolve<TTarget>();
        const auto segments = split_property_path(property);

        entt::meta_data field;
        for (std::size_t i = 0; i < segments.size(); ++i)
        {
            field = type ? type.data(entt::hashed_string{ segments[i].c_str() }) : entt::meta_data{};
            if (!field)
                return PluginResult::failed(ResolutionErrorCode::TargetNotFound,
                    "Property " + property + " on " + info.target_name + " could not be found.");

            if (i + 1 < segments.size())
            {
                return PluginResult::failed(ResolutionErrorCode::ValueTypeUnsupported,
                    "Cannot tween property " + property + " on value type "
                    + std::string(field.type().info().name()) + ", maybe use the struct plugin?");
            }
        }

        if (field.type().info() != entt::type_id<TValue>())
        {
            return PluginResult::failed(ResolutionErrorCode::TypeMismatch,
                "Mismatching types: Property type is " + std::string(field.type().info().name())
                + " but tween type is " + info.value_name
                + " for tween of " + property + " on " + info.target_name + ".");
        }

        if (capability == TweenCapability::Setter && field.is_const())
        {
            return PluginResult::failed(ResolutionErrorCode::ActivationFailed,
                "Property " + property + " on " + info.target_name + " is read-only.");
        }

        return PluginResult::bound(std::make_shared<ReflectionAccessor<TTarget, TValue>>(), entt::any{ field });
    }

} // namespace eanim::plugins

#endif // ReflectionAccessor_hpp
