// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef StructPlugin_hpp
#define StructPlugin_hpp

#include <memory>
#include <string>
#include <vector>
#include <entt/entt.hpp>

#include "core/Tween.hpp"
#include "plugins/PropertyPath.hpp"
#include "LogMacros.h"

namespace eanim::plugins
{
    using MetaDataPath = std::vector<entt::meta_data>;

    /// Read the member at path by value
    entt::meta_any read_meta_path(entt::meta_any& obj, const MetaDataPath& path);

    /// Write leaf_value at path. Intermediate members are copied, modified
    /// and written back since they are held by value.
    bool assign_meta_path_recursive(
        entt::meta_any& obj,
        const MetaDataPath& path,
        std::size_t idx,
        const entt::meta_any& leaf_value);

    /// Accessor for a field of a by-value member, e.g. "position.x"
    template<class TTarget, class TValue>
    class StructAccessor final
        : public ITweenGetter<TTarget, TValue>
        , public ITweenSetter<TTarget, TValue>
    {
    public:
        const char* name() const override { return "Struct"; }

        TValue get_value(TTarget& target, const std::string&, const entt::any& user_data) override
        {
            const auto* path = entt::any_cast<MetaDataPath>(&user_data);
            if (!path)
                return TValue{};

            entt::meta_any obj = entt::forward_as_meta(target);
            entt::meta_any value = read_meta_path(obj, *path);
            if (!value)
                return TValue{};
            return value.cast<TValue>();
        }

        void set_value(TTarget& target, const std::string& property, const TValue& value, const entt::any& user_data) override
        {
            const auto* path = entt::any_cast<MetaDataPath>(&user_data);
            if (!path)
                return;

            entt::meta_any obj = entt::forward_as_meta(target);
            if (!assign_meta_path_recursive(obj, *path, 0, entt::meta_any{ value }))
                EANIM_LOG_WARN("Failed to set %s via struct plugin", property.c_str());
        }
    };

    template<class TTarget, class TValue>
    PluginResult struct_accessor_probe(Tween& tween, TweenCapability capability, bool explicit_request)
    {
        if (!any(capability & TweenCapability::Accessor))
            return PluginResult::none();

        const auto& property = tween.property();
        const auto& info = tween.type_info();
        const auto segments = split_property_path(property);

        if (segments.size() < 2)
        {
            if (explicit_request)
                return PluginResult::failed(ResolutionErrorCode::ActivationFailed,
                    "Struct plugin expects a path of the form member.field, got " + property + ".");
            return PluginResult::none();
        }

        MetaDataPath path;
        entt::meta_type type = entt::resolve<TTarget>();
        for (const auto& segment : segments)
        {
            entt::meta_data field = type ? type.data(entt::hashed_string{ segment.c_str() }) : entt::meta_data{};
            if (!field)
                return PluginResult::failed(ResolutionErrorCode::TargetNotFound,
                    "Property " + property + " on " + info.target_name + " could not be found.");
            path.push_back(field);
            type = field.type();
        }

        if (path.back().type().info() != entt::type_id<TValue>())
        {
            return PluginResult::failed(ResolutionErrorCode::TypeMismatch,
                "Mismatching types: Property type is " + std::string(path.back().type().info().name())
                + " but tween type is " + info.value_name
                + " for tween of " + property + " on " + info.target_name + ".");
        }

        return PluginResult::bound(std::make_shared<StructAccessor<TTarget, TValue>>(), entt::any{ std::move(path) });
    }

    /// Descriptor of the struct plugin. Automatic detection requires
    /// reflection to be enabled on the engine.
    const PluginInfoPtr& struct_plugin();

} // namespace eanim::plugins

#endif // StructPlugin_hpp
