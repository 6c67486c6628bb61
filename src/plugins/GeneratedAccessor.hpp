// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef GeneratedAccessor_hpp
#define GeneratedAccessor_hpp

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <utility>

#include "core/TweenPlugin.hpp"

namespace eanim::plugins
{
    template<class>
    struct member_pointer_traits;

    template<class C, class V>
    struct member_pointer_traits<V C::*>
    {
        using class_type = C;
        using value_type = V;
    };

    /// Direct accessor compiled from a data member pointer
    template<auto Member>
    class MemberAccessor final
        : public ITweenGetter<typename member_pointer_traits<decltype(Member)>::class_type,
                              typename member_pointer_traits<decltype(Member)>::value_type>
        , public ITweenSetter<typename member_pointer_traits<decltype(Member)>::class_type,
                              typename member_pointer_traits<decltype(Member)>::value_type>
    {
        using TTarget = typename member_pointer_traits<decltype(Member)>::class_type;
        using TValue = typename member_pointer_traits<decltype(Member)>::value_type;

    public:
        const char* name() const override { return "GeneratedAccessor"; }

        TValue get_value(TTarget& target, const std::string&, const entt::any&) override
        {
            return target.*Member;
        }

        void set_value(TTarget& target, const std::string&, const TValue& value, const entt::any&) override
        {
            target.*Member = value;
        }
    };

    /// Member-pointer accessors keyed by (target type, property)
    class GeneratedAccessorRegistry
    {
    public:
        template<auto Member>
        void expose(const std::string& property)
        {
            using traits = member_pointer_traits<decltype(Member)>;
            using TTarget = typename traits::class_type;
            using TValue = typename traits::value_type;

            insert(Key{ typeid(TTarget), property }, Entry{
                typeid(TValue),
                std::string(entt::type_id<TValue>().name()),
                std::make_shared<MemberAccessor<Member>>() });
        }

        /// Bound for an exposed property with matching value type,
        /// TypeMismatch if the value type differs, otherwise not applicable
        PluginResult probe(Tween& tween, TweenCapability capability) const;

        void seal() { sealed_ = true; }
        bool sealed() const { return sealed_; }
        void clear();
        std::size_t size() const { return members_.size(); }

    private:
        using Key = std::pair<std::type_index, std::string>;

        struct Entry
        {
            std::type_index value_type;
            std::string value_name;
            std::shared_ptr<ITweenPlugin> plugin;
        };

        void insert(Key key, Entry entry);

        std::map<Key, Entry> members_;
        bool sealed_ = false;
    };

} // namespace eanim::plugins

#endif // GeneratedAccessor_hpp
