// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef StaticAccessor_hpp
#define StaticAccessor_hpp

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <typeindex>

#include "core/TweenPlugin.hpp"

namespace eanim::plugins
{
    /// Accessor built from a taught getter/setter pair
    template<class TTarget, class TValue>
    class TaughtAccessor final
        : public ITweenGetter<TTarget, TValue>
        , public ITweenSetter<TTarget, TValue>
    {
    public:
        using Getter = std::function<TValue(TTarget&)>;
        using Setter = std::function<void(TTarget&, const TValue&)>;

        TaughtAccessor(Getter getter, Setter setter)
            : getter_(std::move(getter))
            , setter_(std::move(setter))
        {
        }

        const char* name() const override { return "StaticAccessor"; }

        TValue get_value(TTarget& target, const std::string&, const entt::any&) override
        {
            return getter_(target);
        }

        void set_value(TTarget& target, const std::string&, const TValue& value, const entt::any&) override
        {
            setter_(target, value);
        }

    private:
        Getter getter_;
        Setter setter_;
    };

    /// Table of taught accessors keyed by (target type, value type, property).
    /// Populated at startup and sealed before the first tick; read-only after that.
    class StaticAccessorRegistry
    {
    public:
        template<class TTarget, class TValue>
        void teach(
            const std::string& property,
            std::function<TValue(TTarget&)> getter,
            std::function<void(TTarget&, const TValue&)> setter)
        {
            if (!getter || !setter)
                throw std::invalid_argument("Static accessor for " + property + " needs both a getter and a setter");

            insert(Key{ typeid(TTarget), typeid(TValue), property },
                std::make_shared<TaughtAccessor<TTarget, TValue>>(std::move(getter), std::move(setter)));
        }

        bool knows(std::type_index target_type, std::type_index value_type, const std::string& property) const;

        /// Bound if a lesson exists for the tween, otherwise not applicable
        PluginResult probe(Tween& tween, TweenCapability capability) const;

        void seal() { sealed_ = true; }
        bool sealed() const { return sealed_; }

        /// Remove all lessons and unseal
        void clear();

        std::size_t size() const { return lessons_.size(); }

    private:
        using Key = std::tuple<std::type_index, std::type_index, std::string>;

        void insert(Key key, std::shared_ptr<ITweenPlugin> plugin);

        std::map<Key, std::shared_ptr<ITweenPlugin>> lessons_;
        bool sealed_ = false;
    };

} // namespace eanim::plugins

#endif // StaticAccessor_hpp
