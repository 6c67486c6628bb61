// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef PluginResolver_hpp
#define PluginResolver_hpp

#include <array>
#include <optional>
#include <variant>
#include <vector>

#include "core/TweenPlugin.hpp"

namespace eanim
{
    class Tween;

    /// Selects exactly one provider per capability for a tween.
    ///
    /// Without an explicit request the default chain for the capability is
    /// probed in order and the first provider that binds is used, weakly.
    /// An explicit request runs only that plugin's probe and binds strongly.
    class PluginResolver
    {
    public:
        using ResolveResult = std::variant<ProviderBinding, ResolutionError>;

        /// Append a provider to the default chain of every capability it serves
        void add_default(PluginInfoPtr info);

        void clear_defaults();

        const std::vector<PluginInfoPtr>& default_chain(TweenCapability capability) const;

        ResolveResult resolve(
            Tween& tween,
            TweenCapability capability,
            const PluginInfo* explicit_request = nullptr) const;

        /// Install binding unless the current binding takes precedence.
        /// Replacing a non-overwritable binding with a strong request is an error.
        std::optional<ResolutionError> bind(
            Tween& tween,
            TweenCapability capability,
            ProviderBinding binding) const;

        /// Resolve all capabilities of a tween: default chains first, then the
        /// plugin loaders of its option scopes.
        std::optional<ResolutionError> resolve_all(Tween& tween) const;

    private:
        static std::size_t chain_index(TweenCapability capability);

        std::array<std::vector<PluginInfoPtr>, 3> chains_;
    };

} // namespace eanim

#endif // PluginResolver_hpp
