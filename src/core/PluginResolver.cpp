// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "core/PluginResolver.hpp"
#include "core/Tween.hpp"
#include <stdexcept>

namespace eanim
{
    namespace
    {
        constexpr TweenCapability capabilities[] = {
            TweenCapability::Getter,
            TweenCapability::Setter,
            TweenCapability::Arithmetic
        };

        ResolutionError chain_exhausted(const Tween& tween, TweenCapability capability)
        {
            const auto& info = tween.type_info();
            if (capability == TweenCapability::Arithmetic)
                return ResolutionError{ ResolutionErrorCode::ArithmeticUnsupported,
                    "Type " + info.value_name + " does not support addition, subtraction or multiplication." };

            return ResolutionError{ ResolutionErrorCode::TargetNotFound,
                "Property " + tween.property() + " on " + info.target_name
                + " could not be found. Expose or teach it, or enable reflection." };
        }

        // Providers may throw while activating; that fails the probe, not the tick
        PluginResult run_probe(const PluginProbe& probe, Tween& tween, TweenCapability capability)
        {
            try
            {
                return probe(tween, capability);
            }
            catch (const std::exception& e)
            {
                return PluginResult::failed(ResolutionErrorCode::ActivationFailed,
                    std::string("Activation threw: ") + e.what());
            }
        }
    }

    std::size_t PluginResolver::chain_index(TweenCapability capability)
    {
        switch (capability)
        {
        case TweenCapability::Getter: return 0;
        case TweenCapability::Setter: return 1;
        case TweenCapability::Arithmetic: return 2;
        default:
            throw std::logic_error("Plugin chain requires a single capability");
        }
    }

    void PluginResolver::add_default(PluginInfoPtr info)
    {
        if (!info)
            return;
        for (auto capability : capabilities)
        {
            if (has_flag(info->capabilities, capability))
                chains_[chain_index(capability)].push_back(info);
        }
    }

    void PluginResolver::clear_defaults()
    {
        for (auto& chain : chains_)
            chain.clear();
    }

    const std::vector<PluginInfoPtr>& PluginResolver::default_chain(TweenCapability capability) const
    {
        return chains_[chain_index(capability)];
    }

    PluginResolver::ResolveResult PluginResolver::resolve(
        Tween& tween,
        TweenCapability capability,
        const PluginInfo* explicit_request) const
    {
        // ---- EXPLICIT REQUEST ----
        if (explicit_request)
        {
            const auto& info = *explicit_request;
            const std::string prefix = "Plugin " + info.name + " for " + tween.describe() + ": ";

            if (!has_flag(info.capabilities, capability))
                return ResolutionError{ ResolutionErrorCode::ActivationFailed,
                    prefix + "does not provide " + to_string(capability) + "." };

            const auto& probe = info.manual_probe ? info.manual_probe : info.auto_probe;
            if (!probe)
                return ResolutionError{ ResolutionErrorCode::ActivationFailed,
                    prefix + "has no activation probe." };

            auto result = run_probe(probe, tween, capability);
            if (result.is_failed())
                return ResolutionError{ ResolutionErrorCode::ActivationFailed, prefix + result.error.message };
            if (!result.is_bound() || !result.binding.plugin)
                return ResolutionError{ ResolutionErrorCode::ActivationFailed, prefix + "could not be activated." };
            if (!tween.accepts(*result.binding.plugin, capability))
                return ResolutionError{ ResolutionErrorCode::ActivationFailed,
                    prefix + "does not support value type " + tween.type_info().value_name + "." };

            auto binding = std::move(result.binding);
            binding.strength = BindingStrength::Strong;
            binding.overwritable = info.overwritable;
            binding.source = info.name;
            return binding;
        }

        // ---- DEFAULT CHAIN ----
        std::optional<ResolutionError> first_error;
        for (const auto& info : chains_[chain_index(capability)])
        {
            if (!info->auto_probe)
                continue;

            auto result = run_probe(info->auto_probe, tween, capability);
            if (result.is_failed())
            {
                if (!first_error)
                    first_error = std::move(result.error);
                continue;
            }
            if (!result.is_bound() || !result.binding.plugin)
                continue;
            if (!tween.accepts(*result.binding.plugin, capability))
                continue;

            auto binding = std::move(result.binding);
            binding.strength = BindingStrength::Weak;
            binding.overwritable = info->overwritable;
            binding.source = info->name;
            return binding;
        }

        if (first_error)
            return *first_error;
        return chain_exhausted(tween, capability);
    }

    std::optional<ResolutionError> PluginResolver::bind(
        Tween& tween,
        TweenCapability capability,
        ProviderBinding binding) const
    {
        const auto& current = tween.binding(capability);
        const bool incoming_strong = binding.strength == BindingStrength::Strong;

        if (current)
        {
            const bool current_strong = current.strength == BindingStrength::Strong;

            // Weak requests never displace a strong or non-overwritable binding
            if (!incoming_strong && (current_strong || !current.overwritable))
            {
                tween.log(TweenLogLevel::Debug, "%s: keeping %s over %s for %s.",
                    tween.describe().c_str(), current.source.c_str(), binding.source.c_str(), to_string(capability));
                return std::nullopt;
            }

            if (!current.overwritable)
            {
                return ResolutionError{ ResolutionErrorCode::ActivationFailed,
                    "Plugin " + binding.source + " conflicts with non-overwritable plugin "
                    + current.source + " for " + to_string(capability) + " of " + tween.describe() + "." };
            }
        }

        tween.install_binding(capability, std::move(binding));
        return std::nullopt;
    }

    std::optional<ResolutionError> PluginResolver::resolve_all(Tween& tween) const
    {
        std::array<std::optional<ResolutionError>, 3> chain_errors;

        // Default chains
        for (auto capability : capabilities)
        {
            auto result = resolve(tween, capability);
            if (auto* binding = std::get_if<ProviderBinding>(&result))
            {
                if (auto error = bind(tween, capability, std::move(*binding)))
                    return error;
            }
            else
                chain_errors[chain_index(capability)] = std::get<ResolutionError>(std::move(result));
        }

        // Plugin loaders of the option scopes, parent scopes first
        for (const auto& state : tween.collect_plugins())
        {
            if (!state.enabled || !state.info)
                continue;

            const auto& info = *state.info;
            for (auto capability : capabilities)
            {
                if (!has_flag(info.capabilities, capability))
                    continue;

                if (state.required)
                {
                    auto result = resolve(tween, capability, &info);
                    if (auto* error = std::get_if<ResolutionError>(&result))
                    {
                        tween.set_plugin_error(*error);
                        return *error;
                    }
                    if (auto error = bind(tween, capability, std::get<ProviderBinding>(std::move(result))))
                    {
                        tween.set_plugin_error(*error);
                        return error;
                    }
                    continue;
                }

                // Not required: automatic detection, failures are informational
                if (!info.auto_probe)
                    continue;
                auto result = run_probe(info.auto_probe, tween, capability);
                if (result.is_failed())
                {
                    tween.log(TweenLogLevel::Debug, "Plugin %s skipped for %s: %s",
                        info.name.c_str(), tween.describe().c_str(), result.error.message.c_str());
                    continue;
                }
                if (!result.is_bound() || !result.binding.plugin || !tween.accepts(*result.binding.plugin, capability))
                    continue;

                auto binding = std::move(result.binding);
                binding.strength = BindingStrength::Weak;
                binding.overwritable = info.overwritable;
                binding.source = info.name;
                if (auto error = bind(tween, capability, std::move(binding)))
                    return error;
            }
        }

        for (auto capability : capabilities)
        {
            if (tween.binding(capability))
                continue;
            auto& error = chain_errors[chain_index(capability)];
            return error ? *error : chain_exhausted(tween, capability);
        }
        return std::nullopt;
    }

} // namespace eanim
