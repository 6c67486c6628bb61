// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef TweenConfig_hpp
#define TweenConfig_hpp

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

#include "core/TweenTypes.hpp"

namespace eanim
{
    class TweenEngine;

    /// Engine defaults read from JSON. Absent keys leave the engine unchanged.
    ///
    /// {
    ///   "duration": 0.5, "delay": 0.0,
    ///   "timing": ["update", "unscaled_time"],
    ///   "overwrite": ["on_start", "stop", "overlapping"],
    ///   "recycle": "all", "log_level": "warning", "easing": "ease_out",
    ///   "enable_reflection": true, "enable_pooling": true, "time_scale": 1.0
    /// }
    struct TweenConfig
    {
        std::optional<float> duration;
        std::optional<float> delay;
        std::optional<TweenTiming> timing;
        std::optional<TweenOverwrite> overwrite;
        std::optional<TweenRecycle> recycle;
        std::optional<TweenLogLevel> log_level;
        std::optional<std::string> easing;
        std::optional<bool> enable_reflection;
        std::optional<bool> enable_pooling;
        std::optional<float> time_scale;

        /// Throws std::runtime_error naming the offending key
        static TweenConfig from_json(const nlohmann::json& json);
        static TweenConfig from_json_string(const std::string& text);
        static TweenConfig from_file(const std::string& path);

        nlohmann::json to_json() const;

        /// Write values into the engine's root option scope
        void apply(TweenEngine& engine) const;
    };

    /// Easing by name, throws std::runtime_error if unknown
    EasingMethod easing_from_name(const std::string& name);

} // namespace eanim

#endif // TweenConfig_hpp
