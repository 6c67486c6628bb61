// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "config/TweenConfig.hpp"
#include "core/TweenEngine.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace eanim
{
    namespace
    {
        template<class E>
        using FlagNames = std::array<std::pair<const char*, E>, 7>;

        constexpr FlagNames<TweenTiming> timing_names{ {
            { "update", TweenTiming::Update },
            { "fixed_update", TweenTiming::FixedUpdate },
            { "late_update", TweenTiming::LateUpdate },
            { "default_time", TweenTiming::DefaultTime },
            { "unscaled_time", TweenTiming::UnscaledTime },
            { "real_time", TweenTiming::RealTime },
            { "default", TweenTiming::Default }
        } };

        constexpr FlagNames<TweenOverwrite> overwrite_names{ {
            { "on_initialize", TweenOverwrite::OnInitialize },
            { "on_start", TweenOverwrite::OnStart },
            { "stop", TweenOverwrite::Stop },
            { "finish", TweenOverwrite::Finish },
            { "cancel", TweenOverwrite::Cancel },
            { "all", TweenOverwrite::All },
            { "overlapping", TweenOverwrite::Overlapping }
        } };

        [[noreturn]] void malformed(const char* key, const std::string& detail)
        {
            throw std::runtime_error(std::string("TweenConfig: malformed value for '") + key + "': " + detail);
        }

        float read_float(const nlohmann::json& json, const char* key)
        {
            const auto& value = json.at(key);
            if (!value.is_number())
                malformed(key, "expected a number");
            const auto result = value.get<float>();
            if (std::isnan(result))
                malformed(key, "not a number");
            return result;
        }

        bool read_bool(const nlohmann::json& json, const char* key)
        {
            const auto& value = json.at(key);
            if (!value.is_boolean())
                malformed(key, "expected true or false");
            return value.get<bool>();
        }

        template<class E>
        E read_flags(const nlohmann::json& json, const char* key, const FlagNames<E>& names)
        {
            const auto& value = json.at(key);

            auto lookup = [&](const nlohmann::json& elem) {
                if (!elem.is_string())
                    malformed(key, "expected flag names");
                const auto name = elem.get<std::string>();
                for (const auto& [flag_name, flag] : names)
                {
                    if (name == flag_name)
                        return flag;
                }
                malformed(key, "unknown flag '" + name + "'");
                };

            if (value.is_string())
                return lookup(value);
            if (!value.is_array() || value.empty())
                malformed(key, "expected a flag name or a non-empty array of flag names");

            E result = E::Undefined;
            for (const auto& elem : value)
                result |= lookup(elem);
            return result;
        }

        template<class E>
        nlohmann::json write_flags(E value, const FlagNames<E>& names)
        {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& [name, flag] : names)
            {
                // Composite names are written as their parts
                if (std::string(name) == "default")
                    continue;
                if (has_flag(value, flag))
                    j.push_back(name);
            }
            return j;
        }

        TweenOverwrite read_overwrite(const nlohmann::json& json)
        {
            const auto& value = json.at("overwrite");
            if (value.is_string())
            {
                const auto name = value.get<std::string>();
                if (name == "none") return TweenOverwrite::None;
                if (name == "default") return TweenOverwrite::Default;
                if (name == "immediate") return TweenOverwrite::Immediate;
            }
            return read_flags(json, "overwrite", overwrite_names);
        }

        TweenRecycle read_recycle(const nlohmann::json& json)
        {
            const auto& value = json.at("recycle");
            if (!value.is_string())
                malformed("recycle", "expected a string");
            const auto name = value.get<std::string>();
            if (name == "none") return TweenRecycle::None;
            if (name == "tweens") return TweenRecycle::Tweens;
            if (name == "groups") return TweenRecycle::Groups;
            if (name == "all") return TweenRecycle::All;
            malformed("recycle", "unknown value '" + name + "'");
        }

        const char* recycle_name(TweenRecycle recycle)
        {
            if (has_flag(recycle, TweenRecycle::Tweens) && has_flag(recycle, TweenRecycle::Groups)) return "all";
            if (has_flag(recycle, TweenRecycle::Tweens)) return "tweens";
            if (has_flag(recycle, TweenRecycle::Groups)) return "groups";
            return "none";
        }

        TweenLogLevel read_log_level(const nlohmann::json& json)
        {
            const auto& value = json.at("log_level");
            if (!value.is_string())
                malformed("log_level", "expected a string");
            const auto name = value.get<std::string>();
            if (name == "debug") return TweenLogLevel::Debug;
            if (name == "warning") return TweenLogLevel::Warning;
            if (name == "error") return TweenLogLevel::Error;
            if (name == "silent") return TweenLogLevel::Silent;
            malformed("log_level", "unknown value '" + name + "'");
        }

        const char* log_level_name(TweenLogLevel level)
        {
            switch (level)
            {
            case TweenLogLevel::Debug: return "debug";
            case TweenLogLevel::Error: return "error";
            case TweenLogLevel::Silent: return "silent";
            default: return "warning";
            }
        }
    }

    EasingMethod easing_from_name(const std::string& name)
    {
        if (name == "linear") return easing::linear;
        if (name == "ease_in") return easing::ease_in;
        if (name == "ease_out") return easing::ease_out;
        if (name == "ease_in_out") return easing::ease_in_out;
        throw std::runtime_error("TweenConfig: unknown easing '" + name + "'");
    }

    TweenConfig TweenConfig::from_json(const nlohmann::json& json)
    {
        if (!json.is_object())
            throw std::runtime_error("TweenConfig: expected a JSON object");

        TweenConfig config;

        if (json.contains("duration"))
        {
            config.duration = read_float(json, "duration");
            if (*config.duration < 0.0f)
                malformed("duration", "must not be negative");
        }
        if (json.contains("delay"))
        {
            config.delay = read_float(json, "delay");
            if (*config.delay < 0.0f)
                malformed("delay", "must not be negative");
        }
        if (json.contains("timing"))
            config.timing = read_flags(json, "timing", timing_names);
        if (json.contains("overwrite"))
            config.overwrite = read_overwrite(json);
        if (json.contains("recycle"))
            config.recycle = read_recycle(json);
        if (json.contains("log_level"))
            config.log_level = read_log_level(json);
        if (json.contains("easing"))
        {
            const auto& value = json.at("easing");
            if (!value.is_string())
                malformed("easing", "expected a string");
            config.easing = value.get<std::string>();
            (void)easing_from_name(*config.easing);
        }
        if (json.contains("enable_reflection"))
            config.enable_reflection = read_bool(json, "enable_reflection");
        if (json.contains("enable_pooling"))
            config.enable_pooling = read_bool(json, "enable_pooling");
        if (json.contains("time_scale"))
        {
            config.time_scale = read_float(json, "time_scale");
            if (*config.time_scale < 0.0f)
                malformed("time_scale", "must not be negative");
        }

        return config;
    }

    TweenConfig TweenConfig::from_json_string(const std::string& text)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw std::runtime_error(std::string("TweenConfig: parse error: ") + e.what());
        }
        return from_json(json);
    }

    TweenConfig TweenConfig::from_file(const std::string& path)
    {
        std::ifstream file(path);
        if (!file)
            throw std::runtime_error("TweenConfig: unable to open " + path);

        std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return from_json_string(text);
    }

    nlohmann::json TweenConfig::to_json() const
    {
        nlohmann::json j = nlohmann::json::object();

        if (duration) j["duration"] = *duration;
        if (delay) j["delay"] = *delay;
        if (timing) j["timing"] = write_flags(*timing, timing_names);
        if (overwrite)
        {
            if (*overwrite == TweenOverwrite::None)
                j["overwrite"] = "none";
            else
                j["overwrite"] = write_flags(*overwrite, overwrite_names);
        }
        if (recycle) j["recycle"] = recycle_name(*recycle);
        if (log_level) j["log_level"] = log_level_name(*log_level);
        if (easing) j["easing"] = *easing;
        if (enable_reflection) j["enable_reflection"] = *enable_reflection;
        if (enable_pooling) j["enable_pooling"] = *enable_pooling;
        if (time_scale) j["time_scale"] = *time_scale;

        return j;
    }

    void TweenConfig::apply(TweenEngine& engine) const
    {
        if (duration) engine.over(*duration);
        if (delay) engine.delay(*delay);
        if (timing) engine.timing(*timing);
        if (overwrite) engine.overwrite_policy(*overwrite);
        if (recycle) engine.recycle(*recycle);
        if (log_level) engine.log_level(*log_level);
        if (easing) engine.ease(easing_from_name(*easing));
        if (enable_reflection) engine.enable_reflection(*enable_reflection);
        if (enable_pooling) engine.enable_pooling(*enable_pooling);
        if (time_scale) engine.set_time_scale(*time_scale);
    }

} // namespace eanim
