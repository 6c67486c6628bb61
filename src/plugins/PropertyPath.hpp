// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <string>
#include <vector>

namespace eanim::plugins
{
    /// Split "member.field" into its segments. Empty segments are kept so
    /// that malformed paths fail lookup instead of resolving to something else.
    inline std::vector<std::string> split_property_path(const std::string& property)
    {
        std::vector<std::string> segments;
        std::string::size_type begin = 0;
        while (true)
        {
            const auto dot = property.find('.', begin);
            segments.push_back(property.substr(begin, dot - begin));
            if (dot == std::string::npos)
                break;
            begin = dot + 1;
        }
        return segments;
    }

    inline bool ends_with(const std::string& text, const std::string& suffix)
    {
        return text.size() >= suffix.size()
            && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}
