// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogManager.hpp"
#include "LogGlobals.hpp"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace
{
    std::string relative_time_string()
    {
        using namespace std::chrono;
        static auto start = steady_clock::now();
        auto now = steady_clock::now();
        auto elapsed = duration_cast<milliseconds>(now - start);

        int seconds = static_cast<int>(elapsed.count() / 1000);
        int millis = static_cast<int>(elapsed.count() % 1000);

        std::ostringstream oss;
        oss << "[+" << seconds << '.' << std::setw(3) << std::setfill('0') << millis << ']';
        return oss.str();
    }
}

namespace eanim
{
    LogManager::LogManager(bool echo, std::size_t max_lines)
        : max_lines_(max_lines > 0 ? max_lines : 1)
        , echo_(echo)
    {
    }

    LogManager::~LogManager() = default;

    void LogManager::log(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string formatted = LogGlobals::format_va(fmt, args);
        va_end(args);

        std::string with_prefix = relative_time_string() + " " + formatted;
        if (echo_)
            std::printf("%s\n", with_prefix.c_str());

        lines_.push_back(std::move(with_prefix));
        while (lines_.size() > max_lines_)
            lines_.pop_front();
    }

    void LogManager::clear()
    {
        lines_.clear();
    }

    bool LogManager::contains(const std::string& text) const
    {
        for (const auto& line : lines_)
            if (line.find(text) != std::string::npos)
                return true;
        return false;
    }
}
