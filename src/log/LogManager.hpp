// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ILogManager.hpp"
#include <cstddef>
#include <deque>
#include <string>

namespace eanim
{
    /// Buffers formatted log lines, optionally echoing them to stdout.
    /// Holds at most max_lines; the oldest lines are dropped first.
    class LogManager : public ILogManager
    {
    public:
        static constexpr std::size_t default_max_lines = 1000;

        explicit LogManager(bool echo = false, std::size_t max_lines = default_max_lines);
        ~LogManager();

        void log(const char* fmt, ...) override;
        void clear() override;

        const std::deque<std::string>& lines() const { return lines_; }

        /// True if any buffered line contains text
        bool contains(const std::string& text) const;

        void set_echo(bool echo) { echo_ = echo; }

        std::size_t max_lines() const { return max_lines_; }

    private:
        std::deque<std::string> lines_;
        std::size_t max_lines_ = default_max_lines;
        bool echo_ = false;
    };
}
