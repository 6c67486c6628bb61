// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogGlobals.hpp"
#include <cstdio>

namespace
{
    std::weak_ptr<eanim::ILogManager> g_logger;
}

namespace eanim::LogGlobals
{
    std::string format_va(const char* fmt, va_list args)
    {
        va_list measure;
        va_copy(measure, args);
        const int length = std::vsnprintf(nullptr, 0, fmt, measure);
        va_end(measure);
        if (length <= 0)
            return {};

        std::string text(static_cast<size_t>(length) + 1, '\0');
        std::vsnprintf(text.data(), text.size(), fmt, args);
        text.resize(static_cast<size_t>(length));
        return text;
    }

    void set_logger(std::weak_ptr<ILogManager> logger)
    {
        g_logger = std::move(logger);
    }

    void log(const char* fmt, ...)
    {
        auto logger = g_logger.lock();
        if (!logger)
            return;

        va_list args;
        va_start(args, fmt);
        const std::string text = format_va(fmt, args);
        va_end(args);
        logger->log("%s", text.c_str());
    }

    void clear()
    {
        if (auto logger = g_logger.lock())
            logger->clear();
    }

    ILogManager* try_get()
    {
        return g_logger.lock().get();
    }
}
