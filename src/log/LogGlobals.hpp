// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <cstdarg>
#include <memory>
#include <string>
#include "ILogManager.hpp"

namespace eanim::LogGlobals
{
    /// Routes library messages to logger. The engine installs its logger here.
    void set_logger(std::weak_ptr<ILogManager> logger);

    /// printf-style message to the installed logger; dropped if none is alive
    void log(const char* fmt, ...);

    void clear();

    /// nullptr if no logger is installed or it has expired
    ILogManager* try_get();

    std::string format_va(const char* fmt, va_list args);
}
