// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "LogGlobals.hpp"

#define EANIM_LOG(...)        ::eanim::LogGlobals::log(__VA_ARGS__)
#define EANIM_LOG_DEBUG(...)  ::eanim::LogGlobals::log("[DEBUG] " __VA_ARGS__)
#define EANIM_LOG_INFO(...)   ::eanim::LogGlobals::log("[INFO] " __VA_ARGS__)
#define EANIM_LOG_WARN(...)   ::eanim::LogGlobals::log("[WARN] " __VA_ARGS__)
#define EANIM_LOG_ERROR(...)  ::eanim::LogGlobals::log("[ERROR] " __VA_ARGS__)
