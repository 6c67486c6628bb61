// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef MetaLiterals_h
#define MetaLiterals_h

#include <entt/entt.hpp>
using namespace entt::literals;

namespace eanim::literals
{
    // Arithmetic used by the reflective arithmetic provider
    constexpr entt::hashed_string add_hs = "add"_hs;
    constexpr entt::hashed_string sub_hs = "sub"_hs;
    constexpr entt::hashed_string scale_hs = "scale"_hs;
}
#endif // MetaLiterals_h
