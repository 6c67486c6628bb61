// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <entt/entt.hpp>
#include "MetaLiterals.h"

namespace eanim::meta
{
    // Registered as member-like functions: the first parameter is the instance

    template<class T>
    T meta_add(const T& self, const T& other)
    {
        return self + other;
    }

    template<class T>
    T meta_sub(const T& self, const T& other)
    {
        return self - other;
    }

    template<class T>
    T meta_scale(const T& self, float factor)
    {
        return self * factor;
    }

    /// Register add/sub/scale meta functions so that T can be tweened
    /// by the reflective arithmetic provider
    template<class T>
    void register_arithmetic()
    {
        entt::meta_factory<T>{}
            .template func<&meta_add<T>>(literals::add_hs)
            .template func<&meta_sub<T>>(literals::sub_hs)
            .template func<&meta_scale<T>>(literals::scale_hs);
    }

    /// Arithmetic meta functions for glm::vec2, glm::vec3 and glm::vec4
    void register_glm_arithmetic();
}
