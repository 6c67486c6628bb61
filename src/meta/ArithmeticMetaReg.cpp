// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "ArithmeticMetaReg.hpp"

#include <stdexcept>
#include <glm/glm.hpp>

namespace eanim::meta
{
    namespace
    {
        template<class T>
        void warm_start_meta_type()
        {
            if (!entt::resolve<T>().func(literals::add_hs))
                throw std::runtime_error("entt::resolve() failed for GLM arithmetic meta type");
        }
    } // namespace

    void register_glm_arithmetic()
    {
        register_arithmetic<glm::vec2>();
        warm_start_meta_type<glm::vec2>();

        register_arithmetic<glm::vec3>();
        warm_start_meta_type<glm::vec3>();

        register_arithmetic<glm::vec4>();
        warm_start_meta_type<glm::vec4>();
    }
}
