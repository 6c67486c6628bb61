// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <string>

namespace eanim
{
    enum class ResolutionErrorCode : int
    {
        TargetNotFound,         // named member absent on target type, or target expired
        TypeMismatch,           // member type differs from the tween's value type
        ValueTypeUnsupported,   // write would land in a by-value copy
        ActivationFailed,       // provider setup failed
        ArithmeticUnsupported   // no provider for diff/end/position
    };

    struct ResolutionError
    {
        ResolutionErrorCode code = ResolutionErrorCode::ActivationFailed;
        std::string message;
    };

    inline const char* to_string(ResolutionErrorCode code)
    {
        switch (code)
        {
        case ResolutionErrorCode::TargetNotFound: return "TargetNotFound";
        case ResolutionErrorCode::TypeMismatch: return "TypeMismatch";
        case ResolutionErrorCode::ValueTypeUnsupported: return "ValueTypeUnsupported";
        case ResolutionErrorCode::ActivationFailed: return "ActivationFailed";
        case ResolutionErrorCode::ArithmeticUnsupported: return "ArithmeticUnsupported";
        }
        return "Unknown";
    }
} // namespace eanim
