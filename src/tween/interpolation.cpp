/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolation.hpp"
#include <algorithm>

namespace twl::tween {

    float applyEasing(const float t, const EasingType easing) {
        const float clamped = std::clamp(t, 0.0f, 1.0f);
        switch (easing) {
            case EasingType::LINEAR:
                return clamped;
            case EasingType::EASE_IN:
                return clamped * clamped;
            case EasingType::EASE_OUT:
                return clamped * (2.0f - clamped);
            case EasingType::EASE_IN_OUT:
                return clamped < 0.5f
                    ? 2.0f * clamped * clamped
                    : -1.0f + (4.0f - 2.0f * clamped) * clamped;
        }
        return clamped;
    }

    std::string_view easingTypeName(const EasingType easing) {
        switch (easing) {
            case EasingType::LINEAR:
                return "linear";
            case EasingType::EASE_IN:
                return "ease_in";
            case EasingType::EASE_OUT:
                return "ease_out";
            case EasingType::EASE_IN_OUT:
                return "ease_in_out";
        }
        return "linear";
    }

} // namespace twl::tween
