/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <cstdint>
#include <string_view>

namespace twl::tween {

    enum class EasingType : uint8_t {
        LINEAR,
        EASE_IN,
        EASE_OUT,
        EASE_IN_OUT
    };

    // Map t in [0,1] to eased t; input outside the range is clamped
    [[nodiscard]] TWL_TWEEN_API float applyEasing(float t, EasingType easing);

    [[nodiscard]] TWL_TWEEN_API std::string_view easingTypeName(EasingType easing);

} // namespace twl::tween
