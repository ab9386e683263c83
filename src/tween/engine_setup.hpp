/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/engine_config.hpp"
#include "core/export.hpp"

namespace twl::tween {

    // Applies logging, pooling and capacity settings. Call once at startup,
    // before any tween or timeline is created.
    TWL_TWEEN_API void configure(const core::EngineConfig& config);

} // namespace twl::tween
