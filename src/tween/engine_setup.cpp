/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine_setup.hpp"
#include "timeline.hpp"
#include "tween.hpp"
#include "tween_manager.hpp"

#include "core/logger.hpp"

namespace twl::tween {

    void configure(const core::EngineConfig& config) {
        auto& logger = core::Logger::get();
        if (!config.log_file.empty()) {
            logger.init(config.log_level, config.log_file);
        } else {
            logger.setLevel(config.log_level);
        }

        Tween::setPoolingEnabled(config.pooling_enabled);
        Tween::ensurePoolCapacity(config.tween_pool_capacity);
        Timeline::ensurePoolCapacity(config.timeline_pool_capacity);
        TweenManager::setDefaultCapacity(config.manager_capacity);

        LOG_INFO("Tween engine configured: pooling {}, pools {}/{} (tweens/timelines), manager capacity {}",
                 config.pooling_enabled ? "on" : "off", config.tween_pool_capacity,
                 config.timeline_pool_capacity, config.manager_capacity);
    }

} // namespace twl::tween
