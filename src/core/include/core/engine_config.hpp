/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/logger.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace twl::core {

    struct TWL_CORE_API EngineConfig {
        // Freed nodes are recycled instead of destroyed
        bool pooling_enabled = true;
        size_t timeline_pool_capacity = 10;
        size_t tween_pool_capacity = 20;
        size_t manager_capacity = 20;

        LogLevel log_level = LogLevel::Info;
        std::string log_file;

        [[nodiscard]] nlohmann::json toJson() const;

        // Keys missing from the document keep their defaults
        static std::expected<EngineConfig, std::string> fromJson(const nlohmann::json& j);
    };

    [[nodiscard]] TWL_CORE_API std::expected<EngineConfig, std::string>
    loadEngineConfig(const std::filesystem::path& path);

} // namespace twl::core
