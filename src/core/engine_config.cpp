/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/engine_config.hpp"

#include <cstdint>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace twl::core {

    namespace {
        template <typename T>
        std::expected<void, std::string> readField(const nlohmann::json& j, const char* key, T& out) {
            if (!j.contains(key)) {
                return {};
            }
            try {
                out = j.at(key).get<T>();
            } catch (const nlohmann::json::exception& e) {
                return std::unexpected(std::format("Invalid value for '{}': {}", key, e.what()));
            }
            return {};
        }

        // Capacities must be non-negative integers
        std::expected<void, std::string> readCapacity(const nlohmann::json& j, const char* key, size_t& out) {
            if (!j.contains(key)) {
                return {};
            }
            const auto& value = j.at(key);
            if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
                return std::unexpected(std::format("Invalid value for '{}': expected a non-negative integer, got {}",
                                                   key, value.dump()));
            }
            out = value.get<size_t>();
            return {};
        }
    } // namespace

    nlohmann::json EngineConfig::toJson() const {
        nlohmann::json j;
        j["pooling_enabled"] = pooling_enabled;
        j["timeline_pool_capacity"] = timeline_pool_capacity;
        j["tween_pool_capacity"] = tween_pool_capacity;
        j["manager_capacity"] = manager_capacity;
        j["log_level"] = std::string(logLevelName(log_level));
        j["log_file"] = log_file;
        return j;
    }

    std::expected<EngineConfig, std::string> EngineConfig::fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::unexpected("Engine config must be a JSON object");
        }

        EngineConfig config;
        std::string level_name(logLevelName(config.log_level));

        for (auto result : {readField(j, "pooling_enabled", config.pooling_enabled),
                            readCapacity(j, "timeline_pool_capacity", config.timeline_pool_capacity),
                            readCapacity(j, "tween_pool_capacity", config.tween_pool_capacity),
                            readCapacity(j, "manager_capacity", config.manager_capacity),
                            readField(j, "log_level", level_name),
                            readField(j, "log_file", config.log_file)}) {
            if (!result) {
                return std::unexpected(result.error());
            }
        }

        const auto level = parseLogLevel(level_name);
        if (!level) {
            return std::unexpected(std::format("Unknown log level: {}", level_name));
        }
        config.log_level = *level;

        return config;
    }

    std::expected<EngineConfig, std::string> loadEngineConfig(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(std::format("Failed to open engine config: {}", path.string()));
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            return std::unexpected(std::format("Failed to parse engine config {}: {}", path.string(), e.what()));
        }

        auto config = EngineConfig::fromJson(j);
        if (config) {
            LOG_INFO("Loaded engine config from {}", path.string());
        }
        return config;
    }

} // namespace twl::core
