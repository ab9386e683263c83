/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace spdlog {
    class logger;
}

namespace twl::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    [[nodiscard]] TWL_CORE_API std::string_view logLevelName(LogLevel level);
    [[nodiscard]] TWL_CORE_API std::optional<LogLevel> parseLogLevel(std::string_view name);

    class TWL_CORE_API Logger {
    public:
        static Logger& get();

        // Console sink is always present; a non-empty log_file adds a file sink
        void init(LogLevel level = LogLevel::Info, const std::string& log_file = "");

        void setLevel(LogLevel level);
        [[nodiscard]] LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        [[nodiscard]] bool shouldLog(const LogLevel level) const {
            return level != LogLevel::Off && level >= this->level();
        }

        template <typename... Args>
        void log(const LogLevel level, const std::source_location& loc,
                 std::format_string<Args...> fmt, Args&&... args) {
            if (!shouldLog(level)) {
                return;
            }
            write(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

        void flush();

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void write(LogLevel level, const std::source_location& loc, const std::string& message);

        std::shared_ptr<spdlog::logger> logger_;
        std::atomic<LogLevel> level_{LogLevel::Info};
        mutable std::mutex mutex_;
    };

} // namespace twl::core

#define LOG_TRACE(...)    ::twl::core::Logger::get().log(::twl::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)
#define LOG_DEBUG(...)    ::twl::core::Logger::get().log(::twl::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)
#define LOG_INFO(...)     ::twl::core::Logger::get().log(::twl::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)
#define LOG_WARN(...)     ::twl::core::Logger::get().log(::twl::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)
#define LOG_ERROR(...)    ::twl::core::Logger::get().log(::twl::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)
#define LOG_CRITICAL(...) ::twl::core::Logger::get().log(::twl::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)
