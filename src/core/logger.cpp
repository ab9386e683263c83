/* SPDX-FileCopyrightText: 2025 Tweenline Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace twl::core {

    namespace {
        constexpr const char* LOGGER_NAME = "tweenline";
        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

        spdlog::level::level_enum toSpdlog(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace:
                return spdlog::level::trace;
            case LogLevel::Debug:
                return spdlog::level::debug;
            case LogLevel::Info:
                return spdlog::level::info;
            case LogLevel::Warn:
                return spdlog::level::warn;
            case LogLevel::Error:
                return spdlog::level::err;
            case LogLevel::Critical:
                return spdlog::level::critical;
            case LogLevel::Off:
                return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        std::shared_ptr<spdlog::logger> makeLogger(std::vector<spdlog::sink_ptr> sinks) {
            auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
            logger->set_pattern(LOG_PATTERN);
            // Filtering happens in Logger::shouldLog
            logger->set_level(spdlog::level::trace);
            return logger;
        }
    } // namespace

    std::string_view logLevelName(const LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::Critical:
            return "critical";
        case LogLevel::Off:
            return "off";
        }
        return "info";
    }

    std::optional<LogLevel> parseLogLevel(const std::string_view name) {
        if (name == "trace")
            return LogLevel::Trace;
        if (name == "debug")
            return LogLevel::Debug;
        if (name == "info")
            return LogLevel::Info;
        if (name == "warn" || name == "warning")
            return LogLevel::Warn;
        if (name == "error")
            return LogLevel::Error;
        if (name == "critical")
            return LogLevel::Critical;
        if (name == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() {
        logger_ = makeLogger({std::make_shared<spdlog::sinks::stdout_color_sink_mt>()});
    }

    Logger::~Logger() = default;

    void Logger::init(const LogLevel level, const std::string& log_file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        std::string file_error;
        if (!log_file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        {
            std::lock_guard lock(mutex_);
            logger_ = makeLogger(std::move(sinks));
        }
        setLevel(level);

        if (!file_error.empty()) {
            LOG_ERROR("Failed to open log file {}: {}", log_file, file_error);
        }
    }

    void Logger::setLevel(const LogLevel level) {
        level_.store(level, std::memory_order_relaxed);
    }

    void Logger::flush() {
        std::lock_guard lock(mutex_);
        logger_->flush();
    }

    void Logger::write(const LogLevel level, const std::source_location& loc, const std::string& message) {
        std::lock_guard lock(mutex_);
        logger_->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                     toSpdlog(level), spdlog::string_view_t(message.data(), message.size()));
    }

} // namespace twl::core
