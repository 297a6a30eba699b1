/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "platform.hpp"
#include "env.hpp"
#include "string.hpp"

#include <array>
#include <atomic>
#include <optional>
#include <string_view>
#include <utility>

#ifndef MDK_ENABLE_SPDLOG
    #define MDK_ENABLE_SPDLOG 0
#endif

namespace mdk {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

/**
 * Parses a log level name, case-insensitive. Valid names are TRACE, DEBUG, INFO, WARN (or WARNING), ERROR, CRITICAL
 * and OFF.
 * @return The level, or nullopt if the name is not known.
 */
inline std::optional<LogLevel> parse_log_level(const std::string_view name) {
    constexpr std::array<std::pair<std::string_view, LogLevel>, 8> k_names {{
        {"TRACE", LogLevel::trace},
        {"DEBUG", LogLevel::debug},
        {"INFO", LogLevel::info},
        {"WARN", LogLevel::warning},
        {"WARNING", LogLevel::warning},
        {"ERROR", LogLevel::error},
        {"CRITICAL", LogLevel::critical},
        {"OFF", LogLevel::off},
    }};
    for (const auto& [level_name, level] : k_names) {
        if (string_compare_case_insensitive(string_trim(name), level_name)) {
            return level;
        }
    }
    return std::nullopt;
}

}  // namespace mdk

#if MDK_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #if MDK_MACOS
        #define SPDLOG_FUNCTION __PRETTY_FUNCTION__
    #endif

    #include <spdlog/spdlog.h>

    #define MDK_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #define MDK_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #define MDK_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #define MDK_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #define MDK_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #define MDK_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

namespace mdk {

inline void set_log_level(const LogLevel level) {
    switch (level) {
        case LogLevel::off:
            spdlog::set_level(spdlog::level::off);
            break;
        case LogLevel::critical:
            spdlog::set_level(spdlog::level::critical);
            break;
        case LogLevel::error:
            spdlog::set_level(spdlog::level::err);
            break;
        case LogLevel::warning:
            spdlog::set_level(spdlog::level::warn);
            break;
        case LogLevel::info:
            spdlog::set_level(spdlog::level::info);
            break;
        case LogLevel::debug:
            spdlog::set_level(spdlog::level::debug);
            break;
        case LogLevel::trace:
            spdlog::set_level(spdlog::level::trace);
            break;
    }
}

}  // namespace mdk

#else

    #include <fmt/format.h>

    #include <cstdio>

namespace mdk {

inline std::atomic<LogLevel>& current_log_level() {
    static std::atomic<LogLevel> level {LogLevel::info};
    return level;
}

inline void set_log_level(const LogLevel level) {
    current_log_level() = level;
}

}  // namespace mdk

    #define MDK_LOG_AT_LEVEL(level, prefix, ...)                                       \
        do {                                                                           \
            if (mdk::current_log_level().load() >= (level)) {                          \
                fmt::print(stderr, "[{}] {}\n", prefix, fmt::format(__VA_ARGS__));     \
            }                                                                          \
        } while (false)

    #define MDK_TRACE(...) MDK_LOG_AT_LEVEL(mdk::LogLevel::trace, "T", __VA_ARGS__)
    #define MDK_DEBUG(...) MDK_LOG_AT_LEVEL(mdk::LogLevel::debug, "D", __VA_ARGS__)
    #define MDK_INFO(...) MDK_LOG_AT_LEVEL(mdk::LogLevel::info, "I", __VA_ARGS__)
    #define MDK_WARNING(...) MDK_LOG_AT_LEVEL(mdk::LogLevel::warning, "W", __VA_ARGS__)
    #define MDK_ERROR(...) MDK_LOG_AT_LEVEL(mdk::LogLevel::error, "E", __VA_ARGS__)
    #define MDK_CRITICAL(...) MDK_LOG_AT_LEVEL(mdk::LogLevel::critical, "C", __VA_ARGS__)

#endif

namespace mdk {

/**
 * Sets the log level from its name, see parse_log_level(). An unknown name sets the level to info.
 * @param level The log level as string, case-insensitive.
 */
inline void set_log_level(const char* level) {
    if (const auto parsed = parse_log_level(level != nullptr ? level : "")) {
        set_log_level(*parsed);
        return;
    }
    set_log_level(LogLevel::info);
    MDK_WARNING("Invalid log level: {}. Setting log level to info.", level != nullptr ? level : "");
}

/**
 * Sets the log level from given environment variable, or to info if the variable is not set.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "MDK_LOG_LEVEL") {
    if (const auto env_value = get_env(env_var)) {
        set_log_level(env_value->c_str());
    } else {
        set_log_level(LogLevel::info);
    }
}

}  // namespace mdk
