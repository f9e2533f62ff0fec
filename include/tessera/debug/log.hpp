#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <string_view>
#include <utility>

namespace tessera::debug {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

/**
 * @brief Process-wide stderr diagnostics with a runtime threshold
 *
 * Lines are written as `[LEVEL][TAG] message`. Secret material must never be
 * passed here; use key_logger.hpp (compiled out by default) for key dumps.
 */
class Log {
public:
    static void SetLevel(LogLevel level) noexcept {
        threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    [[nodiscard]] static LogLevel Level() noexcept {
        return static_cast<LogLevel>(threshold_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] static bool Enabled(LogLevel level) noexcept {
        return static_cast<int>(level) >= threshold_.load(std::memory_order_relaxed) &&
               level != LogLevel::Off;
    }

    template<typename... Args>
    static void Write(LogLevel level, std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
        if (!Enabled(level)) {
            return;
        }
        const auto line = fmt::format(format, std::forward<Args>(args)...);
        std::fprintf(stderr, "[%s][%.*s] %s\n",
                     LevelName(level),
                     static_cast<int>(tag.size()), tag.data(),
                     line.c_str());
    }

    template<typename... Args>
    static void Debug(std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Debug, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warn(std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warn, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, tag, format, std::forward<Args>(args)...);
    }

private:
    static const char* LevelName(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off: return "OFF";
        }
        return "?";
    }

    static inline std::atomic<int> threshold_{static_cast<int>(LogLevel::Warn)};
};

} // namespace tessera::debug
