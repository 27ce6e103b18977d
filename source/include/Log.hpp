#pragma once

#include <atomic>
#include <cstdio>
#include <format>
#include <print>
#include <utility>

enum class LogLevel { Debug = 0, Info, Warning, Error, Off };

inline std::atomic<LogLevel> g_log_level{LogLevel::Info};

inline void set_log_level(LogLevel level) { g_log_level.store(level, std::memory_order_relaxed); }

inline bool log_enabled(LogLevel level) { return level >= g_log_level.load(std::memory_order_relaxed); }

template <typename... Args>
void log_debug(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Debug)) std::println("[debug] {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Info)) std::println("[info] {}", std::format(fmt, std::forward<Args>(args)...));
}

// warnings and errors go to stderr
template <typename... Args>
void log_warn(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Warning)) std::println(stderr, "[warn] {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Error)) std::println(stderr, "[error] {}", std::format(fmt, std::forward<Args>(args)...));
}
