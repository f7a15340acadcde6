// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Log.h
 * @brief Leveled logging with std::format
 *
 * Batch validation logs from several worker threads at once, so the level is
 * atomic and each line is written under a single lock.
 *
 * @code
 * KeyWarden::Log::set_level(KeyWarden::Log::Level::Debug);
 * KeyWarden::Log::info("Stored API key {} ({})", id, masked_key);
 * KeyWarden::Log::error("Integrity check failed for {}", id);
 * @endcode
 *
 * @warning Never pass a decrypted secret to any of these functions. Log
 *          ids, providers and masked keys only.
 */

#ifndef KEYWARDEN_LOG_H
#define KEYWARDEN_LOG_H

#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace KeyWarden::Log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

namespace detail {

inline std::atomic<Level> current_level{Level::Info};

inline std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

inline constexpr std::string_view level_tag(Level level) noexcept {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO ";
        case Level::Warning: return "WARN ";
        case Level::Error:   return "ERROR";
    }
    return "?????";
}

/** @brief Local time as "YYYY-MM-DD HH:MM:SS.mmm" */
inline std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&seconds, &tm);

    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis.count()));
}

inline void write_line(Level level, std::string_view message) {
    const std::string line = std::format("[{}] {} keywarden: {}\n",
        timestamp(), level_tag(level), message);

    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << line;
}

} // namespace detail

[[nodiscard]] inline bool enabled(Level level) noexcept {
    return level >= detail::current_level.load(std::memory_order_relaxed);
}

template<typename... Args>
void log(Level level, std::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) {
        return;
    }
    detail::write_line(level, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Change the minimum level at runtime
 *
 * Safe to call while worker threads are logging.
 */
inline void set_level(Level level) noexcept {
    detail::current_level.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level get_level() noexcept {
    return detail::current_level.load(std::memory_order_relaxed);
}

/**
 * @brief Parse a level name as stored in settings ("debug", "info", ...)
 * @return Matching level, or std::nullopt for unknown names
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "debug")   return Level::Debug;
    if (name == "info")    return Level::Info;
    if (name == "warning") return Level::Warning;
    if (name == "error")   return Level::Error;
    return std::nullopt;
}

} // namespace KeyWarden::Log

#endif // KEYWARDEN_LOG_H
