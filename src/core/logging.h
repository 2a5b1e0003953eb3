#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PST_CORE_LOGGING_H
#define PST_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    LEDGER     = 1u << 0,
    FEES       = 1u << 1,
    ASSET      = 1u << 2,
    RPC        = 1u << 3,
    CONFIG     = 1u << 4,
    STORAGE    = 1u << 5,
    CRYPTO     = 1u << 6,
    NODE       = 1u << 7,
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the name of the lowest set category bit, "NONE" for zero and
/// "ALL" for the full mask.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses "trace", "debug", "info", "warn", "error", "fatal", "off"
/// (case-insensitive). Returns false on an unknown name.
[[nodiscard]] bool parse_log_level(std::string_view name, LogLevel& out);

/// Parses one category name ("ledger", "rpc", ..., "all").
[[nodiscard]] bool parse_log_category(std::string_view name,
                                      LogCategory& out);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    /// Replaces the whole category mask.
    void set_categories(LogCategory mask);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check: true if a message at this level and category
    /// would reach at least one sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the append-mode log file. An empty path
    /// closes the current file.
    void set_log_file(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path log_file() const;

    void flush();

    /// Writes one formatted line. Callers check will_log() first.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Requires write_mutex_.
    void write_line_locked(std::string_view line);
    void drain_buffer_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::filesystem::path log_file_path_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The will_log() check runs before the message expression is evaluated,
// so disabled paths never build their strings.
//
//   LOG_INFO(core::LogCategory::LEDGER, "created transfer " + id_str);
// ---------------------------------------------------------------------------

#define PST_LOG_AT(lvl, cat, msg)                                         \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) PST_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) PST_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  PST_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  PST_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) PST_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) PST_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // PST_CORE_LOGGING_H
