#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FSGUARD_CORE_LOGGING_H
#define FSGUARD_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
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
    HASH       = 1u << 0,
    MERKLE     = 1u << 1,
    PROOF      = 1u << 2,
    IO         = 1u << 3,
    CONFIG     = 1u << 4,
    CLI        = 1u << 5,
    BENCH      = 1u << 6,
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

/// Parses a level name ("trace", "debug", "info", "warn", "error",
/// "fatal", "off"), case-insensitive.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Parses a comma-separated category list such as "merkle,proof".
/// Recognised names: hash, merkle, proof, io, config, cli, bench, all,
/// none.  Returns nullopt if any name is unknown.
[[nodiscard]] std::optional<LogCategory> parse_log_categories(
    std::string_view list);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Returns the process-wide singleton instance.
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    void set_level(LogLevel level);

    /// Replaces the enabled category mask.
    void set_categories(LogCategory cats);

    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check: true if a message at @p level in @p cat would be
    /// written to at least one sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Redirects the console sink (stderr by default).  Passing nullptr
    /// restores stderr.  The stream must outlive its use by the logger.
    void set_console_stream(std::ostream* stream);

    /// Opens (or replaces) the log file in append mode.  An empty path
    /// closes the current file.  Returns false if the file cannot be
    /// opened; file output is disabled in that case.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes one formatted line.  Callers check will_log() first (the
    /// LOG_* macros do) so that disabled messages are never formatted.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123" in UTC.
    static std::string format_timestamp();

    /// Requires write_mutex_.
    void write_line_locked(std::string_view line);
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ostream*         console_ = nullptr;
    std::ofstream         file_stream_;
    std::filesystem::path log_file_path_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The will_log() check runs before the message expression is evaluated, so
// disabled paths cost one atomic load.
//
// Usage:
//   LOG_INFO(core::LogCategory::IO, "read " + path.string());
//   LOG_TRACE(core::LogCategory::PROOF, "sibling " + core::to_hex(d));
// ---------------------------------------------------------------------------

#define FSG_LOG_AT(lvl, cat, msg)                                         \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) FSG_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) FSG_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  FSG_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  FSG_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) FSG_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) FSG_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // FSGUARD_CORE_LOGGING_H
