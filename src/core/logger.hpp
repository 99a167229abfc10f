/**
 * @file logger.hpp
 * @brief NDJSON logger shared by the scheduling service and the CLI.
 *
 * Each record is {"level","ts","msg"} on one line. The destination is an
 * ILogSink picked at startup from [telemetry]: a rotating file under
 * log_dir, stdout when log_dir is empty, or an in-memory sink in tests.
 * The metrics stream reuses the same sink interface.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ledger_scheduler {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Case-sensitive: "debug", "info", "warn" or "error".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/**
 * @brief Escape @p text for embedding inside a JSON string literal.
 *
 * Task ids and error messages are caller-supplied, so every string field
 * written by the logger, metrics and ledger export goes through this.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Destination for complete JSON lines. Implementations in
 * telemetry/json_sink.hpp; callers serialize writes.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Level-filtered front-end over one sink.
 *
 * Records below the minimum level are dropped before formatting. Writes
 * from concurrent scheduling calls are serialized by one mutex.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

}  // namespace ledger_scheduler
