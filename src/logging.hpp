// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& value, LogLevel& level);

/**
 * One structured log record.
 *
 * Built fluently: SLOG_WARN("Table reuse").field("id", id).field("attachment", name)
 */
class LogEntry {
  public:
    LogEntry(LogLevel level, std::string message) : level_(level), message_(std::move(message)) {}

    LogEntry& field(const std::string& key, const std::string& value);
    LogEntry& field(const std::string& key, const char* value);
    LogEntry& field(const std::string& key, int64_t value);
    LogEntry& field(const std::string& key, uint64_t value);
    LogEntry& field(const std::string& key, int32_t value) { return field(key, static_cast<int64_t>(value)); }
    LogEntry& field(const std::string& key, uint32_t value) { return field(key, static_cast<uint64_t>(value)); }
    LogEntry& field(const std::string& key, double value);
    LogEntry& field(const std::string& key, bool value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    std::string format_text() const;
    std::string format_json() const;

  private:
    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };

    LogLevel level_;
    std::string message_;
    std::vector<Field> fields_;
};

class Logger {
  public:
    void log(const LogEntry& entry);

    void set_output(std::ostream* out);
    void set_json_format(bool json);
    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    // Applies VIGIL_LOG_LEVEL and VIGIL_LOG_JSON.
    void configure_from_env();

  private:
    mutable std::mutex mu_;
    std::ostream* out_ = &std::cerr;
    bool json_ = false;
    LogLevel level_ = LogLevel::Info;
};

Logger& logger();

std::string json_escape(const std::string& in);

} // namespace vigil

#define SLOG_DEBUG(msg) ::vigil::LogEntry(::vigil::LogLevel::Debug, (msg))
#define SLOG_INFO(msg) ::vigil::LogEntry(::vigil::LogLevel::Info, (msg))
#define SLOG_WARN(msg) ::vigil::LogEntry(::vigil::LogLevel::Warn, (msg))
#define SLOG_ERROR(msg) ::vigil::LogEntry(::vigil::LogLevel::Error, (msg))
