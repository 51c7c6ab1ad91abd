// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>

#include "utils.hpp"

namespace vigil {

namespace {

std::string timestamp_utc()
{
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03lldZ", buf, static_cast<long long>(millis));
    return out;
}

} // namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& value, LogLevel& level)
{
    const std::string v = to_lower(trim(value));
    if (v == "debug") {
        level = LogLevel::Debug;
    } else if (v == "info") {
        level = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        level = LogLevel::Warn;
    } else if (v == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

std::string json_escape(const std::string& in)
{
    std::string out;
    out.reserve(in.size() + 2);
    for (char c : in) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

LogEntry& LogEntry::field(const std::string& key, const std::string& value)
{
    fields_.push_back(Field{key, value, true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, const char* value)
{
    fields_.push_back(Field{key, value ? value : "", true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, uint64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << value;
    fields_.push_back(Field{key, oss.str(), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, bool value)
{
    fields_.push_back(Field{key, value ? "true" : "false", false});
    return *this;
}

std::string LogEntry::format_text() const
{
    std::string out = timestamp_utc();
    out += " ";
    out += log_level_name(level_);
    out += " ";
    out += message_;
    for (const auto& f : fields_) {
        out += " " + f.key + "=";
        if (f.quoted && f.value.find_first_of(" \t\"") != std::string::npos) {
            out += "\"" + json_escape(f.value) + "\"";
        } else {
            out += f.value;
        }
    }
    return out;
}

std::string LogEntry::format_json() const
{
    std::string out = "{\"ts\":\"" + timestamp_utc() + "\",\"level\":\"" + log_level_name(level_) +
                      "\",\"message\":\"" + json_escape(message_) + "\"";
    for (const auto& f : fields_) {
        out += ",\"" + json_escape(f.key) + "\":";
        if (f.quoted) {
            out += "\"" + json_escape(f.value) + "\"";
        } else {
            out += f.value;
        }
    }
    out += "}";
    return out;
}

void Logger::log(const LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (entry.level() < level_ || out_ == nullptr) {
        return;
    }
    *out_ << (json_ ? entry.format_json() : entry.format_text()) << '\n';
    out_->flush();
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

void Logger::set_json_format(bool json)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = json;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void Logger::configure_from_env()
{
    const char* level_env = std::getenv("VIGIL_LOG_LEVEL");
    if (level_env && *level_env) {
        LogLevel parsed = LogLevel::Info;
        if (parse_log_level(level_env, parsed)) {
            set_level(parsed);
        } else {
            log(SLOG_WARN("Invalid env value; using default").field("key", "VIGIL_LOG_LEVEL").field("value", level_env));
        }
    }
    const char* json_env = std::getenv("VIGIL_LOG_JSON");
    if (json_env && *json_env) {
        bool json = false;
        if (parse_bool(json_env, json)) {
            set_json_format(json);
        } else {
            log(SLOG_WARN("Invalid env value; using default").field("key", "VIGIL_LOG_JSON").field("value", json_env));
        }
    }
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

} // namespace vigil
