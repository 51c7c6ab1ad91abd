// cppcheck-suppress-file missingIncludeSystem
#include "tracing.hpp"

#include <cstdio>
#include <cstdlib>
#include <random>
#include <utility>

#include "logging.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

thread_local std::string g_current_trace_id;
thread_local std::string g_current_span_id;

uint64_t random_u64()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng();
}

} // namespace

std::string make_span_id(const std::string& prefix)
{
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(random_u64()));
    return prefix + "-" + buf;
}

const std::string& current_trace_id()
{
    return g_current_trace_id;
}

const std::string& current_span_id()
{
    return g_current_span_id;
}

bool spans_enabled()
{
    const char* env = std::getenv("VIGIL_OTEL_SPANS");
    if (!env || !*env) {
        return false;
    }
    bool enabled = false;
    return parse_bool(env, enabled) && enabled;
}

ScopedSpan::ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id)
    : name_(std::move(name)), trace_id_(std::move(trace_id)), span_id_(make_span_id("span")),
      parent_span_id_(std::move(parent_span_id)), previous_trace_id_(g_current_trace_id),
      previous_span_id_(g_current_span_id), enabled_(spans_enabled()), start_(std::chrono::steady_clock::now())
{
    g_current_trace_id = trace_id_;
    g_current_span_id = span_id_;

    if (enabled_) {
        auto entry = SLOG_INFO("otel_span_start");
        entry.field("span_name", name_).field("trace_id", trace_id_).field("span_id", span_id_);
        if (!parent_span_id_.empty()) {
            entry.field("parent_span_id", parent_span_id_);
        }
        logger().log(entry);
    }
}

ScopedSpan::~ScopedSpan()
{
    if (enabled_) {
        auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();
        auto entry = SLOG_INFO("otel_span_end");
        entry.field("span_name", name_)
            .field("trace_id", trace_id_)
            .field("span_id", span_id_)
            .field("duration_us", static_cast<int64_t>(elapsed))
            .field("status", failed_ ? "error" : "ok");
        if (!parent_span_id_.empty()) {
            entry.field("parent_span_id", parent_span_id_);
        }
        if (failed_) {
            entry.field("error", error_);
        }
        logger().log(entry);
    }

    g_current_trace_id = previous_trace_id_;
    g_current_span_id = previous_span_id_;
}

void ScopedSpan::fail(const std::string& error)
{
    failed_ = true;
    error_ = error;
}

} // namespace vigil
