// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <chrono>
#include <string>

namespace vigil {

// Returns "<prefix>-<16 hex chars>".
std::string make_span_id(const std::string& prefix);

// Thread-local ids of the innermost live ScopedSpan; empty outside any span.
const std::string& current_trace_id();
const std::string& current_span_id();

// True when VIGIL_OTEL_SPANS is set to a truthy value.
bool spans_enabled();

/**
 * RAII span. Emits otel_span_start on construction and otel_span_end on
 * destruction (when spans are enabled) and maintains the thread-local
 * trace/span context for nested spans.
 */
class ScopedSpan {
  public:
    ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id = {});
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void fail(const std::string& error);

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& span_id() const { return span_id_; }

  private:
    std::string name_;
    std::string trace_id_;
    std::string span_id_;
    std::string parent_span_id_;
    std::string previous_trace_id_;
    std::string previous_span_id_;
    std::string error_;
    bool failed_ = false;
    bool enabled_ = false;
    std::chrono::steady_clock::time_point start_;
};

} // namespace vigil
