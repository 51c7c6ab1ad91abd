// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <istream>
#include <string>

#include "result.hpp"
#include "types.hpp"

namespace vigil {

/**
 * Tracing policy files.
 *
 *   version=1
 *   name=<policy name>
 *   [kprobe]      call=, syscall=, return=, return_arg=, arg=<idx>:<type>, option=<name>=<value>
 *   [tracepoint]  subsystem=, event=, arg=<idx>:<type>
 *   [selector]    match_pids=<In|NotIn> [follow_forks] [namespace] [self] [pid,...]
 *                 match_args=<idx> <Operator> <value>[,<value>...]
 *
 * A [selector] belongs to the closest preceding [kprobe] or [tracepoint].
 * Problems are collected in `issues` with line numbers; the result is an error
 * when any of them is an error.
 */
Result<TracingPolicy> parse_policy_file(const std::string& path, PolicyIssues& issues);
Result<TracingPolicy> parse_policy_stream(std::istream& in, PolicyIssues& issues);

// Single selector lines, shared with the CLI.
Result<PidSelector> parse_match_pids(const std::string& value);
Result<ArgSelector> parse_match_args(const std::string& value);

void report_policy_issues(const PolicyIssues& issues);

} // namespace vigil
