// cppcheck-suppress-file missingIncludeSystem
/*
 * vigil - Policy command implementations
 */

#include "commands_policy.hpp"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <utility>

#include "logging.hpp"
#include "matcher.hpp"
#include "operators.hpp"
#include "policy.hpp"
#include "process_identity.hpp"
#include "selectors.hpp"
#include "sensor.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

struct CompiledAttachment {
    std::string name;
    std::vector<ArgumentSpec> args;
    CompiledSelectors compiled;
};

// Parses and compiles every attachment of the policy at `path`.
Result<std::vector<CompiledAttachment>> compile_policy(const std::string& path, const SensorConfig& cfg)
{
    PolicyIssues issues;
    auto policy = parse_policy_file(path, issues);
    report_policy_issues(issues);
    if (!policy) {
        return policy.error();
    }

    ProcfsIdentity identity;
    auto ctx = identity_context(identity);
    if (!ctx) {
        return ctx.error();
    }

    std::vector<CompiledAttachment> out;
    auto add = [&](const std::string& name, const std::vector<ArgumentSpec>& args,
                   const std::vector<SelectorSpec>& selectors) -> Result<void> {
        auto compiled = compile_selectors(selectors, args, *ctx, cfg.compiler);
        if (!compiled) {
            return compiled.error().with_context(name);
        }
        out.push_back(CompiledAttachment{name, args, std::move(*compiled)});
        return {};
    };

    for (const auto& kp : policy->kprobes) {
        TRY(parse_kprobe_options(kp.options));
        TRY(add(kprobe_attachment_name(kp.call), kp.args, kp.selectors));
    }
    for (const auto& tp : policy->tracepoints) {
        TRY(add(tracepoint_attachment_name(tp.subsystem, tp.event), tp.args, tp.selectors));
    }
    return out;
}

void hex_dump(std::ostream& out, const std::vector<uint8_t>& bytes)
{
    for (size_t off = 0; off < bytes.size(); off += 16) {
        const size_t n = std::min<size_t>(16, bytes.size() - off);
        out << "  " << std::hex << std::setw(4) << std::setfill('0') << off << std::dec << std::setfill(' ') << "  "
            << hex_encode(bytes.data() + off, n) << "\n";
    }
}

const char* key_kind_name(TableKeyKind kind)
{
    return kind == TableKeyKind::String ? "string" : "integer";
}

} // namespace

int cmd_policy_lint(const std::string& path, const SensorConfig& cfg)
{
    const std::string trace_id = make_span_id("trace-policy-lint");
    ScopedSpan span("cli.policy_lint", trace_id);

    auto compiled = compile_policy(path, cfg);
    if (!compiled) {
        logger().log(SLOG_ERROR("Policy lint failed").field("path", path).field("error", compiled.error().to_string()));
        span.fail(compiled.error().to_string());
        return 1;
    }
    logger().log(
        SLOG_INFO("Policy OK").field("path", path).field("attachments", static_cast<uint64_t>(compiled->size())));
    return 0;
}

int cmd_policy_compile(const std::string& path, const SensorConfig& cfg, std::ostream& out)
{
    const std::string trace_id = make_span_id("trace-policy-compile");
    ScopedSpan span("cli.policy_compile", trace_id);

    auto compiled = compile_policy(path, cfg);
    if (!compiled) {
        logger().log(SLOG_ERROR("Policy compile failed")
                         .field("path", path)
                         .field("error", compiled.error().to_string()));
        span.fail(compiled.error().to_string());
        return 1;
    }

    for (const auto& att : *compiled) {
        out << att.name << ": blob " << att.compiled.blob.size() << " bytes, " << att.compiled.tables.size()
            << " tables\n";
        hex_dump(out, att.compiled.blob.bytes);
        for (const auto& table : att.compiled.tables) {
            out << "  table " << std::hex << std::setw(16) << std::setfill('0') << table.id << std::dec
                << std::setfill(' ') << " " << key_kind_name(table.kind) << " keys=" << table.keys.size() << "\n";
        }
    }
    return 0;
}

int cmd_policy_match(const std::string& path, const std::string& attachment, uint32_t pid,
                     const std::vector<std::string>& args, const SensorConfig& cfg, std::ostream& out)
{
    const std::string trace_id = make_span_id("trace-policy-match");
    ScopedSpan span("cli.policy_match", trace_id);
    auto fail = [&](const std::string& message) -> int {
        logger().log(SLOG_ERROR("Policy match failed").field("error", message));
        span.fail(message);
        return 1;
    };

    auto compiled = compile_policy(path, cfg);
    if (!compiled) {
        return fail(compiled.error().to_string());
    }

    const CompiledAttachment* target = nullptr;
    for (const auto& att : *compiled) {
        if (att.name == attachment) {
            target = &att;
        }
    }
    if (!target) {
        return fail("unknown attachment '" + attachment + "'");
    }

    ProcfsIdentity identity;
    TraceEvent event;
    event.pid = pid;
    event.tid = pid;
    auto ns_pid = identity.namespace_pid(pid);
    event.ns_pid = ns_pid ? *ns_pid : pid;

    for (const auto& arg : args) {
        std::string key;
        std::string value;
        uint64_t index = 0;
        if (!parse_key_value(arg, key, value) || !parse_uint64(key, index)) {
            return fail("argument must be <index>=<value>: '" + arg + "'");
        }
        std::optional<ArgType> type;
        for (const auto& spec : target->args) {
            if (spec.index == index) {
                type = spec.type;
            }
        }
        if (!type) {
            return fail("argument " + key + " is not declared");
        }
        if (is_string_type(*type)) {
            event.args[static_cast<uint32_t>(index)] = EventArg::of_string(value);
            continue;
        }
        int64_t v = 0;
        uint64_t u = 0;
        if (parse_uint64(value, u)) {
            event.args[static_cast<uint32_t>(index)] = EventArg::of_uint(u);
        } else if (parse_int64(value, v)) {
            event.args[static_cast<uint32_t>(index)] = EventArg::of_int(v);
        } else {
            return fail("invalid integer for argument " + key + ": '" + value + "'");
        }
    }

    SelectorMatcher matcher(&identity);
    StaticTableView tables(target->compiled.tables);
    const MatchResult result = matcher.match(target->compiled.blob, tables, event);
    if (result.malformed) {
        return fail("compiled blob is malformed");
    }
    if (result.accepted) {
        out << "accepted";
        if (result.selector >= 0) {
            out << " by selector " << result.selector;
        }
        out << "\n";
    } else {
        out << "rejected\n";
    }
    return 0;
}

} // namespace vigil
