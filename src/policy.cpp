// cppcheck-suppress-file missingIncludeSystem
#include "policy.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <set>
#include <unordered_set>

#include "logging.hpp"
#include "operators.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

enum class Probe : uint8_t {
    None,
    Kprobe,
    Tracepoint,
};

std::string at_line(size_t line_no)
{
    return "line " + std::to_string(line_no) + ": ";
}

// "<idx>:<type>"
Result<ArgumentSpec> parse_arg_decl(const std::string& value)
{
    const size_t colon = value.find(':');
    if (colon == std::string::npos) {
        return Error(ErrorCode::InvalidArgument, "arg must be <index>:<type>", value);
    }
    uint64_t index = 0;
    if (!parse_uint64(trim(value.substr(0, colon)), index) || index > std::numeric_limits<uint32_t>::max()) {
        return Error(ErrorCode::InvalidArgument, "invalid argument index", value);
    }
    auto type = parse_arg_type(trim(value.substr(colon + 1)));
    if (!type) {
        return type.error();
    }
    ArgumentSpec spec;
    spec.index = static_cast<uint32_t>(index);
    spec.type = *type;
    return spec;
}

bool add_arg_decl(std::vector<ArgumentSpec>& args, const ArgumentSpec& spec)
{
    for (const auto& existing : args) {
        if (existing.index == spec.index) {
            return false;
        }
    }
    args.push_back(spec);
    return true;
}

} // namespace

void report_policy_issues(const PolicyIssues& issues)
{
    for (const auto& err : issues.errors) {
        logger().log(SLOG_ERROR("Policy error").field("detail", err));
    }
    for (const auto& warn : issues.warnings) {
        logger().log(SLOG_WARN("Policy warning").field("detail", warn));
    }
}

Result<PidSelector> parse_match_pids(const std::string& value)
{
    const auto tokens = split_whitespace(value);
    if (tokens.empty()) {
        return Error(ErrorCode::InvalidArgument, "match_pids needs an operator");
    }
    auto op = parse_pid_operator(tokens[0]);
    if (!op) {
        return op.error();
    }

    PidSelector sel;
    sel.op = *op;
    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        if (tok == "follow_forks") {
            sel.follow_forks = true;
        } else if (tok == "namespace") {
            sel.is_namespace_pid = true;
        } else if (tok == "self") {
            sel.include_self = true;
        } else {
            for (const auto& part : split(tok, ',')) {
                const std::string pid_text = trim(part);
                if (pid_text.empty()) {
                    continue;
                }
                uint64_t pid = 0;
                if (!parse_uint64(pid_text, pid) || pid > std::numeric_limits<uint32_t>::max()) {
                    return Error(ErrorCode::InvalidArgument, "invalid pid", pid_text);
                }
                sel.values.push_back(static_cast<uint32_t>(pid));
            }
        }
    }
    if (sel.values.empty() && !sel.include_self) {
        return Error(ErrorCode::InvalidArgument, "match_pids lists no pids");
    }
    return sel;
}

Result<ArgSelector> parse_match_args(const std::string& value)
{
    const std::string text = trim(value);
    const size_t first = text.find_first_of(" \t");
    if (first == std::string::npos) {
        return Error(ErrorCode::InvalidArgument, "match_args must be <index> <operator> <values>", text);
    }
    const size_t op_start = text.find_first_not_of(" \t", first);
    const size_t op_end = op_start == std::string::npos ? std::string::npos : text.find_first_of(" \t", op_start);
    if (op_end == std::string::npos) {
        return Error(ErrorCode::InvalidArgument, "match_args must be <index> <operator> <values>", text);
    }

    uint64_t index = 0;
    if (!parse_uint64(text.substr(0, first), index) || index > std::numeric_limits<uint32_t>::max()) {
        return Error(ErrorCode::InvalidArgument, "invalid argument index", text.substr(0, first));
    }
    auto op = parse_arg_operator(text.substr(op_start, op_end - op_start));
    if (!op) {
        return op.error();
    }

    ArgSelector sel;
    sel.index = static_cast<uint32_t>(index);
    sel.op = *op;
    for (const auto& part : split(trim(text.substr(op_end)), ',')) {
        const std::string literal = trim(part);
        if (!literal.empty()) {
            sel.values.push_back(literal);
        }
    }
    if (sel.values.empty()) {
        return Error(ErrorCode::InvalidArgument, "match_args lists no values", text);
    }
    return sel;
}

Result<TracingPolicy> parse_policy_file(const std::string& path, PolicyIssues& issues)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        issues.errors.push_back("Failed to open '" + path + "': " + std::strerror(errno));
        return Error(ErrorCode::PolicyParseFailed, "Failed to open policy file", path);
    }
    return parse_policy_stream(in, issues);
}

Result<TracingPolicy> parse_policy_stream(std::istream& in, PolicyIssues& issues)
{
    TracingPolicy policy{};
    std::string section;
    Probe probe = Probe::None;
    SelectorSpec* selector = nullptr;
    bool skipping = false;
    std::set<std::string> probe_names;
    std::string line;
    size_t line_no = 0;

    static const std::unordered_set<std::string> valid_sections = {"kprobe", "tracepoint", "selector"};

    auto current_args = [&]() -> std::vector<ArgumentSpec>& {
        return probe == Probe::Kprobe ? policy.kprobes.back().args : policy.tracepoints.back().args;
    };

    while (std::getline(in, line)) {
        ++line_no;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            selector = nullptr;
            skipping = false;
            if (valid_sections.find(section) == valid_sections.end()) {
                issues.errors.push_back(at_line(line_no) + "unknown section '" + section + "'");
                section.clear();
                probe = Probe::None;
                skipping = true;
                continue;
            }
            if (section == "kprobe") {
                policy.kprobes.emplace_back();
                probe = Probe::Kprobe;
            } else if (section == "tracepoint") {
                policy.tracepoints.emplace_back();
                probe = Probe::Tracepoint;
            } else if (probe == Probe::None) {
                issues.errors.push_back(at_line(line_no) + "[selector] must follow [kprobe] or [tracepoint]");
                section.clear();
                skipping = true;
            } else {
                auto& selectors =
                    probe == Probe::Kprobe ? policy.kprobes.back().selectors : policy.tracepoints.back().selectors;
                selectors.emplace_back();
                selector = &selectors.back();
            }
            continue;
        }

        std::string key;
        std::string value;
        if (!parse_key_value(trimmed, key, value)) {
            issues.errors.push_back(at_line(line_no) + "expected key=value");
            continue;
        }

        if (section.empty()) {
            if (skipping) {
                continue;
            }
            if (key == "version") {
                uint64_t version = 0;
                if (!parse_uint64(value, version) || version == 0 ||
                    version > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                    issues.errors.push_back(at_line(line_no) + "invalid version");
                    continue;
                }
                policy.version = static_cast<int>(version);
            } else if (key == "name") {
                policy.name = value;
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown header key '" + key + "'");
            }
            continue;
        }

        if (key == "arg" && section != "selector") {
            auto spec = parse_arg_decl(value);
            if (!spec) {
                issues.errors.push_back(at_line(line_no) + spec.error().message() + " '" + value + "'");
                continue;
            }
            if (!add_arg_decl(current_args(), *spec)) {
                issues.errors.push_back(at_line(line_no) + "duplicate argument index " + std::to_string(spec->index));
            }
            continue;
        }

        if (section == "kprobe") {
            KprobeSpec& kp = policy.kprobes.back();
            if (key == "call") {
                kp.call = value;
            } else if (key == "syscall" || key == "return") {
                bool flag = false;
                if (!parse_bool(value, flag)) {
                    issues.errors.push_back(at_line(line_no) + "invalid boolean for '" + key + "'");
                    continue;
                }
                (key == "syscall" ? kp.syscall : kp.return_probe) = flag;
            } else if (key == "return_arg") {
                auto type = parse_arg_type(value);
                if (!type) {
                    issues.errors.push_back(at_line(line_no) + "unknown return_arg type '" + value + "'");
                    continue;
                }
                kp.return_arg = *type;
            } else if (key == "option") {
                OptionSpec opt;
                if (!parse_key_value(value, opt.name, opt.value)) {
                    issues.errors.push_back(at_line(line_no) + "option must be <name>=<value>");
                    continue;
                }
                kp.options.push_back(opt);
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown kprobe key '" + key + "'");
            }
            continue;
        }

        if (section == "tracepoint") {
            TracepointSpec& tp = policy.tracepoints.back();
            if (key == "subsystem") {
                tp.subsystem = value;
            } else if (key == "event") {
                tp.event = value;
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown tracepoint key '" + key + "'");
            }
            continue;
        }

        if (section == "selector") {
            if (key == "match_pids") {
                if (selector->match_pid) {
                    issues.errors.push_back(at_line(line_no) + "selector already has match_pids");
                    continue;
                }
                auto pids = parse_match_pids(value);
                if (!pids) {
                    issues.errors.push_back(at_line(line_no) + pids.error().message() + " '" + value + "'");
                    continue;
                }
                selector->match_pid = *pids;
            } else if (key == "match_args") {
                auto args = parse_match_args(value);
                if (!args) {
                    issues.errors.push_back(at_line(line_no) + args.error().message() + " '" + value + "'");
                    continue;
                }
                selector->match_args.push_back(*args);
            } else {
                issues.errors.push_back(at_line(line_no) + "unknown selector key '" + key + "'");
            }
            continue;
        }
    }

    if (policy.version == 0) {
        issues.errors.push_back("missing header key: version");
    } else if (policy.version != 1) {
        issues.errors.push_back("unsupported policy version: " + std::to_string(policy.version));
    }
    if (policy.name.empty()) {
        issues.warnings.push_back("missing header key: name");
    }
    if (policy.kprobes.empty() && policy.tracepoints.empty()) {
        issues.warnings.push_back("policy attaches nothing");
    }

    for (size_t i = 0; i < policy.kprobes.size(); ++i) {
        const KprobeSpec& kp = policy.kprobes[i];
        if (kp.call.empty()) {
            issues.errors.push_back("kprobe[" + std::to_string(i) + "]: missing call");
        } else if (!probe_names.insert("kprobe:" + kp.call).second) {
            issues.errors.push_back("kprobe[" + std::to_string(i) + "]: duplicate call '" + kp.call + "'");
        }
        if (kp.return_arg && !kp.return_probe) {
            issues.warnings.push_back("kprobe[" + std::to_string(i) + "]: return_arg without return=true");
        }
    }
    for (size_t i = 0; i < policy.tracepoints.size(); ++i) {
        const TracepointSpec& tp = policy.tracepoints[i];
        if (tp.subsystem.empty() || tp.event.empty()) {
            issues.errors.push_back("tracepoint[" + std::to_string(i) + "]: missing subsystem or event");
        } else if (!probe_names.insert("tracepoint:" + tp.subsystem + "/" + tp.event).second) {
            issues.errors.push_back("tracepoint[" + std::to_string(i) + "]: duplicate " + tp.subsystem + "/" +
                                    tp.event);
        }
    }

    if (!issues.errors.empty()) {
        return Error(ErrorCode::PolicyParseFailed, "Policy parsing failed with errors");
    }
    return policy;
}

} // namespace vigil
