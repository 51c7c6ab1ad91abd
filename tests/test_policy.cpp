// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "policy.hpp"

namespace vigil {
namespace {

Result<TracingPolicy> parse_text(const std::string& text, PolicyIssues& issues)
{
    std::istringstream in(text);
    return parse_policy_stream(in, issues);
}

bool has_issue(const std::vector<std::string>& list, const std::string& needle)
{
    for (const auto& entry : list) {
        if (entry.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

TEST(PolicyParseTest, FullKprobeAndTracepoint)
{
    PolicyIssues issues;
    auto policy = parse_text(R"(# whence filter
version=1
name=lseek-and-open

[kprobe]
call=__x64_sys_lseek
syscall=true
arg=0:int
arg=2:int
option=disable-kprobe-multi=1

[selector]
match_pids=NotIn follow_forks 1,2
match_args=0 Equal -1
match_args=2 Equal 4444, 4445

[selector]
match_args=2 Range 0:2

[tracepoint]
subsystem=syscalls
event=sys_enter_openat
arg=1:path

[selector]
match_pids=In namespace self
match_args=1 Prefix /etc/,/usr/
)",
                             issues);
    ASSERT_TRUE(policy) << (issues.has_errors() ? issues.errors[0] : "");
    EXPECT_FALSE(issues.has_warnings());

    EXPECT_EQ(policy->version, 1);
    EXPECT_EQ(policy->name, "lseek-and-open");
    ASSERT_EQ(policy->kprobes.size(), 1u);
    ASSERT_EQ(policy->tracepoints.size(), 1u);

    const KprobeSpec& kp = policy->kprobes[0];
    EXPECT_EQ(kp.call, "__x64_sys_lseek");
    EXPECT_TRUE(kp.syscall);
    EXPECT_FALSE(kp.return_probe);
    ASSERT_EQ(kp.args.size(), 2u);
    EXPECT_EQ(kp.args[1].index, 2u);
    EXPECT_EQ(kp.args[1].type, ArgType::Int);
    ASSERT_EQ(kp.options.size(), 1u);
    EXPECT_EQ(kp.options[0].name, "disable-kprobe-multi");
    EXPECT_EQ(kp.options[0].value, "1");

    ASSERT_EQ(kp.selectors.size(), 2u);
    const SelectorSpec& first = kp.selectors[0];
    ASSERT_TRUE(first.match_pid);
    EXPECT_EQ(first.match_pid->op, PidOperator::NotIn);
    EXPECT_TRUE(first.match_pid->follow_forks);
    EXPECT_FALSE(first.match_pid->is_namespace_pid);
    EXPECT_EQ(first.match_pid->values, (std::vector<uint32_t>{1, 2}));
    ASSERT_EQ(first.match_args.size(), 2u);
    EXPECT_EQ(first.match_args[1].values, (std::vector<std::string>{"4444", "4445"}));
    EXPECT_EQ(kp.selectors[1].match_args[0].op, ArgOperator::Range);

    const TracepointSpec& tp = policy->tracepoints[0];
    EXPECT_EQ(tp.subsystem, "syscalls");
    EXPECT_EQ(tp.event, "sys_enter_openat");
    ASSERT_EQ(tp.selectors.size(), 1u);
    ASSERT_TRUE(tp.selectors[0].match_pid);
    EXPECT_TRUE(tp.selectors[0].match_pid->is_namespace_pid);
    EXPECT_TRUE(tp.selectors[0].match_pid->include_self);
    EXPECT_TRUE(tp.selectors[0].match_pid->values.empty());
    EXPECT_EQ(tp.selectors[0].match_args[0].values, (std::vector<std::string>{"/etc/", "/usr/"}));
}

TEST(PolicyParseTest, ReturnProbe)
{
    PolicyIssues issues;
    auto policy = parse_text("version=1\nname=ret\n[kprobe]\ncall=do_sys_open\nreturn=yes\nreturn_arg=int\n", issues);
    ASSERT_TRUE(policy);
    EXPECT_TRUE(policy->kprobes[0].return_probe);
    ASSERT_TRUE(policy->kprobes[0].return_arg);
    EXPECT_EQ(*policy->kprobes[0].return_arg, ArgType::Int);
}

TEST(PolicyParseTest, HeaderProblems)
{
    PolicyIssues missing;
    EXPECT_FALSE(parse_text("name=x\n[kprobe]\ncall=f\n", missing));
    EXPECT_TRUE(has_issue(missing.errors, "missing header key: version"));

    PolicyIssues future;
    EXPECT_FALSE(parse_text("version=2\nname=x\n[kprobe]\ncall=f\n", future));
    EXPECT_TRUE(has_issue(future.errors, "unsupported policy version: 2"));

    PolicyIssues bogus;
    EXPECT_FALSE(parse_text("version=one\n", bogus));
    EXPECT_TRUE(has_issue(bogus.errors, "line 1: invalid version"));

    PolicyIssues unknown;
    EXPECT_FALSE(parse_text("version=1\ncolour=blue\n", unknown));
    EXPECT_TRUE(has_issue(unknown.errors, "line 2: unknown header key 'colour'"));
}

TEST(PolicyParseTest, WarningsDoNotFail)
{
    PolicyIssues issues;
    auto policy = parse_text("version=1\n[kprobe]\ncall=f\nreturn_arg=int\n", issues);
    ASSERT_TRUE(policy);
    EXPECT_FALSE(issues.has_errors());
    EXPECT_TRUE(has_issue(issues.warnings, "missing header key: name"));
    EXPECT_TRUE(has_issue(issues.warnings, "return_arg without return=true"));

    PolicyIssues empty;
    ASSERT_TRUE(parse_text("version=1\nname=idle\n", empty));
    EXPECT_TRUE(has_issue(empty.warnings, "policy attaches nothing"));
}

TEST(PolicyParseTest, SectionProblems)
{
    PolicyIssues orphan;
    EXPECT_FALSE(parse_text("version=1\n[selector]\nmatch_args=0 Equal 1\n", orphan));
    EXPECT_TRUE(has_issue(orphan.errors, "line 2: [selector] must follow [kprobe] or [tracepoint]"));

    PolicyIssues unknown;
    EXPECT_FALSE(parse_text("version=1\n[uprobe]\npath=/bin/true\n", unknown));
    EXPECT_TRUE(has_issue(unknown.errors, "line 2: unknown section 'uprobe'"));
    EXPECT_EQ(unknown.errors.size(), 1u);

    PolicyIssues no_call;
    EXPECT_FALSE(parse_text("version=1\n[kprobe]\nsyscall=true\n", no_call));
    EXPECT_TRUE(has_issue(no_call.errors, "kprobe[0]: missing call"));

    PolicyIssues duplicate;
    EXPECT_FALSE(parse_text("version=1\n[kprobe]\ncall=f\n[kprobe]\ncall=f\n", duplicate));
    EXPECT_TRUE(has_issue(duplicate.errors, "kprobe[1]: duplicate call 'f'"));

    PolicyIssues no_event;
    EXPECT_FALSE(parse_text("version=1\n[tracepoint]\nsubsystem=sched\n", no_event));
    EXPECT_TRUE(has_issue(no_event.errors, "tracepoint[0]: missing subsystem or event"));
}

TEST(PolicyParseTest, ArgumentDeclarationProblems)
{
    PolicyIssues issues;
    EXPECT_FALSE(parse_text("version=1\n[kprobe]\ncall=f\narg=0:int\narg=0:string\narg=1:sock\narg=2\n", issues));
    EXPECT_TRUE(has_issue(issues.errors, "line 5: duplicate argument index 0"));
    EXPECT_TRUE(has_issue(issues.errors, "line 6: Unknown argument type"));
    EXPECT_TRUE(has_issue(issues.errors, "line 7: arg must be <index>:<type>"));
}

TEST(PolicyParseTest, SelectorLineProblems)
{
    PolicyIssues issues;
    EXPECT_FALSE(parse_text("version=1\n[kprobe]\ncall=f\narg=0:int\n[selector]\n"
                            "match_pids=In 1\nmatch_pids=In 2\nmatch_args=0 Like 1\nmatch_pid=In 3\n",
                            issues));
    EXPECT_TRUE(has_issue(issues.errors, "line 7: selector already has match_pids"));
    EXPECT_TRUE(has_issue(issues.errors, "line 8: Unknown argument operator"));
    EXPECT_TRUE(has_issue(issues.errors, "line 9: unknown selector key 'match_pid'"));
}

TEST(PolicyParseTest, MissingFileIsReported)
{
    PolicyIssues issues;
    auto policy = parse_policy_file("/nonexistent/vigil/policy.conf", issues);
    ASSERT_FALSE(policy);
    EXPECT_EQ(policy.error().code(), ErrorCode::PolicyParseFailed);
    EXPECT_TRUE(has_issue(issues.errors, "Failed to open '/nonexistent/vigil/policy.conf'"));
}

TEST(MatchPidsTest, ParsesFlagsAndValues)
{
    auto sel = parse_match_pids("In follow_forks namespace 10, 20 30");
    ASSERT_TRUE(sel);
    EXPECT_EQ(sel->op, PidOperator::In);
    EXPECT_TRUE(sel->follow_forks);
    EXPECT_TRUE(sel->is_namespace_pid);
    EXPECT_FALSE(sel->include_self);
    EXPECT_EQ(sel->values, (std::vector<uint32_t>{10, 20, 30}));
}

TEST(MatchPidsTest, Rejections)
{
    auto no_op = parse_match_pids("");
    ASSERT_FALSE(no_op);
    EXPECT_EQ(no_op.error().code(), ErrorCode::InvalidArgument);

    auto bad_op = parse_match_pids("Within 1");
    ASSERT_FALSE(bad_op);
    EXPECT_EQ(bad_op.error().code(), ErrorCode::UnknownOperator);

    EXPECT_FALSE(parse_match_pids("In"));
    EXPECT_FALSE(parse_match_pids("In -1"));
    EXPECT_FALSE(parse_match_pids("In 4294967296"));
    EXPECT_TRUE(parse_match_pids("NotIn self"));
}

TEST(MatchArgsTest, ParsesIndexOperatorAndValues)
{
    auto sel = parse_match_args("3 NotEqual a, b ,c");
    ASSERT_TRUE(sel);
    EXPECT_EQ(sel->index, 3u);
    EXPECT_EQ(sel->op, ArgOperator::NotEqual);
    EXPECT_EQ(sel->values, (std::vector<std::string>{"a", "b", "c"}));

    auto mask = parse_match_args("1 Mask 0x80000");
    ASSERT_TRUE(mask);
    EXPECT_EQ(mask->values, (std::vector<std::string>{"0x80000"}));
}

TEST(MatchArgsTest, Rejections)
{
    EXPECT_FALSE(parse_match_args("0"));
    EXPECT_FALSE(parse_match_args("0 Equal"));
    EXPECT_FALSE(parse_match_args("x Equal 1"));
    EXPECT_FALSE(parse_match_args("0 Equal ,"));

    auto unknown = parse_match_args("0 Contains 1");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code(), ErrorCode::UnknownOperator);
}

} // namespace
} // namespace vigil
