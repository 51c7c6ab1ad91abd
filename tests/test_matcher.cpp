// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "fake_loader.hpp"
#include "matcher.hpp"
#include "selectors.hpp"

namespace vigil {
namespace {

constexpr uint32_t kMyPid = 4242;
constexpr uint32_t kWhenceIdx = 2;

const std::vector<ArgumentSpec> kLseekArgs = {{0, ArgType::Int}, {kWhenceIdx, ArgType::Int}};

ArgSelector make_arg(uint32_t index, ArgOperator op, std::vector<std::string> values)
{
    ArgSelector sel;
    sel.index = index;
    sel.op = op;
    sel.values = std::move(values);
    return sel;
}

PidSelector my_pid_follow_forks()
{
    PidSelector sel;
    sel.op = PidOperator::In;
    sel.follow_forks = true;
    sel.values = {kMyPid};
    return sel;
}

TraceEvent event_from(uint32_t pid, uint32_t tid, std::map<uint32_t, EventArg> args = {})
{
    TraceEvent ev;
    ev.pid = pid;
    ev.tid = tid;
    ev.ns_pid = pid;
    ev.args = std::move(args);
    return ev;
}

TraceEvent lseek_event(int64_t whence)
{
    return event_from(kMyPid, kMyPid, {{0, EventArg::of_int(-1)}, {kWhenceIdx, EventArg::of_int(whence)}});
}

CompiledSelectors compile_or_die(const std::vector<SelectorSpec>& selectors, const std::vector<ArgumentSpec>& args,
                                 CompilerConfig cfg = {})
{
    auto compiled = compile_selectors(selectors, args, IdentityContext{kMyPid, kMyPid}, cfg);
    EXPECT_TRUE(compiled) << (compiled ? "" : compiled.error().to_string());
    return compiled ? *compiled : CompiledSelectors{};
}

MatchResult run(const std::vector<SelectorSpec>& selectors, const std::vector<ArgumentSpec>& args,
                const TraceEvent& event)
{
    const CompiledSelectors compiled = compile_or_die(selectors, args);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher;
    return matcher.match(compiled.blob, tables, event);
}

// One lseek(-1, 0, whence) call per entry of `whences`; counts the accepted
// calls per whence value.
struct LseekCase {
    std::string name;
    ArgOperator op;
    std::vector<std::vector<std::string>> selector_values;
    std::vector<int64_t> whences;
    std::map<int64_t, int> expected;
};

class LseekSelectorTest : public ::testing::TestWithParam<LseekCase> {};

TEST_P(LseekSelectorTest, CountsAcceptedCalls)
{
    const auto& tc = GetParam();
    std::vector<SelectorSpec> selectors;
    for (const auto& values : tc.selector_values) {
        SelectorSpec sel;
        sel.match_pid = my_pid_follow_forks();
        sel.match_args.push_back(make_arg(kWhenceIdx, tc.op, values));
        selectors.push_back(sel);
    }
    const CompiledSelectors compiled = compile_or_die(selectors, kLseekArgs);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher;

    std::map<int64_t, int> seen;
    for (int64_t whence : tc.whences) {
        const MatchResult result = matcher.match(compiled.blob, tables, lseek_event(whence));
        ASSERT_FALSE(result.malformed);
        if (result.accepted) {
            ++seen[whence];
        }
    }
    EXPECT_EQ(seen, tc.expected);
}

INSTANTIATE_TEST_SUITE_P(
    WhenceFilters, LseekSelectorTest,
    ::testing::Values(
        LseekCase{"equal_4443_9999_a", ArgOperator::Equal, {{"4443"}, {"9999"}}, {4444, 4443}, {{4443, 1}}},
        LseekCase{"equal_4443_9999_b", ArgOperator::Equal, {{"4443"}, {"9999"}}, {4443, 4444, 4443}, {{4443, 2}}},
        LseekCase{"equal_4443_9999_c", ArgOperator::Equal, {{"4443"}, {"9999"}}, {9999, 4443}, {{4443, 1}, {9999, 1}}},
        LseekCase{"equal_4443_9999_d", ArgOperator::Equal, {{"4443"}, {"9999"}}, {9999, 4444}, {{9999, 1}}},
        LseekCase{"equal_4444_9999_a", ArgOperator::Equal, {{"4444"}, {"9999"}}, {4444, 4443}, {{4444, 1}}},
        LseekCase{"equal_4444_9999_b", ArgOperator::Equal, {{"4444"}, {"9999"}}, {4443, 4444, 4443}, {{4444, 1}}},
        LseekCase{"equal_4444_9999_c", ArgOperator::Equal, {{"4444"}, {"9999"}}, {9999, 4443}, {{9999, 1}}},
        LseekCase{"equal_4444_9999_d", ArgOperator::Equal, {{"4444"}, {"9999"}}, {9999, 4444}, {{9999, 1}, {4444, 1}}},
        LseekCase{"inmap_4443_9999_a", ArgOperator::InMap, {{"4443"}, {"9999"}}, {4444, 4443}, {{4443, 1}}},
        LseekCase{"inmap_4443_9999_b", ArgOperator::InMap, {{"4443"}, {"9999"}}, {4443, 4444, 4443}, {{4443, 2}}},
        LseekCase{"inmap_4443_9999_c", ArgOperator::InMap, {{"4443"}, {"9999"}}, {9999, 4443}, {{4443, 1}, {9999, 1}}},
        LseekCase{"inmap_4443_9999_d", ArgOperator::InMap, {{"4443"}, {"9999"}}, {9999, 4444}, {{9999, 1}}},
        LseekCase{"inmap_4444_9999_a", ArgOperator::InMap, {{"4444"}, {"9999"}}, {4444, 4443}, {{4444, 1}}},
        LseekCase{"inmap_4444_9999_b", ArgOperator::InMap, {{"4444"}, {"9999"}}, {4443, 4444, 4443}, {{4444, 1}}},
        LseekCase{"inmap_4444_9999_c", ArgOperator::InMap, {{"4444"}, {"9999"}}, {9999, 4443}, {{9999, 1}}},
        LseekCase{"inmap_4444_9999_d", ArgOperator::InMap, {{"4444"}, {"9999"}}, {9999, 4444}, {{9999, 1}, {4444, 1}}},
        LseekCase{"equal_three_selectors", ArgOperator::Equal, {{"8888"}, {"8889"}, {"4443"}}, {4444, 4443},
                  {{4443, 1}}}),
    [](const ::testing::TestParamInfo<LseekCase>& info) { return info.param.name; });

TEST(SelectorMatcherTest, EmptySelectorListAcceptsEverything)
{
    const MatchResult result = run({}, {}, event_from(1, 1));
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.selector, -1);
    EXPECT_FALSE(result.malformed);
}

TEST(SelectorMatcherTest, FirstAcceptingSelectorWins)
{
    SelectorSpec a;
    a.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::Equal, {"7"}));
    SelectorSpec b;
    b.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::GT, {"0"}));

    EXPECT_EQ(run({a, b}, kLseekArgs, lseek_event(7)).selector, 0);
    EXPECT_EQ(run({a, b}, kLseekArgs, lseek_event(8)).selector, 1);
    EXPECT_FALSE(run({a, b}, kLseekArgs, lseek_event(-8)).accepted);
}

TEST(SelectorMatcherTest, FiltersWithinSelectorAreAnded)
{
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(0, ArgOperator::Equal, {"-1"}));
    sel.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::Equal, {"4443"}));

    EXPECT_TRUE(run({sel}, kLseekArgs, lseek_event(4443)).accepted);

    TraceEvent other_fd = lseek_event(4443);
    other_fd.args[0] = EventArg::of_int(3);
    EXPECT_FALSE(run({sel}, kLseekArgs, other_fd).accepted);
}

TEST(SelectorMatcherTest, NegatedOperatorsRequireNoLiteralToMatch)
{
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::NotEqual, {"1", "2"}));
    EXPECT_TRUE(run({sel}, kLseekArgs, lseek_event(3)).accepted);
    EXPECT_FALSE(run({sel}, kLseekArgs, lseek_event(2)).accepted);
}

TEST(SelectorMatcherTest, SignedComparisons)
{
    SelectorSpec gt;
    gt.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::GT, {"-5"}));
    EXPECT_TRUE(run({gt}, kLseekArgs, lseek_event(-1)).accepted);
    EXPECT_FALSE(run({gt}, kLseekArgs, lseek_event(-5)).accepted);

    SelectorSpec lt;
    lt.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::LT, {"0"}));
    EXPECT_TRUE(run({lt}, kLseekArgs, lseek_event(-1)).accepted);
    EXPECT_FALSE(run({lt}, kLseekArgs, lseek_event(0)).accepted);
}

TEST(SelectorMatcherTest, RangeIsInclusive)
{
    const std::vector<ArgumentSpec> args = {{1, ArgType::Uint64}};
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(1, ArgOperator::Range, {"10:20", "100:100"}));
    auto with = [](uint64_t v) { return event_from(1, 1, {{1, EventArg::of_uint(v)}}); };

    EXPECT_TRUE(run({sel}, args, with(10)).accepted);
    EXPECT_TRUE(run({sel}, args, with(20)).accepted);
    EXPECT_TRUE(run({sel}, args, with(100)).accepted);
    EXPECT_FALSE(run({sel}, args, with(21)).accepted);
    EXPECT_FALSE(run({sel}, args, with(9)).accepted);
}

TEST(SelectorMatcherTest, MaskMatchesAnyCommonBit)
{
    const std::vector<ArgumentSpec> args = {{1, ArgType::Uint32}};
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(1, ArgOperator::Mask, {"0x40"}));
    EXPECT_TRUE(run({sel}, args, event_from(1, 1, {{1, EventArg::of_uint(0x41)}})).accepted);
    EXPECT_FALSE(run({sel}, args, event_from(1, 1, {{1, EventArg::of_uint(0x01)}})).accepted);
}

TEST(SelectorMatcherTest, StringOperators)
{
    const std::vector<ArgumentSpec> args = {{0, ArgType::Path}};
    auto path = [](const std::string& p) { return event_from(1, 1, {{0, EventArg::of_string(p)}}); };

    SelectorSpec prefix;
    prefix.match_args.push_back(make_arg(0, ArgOperator::Prefix, {"/etc/", "/root/"}));
    EXPECT_TRUE(run({prefix}, args, path("/etc/passwd")).accepted);
    EXPECT_FALSE(run({prefix}, args, path("/tmp/etc/passwd")).accepted);

    SelectorSpec postfix;
    postfix.match_args.push_back(make_arg(0, ArgOperator::Postfix, {".so"}));
    EXPECT_TRUE(run({postfix}, args, path("/lib/libc.so")).accepted);
    EXPECT_FALSE(run({postfix}, args, path("so")).accepted);

    SelectorSpec not_prefix;
    not_prefix.match_args.push_back(make_arg(0, ArgOperator::NotPrefix, {"/proc"}));
    EXPECT_TRUE(run({not_prefix}, args, path("/home/user")).accepted);
    EXPECT_FALSE(run({not_prefix}, args, path("/proc/self")).accepted);

    SelectorSpec equal;
    equal.match_args.push_back(make_arg(0, ArgOperator::Equal, {"/etc/shadow"}));
    EXPECT_TRUE(run({equal}, args, path("/etc/shadow")).accepted);
    EXPECT_FALSE(run({equal}, args, path("/etc/shadow-")).accepted);
}

TEST(SelectorMatcherTest, StringSetInTable)
{
    const std::vector<ArgumentSpec> args = {{0, ArgType::String}};
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(0, ArgOperator::InMap, {"bash", "sh", "zsh"}));
    EXPECT_TRUE(run({sel}, args, event_from(1, 1, {{0, EventArg::of_string("sh")}})).accepted);
    EXPECT_FALSE(run({sel}, args, event_from(1, 1, {{0, EventArg::of_string("fish")}})).accepted);
}

TEST(SelectorMatcherTest, MissingArgumentDoesNotMatch)
{
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::NotEqual, {"1"}));
    EXPECT_FALSE(run({sel}, kLseekArgs, event_from(kMyPid, kMyPid)).accepted);
}

TEST(SelectorMatcherTest, MissingTableDoesNotMatch)
{
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::NotInMap, {"1"}));
    const CompiledSelectors compiled = compile_or_die({sel}, kLseekArgs);
    ASSERT_EQ(compiled.tables.size(), 1u);

    const std::vector<AuxTableContent> none;
    StaticTableView empty(none);
    SelectorMatcher matcher;
    EXPECT_FALSE(matcher.match(compiled.blob, empty, lseek_event(5)).accepted);
}

TEST(SelectorMatcherTest, CorruptBlobIsMalformed)
{
    SelectorSpec sel;
    sel.match_args.push_back(make_arg(kWhenceIdx, ArgOperator::Equal, {"1"}));
    CompiledSelectors compiled = compile_or_die({sel}, kLseekArgs);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher;

    CompiledSelectorBlob bad_magic = compiled.blob;
    bad_magic.bytes[0] ^= 0xff;
    EXPECT_TRUE(matcher.match(bad_magic, tables, lseek_event(1)).malformed);

    CompiledSelectorBlob truncated = compiled.blob;
    truncated.bytes.resize(truncated.bytes.size() - 8);
    EXPECT_TRUE(matcher.match(truncated, tables, lseek_event(1)).malformed);
}

TEST(SelectorMatcherTest, ThreadsMatchOnThreadGroupId)
{
    PidSelector pids;
    pids.op = PidOperator::In;
    pids.values = {100};
    SelectorSpec sel;
    sel.match_pid = pids;

    EXPECT_TRUE(run({sel}, {}, event_from(100, 100)).accepted);
    EXPECT_TRUE(run({sel}, {}, event_from(100, 101)).accepted);
    EXPECT_FALSE(run({sel}, {}, event_from(101, 101)).accepted);
}

TEST(SelectorMatcherTest, NotInRejectsListedPids)
{
    PidSelector pids;
    pids.op = PidOperator::NotIn;
    pids.values = {1, 2};
    SelectorSpec sel;
    sel.match_pid = pids;

    EXPECT_FALSE(run({sel}, {}, event_from(2, 2)).accepted);
    EXPECT_TRUE(run({sel}, {}, event_from(3, 3)).accepted);
}

TEST(SelectorMatcherTest, NamespacePidUsesNamespaceValue)
{
    PidSelector pids;
    pids.op = PidOperator::In;
    pids.is_namespace_pid = true;
    pids.values = {1};
    SelectorSpec sel;
    sel.match_pid = pids;

    TraceEvent container_init = event_from(5000, 5000);
    container_init.ns_pid = 1;
    EXPECT_TRUE(run({sel}, {}, container_init).accepted);

    TraceEvent host_init = event_from(1, 1);
    host_init.ns_pid = 77;
    EXPECT_FALSE(run({sel}, {}, host_init).accepted);
}

TEST(SelectorMatcherTest, LargePidSetUsesTable)
{
    PidSelector pids;
    pids.op = PidOperator::In;
    pids.values = {10, 20, 30, 40};
    SelectorSpec sel;
    sel.match_pid = pids;

    CompilerConfig cfg;
    cfg.max_inline_values = 2;
    const CompiledSelectors compiled = compile_or_die({sel}, {}, cfg);
    ASSERT_EQ(compiled.tables.size(), 1u);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher;
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(30, 30)).accepted);
    EXPECT_FALSE(matcher.match(compiled.blob, tables, event_from(31, 31)).accepted);
}

// Resets `matcher` on every parent lookup, as a publish landing in the
// middle of a follow-forks walk would.
class ResettingLineage final : public ProcessLineage {
  public:
    explicit ResettingLineage(const ProcessLineage& parents) : parents_(parents) {}

    void bind(SelectorMatcher* matcher) { matcher_ = matcher; }

    std::optional<uint32_t> parent_of(uint32_t pid) const override
    {
        if (matcher_) {
            matcher_->reset_approvals();
        }
        return parents_.parent_of(pid);
    }

    Result<uint32_t> namespace_pid(uint32_t pid) const override { return parents_.namespace_pid(pid); }

  private:
    const ProcessLineage& parents_;
    SelectorMatcher* matcher_ = nullptr;
};

class FollowForksTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        lineage_.add(200, 100);
        lineage_.add(300, 200);
        lineage_.add(999, 1);
    }

    CompiledSelectors compile(PidOperator op, bool follow_forks)
    {
        PidSelector pids;
        pids.op = op;
        pids.follow_forks = follow_forks;
        pids.values = {100};
        SelectorSpec sel;
        sel.match_pid = pids;
        return compile_or_die({sel}, {});
    }

    FakeLineage lineage_;
};

TEST_F(FollowForksTest, DescendantsOfListedPidMatch)
{
    const CompiledSelectors compiled = compile(PidOperator::In, true);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher(&lineage_);

    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(200, 201)).accepted);
    EXPECT_FALSE(matcher.match(compiled.blob, tables, event_from(999, 999)).accepted);
    EXPECT_EQ(matcher.approved_count(), 2u);
}

TEST_F(FollowForksTest, WithoutFollowForksOnlyListedPidMatches)
{
    const CompiledSelectors compiled = compile(PidOperator::In, false);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher(&lineage_);

    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(100, 100)).accepted);
    EXPECT_FALSE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    EXPECT_EQ(matcher.approved_count(), 0u);
}

TEST_F(FollowForksTest, NotInExcludesDescendants)
{
    const CompiledSelectors compiled = compile(PidOperator::NotIn, true);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher(&lineage_);

    EXPECT_FALSE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(999, 999)).accepted);
}

TEST_F(FollowForksTest, ApprovalSurvivesReparentingUntilReset)
{
    const CompiledSelectors compiled = compile(PidOperator::In, true);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher(&lineage_);
    ASSERT_TRUE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);

    // 200 exits and 300 is reparented to init.
    lineage_.add(300, 1);
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);

    matcher.reset_approvals();
    EXPECT_EQ(matcher.approved_count(), 0u);
    EXPECT_FALSE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
}

TEST_F(FollowForksTest, ApprovalFromWalkOverlappingResetIsDropped)
{
    const CompiledSelectors compiled = compile(PidOperator::In, true);
    StaticTableView tables(compiled.tables);
    ResettingLineage lineage(lineage_);
    SelectorMatcher matcher(&lineage);

    lineage.bind(&matcher);
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    EXPECT_EQ(matcher.approved_count(), 0u);

    lineage.bind(nullptr);
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    EXPECT_EQ(matcher.approved_count(), 1u);
}

TEST_F(FollowForksTest, ForgottenProcessLosesApproval)
{
    const CompiledSelectors compiled = compile(PidOperator::In, true);
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher(&lineage_);
    ASSERT_TRUE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    ASSERT_TRUE(matcher.match(compiled.blob, tables, event_from(200, 200)).accepted);
    EXPECT_EQ(matcher.approved_count(), 2u);

    // 300 exits; its PID comes back as a child of init.
    matcher.forget_process(300);
    lineage_.add(300, 1);
    EXPECT_EQ(matcher.approved_count(), 1u);
    EXPECT_FALSE(matcher.match(compiled.blob, tables, event_from(300, 300)).accepted);
    EXPECT_TRUE(matcher.match(compiled.blob, tables, event_from(200, 200)).accepted);
}

TEST_F(FollowForksTest, NamespaceFollowForksChecksAncestorNamespacePid)
{
    FakeLineage ns_lineage;
    ns_lineage.add(7001, 7000, 2);
    ns_lineage.add(7000, 6000, 1);

    PidSelector pids;
    pids.op = PidOperator::In;
    pids.follow_forks = true;
    pids.is_namespace_pid = true;
    pids.values = {1};
    SelectorSpec sel;
    sel.match_pid = pids;
    const CompiledSelectors compiled = compile_or_die({sel}, {});
    StaticTableView tables(compiled.tables);
    SelectorMatcher matcher(&ns_lineage);

    TraceEvent child = event_from(7001, 7001);
    child.ns_pid = 2;
    EXPECT_TRUE(matcher.match(compiled.blob, tables, child).accepted);
}

} // namespace
} // namespace vigil
