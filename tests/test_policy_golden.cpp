// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "match_value.hpp"
#include "policy.hpp"
#include "selectors.hpp"

namespace vigil {
namespace {

std::string resolve_fixture(const std::string& name)
{
    // Try relative to build directory
    std::string path = "../tests/fixtures/golden/" + name;
    if (std::filesystem::exists(path)) {
        return path;
    }
    // Try from source root
    path = (std::filesystem::current_path().parent_path() / "tests/fixtures/golden" / name).string();
    if (std::filesystem::exists(path)) {
        return path;
    }
    return "../tests/fixtures/golden/" + name;
}

struct GoldenTestCase {
    std::string fixture_name;
    size_t expected_kprobes;
    size_t expected_tracepoints;
    size_t expected_selectors;
    size_t expected_warnings;
    size_t expected_tables;
    size_t expected_blob_bytes; // summed over all attachments
};

class PolicyGoldenTest : public ::testing::TestWithParam<GoldenTestCase> {};

TEST_P(PolicyGoldenTest, ParsesAndCompilesToExpectedLayout)
{
    const auto& tc = GetParam();
    std::string path = resolve_fixture(tc.fixture_name);
    ASSERT_TRUE(std::filesystem::exists(path)) << "Golden fixture not found: " << path;

    PolicyIssues issues;
    auto result = parse_policy_file(path, issues);
    ASSERT_TRUE(result) << "Parse failed: " << (issues.has_errors() ? issues.errors[0] : "unknown");
    EXPECT_FALSE(issues.has_errors());
    EXPECT_EQ(issues.warnings.size(), tc.expected_warnings);

    const TracingPolicy& policy = *result;
    EXPECT_EQ(policy.version, 1);
    EXPECT_EQ(policy.kprobes.size(), tc.expected_kprobes);
    EXPECT_EQ(policy.tracepoints.size(), tc.expected_tracepoints);

    const IdentityContext identity{4242, 17};
    size_t selectors = 0;
    size_t tables = 0;
    size_t blob_bytes = 0;
    auto compile = [&](const std::vector<SelectorSpec>& sels, const std::vector<ArgumentSpec>& args) {
        auto compiled = compile_selectors(sels, args, identity, CompilerConfig{});
        ASSERT_TRUE(compiled) << compiled.error().to_string();
        EXPECT_EQ(load_u32(compiled->blob.data() + 12), compiled->blob.size());
        selectors += sels.size();
        tables += compiled->tables.size();
        blob_bytes += compiled->blob.size();
    };
    for (const auto& kp : policy.kprobes) {
        compile(kp.selectors, kp.args);
    }
    for (const auto& tp : policy.tracepoints) {
        compile(tp.selectors, tp.args);
    }

    EXPECT_EQ(selectors, tc.expected_selectors);
    EXPECT_EQ(tables, tc.expected_tables);
    EXPECT_EQ(blob_bytes, tc.expected_blob_bytes);
}

INSTANTIATE_TEST_SUITE_P(GoldenVectors, PolicyGoldenTest,
                         ::testing::Values(GoldenTestCase{"lseek_whence.conf", 1, 0, 1, 0, 0, 96},
                                           GoldenTestCase{"pid_follow_forks.conf", 1, 0, 1, 0, 0, 60},
                                           GoldenTestCase{"openat_prefix.conf", 0, 1, 1, 0, 0, 324},
                                           GoldenTestCase{"table_promotion.conf", 1, 0, 2, 0, 2, 100},
                                           GoldenTestCase{"multi_probe.conf", 2, 1, 2, 1, 0, 176}),
                         [](const ::testing::TestParamInfo<GoldenTestCase>& info) {
                             // Generate readable test name from fixture name
                             std::string name = info.param.fixture_name;
                             // Remove .conf extension
                             auto pos = name.rfind('.');
                             if (pos != std::string::npos) {
                                 name = name.substr(0, pos);
                             }
                             return name;
                         });

} // namespace
} // namespace vigil
