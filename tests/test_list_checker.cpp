// ---------------------------------------------------------------------------
// test_list_checker.cpp
//
// ListChecker 단위 테스트.
//
// [테스트 범위]
// - allow 우선 평가: allow 와 block 이 동시에 매칭되면 ALLOW
// - exact: 대소문자 무시 부분 문자열
// - regex: 대소문자 무시 검색, 잘못된 regex 는 never-match (uncompiled 집계)
// - load 실패 → 빈 목록 (fail-open) + 에러 반환
// - apply() 로 원자 교체
// - 배포 config/lists.yaml 로딩
// ---------------------------------------------------------------------------

#include "input/list_checker.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace {

ListEntryRule exact(const std::string& id, const std::string& pattern) {
    return ListEntryRule{.id = id, .pattern = pattern, .kind = ListEntryKind::kExact,
                         .reason = "test"};
}

ListEntryRule regex(const std::string& id, const std::string& pattern) {
    return ListEntryRule{.id = id, .pattern = pattern, .kind = ListEntryKind::kRegex,
                         .reason = "test"};
}

ListRuleSet make_rules() {
    ListRuleSet rules{};
    rules.allow_list = {exact("ALLOW-1", "what is my balance")};
    rules.block_list = {
        exact("BLOCK-1", "jailbreak"),
        regex("BLOCK-2", R"(rm\s+-rf)"),
    };
    return rules;
}

} // namespace

TEST(ListChecker, NoMatch_ReturnsUnmatched) {
    ListChecker checker{make_rules()};
    const auto r = checker.check("show me my recent transactions");

    EXPECT_FALSE(r.matched);
    EXPECT_FALSE(r.decision.has_value());
    EXPECT_TRUE(r.list_id.empty());
}

TEST(ListChecker, ExactMatch_IsCaseInsensitiveSubstring) {
    ListChecker checker{make_rules()};
    const auto r = checker.check("Please enable JailBreak now");

    ASSERT_TRUE(r.matched);
    EXPECT_EQ(r.decision, InspectionDecision::kBlock);
    EXPECT_EQ(r.list_id, "BLOCK-1");
}

TEST(ListChecker, RegexMatch_SearchesWholeInput) {
    ListChecker checker{make_rules()};
    const auto r = checker.check("then run RM   -RF / quietly");

    ASSERT_TRUE(r.matched);
    EXPECT_EQ(r.decision, InspectionDecision::kBlock);
    EXPECT_EQ(r.list_id, "BLOCK-2");
}

// ---------------------------------------------------------------------------
// AllowWinsOverBlock
//   allow 와 block 이 동시에 매칭되면 allow 가 이긴다.
// ---------------------------------------------------------------------------
TEST(ListChecker, AllowWinsOverBlock) {
    ListChecker checker{make_rules()};
    const auto r = checker.check("jailbreak aside, what is my balance?");

    ASSERT_TRUE(r.matched);
    EXPECT_EQ(r.decision, InspectionDecision::kAllow);
    EXPECT_EQ(r.list_id, "ALLOW-1");
}

// 잘못된 regex 는 로드를 막지 않고 절대 매칭되지 않는다
TEST(ListChecker, InvalidRegex_NeverMatches) {
    ListRuleSet rules{};
    rules.block_list = {regex("BAD", "([unclosed"), exact("OK", "blockme")};
    ListChecker checker{rules};

    EXPECT_FALSE(checker.check("([unclosed").matched);
    EXPECT_TRUE(checker.check("please blockme").matched);

    const auto stats = checker.stats();
    EXPECT_EQ(stats.block_entries, 2u);
    EXPECT_EQ(stats.uncompiled_entries, 1u);
}

TEST(ListChecker, LoadFailure_FailsOpenWithEmptyLists) {
    ListChecker checker{make_rules()};
    ASSERT_TRUE(checker.check("jailbreak").matched);

    const auto result = checker.load("/nonexistent/llmgate/lists.yaml");
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(checker.check("jailbreak").matched) << "failed load must clear the lists";
    EXPECT_EQ(checker.stats().block_entries, 0u);
}

TEST(ListChecker, Apply_ReplacesRules) {
    ListChecker checker{make_rules()};
    ListRuleSet next{};
    next.block_list = {exact("BLOCK-NEW", "forbidden")};
    checker.apply(next);

    EXPECT_FALSE(checker.check("jailbreak").matched);
    EXPECT_EQ(checker.check("forbidden words").list_id, "BLOCK-NEW");
}

TEST(ListChecker, LoadsFromYamlFile) {
    const auto path = std::filesystem::temp_directory_path() / "llmgate_test_lists.yaml";
    {
        std::ofstream out(path);
        out << "version: \"t1\"\n"
               "allow_list:\n"
               "  - id: A1\n"
               "    pattern: 'safe phrase'\n"
               "    type: exact\n"
               "block_list:\n"
               "  - id: B1\n"
               "    pattern: '^drop\\s+everything$'\n"
               "    type: regex\n"
               "  - id: B2\n"
               "    type: exact\n";  // pattern 누락 → 건너뜀
    }

    ListChecker checker;
    ASSERT_TRUE(checker.load(path).has_value());
    EXPECT_EQ(checker.stats().allow_entries, 1u);
    EXPECT_EQ(checker.stats().block_entries, 1u);
    EXPECT_EQ(checker.check("DROP   everything").list_id, "B1");

    std::filesystem::remove(path);
}

TEST(ListChecker, ShippedConfig_Loads) {
    ListChecker checker;
    const auto result =
        checker.load(std::filesystem::path(LLMGATE_CONFIG_DIR) / "lists.yaml");
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_GT(checker.stats().allow_entries, 0u);
    EXPECT_GT(checker.stats().block_entries, 0u);
    EXPECT_EQ(checker.stats().uncompiled_entries, 0u);
}
