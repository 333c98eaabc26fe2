// ---------------------------------------------------------------------------
// test_rule_loader.cpp
//
// RuleLoader 단위 테스트.
//
// [테스트 범위]
// - 문서 수준 실패: 없는 파일, YAML 문법 오류, 최상위가 map 이 아님
// - 패턴: severity 미지정 시 카테고리 severity 상속, 알 수 없는 severity → 상속값
// - 이상 점수: 범위 밖 thresholds → 내장 기본값, 길이 구간 역전 → 기본값
// - PII: 알 수 없는 카테고리 건너뜀, 확신도 파싱, 스칼라 exclusion 허용
// - 식별자 시드: id 없는 항목 건너뜀
// - 배포 config/ 디렉터리 전체 로딩
// ---------------------------------------------------------------------------

#include "config/rule_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RuleLoaderTest 픽스처
//   테스트마다 임시 디렉터리에 YAML 문서를 쓴다.
// ---------------------------------------------------------------------------
class RuleLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("llmgate_rule_loader_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        const fs::path p = dir_ / name;
        std::ofstream out(p);
        out << content;
        return p;
    }

    fs::path dir_;
};

TEST_F(RuleLoaderTest, MissingFile_Fails) {
    const auto r = RuleLoader::load_patterns(dir_ / "nope.yaml");
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().find("pattern_rules"), std::string::npos);
}

TEST_F(RuleLoaderTest, SyntaxError_Fails) {
    const auto p = write("bad.yaml", "patterns: [unclosed\n  - id: x\n");
    EXPECT_FALSE(RuleLoader::load_patterns(p).has_value());
}

TEST_F(RuleLoaderTest, TopLevelNotMap_Fails) {
    const auto p = write("seq.yaml", "- a\n- b\n");
    EXPECT_FALSE(RuleLoader::load_lists(p).has_value());
}

TEST_F(RuleLoaderTest, Patterns_SeverityInheritedFromCategory) {
    const auto p = write("patterns.yaml",
        "version: \"2\"\n"
        "categories:\n"
        "  - id: role\n"
        "    severity: HIGH\n"
        "patterns:\n"
        "  - id: R1\n"
        "    category: role\n"
        "    pattern: 'you are now'\n"
        "  - id: R2\n"
        "    category: role\n"
        "    pattern: 'act as'\n"
        "    severity: low\n"
        "  - id: R3\n"
        "    category: role\n"
        "    pattern: 'pretend'\n"
        "    severity: SEVERE\n"
        "  - id: R4\n"
        "    category: role\n");

    const auto r = RuleLoader::load_patterns(p);
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->version, "2");
    ASSERT_EQ(r->patterns.size(), 3u) << "entry without pattern is skipped";
    EXPECT_EQ(r->patterns[0].severity, Severity::kHigh);
    EXPECT_EQ(r->patterns[1].severity, Severity::kLow);
    EXPECT_EQ(r->patterns[2].severity, Severity::kHigh);
}

TEST_F(RuleLoaderTest, Lists_UnknownTypeTreatedAsExact) {
    const auto p = write("lists.yaml",
        "block_list:\n"
        "  - id: B1\n"
        "    pattern: 'x'\n"
        "    type: glob\n");
    const auto r = RuleLoader::load_lists(p);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->block_list.size(), 1u);
    EXPECT_EQ(r->block_list[0].kind, ListEntryKind::kExact);
    EXPECT_TRUE(r->allow_list.empty());
}

TEST_F(RuleLoaderTest, Anomaly_InvalidThresholdsUseDefaults) {
    const auto p = write("anomaly.yaml",
        "thresholds:\n"
        "  block: 0.2\n"
        "  escalate: 0.5\n");
    const auto r = RuleLoader::load_anomaly_rules(p);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->thresholds.block, 0.7);
    EXPECT_DOUBLE_EQ(r->thresholds.escalate, 0.3);
}

TEST_F(RuleLoaderTest, Anomaly_CustomValuesApplied) {
    const auto p = write("anomaly.yaml",
        "thresholds:\n"
        "  block: 0.8\n"
        "  escalate: 0.4\n"
        "factors:\n"
        "  pattern_match:\n"
        "    max_contribution: 0.5\n"
        "    severity_weights:\n"
        "      CRITICAL: 0.45\n"
        "  input_length:\n"
        "    normal_range: {min: 20, max: 10}\n"
        "  encoding_detection:\n"
        "    techniques: [base64]\n"
        "  instruction_language:\n"
        "    conditional_words: [provided]\n");
    const auto r = RuleLoader::load_anomaly_rules(p);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->thresholds.block, 0.8);
    EXPECT_DOUBLE_EQ(r->pattern_match.max_contribution, 0.5);
    EXPECT_DOUBLE_EQ(r->pattern_match.severity_weights.critical, 0.45);
    EXPECT_DOUBLE_EQ(r->pattern_match.severity_weights.high, 0.4);
    // min > max → 길이 구간 기본값
    EXPECT_EQ(r->input_length.normal_min, 10u);
    EXPECT_EQ(r->input_length.normal_max, 2000u);
    ASSERT_EQ(r->encoding.techniques.size(), 1u);
    ASSERT_EQ(r->instruction.conditionals.size(), 1u);
    EXPECT_EQ(r->instruction.conditionals[0], "provided");
    EXPECT_FALSE(r->instruction.imperative_verbs.empty());
}

TEST_F(RuleLoaderTest, Pii_CategoriesAndExclusions) {
    const auto p = write("pii.yaml",
        "settings:\n"
        "  max_matches_per_type: 0\n"
        "categories:\n"
        "  email:\n"
        "    patterns:\n"
        "      - id: E1\n"
        "        pattern: '\\S+@\\S+'\n"
        "        confidence: high\n"
        "    exclusions:\n"
        "      - 'noreply@\\S+'\n"
        "      - pattern: 'support@\\S+'\n"
        "        reason: service\n"
        "  passport:\n"
        "    patterns: []\n"
        "  phone:\n"
        "    enabled: false\n"
        "    patterns:\n"
        "      - id: P1\n"
        "        pattern: '\\d{3}-\\d{4}'\n"
        "        confidence: sure\n");

    const auto r = RuleLoader::load_pii_rules(p);
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->settings.max_matches_per_type, 100u);
    ASSERT_EQ(r->categories.size(), 2u) << "unknown category is skipped";

    const auto& email = r->categories[0];
    EXPECT_EQ(email.type, PiiType::kEmail);
    EXPECT_TRUE(email.enabled);
    ASSERT_EQ(email.patterns.size(), 1u);
    EXPECT_EQ(email.patterns[0].confidence, Confidence::kHigh);
    EXPECT_EQ(email.exclusions.size(), 2u);

    const auto& phone = r->categories[1];
    EXPECT_EQ(phone.type, PiiType::kPhone);
    EXPECT_FALSE(phone.enabled);
    EXPECT_EQ(phone.patterns[0].confidence, Confidence::kMedium);
}

TEST_F(RuleLoaderTest, Identities_SkipEntriesWithoutId) {
    const auto p = write("identities.yaml",
        "users:\n"
        "  - id: u1\n"
        "    email: U1@Example.com\n"
        "    transactions: ['ACCT-A-111']\n"
        "  - email: orphan@example.com\n");
    const auto r = RuleLoader::load_identities(p);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 1u);
    EXPECT_EQ((*r)[0].user_id, "u1");
    EXPECT_EQ((*r)[0].email, "U1@Example.com");
    ASSERT_EQ((*r)[0].transaction_texts.size(), 1u);
}

TEST(RuleLoaderShipped, AllConfigFilesLoad) {
    const fs::path dir(LLMGATE_CONFIG_DIR);

    const auto patterns = RuleLoader::load_patterns(dir / "injection_patterns.yaml");
    ASSERT_TRUE(patterns.has_value()) << patterns.error();
    EXPECT_GE(patterns->patterns.size(), 10u);

    const auto lists = RuleLoader::load_lists(dir / "lists.yaml");
    ASSERT_TRUE(lists.has_value()) << lists.error();

    const auto anomaly = RuleLoader::load_anomaly_rules(dir / "anomaly_rules.yaml");
    ASSERT_TRUE(anomaly.has_value()) << anomaly.error();
    EXPECT_DOUBLE_EQ(anomaly->thresholds.block, 0.7);
    EXPECT_DOUBLE_EQ(anomaly->thresholds.escalate, 0.3);

    const auto pii = RuleLoader::load_pii_rules(dir / "pii_patterns.yaml");
    ASSERT_TRUE(pii.has_value()) << pii.error();
    EXPECT_EQ(pii->categories.size(), 6u);

    const auto ids = RuleLoader::load_identities(dir / "identities.yaml");
    ASSERT_TRUE(ids.has_value()) << ids.error();
    EXPECT_EQ(ids->size(), 3u);
}
