// ---------------------------------------------------------------------------
// test_pii_redactor.cpp
//
// PiiRedactor 단위 테스트.
//
// [테스트 범위]
// - 기본 자리표시자 치환, 여러 매치의 오프셋 보존
// - min_confidence 임계값 (LOW 매치는 기본 설정에서 유지)
// - 유형별 자리표시자 덮어쓰기
// - 부분 공개 모드
// - 요약: total / by_type / by_confidence / positions / characters_redacted
// - redact_json: 키와 구조 유지, 문자열 리프만 치환, 파싱 실패 시 평문 처리
// ---------------------------------------------------------------------------

#include "pii/pii_redactor.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

class PiiRedactorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto r =
            detector_.load(std::filesystem::path(LLMGATE_CONFIG_DIR) / "pii_patterns.yaml");
        ASSERT_TRUE(r.has_value()) << r.error();
    }

    PiiDetector detector_;
};

TEST_F(PiiRedactorTest, DefaultPlaceholders) {
    PiiRedactor redactor{detector_};
    const auto r = redactor.redact("Email bob@example.com or call 555-123-4567 now");

    EXPECT_TRUE(r.was_redacted);
    EXPECT_EQ(r.text, "Email [REDACTED-EMAIL] or call [REDACTED-PHONE] now");
    EXPECT_EQ(r.summary.total, 2u);
    EXPECT_EQ(r.summary.by_type.at("email"), 1u);
    EXPECT_EQ(r.summary.by_type.at("phone"), 1u);
    EXPECT_EQ(r.summary.by_confidence.at("HIGH"), 1u);
    EXPECT_EQ(r.summary.by_confidence.at("MEDIUM"), 1u);
    EXPECT_EQ(r.summary.characters_redacted, 15u + 12u);

    ASSERT_EQ(r.summary.positions.size(), 2u);
    EXPECT_EQ(r.summary.positions[0].start, 6u);
    EXPECT_EQ(r.summary.positions[0].original_length, 15u);
    EXPECT_EQ(r.summary.positions[0].replacement_length, 16u);
    EXPECT_LT(r.summary.positions[0].start, r.summary.positions[1].start);
}

TEST_F(PiiRedactorTest, AllTypes) {
    PiiRedactor redactor{detector_};
    const auto r = redactor.redact(
        "ssn 123-45-6789 card 4111111111111111 acct ACCT-A-10234 loan LOAN-A-5521");
    EXPECT_EQ(r.text,
              "ssn [REDACTED-SSN] card [REDACTED-CC] acct [REDACTED-ACCOUNT] loan [REDACTED-LOAN]");
}

TEST_F(PiiRedactorTest, RedactionIsIdempotent) {
    PiiRedactor redactor{detector_};
    const auto once = redactor.redact(
        "Mail bob@example.com, call 555-123-4567, SSN 123-45-6789, acct ACCT-A-10234");
    const auto twice = redactor.redact(once.text);
    EXPECT_EQ(twice.text, once.text);
    EXPECT_FALSE(twice.was_redacted);
}

TEST_F(PiiRedactorTest, CleanText_Unchanged) {
    PiiRedactor redactor{detector_};
    const std::string text = "Your transfer was completed.";
    const auto r = redactor.redact(text);
    EXPECT_FALSE(r.was_redacted);
    EXPECT_EQ(r.text, text);
    EXPECT_EQ(r.summary.total, 0u);
}

// 국제 전화 패턴은 LOW 이므로 기본 임계값(MEDIUM)에서 치환하지 않는다
TEST_F(PiiRedactorTest, BelowMinConfidence_Kept) {
    PiiRedactor redactor{detector_};
    const std::string text = "Reach us at +44 20 7946 0958";
    EXPECT_EQ(redactor.redact(text).text, text);

    PiiRedactor everything{detector_, RedactorOptions{.min_confidence = Confidence::kLow}};
    EXPECT_EQ(everything.redact(text).text, "Reach us at [REDACTED-PHONE]");
}

TEST_F(PiiRedactorTest, HighConfidenceOnly_SkipsMediumSsn) {
    const auto redactor = PiiRedactor::high_confidence_only(detector_);
    const auto r = redactor.redact("SSN 123-45-6789, email bob@example.com");
    EXPECT_EQ(r.text, "SSN 123-45-6789, email [REDACTED-EMAIL]");
}

TEST_F(PiiRedactorTest, CustomPlaceholder) {
    PiiRedactor redactor{detector_,
                         RedactorOptions{.placeholders = {{PiiType::kEmail, "<email>"}}}};
    EXPECT_EQ(redactor.placeholder_for(PiiType::kEmail), "<email>");
    EXPECT_EQ(redactor.placeholder_for(PiiType::kSsn), "[REDACTED-SSN]");
    EXPECT_EQ(redactor.redact("to bob@example.com").text, "to <email>");
}

TEST_F(PiiRedactorTest, PartialRedaction) {
    const auto redactor = PiiRedactor::with_partial_redaction(detector_);
    EXPECT_EQ(redactor.redact("ssn 123-45-6789").text, "ssn ***-**-6789");
    EXPECT_EQ(redactor.redact("card 4111 1111 1111 1111").text, "card ****-****-****-1111");
    EXPECT_EQ(redactor.redact("call 555-123-4567").text, "call ***-***-4567");
    EXPECT_EQ(redactor.redact("bob@example.com").text, "[REDACTED]@example.com");
    EXPECT_EQ(redactor.redact("ACCT-A-10234").text, "[REDACTED]-234");
}

// 호출자가 넘긴 매치로만 치환하고, 겹치는 스팬은 한 번만 치환한다
TEST_F(PiiRedactorTest, ExplicitMatches_OverlapIgnored) {
    PiiRedactor redactor{detector_};
    const std::string text = "abcdefghij";
    const std::vector<PiiMatch> matches{
        PiiMatch{.type = PiiType::kEmail, .value = "cdef", .start = 2, .end = 6,
                 .confidence = Confidence::kHigh},
        PiiMatch{.type = PiiType::kPhone, .value = "efgh", .start = 4, .end = 8,
                 .confidence = Confidence::kHigh},
    };
    const auto r = redactor.redact(text, matches);
    EXPECT_EQ(r.summary.total, 1u);
    EXPECT_EQ(r.text, "abcd[REDACTED-PHONE]ij");
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------
TEST_F(PiiRedactorTest, Json_StructurePreserved) {
    PiiRedactor redactor{detector_};
    const std::string input = R"({"user":{"email":"bob@example.com","age":41},)"
                              R"("notes":["call 555-123-4567","ok"],"id":"bob@example.com"})";
    const auto r = redactor.redact_json(input);

    ASSERT_TRUE(r.was_redacted);
    EXPECT_EQ(r.summary.total, 3u);

    const auto doc = nlohmann::ordered_json::parse(r.text);
    EXPECT_EQ(doc["user"]["email"], "[REDACTED-EMAIL]");
    EXPECT_EQ(doc["user"]["age"], 41);
    EXPECT_EQ(doc["notes"][0], "call [REDACTED-PHONE]");
    EXPECT_EQ(doc["notes"][1], "ok");
    EXPECT_EQ(doc["id"], "[REDACTED-EMAIL]");

    // 키 순서 유지
    auto it = doc.begin();
    EXPECT_EQ(it.key(), "user");
    ++it;
    EXPECT_EQ(it.key(), "notes");
}

TEST_F(PiiRedactorTest, Json_NoPii_ReturnsInputVerbatim) {
    PiiRedactor redactor{detector_};
    const std::string input = R"({"a":1,"b":"hello"})";
    const auto r = redactor.redact_json(input);
    EXPECT_FALSE(r.was_redacted);
    EXPECT_EQ(r.text, input);
}

TEST_F(PiiRedactorTest, Json_InvalidFallsBackToText) {
    PiiRedactor redactor{detector_};
    const auto r = redactor.redact_json("{not json bob@example.com");
    EXPECT_TRUE(r.was_redacted);
    EXPECT_EQ(r.text, "{not json [REDACTED-EMAIL]");
}
