// ---------------------------------------------------------------------------
// test_output_pipeline.cpp
//
// OutputInspectionPipeline 통합 테스트 (배포 PII 규칙 + 시드 식별자).
//
// [테스트 범위]
// - PII 없음 → ALLOW, 원문 그대로
// - 본인 이메일 / 전화번호 → REDACT
// - 다른 사용자 이메일, SSN, 카드 → BLOCK + 보안 이벤트(alert_sent=true)
// - 본인 데이터와 다른 사용자 이메일이 섞여도 BLOCK
// - 카드 번호 뒤에 짧은 숫자가 붙어도 BLOCK
// - Luhn 실패 카드 번호는 탐지되지 않으므로 ALLOW
// - 임계값 미만 매치만 있으면 원문 그대로 REDACT
// - 보안 이벤트 저장 실패 → "blocked-<uuid>" 추적 ID, 판정 유지
// - 식별자 조회 예외 → 빈 식별자로 보수적 판정
// - 플래그 off → 통과, 통계 미집계
// - inspect_or_throw, inspect_json
// ---------------------------------------------------------------------------

#include "common/persistence_executor.hpp"
#include "config/rule_loader.hpp"
#include "output/output_inspection_pipeline.hpp"
#include "output/security_event_store.hpp"
#include "pii/cross_user_classifier.hpp"
#include "pii/identity_directory.hpp"
#include "pii/pii_detector.hpp"
#include "pii/pii_redactor.hpp"
#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

InspectionContext ctx_for(const std::string& user_id) {
    return InspectionContext{
        .user_id    = user_id,
        .session_id = "sess-1",
        .request_id = "req-out-1",
        .endpoint   = "/chat",
    };
}

// create 가 항상 실패하는 이벤트 저장소
class FailingEventStore final : public SecurityEventStore {
public:
    std::expected<std::string, std::string> create(const SecurityEventRecord&) override {
        return std::unexpected(std::string("event db down"));
    }
    std::expected<void, std::string> update(const SecurityEventRecord&) override {
        return std::unexpected(std::string("event db down"));
    }
    std::expected<std::optional<SecurityEventRecord>, std::string>
    find(const std::string&) override {
        return std::optional<SecurityEventRecord>{};
    }
};

// 모든 조회에서 예외를 던지는 식별자 소스. 분류 단계 예외를 흉내 낸다.
class ThrowingSource final : public IdentitySource {
public:
    std::expected<std::optional<UserProfile>, std::string> find_user(const std::string&) override {
        throw std::runtime_error("boom");
    }
    std::expected<std::map<std::string, std::string>, std::string> list_user_emails() override {
        throw std::runtime_error("boom");
    }
    std::expected<std::vector<std::string>, std::string>
    recent_transaction_texts(const std::string&, std::size_t) override {
        throw std::runtime_error("boom");
    }
};

} // namespace

// ---------------------------------------------------------------------------
// OutputPipeline 픽스처
// ---------------------------------------------------------------------------
class OutputPipeline : public ::testing::Test {
protected:
    void SetUp() override {
        const std::filesystem::path dir(LLMGATE_CONFIG_DIR);
        ASSERT_TRUE(detector_.load(dir / "pii_patterns.yaml").has_value());
        auto seed = RuleLoader::load_identities(dir / "identities.yaml");
        ASSERT_TRUE(seed.has_value()) << seed.error();
        for (const auto& r : *seed) {
            identities_->upsert(r);
        }
    }

    OutputInspectionPipeline make_pipeline(std::shared_ptr<SecurityEventStore> events,
                                           FeatureFlags flags = {}) {
        return OutputInspectionPipeline{detector_, classifier_, redactor_, std::move(events),
                                        executor_, nullptr, &stats_, flags};
    }

    PiiDetector                                 detector_;
    std::shared_ptr<IdentityDirectory>          identities_ = std::make_shared<IdentityDirectory>();
    PersistenceExecutor                         executor_{2, std::chrono::milliseconds{2000}};
    CrossUserClassifier                         classifier_{detector_, identities_, executor_};
    PiiRedactor                                 redactor_{detector_};
    std::shared_ptr<InMemorySecurityEventStore> events_ =
        std::make_shared<InMemorySecurityEventStore>();
    StatsCollector                              stats_;
};

TEST_F(OutputPipeline, NoPii_Allows) {
    auto pipeline = make_pipeline(events_);
    const std::string text = "Your balance is available in the app.";
    const auto r = pipeline.inspect(ctx_for("user-001"), text);

    EXPECT_EQ(r.decision, OutputDecision::kAllow);
    EXPECT_EQ(r.processed_text, text);
    EXPECT_EQ(r.pii_found, 0u);
    EXPECT_EQ(r.response_hash.size(), 16u);
    EXPECT_EQ(stats_.snapshot().outputs_total, 1u);
}

TEST_F(OutputPipeline, OwnEmailAndPhone_Redacted) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect(ctx_for("user-001"),
                                    "We will email alice@example.com or call 555-123-4567.");

    EXPECT_EQ(r.decision, OutputDecision::kRedact);
    EXPECT_EQ(r.processed_text, "We will email [REDACTED-EMAIL] or call [REDACTED-PHONE].");
    EXPECT_EQ(r.summary.total, 2u);
    EXPECT_FALSE(r.cross_user_detected);
    EXPECT_TRUE(r.security_event_id.empty());
    EXPECT_EQ(events_->size(), 0u);
    EXPECT_EQ(stats_.snapshot().outputs_redacted, 1u);
}

TEST_F(OutputPipeline, OtherUsersEmail_BlocksWithSecurityEvent) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect(ctx_for("user-001"),
                                    "The transfer went to bob@example.com yesterday.");

    EXPECT_EQ(r.decision, OutputDecision::kBlock);
    EXPECT_TRUE(r.processed_text.empty());
    EXPECT_TRUE(r.cross_user_detected);
    ASSERT_FALSE(r.security_event_id.empty());

    const auto rec = events_->find(r.security_event_id);
    ASSERT_TRUE(rec.has_value());
    ASSERT_TRUE(rec->has_value());
    EXPECT_EQ((*rec)->event_type, kCrossUserDataBlocked);
    EXPECT_EQ((*rec)->severity, Severity::kCritical);
    EXPECT_TRUE((*rec)->alert_sent);
    EXPECT_EQ((*rec)->user_id, "user-001");
    ASSERT_EQ((*rec)->pii_types.size(), 1u);
    EXPECT_EQ((*rec)->pii_types[0], "email");
    EXPECT_EQ((*rec)->response_hash, r.response_hash);
    EXPECT_EQ(stats_.snapshot().outputs_blocked, 1u);
}

TEST_F(OutputPipeline, OwnDataMixedWithOtherUsersEmail_Blocks) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect(
        ctx_for("user-001"),
        "Statement for alice@example.com, account ACCT-A-10234. Payee: bob@example.com.");

    EXPECT_EQ(r.decision, OutputDecision::kBlock);
    EXPECT_TRUE(r.processed_text.empty());
    EXPECT_TRUE(r.cross_user_detected);
    ASSERT_FALSE(r.security_event_id.empty());

    const auto rec = events_->find(r.security_event_id);
    ASSERT_TRUE(rec.has_value());
    ASSERT_TRUE(rec->has_value());
    EXPECT_EQ((*rec)->severity, Severity::kCritical);
    EXPECT_EQ(events_->size(), 1u);
}

TEST_F(OutputPipeline, SsnAlwaysBlocks) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect(ctx_for("user-001"), "Your SSN is 123-45-6789.");
    EXPECT_EQ(r.decision, OutputDecision::kBlock);
    EXPECT_FALSE(r.cross_user_detected);
    EXPECT_EQ(events_->size(), 1u);
}

TEST_F(OutputPipeline, ValidCardBlocks_InvalidCardAllowed) {
    auto pipeline = make_pipeline(events_);
    EXPECT_EQ(pipeline.inspect(ctx_for("user-001"), "Card 4111 1111 1111 1111 on file").decision,
              OutputDecision::kBlock);
    EXPECT_EQ(pipeline.inspect(ctx_for("user-001"), "Card 4111 1111 1111 1112 on file").decision,
              OutputDecision::kAllow);
}

TEST_F(OutputPipeline, CardFollowedByShortNumber_Blocks) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect(ctx_for("user-001"), "Card 4532015112830366 12 payments left");
    EXPECT_EQ(r.decision, OutputDecision::kBlock);
    EXPECT_TRUE(r.processed_text.empty());
    ASSERT_EQ(r.pii_types.size(), 1u);
    EXPECT_EQ(r.pii_types[0], "credit_card");
}

// LOW 매치는 치환되지 않지만 PII 가 있었으므로 ALLOW 가 아니다
TEST_F(OutputPipeline, OnlyLowConfidencePii_RedactWithTextUnchanged) {
    auto pipeline = make_pipeline(events_);
    const std::string text = "call +44 20 7946 0958";
    const auto r = pipeline.inspect(ctx_for("user-001"), text);

    EXPECT_EQ(r.decision, OutputDecision::kRedact);
    EXPECT_EQ(r.pii_found, 1u);
    EXPECT_EQ(r.processed_text, text);
    EXPECT_EQ(stats_.snapshot().outputs_redacted, 1u);
}

TEST_F(OutputPipeline, OwnAccountRedacted) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect(ctx_for("user-001"), "Account ACCT-A-10234 is active.");
    EXPECT_EQ(r.decision, OutputDecision::kRedact);
    EXPECT_EQ(r.processed_text, "Account [REDACTED-ACCOUNT] is active.");
}

TEST_F(OutputPipeline, EventStoreFailure_TrackingIdAndStillBlocked) {
    auto pipeline = make_pipeline(std::make_shared<FailingEventStore>());
    const auto r = pipeline.inspect(ctx_for("user-001"), "Reach bob@example.com");

    EXPECT_EQ(r.decision, OutputDecision::kBlock);
    EXPECT_EQ(r.security_event_id.rfind("blocked-", 0), 0u);
    EXPECT_EQ(r.security_event_id.size(), std::string("blocked-").size() + 36u);

    // 같은 밀리초 안의 두 실패도 서로 다른 추적 ID 를 받는다
    const auto again = pipeline.inspect(ctx_for("user-001"), "Reach bob@example.com");
    EXPECT_NE(again.security_event_id, r.security_event_id);
}

// 식별자 조회가 예외를 던져도 검사는 계속되고, 빈 식별자로 보수적으로 판정한다.
// 본인 이메일도 본인 것으로 인정되지 않아 UNKNOWN → REDACT 가 된다.
TEST_F(OutputPipeline, IdentityLookupThrows_ConservativeDecision) {
    CrossUserClassifier      throwing{detector_, std::make_shared<ThrowingSource>(), executor_};
    OutputInspectionPipeline pipeline{detector_, throwing, redactor_, events_,
                                      executor_, nullptr, &stats_, FeatureFlags{}};

    const auto r = pipeline.inspect(ctx_for("user-001"), "Mail alice@example.com");
    EXPECT_EQ(r.decision, OutputDecision::kRedact);
    EXPECT_EQ(r.processed_text, "Mail [REDACTED-EMAIL]");

    EXPECT_EQ(pipeline.inspect(ctx_for("user-001"), "SSN 123-45-6789").decision,
              OutputDecision::kBlock);
}

TEST_F(OutputPipeline, FlagOff_PassesThroughWithoutStats) {
    FeatureFlags flags{};
    flags.output_inspection_enabled = false;
    auto pipeline = make_pipeline(events_, flags);

    const std::string text = "bob@example.com 123-45-6789";
    const auto r = pipeline.inspect(ctx_for("user-001"), text);
    EXPECT_EQ(r.decision, OutputDecision::kAllow);
    EXPECT_EQ(r.processed_text, text);
    EXPECT_EQ(stats_.snapshot().outputs_total, 0u);
}

TEST_F(OutputPipeline, InspectOrThrow) {
    auto pipeline = make_pipeline(events_);
    EXPECT_EQ(pipeline.inspect_or_throw(ctx_for("user-001"), "call 555-123-4567"),
              "call [REDACTED-PHONE]");

    try {
        (void)pipeline.inspect_or_throw(ctx_for("user-001"), "mail bob@example.com");
        FAIL() << "expected OutputBlockedError";
    } catch (const OutputBlockedError& e) {
        EXPECT_STREQ(e.what(), "Unable to process request");
        EXPECT_FALSE(e.security_event_id().empty());
    }
}

TEST_F(OutputPipeline, InspectJson_RedactsLeaves) {
    auto pipeline = make_pipeline(events_);
    const auto r = pipeline.inspect_json(ctx_for("user-001"),
                                         R"({"contact":"alice@example.com","count":2})");
    EXPECT_EQ(r.decision, OutputDecision::kRedact);
    EXPECT_NE(r.processed_text.find("[REDACTED-EMAIL]"), std::string::npos);
    EXPECT_NE(r.processed_text.find("\"count\""), std::string::npos);
}
