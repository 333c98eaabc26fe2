// ---------------------------------------------------------------------------
// test_escalation_queue.cpp
//
// EscalationQueue 단위 테스트.
//
// [테스트 범위]
// - severity 매핑 경계 (0.6 / 0.45)
// - escalate → PENDING 레코드 저장, 원문 대신 해시만 저장
// - 저장 실패 / 시간 초과 → ephemeral 추적 ID, 판정 유지
// - list_pending 정렬: severity 내림차순 → 생성 시각 오름차순, limit
// - resolve: 정확히 한 번, 재해결 → kAlreadyResolved, 없는 ID → kNotFound
// - 동시 resolve: 하나만 성공
// - stats 집계
// ---------------------------------------------------------------------------

#include "common/persistence_executor.hpp"
#include "escalation/escalation_queue.hpp"
#include "escalation/escalation_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

InspectionContext make_ctx(const std::string& request_id) {
    return InspectionContext{
        .user_id    = "user-001",
        .session_id = "sess-1",
        .request_id = request_id,
        .endpoint   = "/chat",
        .input      = "do not store this text",
    };
}

// create 가 항상 실패하는 저장소
class FailingStore final : public EscalationStore {
public:
    std::expected<std::string, std::string> create(const EscalationRecord&) override {
        return std::unexpected(std::string("disk full"));
    }
    std::expected<void, std::string> update(const EscalationRecord&) override {
        return std::unexpected(std::string("disk full"));
    }
    std::expected<std::optional<EscalationRecord>, std::string> find(const std::string&) override {
        return std::unexpected(std::string("disk full"));
    }
    std::expected<std::vector<EscalationRecord>, std::string>
    list(std::optional<EscalationStatus>) override {
        return std::unexpected(std::string("disk full"));
    }
};

// create 가 제한 시간보다 오래 걸리는 저장소
class SlowStore final : public EscalationStore {
public:
    std::expected<std::string, std::string> create(const EscalationRecord& r) override {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        return r.id;
    }
    std::expected<void, std::string> update(const EscalationRecord&) override { return {}; }
    std::expected<std::optional<EscalationRecord>, std::string> find(const std::string&) override {
        return std::optional<EscalationRecord>{};
    }
    std::expected<std::vector<EscalationRecord>, std::string>
    list(std::optional<EscalationStatus>) override {
        return std::vector<EscalationRecord>{};
    }
};

} // namespace

TEST(EscalationSeverity, ScoreBoundaries) {
    EXPECT_EQ(EscalationQueue::severity_for_score(0.69), Severity::kHigh);
    EXPECT_EQ(EscalationQueue::severity_for_score(0.6), Severity::kHigh);
    EXPECT_EQ(EscalationQueue::severity_for_score(0.59), Severity::kMedium);
    EXPECT_EQ(EscalationQueue::severity_for_score(0.45), Severity::kMedium);
    EXPECT_EQ(EscalationQueue::severity_for_score(0.44), Severity::kLow);
    EXPECT_EQ(EscalationQueue::severity_for_score(0.3), Severity::kLow);
}

TEST(EscalationStrings, ResolutionParsing) {
    EXPECT_EQ(parse_resolution("approve"), Resolution::kApprove);
    EXPECT_EQ(parse_resolution("REJECT"), Resolution::kReject);
    EXPECT_EQ(parse_resolution("Dismiss"), Resolution::kDismiss);
    EXPECT_FALSE(parse_resolution("maybe").has_value());
    EXPECT_EQ(to_string(EscalationStatus::kPending), "PENDING");
}

// ---------------------------------------------------------------------------
// EscalationQueueTest 픽스처
// ---------------------------------------------------------------------------
class EscalationQueueTest : public ::testing::Test {
protected:
    EscalationTicket escalate(double score, const std::string& request_id = "req-1") {
        return queue_.escalate(make_ctx(request_id), "hash-" + request_id, score,
                               FactorScores{.pattern_match = 0.4}, {"IO-001"});
    }

    std::shared_ptr<InMemoryEscalationStore> store_ =
        std::make_shared<InMemoryEscalationStore>();
    PersistenceExecutor executor_{2, std::chrono::milliseconds{2000}};
    EscalationQueue     queue_{store_, executor_};
};

TEST_F(EscalationQueueTest, Escalate_PersistsPendingRecord) {
    const auto ticket = escalate(0.65);

    EXPECT_TRUE(ticket.persisted);
    EXPECT_EQ(ticket.status, EscalationStatus::kPending);
    EXPECT_EQ(ticket.severity, Severity::kHigh);
    EXPECT_EQ(ticket.review_id.rfind("ephemeral-", 0), std::string::npos);

    const auto found = queue_.find(ticket.review_id);
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found->has_value());
    const auto& rec = **found;
    EXPECT_EQ(rec.status, EscalationStatus::kPending);
    EXPECT_EQ(rec.input_hash, "hash-req-1");
    EXPECT_EQ(rec.user_id, "user-001");
    EXPECT_DOUBLE_EQ(rec.factors.pattern_match, 0.4);
    ASSERT_EQ(rec.patterns_matched.size(), 1u);
    EXPECT_FALSE(rec.resolution.has_value());
}

TEST(EscalationQueueFailure, StoreFailure_ReturnsEphemeralId) {
    PersistenceExecutor executor{1, std::chrono::milliseconds{2000}};
    EscalationQueue queue{std::make_shared<FailingStore>(), executor};

    const auto ticket = queue.escalate(make_ctx("req-x"), "h", 0.5, FactorScores{}, {});
    EXPECT_FALSE(ticket.persisted);
    EXPECT_EQ(ticket.review_id.rfind("ephemeral-", 0), 0u);
    EXPECT_EQ(ticket.status, EscalationStatus::kPending);
    EXPECT_FALSE(queue.list_pending().has_value());
}

TEST(EscalationQueueFailure, StoreTimeout_ReturnsEphemeralId) {
    PersistenceExecutor executor{1, std::chrono::milliseconds{20}};
    EscalationQueue queue{std::make_shared<SlowStore>(), executor};

    const auto ticket = queue.escalate(make_ctx("req-y"), "h", 0.5, FactorScores{}, {});
    EXPECT_FALSE(ticket.persisted);
    EXPECT_EQ(ticket.review_id.rfind("ephemeral-", 0), 0u);
}

TEST(EscalationQueueFailure, NullStoreRejected) {
    PersistenceExecutor executor{1, std::chrono::milliseconds{100}};
    EXPECT_THROW(EscalationQueue(nullptr, executor), std::invalid_argument);
}

TEST_F(EscalationQueueTest, ListPending_OrderedBySeverityThenAge) {
    const auto low1 = escalate(0.35, "a");
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    const auto high = escalate(0.65, "b");
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    const auto low2 = escalate(0.31, "c");
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    const auto med = escalate(0.5, "d");

    const auto pending = queue_.list_pending();
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending->size(), 4u);
    EXPECT_EQ((*pending)[0].id, high.review_id);
    EXPECT_EQ((*pending)[1].id, med.review_id);
    EXPECT_EQ((*pending)[2].id, low1.review_id);
    EXPECT_EQ((*pending)[3].id, low2.review_id);

    const auto limited = queue_.list_pending(2);
    ASSERT_TRUE(limited.has_value());
    EXPECT_EQ(limited->size(), 2u);
}

TEST_F(EscalationQueueTest, Resolve_ExactlyOnce) {
    const auto ticket = escalate(0.5);

    const auto resolved =
        queue_.resolve(ticket.review_id, Resolution::kReject, "analyst-1", "confirmed attack");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->status, EscalationStatus::kResolved);
    EXPECT_EQ(resolved->resolution, Resolution::kReject);
    EXPECT_EQ(resolved->reviewer, "analyst-1");
    EXPECT_EQ(resolved->resolution_reason, "confirmed attack");
    EXPECT_TRUE(resolved->resolved_at.has_value());

    const auto again = queue_.resolve(ticket.review_id, Resolution::kApprove, "analyst-2");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ResolveErrorCode::kAlreadyResolved);

    const auto pending = queue_.list_pending();
    ASSERT_TRUE(pending.has_value());
    EXPECT_TRUE(pending->empty());
}

TEST_F(EscalationQueueTest, Resolve_UnknownId) {
    const auto r = queue_.resolve("no-such-id", Resolution::kDismiss, "analyst-1");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ResolveErrorCode::kNotFound);
}

// 여러 검토자가 같은 레코드를 동시에 해결해도 성공은 한 번뿐이다
TEST_F(EscalationQueueTest, Resolve_ConcurrentOnlyOneWins) {
    const auto ticket = escalate(0.5);

    std::atomic<int> successes{0};
    std::atomic<int> already{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            const auto r = queue_.resolve(ticket.review_id, Resolution::kApprove,
                                          "analyst-" + std::to_string(i));
            if (r) {
                ++successes;
            } else if (r.error().code == ResolveErrorCode::kAlreadyResolved) {
                ++already;
            }
        });
    }
    for (auto& t : threads) { t.join(); }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(already.load(), 7);
}

TEST_F(EscalationQueueTest, Stats_CountsByStatus) {
    const auto a = escalate(0.65, "a");
    escalate(0.5, "b");
    escalate(0.35, "c");
    ASSERT_TRUE(queue_.resolve(a.review_id, Resolution::kApprove, "analyst-1").has_value());

    const auto stats = queue_.stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->pending, 2u);
    EXPECT_EQ(stats->resolved, 1u);
    EXPECT_EQ(stats->pending_by_severity.at("MEDIUM"), 1u);
    EXPECT_EQ(stats->pending_by_severity.at("LOW"), 1u);
    EXPECT_EQ(stats->resolved_by_resolution.at("APPROVE"), 1u);
}
