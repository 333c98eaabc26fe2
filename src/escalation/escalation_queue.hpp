#pragma once

// ---------------------------------------------------------------------------
// escalation_queue.hpp
//
// ESCALATE 판정을 사람 검토 레코드로 저장하고 관리한다.
//
// [생성]
// - severity: score >= 0.6 → HIGH, >= 0.45 → MEDIUM, 그 외 LOW
// - 입력 원문 대신 input_hash 와 요인 점수만 저장한다.
// - 저장 실패/시간 초과 시 "ephemeral-<uuid>" 추적 ID 를 만들어 PENDING 으로
//   반환한다. 판정(ESCALATE)은 바뀌지 않는다.
//
// [해결]
// - PENDING → RESOLVED 는 정확히 한 번. 이미 해결된 레코드는 kAlreadyResolved.
// - resolve() 는 내부 mutex 로 직렬화한다. find → update 사이에 다른
//   해결 요청이 끼어들 수 없다.
//
// [스레드 안전성]
// 모든 메서드는 여러 요청 스레드에서 동시에 호출할 수 있다.
// ---------------------------------------------------------------------------

#include "common/persistence_executor.hpp"
#include "common/types.hpp"
#include "escalation/escalation_store.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class StructuredLogger;

struct EscalationTicket {
    std::string      review_id{};
    EscalationStatus status{EscalationStatus::kPending};
    Severity         severity{Severity::kLow};
    bool             persisted{true};   // false 면 ephemeral ID
    std::string      estimated_wait{"24 hours"};
};

enum class ResolveErrorCode : std::uint8_t {
    kNotFound        = 0,
    kAlreadyResolved = 1,
    kStorageFailure  = 2,
};

struct ResolveError {
    ResolveErrorCode code{ResolveErrorCode::kStorageFailure};
    std::string      message{};
};

struct EscalationStats {
    std::size_t                        pending{0};
    std::size_t                        resolved{0};
    std::map<std::string, std::size_t> pending_by_severity{};  // "HIGH" → n
    std::map<std::string, std::size_t> resolved_by_resolution{};  // "APPROVE" → n
};

class EscalationQueue {
public:
    // 생성자
    //   store    : 저장소 협력자 (nullptr 금지)
    //   executor : 저장소 호출을 실행할 스레드 풀 (호출자 소유, 수명이 더 길어야 함)
    //   logger   : 감사 로거. nullptr 이면 감사 라인 생략.
    EscalationQueue(std::shared_ptr<EscalationStore> store,
                    PersistenceExecutor&             executor,
                    StructuredLogger*                logger = nullptr);

    ~EscalationQueue() = default;

    EscalationQueue(const EscalationQueue&)            = delete;
    EscalationQueue& operator=(const EscalationQueue&) = delete;
    EscalationQueue(EscalationQueue&&)                 = delete;
    EscalationQueue& operator=(EscalationQueue&&)      = delete;

    // escalate
    //   실패하지 않는다. 저장 실패 시 ticket.persisted=false.
    [[nodiscard]] EscalationTicket escalate(const InspectionContext&        ctx,
                                            const std::string&              input_hash,
                                            double                          anomaly_score,
                                            const FactorScores&             factors,
                                            const std::vector<std::string>& patterns_matched);

    // list_pending
    //   severity 내림차순, 같은 severity 안에서는 생성 시각 오름차순.
    [[nodiscard]] std::expected<std::vector<EscalationRecord>, std::string>
    list_pending(std::size_t limit = 50);

    [[nodiscard]] std::expected<std::optional<EscalationRecord>, std::string>
    find(const std::string& review_id);

    // resolve
    //   reason 은 선택 (빈 문자열 허용).
    [[nodiscard]] std::expected<EscalationRecord, ResolveError>
    resolve(const std::string& review_id,
            Resolution         resolution,
            const std::string& reviewer,
            const std::string& reason = {});

    [[nodiscard]] std::expected<EscalationStats, std::string> stats();

    // 점수 → severity 매핑 (순수 함수)
    [[nodiscard]] static Severity severity_for_score(double score) noexcept;

private:
    std::shared_ptr<EscalationStore> store_;
    PersistenceExecutor&             executor_;
    StructuredLogger*                logger_;
    std::mutex                       resolve_mutex_;
};
