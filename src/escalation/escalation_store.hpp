#pragma once

// ---------------------------------------------------------------------------
// escalation_store.hpp
//
// 사람 검토 레코드 타입과 저장소 협력자 인터페이스.
//
// [저장소 계약]
// - create/update/find/list 만 요구한다. 저장 엔진은 이 프로젝트가 정의하지 않는다.
// - 모든 메서드는 PersistenceExecutor 스레드에서 호출되므로 구현체는
//   스레드 안전해야 한다.
// - 실패는 예외가 아닌 std::unexpected(message) 로 보고한다.
//
// [민감정보]
// EscalationRecord 는 입력 원문을 담지 않는다. input_hash 와 요인 점수만 저장한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class EscalationStatus : std::uint8_t {
    kPending  = 0,
    kResolved = 1,
};

enum class Resolution : std::uint8_t {
    kApprove = 0,
    kReject  = 1,
    kDismiss = 2,
};

[[nodiscard]] std::string_view to_string(EscalationStatus s) noexcept;
[[nodiscard]] std::string_view to_string(Resolution r) noexcept;
[[nodiscard]] std::optional<Resolution> parse_resolution(std::string_view s);

// ---------------------------------------------------------------------------
// EscalationRecord
//   severity: HIGH (score >= 0.6) / MEDIUM (>= 0.45) / LOW
//   PENDING → RESOLVED 전이는 정확히 한 번.
// ---------------------------------------------------------------------------
struct EscalationRecord {
    std::string                                          id{};
    Severity                                             severity{Severity::kLow};
    EscalationStatus                                     status{EscalationStatus::kPending};
    std::optional<Resolution>                            resolution{};
    std::string                                          user_id{};
    std::string                                          session_id{};
    std::string                                          request_id{};
    std::string                                          endpoint{};
    std::string                                          input_hash{};
    double                                               anomaly_score{0.0};
    FactorScores                                         factors{};
    std::vector<std::string>                             patterns_matched{};
    std::string                                          reviewer{};
    std::string                                          resolution_reason{};
    std::chrono::system_clock::time_point                created_at{};
    std::optional<std::chrono::system_clock::time_point> resolved_at{};
};

class EscalationStore {
public:
    virtual ~EscalationStore() = default;

    // create
    //   record.id 를 키로 저장한다. 반환: 저장된 ID.
    [[nodiscard]] virtual std::expected<std::string, std::string>
    create(const EscalationRecord& record) = 0;

    [[nodiscard]] virtual std::expected<void, std::string>
    update(const EscalationRecord& record) = 0;

    [[nodiscard]] virtual std::expected<std::optional<EscalationRecord>, std::string>
    find(const std::string& id) = 0;

    // list
    //   status 가 nullopt 이면 전체. 순서는 보장하지 않는다.
    [[nodiscard]] virtual std::expected<std::vector<EscalationRecord>, std::string>
    list(std::optional<EscalationStatus> status) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryEscalationStore
//   프로세스 메모리 저장소. 재시작 시 레코드가 사라진다 (개발/테스트용).
// ---------------------------------------------------------------------------
class InMemoryEscalationStore final : public EscalationStore {
public:
    InMemoryEscalationStore() = default;

    [[nodiscard]] std::expected<std::string, std::string>
    create(const EscalationRecord& record) override;

    [[nodiscard]] std::expected<void, std::string>
    update(const EscalationRecord& record) override;

    [[nodiscard]] std::expected<std::optional<EscalationRecord>, std::string>
    find(const std::string& id) override;

    [[nodiscard]] std::expected<std::vector<EscalationRecord>, std::string>
    list(std::optional<EscalationStatus> status) override;

private:
    std::mutex                              mutex_;
    std::map<std::string, EscalationRecord> records_;
};
