#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사/보안 이벤트 구조화 로그 타입 정의.
//
// [민감정보 취급 원칙]
// - 입력 원문, 모델 응답 원문, PII 값은 어떤 로그 타입에도 담지 않는다.
// - 내용 식별은 SHA-256 해시(input_hash / response_hash)로만 한다.
// - PII 는 유형(taxonomy)과 개수만 기록한다.
//
// [순환 의존성 방지]
// - 판정 enum 은 common/types.hpp 에서만 가져온다.
// - 파이프라인 결과 구조체(InspectionResult 등)를 직접 include 하지 않는다.
//   호출자가 필요한 필드만 채워 넘긴다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. LOG_LEVEL 환경변수에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// InputAuditLog
//   입력 검사 1회당 1건. 목록 단락 평가 경로도 동일하게 기록한다.
//   list_id 가 있으면 factors 는 비어 있다.
// ---------------------------------------------------------------------------
struct InputAuditLog {
    std::string                           request_id{};
    std::string                           user_id{};
    std::string                           session_id{};
    std::string                           endpoint{};
    std::string                           input_hash{};
    std::size_t                           input_length{0};
    InspectionDecision                    decision{InspectionDecision::kBlock};
    double                                confidence{0.0};
    double                                anomaly_score{0.0};
    std::vector<std::string>              patterns_matched{};
    std::optional<FactorScores>           factors{};
    std::string                           list_id{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// OutputAuditLog
//   출력 검사 1회당 1건.
//   response_hash: SHA-256 앞 16자리.
// ---------------------------------------------------------------------------
struct OutputAuditLog {
    std::string                           request_id{};
    std::string                           user_id{};
    std::string                           session_id{};
    std::string                           endpoint{};
    std::string                           response_hash{};
    std::size_t                           response_length{0};
    std::string                           decision{};       // "ALLOW" | "REDACT" | "BLOCK"
    std::vector<std::string>              pii_types{};      // 탐지된 PII 유형 (중복 제거)
    std::size_t                           pii_match_count{0};
    std::size_t                           redaction_count{0};
    std::map<std::string, std::size_t>    redactions_by_type{};
    bool                                  cross_user_detected{false};
    std::size_t                           cross_user_match_count{0};
    std::string                           security_event_id{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// SecurityEventLog
//   BLOCK / ESCALATE / 교차 사용자 차단 등 상위 심각도 이벤트.
//   event: "input_blocked" | "input_escalated" | "cross_user_data_blocked"
//   severity: "HIGH" | "CRITICAL" ...
// ---------------------------------------------------------------------------
struct SecurityEventLog {
    std::string                           event{};
    std::string                           severity{};
    std::string                           request_id{};
    std::string                           user_id{};
    std::string                           session_id{};
    std::string                           endpoint{};
    std::string                           content_hash{};
    std::string                           event_id{};       // 보안 이벤트/리뷰 ID
    double                                score{0.0};
    std::vector<std::string>              tags{};           // 패턴 ID 또는 PII 유형
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// EscalationLog
//   리뷰 레코드 생성/해결 이벤트.
//   event: "escalation_created" | "escalation_resolved"
// ---------------------------------------------------------------------------
struct EscalationLog {
    std::string                           event{};
    std::string                           review_id{};
    std::string                           severity{};
    std::string                           status{};
    std::string                           resolution{};
    std::string                           reviewer{};
    bool                                  persisted{true};
    std::chrono::system_clock::time_point timestamp{};
};
