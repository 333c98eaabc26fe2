#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// 입력/출력 검사 파이프라인 전반에서 공유하는 기본 타입.
//
// [순환 의존성 방지]
// - 이 헤더는 표준 라이브러리만 포함한다.
// - input/, pii/, escalation/, logger/ 모듈 모두 이 헤더를 단방향으로 참조한다.
//
// [문자열 변환]
// - to_string(): 감사 로그/UDS 응답용 대문자 식별자 ("BLOCK", "HIGH" 등).
// - parse_*(): YAML/UDS 입력 파싱용. 알 수 없는 값이면 std::nullopt.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// InspectionContext
//   검사 요청 하나를 식별하는 컨텍스트.
//   상위 텍스트 추출 레이어가 생성하여 파이프라인에 const-ref 로 전달한다.
//
//   [민감정보]
//   input 원문은 어떤 로그/저장소에도 그대로 기록하지 않는다.
//   감사 로그와 에스컬레이션 레코드에는 SHA-256 해시만 남긴다.
// ---------------------------------------------------------------------------
struct InspectionContext {
    std::string user_id{};
    std::string session_id{};
    std::string request_id{};
    std::string endpoint{};
    std::string input{};       // 검사 대상 원문 (비영속)
};

// ---------------------------------------------------------------------------
// InspectionDecision
//   입력 검사 최종 판정.
// ---------------------------------------------------------------------------
enum class InspectionDecision : std::uint8_t {
    kAllow    = 0,
    kBlock    = 1,
    kEscalate = 2,  // 사람 검토 큐로 이관
};

// ---------------------------------------------------------------------------
// Severity
//   공격 패턴 심각도. 값이 클수록 위험하다 (정렬 비교에 사용).
// ---------------------------------------------------------------------------
enum class Severity : std::uint8_t {
    kLow      = 0,
    kMedium   = 1,
    kHigh     = 2,
    kCritical = 3,
};

// ---------------------------------------------------------------------------
// Confidence
//   PII 탐지 확신도. 값이 클수록 확신이 높다 (임계값 비교에 사용).
// ---------------------------------------------------------------------------
enum class Confidence : std::uint8_t {
    kLow    = 0,
    kMedium = 1,
    kHigh   = 2,
};

// ---------------------------------------------------------------------------
// PiiType
//   지원하는 PII 유형.
// ---------------------------------------------------------------------------
enum class PiiType : std::uint8_t {
    kSsn           = 0,
    kAccountNumber = 1,
    kLoanNumber    = 2,
    kCreditCard    = 3,
    kEmail         = 4,
    kPhone         = 5,
};

inline constexpr PiiType kAllPiiTypes[] = {
    PiiType::kSsn,        PiiType::kAccountNumber, PiiType::kLoanNumber,
    PiiType::kCreditCard, PiiType::kEmail,         PiiType::kPhone,
};

// ---------------------------------------------------------------------------
// Ownership
//   PII 매치의 소유자 분류.
// ---------------------------------------------------------------------------
enum class Ownership : std::uint8_t {
    kCurrentUser = 0,
    kOtherUser   = 1,
    kUnknown     = 2,
};

// ---------------------------------------------------------------------------
// FactorScores
//   이상 점수 요인별 값. 감사 로그와 에스컬레이션 레코드에 저장한다.
// ---------------------------------------------------------------------------
struct FactorScores {
    double pattern_match{0.0};
    double input_length{0.0};
    double special_chars{0.0};
    double encoding{0.0};
    double instruction{0.0};
};

[[nodiscard]] constexpr std::string_view to_string(InspectionDecision d) noexcept {
    switch (d) {
        case InspectionDecision::kAllow:    return "ALLOW";
        case InspectionDecision::kBlock:    return "BLOCK";
        case InspectionDecision::kEscalate: return "ESCALATE";
    }
    return "BLOCK";
}

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept {
    switch (s) {
        case Severity::kLow:      return "LOW";
        case Severity::kMedium:   return "MEDIUM";
        case Severity::kHigh:     return "HIGH";
        case Severity::kCritical: return "CRITICAL";
    }
    return "LOW";
}

[[nodiscard]] constexpr std::string_view to_string(Confidence c) noexcept {
    switch (c) {
        case Confidence::kLow:    return "LOW";
        case Confidence::kMedium: return "MEDIUM";
        case Confidence::kHigh:   return "HIGH";
    }
    return "LOW";
}

// YAML 카테고리 키와 동일한 소문자 식별자
[[nodiscard]] constexpr std::string_view to_string(PiiType t) noexcept {
    switch (t) {
        case PiiType::kSsn:           return "ssn";
        case PiiType::kAccountNumber: return "account_number";
        case PiiType::kLoanNumber:    return "loan_number";
        case PiiType::kCreditCard:    return "credit_card";
        case PiiType::kEmail:         return "email";
        case PiiType::kPhone:         return "phone";
    }
    return "ssn";
}

[[nodiscard]] constexpr std::string_view to_string(Ownership o) noexcept {
    switch (o) {
        case Ownership::kCurrentUser: return "CURRENT_USER";
        case Ownership::kOtherUser:   return "OTHER_USER";
        case Ownership::kUnknown:     return "UNKNOWN";
    }
    return "UNKNOWN";
}

// 대소문자 무시 파싱. "critical", "CRITICAL" 모두 허용.
[[nodiscard]] std::optional<Severity>   parse_severity(std::string_view s);
[[nodiscard]] std::optional<Confidence> parse_confidence(std::string_view s);
[[nodiscard]] std::optional<PiiType>    parse_pii_type(std::string_view s);
