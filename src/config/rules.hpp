#pragma once

// ---------------------------------------------------------------------------
// rules.hpp
//
// 검사 규칙 문서 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/*.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 common/types.hpp 외의 프로젝트 헤더에 의존하지 않는다.
// - 모든 멤버는 기본값을 명시한다. AnomalyRules 의 기본값은 규칙 파일
//   로드 실패 시 사용하는 내장 기본값이기도 하다.
// - 구조체 자체는 판정 로직을 포함하지 않는다. 컴파일(정규식)은 각 컴포넌트가
//   스냅샷을 만들 때 수행한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ===========================================================================
// 인젝션 패턴 (config/injection_patterns.yaml)
// ===========================================================================

struct PatternCategory {
    std::string id{};
    std::string name{};
    Severity    severity{Severity::kMedium};
};

// ---------------------------------------------------------------------------
// PatternRule
//   pattern: ECMAScript 정규식 소스.
//   flags  : 추가 플래그 문자열 (로드 시 보존만 한다. 대소문자 무시와
//            전체 스캔은 항상 강제된다).
// ---------------------------------------------------------------------------
struct PatternRule {
    std::string id{};
    std::string category{};
    std::string name{};
    std::string pattern{};
    std::string flags{};
    Severity    severity{Severity::kMedium};
    std::string description{};
};

struct PatternRuleSet {
    std::string                  version{};
    std::vector<PatternCategory> categories{};
    std::vector<PatternRule>     patterns{};
};

// ===========================================================================
// 허용/차단 목록 (config/lists.yaml)
// ===========================================================================

enum class ListEntryKind : std::uint8_t {
    kExact = 0,  // 대소문자 무시 부분 문자열
    kRegex = 1,  // 대소문자 무시 정규식 검색
};

struct ListEntryRule {
    std::string   id{};
    std::string   pattern{};
    ListEntryKind kind{ListEntryKind::kExact};
    std::string   reason{};
    std::string   added_by{};
    std::string   added_at{};
};

struct ListRuleSet {
    std::string                version{};
    std::vector<ListEntryRule> allow_list{};
    std::vector<ListEntryRule> block_list{};
};

// ===========================================================================
// 이상 점수 규칙 (config/anomaly_rules.yaml)
// ===========================================================================

// ---------------------------------------------------------------------------
// AnomalyThresholds
//   score >= block    → BLOCK
//   score >= escalate → ESCALATE
//   그 외             → ALLOW
//   allow 는 문서 호환용으로만 보관한다 (판정에는 사용하지 않음).
// ---------------------------------------------------------------------------
struct AnomalyThresholds {
    double block{0.7};
    double escalate{0.3};
    double allow{0.3};
};

struct SeverityWeights {
    double critical{0.5};
    double high{0.4};
    double medium{0.2};
    double low{0.1};
};

struct PatternFactorRules {
    double          max_contribution{0.6};
    SeverityWeights severity_weights{};
    double          diminishing_rate{0.7};
};

struct LengthFactorRules {
    double        max_contribution{0.15};
    std::uint32_t normal_min{10};
    std::uint32_t normal_max{2000};
    std::uint32_t very_short{5};
    std::uint32_t very_long{5000};
};

struct SpecialCharFactorRules {
    double      max_contribution{0.15};
    std::string characters{"{}[]<>|;$#@!\\^`~"};
    double      threshold{0.1};
};

// ---------------------------------------------------------------------------
// EncodingFactorRules
//   techniques: "base64" | "unicode_escape" | "url_encoding"
//   목록에 없는 기법은 탐지하지 않는다.
// ---------------------------------------------------------------------------
struct EncodingFactorRules {
    double                   max_contribution{0.2};
    std::vector<std::string> techniques{"base64", "unicode_escape", "url_encoding"};
};

struct InstructionFactorRules {
    double                   max_contribution{0.2};
    std::vector<std::string> imperative_verbs{
        "ignore", "disregard", "forget", "reveal", "execute", "run",
        "perform", "print", "show", "tell", "do",
    };
    std::vector<std::string> conditionals{"if", "when", "unless", "otherwise"};
    std::vector<std::string> ai_references{
        "you must", "you will", "you are now", "your instructions",
        "previous instructions", "system prompt", "ignore all",
    };
};

struct AnomalyRules {
    std::string            version{"builtin"};
    AnomalyThresholds      thresholds{};
    PatternFactorRules     pattern_match{};
    LengthFactorRules      input_length{};
    SpecialCharFactorRules special_chars{};
    EncodingFactorRules    encoding{};
    InstructionFactorRules instruction{};
};

// ===========================================================================
// PII 패턴 (config/pii_patterns.yaml)
// ===========================================================================

// ---------------------------------------------------------------------------
// PiiPatternRule
//   validation: "luhn" | "ssn_checksum" | 빈 문자열
//   빈 문자열이면 유형 기본 검증기를 사용한다
//   (credit_card → luhn, ssn → ssn_checksum, 그 외 없음).
// ---------------------------------------------------------------------------
struct PiiPatternRule {
    std::string id{};
    std::string name{};
    std::string pattern{};
    Confidence  confidence{Confidence::kMedium};
    std::string validation{};
};

struct PiiExclusionRule {
    std::string pattern{};
    std::string reason{};
};

struct PiiCategoryRules {
    PiiType                       type{PiiType::kSsn};
    bool                          enabled{true};
    std::vector<PiiPatternRule>   patterns{};
    std::vector<PiiExclusionRule> exclusions{};
    std::vector<std::string>      invalid_prefixes{};  // SSN 전용 (예: "000", "666")
};

struct PiiSettings {
    bool          case_sensitive{false};
    std::uint32_t max_matches_per_type{100};
    bool          enable_validation{true};
};

struct PiiRuleSet {
    std::string                   version{};
    PiiSettings                   settings{};
    std::vector<PiiCategoryRules> categories{};
};

// ===========================================================================
// 사용자 식별자 시드 (config/identities.yaml)
// ===========================================================================

// ---------------------------------------------------------------------------
// IdentityRecord
//   in-memory IdentityDirectory 초기화용. transaction_texts 는 사용자의
//   거래 메모/가맹점 문자열로, 계좌/대출 번호 패턴 추출에 쓰인다.
// ---------------------------------------------------------------------------
struct IdentityRecord {
    std::string              user_id{};
    std::string              email{};
    std::string              name{};
    std::vector<std::string> transaction_texts{};
};
