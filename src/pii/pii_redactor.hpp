#pragma once

// ---------------------------------------------------------------------------
// pii_redactor.hpp
//
// 확신도 임계값 기반 PII 마스킹.
//
// [치환 규칙]
// - min_confidence 미만 매치는 치환하지 않는다 (기본 MEDIUM).
// - 스팬 내림차순으로 치환한다. 뒤쪽 치환이 앞쪽 오프셋을 바꾸지 않는다.
// - 기본 자리표시자: [REDACTED-SSN] [REDACTED-ACCOUNT] [REDACTED-LOAN]
//                    [REDACTED-CC] [REDACTED-EMAIL] [REDACTED-PHONE]
//   유형별로 덮어쓸 수 있다.
//
// [부분 공개 모드]
//   ssn     → ***-**-1234
//   card    → ****-****-****-1234
//   phone   → ***-***-1234
//   email   → [REDACTED]@example.com
//   account → [REDACTED]-345 (마지막 3자)
//
// [JSON]
// redact_json() 은 문자열 리프만 치환하고 키 집합/중첩 구조/키 순서를 유지한다.
// 파싱 실패 시 전체 문자열을 일반 텍스트로 치환한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "pii/pii_detector.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct RedactedSpan {
    PiiType     type{PiiType::kEmail};
    std::size_t start{0};               // 원본 텍스트 기준 바이트 오프셋
    std::size_t original_length{0};
    std::size_t replacement_length{0};
};

struct RedactionSummary {
    std::size_t                        total{0};
    std::map<std::string, std::size_t> by_type{};        // "ssn" → n
    std::map<std::string, std::size_t> by_confidence{};  // "HIGH" → n
    std::vector<RedactedSpan>          positions{};
    std::size_t                        characters_redacted{0};

    void merge(const RedactionSummary& other);
};

struct RedactionResult {
    std::string      text{};
    bool             was_redacted{false};
    RedactionSummary summary{};
};

struct RedactorOptions {
    Confidence                     min_confidence{Confidence::kMedium};
    bool                           partial{false};
    std::map<PiiType, std::string> placeholders{};  // 비어 있는 유형은 기본값
};

class PiiRedactor {
public:
    explicit PiiRedactor(const PiiDetector& detector, RedactorOptions options = {});

    ~PiiRedactor() = default;

    PiiRedactor(const PiiRedactor&)            = delete;
    PiiRedactor& operator=(const PiiRedactor&) = delete;
    PiiRedactor(PiiRedactor&&)                 = delete;
    PiiRedactor& operator=(PiiRedactor&&)      = delete;

    // 탐지기로 매치를 찾은 뒤 치환한다.
    [[nodiscard]] RedactionResult redact(std::string_view text) const;

    // 이미 탐지된 매치로 치환한다. 매치 스팬은 text 기준이어야 한다.
    [[nodiscard]] RedactionResult redact(std::string_view             text,
                                         const std::vector<PiiMatch>& matches) const;

    [[nodiscard]] RedactionResult redact_json(std::string_view json_text) const;

    [[nodiscard]] std::string placeholder_for(PiiType type) const;

    [[nodiscard]] const RedactorOptions& options() const noexcept { return options_; }

    // HIGH 확신도 매치만 치환
    [[nodiscard]] static PiiRedactor high_confidence_only(const PiiDetector& detector);

    // 부분 공개 모드
    [[nodiscard]] static PiiRedactor with_partial_redaction(const PiiDetector& detector);

    [[nodiscard]] static std::string default_placeholder(PiiType type);

private:
    [[nodiscard]] std::string replacement_for(const PiiMatch& m) const;

    const PiiDetector& detector_;
    RedactorOptions    options_;
};
