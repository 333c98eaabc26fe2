#pragma once

// ---------------------------------------------------------------------------
// output_inspection_pipeline.hpp
//
// 모델 응답 PII 검사 오케스트레이터.
//
// [흐름]
// 1. OUTPUT_INSPECTION_ENABLED=false → 원문 그대로 통과 (감사 없음)
// 2. PIIDetector       → 매치 없음 → ALLOW
// 3. CrossUserClassifier
//    - HIGH 확신도 OTHER_USER, 또는 SSN/카드 매치가 하나라도 있으면
//      CRITICAL 보안 이벤트 기록 → 경보 → 응답 전체 BLOCK
//      (일부만 가리고 내보내는 것은 허용하지 않는다)
// 4. 그 외 → PIIRedactor 로 임계값 이상 매치를 치환 → REDACT
//    (임계값 미만 매치만 있어 바뀐 글자가 없어도 REDACT)
// 모든 검사 경로는 output_inspection 감사 라인 1건을 남긴다.
//
// [fail-close]
// 검사 도중 예외가 발생하면 BLOCK 으로 처리하고 원문을 내보내지 않는다.
//
// [보안 이벤트 저장 실패]
// 저장소 오류/시간 초과 시 "blocked-<uuid>" 추적 ID 를 만든다.
// BLOCK 판정은 바뀌지 않는다.
// ---------------------------------------------------------------------------

#include "common/persistence_executor.hpp"
#include "common/types.hpp"
#include "config/feature_flags.hpp"
#include "output/security_event_store.hpp"
#include "pii/cross_user_classifier.hpp"
#include "pii/pii_detector.hpp"
#include "pii/pii_redactor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class StatsCollector;
class StructuredLogger;

inline constexpr std::string_view kOutputBlockedMessage = "Unable to process request";

enum class OutputDecision : std::uint8_t {
    kAllow  = 0,
    kRedact = 1,
    kBlock  = 2,
};

[[nodiscard]] std::string_view to_string(OutputDecision d) noexcept;

struct OutputInspectionResult {
    OutputDecision           decision{OutputDecision::kBlock};
    std::string              processed_text{};     // BLOCK 이면 비어 있음
    RedactionSummary         summary{};
    std::string              security_event_id{};  // BLOCK 이면 설정
    std::vector<std::string> pii_types{};          // 탐지된 유형 (중복 제거)
    std::size_t              pii_found{0};
    bool                     cross_user_detected{false};
    std::string              response_hash{};      // SHA-256 앞 16자리
    double                   processing_time_ms{0.0};
};

// ---------------------------------------------------------------------------
// OutputBlockedError
//   inspect_or_throw() 가 BLOCK 판정 시 던진다. what() 은 고정 문구.
// ---------------------------------------------------------------------------
class OutputBlockedError : public std::runtime_error {
public:
    explicit OutputBlockedError(std::string security_event_id)
        : std::runtime_error(std::string(kOutputBlockedMessage))
        , security_event_id_(std::move(security_event_id))
    {}

    [[nodiscard]] const std::string& security_event_id() const noexcept {
        return security_event_id_;
    }

private:
    std::string security_event_id_;
};

class OutputInspectionPipeline {
public:
    OutputInspectionPipeline(const PiiDetector&                  detector,
                             CrossUserClassifier&                classifier,
                             const PiiRedactor&                  redactor,
                             std::shared_ptr<SecurityEventStore> events,
                             PersistenceExecutor&                executor,
                             StructuredLogger*                   logger,
                             StatsCollector*                     stats,
                             FeatureFlags                        flags);

    ~OutputInspectionPipeline() = default;

    OutputInspectionPipeline(const OutputInspectionPipeline&)            = delete;
    OutputInspectionPipeline& operator=(const OutputInspectionPipeline&) = delete;
    OutputInspectionPipeline(OutputInspectionPipeline&&)                 = delete;
    OutputInspectionPipeline& operator=(OutputInspectionPipeline&&)      = delete;

    // ctx.input 은 사용하지 않는다. 검사 대상은 response.
    [[nodiscard]] OutputInspectionResult inspect(const InspectionContext& ctx,
                                                 std::string_view         response);

    // JSON 응답: 판정은 동일하고, REDACT 시 문자열 리프만 치환한다.
    [[nodiscard]] OutputInspectionResult inspect_json(const InspectionContext& ctx,
                                                      std::string_view         json_response);

    // BLOCK 이면 OutputBlockedError, 그 외 processed_text 반환
    [[nodiscard]] std::string inspect_or_throw(const InspectionContext& ctx,
                                               std::string_view         response);

private:
    [[nodiscard]] OutputInspectionResult run(const InspectionContext& ctx,
                                             std::string_view         response,
                                             bool                     json);

    // cross_user_count: OTHER_USER 매치 수 (감사 로그용)
    [[nodiscard]] OutputInspectionResult evaluate(const InspectionContext& ctx,
                                                  std::string_view         response,
                                                  bool                     json,
                                                  std::size_t&             cross_user_count);

    [[nodiscard]] std::string record_security_event(const InspectionContext&        ctx,
                                                    const std::vector<std::string>& pii_types,
                                                    const std::string&              response_hash);

    void audit(const InspectionContext&      ctx,
               std::string_view              response,
               const OutputInspectionResult& result,
               std::size_t                   cross_user_count) const;

    const PiiDetector&                  detector_;
    CrossUserClassifier&                classifier_;
    const PiiRedactor&                  redactor_;
    std::shared_ptr<SecurityEventStore> events_;
    PersistenceExecutor&                executor_;
    StructuredLogger*                   logger_;
    StatsCollector*                     stats_;
    FeatureFlags                        flags_;
};
