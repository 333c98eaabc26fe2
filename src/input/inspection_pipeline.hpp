#pragma once

// ---------------------------------------------------------------------------
// inspection_pipeline.hpp
//
// 입력 검사 오케스트레이터.
//
// [단계 (순서 고정: 각 단계가 이전 단계 결과를 소비한다)]
// Stage 0: ListChecker     → 매칭 시 즉시 판정 (단락 평가)
// Stage 1: PatternMatcher  → 공격 패턴 매치 목록
// Stage 2: AnomalyScorer   → 0~1 점수 + 판정
// Stage 3: 판정 확정, confidence = |score - 0.5| * 2
//
// [감사]
// - 모든 호출(단락 평가 포함)은 input_inspection 감사 라인 1건을 남긴다.
// - BLOCK / ESCALATE 는 보안 이벤트 라인을 추가로 남긴다.
// - 입력 원문은 SHA-256 해시로만 기록한다.
//
// [예외]
// inspect() 는 내부 오류(해시 실패, 정규식 실행 예외 등)를 잡지 않는다.
// 호출 경계(InputGate)가 fail-close 로 처리한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/feature_flags.hpp"
#include "input/anomaly_scorer.hpp"
#include "input/list_checker.hpp"
#include "input/pattern_matcher.hpp"

#include <optional>
#include <string>
#include <vector>

class StructuredLogger;

struct InspectionReasoning {
    std::vector<std::string>       patterns_matched{};  // 패턴 ID (단락 평가 시 목록 ID)
    double                         anomaly_score{0.0};
    std::optional<FactorBreakdown> factors{};           // 단락 평가 시 비어 있음
    std::string                    list_id{};
};

struct InspectionMetadata {
    double                   processing_time_ms{0.0};
    std::vector<std::string> active_flags{};
    std::string              input_hash{};
};

struct InspectionResult {
    InspectionDecision  decision{InspectionDecision::kBlock};
    double              confidence{0.0};  // [0, 1]
    InspectionReasoning reasoning{};
    InspectionMetadata  metadata{};
};

// 감사 로그/에스컬레이션 레코드용 점수 값만 추린다
[[nodiscard]] FactorScores to_factor_scores(const FactorBreakdown& f) noexcept;

// ---------------------------------------------------------------------------
// InputInspector
//   InputGate 가 의존하는 검사기 인터페이스. 테스트에서 예외를 던지는
//   대역으로 교체해 fail-close 경로를 검증한다.
// ---------------------------------------------------------------------------
class InputInspector {
public:
    virtual ~InputInspector() = default;

    [[nodiscard]] virtual InspectionResult inspect(const InspectionContext& ctx) = 0;
};

class InputInspectionPipeline final : public InputInspector {
public:
    // 구성 요소는 호출자 소유. 파이프라인보다 오래 살아야 한다.
    InputInspectionPipeline(const ListChecker&    lists,
                            const PatternMatcher& patterns,
                            const AnomalyScorer&  scorer,
                            StructuredLogger*     logger,
                            FeatureFlags          flags);

    ~InputInspectionPipeline() override = default;

    InputInspectionPipeline(const InputInspectionPipeline&)            = delete;
    InputInspectionPipeline& operator=(const InputInspectionPipeline&) = delete;
    InputInspectionPipeline(InputInspectionPipeline&&)                 = delete;
    InputInspectionPipeline& operator=(InputInspectionPipeline&&)      = delete;

    [[nodiscard]] InspectionResult inspect(const InspectionContext& ctx) override;

    // |score - 0.5| * 2, [0, 1] 로 클램프
    [[nodiscard]] static double confidence_for_score(double score) noexcept;

private:
    void audit(const InspectionContext& ctx, const InspectionResult& result) const;

    const ListChecker&    lists_;
    const PatternMatcher& patterns_;
    const AnomalyScorer&  scorer_;
    StructuredLogger*     logger_;
    FeatureFlags          flags_;
};
