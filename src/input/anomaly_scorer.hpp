#pragma once

// ---------------------------------------------------------------------------
// anomaly_scorer.hpp
//
// 패턴 매치와 독립 휴리스틱 4종을 합산해 0~1 위험 점수와 판정을 만든다.
// 파이프라인 Stage 2.
//
// [요인 (합산 후 1.0 으로 상한)]
// 1. pattern_match        : 심각도 가중치 내림차순, 항마다 diminishing_rate 배로 감쇠
// 2. input_length         : 정상 범위 밖에서 선형 보간, 극단값 이후 최대
// 3. special_char_density : 위험 문자 밀도가 threshold 를 넘는 만큼 선형 증가
// 4. encoding_detection   : base64 / 유니코드·hex 이스케이프 / 중첩 URL 인코딩.
//                           발생 횟수가 아니라 탐지된 "기법 수"에 비례
// 5. instruction_language : 명령형 동사(+1), AI 지시 문구(+2), 조건어(+0.5)
//
// 각 요인은 max_contribution 으로 상한이 있으므로 입력 크기와 무관하게
// 점수 계산 비용과 값이 제한된다.
//
// [판정]
// score >= block → BLOCK, score >= escalate → ESCALATE, 그 외 ALLOW.
// 파이프라인도 이 임계값을 그대로 사용한다 (임계값 출처는 하나).
//
// [fallback]
// 규칙 파일 로드 실패 시 내장 기본값(AnomalyRules{})을 사용한다.
// score() 자체는 실패하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/rules.hpp"
#include "input/pattern_matcher.hpp"

#include <atomic>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct FactorScore {
    double      score{0.0};
    std::string details{};  // 감사 로그용 요약 (입력 원문 미포함)
};

struct FactorBreakdown {
    FactorScore pattern_match{};
    FactorScore input_length{};
    FactorScore special_chars{};
    FactorScore encoding{};
    FactorScore instruction{};
};

struct AnomalyScore {
    double             value{0.0};  // [0, 1]
    FactorBreakdown    factors{};
    InspectionDecision decision{InspectionDecision::kAllow};
};

class AnomalyScorer {
public:
    // 내장 기본 규칙으로 시작한다.
    AnomalyScorer();
    explicit AnomalyScorer(const AnomalyRules& rules);

    ~AnomalyScorer() = default;

    AnomalyScorer(const AnomalyScorer&)            = delete;
    AnomalyScorer& operator=(const AnomalyScorer&) = delete;
    AnomalyScorer(AnomalyScorer&&)                 = delete;
    AnomalyScorer& operator=(AnomalyScorer&&)      = delete;

    // load
    //   실패 시 내장 기본값으로 교체하고 에러를 반환한다.
    std::expected<void, std::string> load(const std::filesystem::path& path);

    void apply(const AnomalyRules& rules);

    [[nodiscard]] AnomalyScore score(std::string_view                 input,
                                     const std::vector<PatternMatch>& patterns) const;

    [[nodiscard]] AnomalyThresholds thresholds() const;

    // decide
    //   임계값 비교만 수행하는 순수 함수. block 이 escalate 보다 먼저 검사된다.
    [[nodiscard]] static InspectionDecision decide(double                   score,
                                                   const AnomalyThresholds& t) noexcept;

private:
    struct Snapshot;

    [[nodiscard]] static std::shared_ptr<const Snapshot> build(const AnomalyRules& rules);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
};
