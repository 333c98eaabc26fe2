#pragma once

// ---------------------------------------------------------------------------
// input_gate.hpp
//
// 입력 검사 결과를 요청 게이팅 응답으로 바꾸는 집행 경계.
//
// [응답 매핑]
//   ALLOW    → 200, allowed=true
//   BLOCK    → 403, "Request blocked by security inspection"
//   ESCALATE → 202, 에스컬레이션 큐 등록 후 review_id 와 함께
//              "Your request requires additional review and will be processed shortly"
//
// [fail-close]
// 파이프라인에서 빠져나온 예외는 모두 BLOCK(403) 으로 처리한다.
// 사용자 메시지는 고정 문구이며 어떤 규칙이 발동했는지 노출하지 않는다.
//
// [우회]
// - INPUT_INSPECTION_ENABLED=false → 검사 없이 통과
// - 빈 입력 (공백만 포함) → 검사 없이 통과
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/feature_flags.hpp"
#include "input/inspection_pipeline.hpp"

#include <optional>
#include <string>
#include <string_view>

class EscalationQueue;
class StatsCollector;

inline constexpr std::string_view kBlockedMessage =
    "Request blocked by security inspection";
inline constexpr std::string_view kEscalatedMessage =
    "Your request requires additional review and will be processed shortly";

struct GateResponse {
    bool                            allowed{false};
    int                             status_code{403};
    InspectionDecision              decision{InspectionDecision::kBlock};
    std::string                     message{};
    std::string                     review_id{};
    std::string                     estimated_wait{};
    std::optional<InspectionResult> result{};  // 우회/예외 경로에서는 비어 있음
};

class InputGate {
public:
    // escalations / stats 는 nullptr 허용.
    // escalations 가 없으면 ESCALATE 는 review_id 없이 202 를 반환한다.
    InputGate(InputInspector&  inspector,
              EscalationQueue* escalations,
              StatsCollector*  stats,
              FeatureFlags     flags);

    ~InputGate() = default;

    InputGate(const InputGate&)            = delete;
    InputGate& operator=(const InputGate&) = delete;
    InputGate(InputGate&&)                 = delete;
    InputGate& operator=(InputGate&&)      = delete;

    // 예외를 던지지 않는다.
    [[nodiscard]] GateResponse handle(const InspectionContext& ctx) noexcept;

private:
    [[nodiscard]] GateResponse evaluate(const InspectionContext& ctx);

    InputInspector&  inspector_;
    EscalationQueue* escalations_;
    StatsCollector*  stats_;
    FeatureFlags     flags_;
};
