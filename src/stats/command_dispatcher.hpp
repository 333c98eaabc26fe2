#pragma once

// ---------------------------------------------------------------------------
// command_dispatcher.hpp
//
// 제어 소켓 JSON 커맨드 디스패처. UdsServer 가 프레임을 읽어 dispatch() 에
// 넘기고, 반환된 JSON 문자열을 그대로 응답 프레임으로 보낸다.
//
// [응답 형식]
//   성공: {"ok":true, "payload":{...}}
//   실패: {"ok":false,"error":"<메시지>"[,"code":"<분류>"]}
//
// [지원 커맨드]
//   "stats"            : StatsSnapshot
//   "inspect_input"    : InputGate 응답 (user_id, session_id, request_id, endpoint, input)
//   "inspect_output"   : 출력 검사 결과 (..., response, json)
//   "escalations"      : 대기 중 리뷰 목록 (limit, 기본 50)
//   "escalation"       : 리뷰 단건 (id)
//   "resolve"          : 리뷰 해결 (id, resolution, reviewer, reason)
//   "escalation_stats" : 상태/심각도별 집계
//   "reload"           : 규칙 파일 재로드
//   "invalidate_user"  : 사용자 식별자 캐시 무효화 (user_id)
//
// 구성 요소 포인터가 nullptr 이면 해당 커맨드는 "not available" 에러.
// 응답에는 입력/응답 원문이나 PII 값이 포함되지 않는다 (inspect_output 의
// processed_text 는 이미 치환된 텍스트).
// ---------------------------------------------------------------------------

#include <expected>
#include <functional>
#include <string>
#include <string_view>

class CrossUserClassifier;
class EscalationQueue;
class InputGate;
class OutputInspectionPipeline;
class StatsCollector;

struct ControlPlane {
    StatsCollector*           stats{nullptr};
    InputGate*                input_gate{nullptr};
    OutputInspectionPipeline* output_pipeline{nullptr};
    EscalationQueue*          escalations{nullptr};
    CrossUserClassifier*      classifier{nullptr};
    std::function<std::expected<void, std::string>()> reload{};
};

class CommandDispatcher {
public:
    explicit CommandDispatcher(ControlPlane plane);

    ~CommandDispatcher() = default;

    CommandDispatcher(const CommandDispatcher&)            = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;
    CommandDispatcher(CommandDispatcher&&)                 = delete;
    CommandDispatcher& operator=(CommandDispatcher&&)      = delete;

    // dispatch
    //   요청 JSON → 응답 JSON. 예외를 던지지 않는다.
    [[nodiscard]] std::string dispatch(std::string_view request_json) const;

private:
    ControlPlane plane_;
};
