// ---------------------------------------------------------------------------
// input_gate.cpp
// ---------------------------------------------------------------------------

#include "input/input_gate.hpp"

#include "common/text_util.hpp"
#include "escalation/escalation_queue.hpp"
#include "stats/stats_collector.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

GateResponse pass_through() {
    return GateResponse{
        .allowed     = true,
        .status_code = 200,
        .decision    = InspectionDecision::kAllow,
    };
}

GateResponse blocked_response() {
    return GateResponse{
        .allowed     = false,
        .status_code = 403,
        .decision    = InspectionDecision::kBlock,
        .message     = std::string(kBlockedMessage),
    };
}

}  // namespace

InputGate::InputGate(InputInspector&  inspector,
                     EscalationQueue* escalations,
                     StatsCollector*  stats,
                     FeatureFlags     flags)
    : inspector_(inspector)
    , escalations_(escalations)
    , stats_(stats)
    , flags_(flags)
{}

GateResponse InputGate::handle(const InspectionContext& ctx) noexcept {
    if (!flags_.input_inspection_enabled) {
        return pass_through();
    }
    if (trim(ctx.input).empty()) {
        return pass_through();
    }

    try {
        GateResponse response = evaluate(ctx);
        if (stats_) {
            stats_->on_input(response.decision);
        }
        return response;
    } catch (const std::exception& e) {
        // [fail-close] 예외 메시지는 진단 로그에만 남긴다.
        spdlog::error("input_gate: inspection failed for request {}, blocking: {}",
                      ctx.request_id, e.what());
    }

    if (stats_) {
        stats_->on_input(InspectionDecision::kBlock);
    }
    return blocked_response();
}

GateResponse InputGate::evaluate(const InspectionContext& ctx) {
    InspectionResult result = inspector_.inspect(ctx);

    switch (result.decision) {
        case InspectionDecision::kAllow: {
            GateResponse response = pass_through();
            response.result = std::move(result);
            return response;
        }
        case InspectionDecision::kEscalate: {
            GateResponse response{
                .allowed     = false,
                .status_code = 202,
                .decision    = InspectionDecision::kEscalate,
                .message     = std::string(kEscalatedMessage),
            };
            if (escalations_) {
                const FactorScores factors = result.reasoning.factors
                    ? to_factor_scores(*result.reasoning.factors)
                    : FactorScores{};
                const EscalationTicket ticket = escalations_->escalate(
                    ctx, result.metadata.input_hash, result.reasoning.anomaly_score,
                    factors, result.reasoning.patterns_matched);
                response.review_id      = ticket.review_id;
                response.estimated_wait = ticket.estimated_wait;
            }
            response.result = std::move(result);
            return response;
        }
        case InspectionDecision::kBlock:
            break;
    }

    GateResponse response = blocked_response();
    response.result = std::move(result);
    return response;
}
