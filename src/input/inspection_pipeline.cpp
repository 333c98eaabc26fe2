// ---------------------------------------------------------------------------
// inspection_pipeline.cpp
// ---------------------------------------------------------------------------

#include "input/inspection_pipeline.hpp"

#include "common/content_hash.hpp"
#include "common/text_util.hpp"
#include "logger/structured_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <spdlog/spdlog.h>

FactorScores to_factor_scores(const FactorBreakdown& f) noexcept {
    return FactorScores{
        .pattern_match = f.pattern_match.score,
        .input_length  = f.input_length.score,
        .special_chars = f.special_chars.score,
        .encoding      = f.encoding.score,
        .instruction   = f.instruction.score,
    };
}

InputInspectionPipeline::InputInspectionPipeline(const ListChecker&    lists,
                                                 const PatternMatcher& patterns,
                                                 const AnomalyScorer&  scorer,
                                                 StructuredLogger*     logger,
                                                 FeatureFlags          flags)
    : lists_(lists)
    , patterns_(patterns)
    , scorer_(scorer)
    , logger_(logger)
    , flags_(flags)
{}

double InputInspectionPipeline::confidence_for_score(double score) noexcept {
    return std::clamp(std::abs(score - 0.5) * 2.0, 0.0, 1.0);
}

// ---------------------------------------------------------------------------
// inspect
// ---------------------------------------------------------------------------
InspectionResult InputInspectionPipeline::inspect(const InspectionContext& ctx) {
    const auto started = std::chrono::steady_clock::now();

    InspectionResult result;
    result.metadata.input_hash   = sha256_hex(ctx.input);
    result.metadata.active_flags = flags_.active_names();

    // Stage 0: 목록 단락 평가
    const ListCheckResult listed = lists_.check(ctx.input);
    if (listed.matched && listed.decision) {
        const double score = (*listed.decision == InspectionDecision::kBlock) ? 1.0 : 0.0;
        result.decision                   = *listed.decision;
        result.confidence                 = confidence_for_score(score);
        result.reasoning.anomaly_score    = score;
        result.reasoning.list_id          = listed.list_id;
    } else {
        // Stage 1 / 2
        const std::vector<PatternMatch> matches = patterns_.match(ctx.input);
        const AnomalyScore              scored  = scorer_.score(ctx.input, matches);

        // Stage 3
        result.decision                = scored.decision;
        result.confidence              = confidence_for_score(scored.value);
        result.reasoning.anomaly_score = scored.value;
        result.reasoning.factors       = scored.factors;
        result.reasoning.patterns_matched.reserve(matches.size());
        for (const auto& m : matches) {
            result.reasoning.patterns_matched.push_back(m.pattern_id);
        }
    }

    result.metadata.processing_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();

    spdlog::debug("input_pipeline: request {} decision={} score={:.3f}",
                  ctx.request_id, to_string(result.decision), result.reasoning.anomaly_score);

    audit(ctx, result);
    return result;
}

// ---------------------------------------------------------------------------
// audit
//   감사 라인 1건 + BLOCK/ESCALATE 보안 이벤트.
// ---------------------------------------------------------------------------
void InputInspectionPipeline::audit(const InspectionContext& ctx,
                                    const InspectionResult&  result) const {
    if (logger_ == nullptr) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::duration<double, std::milli>(result.metadata.processing_time_ms));

    InputAuditLog entry{
        .request_id       = ctx.request_id,
        .user_id          = ctx.user_id,
        .session_id       = ctx.session_id,
        .endpoint         = ctx.endpoint,
        .input_hash       = result.metadata.input_hash,
        .input_length     = utf8_length(ctx.input),
        .decision         = result.decision,
        .confidence       = result.confidence,
        .anomaly_score    = result.reasoning.anomaly_score,
        .patterns_matched = result.reasoning.patterns_matched,
        .factors          = std::nullopt,
        .list_id          = result.reasoning.list_id,
        .timestamp        = now,
        .duration         = duration,
    };
    if (result.reasoning.factors) {
        entry.factors = to_factor_scores(*result.reasoning.factors);
    }
    logger_->log_input_inspection(entry);

    if (result.decision == InspectionDecision::kAllow) {
        return;
    }

    const bool blocked = result.decision == InspectionDecision::kBlock;
    logger_->log_security_event(SecurityEventLog{
        .event        = blocked ? "input_blocked" : "input_escalated",
        .severity     = blocked ? "HIGH" : "MEDIUM",
        .request_id   = ctx.request_id,
        .user_id      = ctx.user_id,
        .session_id   = ctx.session_id,
        .endpoint     = ctx.endpoint,
        .content_hash = result.metadata.input_hash,
        .score        = result.reasoning.anomaly_score,
        .tags         = result.reasoning.patterns_matched,
        .timestamp    = now,
    });
}
