// ---------------------------------------------------------------------------
// output_inspection_pipeline.cpp
// ---------------------------------------------------------------------------

#include "output/output_inspection_pipeline.hpp"

#include "common/content_hash.hpp"
#include "logger/structured_logger.hpp"
#include "stats/stats_collector.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kResponseHashPrefix = 16;

[[nodiscard]] bool must_block(const CrossUserMatch& c) noexcept {
    if (c.pii.type == PiiType::kSsn || c.pii.type == PiiType::kCreditCard) {
        return true;
    }
    return c.ownership == Ownership::kOtherUser && c.confidence == Confidence::kHigh;
}

// 첫 등장 순서를 유지한 유형 목록
[[nodiscard]] std::vector<std::string> distinct_types(const std::vector<PiiMatch>& matches) {
    std::vector<std::string> out;
    for (const auto& m : matches) {
        std::string t(to_string(m.type));
        if (std::find(out.begin(), out.end(), t) == out.end()) {
            out.push_back(std::move(t));
        }
    }
    return out;
}

[[nodiscard]] OutputOutcome to_outcome(OutputDecision d) noexcept {
    switch (d) {
        case OutputDecision::kAllow:  return OutputOutcome::kAllowed;
        case OutputDecision::kRedact: return OutputOutcome::kRedacted;
        case OutputDecision::kBlock:  return OutputOutcome::kBlocked;
    }
    return OutputOutcome::kBlocked;
}

}  // namespace

std::string_view to_string(OutputDecision d) noexcept {
    switch (d) {
        case OutputDecision::kAllow:  return "ALLOW";
        case OutputDecision::kRedact: return "REDACT";
        case OutputDecision::kBlock:  return "BLOCK";
    }
    return "BLOCK";
}

OutputInspectionPipeline::OutputInspectionPipeline(const PiiDetector&                  detector,
                                                   CrossUserClassifier&                classifier,
                                                   const PiiRedactor&                  redactor,
                                                   std::shared_ptr<SecurityEventStore> events,
                                                   PersistenceExecutor&                executor,
                                                   StructuredLogger*                   logger,
                                                   StatsCollector*                     stats,
                                                   FeatureFlags                        flags)
    : detector_(detector)
    , classifier_(classifier)
    , redactor_(redactor)
    , events_(std::move(events))
    , executor_(executor)
    , logger_(logger)
    , stats_(stats)
    , flags_(flags)
{
    if (!events_) {
        throw std::invalid_argument("OutputInspectionPipeline: event store must not be null");
    }
}

OutputInspectionResult OutputInspectionPipeline::inspect(const InspectionContext& ctx,
                                                         std::string_view         response) {
    return run(ctx, response, false);
}

OutputInspectionResult OutputInspectionPipeline::inspect_json(const InspectionContext& ctx,
                                                              std::string_view         json_response) {
    return run(ctx, json_response, true);
}

std::string OutputInspectionPipeline::inspect_or_throw(const InspectionContext& ctx,
                                                       std::string_view         response) {
    OutputInspectionResult result = inspect(ctx, response);
    if (result.decision == OutputDecision::kBlock) {
        throw OutputBlockedError(result.security_event_id);
    }
    return std::move(result.processed_text);
}

// ---------------------------------------------------------------------------
// run
//   플래그 확인, 예외 → BLOCK 변환, 통계/감사.
// ---------------------------------------------------------------------------
OutputInspectionResult OutputInspectionPipeline::run(const InspectionContext& ctx,
                                                     std::string_view         response,
                                                     bool                     json) {
    if (!flags_.output_inspection_enabled) {
        return OutputInspectionResult{
            .decision       = OutputDecision::kAllow,
            .processed_text = std::string(response),
        };
    }

    const auto started = std::chrono::steady_clock::now();
    std::size_t cross_user_count = 0;

    OutputInspectionResult result;
    try {
        result = evaluate(ctx, response, json, cross_user_count);
    } catch (const std::exception& e) {
        // [fail-close] 원문을 내보내지 않는다.
        spdlog::error("output_pipeline: inspection failed for request {}, blocking: {}",
                      ctx.request_id, e.what());
        result = OutputInspectionResult{.decision = OutputDecision::kBlock};
    }

    result.processing_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();

    if (stats_) {
        stats_->on_output(to_outcome(result.decision));
    }
    audit(ctx, response, result, cross_user_count);
    return result;
}

// ---------------------------------------------------------------------------
// evaluate
// ---------------------------------------------------------------------------
OutputInspectionResult OutputInspectionPipeline::evaluate(const InspectionContext& ctx,
                                                          std::string_view         response,
                                                          bool                     json,
                                                          std::size_t&             cross_user_count) {
    OutputInspectionResult result;
    result.response_hash = sha256_hex_prefix(response, kResponseHashPrefix);

    const std::vector<PiiMatch> matches = detector_.detect(response);
    result.pii_found = matches.size();
    if (matches.empty()) {
        result.decision       = OutputDecision::kAllow;
        result.processed_text = std::string(response);
        return result;
    }
    result.pii_types = distinct_types(matches);

    const std::vector<CrossUserMatch> classified = classifier_.classify(matches, ctx.user_id);
    cross_user_count = static_cast<std::size_t>(std::count_if(
        classified.begin(), classified.end(),
        [](const CrossUserMatch& c) { return c.ownership == Ownership::kOtherUser; }));
    result.cross_user_detected = cross_user_count > 0;

    if (std::any_of(classified.begin(), classified.end(), must_block)) {
        result.decision          = OutputDecision::kBlock;
        result.security_event_id = record_security_event(ctx, result.pii_types,
                                                         result.response_hash);
        return result;
    }

    RedactionResult redacted = json ? redactor_.redact_json(response)
                                    : redactor_.redact(response, matches);
    // PII 가 있으면 임계값 미만이라 치환된 것이 없어도 REDACT
    result.decision       = OutputDecision::kRedact;
    result.processed_text = std::move(redacted.text);
    result.summary        = std::move(redacted.summary);
    return result;
}

// ---------------------------------------------------------------------------
// record_security_event
//   저장 → 경보 → alert_sent 갱신. 저장 실패는 판정에 영향을 주지 않는다.
// ---------------------------------------------------------------------------
std::string OutputInspectionPipeline::record_security_event(
    const InspectionContext&        ctx,
    const std::vector<std::string>& pii_types,
    const std::string&              response_hash) {
    thread_local boost::uuids::random_generator gen;

    SecurityEventRecord record{
        .id            = boost::uuids::to_string(gen()),
        .user_id       = ctx.user_id,
        .session_id    = ctx.session_id,
        .request_id    = ctx.request_id,
        .endpoint      = ctx.endpoint,
        .pii_types     = pii_types,
        .response_hash = response_hash,
        .created_at    = std::chrono::system_clock::now(),
    };

    bool persisted = true;
    auto created = executor_.run("security event create",
        [store = events_, record]() { return store->create(record); });
    if (!created) {
        persisted = false;
        record.id = "blocked-" + boost::uuids::to_string(gen());
        spdlog::error("output_pipeline: failed to persist security event (tracking id {}): {}",
                      record.id, created.error());
    } else {
        record.id = *created;
    }

    // 경보
    spdlog::critical("output_pipeline: ALERT cross-user data blocked event={} user={} types=[{}]",
                     record.id, ctx.user_id, fmt::join(pii_types, ","));
    if (logger_) {
        logger_->log_security_event(SecurityEventLog{
            .event        = "cross_user_data_blocked",
            .severity     = "CRITICAL",
            .request_id   = ctx.request_id,
            .user_id      = ctx.user_id,
            .session_id   = ctx.session_id,
            .endpoint     = ctx.endpoint,
            .content_hash = response_hash,
            .event_id     = record.id,
            .score        = 1.0,
            .tags         = pii_types,
            .timestamp    = record.created_at,
        });
    }

    if (persisted) {
        record.alert_sent = true;
        auto updated = executor_.run("security event update",
            [store = events_, record]() { return store->update(record); });
        if (!updated) {
            spdlog::warn("output_pipeline: failed to mark alert sent for event {}: {}",
                         record.id, updated.error());
        }
    }
    return record.id;
}

void OutputInspectionPipeline::audit(const InspectionContext&      ctx,
                                     std::string_view              response,
                                     const OutputInspectionResult& result,
                                     std::size_t                   cross_user_count) const {
    if (logger_ == nullptr) {
        return;
    }
    logger_->log_output_inspection(OutputAuditLog{
        .request_id             = ctx.request_id,
        .user_id                = ctx.user_id,
        .session_id             = ctx.session_id,
        .endpoint               = ctx.endpoint,
        .response_hash          = result.response_hash,
        .response_length        = response.size(),
        .decision               = std::string(to_string(result.decision)),
        .pii_types              = result.pii_types,
        .pii_match_count        = result.pii_found,
        .redaction_count        = result.summary.total,
        .redactions_by_type     = result.summary.by_type,
        .cross_user_detected    = result.cross_user_detected,
        .cross_user_match_count = cross_user_count,
        .security_event_id      = result.security_event_id,
        .timestamp              = std::chrono::system_clock::now(),
        .duration               = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::duration<double, std::milli>(result.processing_time_ms)),
    });
}
