// ---------------------------------------------------------------------------
// command_dispatcher.cpp
// ---------------------------------------------------------------------------

#include "stats/command_dispatcher.hpp"

#include "escalation/escalation_queue.hpp"
#include "input/input_gate.hpp"
#include "output/output_inspection_pipeline.hpp"
#include "pii/cross_user_classifier.hpp"
#include "stats/stats_collector.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

using Json = nlohmann::json;

std::string make_ok_response(Json payload) {
    return Json{{"ok", true}, {"payload", std::move(payload)}}.dump();
}

std::string make_error_response(std::string_view msg, std::string_view code = {}) {
    Json out{{"ok", false}, {"error", std::string(msg)}};
    if (!code.empty()) {
        out["code"] = std::string(code);
    }
    return out.dump();
}

std::int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Json serialize_snapshot(const StatsSnapshot& s) {
    return Json{
        {"inputs_total", s.inputs_total},
        {"inputs_blocked", s.inputs_blocked},
        {"inputs_escalated", s.inputs_escalated},
        {"outputs_total", s.outputs_total},
        {"outputs_redacted", s.outputs_redacted},
        {"outputs_blocked", s.outputs_blocked},
        {"input_block_rate", s.input_block_rate},
        {"inspections_per_sec", s.inspections_per_sec},
        {"captured_at_ms", epoch_ms(s.captured_at)},
    };
}

Json serialize_factors(const FactorScores& f) {
    return Json{
        {"pattern_match", f.pattern_match},
        {"input_length", f.input_length},
        {"special_chars", f.special_chars},
        {"encoding", f.encoding},
        {"instruction", f.instruction},
    };
}

Json serialize_record(const EscalationRecord& r) {
    Json out{
        {"id", r.id},
        {"severity", std::string(to_string(r.severity))},
        {"status", std::string(to_string(r.status))},
        {"user_id", r.user_id},
        {"session_id", r.session_id},
        {"request_id", r.request_id},
        {"endpoint", r.endpoint},
        {"input_hash", r.input_hash},
        {"anomaly_score", r.anomaly_score},
        {"factors", serialize_factors(r.factors)},
        {"patterns_matched", r.patterns_matched},
        {"created_at_ms", epoch_ms(r.created_at)},
    };
    if (r.resolution) {
        out["resolution"]        = std::string(to_string(*r.resolution));
        out["reviewer"]          = r.reviewer;
        out["resolution_reason"] = r.resolution_reason;
    }
    if (r.resolved_at) {
        out["resolved_at_ms"] = epoch_ms(*r.resolved_at);
    }
    return out;
}

InspectionContext read_context(const Json& req) {
    return InspectionContext{
        .user_id    = req.value("user_id", std::string{}),
        .session_id = req.value("session_id", std::string{}),
        .request_id = req.value("request_id", std::string{}),
        .endpoint   = req.value("endpoint", std::string{}),
        .input      = req.value("input", std::string{}),
    };
}

std::string_view resolve_error_code(ResolveErrorCode code) noexcept {
    switch (code) {
        case ResolveErrorCode::kNotFound:        return "not_found";
        case ResolveErrorCode::kAlreadyResolved: return "already_resolved";
        case ResolveErrorCode::kStorageFailure:  return "storage_failure";
    }
    return "storage_failure";
}

std::string not_available(std::string_view cmd) {
    return make_error_response(fmt::format("command '{}' is not available", cmd), "unavailable");
}

}  // namespace

CommandDispatcher::CommandDispatcher(ControlPlane plane) : plane_(std::move(plane)) {}

std::string CommandDispatcher::dispatch(std::string_view request_json) const {
    const Json req = Json::parse(request_json, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
        spdlog::warn("[uds_server] dispatch: malformed request JSON");
        return make_error_response("malformed request JSON");
    }
    const auto cmd_it = req.find("command");
    if (cmd_it == req.end() || !cmd_it->is_string()) {
        spdlog::warn("[uds_server] dispatch: missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }
    const std::string cmd = cmd_it->get<std::string>();

    try {
        if (cmd == "stats") {
            if (!plane_.stats) { return not_available(cmd); }
            return make_ok_response(serialize_snapshot(plane_.stats->snapshot()));
        }

        if (cmd == "inspect_input") {
            if (!plane_.input_gate) { return not_available(cmd); }
            const GateResponse r = plane_.input_gate->handle(read_context(req));
            Json payload{
                {"allowed", r.allowed},
                {"status_code", r.status_code},
                {"decision", std::string(to_string(r.decision))},
                {"message", r.message},
            };
            if (!r.review_id.empty()) {
                payload["review_id"]      = r.review_id;
                payload["estimated_wait"] = r.estimated_wait;
            }
            if (r.result) {
                payload["confidence"]       = r.result->confidence;
                payload["anomaly_score"]    = r.result->reasoning.anomaly_score;
                payload["patterns_matched"] = r.result->reasoning.patterns_matched;
                payload["input_hash"]       = r.result->metadata.input_hash;
                payload["active_flags"]     = r.result->metadata.active_flags;
                payload["processing_time_ms"] = r.result->metadata.processing_time_ms;
            }
            return make_ok_response(std::move(payload));
        }

        if (cmd == "inspect_output") {
            if (!plane_.output_pipeline) { return not_available(cmd); }
            const InspectionContext ctx      = read_context(req);
            const std::string       response = req.value("response", std::string{});
            const bool              as_json  = req.value("json", false);
            const OutputInspectionResult r = as_json
                ? plane_.output_pipeline->inspect_json(ctx, response)
                : plane_.output_pipeline->inspect(ctx, response);

            Json payload{
                {"decision", std::string(to_string(r.decision))},
                {"pii_types", r.pii_types},
                {"pii_found", r.pii_found},
                {"cross_user_detected", r.cross_user_detected},
                {"redaction_count", r.summary.total},
                {"redactions_by_type", r.summary.by_type},
                {"characters_redacted", r.summary.characters_redacted},
                {"response_hash", r.response_hash},
            };
            if (r.decision == OutputDecision::kBlock) {
                payload["message"]           = std::string(kOutputBlockedMessage);
                payload["security_event_id"] = r.security_event_id;
            } else {
                payload["processed_text"] = r.processed_text;
            }
            return make_ok_response(std::move(payload));
        }

        if (cmd == "escalations") {
            if (!plane_.escalations) { return not_available(cmd); }
            const auto limit = req.value("limit", std::size_t{50});
            auto listed = plane_.escalations->list_pending(limit);
            if (!listed) {
                return make_error_response(listed.error(), "storage_failure");
            }
            Json items = Json::array();
            for (const auto& r : *listed) {
                items.push_back(serialize_record(r));
            }
            return make_ok_response(std::move(items));
        }

        if (cmd == "escalation") {
            if (!plane_.escalations) { return not_available(cmd); }
            const std::string id = req.value("id", std::string{});
            auto found = plane_.escalations->find(id);
            if (!found) {
                return make_error_response(found.error(), "storage_failure");
            }
            if (!found->has_value()) {
                return make_error_response(fmt::format("review '{}' not found", id), "not_found");
            }
            return make_ok_response(serialize_record(**found));
        }

        if (cmd == "resolve") {
            if (!plane_.escalations) { return not_available(cmd); }
            const auto resolution = parse_resolution(req.value("resolution", std::string{}));
            if (!resolution) {
                return make_error_response("resolution must be APPROVE, REJECT or DISMISS",
                                           "invalid_argument");
            }
            const std::string reviewer = req.value("reviewer", std::string{});
            if (reviewer.empty()) {
                return make_error_response("reviewer is required", "invalid_argument");
            }
            auto resolved = plane_.escalations->resolve(
                req.value("id", std::string{}), *resolution, reviewer,
                req.value("reason", std::string{}));
            if (!resolved) {
                return make_error_response(resolved.error().message,
                                           std::string(resolve_error_code(resolved.error().code)));
            }
            return make_ok_response(serialize_record(*resolved));
        }

        if (cmd == "escalation_stats") {
            if (!plane_.escalations) { return not_available(cmd); }
            auto stats = plane_.escalations->stats();
            if (!stats) {
                return make_error_response(stats.error(), "storage_failure");
            }
            return make_ok_response(Json{
                {"pending", stats->pending},
                {"resolved", stats->resolved},
                {"pending_by_severity", stats->pending_by_severity},
                {"resolved_by_resolution", stats->resolved_by_resolution},
            });
        }

        if (cmd == "reload") {
            if (!plane_.reload) { return not_available(cmd); }
            auto reloaded = plane_.reload();
            if (!reloaded) {
                return make_error_response(reloaded.error(), "reload_failed");
            }
            return make_ok_response(Json{{"reloaded", true}});
        }

        if (cmd == "invalidate_user") {
            if (!plane_.classifier) { return not_available(cmd); }
            const std::string user_id = req.value("user_id", std::string{});
            if (user_id.empty()) {
                return make_error_response("user_id is required", "invalid_argument");
            }
            plane_.classifier->invalidate_user(user_id);
            return make_ok_response(Json{{"invalidated", user_id}});
        }
    } catch (const std::exception& e) {
        // 잘못된 필드 타입(nlohmann type_error) 등
        spdlog::warn("[uds_server] dispatch: command '{}' failed: {}", cmd, e.what());
        return make_error_response(fmt::format("command '{}' failed", cmd));
    }

    spdlog::warn("[uds_server] dispatch: unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}
