// ---------------------------------------------------------------------------
// escalation_queue.cpp
// ---------------------------------------------------------------------------

#include "escalation/escalation_queue.hpp"

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::string make_uuid() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

}  // namespace

EscalationQueue::EscalationQueue(std::shared_ptr<EscalationStore> store,
                                 PersistenceExecutor&             executor,
                                 StructuredLogger*                logger)
    : store_(std::move(store))
    , executor_(executor)
    , logger_(logger)
{
    if (!store_) {
        throw std::invalid_argument("EscalationQueue: store must not be null");
    }
}

Severity EscalationQueue::severity_for_score(double score) noexcept {
    if (score >= 0.6) {
        return Severity::kHigh;
    }
    if (score >= 0.45) {
        return Severity::kMedium;
    }
    return Severity::kLow;
}

// ---------------------------------------------------------------------------
// escalate
// ---------------------------------------------------------------------------
EscalationTicket EscalationQueue::escalate(const InspectionContext&        ctx,
                                           const std::string&              input_hash,
                                           double                          anomaly_score,
                                           const FactorScores&             factors,
                                           const std::vector<std::string>& patterns_matched) {
    EscalationRecord record{
        .id               = make_uuid(),
        .severity         = severity_for_score(anomaly_score),
        .status           = EscalationStatus::kPending,
        .resolution       = std::nullopt,
        .user_id          = ctx.user_id,
        .session_id       = ctx.session_id,
        .request_id       = ctx.request_id,
        .endpoint         = ctx.endpoint,
        .input_hash       = input_hash,
        .anomaly_score    = anomaly_score,
        .factors          = factors,
        .patterns_matched = patterns_matched,
        .created_at       = std::chrono::system_clock::now(),
    };

    EscalationTicket ticket{
        .review_id = record.id,
        .status    = EscalationStatus::kPending,
        .severity  = record.severity,
    };

    // 람다는 store_ 와 record 를 값으로 캡처한다. 시간 초과 후에도 쓰기가
    // 백그라운드에서 계속되기 때문이다.
    auto created = executor_.run("escalation create",
        [store = store_, record]() -> std::expected<std::string, std::string> {
            return store->create(record);
        });

    if (!created) {
        ticket.review_id = "ephemeral-" + make_uuid();
        ticket.persisted = false;
        spdlog::error("escalation: failed to persist review record (tracking id {}): {}",
                      ticket.review_id, created.error());
    } else {
        ticket.review_id = *created;
    }

    if (logger_) {
        logger_->log_escalation(EscalationLog{
            .event     = "escalation_created",
            .review_id = ticket.review_id,
            .severity  = std::string(to_string(ticket.severity)),
            .status    = std::string(to_string(ticket.status)),
            .persisted = ticket.persisted,
            .timestamp = record.created_at,
        });
    }
    return ticket;
}

// ---------------------------------------------------------------------------
// list_pending
// ---------------------------------------------------------------------------
std::expected<std::vector<EscalationRecord>, std::string>
EscalationQueue::list_pending(std::size_t limit) {
    auto listed = executor_.run("escalation list",
        [store = store_]() -> std::expected<std::vector<EscalationRecord>, std::string> {
            return store->list(EscalationStatus::kPending);
        });
    if (!listed) {
        spdlog::error("escalation: list pending failed: {}", listed.error());
        return std::unexpected(listed.error());
    }

    auto records = std::move(*listed);
    std::stable_sort(records.begin(), records.end(),
        [](const EscalationRecord& a, const EscalationRecord& b) {
            if (a.severity != b.severity) {
                return static_cast<int>(a.severity) > static_cast<int>(b.severity);
            }
            return a.created_at < b.created_at;
        });

    if (limit > 0 && records.size() > limit) {
        records.resize(limit);
    }
    return records;
}

std::expected<std::optional<EscalationRecord>, std::string>
EscalationQueue::find(const std::string& review_id) {
    auto found = executor_.run("escalation find",
        [store = store_, review_id]() { return store->find(review_id); });
    if (!found) {
        spdlog::error("escalation: find {} failed: {}", review_id, found.error());
    }
    return found;
}

// ---------------------------------------------------------------------------
// resolve
// ---------------------------------------------------------------------------
std::expected<EscalationRecord, ResolveError>
EscalationQueue::resolve(const std::string& review_id,
                         Resolution         resolution,
                         const std::string& reviewer,
                         const std::string& reason) {
    std::lock_guard lock(resolve_mutex_);

    auto found = executor_.run("escalation find",
        [store = store_, review_id]() { return store->find(review_id); });
    if (!found) {
        return std::unexpected(ResolveError{ResolveErrorCode::kStorageFailure, found.error()});
    }
    if (!found->has_value()) {
        return std::unexpected(ResolveError{
            ResolveErrorCode::kNotFound,
            fmt::format("review '{}' not found", review_id)});
    }

    EscalationRecord record = std::move(**found);
    if (record.status == EscalationStatus::kResolved) {
        return std::unexpected(ResolveError{
            ResolveErrorCode::kAlreadyResolved,
            fmt::format("review '{}' is already resolved", review_id)});
    }

    const auto now = std::chrono::system_clock::now();
    record.status            = EscalationStatus::kResolved;
    record.resolution        = resolution;
    record.reviewer          = reviewer;
    record.resolution_reason = reason;
    record.resolved_at       = now;

    auto updated = executor_.run("escalation update",
        [store = store_, record]() { return store->update(record); });
    if (!updated) {
        spdlog::error("escalation: resolve {} failed: {}", review_id, updated.error());
        return std::unexpected(ResolveError{ResolveErrorCode::kStorageFailure, updated.error()});
    }

    if (logger_) {
        logger_->log_escalation(EscalationLog{
            .event      = "escalation_resolved",
            .review_id  = record.id,
            .severity   = std::string(to_string(record.severity)),
            .status     = std::string(to_string(record.status)),
            .resolution = std::string(to_string(resolution)),
            .reviewer   = reviewer,
            .persisted  = true,
            .timestamp  = now,
        });
    }
    return record;
}

// ---------------------------------------------------------------------------
// stats
// ---------------------------------------------------------------------------
std::expected<EscalationStats, std::string> EscalationQueue::stats() {
    auto listed = executor_.run("escalation list",
        [store = store_]() -> std::expected<std::vector<EscalationRecord>, std::string> {
            return store->list(std::nullopt);
        });
    if (!listed) {
        spdlog::error("escalation: stats failed: {}", listed.error());
        return std::unexpected(listed.error());
    }

    EscalationStats out;
    for (const auto& rec : *listed) {
        if (rec.status == EscalationStatus::kPending) {
            ++out.pending;
            ++out.pending_by_severity[std::string(to_string(rec.severity))];
        } else {
            ++out.resolved;
            if (rec.resolution) {
                ++out.resolved_by_resolution[std::string(to_string(*rec.resolution))];
            }
        }
    }
    return out;
}
