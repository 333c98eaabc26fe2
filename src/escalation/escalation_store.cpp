// ---------------------------------------------------------------------------
// escalation_store.cpp
// ---------------------------------------------------------------------------

#include "escalation/escalation_store.hpp"

#include "common/text_util.hpp"

#include <fmt/format.h>

std::string_view to_string(EscalationStatus s) noexcept {
    return s == EscalationStatus::kResolved ? "RESOLVED" : "PENDING";
}

std::string_view to_string(Resolution r) noexcept {
    switch (r) {
        case Resolution::kApprove: return "APPROVE";
        case Resolution::kReject:  return "REJECT";
        case Resolution::kDismiss: return "DISMISS";
    }
    return "DISMISS";
}

std::optional<Resolution> parse_resolution(std::string_view s) {
    if (iequals(s, "APPROVE")) { return Resolution::kApprove; }
    if (iequals(s, "REJECT"))  { return Resolution::kReject; }
    if (iequals(s, "DISMISS")) { return Resolution::kDismiss; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// InMemoryEscalationStore
// ---------------------------------------------------------------------------
std::expected<std::string, std::string>
InMemoryEscalationStore::create(const EscalationRecord& record) {
    if (record.id.empty()) {
        return std::unexpected(std::string("escalation record id is empty"));
    }
    std::lock_guard lock(mutex_);
    const auto [it, inserted] = records_.emplace(record.id, record);
    if (!inserted) {
        return std::unexpected(fmt::format("escalation record '{}' already exists", record.id));
    }
    return it->first;
}

std::expected<void, std::string>
InMemoryEscalationStore::update(const EscalationRecord& record) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(record.id);
    if (it == records_.end()) {
        return std::unexpected(fmt::format("escalation record '{}' not found", record.id));
    }
    it->second = record;
    return {};
}

std::expected<std::optional<EscalationRecord>, std::string>
InMemoryEscalationStore::find(const std::string& id) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) {
        return std::optional<EscalationRecord>{};
    }
    return std::optional<EscalationRecord>{it->second};
}

std::expected<std::vector<EscalationRecord>, std::string>
InMemoryEscalationStore::list(std::optional<EscalationStatus> status) {
    std::lock_guard lock(mutex_);
    std::vector<EscalationRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        if (!status || rec.status == *status) {
            out.push_back(rec);
        }
    }
    return out;
}
