// ---------------------------------------------------------------------------
// security_event_store.cpp
// ---------------------------------------------------------------------------

#include "output/security_event_store.hpp"

#include <fmt/format.h>

std::expected<std::string, std::string>
InMemorySecurityEventStore::create(const SecurityEventRecord& record) {
    if (record.id.empty()) {
        return std::unexpected(std::string("security event id is empty"));
    }
    std::lock_guard lock(mutex_);
    const auto [it, inserted] = records_.emplace(record.id, record);
    if (!inserted) {
        return std::unexpected(fmt::format("security event '{}' already exists", record.id));
    }
    return it->first;
}

std::expected<void, std::string>
InMemorySecurityEventStore::update(const SecurityEventRecord& record) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(record.id);
    if (it == records_.end()) {
        return std::unexpected(fmt::format("security event '{}' not found", record.id));
    }
    it->second = record;
    return {};
}

std::expected<std::optional<SecurityEventRecord>, std::string>
InMemorySecurityEventStore::find(const std::string& id) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) {
        return std::optional<SecurityEventRecord>{};
    }
    return std::optional<SecurityEventRecord>{it->second};
}

std::size_t InMemorySecurityEventStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}
