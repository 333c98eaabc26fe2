#pragma once

// ---------------------------------------------------------------------------
// security_event_store.hpp
//
// 교차 사용자 차단 보안 이벤트 레코드와 저장소 협력자 인터페이스.
//
// [민감정보]
// 레코드에는 PII 값이 없다. 유형 목록(taxonomy)과 응답 해시(앞 16자리)만 담는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view kCrossUserDataBlocked = "CROSS_USER_DATA_BLOCKED";

struct SecurityEventRecord {
    std::string                           id{};
    std::string                           event_type{kCrossUserDataBlocked};
    Severity                              severity{Severity::kCritical};
    std::string                           user_id{};
    std::string                           session_id{};
    std::string                           request_id{};
    std::string                           endpoint{};
    std::vector<std::string>              pii_types{};
    std::string                           response_hash{};
    bool                                  alert_sent{false};
    std::chrono::system_clock::time_point created_at{};
};

class SecurityEventStore {
public:
    virtual ~SecurityEventStore() = default;

    [[nodiscard]] virtual std::expected<std::string, std::string>
    create(const SecurityEventRecord& record) = 0;

    [[nodiscard]] virtual std::expected<void, std::string>
    update(const SecurityEventRecord& record) = 0;

    [[nodiscard]] virtual std::expected<std::optional<SecurityEventRecord>, std::string>
    find(const std::string& id) = 0;
};

class InMemorySecurityEventStore final : public SecurityEventStore {
public:
    InMemorySecurityEventStore() = default;

    [[nodiscard]] std::expected<std::string, std::string>
    create(const SecurityEventRecord& record) override;

    [[nodiscard]] std::expected<void, std::string>
    update(const SecurityEventRecord& record) override;

    [[nodiscard]] std::expected<std::optional<SecurityEventRecord>, std::string>
    find(const std::string& id) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex                         mutex_;
    std::map<std::string, SecurityEventRecord> records_;
};
