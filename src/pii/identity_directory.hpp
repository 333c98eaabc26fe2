#pragma once

// ---------------------------------------------------------------------------
// identity_directory.hpp
//
// 교차 사용자 판정에 필요한 사용자 식별자 조회 협력자.
//
// [계약]
// - find_user               : 사용자 프로필 (이메일, 이름)
// - list_user_emails        : 전체 이메일 → 사용자 ID 디렉터리
// - recent_transaction_texts: 사용자 본인 거래의 메모/가맹점 문자열 (최신순, limit 개)
// 모든 메서드는 PersistenceExecutor 스레드에서 호출되므로 스레드 안전해야 한다.
// ---------------------------------------------------------------------------

#include "config/rules.hpp"

#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct UserProfile {
    std::string user_id{};
    std::string email{};
    std::string name{};
};

class IdentitySource {
public:
    virtual ~IdentitySource() = default;

    [[nodiscard]] virtual std::expected<std::optional<UserProfile>, std::string>
    find_user(const std::string& user_id) = 0;

    // 소문자 이메일 → 사용자 ID
    [[nodiscard]] virtual std::expected<std::map<std::string, std::string>, std::string>
    list_user_emails() = 0;

    [[nodiscard]] virtual std::expected<std::vector<std::string>, std::string>
    recent_transaction_texts(const std::string& user_id, std::size_t limit) = 0;
};

// ---------------------------------------------------------------------------
// IdentityDirectory
//   config/identities.yaml 로 초기화하는 in-memory 구현.
//   upsert() 로 프로필을 바꾼 뒤에는 CrossUserClassifier::invalidate_user()
//   를 호출해야 캐시에 반영된다.
// ---------------------------------------------------------------------------
class IdentityDirectory final : public IdentitySource {
public:
    IdentityDirectory() = default;
    explicit IdentityDirectory(const std::vector<IdentityRecord>& records);

    [[nodiscard]] std::expected<std::optional<UserProfile>, std::string>
    find_user(const std::string& user_id) override;

    [[nodiscard]] std::expected<std::map<std::string, std::string>, std::string>
    list_user_emails() override;

    [[nodiscard]] std::expected<std::vector<std::string>, std::string>
    recent_transaction_texts(const std::string& user_id, std::size_t limit) override;

    void upsert(const IdentityRecord& record);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex             mutex_;
    std::map<std::string, IdentityRecord> users_;
};
