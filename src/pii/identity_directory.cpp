// ---------------------------------------------------------------------------
// identity_directory.cpp
// ---------------------------------------------------------------------------

#include "pii/identity_directory.hpp"

#include "common/text_util.hpp"

#include <mutex>

IdentityDirectory::IdentityDirectory(const std::vector<IdentityRecord>& records) {
    for (const auto& r : records) {
        users_.insert_or_assign(r.user_id, r);
    }
}

std::expected<std::optional<UserProfile>, std::string>
IdentityDirectory::find_user(const std::string& user_id) {
    std::shared_lock lock(mutex_);
    const auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::optional<UserProfile>{};
    }
    return std::optional<UserProfile>{UserProfile{
        .user_id = it->second.user_id,
        .email   = it->second.email,
        .name    = it->second.name,
    }};
}

std::expected<std::map<std::string, std::string>, std::string>
IdentityDirectory::list_user_emails() {
    std::shared_lock lock(mutex_);
    std::map<std::string, std::string> out;
    for (const auto& [id, rec] : users_) {
        if (!rec.email.empty()) {
            out.emplace(to_lower_ascii(rec.email), id);
        }
    }
    return out;
}

// transaction_texts 는 최신순으로 저장되어 있다고 가정한다
std::expected<std::vector<std::string>, std::string>
IdentityDirectory::recent_transaction_texts(const std::string& user_id, std::size_t limit) {
    std::shared_lock lock(mutex_);
    const auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::vector<std::string>{};
    }
    const auto& texts = it->second.transaction_texts;
    const std::size_t n = (limit == 0 || texts.size() < limit) ? texts.size() : limit;
    return std::vector<std::string>(texts.begin(), texts.begin() + static_cast<std::ptrdiff_t>(n));
}

void IdentityDirectory::upsert(const IdentityRecord& record) {
    std::unique_lock lock(mutex_);
    users_.insert_or_assign(record.user_id, record);
}

std::size_t IdentityDirectory::size() const {
    std::shared_lock lock(mutex_);
    return users_.size();
}
