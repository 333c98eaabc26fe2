// ---------------------------------------------------------------------------
// cross_user_classifier.cpp
// ---------------------------------------------------------------------------

#include "pii/cross_user_classifier.hpp"

#include "common/text_util.hpp"

#include <regex>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

const std::string kDirectoryKey = "all";

const std::regex& account_number_regex() {
    static const std::regex re(R"(\b(ACCT|LOAN)-[A-Z]-\d{3,6}\b)",
                               std::regex_constants::ECMAScript | std::regex_constants::icase);
    return re;
}

}  // namespace

CrossUserClassifier::CrossUserClassifier(const PiiDetector&              detector,
                                         std::shared_ptr<IdentitySource> identities,
                                         PersistenceExecutor&            executor,
                                         std::chrono::seconds            identifier_ttl,
                                         std::chrono::seconds            directory_ttl)
    : detector_(detector)
    , identities_(std::move(identities))
    , executor_(executor)
    , identifier_cache_(identifier_ttl)
    , directory_cache_(directory_ttl)
{
    if (!identities_) {
        throw std::invalid_argument("CrossUserClassifier: identity source must not be null");
    }
}

std::set<std::string> CrossUserClassifier::mine_account_patterns(
    const std::vector<std::string>& texts) {
    std::set<std::string> out;
    for (const auto& t : texts) {
        const auto end = std::sregex_iterator();
        for (auto it = std::sregex_iterator(t.begin(), t.end(), account_number_regex());
             it != end; ++it) {
            out.insert(to_upper_ascii(it->str(0)));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// identifiers_for
//   캐시 미스 시 프로필과 최근 거래 100건을 조회한다.
// ---------------------------------------------------------------------------
UserIdentifiers CrossUserClassifier::identifiers_for(const std::string& user_id) {
    if (user_id.empty()) {
        return UserIdentifiers{};
    }
    if (auto cached = identifier_cache_.get(user_id)) {
        return std::move(*cached);
    }

    auto profile = executor_.run("identity find_user",
        [src = identities_, user_id]() { return src->find_user(user_id); });
    if (!profile) {
        spdlog::warn("cross_user: profile lookup failed for user {}: {}", user_id, profile.error());
        return UserIdentifiers{.user_id = user_id};
    }

    auto texts = executor_.run("identity transactions",
        [src = identities_, user_id]() {
            return src->recent_transaction_texts(user_id, kTransactionLimit);
        });
    if (!texts) {
        spdlog::warn("cross_user: transaction lookup failed for user {}: {}",
                     user_id, texts.error());
        return UserIdentifiers{.user_id = user_id};
    }

    UserIdentifiers ident{.user_id = user_id};
    if (profile->has_value()) {
        ident.email = to_lower_ascii((*profile)->email);
        ident.name  = (*profile)->name;
    }
    ident.account_patterns = mine_account_patterns(*texts);

    identifier_cache_.put(user_id, ident);
    return ident;
}

std::shared_ptr<const CrossUserClassifier::EmailDirectory> CrossUserClassifier::email_directory() {
    if (auto cached = directory_cache_.get(kDirectoryKey)) {
        return *cached;
    }

    auto listed = executor_.run("identity list_user_emails",
        [src = identities_]() { return src->list_user_emails(); });
    if (!listed) {
        spdlog::warn("cross_user: email directory lookup failed: {}", listed.error());
        return std::make_shared<const EmailDirectory>();
    }

    auto dir = std::make_shared<const EmailDirectory>(std::move(*listed));
    directory_cache_.put(kDirectoryKey, dir);
    return dir;
}

CrossUserMatch CrossUserClassifier::classify_one(const PiiMatch&        m,
                                                 const UserIdentifiers& ident,
                                                 const EmailDirectory&  directory) {
    CrossUserMatch out{.pii = m};

    switch (m.type) {
        case PiiType::kEmail: {
            const std::string email = to_lower_ascii(m.value);
            if (!ident.email.empty() && email == ident.email) {
                out.ownership  = Ownership::kCurrentUser;
                out.confidence = Confidence::kHigh;
                break;
            }
            const auto it = directory.find(email);
            if (it != directory.end()) {
                if (!ident.user_id.empty() && it->second == ident.user_id) {
                    out.ownership  = Ownership::kCurrentUser;
                    out.confidence = Confidence::kHigh;
                } else {
                    out.ownership     = Ownership::kOtherUser;
                    out.confidence    = Confidence::kHigh;
                    out.owner_user_id = it->second;
                }
                break;
            }
            out.ownership  = Ownership::kUnknown;
            out.confidence = Confidence::kMedium;
            break;
        }
        case PiiType::kAccountNumber:
        case PiiType::kLoanNumber:
            if (ident.account_patterns.contains(to_upper_ascii(m.value))) {
                out.ownership  = Ownership::kCurrentUser;
                out.confidence = Confidence::kHigh;
            } else {
                out.ownership  = Ownership::kUnknown;
                out.confidence = Confidence::kMedium;
            }
            break;
        case PiiType::kSsn:
        case PiiType::kCreditCard:
            out.ownership  = Ownership::kUnknown;
            out.confidence = Confidence::kHigh;
            break;
        case PiiType::kPhone:
            out.ownership  = Ownership::kUnknown;
            out.confidence = Confidence::kLow;
            break;
    }
    return out;
}

std::vector<CrossUserMatch> CrossUserClassifier::classify(const std::vector<PiiMatch>& matches,
                                                          const std::string&           user_id) {
    std::vector<CrossUserMatch> out;
    if (matches.empty()) {
        return out;
    }

    const UserIdentifiers ident = identifiers_for(user_id);
    const auto            dir   = email_directory();

    out.reserve(matches.size());
    for (const auto& m : matches) {
        out.push_back(classify_one(m, ident, *dir));
    }
    return out;
}

CrossUserReport CrossUserClassifier::detect(std::string_view text, const std::string& user_id) {
    CrossUserReport report{.current_user_id = user_id};

    const std::vector<PiiMatch> matches = detector_.detect(text);
    report.total_pii_found = matches.size();

    for (auto& c : classify(matches, user_id)) {
        if (c.ownership == Ownership::kOtherUser) {
            report.other_user_matches.push_back(std::move(c));
        } else if (c.ownership == Ownership::kUnknown) {
            report.unknown_matches.push_back(std::move(c));
        }
    }
    report.has_cross_user_data = !report.other_user_matches.empty();
    return report;
}

void CrossUserClassifier::invalidate_user(const std::string& user_id) {
    const bool removed = identifier_cache_.invalidate(user_id);
    // 이메일 변경은 디렉터리에도 반영돼야 한다
    directory_cache_.invalidate(kDirectoryKey);
    spdlog::debug("cross_user: invalidated identifiers for user {} (cached={})", user_id, removed);
}

void CrossUserClassifier::clear_caches() {
    identifier_cache_.clear();
    directory_cache_.clear();
    spdlog::info("cross_user: identifier and directory caches cleared");
}
