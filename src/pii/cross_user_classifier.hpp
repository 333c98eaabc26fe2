#pragma once

// ---------------------------------------------------------------------------
// cross_user_classifier.hpp
//
// PII 매치마다 소유자를 판정한다 (현재 사용자 / 다른 사용자 / 알 수 없음).
//
// [판정 규칙]
//   email          : 현재 사용자 이메일        → CURRENT_USER / HIGH
//                    다른 등록 사용자 이메일   → OTHER_USER   / HIGH (owner 첨부)
//                    그 외                     → UNKNOWN      / MEDIUM
//   account / loan : 현재 사용자 거래에서 추출한 번호와 일치 → CURRENT_USER / HIGH
//                    그 외                                   → UNKNOWN      / MEDIUM
//   ssn / card     : 항상 UNKNOWN / HIGH (응답에 절대 나오면 안 되는 유형)
//   phone          : UNKNOWN / LOW (참조 데이터 없음)
//
// [캐시]
// - 사용자 식별자 스냅샷: TTL 300초 (사용자별)
// - 이메일 디렉터리     : TTL 60초 (전역)
// 프로필 변경 시 invalidate_user() 를 반드시 호출한다.
// 조회 실패 결과는 캐시하지 않는다.
//
// [조회 실패]
// 식별자 조회가 실패/시간 초과하면 빈 식별자로 판정한다. 이메일과 번호가
// 현재 사용자 것으로 인정되지 않으므로 판정은 보수적인 방향으로만 바뀐다.
// ---------------------------------------------------------------------------

#include "common/persistence_executor.hpp"
#include "common/ttl_cache.hpp"
#include "common/types.hpp"
#include "pii/identity_directory.hpp"
#include "pii/pii_detector.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct UserIdentifiers {
    std::string           user_id{};
    std::string           email{};             // 소문자
    std::string           name{};
    std::set<std::string> account_patterns{};  // 대문자 ("ACCT-A-12345")
};

struct CrossUserMatch {
    PiiMatch    pii{};
    Ownership   ownership{Ownership::kUnknown};
    Confidence  confidence{Confidence::kLow};  // 소유자 판정 확신도
    std::string owner_user_id{};               // OTHER_USER 일 때만
};

struct CrossUserReport {
    bool                        has_cross_user_data{false};
    std::vector<CrossUserMatch> other_user_matches{};
    std::vector<CrossUserMatch> unknown_matches{};
    std::string                 current_user_id{};
    std::size_t                 total_pii_found{0};
};

class CrossUserClassifier {
public:
    static constexpr std::chrono::seconds kIdentifierTtl{300};
    static constexpr std::chrono::seconds kDirectoryTtl{60};
    static constexpr std::size_t          kTransactionLimit = 100;

    CrossUserClassifier(const PiiDetector&              detector,
                        std::shared_ptr<IdentitySource> identities,
                        PersistenceExecutor&            executor,
                        std::chrono::seconds            identifier_ttl = kIdentifierTtl,
                        std::chrono::seconds            directory_ttl  = kDirectoryTtl);

    ~CrossUserClassifier() = default;

    CrossUserClassifier(const CrossUserClassifier&)            = delete;
    CrossUserClassifier& operator=(const CrossUserClassifier&) = delete;
    CrossUserClassifier(CrossUserClassifier&&)                 = delete;
    CrossUserClassifier& operator=(CrossUserClassifier&&)      = delete;

    // classify
    //   입력 순서를 유지한 판정 목록을 반환한다. user_id 가 비어 있으면
    //   익명 요청으로 보고 빈 식별자로 판정한다.
    [[nodiscard]] std::vector<CrossUserMatch> classify(const std::vector<PiiMatch>& matches,
                                                       const std::string&           user_id);

    // detect
    //   PII 탐지 + 판정을 한 번에 수행한다.
    [[nodiscard]] CrossUserReport detect(std::string_view text, const std::string& user_id);

    void invalidate_user(const std::string& user_id);

    void clear_caches();

    // 거래 문자열에서 계좌/대출 번호를 추출한다 (대문자 정규화)
    [[nodiscard]] static std::set<std::string> mine_account_patterns(
        const std::vector<std::string>& texts);

private:
    using EmailDirectory = std::map<std::string, std::string>;

    [[nodiscard]] UserIdentifiers identifiers_for(const std::string& user_id);
    [[nodiscard]] std::shared_ptr<const EmailDirectory> email_directory();

    [[nodiscard]] static CrossUserMatch classify_one(const PiiMatch&        m,
                                                     const UserIdentifiers& ident,
                                                     const EmailDirectory&  directory);

    const PiiDetector&              detector_;
    std::shared_ptr<IdentitySource> identities_;
    PersistenceExecutor&            executor_;

    TtlCache<std::string, UserIdentifiers>                       identifier_cache_;
    TtlCache<std::string, std::shared_ptr<const EmailDirectory>> directory_cache_;
};
