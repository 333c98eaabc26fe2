#pragma once

// ---------------------------------------------------------------------------
// pattern_matcher.hpp
//
// 이름/심각도가 붙은 프롬프트 인젝션 패턴 스캐너. 파이프라인 Stage 1.
//
// [탐지 대상 카테고리 (기본값, config/injection_patterns.yaml 에서 로드)]
// - instruction_override : "ignore all previous instructions" 류
// - prompt_extraction    : 시스템 프롬프트 유출 요구
// - role_manipulation    : "you are now DAN" 류 역할 재정의
// - delimiter_injection  : 가짜 system/assistant 구분자 삽입
// - data_exfiltration    : 다른 사용자 데이터 요구
//
// [컴파일 규칙]
// - 모든 패턴은 icase 로 컴파일하고 전체 스캔한다 (설정의 flags 값과 무관).
// - 컴파일 실패 패턴은 never-match 로 보관하고 로드를 계속한다.
//
// [오탐/미탐 트레이드오프]
// - 패턴을 넓힐수록 일반 대화("show me my expenses")에서 false positive 증가.
//   단, 이 단계는 점수의 한 요인일 뿐이며 단독으로 BLOCK 을 결정하지 않는다.
// - 동의어/철자 변형/다국어 우회는 탐지하지 못한다 (false negative).
//
// [fail-open]
// 규칙 파일 로드 실패 → 패턴 0개. AnomalyScorer 의 나머지 요인이 계속 적용된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/rules.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PatternMatch
//   matched_text 는 최대 50바이트로 잘라 보관한다. 공격 페이로드 전문이
//   로그로 흘러가지 않도록 하기 위한 상한이다.
// ---------------------------------------------------------------------------
struct PatternMatch {
    std::string pattern_id{};
    std::string category{};
    std::string name{};
    Severity    severity{Severity::kLow};
    std::size_t start{0};  // 바이트 오프셋, [start, end)
    std::size_t end{0};
    std::string matched_text{};
};

inline constexpr std::size_t kMaxMatchedTextBytes = 50;

class PatternMatcher {
public:
    PatternMatcher();
    explicit PatternMatcher(const PatternRuleSet& rules);

    ~PatternMatcher() = default;

    PatternMatcher(const PatternMatcher&)            = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;
    PatternMatcher(PatternMatcher&&)                 = delete;
    PatternMatcher& operator=(PatternMatcher&&)      = delete;

    // load
    //   실패 시 패턴 0개로 교체하고 에러를 반환한다 (fail-open).
    std::expected<void, std::string> load(const std::filesystem::path& path);

    void apply(const PatternRuleSet& rules);

    // match
    //   모든 패턴으로 입력 전체를 스캔한다. 같은 패턴이 N번 (겹치지 않게)
    //   나타나면 N개의 PatternMatch 를 반환한다. 결과는 패턴 정의 순서,
    //   같은 패턴 안에서는 위치 순서.
    [[nodiscard]] std::vector<PatternMatch> match(std::string_view input) const;

    // 로드된 패턴 수 (never-match 패턴 포함)
    [[nodiscard]] std::size_t pattern_count() const;

    // 카테고리별 패턴 수
    [[nodiscard]] std::map<std::string, std::size_t> stats_by_category() const;

private:
    struct CompiledPattern;
    struct Snapshot;

    [[nodiscard]] static std::shared_ptr<const Snapshot> build(const PatternRuleSet& rules);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
};
