#pragma once

// ---------------------------------------------------------------------------
// pii_detector.hpp
//
// 다중 유형 PII 스캐너. 출력 검사 파이프라인 1단계.
//
// [유형별 처리 순서]
// 1. 유형의 패턴마다 전체 스캔
// 2. 검증기 적용 (enable_validation=true 일 때)
//    - credit_card: Luhn 체크섬 (13~19 자리). 실패 → 버림
//    - ssn        : 구조 검증 + invalid_prefixes + 날짜 문맥 키워드.
//                   통과한 SSN 은 MEDIUM 으로 하향 (구조가 맞다고 실제 번호는 아님)
// 3. 제외 패턴: 매치 스팬을 완전히 포함하는 제외 매치가 있으면 버림
// 4. 유형당 max_matches_per_type 개에서 중단
//
// [중복 제거]
// 모든 유형의 매치를 start 오름차순 → confidence 내림차순으로 정렬하고,
// 직전 채택 매치의 end 이전에 시작하는 매치를 버린다. 결과는 위치 순서이며
// 스팬이 서로 겹치지 않는다.
//
// [fail-open]
// 규칙 파일 로드 실패 → 빈 규칙 (탐지 0건). 교차 사용자 판정은 탐지된
// 매치에만 적용되므로 이 계층만 열린다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/rules.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct PiiMatch {
    PiiType     type{PiiType::kEmail};
    std::string value{};
    std::size_t start{0};  // 바이트 오프셋, [start, end)
    std::size_t end{0};
    Confidence  confidence{Confidence::kLow};
    std::string pattern_id{};
};

struct PiiCapability {
    PiiType     type{PiiType::kEmail};
    bool        enabled{false};
    std::size_t pattern_count{0};
};

class PiiDetector {
public:
    // 빈 규칙으로 시작한다.
    PiiDetector();
    explicit PiiDetector(const PiiRuleSet& rules);

    ~PiiDetector() = default;

    PiiDetector(const PiiDetector&)            = delete;
    PiiDetector& operator=(const PiiDetector&) = delete;
    PiiDetector(PiiDetector&&)                 = delete;
    PiiDetector& operator=(PiiDetector&&)      = delete;

    // load
    //   실패 시 빈 규칙으로 교체하고 에러를 반환한다.
    std::expected<void, std::string> load(const std::filesystem::path& path);

    void apply(const PiiRuleSet& rules);

    // detect
    //   활성화된 모든 유형을 스캔하고 중복 제거한 결과를 위치 순서로 반환한다.
    //   스캔 중 std::regex_error 는 호출자에게 전파된다.
    [[nodiscard]] std::vector<PiiMatch> detect(std::string_view text) const;

    // 한 유형만 스캔한다. detect 와 같은 중복 제거를 거친다. 비활성 유형이면 빈 결과.
    [[nodiscard]] std::vector<PiiMatch> detect_by_type(std::string_view text, PiiType type) const;

    [[nodiscard]] std::vector<PiiCapability> capabilities() const;

    [[nodiscard]] bool is_type_enabled(PiiType type) const;

    // Luhn 체크섬. 공백/하이픈은 무시하고 숫자 13~19 자리만 허용한다.
    [[nodiscard]] static bool luhn_valid(std::string_view candidate) noexcept;

    // SSN 구조 검증. 숫자 9자리를 추출해
    // area ∉ {000, 666, 9xx}, group ≠ 00, serial ≠ 0000 을 확인한다.
    [[nodiscard]] static bool ssn_structurally_valid(std::string_view candidate) noexcept;

private:
    struct CompiledCategory;
    struct Snapshot;

    [[nodiscard]] static std::shared_ptr<const Snapshot> build(const PiiRuleSet& rules);

    [[nodiscard]] static std::vector<PiiMatch> scan_category(const Snapshot&         snap,
                                                             const CompiledCategory& cat,
                                                             const std::string&      text);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
};
