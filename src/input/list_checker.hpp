#pragma once

// ---------------------------------------------------------------------------
// list_checker.hpp
//
// 허용/차단 목록 평가기. 파이프라인 Stage 0 (즉시 판정, 단락 평가).
//
// [평가 순서]
// 1. allow_list 전체 평가 → 하나라도 매칭되면 즉시 ALLOW
// 2. block_list 평가     → 매칭되면 BLOCK
// 3. 둘 다 없으면 matched=false (다음 단계로 진행)
// allow 와 block 이 동시에 매칭되면 allow 가 이긴다.
//
// [매칭 방식]
// - exact: 대소문자 무시 부분 문자열
// - regex: 대소문자 무시 정규식 검색 (입력 전체 대상, 앵커 없음)
//
// [fail-open]
// - 규칙 파일 로드 실패 → 빈 목록 (이 계층만 열림. 패턴/이상 점수
//   단계가 계속 보호한다)
// - 잘못된 regex 항목 → 보관하되 uncompiled 로 표시, 절대 매칭되지 않음
//
// [스레드 안전성]
// check()/stats() 는 atomic shared_ptr 스냅샷을 읽는다. load()/apply() 는
// 새 스냅샷을 만들어 원자적으로 교체한다. 진행 중인 check() 는 이전
// 스냅샷으로 완료된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/rules.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ListCheckResult
//   reason 은 감사 로그 전용. 클라이언트에 노출하지 않는다.
// ---------------------------------------------------------------------------
struct ListCheckResult {
    bool                              matched{false};
    std::optional<InspectionDecision> decision{};
    std::string                       list_id{};
    std::string                       reason{};
};

struct ListStats {
    std::size_t allow_entries{0};
    std::size_t block_entries{0};
    std::size_t uncompiled_entries{0};  // 잘못된 regex 로 비활성화된 항목 수
};

class ListChecker {
public:
    // 빈 목록으로 시작한다. load()/apply() 전까지 check() 는 항상 matched=false.
    ListChecker();
    explicit ListChecker(const ListRuleSet& rules);

    ~ListChecker() = default;

    ListChecker(const ListChecker&)            = delete;
    ListChecker& operator=(const ListChecker&) = delete;
    ListChecker(ListChecker&&)                 = delete;
    ListChecker& operator=(ListChecker&&)      = delete;

    // load
    //   YAML 목록 파일을 읽어 스냅샷을 교체한다.
    //   실패 시 빈 목록으로 교체하고 에러를 반환한다 (fail-open, 호출자가 관측 가능).
    std::expected<void, std::string> load(const std::filesystem::path& path);

    // apply
    //   이미 파싱된 규칙으로 스냅샷을 교체한다.
    void apply(const ListRuleSet& rules);

    [[nodiscard]] ListCheckResult check(std::string_view input) const;

    [[nodiscard]] ListStats stats() const;

private:
    struct Snapshot;

    [[nodiscard]] static std::shared_ptr<const Snapshot> build(const ListRuleSet& rules);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
};
