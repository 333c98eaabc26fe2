#pragma once

// ---------------------------------------------------------------------------
// rule_loader.hpp
//
// YAML 규칙 문서를 읽어 rules.hpp 구조체로 파싱하는 정적 로더.
//
// [설계 원칙]
// - load_*() 실패 시 std::unexpected(error_message) 반환. 부분적으로 파싱된
//   문서를 반환하지 않는다.
// - 실패 시의 처리(빈 규칙 집합으로 fail-open, 내장 기본값으로 fallback)는
//   문서를 소유한 컴포넌트가 결정한다. 로더는 판정 정책을 갖지 않는다.
// - 개별 항목 오류(id 누락, 알 수 없는 severity 등)는 경고 로그 후 해당
//   항목만 건너뛰거나 기본값을 적용한다. 문서 전체를 실패시키지 않는다.
//
// [보안 고려사항]
// - 경로는 canonical 로 정규화한 뒤 연다.
// - 파싱 오류 메시지에 YAML 내용(정규식 원문 등)을 그대로 싣지 않는다.
// ---------------------------------------------------------------------------

#include "rules.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

class RuleLoader {
public:
    RuleLoader() = delete;

    [[nodiscard]] static std::expected<PatternRuleSet, std::string>
    load_patterns(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<ListRuleSet, std::string>
    load_lists(const std::filesystem::path& path);

    // load_anomaly_rules
    //   thresholds/factor 값이 범위를 벗어나면 해당 블록만 내장 기본값으로
    //   되돌리고 경고한다 (문서 자체는 성공).
    [[nodiscard]] static std::expected<AnomalyRules, std::string>
    load_anomaly_rules(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<PiiRuleSet, std::string>
    load_pii_rules(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<std::vector<IdentityRecord>, std::string>
    load_identities(const std::filesystem::path& path);
};
