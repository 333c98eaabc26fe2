// ---------------------------------------------------------------------------
// pattern_matcher.cpp
//
// [CompiledPattern 구현 주의사항]
// std::regex 는 shared_ptr<const std::regex> 로 보관한다. nullptr 는
// 컴파일 실패 패턴(never-match)을 뜻하며 match() 에서 건너뛴다.
// 패턴 수 통계에는 포함된다 (운영자가 로드 개수와 정의 개수를 비교할 수 있도록).
// ---------------------------------------------------------------------------

#include "input/pattern_matcher.hpp"

#include "common/regex_util.hpp"
#include "common/text_util.hpp"
#include "config/rule_loader.hpp"

#include <regex>

#include <spdlog/spdlog.h>

struct PatternMatcher::CompiledPattern {
    PatternRule                       rule;
    std::shared_ptr<const std::regex> compiled;  // nullptr = never-match
};

struct PatternMatcher::Snapshot {
    std::vector<CompiledPattern> patterns;
    std::size_t                  invalid{0};
};

std::shared_ptr<const PatternMatcher::Snapshot> PatternMatcher::build(const PatternRuleSet& rules) {
    auto snap = std::make_shared<Snapshot>();
    snap->patterns.reserve(rules.patterns.size());

    for (const auto& rule : rules.patterns) {
        // 대소문자 무시는 설정과 무관하게 강제한다
        auto re = compile_rule_regex(rule.pattern, true, "pattern_matcher", rule.id);
        if (!re) {
            ++snap->invalid;
        }
        snap->patterns.push_back(CompiledPattern{rule, std::move(re)});
    }
    return snap;
}

PatternMatcher::PatternMatcher() : snapshot_(std::make_shared<const Snapshot>()) {}

PatternMatcher::PatternMatcher(const PatternRuleSet& rules) : snapshot_(build(rules)) {}

std::expected<void, std::string> PatternMatcher::load(const std::filesystem::path& path) {
    auto rules = RuleLoader::load_patterns(path);
    if (!rules) {
        spdlog::warn("pattern_matcher: rule load failed, running with zero patterns");
        snapshot_.store(std::make_shared<const Snapshot>());
        return std::unexpected(rules.error());
    }
    apply(*rules);
    return {};
}

void PatternMatcher::apply(const PatternRuleSet& rules) {
    auto snap = build(rules);
    if (snap->invalid > 0) {
        spdlog::warn("pattern_matcher: {} of {} patterns failed to compile and will never match",
                     snap->invalid, snap->patterns.size());
    }
    spdlog::info("pattern_matcher: active patterns={}", snap->patterns.size());
    snapshot_.store(std::move(snap));
}

std::vector<PatternMatch> PatternMatcher::match(std::string_view input) const {
    const auto snap = snapshot_.load();
    const std::string text(input);

    std::vector<PatternMatch> matches;
    for (const auto& cp : snap->patterns) {
        if (!cp.compiled) {
            continue;
        }
        for_each_match(*cp.compiled, text, 0, [&](std::size_t pos, std::size_t len) {
            matches.push_back(PatternMatch{
                .pattern_id   = cp.rule.id,
                .category     = cp.rule.category,
                .name         = cp.rule.name,
                .severity     = cp.rule.severity,
                .start        = pos,
                .end          = pos + len,
                .matched_text = truncate_utf8(std::string_view(text).substr(pos, len),
                                              kMaxMatchedTextBytes),
            });
        });
    }

    if (!matches.empty()) {
        spdlog::debug("pattern_matcher: {} matches", matches.size());
    }
    return matches;
}

std::size_t PatternMatcher::pattern_count() const {
    return snapshot_.load()->patterns.size();
}

std::map<std::string, std::size_t> PatternMatcher::stats_by_category() const {
    const auto snap = snapshot_.load();
    std::map<std::string, std::size_t> counts;
    for (const auto& cp : snap->patterns) {
        ++counts[cp.rule.category];
    }
    return counts;
}
