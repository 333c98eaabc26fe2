// ---------------------------------------------------------------------------
// list_checker.cpp
// ---------------------------------------------------------------------------

#include "input/list_checker.hpp"

#include "common/regex_util.hpp"
#include "common/text_util.hpp"
#include "config/rule_loader.hpp"

#include <regex>
#include <vector>

#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// CompiledEntry / Snapshot
//   exact 항목은 소문자 패턴을 미리 만들어 두고, regex 항목은 컴파일 결과를
//   shared_ptr 로 보관한다. regex 가 nullptr 인 regex 항목은 uncompiled.
// ---------------------------------------------------------------------------
namespace {

struct CompiledEntry {
    ListEntryRule                     rule;
    std::shared_ptr<const std::regex> regex;  // kRegex 전용
};

[[nodiscard]] bool entry_matches(const CompiledEntry& e, std::string_view input,
                                 const std::string& input_str) {
    if (e.rule.kind == ListEntryKind::kExact) {
        return icontains(input, e.rule.pattern);
    }
    if (!e.regex) {
        return false;
    }
    return std::regex_search(input_str, *e.regex);
}

}  // namespace

struct ListChecker::Snapshot {
    std::vector<CompiledEntry> allow;
    std::vector<CompiledEntry> block;
    std::size_t                uncompiled{0};
};

std::shared_ptr<const ListChecker::Snapshot> ListChecker::build(const ListRuleSet& rules) {
    auto snap = std::make_shared<Snapshot>();

    auto compile_into = [&snap](const std::vector<ListEntryRule>& src,
                                std::vector<CompiledEntry>&       dst) {
        dst.reserve(src.size());
        for (const auto& rule : src) {
            CompiledEntry entry{rule, nullptr};
            if (rule.kind == ListEntryKind::kRegex) {
                entry.regex = compile_rule_regex(rule.pattern, true, "list_checker", rule.id);
                if (!entry.regex) {
                    ++snap->uncompiled;
                }
            }
            dst.push_back(std::move(entry));
        }
    };

    compile_into(rules.allow_list, snap->allow);
    compile_into(rules.block_list, snap->block);
    return snap;
}

ListChecker::ListChecker() : snapshot_(std::make_shared<const Snapshot>()) {}

ListChecker::ListChecker(const ListRuleSet& rules) : snapshot_(build(rules)) {}

std::expected<void, std::string> ListChecker::load(const std::filesystem::path& path) {
    auto rules = RuleLoader::load_lists(path);
    if (!rules) {
        // [fail-open] 이 계층만 비활성화한다.
        spdlog::warn("list_checker: rule load failed, allow/block lists are now empty");
        snapshot_.store(std::make_shared<const Snapshot>());
        return std::unexpected(rules.error());
    }
    apply(*rules);
    return {};
}

void ListChecker::apply(const ListRuleSet& rules) {
    auto snap = build(rules);
    spdlog::info("list_checker: active allow={} block={} uncompiled={}",
                 snap->allow.size(), snap->block.size(), snap->uncompiled);
    snapshot_.store(std::move(snap));
}

ListCheckResult ListChecker::check(std::string_view input) const {
    const auto snap = snapshot_.load();
    const std::string input_str(input);

    // 1. allow 우선: block 항목은 allow 평가가 끝날 때까지 보지 않는다
    for (const auto& e : snap->allow) {
        if (entry_matches(e, input, input_str)) {
            return ListCheckResult{
                .matched  = true,
                .decision = InspectionDecision::kAllow,
                .list_id  = e.rule.id,
                .reason   = e.rule.reason,
            };
        }
    }

    // 2. block
    for (const auto& e : snap->block) {
        if (entry_matches(e, input, input_str)) {
            return ListCheckResult{
                .matched  = true,
                .decision = InspectionDecision::kBlock,
                .list_id  = e.rule.id,
                .reason   = e.rule.reason,
            };
        }
    }

    return ListCheckResult{};
}

ListStats ListChecker::stats() const {
    const auto snap = snapshot_.load();
    return ListStats{
        .allow_entries      = snap->allow.size(),
        .block_entries      = snap->block.size(),
        .uncompiled_entries = snap->uncompiled,
    };
}
