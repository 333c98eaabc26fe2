// ---------------------------------------------------------------------------
// pii_detector.cpp
// ---------------------------------------------------------------------------

#include "pii/pii_detector.hpp"

#include "common/regex_util.hpp"
#include "common/text_util.hpp"
#include "config/rule_loader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

enum class Validator : std::uint8_t {
    kNone        = 0,
    kLuhn        = 1,
    kSsnChecksum = 2,
};

// SSN 앞뒤 문맥에서 날짜로 보이게 하는 키워드
constexpr std::array<std::string_view, 7> kDateKeywords = {
    "date", "born", "birthday", "dob", "year", "month", "day",
};
constexpr std::size_t kContextBefore = 20;
constexpr std::size_t kContextAfter  = 10;

[[nodiscard]] Validator default_validator(PiiType type) noexcept {
    switch (type) {
        case PiiType::kCreditCard: return Validator::kLuhn;
        case PiiType::kSsn:        return Validator::kSsnChecksum;
        default:                   return Validator::kNone;
    }
}

[[nodiscard]] Validator resolve_validator(const PiiPatternRule& rule, PiiType type) {
    if (rule.validation.empty()) {
        return default_validator(type);
    }
    if (iequals(rule.validation, "luhn")) {
        return Validator::kLuhn;
    }
    if (iequals(rule.validation, "ssn_checksum") || iequals(rule.validation, "ssn")) {
        return Validator::kSsnChecksum;
    }
    if (iequals(rule.validation, "none")) {
        return Validator::kNone;
    }
    spdlog::warn("pii_detector: pattern '{}' has unknown validation '{}', using type default",
                 rule.id, rule.validation);
    return default_validator(type);
}

[[nodiscard]] std::string digits_only(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            out += c;
        }
    }
    return out;
}

// Luhn 을 통과하는 가장 긴 접두부 길이 (구분자 직전에서만 자른다). 없으면 0.
// 카드 번호 뒤에 붙은 짧은 숫자를 탐욕 매치가 함께 삼킨 경우를 되살린다.
[[nodiscard]] std::size_t luhn_prefix_length(std::string_view value) noexcept {
    for (std::size_t i = value.size(); i-- > 1;) {
        const char c = value[i];
        if ((c == ' ' || c == '-') &&
            std::isdigit(static_cast<unsigned char>(value[i - 1])) != 0 &&
            PiiDetector::luhn_valid(value.substr(0, i))) {
            return i;
        }
    }
    return 0;
}

// 먼저 시작한 매치, 같은 위치면 확신도 높은 매치가 이긴다
[[nodiscard]] std::vector<PiiMatch> dedup_spans(std::vector<PiiMatch> all) {
    std::stable_sort(all.begin(), all.end(), [](const PiiMatch& a, const PiiMatch& b) {
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return a.confidence > b.confidence;
    });

    std::vector<PiiMatch> kept;
    kept.reserve(all.size());
    std::size_t last_end = 0;
    for (auto& m : all) {
        if (!kept.empty() && m.start < last_end) {
            continue;
        }
        last_end = m.end;
        kept.push_back(std::move(m));
    }
    return kept;
}

struct Span {
    std::size_t start;
    std::size_t end;
};

}  // namespace

struct PiiDetector::CompiledCategory {
    struct Pattern {
        PiiPatternRule                    rule;
        std::shared_ptr<const std::regex> regex;  // nullptr = never-match
        Validator                         validator{Validator::kNone};
    };

    PiiType                                        type{PiiType::kEmail};
    bool                                           enabled{true};
    std::vector<Pattern>                           patterns;
    std::vector<std::shared_ptr<const std::regex>> exclusions;
    std::vector<std::string>                       invalid_prefixes;
};

struct PiiDetector::Snapshot {
    PiiSettings                   settings;
    std::vector<CompiledCategory> categories;
};

// ---------------------------------------------------------------------------
// 검증기
// ---------------------------------------------------------------------------
bool PiiDetector::luhn_valid(std::string_view candidate) noexcept {
    int         sum    = 0;
    std::size_t digits = 0;
    bool        dbl    = false;

    for (auto it = candidate.rbegin(); it != candidate.rend(); ++it) {
        const char c = *it;
        if (c == ' ' || c == '-') {
            continue;
        }
        if (c < '0' || c > '9') {
            return false;
        }
        int d = c - '0';
        if (dbl) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        dbl = !dbl;
        ++digits;
    }
    if (digits < 13 || digits > 19) {
        return false;
    }
    return sum % 10 == 0;
}

bool PiiDetector::ssn_structurally_valid(std::string_view candidate) noexcept {
    char d[9];
    std::size_t n = 0;
    for (const char c : candidate) {
        if (c >= '0' && c <= '9') {
            if (n == 9) {
                return false;
            }
            d[n++] = c;
        }
    }
    if (n != 9) {
        return false;
    }

    const std::string_view area(d, 3);
    const std::string_view group(d + 3, 2);
    const std::string_view serial(d + 5, 4);

    if (area == "000" || area == "666" || area[0] == '9') {
        return false;
    }
    if (group == "00") {
        return false;
    }
    return serial != "0000";
}

// ---------------------------------------------------------------------------
// build / load
// ---------------------------------------------------------------------------
std::shared_ptr<const PiiDetector::Snapshot> PiiDetector::build(const PiiRuleSet& rules) {
    auto snap = std::make_shared<Snapshot>();
    snap->settings = rules.settings;
    const bool icase = !rules.settings.case_sensitive;

    for (const auto& cat_rules : rules.categories) {
        CompiledCategory cat;
        cat.type             = cat_rules.type;
        cat.enabled          = cat_rules.enabled;
        cat.invalid_prefixes = cat_rules.invalid_prefixes;

        for (const auto& p : cat_rules.patterns) {
            cat.patterns.push_back(CompiledCategory::Pattern{
                .rule      = p,
                .regex     = compile_rule_regex(p.pattern, icase, "pii_detector", p.id),
                .validator = resolve_validator(p, cat_rules.type),
            });
        }
        for (const auto& ex : cat_rules.exclusions) {
            auto re = compile_rule_regex(ex.pattern, true, "pii_detector",
                                         std::string(to_string(cat_rules.type)) + ".exclusion");
            if (re) {
                cat.exclusions.push_back(std::move(re));
            }
        }
        snap->categories.push_back(std::move(cat));
    }
    return snap;
}

PiiDetector::PiiDetector() : snapshot_(std::make_shared<const Snapshot>()) {}

PiiDetector::PiiDetector(const PiiRuleSet& rules) : snapshot_(build(rules)) {}

std::expected<void, std::string> PiiDetector::load(const std::filesystem::path& path) {
    auto rules = RuleLoader::load_pii_rules(path);
    if (!rules) {
        // [fail-open] 출력 PII 탐지만 비활성화된다.
        spdlog::warn("pii_detector: rule load failed, PII detection is disabled");
        snapshot_.store(std::make_shared<const Snapshot>());
        return std::unexpected(rules.error());
    }
    apply(*rules);
    return {};
}

void PiiDetector::apply(const PiiRuleSet& rules) {
    auto snap = build(rules);
    std::size_t enabled = 0;
    for (const auto& c : snap->categories) {
        if (c.enabled) {
            ++enabled;
        }
    }
    spdlog::info("pii_detector: active categories={} of {}", enabled, snap->categories.size());
    snapshot_.store(std::move(snap));
}

// ---------------------------------------------------------------------------
// scan_category
//   한 유형의 모든 패턴으로 스캔한다. 유형당 상한에 도달하면 중단.
// ---------------------------------------------------------------------------
std::vector<PiiMatch> PiiDetector::scan_category(const Snapshot&         snap,
                                                 const CompiledCategory& cat,
                                                 const std::string&      text) {
    std::vector<PiiMatch> out;
    const std::size_t cap = snap.settings.max_matches_per_type;

    // 제외 스팬은 유형당 한 번만 계산한다
    std::vector<Span> excluded;
    for (const auto& ex : cat.exclusions) {
        for_each_match(*ex, text, 0, [&excluded](std::size_t pos, std::size_t len) {
            excluded.push_back(Span{pos, pos + len});
        });
    }

    const auto is_excluded = [&excluded](std::size_t s, std::size_t e) {
        return std::any_of(excluded.begin(), excluded.end(),
                           [s, e](const Span& x) { return x.start <= s && e <= x.end; });
    };

    const auto date_context = [&text](std::size_t s, std::size_t e) {
        const std::size_t from = s > kContextBefore ? s - kContextBefore : 0;
        const std::size_t to   = std::min(text.size(), e + kContextAfter);
        const std::string window =
            to_lower_ascii(std::string_view(text).substr(from, to - from));
        return std::any_of(kDateKeywords.begin(), kDateKeywords.end(),
                           [&window](std::string_view k) {
                               return window.find(k) != std::string::npos;
                           });
    };

    for (const auto& p : cat.patterns) {
        if (!p.regex) {
            continue;
        }
        const auto end_it = std::sregex_iterator();
        for (auto it = std::sregex_iterator(text.begin(), text.end(), *p.regex);
             it != end_it; ++it) {
            if (cap != 0 && out.size() >= cap) {
                return out;
            }
            const auto& m = *it;
            if (m.length(0) == 0) {
                continue;
            }
            const auto start = static_cast<std::size_t>(m.position(0));
            auto        end   = start + static_cast<std::size_t>(m.length(0));
            std::string value = m.str(0);
            Confidence  confidence = p.rule.confidence;

            if (snap.settings.enable_validation) {
                if (p.validator == Validator::kLuhn && !luhn_valid(value)) {
                    const std::size_t keep = luhn_prefix_length(value);
                    if (keep == 0) {
                        continue;
                    }
                    value.resize(keep);
                    end = start + keep;
                }
                if (p.validator == Validator::kSsnChecksum) {
                    if (!ssn_structurally_valid(value)) {
                        continue;
                    }
                    const std::string digits = digits_only(value);
                    const bool bad_prefix = std::any_of(
                        cat.invalid_prefixes.begin(), cat.invalid_prefixes.end(),
                        [&digits](const std::string& pfx) {
                            return !pfx.empty() && digits.starts_with(pfx);
                        });
                    if (bad_prefix || date_context(start, end)) {
                        continue;
                    }
                    if (confidence > Confidence::kMedium) {
                        confidence = Confidence::kMedium;
                    }
                }
            }

            if (is_excluded(start, end)) {
                continue;
            }

            out.push_back(PiiMatch{
                .type       = cat.type,
                .value      = std::move(value),
                .start      = start,
                .end        = end,
                .confidence = confidence,
                .pattern_id = p.rule.id,
            });
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// detect
// ---------------------------------------------------------------------------
std::vector<PiiMatch> PiiDetector::detect(std::string_view input) const {
    const auto snap = snapshot_.load();
    const std::string text(input);

    std::vector<PiiMatch> all;
    for (const auto& cat : snap->categories) {
        if (!cat.enabled) {
            continue;
        }
        auto found = scan_category(*snap, cat, text);
        all.insert(all.end(), std::make_move_iterator(found.begin()),
                   std::make_move_iterator(found.end()));
    }

    const std::size_t raw = all.size();
    std::vector<PiiMatch> kept = dedup_spans(std::move(all));
    if (!kept.empty()) {
        spdlog::debug("pii_detector: {} matches after dedup ({} raw)", kept.size(), raw);
    }
    return kept;
}

std::vector<PiiMatch> PiiDetector::detect_by_type(std::string_view input, PiiType type) const {
    const auto snap = snapshot_.load();
    const std::string text(input);

    for (const auto& cat : snap->categories) {
        if (cat.type == type && cat.enabled) {
            return dedup_spans(scan_category(*snap, cat, text));
        }
    }
    return {};
}

std::vector<PiiCapability> PiiDetector::capabilities() const {
    const auto snap = snapshot_.load();
    std::vector<PiiCapability> out;
    for (const PiiType type : kAllPiiTypes) {
        PiiCapability cap{.type = type};
        for (const auto& cat : snap->categories) {
            if (cat.type == type) {
                cap.enabled       = cat.enabled;
                cap.pattern_count = cat.patterns.size();
                break;
            }
        }
        out.push_back(cap);
    }
    return out;
}

bool PiiDetector::is_type_enabled(PiiType type) const {
    const auto snap = snapshot_.load();
    return std::any_of(snap->categories.begin(), snap->categories.end(),
                       [type](const CompiledCategory& c) { return c.type == type && c.enabled; });
}
