// ---------------------------------------------------------------------------
// rule_loader.cpp
//
// YAML 규칙 문서 파서.
//
// [공통 흐름]
// 1. canonical 경로 정규화 (실패 → unexpected)
// 2. YAML::LoadFile (BadFile / ParserException / Exception → unexpected)
// 3. 최상위 map 검증
// 4. 섹션별 파싱 (섹션 단위 try-catch)
// 5. 요약 info 로그 (개수만, 내용은 출력하지 않음)
//
// [알려진 한계]
// - 정규식 유효성은 여기서 검사하지 않는다. 컴파일 실패는 각 컴포넌트가
//   규칙 단위로 격리한다.
// - 알 수 없는 키는 무시한다 (문서 버전 간 호환성).
// ---------------------------------------------------------------------------

#include "config/rule_loader.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 읽기 (없거나 변환 불가 → fallback)
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] double read_double(const YAML::Node& node, double fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// 노드가 sequence 가 아니면 fallback 을 그대로 반환한다.
[[nodiscard]] std::vector<std::string> read_string_sequence(
    const YAML::Node& node, const std::vector<std::string>& fallback = {}) {
    if (!node || !node.IsSequence()) {
        return fallback;
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool in_unit_range(double v) noexcept {
    return v >= 0.0 && v <= 1.0;
}

// ---------------------------------------------------------------------------
// load_document
//   경로 정규화 + YAML 로드 + 최상위 map 검증.
//   tag: 로그 접두어 ("pattern_rules", "list_rules" ...)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<YAML::Node, std::string>
load_document(const std::filesystem::path& path, std::string_view tag) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "{}: cannot resolve config path '{}': {}", tag, path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("{}: loading rules from '{}'", tag, canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "{}: cannot open file '{}': {}", tag, canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "{}: YAML parse error in '{}' at line {}, col {}: {}",
            tag, canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "{}: YAML error in '{}': {}", tag, canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "{}: '{}' is not a valid YAML map (top-level)", tag, canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return root;
}

// ---------------------------------------------------------------------------
// 인젝션 패턴 섹션
// ---------------------------------------------------------------------------
[[nodiscard]] Severity read_severity(const YAML::Node& node, Severity fallback,
                                     std::string_view owner_id) {
    const std::string raw = read_string(node, "");
    if (raw.empty()) {
        return fallback;
    }
    if (const auto sev = parse_severity(raw)) {
        return *sev;
    }
    spdlog::warn("pattern_rules: unknown severity '{}' on '{}', using {}",
                 raw, owner_id, to_string(fallback));
    return fallback;
}

[[nodiscard]] std::vector<PatternCategory> parse_categories(const YAML::Node& node) {
    std::vector<PatternCategory> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    for (const auto& item : node) {
        if (!item.IsMap()) {
            continue;
        }
        PatternCategory cat{};
        cat.id       = read_string(item["id"], "");
        cat.name     = read_string(item["name"], cat.id);
        cat.severity = read_severity(item["severity"], Severity::kMedium, cat.id);
        if (cat.id.empty()) {
            spdlog::warn("pattern_rules: category without id, skipping");
            continue;
        }
        result.push_back(std::move(cat));
    }
    return result;
}

[[nodiscard]] std::vector<PatternRule> parse_pattern_rules(
    const YAML::Node& node, const std::vector<PatternCategory>& categories) {
    std::vector<PatternRule> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsMap()) {
            continue;
        }
        PatternRule rule{};
        rule.id          = read_string(item["id"], "");
        rule.category    = read_string(item["category"], "uncategorized");
        rule.name        = read_string(item["name"], rule.id);
        rule.pattern     = read_string(item["pattern"], "");
        rule.flags       = read_string(item["flags"], "");
        rule.description = read_string(item["description"], "");

        if (rule.id.empty() || rule.pattern.empty()) {
            spdlog::warn("pattern_rules: pattern entry missing id or pattern, skipping");
            continue;
        }

        // severity 미지정 시 카테고리 severity 를 상속한다
        Severity inherited = Severity::kMedium;
        const auto cat_it = std::find_if(
            categories.begin(), categories.end(),
            [&](const PatternCategory& c) { return c.id == rule.category; });
        if (cat_it != categories.end()) {
            inherited = cat_it->severity;
        }
        rule.severity = read_severity(item["severity"], inherited, rule.id);

        result.push_back(std::move(rule));
    }
    return result;
}

// ---------------------------------------------------------------------------
// 허용/차단 목록 섹션
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<ListEntryRule> parse_list_entries(const YAML::Node& node,
                                                            std::string_view list_name) {
    std::vector<ListEntryRule> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsMap()) {
            continue;
        }
        ListEntryRule entry{};
        entry.id       = read_string(item["id"], "");
        entry.pattern  = read_string(item["pattern"], "");
        entry.reason   = read_string(item["reason"], "");
        entry.added_by = read_string(item["added_by"], "");
        entry.added_at = read_string(item["added_at"], "");

        if (entry.id.empty() || entry.pattern.empty()) {
            spdlog::warn("list_rules: {} entry missing id or pattern, skipping", list_name);
            continue;
        }

        const std::string type = read_string(item["type"], "exact");
        if (type == "regex") {
            entry.kind = ListEntryKind::kRegex;
        } else {
            if (type != "exact") {
                spdlog::warn("list_rules: entry '{}' has unknown type '{}', treating as exact",
                             entry.id, type);
            }
            entry.kind = ListEntryKind::kExact;
        }
        result.push_back(std::move(entry));
    }
    return result;
}

// ---------------------------------------------------------------------------
// 이상 점수 섹션
// ---------------------------------------------------------------------------
[[nodiscard]] AnomalyThresholds parse_thresholds(const YAML::Node& node) {
    AnomalyThresholds defaults{};
    if (!node || !node.IsMap()) {
        return defaults;
    }
    AnomalyThresholds t{};
    t.block    = read_double(node["block"],    defaults.block);
    t.escalate = read_double(node["escalate"], defaults.escalate);
    t.allow    = read_double(node["allow"],    defaults.allow);

    if (!in_unit_range(t.block) || !in_unit_range(t.escalate) || !in_unit_range(t.allow) ||
        t.escalate > t.block) {
        spdlog::warn(
            "anomaly_rules: invalid thresholds (block={}, escalate={}, allow={}), "
            "using built-in defaults",
            t.block, t.escalate, t.allow);
        return defaults;
    }
    return t;
}

[[nodiscard]] double read_contribution(const YAML::Node& node, double fallback,
                                       std::string_view factor) {
    const double v = read_double(node, fallback);
    if (!in_unit_range(v)) {
        spdlog::warn("anomaly_rules: {}.max_contribution={} out of [0,1], using {}",
                     factor, v, fallback);
        return fallback;
    }
    return v;
}

[[nodiscard]] PatternFactorRules parse_pattern_factor(const YAML::Node& node) {
    PatternFactorRules r{};
    if (!node || !node.IsMap()) {
        return r;
    }
    r.max_contribution = read_contribution(node["max_contribution"], r.max_contribution,
                                           "pattern_match");
    const YAML::Node& w = node["severity_weights"];
    if (w && w.IsMap()) {
        r.severity_weights.critical = read_double(w["CRITICAL"], r.severity_weights.critical);
        r.severity_weights.high     = read_double(w["HIGH"],     r.severity_weights.high);
        r.severity_weights.medium   = read_double(w["MEDIUM"],   r.severity_weights.medium);
        r.severity_weights.low      = read_double(w["LOW"],      r.severity_weights.low);
    }
    const double rate = read_double(node["diminishing_rate"], r.diminishing_rate);
    if (in_unit_range(rate)) {
        r.diminishing_rate = rate;
    } else {
        spdlog::warn("anomaly_rules: diminishing_rate={} out of [0,1], using {}",
                     rate, r.diminishing_rate);
    }
    return r;
}

[[nodiscard]] LengthFactorRules parse_length_factor(const YAML::Node& node) {
    const LengthFactorRules defaults{};
    if (!node || !node.IsMap()) {
        return defaults;
    }
    LengthFactorRules r{};
    r.max_contribution = read_contribution(node["max_contribution"], r.max_contribution,
                                           "input_length");
    const YAML::Node& range = node["normal_range"];
    if (range && range.IsMap()) {
        r.normal_min = read_uint32(range["min"], r.normal_min);
        r.normal_max = read_uint32(range["max"], r.normal_max);
    }
    r.very_short = read_uint32(node["very_short"], r.very_short);
    r.very_long  = read_uint32(node["very_long"],  r.very_long);

    if (r.very_short > r.normal_min || r.normal_min > r.normal_max ||
        r.normal_max > r.very_long) {
        spdlog::warn(
            "anomaly_rules: input_length bounds must satisfy very_short <= min <= max <= "
            "very_long, using built-in defaults");
        LengthFactorRules fixed = defaults;
        fixed.max_contribution  = r.max_contribution;
        return fixed;
    }
    return r;
}

[[nodiscard]] SpecialCharFactorRules parse_special_char_factor(const YAML::Node& node) {
    SpecialCharFactorRules r{};
    if (!node || !node.IsMap()) {
        return r;
    }
    r.max_contribution = read_contribution(node["max_contribution"], r.max_contribution,
                                           "special_characters");
    r.characters = read_string(node["characters"], r.characters);
    r.threshold  = read_double(node["threshold"], r.threshold);
    return r;
}

[[nodiscard]] EncodingFactorRules parse_encoding_factor(const YAML::Node& node) {
    EncodingFactorRules r{};
    if (!node || !node.IsMap()) {
        return r;
    }
    r.max_contribution = read_contribution(node["max_contribution"], r.max_contribution,
                                           "encoding_detection");
    r.techniques = read_string_sequence(node["techniques"], r.techniques);
    return r;
}

[[nodiscard]] InstructionFactorRules parse_instruction_factor(const YAML::Node& node) {
    InstructionFactorRules r{};
    if (!node || !node.IsMap()) {
        return r;
    }
    r.max_contribution = read_contribution(node["max_contribution"], r.max_contribution,
                                           "instruction_language");
    r.imperative_verbs = read_string_sequence(node["imperative_verbs"], r.imperative_verbs);
    r.conditionals     = read_string_sequence(node["conditional_words"], r.conditionals);
    r.ai_references    = read_string_sequence(node["ai_references"],    r.ai_references);
    return r;
}

// ---------------------------------------------------------------------------
// PII 섹션
// ---------------------------------------------------------------------------
[[nodiscard]] PiiSettings parse_pii_settings(const YAML::Node& node) {
    PiiSettings s{};
    if (!node || !node.IsMap()) {
        return s;
    }
    s.case_sensitive       = read_bool(node["case_sensitive"], s.case_sensitive);
    s.max_matches_per_type = read_uint32(node["max_matches_per_type"], s.max_matches_per_type);
    s.enable_validation    = read_bool(node["enable_validation"], s.enable_validation);
    if (s.max_matches_per_type == 0) {
        spdlog::warn("pii_rules: max_matches_per_type must be positive, using 100");
        s.max_matches_per_type = 100;
    }
    return s;
}

[[nodiscard]] PiiCategoryRules parse_pii_category(PiiType type, const YAML::Node& node) {
    PiiCategoryRules cat{};
    cat.type = type;
    if (!node.IsMap()) {
        cat.enabled = false;
        return cat;
    }
    cat.enabled = read_bool(node["enabled"], true);

    const YAML::Node& patterns = node["patterns"];
    if (patterns && patterns.IsSequence()) {
        for (const auto& item : patterns) {
            if (!item.IsMap()) {
                continue;
            }
            PiiPatternRule p{};
            p.id         = read_string(item["id"], "");
            p.name       = read_string(item["name"], p.id);
            p.pattern    = read_string(item["pattern"], "");
            p.validation = read_string(item["validation"], "");
            if (p.id.empty() || p.pattern.empty()) {
                spdlog::warn("pii_rules: {} pattern missing id or pattern, skipping",
                             to_string(type));
                continue;
            }
            const std::string conf = read_string(item["confidence"], "MEDIUM");
            if (const auto c = parse_confidence(conf)) {
                p.confidence = *c;
            } else {
                spdlog::warn("pii_rules: pattern '{}' has unknown confidence '{}', using MEDIUM",
                             p.id, conf);
            }
            cat.patterns.push_back(std::move(p));
        }
    }

    const YAML::Node& exclusions = node["exclusions"];
    if (exclusions && exclusions.IsSequence()) {
        for (const auto& item : exclusions) {
            PiiExclusionRule ex{};
            if (item.IsScalar()) {
                ex.pattern = item.as<std::string>();
            } else if (item.IsMap()) {
                ex.pattern = read_string(item["pattern"], "");
                ex.reason  = read_string(item["reason"], "");
            }
            if (!ex.pattern.empty()) {
                cat.exclusions.push_back(std::move(ex));
            }
        }
    }

    cat.invalid_prefixes = read_string_sequence(node["invalid_prefixes"]);
    return cat;
}

}  // namespace

// ---------------------------------------------------------------------------
// RuleLoader::load_patterns
// ---------------------------------------------------------------------------
std::expected<PatternRuleSet, std::string>
RuleLoader::load_patterns(const std::filesystem::path& path) {
    auto root = load_document(path, "pattern_rules");
    if (!root) {
        return std::unexpected(root.error());
    }

    PatternRuleSet rules{};
    try {
        rules.version    = read_string((*root)["version"], "");
        rules.categories = parse_categories((*root)["categories"]);
        rules.patterns   = parse_pattern_rules((*root)["patterns"], rules.categories);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("pattern_rules: error parsing patterns: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("pattern_rules: loaded version='{}' categories={} patterns={}",
                 rules.version, rules.categories.size(), rules.patterns.size());
    return rules;
}

// ---------------------------------------------------------------------------
// RuleLoader::load_lists
// ---------------------------------------------------------------------------
std::expected<ListRuleSet, std::string>
RuleLoader::load_lists(const std::filesystem::path& path) {
    auto root = load_document(path, "list_rules");
    if (!root) {
        return std::unexpected(root.error());
    }

    ListRuleSet rules{};
    try {
        rules.version    = read_string((*root)["version"], "");
        rules.allow_list = parse_list_entries((*root)["allow_list"], "allow_list");
        rules.block_list = parse_list_entries((*root)["block_list"], "block_list");
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("list_rules: error parsing lists: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("list_rules: loaded version='{}' allow={} block={}",
                 rules.version, rules.allow_list.size(), rules.block_list.size());
    return rules;
}

// ---------------------------------------------------------------------------
// RuleLoader::load_anomaly_rules
// ---------------------------------------------------------------------------
std::expected<AnomalyRules, std::string>
RuleLoader::load_anomaly_rules(const std::filesystem::path& path) {
    auto root = load_document(path, "anomaly_rules");
    if (!root) {
        return std::unexpected(root.error());
    }

    AnomalyRules rules{};
    try {
        rules.version    = read_string((*root)["version"], "");
        rules.thresholds = parse_thresholds((*root)["thresholds"]);

        const YAML::Node& factors = (*root)["factors"];
        if (factors && factors.IsMap()) {
            rules.pattern_match = parse_pattern_factor(factors["pattern_match"]);
            rules.input_length  = parse_length_factor(factors["input_length"]);
            rules.special_chars = parse_special_char_factor(factors["special_characters"]);
            rules.encoding      = parse_encoding_factor(factors["encoding_detection"]);
            rules.instruction   = parse_instruction_factor(factors["instruction_language"]);
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("anomaly_rules: error parsing rules: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("anomaly_rules: loaded version='{}' block={} escalate={}",
                 rules.version, rules.thresholds.block, rules.thresholds.escalate);
    return rules;
}

// ---------------------------------------------------------------------------
// RuleLoader::load_pii_rules
// ---------------------------------------------------------------------------
std::expected<PiiRuleSet, std::string>
RuleLoader::load_pii_rules(const std::filesystem::path& path) {
    auto root = load_document(path, "pii_rules");
    if (!root) {
        return std::unexpected(root.error());
    }

    PiiRuleSet rules{};
    try {
        rules.version  = read_string((*root)["version"], "");
        rules.settings = parse_pii_settings((*root)["settings"]);

        const YAML::Node& categories = (*root)["categories"];
        if (categories && categories.IsMap()) {
            for (const auto& kv : categories) {
                const std::string key = kv.first.as<std::string>();
                const auto type = parse_pii_type(key);
                if (!type) {
                    spdlog::warn("pii_rules: unknown PII category '{}', skipping", key);
                    continue;
                }
                rules.categories.push_back(parse_pii_category(*type, kv.second));
            }
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("pii_rules: error parsing rules: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    std::size_t pattern_count = 0;
    for (const auto& c : rules.categories) {
        pattern_count += c.patterns.size();
    }
    spdlog::info("pii_rules: loaded version='{}' categories={} patterns={}",
                 rules.version, rules.categories.size(), pattern_count);
    return rules;
}

// ---------------------------------------------------------------------------
// RuleLoader::load_identities
// ---------------------------------------------------------------------------
std::expected<std::vector<IdentityRecord>, std::string>
RuleLoader::load_identities(const std::filesystem::path& path) {
    auto root = load_document(path, "identity_seed");
    if (!root) {
        return std::unexpected(root.error());
    }

    std::vector<IdentityRecord> users;
    try {
        const YAML::Node& node = (*root)["users"];
        if (node && node.IsSequence()) {
            for (const auto& item : node) {
                if (!item.IsMap()) {
                    continue;
                }
                IdentityRecord rec{};
                rec.user_id           = read_string(item["id"], "");
                rec.email             = read_string(item["email"], "");
                rec.name              = read_string(item["name"], "");
                rec.transaction_texts = read_string_sequence(item["transactions"]);
                if (rec.user_id.empty()) {
                    spdlog::warn("identity_seed: user entry without id, skipping");
                    continue;
                }
                users.push_back(std::move(rec));
            }
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("identity_seed: error parsing users: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("identity_seed: loaded users={}", users.size());
    return users;
}
