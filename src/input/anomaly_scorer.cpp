// ---------------------------------------------------------------------------
// anomaly_scorer.cpp
//
// [오탐/미탐 트레이드오프]
// - pattern 요인 감쇠: LOW 패턴 여러 개가 쌓여 BLOCK 이 되는 것을 막는다.
//   대신 서로 다른 HIGH 패턴 다수가 섞인 공격은 max_contribution 에서 포화된다.
// - 길이 요인: 매우 짧은 입력("hi")도 최대 0.15 로, 단독으로는 escalate
//   임계값(0.3)에 닿지 않는다.
// - base64 휴리스틱은 20자 이상 연속 영숫자에 반응하므로 긴 토큰/해시를
//   붙여넣은 정상 입력에서 false positive 가 난다 (기법당 0.1 로 제한).
// - 명령형 동사는 일상 대화에도 흔하다. 동사는 +1, AI 지시 문구는 +2 로
//   차등을 두고 0.05 배율 + 상한으로 영향을 제한한다.
// ---------------------------------------------------------------------------

#include "input/anomaly_scorer.hpp"

#include "common/regex_util.hpp"
#include "common/text_util.hpp"
#include "config/rule_loader.hpp"

#include <algorithm>
#include <functional>
#include <regex>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr double kInstructionIndicatorScale = 0.05;
constexpr double kVerbWeight                = 1.0;
constexpr double kAiReferenceWeight         = 2.0;
constexpr double kConditionalWeight         = 0.5;
constexpr double kEncodingPerTechnique      = 0.1;
constexpr double kDensityScale              = 5.0;

// 인코딩 휴리스틱 정규식. 함수 내부 static 으로 한 번만 컴파일한다.
const std::regex& base64_regex() {
    static const std::regex re{R"([A-Za-z0-9+/]{20,}={0,2})", std::regex_constants::ECMAScript};
    return re;
}

const std::regex& unicode_escape_regex() {
    static const std::regex re{
        R"(\\u[0-9a-fA-F]{4}|\\x[0-9a-fA-F]{2}|&#x[0-9a-fA-F]+;|&#[0-9]+;)",
        std::regex_constants::ECMAScript};
    return re;
}

const std::regex& url_encoding_regex() {
    static const std::regex re{R"(%[0-9a-fA-F]{2}.*(%[0-9a-fA-F]{2}){2,})",
                               std::regex_constants::ECMAScript};
    return re;
}

[[nodiscard]] double severity_weight(Severity s, const SeverityWeights& w) noexcept {
    switch (s) {
        case Severity::kCritical: return w.critical;
        case Severity::kHigh:     return w.high;
        case Severity::kMedium:   return w.medium;
        case Severity::kLow:      return w.low;
    }
    return w.low;
}

struct WordRule {
    std::string                       word;
    std::shared_ptr<const std::regex> regex;  // \bword\b (icase)
};

[[nodiscard]] std::vector<WordRule> compile_words(const std::vector<std::string>& words) {
    std::vector<WordRule> out;
    out.reserve(words.size());
    for (const auto& w : words) {
        if (w.empty()) {
            continue;
        }
        out.push_back(WordRule{
            w, compile_rule_regex("\\b" + escape_regex(w) + "\\b", true, "anomaly_scorer", w)});
    }
    return out;
}

// 상세 문자열에 앞 3개 항목만 싣는다
[[nodiscard]] std::string summarize(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size() && i < 3; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += items[i];
    }
    if (items.size() > 3) {
        out += "...";
    }
    return out;
}

}  // namespace

struct AnomalyScorer::Snapshot {
    AnomalyRules          rules;
    std::vector<WordRule> verbs;
    std::vector<WordRule> conditionals;
};

std::shared_ptr<const AnomalyScorer::Snapshot> AnomalyScorer::build(const AnomalyRules& rules) {
    auto snap = std::make_shared<Snapshot>();
    snap->rules        = rules;
    snap->verbs        = compile_words(rules.instruction.imperative_verbs);
    snap->conditionals = compile_words(rules.instruction.conditionals);
    return snap;
}

AnomalyScorer::AnomalyScorer() : snapshot_(build(AnomalyRules{})) {}

AnomalyScorer::AnomalyScorer(const AnomalyRules& rules) : snapshot_(build(rules)) {}

std::expected<void, std::string> AnomalyScorer::load(const std::filesystem::path& path) {
    auto rules = RuleLoader::load_anomaly_rules(path);
    if (!rules) {
        spdlog::warn("anomaly_scorer: rule load failed, using built-in defaults");
        snapshot_.store(build(AnomalyRules{}));
        return std::unexpected(rules.error());
    }
    apply(*rules);
    return {};
}

void AnomalyScorer::apply(const AnomalyRules& rules) {
    snapshot_.store(build(rules));
    spdlog::info("anomaly_scorer: thresholds block={} escalate={}",
                 rules.thresholds.block, rules.thresholds.escalate);
}

AnomalyThresholds AnomalyScorer::thresholds() const {
    return snapshot_.load()->rules.thresholds;
}

InspectionDecision AnomalyScorer::decide(double score, const AnomalyThresholds& t) noexcept {
    if (score >= t.block) {
        return InspectionDecision::kBlock;
    }
    if (score >= t.escalate) {
        return InspectionDecision::kEscalate;
    }
    return InspectionDecision::kAllow;
}

AnomalyScore AnomalyScorer::score(std::string_view                 input,
                                  const std::vector<PatternMatch>& patterns) const {
    const auto snap = snapshot_.load();
    const AnomalyRules& r = snap->rules;
    const std::string text(input);
    const std::size_t length = utf8_length(input);

    AnomalyScore result{};

    // ── 1. pattern_match ────────────────────────────────────────────────
    {
        const auto& cfg = r.pattern_match;
        std::vector<double> weights;
        weights.reserve(patterns.size());
        for (const auto& m : patterns) {
            weights.push_back(severity_weight(m.severity, cfg.severity_weights));
        }
        std::sort(weights.begin(), weights.end(), std::greater<>());

        double total      = 0.0;
        double multiplier = 1.0;
        for (const double w : weights) {
            total += w * multiplier;
            multiplier *= cfg.diminishing_rate;
        }
        result.factors.pattern_match.score = std::min(total, cfg.max_contribution);
        result.factors.pattern_match.details =
            patterns.empty() ? "No patterns matched"
                             : fmt::format("{} pattern matches", patterns.size());
    }

    // ── 2. input_length ─────────────────────────────────────────────────
    {
        const auto& cfg = r.input_length;
        const double len = static_cast<double>(length);
        double s = 0.0;
        std::string details = "Normal length";

        if (length < cfg.very_short) {
            s = cfg.max_contribution;
            details = fmt::format("Very short input ({} chars)", length);
        } else if (length < cfg.normal_min) {
            const double span = static_cast<double>(cfg.normal_min - cfg.very_short);
            s = span > 0.0
                    ? (static_cast<double>(cfg.normal_min) - len) / span * cfg.max_contribution
                    : cfg.max_contribution;
            details = fmt::format("Short input ({} chars)", length);
        } else if (length > cfg.very_long) {
            s = cfg.max_contribution;
            details = fmt::format("Very long input ({} chars)", length);
        } else if (length > cfg.normal_max) {
            const double span = static_cast<double>(cfg.very_long - cfg.normal_max);
            s = span > 0.0
                    ? (len - static_cast<double>(cfg.normal_max)) / span * cfg.max_contribution
                    : cfg.max_contribution;
            details = fmt::format("Long input ({} chars)", length);
        }
        result.factors.input_length.score   = std::clamp(s, 0.0, cfg.max_contribution);
        result.factors.input_length.details = std::move(details);
    }

    // ── 3. special_char_density ─────────────────────────────────────────
    {
        const auto& cfg = r.special_chars;
        // 설정 문자와 입력 모두 코드 포인트 단위로 비교한다
        const std::vector<std::string_view> charset = utf8_split(cfg.characters);
        std::size_t special = 0;
        for (const std::string_view cp : utf8_split(text)) {
            if (std::find(charset.begin(), charset.end(), cp) != charset.end()) {
                ++special;
            }
        }
        const double density =
            length > 0 ? static_cast<double>(special) / static_cast<double>(length) : 0.0;

        double s = 0.0;
        if (density > cfg.threshold) {
            s = std::min((density - cfg.threshold) * kDensityScale, cfg.max_contribution);
        }
        result.factors.special_chars.score = s;
        result.factors.special_chars.details =
            fmt::format("Special char density {:.1f}%", density * 100.0);
    }

    // ── 4. encoding_detection ───────────────────────────────────────────
    {
        const auto& cfg = r.encoding;
        std::vector<std::string> detected;
        auto enabled = [&cfg](std::string_view name) {
            return std::find(cfg.techniques.begin(), cfg.techniques.end(), name) !=
                   cfg.techniques.end();
        };
        if (enabled("base64") && std::regex_search(text, base64_regex())) {
            detected.emplace_back("base64");
        }
        if (enabled("unicode_escape") && std::regex_search(text, unicode_escape_regex())) {
            detected.emplace_back("unicode_escape");
        }
        if (enabled("url_encoding") && std::regex_search(text, url_encoding_regex())) {
            detected.emplace_back("url_encoding");
        }
        result.factors.encoding.score = std::min(
            static_cast<double>(detected.size()) * kEncodingPerTechnique, cfg.max_contribution);
        result.factors.encoding.details =
            detected.empty() ? "No encoding detected"
                             : fmt::format("Detected: {}", summarize(detected));
    }

    // ── 5. instruction_language ─────────────────────────────────────────
    {
        const auto& cfg = r.instruction;
        double indicators = 0.0;
        std::vector<std::string> hits;

        for (const auto& v : snap->verbs) {
            if (v.regex && std::regex_search(text, *v.regex)) {
                indicators += kVerbWeight;
                hits.push_back(v.word);
            }
        }
        for (const auto& phrase : cfg.ai_references) {
            if (icontains(input, phrase)) {
                indicators += kAiReferenceWeight;
                hits.push_back(phrase);
            }
        }
        for (const auto& c : snap->conditionals) {
            if (c.regex && std::regex_search(text, *c.regex)) {
                indicators += kConditionalWeight;
                hits.push_back(c.word);
            }
        }

        result.factors.instruction.score =
            std::min(indicators * kInstructionIndicatorScale, cfg.max_contribution);
        result.factors.instruction.details =
            hits.empty() ? "No instruction language"
                         : fmt::format("{} instruction indicators ({})",
                                       static_cast<int>(indicators), summarize(hits));
    }

    // ── 합산 ────────────────────────────────────────────────────────────
    const auto& f = result.factors;
    const double total = f.pattern_match.score + f.input_length.score + f.special_chars.score +
                         f.encoding.score + f.instruction.score;
    result.value    = std::clamp(total, 0.0, 1.0);
    result.decision = decide(result.value, r.thresholds);

    spdlog::debug(
        "anomaly_scorer: score={:.3f} decision={} pattern={:.3f} length={:.3f} "
        "special={:.3f} encoding={:.3f} instruction={:.3f}",
        result.value, to_string(result.decision), f.pattern_match.score, f.input_length.score,
        f.special_chars.score, f.encoding.score, f.instruction.score);

    return result;
}
