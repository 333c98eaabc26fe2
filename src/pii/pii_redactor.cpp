// ---------------------------------------------------------------------------
// pii_redactor.cpp
// ---------------------------------------------------------------------------

#include "pii/pii_redactor.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

using Json = nlohmann::ordered_json;

// 마지막 n 자리 숫자
std::string last_digits(std::string_view s, std::size_t n) {
    std::string digits;
    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            digits += c;
        }
    }
    if (digits.size() <= n) {
        return digits;
    }
    return digits.substr(digits.size() - n);
}

// 문자열 리프만 치환한다. 키와 비문자열 값은 그대로 둔다.
void redact_leaves(Json& node, const PiiRedactor& redactor, RedactionSummary& summary) {
    if (node.is_string()) {
        auto result = redactor.redact(node.get_ref<const std::string&>());
        if (result.was_redacted) {
            node = std::move(result.text);
            summary.merge(result.summary);
        }
        return;
    }
    if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            redact_leaves(child, redactor, summary);
        }
    }
}

}  // namespace

void RedactionSummary::merge(const RedactionSummary& other) {
    total += other.total;
    for (const auto& [k, v] : other.by_type) {
        by_type[k] += v;
    }
    for (const auto& [k, v] : other.by_confidence) {
        by_confidence[k] += v;
    }
    positions.insert(positions.end(), other.positions.begin(), other.positions.end());
    characters_redacted += other.characters_redacted;
}

PiiRedactor::PiiRedactor(const PiiDetector& detector, RedactorOptions options)
    : detector_(detector)
    , options_(std::move(options))
{}

PiiRedactor PiiRedactor::high_confidence_only(const PiiDetector& detector) {
    return PiiRedactor(detector, RedactorOptions{.min_confidence = Confidence::kHigh});
}

PiiRedactor PiiRedactor::with_partial_redaction(const PiiDetector& detector) {
    return PiiRedactor(detector, RedactorOptions{.partial = true});
}

std::string PiiRedactor::default_placeholder(PiiType type) {
    switch (type) {
        case PiiType::kSsn:           return "[REDACTED-SSN]";
        case PiiType::kAccountNumber: return "[REDACTED-ACCOUNT]";
        case PiiType::kLoanNumber:    return "[REDACTED-LOAN]";
        case PiiType::kCreditCard:    return "[REDACTED-CC]";
        case PiiType::kEmail:         return "[REDACTED-EMAIL]";
        case PiiType::kPhone:         return "[REDACTED-PHONE]";
    }
    return "[REDACTED]";
}

std::string PiiRedactor::placeholder_for(PiiType type) const {
    const auto it = options_.placeholders.find(type);
    if (it != options_.placeholders.end() && !it->second.empty()) {
        return it->second;
    }
    return default_placeholder(type);
}

std::string PiiRedactor::replacement_for(const PiiMatch& m) const {
    if (!options_.partial) {
        return placeholder_for(m.type);
    }
    switch (m.type) {
        case PiiType::kSsn:
            return "***-**-" + last_digits(m.value, 4);
        case PiiType::kCreditCard:
            return "****-****-****-" + last_digits(m.value, 4);
        case PiiType::kPhone:
            return "***-***-" + last_digits(m.value, 4);
        case PiiType::kEmail: {
            const auto at = m.value.rfind('@');
            if (at == std::string::npos) {
                return placeholder_for(m.type);
            }
            return "[REDACTED]" + m.value.substr(at);
        }
        case PiiType::kAccountNumber:
        case PiiType::kLoanNumber: {
            const std::size_t n = std::min<std::size_t>(3, m.value.size());
            return "[REDACTED]-" + m.value.substr(m.value.size() - n);
        }
    }
    return placeholder_for(m.type);
}

// ---------------------------------------------------------------------------
// redact
// ---------------------------------------------------------------------------
RedactionResult PiiRedactor::redact(std::string_view text) const {
    return redact(text, detector_.detect(text));
}

RedactionResult PiiRedactor::redact(std::string_view             text,
                                    const std::vector<PiiMatch>& matches) const {
    RedactionResult result{.text = std::string(text)};

    std::vector<const PiiMatch*> targets;
    targets.reserve(matches.size());
    for (const auto& m : matches) {
        if (m.confidence >= options_.min_confidence && m.start < m.end && m.end <= text.size()) {
            targets.push_back(&m);
        }
    }

    // 내림차순: 뒤쪽부터 치환해야 앞쪽 오프셋이 유지된다
    std::sort(targets.begin(), targets.end(),
              [](const PiiMatch* a, const PiiMatch* b) { return a->start > b->start; });

    std::size_t floor = text.size();  // 직전 치환 스팬의 시작 (겹침 방지)
    for (const PiiMatch* m : targets) {
        if (m->end > floor) {
            continue;
        }
        const std::string replacement = replacement_for(*m);
        const std::size_t length      = m->end - m->start;
        result.text.replace(m->start, length, replacement);
        floor = m->start;

        auto& s = result.summary;
        ++s.total;
        ++s.by_type[std::string(to_string(m->type))];
        ++s.by_confidence[std::string(to_string(m->confidence))];
        s.positions.push_back(RedactedSpan{
            .type               = m->type,
            .start              = m->start,
            .original_length    = length,
            .replacement_length = replacement.size(),
        });
        s.characters_redacted += length;
    }

    // positions 는 위치 오름차순으로 보고한다
    std::reverse(result.summary.positions.begin(), result.summary.positions.end());
    result.was_redacted = result.summary.total > 0;
    return result;
}

// ---------------------------------------------------------------------------
// redact_json
// ---------------------------------------------------------------------------
RedactionResult PiiRedactor::redact_json(std::string_view json_text) const {
    Json doc = Json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        spdlog::debug("pii_redactor: input is not valid JSON, redacting as plain text");
        return redact(json_text);
    }

    RedactionResult result;
    redact_leaves(doc, *this, result.summary);
    result.was_redacted = result.summary.total > 0;
    result.text = result.was_redacted ? doc.dump(2) : std::string(json_text);
    return result;
}
