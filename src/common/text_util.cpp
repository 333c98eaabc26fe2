// ---------------------------------------------------------------------------
// text_util.cpp
// ---------------------------------------------------------------------------

#include "common/text_util.hpp"
#include "common/types.hpp"

#include <algorithm>
#include <cctype>

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty() || needle.size() > haystack.size()) {
        return false;
    }
    const auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::size_t utf8_length(std::string_view s) noexcept {
    std::size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string_view> utf8_split(std::string_view s) {
    std::vector<std::string_view> out;
    out.reserve(s.size());
    std::size_t start = 0;
    for (std::size_t i = 1; i <= s.size(); ++i) {
        if (i == s.size() || (static_cast<unsigned char>(s[i]) & 0xC0u) != 0x80u) {
            out.push_back(s.substr(start, i - start));
            start = i;
        }
    }
    return out;
}

std::string truncate_utf8(std::string_view s, std::size_t max_bytes) {
    if (s.size() <= max_bytes) {
        return std::string(s);
    }
    std::size_t cut = max_bytes;
    // continuation 바이트 중간에서 자르지 않는다
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    return std::string(s.substr(0, cut));
}

std::string escape_regex(std::string_view s) {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        if (special.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// ---------------------------------------------------------------------------
// common/types.hpp 문자열 파서
// ---------------------------------------------------------------------------
std::optional<Severity> parse_severity(std::string_view s) {
    if (iequals(s, "LOW"))      { return Severity::kLow; }
    if (iequals(s, "MEDIUM"))   { return Severity::kMedium; }
    if (iequals(s, "HIGH"))     { return Severity::kHigh; }
    if (iequals(s, "CRITICAL")) { return Severity::kCritical; }
    return std::nullopt;
}

std::optional<Confidence> parse_confidence(std::string_view s) {
    if (iequals(s, "LOW"))    { return Confidence::kLow; }
    if (iequals(s, "MEDIUM")) { return Confidence::kMedium; }
    if (iequals(s, "HIGH"))   { return Confidence::kHigh; }
    return std::nullopt;
}

std::optional<PiiType> parse_pii_type(std::string_view s) {
    for (const PiiType t : kAllPiiTypes) {
        if (iequals(s, to_string(t))) {
            return t;
        }
    }
    return std::nullopt;
}
