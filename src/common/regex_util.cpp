// ---------------------------------------------------------------------------
// regex_util.cpp
// ---------------------------------------------------------------------------

#include "common/regex_util.hpp"

#include <iterator>

#include <spdlog/spdlog.h>

std::shared_ptr<const std::regex> compile_rule_regex(
    const std::string& pattern,
    bool               case_insensitive,
    std::string_view   owner,
    std::string_view   rule_id)
{
    auto flags = std::regex_constants::ECMAScript;
    if (case_insensitive) {
        flags |= std::regex_constants::icase;
    }
    try {
        return std::make_shared<const std::regex>(pattern, flags);
    } catch (const std::regex_error& e) {
        // [미탐 경보] 이 규칙은 이후 어떤 입력에도 매칭되지 않는다.
        spdlog::warn("{}: rule '{}' has invalid regex, it will never match: {}",
                     owner, rule_id, e.what());
        return nullptr;
    }
}

std::size_t for_each_match(
    const std::regex&                                   re,
    const std::string&                                  text,
    std::size_t                                         max_matches,
    const std::function<void(std::size_t, std::size_t)>& fn)
{
    std::size_t count = 0;
    const auto begin = std::sregex_iterator(text.begin(), text.end(), re);
    const auto end   = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        const auto& m = *it;
        // 빈 매치는 스팬이 없으므로 보고하지 않는다
        if (m.length(0) == 0) {
            continue;
        }
        fn(static_cast<std::size_t>(m.position(0)), static_cast<std::size_t>(m.length(0)));
        ++count;
        if (max_matches != 0 && count >= max_matches) {
            break;
        }
    }
    return count;
}
