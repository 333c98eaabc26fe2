#pragma once

// ---------------------------------------------------------------------------
// regex_util.hpp
//
// 규칙 정규식 컴파일/스캔 공용 헬퍼 (std::regex, ECMAScript 문법).
//
// [컴파일 실패 격리]
// compile_rule_regex() 는 std::regex_error 를 잡아 경고 로그를 남기고
// nullptr 를 반환한다. 호출자는 nullptr 를 "절대 매칭되지 않는 규칙"으로
// 보관한다. 잘못된 규칙 하나가 나머지 규칙 로드를 막지 않는다.
//
// [스캔 중 예외]
// 매칭 도중 발생하는 std::regex_error (error_complexity / error_stack) 는
// 잡지 않는다. 호출 경계(InputGate, OutputInspectionPipeline)가 차단으로
// 처리한다 (fail-close).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <string_view>

// compile_rule_regex
//   pattern        : ECMAScript 정규식 소스
//   case_insensitive: true 면 icase 플래그 추가
//   owner / rule_id: 실패 로그용 식별자 (정규식 원문은 로그에 남기지 않는다)
[[nodiscard]] std::shared_ptr<const std::regex> compile_rule_regex(
    const std::string& pattern,
    bool               case_insensitive,
    std::string_view   owner,
    std::string_view   rule_id);

// for_each_match
//   text 전체를 스캔하며 겹치지 않는 매치마다 fn(start, length) 를 호출한다.
//   max_matches 에 도달하면 중단한다 (0 = 무제한).
//   반환: 호출 횟수
std::size_t for_each_match(
    const std::regex&                                   re,
    const std::string&                                  text,
    std::size_t                                         max_matches,
    const std::function<void(std::size_t, std::size_t)>& fn);
