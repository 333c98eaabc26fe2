#pragma once

// ---------------------------------------------------------------------------
// text_util.hpp
//
// ASCII 대소문자 변환, 비교, UTF-8 길이 계산 등 공용 문자열 헬퍼.
//
// [알려진 한계]
// - 대소문자 변환은 ASCII 범위만 처리한다. 비 ASCII 문자는 그대로 둔다.
// - utf8_length 는 잘못된 UTF-8 시퀀스를 검증하지 않는다. continuation
//   바이트(10xxxxxx)를 제외한 바이트 수를 센다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

[[nodiscard]] std::string to_lower_ascii(std::string_view s);
[[nodiscard]] std::string to_upper_ascii(std::string_view s);

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// haystack 안에 needle 이 대소문자 무시로 포함되어 있는지 검사한다.
// needle 이 비어 있으면 false.
[[nodiscard]] bool icontains(std::string_view haystack, std::string_view needle);

// 앞뒤 공백(스페이스, 탭, 개행) 제거
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

// UTF-8 코드 포인트 수
[[nodiscard]] std::size_t utf8_length(std::string_view s) noexcept;

// 코드 포인트 단위로 자른 조각들 (원본을 가리키는 뷰). 경계 규칙은 utf8_length 와 같다.
[[nodiscard]] std::vector<std::string_view> utf8_split(std::string_view s);

// 감사 로그용 절단. max_bytes 를 넘으면 UTF-8 경계에서 자른다.
[[nodiscard]] std::string truncate_utf8(std::string_view s, std::size_t max_bytes);

// std::regex 리터럴 이스케이프 (키워드를 \b...\b 패턴으로 조합할 때 사용)
[[nodiscard]] std::string escape_regex(std::string_view s);
