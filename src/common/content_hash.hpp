#pragma once

// ---------------------------------------------------------------------------
// content_hash.hpp
//
// 입력/응답 원문 대신 감사 로그에 남길 SHA-256 해시 (OpenSSL EVP).
//
// [실패 처리]
// EVP 컨텍스트 생성이나 다이제스트 계산이 실패하면 std::runtime_error 를
// 던진다. 입력 파이프라인에서는 이 예외가 InputGate 까지 전파되어
// BLOCK 으로 처리된다 (fail-close).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

// 64자리 소문자 hex
[[nodiscard]] std::string sha256_hex(std::string_view data);

// 앞 prefix_len 자리만 사용하는 축약 해시 (응답 감사 로그용)
[[nodiscard]] std::string sha256_hex_prefix(std::string_view data, std::size_t prefix_len);
