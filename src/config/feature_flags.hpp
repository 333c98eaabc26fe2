#pragma once

// ---------------------------------------------------------------------------
// feature_flags.hpp
//
// 검사 기능 on/off 플래그. 환경변수에서 읽는다.
//
// [모드]
//   SECURITY_MODE=secure     (기본) → 모든 검사 플래그 기본값 true
//   SECURITY_MODE=vulnerable         → 모든 검사 플래그 기본값 false
//   개별 환경변수(INPUT_INSPECTION_ENABLED 등)가 모드 기본값을 덮어쓴다.
//
// [보안 주의]
// - vulnerable 모드는 데모/훈련 환경 전용. 시작 시 warn 로그를 남긴다.
// - 알 수 없는 SECURITY_MODE 값은 secure 로 취급한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class SecurityMode : std::uint8_t {
    kSecure     = 0,
    kVulnerable = 1,
};

struct FeatureFlags {
    SecurityMode mode{SecurityMode::kSecure};
    bool         input_inspection_enabled{true};
    bool         output_inspection_enabled{true};
    bool         audit_logging_enabled{true};

    // 활성화된 플래그 이름 목록 (InspectionResult.metadata 용)
    [[nodiscard]] std::vector<std::string> active_names() const;

    // 모드 기본값 적용
    [[nodiscard]] static FeatureFlags for_mode(SecurityMode mode) noexcept;

    // from_env
    //   SECURITY_MODE 와 개별 플래그 환경변수를 읽어 FeatureFlags 를 만든다.
    [[nodiscard]] static FeatureFlags from_env();
};

[[nodiscard]] std::string_view to_string(SecurityMode mode) noexcept;
