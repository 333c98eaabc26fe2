// ---------------------------------------------------------------------------
// feature_flags.cpp
// ---------------------------------------------------------------------------

#include "config/feature_flags.hpp"

#include "common/text_util.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

namespace {

// 값이 없으면 fallback. true/false/1/0/yes/no 외의 값은 경고 후 fallback.
bool env_flag(const char* name, bool fallback) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return fallback;
    }
    const std::string_view v{val};
    if (iequals(v, "true") || v == "1" || iequals(v, "yes")) {
        return true;
    }
    if (iequals(v, "false") || v == "0" || iequals(v, "no")) {
        return false;
    }
    spdlog::warn("feature_flags: env {} has invalid value '{}', using {}", name, v, fallback);
    return fallback;
}

}  // namespace

std::string_view to_string(SecurityMode mode) noexcept {
    return mode == SecurityMode::kVulnerable ? "vulnerable" : "secure";
}

std::vector<std::string> FeatureFlags::active_names() const {
    std::vector<std::string> names;
    if (input_inspection_enabled) {
        names.emplace_back("INPUT_INSPECTION_ENABLED");
    }
    if (output_inspection_enabled) {
        names.emplace_back("OUTPUT_INSPECTION_ENABLED");
    }
    if (audit_logging_enabled) {
        names.emplace_back("AUDIT_LOGGING_ENABLED");
    }
    return names;
}

FeatureFlags FeatureFlags::for_mode(SecurityMode mode) noexcept {
    const bool on = (mode == SecurityMode::kSecure);
    return FeatureFlags{
        .mode                      = mode,
        .input_inspection_enabled  = on,
        .output_inspection_enabled = on,
        .audit_logging_enabled     = on,
    };
}

FeatureFlags FeatureFlags::from_env() {
    SecurityMode mode = SecurityMode::kSecure;
    const char* raw_mode = std::getenv("SECURITY_MODE");  // NOLINT(concurrency-mt-unsafe)
    if (raw_mode != nullptr && raw_mode[0] != '\0') {
        if (iequals(raw_mode, "vulnerable")) {
            mode = SecurityMode::kVulnerable;
        } else if (!iequals(raw_mode, "secure")) {
            spdlog::warn("feature_flags: unknown SECURITY_MODE '{}', using secure", raw_mode);
        }
    }

    FeatureFlags flags = for_mode(mode);
    flags.input_inspection_enabled =
        env_flag("INPUT_INSPECTION_ENABLED", flags.input_inspection_enabled);
    flags.output_inspection_enabled =
        env_flag("OUTPUT_INSPECTION_ENABLED", flags.output_inspection_enabled);
    flags.audit_logging_enabled =
        env_flag("AUDIT_LOGGING_ENABLED", flags.audit_logging_enabled);

    if (mode == SecurityMode::kVulnerable) {
        spdlog::warn("feature_flags: SECURITY_MODE=vulnerable, inspection defaults are OFF");
    }
    spdlog::info("feature_flags: mode={} input={} output={} audit={}",
                 to_string(mode), flags.input_inspection_enabled,
                 flags.output_inspection_enabled, flags.audit_logging_enabled);
    return flags;
}
