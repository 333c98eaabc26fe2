#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 감사/보안 이벤트 JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 파이프라인에 전달한다.
// - 한 줄 = 한 JSON 객체. 필드명은 snake_case.
// - audit_enabled=false 이면 감사 라인(log_input/log_output/log_escalation)
//   만 억제한다. 보안 이벤트 라인은 항상 기록한다.
//
// [싱크]
// - stdout + rotating file (100MB x 3). log_path 가 비어 있으면 stdout 만 사용.
// - 매 라인 flush (감사 로그 유실 방지).
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

class StructuredLogger {
public:
    // 생성자
    //   min_level     : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path      : 로그 파일 경로 (빈 경로 = 파일 싱크 없음)
    //   audit_enabled : AUDIT_LOGGING_ENABLED 플래그
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     bool                         audit_enabled = true);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // log_input_inspection
    //   ALLOW/ESCALATE 는 info, BLOCK 은 warn.
    void log_input_inspection(const InputAuditLog& entry);

    // log_output_inspection
    //   ALLOW/REDACT 는 info, BLOCK 은 warn.
    void log_output_inspection(const OutputAuditLog& entry);

    // log_security_event
    //   CRITICAL 은 critical, 그 외 warn. audit_enabled 와 무관하게 기록한다.
    void log_security_event(const SecurityEventLog& entry);

    void log_escalation(const EscalationLog& entry);

    [[nodiscard]] bool audit_enabled() const noexcept { return audit_enabled_; }

    // 파일 싱크까지 즉시 반영 (테스트/종료 시)
    void flush();

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    bool                            audit_enabled_;
    std::shared_ptr<spdlog::logger> logger_;
};

// "debug" | "info" | "warn" | "error" → LogLevel (알 수 없으면 kInfo)
[[nodiscard]] LogLevel parse_log_level(std::string_view s) noexcept;
