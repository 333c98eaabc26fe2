// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 감사/보안 이벤트 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/text_util.hpp"

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

// ["a","b"] 형태의 JSON 배열
std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += '"';
        out += escape_json_string(items[i]);
        out += '"';
    }
    out += ']';
    return out;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view s) noexcept {
    if (iequals(s, "debug")) { return LogLevel::kDebug; }
    if (iequals(s, "warn") || iequals(s, "warning")) { return LogLevel::kWarn; }
    if (iequals(s, "error")) { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
//   전역 registry 에 등록하지 않는다. 테스트에서 여러 인스턴스를 만들어도
//   이름 충돌이 나지 않는다.
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         audit_enabled)
    : min_level_(min_level)
    , log_path_(log_path)
    , audit_enabled_(audit_enabled)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }
            constexpr std::size_t max_file_size = 100 * 1024 * 1024;  // 100MB
            constexpr std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        logger_ = std::make_shared<spdlog::logger>("llmgate_audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드가 JSON 으로 만든다. 패턴은 타임스탬프 접두어만.
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_input_inspection
// ---------------------------------------------------------------------------
void StructuredLogger::log_input_inspection(const InputAuditLog& entry) {
    const bool blocked = entry.decision == InspectionDecision::kBlock;
    const LogLevel level = blocked ? LogLevel::kWarn : LogLevel::kInfo;
    if (!audit_enabled_ || !enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"input_inspection","request_id":")" << escape_json_string(entry.request_id)
         << R"(","user_id":")" << escape_json_string(entry.user_id)
         << R"(","session_id":")" << escape_json_string(entry.session_id)
         << R"(","endpoint":")" << escape_json_string(entry.endpoint)
         << R"(","input_hash":")" << entry.input_hash
         << R"(","input_length":)" << entry.input_length
         << R"(,"decision":")" << to_string(entry.decision)
         << R"(","confidence":)" << fmt::format("{:.4f}", entry.confidence)
         << R"(,"anomaly_score":)" << fmt::format("{:.4f}", entry.anomaly_score)
         << R"(,"patterns_matched":)" << json_string_array(entry.patterns_matched);

    if (entry.factors) {
        const auto& f = *entry.factors;
        json << fmt::format(
            R"(,"factors":{{"pattern_match":{:.4f},"input_length":{:.4f},"special_chars":{:.4f},"encoding":{:.4f},"instruction":{:.4f}}})",
            f.pattern_match, f.input_length, f.special_chars, f.encoding, f.instruction);
    }
    if (!entry.list_id.empty()) {
        json << R"(,"list_id":")" << escape_json_string(entry.list_id) << '"';
    }

    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    if (blocked) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_output_inspection
// ---------------------------------------------------------------------------
void StructuredLogger::log_output_inspection(const OutputAuditLog& entry) {
    const bool blocked = entry.decision == "BLOCK";
    const LogLevel level = blocked ? LogLevel::kWarn : LogLevel::kInfo;
    if (!audit_enabled_ || !enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"output_inspection","request_id":")" << escape_json_string(entry.request_id)
         << R"(","user_id":")" << escape_json_string(entry.user_id)
         << R"(","session_id":")" << escape_json_string(entry.session_id)
         << R"(","endpoint":")" << escape_json_string(entry.endpoint)
         << R"(","response_hash":")" << entry.response_hash
         << R"(","response_length":)" << entry.response_length
         << R"(,"decision":")" << escape_json_string(entry.decision)
         << R"(","pii_types":)" << json_string_array(entry.pii_types)
         << R"(,"pii_match_count":)" << entry.pii_match_count
         << R"(,"redaction_count":)" << entry.redaction_count
         << R"(,"redactions_by_type":{)";

    bool first = true;
    for (const auto& [type, count] : entry.redactions_by_type) {
        if (!first) {
            json << ',';
        }
        first = false;
        json << '"' << escape_json_string(type) << R"(":)" << count;
    }

    json << R"(},"cross_user_detected":)" << (entry.cross_user_detected ? "true" : "false")
         << R"(,"cross_user_match_count":)" << entry.cross_user_match_count;
    if (!entry.security_event_id.empty()) {
        json << R"(,"security_event_id":")" << escape_json_string(entry.security_event_id) << '"';
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    if (blocked) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_security_event
// ---------------------------------------------------------------------------
void StructuredLogger::log_security_event(const SecurityEventLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event)
         << R"(","security_event":true,"severity":")" << escape_json_string(entry.severity)
         << R"(","request_id":")" << escape_json_string(entry.request_id)
         << R"(","user_id":")" << escape_json_string(entry.user_id)
         << R"(","session_id":")" << escape_json_string(entry.session_id)
         << R"(","endpoint":")" << escape_json_string(entry.endpoint)
         << R"(","content_hash":")" << escape_json_string(entry.content_hash)
         << R"(","event_id":")" << escape_json_string(entry.event_id)
         << R"(","score":)" << fmt::format("{:.4f}", entry.score)
         << R"(,"tags":)" << json_string_array(entry.tags)
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (entry.severity == "CRITICAL") {
        logger_->critical(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_escalation
// ---------------------------------------------------------------------------
void StructuredLogger::log_escalation(const EscalationLog& entry) {
    if (!audit_enabled_ || !enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event)
         << R"(","review_id":")" << escape_json_string(entry.review_id)
         << R"(","severity":")" << escape_json_string(entry.severity)
         << R"(","status":")" << escape_json_string(entry.status) << '"';
    if (!entry.resolution.empty()) {
        json << R"(,"resolution":")" << escape_json_string(entry.resolution)
             << R"(","reviewer":")" << escape_json_string(entry.reviewer) << '"';
    }
    json << R"(,"persisted":)" << (entry.persisted ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}
