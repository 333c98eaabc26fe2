#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 검사 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_input / on_output: 요청 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로(UDS stats 명령)에서 호출. mutex 없이 읽는다.
//
// [격리 원칙]
// - 통계 갱신 실패가 검사 판정으로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   input_block_rate : inputs_blocked / inputs_total (total == 0 이면 0.0)
//   inspections_per_sec: 시작 이후 평균 (입력 + 출력)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         inputs_total{0};
    std::uint64_t                         inputs_blocked{0};
    std::uint64_t                         inputs_escalated{0};
    std::uint64_t                         outputs_total{0};
    std::uint64_t                         outputs_redacted{0};
    std::uint64_t                         outputs_blocked{0};
    double                                input_block_rate{0.0};
    double                                inspections_per_sec{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

// 출력 검사 판정 (통계용 축약)
enum class OutputOutcome : std::uint8_t {
    kAllowed  = 0,
    kRedacted = 1,
    kBlocked  = 2,
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : inputs_total_{0}
        , inputs_blocked_{0}
        , inputs_escalated_{0}
        , outputs_total_{0}
        , outputs_redacted_{0}
        , outputs_blocked_{0}
        , started_at_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_input
    //   입력 검사 1회 완료 시 호출 (InputGate).
    void on_input(InspectionDecision decision) noexcept {
        inputs_total_.fetch_add(1, std::memory_order_relaxed);
        if (decision == InspectionDecision::kBlock) {
            inputs_blocked_.fetch_add(1, std::memory_order_relaxed);
        } else if (decision == InspectionDecision::kEscalate) {
            inputs_escalated_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_output
    //   출력 검사 1회 완료 시 호출 (OutputInspectionPipeline).
    void on_output(OutputOutcome outcome) noexcept {
        outputs_total_.fetch_add(1, std::memory_order_relaxed);
        if (outcome == OutputOutcome::kRedacted) {
            outputs_redacted_.fetch_add(1, std::memory_order_relaxed);
        } else if (outcome == OutputOutcome::kBlocked) {
            outputs_blocked_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now         = std::chrono::system_clock::now();
        const auto in_total    = inputs_total_.load(std::memory_order_relaxed);
        const auto in_blocked  = inputs_blocked_.load(std::memory_order_relaxed);
        const auto in_escal    = inputs_escalated_.load(std::memory_order_relaxed);
        const auto out_total   = outputs_total_.load(std::memory_order_relaxed);
        const auto out_redact  = outputs_redacted_.load(std::memory_order_relaxed);
        const auto out_blocked = outputs_blocked_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();

        double per_sec = 0.0;
        if (elapsed_sec > 0.0) {
            per_sec = static_cast<double>(in_total + out_total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (in_total > 0) {
            block_rate = static_cast<double>(in_blocked) / static_cast<double>(in_total);
        }

        return StatsSnapshot{
            .inputs_total        = in_total,
            .inputs_blocked      = in_blocked,
            .inputs_escalated    = in_escal,
            .outputs_total       = out_total,
            .outputs_redacted    = out_redact,
            .outputs_blocked     = out_blocked,
            .input_block_rate    = block_rate,
            .inspections_per_sec = per_sec,
            .captured_at         = now,
        };
    }

private:
    std::atomic<std::uint64_t>            inputs_total_;
    std::atomic<std::uint64_t>            inputs_blocked_;
    std::atomic<std::uint64_t>            inputs_escalated_;
    std::atomic<std::uint64_t>            outputs_total_;
    std::atomic<std::uint64_t>            outputs_redacted_;
    std::atomic<std::uint64_t>            outputs_blocked_;
    const std::chrono::system_clock::time_point started_at_;
};
