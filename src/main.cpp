#include "common/persistence_executor.hpp"
#include "config/feature_flags.hpp"
#include "config/rule_loader.hpp"
#include "escalation/escalation_queue.hpp"
#include "escalation/escalation_store.hpp"
#include "input/anomaly_scorer.hpp"
#include "input/input_gate.hpp"
#include "input/inspection_pipeline.hpp"
#include "input/list_checker.hpp"
#include "input/pattern_matcher.hpp"
#include "logger/structured_logger.hpp"
#include "output/output_inspection_pipeline.hpp"
#include "output/security_event_store.hpp"
#include "pii/cross_user_classifier.hpp"
#include "pii/identity_directory.hpp"
#include "pii/pii_detector.hpp"
#include "pii/pii_redactor.hpp"
#include "stats/command_dispatcher.hpp"
#include "stats/stats_collector.hpp"
#include "stats/uds_server.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#ifndef LLMGATE_CONFIG_DIR
#define LLMGATE_CONFIG_DIR "config"
#endif

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

uint32_t env_u32(const char* name, uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed < 0) {
            spdlog::warn("env {}: negative value {}, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

// 규칙 파일 경로 묶음
struct RulePaths {
    std::filesystem::path patterns;
    std::filesystem::path lists;
    std::filesystem::path anomaly;
    std::filesystem::path pii;
    std::filesystem::path identities;
};

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const std::filesystem::path config_dir = env_str("CONFIG_DIR", LLMGATE_CONFIG_DIR);
    const RulePaths paths{
        .patterns   = env_str("PATTERNS_PATH",   (config_dir / "injection_patterns.yaml").string()),
        .lists      = env_str("LISTS_PATH",      (config_dir / "lists.yaml").string()),
        .anomaly    = env_str("ANOMALY_RULES_PATH", (config_dir / "anomaly_rules.yaml").string()),
        .pii        = env_str("PII_PATTERNS_PATH", (config_dir / "pii_patterns.yaml").string()),
        .identities = env_str("IDENTITIES_PATH", (config_dir / "identities.yaml").string()),
    };
    const std::string uds_socket_path = env_str("UDS_SOCKET_PATH", "/tmp/llmgate.sock");
    const std::string log_path        = env_str("LOG_PATH",        "/tmp/llmgate.log");
    const std::string log_level       = env_str("LOG_LEVEL",       "info");
    const uint32_t    persist_threads = env_u32("PERSISTENCE_THREADS",    2);
    const uint32_t    persist_timeout = env_u32("PERSISTENCE_TIMEOUT_MS", 2000);

    const FeatureFlags flags = FeatureFlags::from_env();

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::info("Starting llmgate inspection service");
    spdlog::info("Security mode: {}", to_string(flags.mode));
    spdlog::info("Config dir: {}", config_dir.string());
    spdlog::info("UDS socket: {}", uds_socket_path);
    spdlog::info("Log level: {}", log_level);

    StructuredLogger logger{parse_log_level(log_level), log_path, flags.audit_logging_enabled};

    // ── 규칙 로드 (실패 시 각 컴포넌트가 fail-open/기본값 처리) ──────────
    ListChecker    lists;
    PatternMatcher patterns;
    AnomalyScorer  scorer;
    PiiDetector    detector;

    auto load_rules = [&]() -> std::expected<void, std::string> {
        std::vector<std::string> errors;
        if (auto r = lists.load(paths.lists); !r)       { errors.push_back(r.error()); }
        if (auto r = patterns.load(paths.patterns); !r) { errors.push_back(r.error()); }
        if (auto r = scorer.load(paths.anomaly); !r)    { errors.push_back(r.error()); }
        if (auto r = detector.load(paths.pii); !r)      { errors.push_back(r.error()); }
        if (!errors.empty()) {
            return std::unexpected(fmt::format("{}", fmt::join(errors, "; ")));
        }
        return {};
    };
    if (auto loaded = load_rules(); !loaded) {
        spdlog::warn("Some rule files failed to load: {}", loaded.error());
    }

    auto identities = std::make_shared<IdentityDirectory>();
    if (auto seed = RuleLoader::load_identities(paths.identities)) {
        for (const auto& record : *seed) {
            identities->upsert(record);
        }
    } else {
        spdlog::warn("Identity seed not loaded, cross-user checks rely on email lookups only");
    }

    // ── 구성 요소 조립 ──────────────────────────────────────────────────
    PersistenceExecutor executor{persist_threads, std::chrono::milliseconds{persist_timeout}};
    StatsCollector      stats;

    auto escalation_store = std::make_shared<InMemoryEscalationStore>();
    auto event_store      = std::make_shared<InMemorySecurityEventStore>();

    EscalationQueue        escalations{escalation_store, executor, &logger};
    InputInspectionPipeline input_pipeline{lists, patterns, scorer, &logger, flags};
    InputGate              gate{input_pipeline, &escalations, &stats, flags};

    CrossUserClassifier      classifier{detector, identities, executor};
    PiiRedactor              redactor{detector};
    OutputInspectionPipeline output_pipeline{detector, classifier, redactor, event_store,
                                             executor, &logger, &stats, flags};

    CommandDispatcher dispatcher{ControlPlane{
        .stats           = &stats,
        .input_gate      = &gate,
        .output_pipeline = &output_pipeline,
        .escalations     = &escalations,
        .classifier      = &classifier,
        .reload          = [&]() {
            auto reloaded = load_rules();
            // 새 PII 규칙이 반영되도록 식별자 캐시도 비운다
            classifier.clear_caches();
            return reloaded;
        },
    }};

    // ── UDS 제어 서버 실행 ──────────────────────────────────────────────
    boost::asio::io_context ioc;
    UdsServer server{uds_socket_path, dispatcher, ioc};

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signo);
        // 열린 제어 세션은 기다리지 않는다. stop() 의 정리 작업이 먼저 실행된다.
        server.stop();
        boost::asio::post(ioc, [&ioc]() { ioc.stop(); });
    });

    boost::asio::co_spawn(ioc, server.run(), boost::asio::detached);
    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    logger.flush();
    spdlog::info("llmgate stopped");

    return EXIT_SUCCESS;
}
