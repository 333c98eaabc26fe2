#pragma once

// ---------------------------------------------------------------------------
// persistence_executor.hpp
//
// 저장소 협력자(에스컬레이션 레코드, 보안 이벤트, 사용자 식별자 조회)
// 호출을 Boost.Asio thread_pool 에서 실행하고, 호출 측은 제한 시간까지만
// 결과를 기다린다.
//
// [설계 원칙]
// - 감사 쓰기 지연이 요청 처리 지연으로 번지지 않아야 한다.
//   제한 시간을 넘기면 호출 측은 std::unexpected("... timed out") 를 받고
//   판정을 계속 진행한다.
// - 이미 제출된 쓰기는 취소하지 않는다. 제한 시간 이후에도 백그라운드에서
//   완료되거나 독립적으로 실패한다. 따라서 작업 람다는 호출 측 지역 변수를
//   참조로 캡처하면 안 된다 (값 캡처 또는 shared_ptr 만 허용).
// - 작업이 던진 예외는 std::unexpected(e.what()) 로 변환한다.
//
// [종료]
// 소멸자에서 thread_pool::join() 으로 진행 중 작업 완료를 기다린다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <exception>
#include <expected>
#include <future>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <fmt/format.h>

namespace asio = boost::asio;

class PersistenceExecutor {
public:
    PersistenceExecutor(std::size_t threads, std::chrono::milliseconds timeout)
        : pool_(threads == 0 ? 1 : threads)
        , timeout_(timeout)
    {}

    ~PersistenceExecutor() { pool_.join(); }

    PersistenceExecutor(const PersistenceExecutor&)            = delete;
    PersistenceExecutor& operator=(const PersistenceExecutor&) = delete;
    PersistenceExecutor(PersistenceExecutor&&)                 = delete;
    PersistenceExecutor& operator=(PersistenceExecutor&&)      = delete;

    // run
    //   fn: std::expected<T, std::string>() 시그니처의 호출 가능 객체.
    //   op: 로그/에러 메시지에 쓰는 작업 이름.
    //
    //   반환: fn 의 결과, 또는 제한 시간 초과/예외 시 std::unexpected.
    template <typename Fn>
    [[nodiscard]] std::invoke_result_t<Fn> run(std::string_view op, Fn fn) {
        using Result = std::invoke_result_t<Fn>;

        auto task = [fn = std::move(fn)]() mutable -> Result {
            try {
                return fn();
            } catch (const std::exception& e) {
                return std::unexpected(std::string(e.what()));
            }
        };

        std::future<Result> fut = asio::post(pool_, asio::use_future(std::move(task)));

        if (fut.wait_for(timeout_) != std::future_status::ready) {
            return std::unexpected(fmt::format("{} timed out after {} ms", op, timeout_.count()));
        }
        return fut.get();
    }

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    asio::thread_pool           pool_;
    std::chrono::milliseconds   timeout_;
};
