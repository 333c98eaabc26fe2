#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 제어 서버. 운영 CLI 에 통계, 검사, 리뷰 큐를 노출한다.
//
// [프레임]
//   요청/응답 모두 [4byte LE 길이][JSON 본문]. 길이 0 또는 4MiB 초과는
//   프로토콜 위반이며 응답 없이 연결을 닫는다.
//
// [세션]
//   한 연결에서 요청 프레임을 여러 개 보낼 수 있다. 서버는 프레임마다
//   응답 프레임 하나를 돌려주고, 클라이언트가 EOF 를 보내면 연결을 닫는다.
//   커맨드 의미는 CommandDispatcher 가 정한다.
//
// [소켓 파일]
//   bind 직후 0600 으로 권한을 줄인다 (inspect/resolve 를 노출하므로).
//   stop() 시 소켓 파일을 지운다.
//
// [비동기 모델]
//   Boost.Asio co_await. io_context 는 외부에서 주입한다. 연결마다 코루틴 하나.
//   I/O 실패는 해당 연결만 끝내고 accept 루프에는 영향을 주지 않는다.
// ---------------------------------------------------------------------------

#include "stats/command_dispatcher.hpp"

#include <utility>  // Boost.Asio awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace asio = boost::asio;

inline constexpr std::uint32_t kMaxControlFrameSize = 4u * 1024u * 1024u;

class UdsServer {
public:
    // dispatcher 는 서버보다 오래 살아야 한다.
    UdsServer(std::filesystem::path    socket_path,
              const CommandDispatcher& dispatcher,
              asio::io_context&        ioc);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;
    UdsServer(UdsServer&&)                 = delete;
    UdsServer& operator=(UdsServer&&)      = delete;

    // run
    //   bind/listen 후 accept 루프. stop() 또는 accept 오류까지 반환하지 않는다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫고 소켓 파일을 지운다. 여러 번 호출해도 안전하다.
    void stop();

    [[nodiscard]] const std::filesystem::path& socket_path() const noexcept {
        return socket_path_;
    }

private:
    using Socket = asio::local::stream_protocol::socket;

    [[nodiscard]] bool listen();

    asio::awaitable<void> serve_session(Socket socket);

    // read_frame
    //   EOF, I/O 오류, 프로토콜 위반이면 nullopt.
    static asio::awaitable<std::optional<std::string>> read_frame(Socket& socket);

    static asio::awaitable<bool> write_frame(Socket& socket, const std::string& body);

    std::filesystem::path                  socket_path_;
    const CommandDispatcher&               dispatcher_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
    std::atomic<bool>                      bound_{false};
};
