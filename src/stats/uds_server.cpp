// ---------------------------------------------------------------------------
// uds_server.cpp
// ---------------------------------------------------------------------------

#include "stats/uds_server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <cstddef>
#include <system_error>
#include <utility>

namespace {

using FrameHeader = std::array<std::uint8_t, 4>;

FrameHeader to_header(std::uint32_t len) noexcept {
    return {
        static_cast<std::uint8_t>(len & 0xFFu),
        static_cast<std::uint8_t>((len >> 8) & 0xFFu),
        static_cast<std::uint8_t>((len >> 16) & 0xFFu),
        static_cast<std::uint8_t>((len >> 24) & 0xFFu),
    };
}

std::uint32_t from_header(const FrameHeader& h) noexcept {
    std::uint32_t len = 0;
    for (std::size_t i = h.size(); i-- > 0;) {
        len = (len << 8) | h[i];
    }
    return len;
}

} // namespace

UdsServer::UdsServer(std::filesystem::path    socket_path,
                     const CommandDispatcher& dispatcher,
                     asio::io_context&        ioc)
    : socket_path_(std::move(socket_path))
    , dispatcher_(dispatcher)
    , ioc_(ioc)
    , acceptor_(ioc)
{}

UdsServer::~UdsServer() {
    stop();
}

void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto shutdown = [this]() {
        boost::system::error_code ec;
        acceptor_.cancel(ec);
        acceptor_.close(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor close error: {}", ec.message());
        }
        if (bound_.exchange(false)) {
            std::error_code fs_ec;
            std::filesystem::remove(socket_path_, fs_ec);
        }
    };

    // acceptor 는 io_context 스레드에서만 만진다
    if (ioc_.stopped()) {
        shutdown();
    } else {
        asio::post(ioc_, std::move(shutdown));
    }
}

bool UdsServer::listen() {
    using stream_protocol = asio::local::stream_protocol;

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec) {
        spdlog::error("[uds_server] cannot remove stale socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        return false;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (!ec) {
        acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    }
    if (ec) {
        spdlog::error("[uds_server] bind {} failed: {}", socket_path_.string(), ec.message());
        return false;
    }
    bound_ = true;

    std::filesystem::permissions(socket_path_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, fs_ec);
    if (fs_ec) {
        spdlog::warn("[uds_server] chmod 0600 on {} failed: {}",
                     socket_path_.string(), fs_ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[uds_server] listen failed: {}", ec.message());
        return false;
    }
    return true;
}

asio::awaitable<void> UdsServer::run() {
    if (stop_requested_.load(std::memory_order_acquire) || !listen()) {
        co_return;
    }
    spdlog::info("[uds_server] control socket listening on {}", socket_path_.string());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        Socket client{ioc_};
        boost::system::error_code ec;
        co_await acceptor_.async_accept(client, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
            break;
        }
        if (ec) {
            spdlog::error("[uds_server] accept failed: {}", ec.message());
            break;
        }
        asio::co_spawn(ioc_, serve_session(std::move(client)), asio::detached);
    }
    spdlog::info("[uds_server] control socket closed");
}

asio::awaitable<void> UdsServer::serve_session(Socket socket) {
    std::size_t handled = 0;
    while (auto request = co_await read_frame(socket)) {
        const std::string response = dispatcher_.dispatch(*request);
        if (!co_await write_frame(socket, response)) {
            break;
        }
        ++handled;
    }
    spdlog::debug("[uds_server] session closed after {} request(s)", handled);
}

asio::awaitable<std::optional<std::string>> UdsServer::read_frame(Socket& socket) {
    FrameHeader header{};
    boost::system::error_code hdr_ec;
    co_await asio::async_read(socket, asio::buffer(header),
                              asio::redirect_error(asio::use_awaitable, hdr_ec));
    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("[uds_server] read header failed: {}", hdr_ec.message());
        }
        co_return std::nullopt;
    }

    const std::uint32_t len = from_header(header);
    if (len == 0 || len > kMaxControlFrameSize) {
        spdlog::warn("[uds_server] rejecting frame with length {}", len);
        co_return std::nullopt;
    }

    std::string body(len, '\0');
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body), asio::redirect_error(asio::use_awaitable, body_ec));
    if (body_ec || body_n != len) {
        spdlog::warn("[uds_server] short frame body ({}/{} bytes)", body_n, len);
        co_return std::nullopt;
    }
    co_return body;
}

asio::awaitable<bool> UdsServer::write_frame(Socket& socket, const std::string& body) {
    const FrameHeader header = to_header(static_cast<std::uint32_t>(body.size()));
    const std::array<asio::const_buffer, 2> buffers{asio::buffer(header), asio::buffer(body)};

    boost::system::error_code ec;
    const std::size_t n = co_await asio::async_write(
        socket, buffers, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[uds_server] write failed after {} bytes: {}", n, ec.message());
        co_return false;
    }
    co_return true;
}
