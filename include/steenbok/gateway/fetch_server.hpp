#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "steenbok/core/config.hpp"
#include "steenbok/core/error.hpp"
#include "steenbok/gateway/fetch_handler.hpp"

namespace steenbok::gateway {

using boost::asio::awaitable;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/// Loopback-only HTTP/1.1 server in front of a FetchHandler.
class FetchServer {
public:
    using ReloadCallback = std::function<void()>;

    FetchServer(net::io_context& ioc, std::shared_ptr<FetchHandler> handler, ServerConfig config);

    /// Binds 127.0.0.1:<port> and serves until stop(). Fails with IoError
    /// when the port cannot be bound.
    auto start() -> awaitable<Result<void>>;

    void stop();

    /// Invoked on SIGHUP.
    void on_reload(ReloadCallback cb);

    [[nodiscard]] auto connection_count() const noexcept -> size_t { return *active_; }
    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

private:
    auto accept_loop() -> awaitable<void>;
    auto reload_loop() -> awaitable<void>;
    auto handle_session(tcp::socket socket) -> awaitable<void>;

    net::io_context& ioc_;
    std::shared_ptr<FetchHandler> handler_;
    ServerConfig config_;
    tcp::acceptor acceptor_;
    net::signal_set signals_;
    ReloadCallback reload_;

    std::atomic<bool> running_{false};
    // Shared with session frames, which may outlive the server on teardown.
    std::shared_ptr<std::atomic<size_t>> active_ = std::make_shared<std::atomic<size_t>>(0);
};

} // namespace steenbok::gateway
