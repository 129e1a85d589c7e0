#include "steenbok/gateway/fetch_server.hpp"

#include "steenbok/core/logger.hpp"

#include <csignal>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

namespace steenbok::gateway {

namespace beast = boost::beast;
namespace http = beast::http;

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(30);

/// Decrements the active-session counter when a session coroutine ends.
struct SessionCount {
    std::shared_ptr<std::atomic<size_t>> active;
    ~SessionCount() { --*active; }
};

} // anonymous namespace

FetchServer::FetchServer(net::io_context& ioc, std::shared_ptr<FetchHandler> handler,
                         ServerConfig config)
    : ioc_(ioc)
    , handler_(std::move(handler))
    , config_(std::move(config))
    , acceptor_(ioc)
    , signals_(ioc) {}

void FetchServer::on_reload(ReloadCallback cb) {
    reload_ = std::move(cb);
}

auto FetchServer::start() -> awaitable<Result<void>> {
    // Never reachable from other hosts.
    auto address = net::ip::make_address("127.0.0.1");
    auto endpoint = tcp::endpoint{address, config_.port};

    try {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        co_return make_fail(make_error(ErrorCode::IoError,
            "Cannot listen on " + address.to_string() + ":" + std::to_string(config_.port),
            e.what()));
    }

    running_ = true;
    LOG_INFO("Fetch endpoint listening on http://{}:{}/fetch",
             address.to_string(), acceptor_.local_endpoint().port());

#ifndef _WIN32
    signals_.add(SIGHUP);
    net::co_spawn(ioc_, reload_loop(), net::detached);
#endif

    co_await accept_loop();
    co_return ok_result();
}

void FetchServer::stop() {
    if (!running_.exchange(false)) return;

    boost::system::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);
    LOG_INFO("Fetch endpoint stopped ({} sessions still open)", active_->load());
}

auto FetchServer::reload_loop() -> awaitable<void> {
    while (running_) {
        boost::system::error_code ec;
        co_await signals_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec) break;
        LOG_INFO("SIGHUP received: reloading allowlist");
        if (reload_) {
            reload_();
        }
    }
}

auto FetchServer::accept_loop() -> awaitable<void> {
    while (running_) {
        try {
            auto socket = co_await acceptor_.async_accept(net::use_awaitable);

            if (*active_ >= config_.max_connections) {
                LOG_WARN("Max connections ({}) reached, rejecting", config_.max_connections);
                socket.close();
                continue;
            }

            ++*active_;
            net::co_spawn(ioc_, handle_session(std::move(socket)), net::detached);

        } catch (const boost::system::system_error& e) {
            if (!running_) break;  // acceptor closed by stop()
            LOG_ERROR("Accept error: {}", e.what());
        }
    }
}

auto FetchServer::handle_session(tcp::socket socket) -> awaitable<void> {
    SessionCount count{active_};

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    try {
        while (running_) {
            stream.expires_after(kIdleTimeout);
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);

            auto target = req.target();
            auto reply = co_await handler_->handle(
                req.method(), std::string_view(target.data(), target.size()));

            http::response<http::string_body> res{
                static_cast<http::status>(reply.status), req.version()};
            res.set(http::field::server, "steenbok");
            res.set(http::field::content_type, reply.content_type);
            res.set(http::field::cache_control, "no-store");
            res.keep_alive(req.keep_alive());
            res.body() = std::move(reply.body);
            res.prepare_payload();

            stream.expires_after(kIdleTimeout);
            co_await http::async_write(stream, res, net::use_awaitable);

            if (!res.keep_alive()) break;
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != http::error::end_of_stream && e.code() != beast::error::timeout) {
            LOG_DEBUG("Session error: {}", e.what());
        }
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace steenbok::gateway
