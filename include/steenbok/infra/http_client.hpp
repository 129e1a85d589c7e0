#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "steenbok/core/error.hpp"
#include "steenbok/infra/url.hpp"

namespace steenbok::infra {

/// Status line and headers of a response, before any body byte is read.
struct HttpResponseHead {
    int status = 0;
    std::map<std::string, std::string> headers;  // keys lowercased

    /// Case-insensitive header lookup; empty when absent.
    [[nodiscard]] auto header(std::string_view name) const -> std::string;

    [[nodiscard]] auto is_redirect() const noexcept -> bool {
        return status >= 300 && status < 400 && status != 304;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Callbacks steering one streamed exchange.
struct HttpStreamHandler {
    /// Called once with the response head. Return false to stop before the body.
    std::function<bool(const HttpResponseHead&)> on_head;

    /// Called per body chunk. Return false to abort the stream.
    std::function<bool(const char* data, size_t length)> on_chunk;
};

/// A single GET with redirect following disabled.
struct HttpHopRequest {
    Url url;
    /// Address to connect to instead of resolving `url.host` again. The
    /// hostname is still used for SNI and the Host header. Empty: resolve.
    std::string pinned_address;
};

/// Outcome of an exchange that reached the server.
struct HttpExchange {
    HttpResponseHead head;
    /// True when a handler callback stopped the transfer early.
    bool stopped_by_handler = false;
};

/// Outbound HTTP seam. Failures to complete the exchange map to
/// NetworkTimeout or NetworkError; an exchange stopped by the handler is a
/// success with `stopped_by_handler` set.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto get(const HttpHopRequest& request, const HttpStreamHandler& handler)
        -> boost::asio::awaitable<Result<HttpExchange>> = 0;
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::chrono::milliseconds timeout{10000};  // wall clock, per exchange
    bool verify_ssl = true;
    size_t worker_threads = 4;
    std::map<std::string, std::string> default_headers;
};

/// Streaming HTTP client wrapping cpp-httplib. Each exchange runs the
/// blocking httplib call on an internal thread pool and resumes the calling
/// coroutine when it completes. A timer on the caller's executor bounds the
/// whole exchange, connect and header phase included, by `timeout`.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    auto get(const HttpHopRequest& request, const HttpStreamHandler& handler)
        -> boost::asio::awaitable<Result<HttpExchange>> override;

    [[nodiscard]] auto config() const noexcept -> const HttpClientConfig& { return config_; }

private:
    class ExchangeControl;

    auto run_exchange(const HttpHopRequest& request, const HttpStreamHandler& handler,
                      ExchangeControl& control) -> Result<HttpExchange>;

    static void arm_deadline(std::shared_ptr<boost::asio::steady_timer> timer,
                             std::shared_ptr<ExchangeControl> control);

    HttpClientConfig config_;
    boost::asio::thread_pool pool_;
};

} // namespace steenbok::infra
