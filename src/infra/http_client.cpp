#include "steenbok/infra/http_client.hpp"
#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"

#include <httplib.h>

#include <atomic>
#include <mutex>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace steenbok::infra {

namespace net = boost::asio;

namespace {

auto describe(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        case httplib::Error::ConnectionTimeout: return "Connection timeout";
        default: return "HTTP error " + std::to_string(static_cast<int>(err));
    }
}

auto to_head(const httplib::Response& res) -> HttpResponseHead {
    HttpResponseHead head;
    head.status = res.status;
    for (const auto& [key, value] : res.headers) {
        head.headers.emplace(utils::to_lower(key), value);
    }
    return head;
}

// httplib::Client::stop() does nothing before the socket exists, so an
// expired exchange is stopped again until it returns.
constexpr auto kStopRetry = std::chrono::milliseconds(50);

} // anonymous namespace

/// Links the pool thread running an exchange with the deadline timer on the
/// caller's executor.
class HttpClient::ExchangeControl {
public:
    void attach(httplib::Client* client) {
        std::lock_guard lock(mutex_);
        client_ = client;
    }

    void detach() {
        std::lock_guard lock(mutex_);
        client_ = nullptr;
    }

    void expire() {
        std::lock_guard lock(mutex_);
        expired_ = true;
        if (client_) {
            client_->stop();
        }
    }

    [[nodiscard]] auto expired() -> bool {
        std::lock_guard lock(mutex_);
        return expired_;
    }

    std::atomic<bool> finished{false};

private:
    std::mutex mutex_;
    httplib::Client* client_ = nullptr;
    bool expired_ = false;
};

auto HttpResponseHead::header(std::string_view name) const -> std::string {
    auto it = headers.find(utils::to_lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

HttpClient::HttpClient(HttpClientConfig config)
    : config_(std::move(config)), pool_(config_.worker_threads == 0 ? 1 : config_.worker_threads) {}

HttpClient::~HttpClient() {
    pool_.join();
}

auto HttpClient::get(const HttpHopRequest& request, const HttpStreamHandler& handler)
    -> net::awaitable<Result<HttpExchange>> {
    auto control = std::make_shared<ExchangeControl>();
    auto timer = std::make_shared<net::steady_timer>(
        co_await net::this_coro::executor, config_.timeout);
    arm_deadline(timer, control);

    // httplib blocks; run it on the pool and resume the caller afterwards.
    auto result = co_await net::co_spawn(
        pool_.get_executor(),
        [this, &request, &handler, control]() -> net::awaitable<Result<HttpExchange>> {
            co_return run_exchange(request, handler, *control);
        },
        net::use_awaitable);

    control->finished = true;
    timer->cancel();
    co_return result;
}

void HttpClient::arm_deadline(std::shared_ptr<net::steady_timer> timer,
                              std::shared_ptr<ExchangeControl> control) {
    timer->async_wait([timer, control](const boost::system::error_code& ec) {
        if (ec || control->finished) {
            return;
        }
        control->expire();
        timer->expires_after(kStopRetry);
        arm_deadline(timer, control);
    });
}

auto HttpClient::run_exchange(const HttpHopRequest& request, const HttpStreamHandler& handler,
                              ExchangeControl& control) -> Result<HttpExchange> {
    const auto& url = request.url;
    auto started = std::chrono::steady_clock::now();

    // httplib::Client is not thread-safe; one per exchange.
    httplib::Client client(url.scheme + "://" + url.host_for_authority() + ":" +
                           std::to_string(url.effective_port()));
    client.set_follow_location(false);
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);
    client.set_write_timeout(config_.timeout);
    if (!config_.verify_ssl) {
        client.enable_server_certificate_verification(false);
    }
    if (!request.pinned_address.empty()) {
        client.set_hostname_addr_map({{url.host, request.pinned_address}});
    }

    control.attach(&client);
    struct Detach {
        ExchangeControl& control;
        ~Detach() { control.detach(); }
    } detach{control};

    httplib::Headers hdrs;
    for (const auto& [key, value] : config_.default_headers) {
        hdrs.emplace(key, value);
    }

    HttpExchange exchange;
    bool head_seen = false;

    auto on_response = [&](const httplib::Response& res) -> bool {
        exchange.head = to_head(res);
        head_seen = true;
        if (handler.on_head && !handler.on_head(exchange.head)) {
            exchange.stopped_by_handler = true;
            return false;
        }
        return true;
    };

    auto on_content = [&](const char* data, size_t length) -> bool {
        if (control.expired()) {
            return false;
        }
        if (handler.on_chunk && !handler.on_chunk(data, length)) {
            exchange.stopped_by_handler = true;
            return false;
        }
        return true;
    };

    if (control.expired()) {
        return std::unexpected(make_error(ErrorCode::NetworkTimeout,
            "HTTP exchange exceeded its time budget", url.origin()));
    }

    LOG_DEBUG("GET {} (pinned={})", url.str(),
              request.pinned_address.empty() ? "-" : request.pinned_address);
    auto res = client.Get(url.request_target(), hdrs, on_response, on_content);

    if (res) {
        if (!head_seen) {
            exchange.head = to_head(*res);
        }
        return exchange;
    }

    auto err = res.error();
    if (err == httplib::Error::Canceled && exchange.stopped_by_handler) {
        return exchange;
    }
    if (control.expired()) {
        return std::unexpected(make_error(ErrorCode::NetworkTimeout,
            "HTTP exchange exceeded its time budget",
            url.origin() + ": " + describe(err)));
    }

    bool over_budget = std::chrono::steady_clock::now() - started >= config_.timeout;
    if (err == httplib::Error::ConnectionTimeout ||
        (err == httplib::Error::Read && over_budget)) {
        return std::unexpected(make_error(ErrorCode::NetworkTimeout,
            "HTTP request timed out", url.origin() + ": " + describe(err)));
    }
    return std::unexpected(make_error(ErrorCode::NetworkError,
        "HTTP request failed", url.origin() + ": " + describe(err)));
}

} // namespace steenbok::infra
