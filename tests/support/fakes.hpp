#pragma once

#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "steenbok/infra/audit_log.hpp"
#include "steenbok/infra/host_validator.hpp"
#include "steenbok/infra/http_client.hpp"
#include "steenbok/infra/rate_limiter.hpp"

namespace steenbok::testing {

namespace net = boost::asio;

/// Runs a coroutine to completion on a private io_context.
template <typename T>
auto run_sync(net::awaitable<T> task) -> T {
    net::io_context ioc;
    std::optional<T> result;
    std::exception_ptr error;
    net::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e) result.emplace(std::move(value));
    });
    ioc.run();
    if (error) std::rethrow_exception(error);
    return std::move(*result);
}

/// Resolver answering from a fixed table; unknown names fail to resolve.
class FakeResolver : public infra::HostResolver {
public:
    void add(std::string host, std::vector<std::string> addresses) {
        std::vector<net::ip::address> parsed;
        for (const auto& a : addresses) {
            parsed.push_back(net::ip::make_address(a));
        }
        table_[std::move(host)] = std::move(parsed);
    }

    auto resolve(std::string_view host)
        -> net::awaitable<Result<std::vector<net::ip::address>>> override
    {
        queries.emplace_back(host);
        auto it = table_.find(std::string(host));
        if (it == table_.end()) {
            co_return make_fail(make_error(ErrorCode::HostResolutionFailed,
                "DNS resolution failed", std::string(host) + ": Host not found"));
        }
        co_return it->second;
    }

    [[nodiscard]] auto queried(std::string_view host) const -> bool {
        return std::find(queries.begin(), queries.end(), host) != queries.end();
    }

    std::vector<std::string> queries;

private:
    std::map<std::string, std::vector<net::ip::address>> table_;
};

/// One canned response of the scripted transport.
struct ScriptedResponse {
    int status = 200;
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;
    size_t chunk_size = 4096;
    std::optional<Error> error;                  // transport-level failure
};

/// HttpTransport that serves scripted responses keyed by URL and records
/// every request and every body byte it handed to the caller.
class ScriptedTransport : public infra::HttpTransport {
public:
    void add(std::string url, ScriptedResponse response) {
        script_[std::move(url)] = std::move(response);
    }

    void redirect(std::string from, int status, std::string location) {
        ScriptedResponse r;
        r.status = status;
        r.headers["location"] = std::move(location);
        r.body = "<a href=\"moved\">moved</a>";
        add(std::move(from), std::move(r));
    }

    void html(std::string url, std::string body) {
        ScriptedResponse r;
        r.headers["content-type"] = "text/html; charset=utf-8";
        r.body = std::move(body);
        add(std::move(url), std::move(r));
    }

    auto get(const infra::HttpHopRequest& request, const infra::HttpStreamHandler& handler)
        -> net::awaitable<Result<infra::HttpExchange>> override
    {
        auto url = request.url.str();
        requests.push_back(url);
        pinned.push_back(request.pinned_address);

        auto it = script_.find(url);
        if (it == script_.end()) {
            co_return make_fail(make_error(ErrorCode::NetworkError,
                "HTTP request failed", url + ": Connection failed"));
        }
        const auto& response = it->second;
        if (response.error) {
            co_return make_fail(*response.error);
        }

        infra::HttpExchange exchange;
        exchange.head.status = response.status;
        exchange.head.headers = response.headers;
        if (handler.on_head && !handler.on_head(exchange.head)) {
            exchange.stopped_by_handler = true;
            co_return exchange;
        }

        size_t offset = 0;
        while (offset < response.body.size()) {
            auto n = std::min(response.chunk_size, response.body.size() - offset);
            body_bytes_delivered += n;
            if (handler.on_chunk && !handler.on_chunk(response.body.data() + offset, n)) {
                exchange.stopped_by_handler = true;
                break;
            }
            offset += n;
        }
        co_return exchange;
    }

    [[nodiscard]] auto requested(std::string_view url) const -> bool {
        return std::find(requests.begin(), requests.end(), url) != requests.end();
    }

    std::vector<std::string> requests;
    std::vector<std::string> pinned;
    size_t body_bytes_delivered = 0;

private:
    std::map<std::string, ScriptedResponse> script_;
};

class RecordingAuditSink : public infra::AuditSink {
public:
    void record(const infra::AuditEvent& event) override {
        std::lock_guard lock(mutex_);
        events.push_back(event);
    }

    std::vector<infra::AuditEvent> events;

private:
    std::mutex mutex_;
};

/// Clock that only moves when a caller sleeps.
class ManualClock : public infra::RateLimiterClock {
public:
    auto now() -> time_point override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    auto sleep_for(duration d) -> net::awaitable<void> override {
        {
            std::lock_guard lock(mutex_);
            sleeps.push_back(d);
            now_ += d;
        }
        // Let other coroutines run before the caller re-checks.
        co_await net::post(co_await net::this_coro::executor, net::use_awaitable);
    }

    [[nodiscard]] auto elapsed() -> duration {
        std::lock_guard lock(mutex_);
        return now_ - time_point{};
    }

    std::vector<duration> sleeps;

private:
    std::mutex mutex_;
    time_point now_{};
};

} // namespace steenbok::testing
