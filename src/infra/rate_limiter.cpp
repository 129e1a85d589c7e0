#include "steenbok/infra/rate_limiter.hpp"

#include "steenbok/core/logger.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace steenbok::infra {

namespace net = boost::asio;

auto SteadyRateLimiterClock::now() -> time_point {
    return std::chrono::steady_clock::now();
}

auto SteadyRateLimiterClock::sleep_for(duration d) -> net::awaitable<void> {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor, d);
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    // Cancellation only shortens the wait; acquire() re-checks the slot.
}

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval,
                         std::shared_ptr<RateLimiterClock> clock)
    : min_interval_(min_interval), clock_(std::move(clock)) {}

auto RateLimiter::try_claim() -> RateLimiterClock::duration {
    std::lock_guard lock(mutex_);
    auto now = clock_->now();
    if (!last_request_ || now - *last_request_ >= min_interval_) {
        last_request_ = now;
        return RateLimiterClock::duration::zero();
    }
    return *last_request_ + min_interval_ - now;
}

auto RateLimiter::acquire() -> net::awaitable<void> {
    while (true) {
        auto wait = try_claim();
        if (wait == RateLimiterClock::duration::zero()) {
            co_return;
        }
        LOG_TRACE("RateLimiter: waiting {} ms for a request slot",
                  std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
        // Lock released above; other callers keep computing their own waits.
        co_await clock_->sleep_for(wait);
    }
}

auto RateLimiter::pending_delay() -> RateLimiterClock::duration {
    std::lock_guard lock(mutex_);
    if (!last_request_) {
        return RateLimiterClock::duration::zero();
    }
    auto elapsed = clock_->now() - *last_request_;
    if (elapsed >= min_interval_) {
        return RateLimiterClock::duration::zero();
    }
    return min_interval_ - elapsed;
}

auto RateLimiter::last_request() -> std::optional<RateLimiterClock::time_point> {
    std::lock_guard lock(mutex_);
    return last_request_;
}

} // namespace steenbok::infra
