#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace steenbok::infra {

/// Time source and sleep primitive for the rate limiter. Tests substitute a
/// manual clock.
class RateLimiterClock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~RateLimiterClock() = default;

    [[nodiscard]] virtual auto now() -> time_point = 0;

    /// Suspends the calling coroutine for `d` without blocking the executor.
    virtual auto sleep_for(duration d) -> boost::asio::awaitable<void> = 0;
};

/// steady_clock plus a steady_timer on the caller's executor.
class SteadyRateLimiterClock : public RateLimiterClock {
public:
    [[nodiscard]] auto now() -> time_point override;
    auto sleep_for(duration d) -> boost::asio::awaitable<void> override;
};

/// Process-wide pacing of outbound requests: no two acquisitions complete
/// less than `min_interval` apart, whatever the number of concurrent callers.
///
/// The mutex only guards the last-request timestamp. It is never held while
/// a caller sleeps, so waiters share the clock instead of queueing behind
/// each other's sleeps.
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds min_interval,
                         std::shared_ptr<RateLimiterClock> clock =
                             std::make_shared<SteadyRateLimiterClock>());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Waits until a request slot is available, then claims it.
    auto acquire() -> boost::asio::awaitable<void>;

    /// How long a caller arriving now would have to wait (zero if none).
    [[nodiscard]] auto pending_delay() -> RateLimiterClock::duration;

    [[nodiscard]] auto min_interval() const noexcept -> std::chrono::milliseconds {
        return min_interval_;
    }

    /// Time of the most recent claimed slot, if any.
    [[nodiscard]] auto last_request() -> std::optional<RateLimiterClock::time_point>;

private:
    /// Claims the slot if it is free and returns zero; otherwise returns the
    /// remaining wait without claiming.
    auto try_claim() -> RateLimiterClock::duration;

    std::chrono::milliseconds min_interval_;
    std::shared_ptr<RateLimiterClock> clock_;
    std::mutex mutex_;
    std::optional<RateLimiterClock::time_point> last_request_;
};

} // namespace steenbok::infra
