#pragma once
#include "cancellation.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace mcprt {

/// Counting gate bounding how many handlers execute at once.
class ConcurrencyGate {
public:
    /// Held slot. Released exactly once, on destruction or by release().
    class Permit {
    public:
        Permit() = default;
        explicit Permit(ConcurrencyGate* gate) : gate_(gate) {}
        ~Permit() { release(); }

        Permit(Permit&& o) noexcept : gate_(o.gate_) { o.gate_ = nullptr; }
        Permit& operator=(Permit&& o) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        void release() noexcept;
        [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }

    private:
        ConcurrencyGate* gate_{nullptr};
    };

    explicit ConcurrencyGate(size_t max_concurrency);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /// Block until a slot is free. Throws McpCancelledError if `token` is
    /// cancelled first, McpTimeoutError if `timeout` elapses first.
    [[nodiscard]] Permit acquire(const CancellationToken& token = {},
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] size_t capacity() const noexcept { return max_; }
    [[nodiscard]] size_t active() const;
    [[nodiscard]] size_t waiting() const;
    /// Highest number of simultaneously held permits observed.
    [[nodiscard]] size_t peak() const;

private:
    void release() noexcept;

    const size_t max_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t active_{0};
    size_t waiting_{0};
    size_t peak_{0};
};

/// Resettable idle timer attached to one request. Once fired it stays fired
/// and later resets are ignored.
class IdleWatchdog {
public:
    using Clock = std::chrono::steady_clock;

    IdleWatchdog(std::chrono::milliseconds timeout, CancellationSource source);

    /// Restart the idle window from now.
    void reset();

    /// Mark the request timed out and cancel it. Returns true the first time.
    bool fire();

    [[nodiscard]] bool fired() const noexcept { return fired_.load(); }
    [[nodiscard]] Clock::time_point deadline() const;
    [[nodiscard]] bool expired(Clock::time_point now = Clock::now()) const;
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    const std::chrono::milliseconds timeout_;
    CancellationSource source_;
    mutable std::mutex mutex_;
    Clock::time_point deadline_;
    std::atomic<bool> fired_{false};
};

/// Concurrency gate plus one idle watchdog per accepted request.
class Limiter {
public:
    /// Everything a request holds while it is admitted.
    class Slot {
    public:
        Slot(ConcurrencyGate::Permit permit,
             std::shared_ptr<IdleWatchdog> watchdog,
             CancellationSource source,
             CancellationToken::Registration link)
            : permit_(std::move(permit)), watchdog_(std::move(watchdog)),
              source_(std::move(source)), link_(std::move(link)) {}

        Slot(Slot&&) noexcept = default;
        Slot& operator=(Slot&&) noexcept = default;

        [[nodiscard]] const std::shared_ptr<IdleWatchdog>& watchdog() const { return watchdog_; }
        [[nodiscard]] CancellationToken token() const { return source_.token(); }
        /// Cancel without marking the request timed out.
        void cancel() { source_.cancel(); }
        /// Give the concurrency slot back early; later calls are no-ops.
        void release() noexcept { permit_.release(); }

    private:
        ConcurrencyGate::Permit permit_;
        std::shared_ptr<IdleWatchdog> watchdog_;
        CancellationSource source_;
        CancellationToken::Registration link_;
    };

    static constexpr std::chrono::milliseconds DEFAULT_IDLE_TIMEOUT{30000};
    static constexpr size_t DEFAULT_MAX_CONCURRENCY = 100;

    Limiter(std::chrono::milliseconds idle_timeout = DEFAULT_IDLE_TIMEOUT,
            size_t max_concurrency = DEFAULT_MAX_CONCURRENCY,
            std::optional<std::chrono::milliseconds> acquire_timeout = std::nullopt);

    /// Admit a request. Blocks while the gate is full. The returned slot's
    /// token is cancelled when `caller` is cancelled or the watchdog fires.
    [[nodiscard]] Slot acquire(const CancellationToken& caller = {});

    [[nodiscard]] std::chrono::milliseconds idle_timeout() const noexcept { return idle_timeout_; }
    [[nodiscard]] const ConcurrencyGate& gate() const noexcept { return gate_; }

private:
    std::chrono::milliseconds idle_timeout_;
    std::optional<std::chrono::milliseconds> acquire_timeout_;
    ConcurrencyGate gate_;
};

} // namespace mcprt
