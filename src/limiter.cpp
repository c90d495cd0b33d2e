#include "mcprt/limiter.hpp"
#include "mcprt/error.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcprt {

// ---------- ConcurrencyGate ----------

ConcurrencyGate::Permit& ConcurrencyGate::Permit::operator=(Permit&& o) noexcept {
    if (this != &o) {
        release();
        gate_ = o.gate_;
        o.gate_ = nullptr;
    }
    return *this;
}

void ConcurrencyGate::Permit::release() noexcept {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

ConcurrencyGate::ConcurrencyGate(size_t max_concurrency)
    : max_(max_concurrency) {
    if (max_ == 0) {
        throw std::invalid_argument("max_concurrency must be at least 1");
    }
}

ConcurrencyGate::Permit ConcurrencyGate::acquire(const CancellationToken& token,
                                                 std::optional<std::chrono::milliseconds> timeout) {
    // Wake the waiter below when the caller is cancelled.
    auto wake = token.on_cancel([this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [&] { return active_ < max_ || token.is_cancelled(); };

    ++waiting_;
    bool admitted = true;
    if (timeout) {
        admitted = cv_.wait_for(lock, *timeout, ready);
    } else {
        cv_.wait(lock, ready);
    }
    --waiting_;

    if (token.is_cancelled()) {
        throw McpCancelledError("Cancelled while waiting for a concurrency slot");
    }
    if (!admitted) {
        throw McpTimeoutError("Timed out waiting for a concurrency slot");
    }

    ++active_;
    if (active_ > peak_) peak_ = active_;
    return Permit{this};
}

void ConcurrencyGate::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    cv_.notify_one();
}

size_t ConcurrencyGate::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
}

size_t ConcurrencyGate::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

// ---------- IdleWatchdog ----------

IdleWatchdog::IdleWatchdog(std::chrono::milliseconds timeout, CancellationSource source)
    : timeout_(timeout), source_(std::move(source)), deadline_(Clock::now() + timeout) {
}

void IdleWatchdog::reset() {
    if (fired_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = Clock::now() + timeout_;
}

bool IdleWatchdog::fire() {
    if (fired_.exchange(true)) return false;
    spdlog::warn("Handler idle for more than {} ms, cancelling", timeout_.count());
    source_.cancel();
    return true;
}

IdleWatchdog::Clock::time_point IdleWatchdog::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

bool IdleWatchdog::expired(Clock::time_point now) const {
    return now >= deadline();
}

// ---------- Limiter ----------

Limiter::Limiter(std::chrono::milliseconds idle_timeout,
                 size_t max_concurrency,
                 std::optional<std::chrono::milliseconds> acquire_timeout)
    : idle_timeout_(idle_timeout)
    , acquire_timeout_(acquire_timeout)
    , gate_(max_concurrency) {
}

Limiter::Slot Limiter::acquire(const CancellationToken& caller) {
    auto permit = gate_.acquire(caller, acquire_timeout_);

    CancellationSource source;
    auto link = caller.on_cancel([source]() mutable { source.cancel(); });
    // The idle window starts once the slot is held.
    auto watchdog = std::make_shared<IdleWatchdog>(idle_timeout_, source);
    return Slot{std::move(permit), std::move(watchdog), std::move(source), std::move(link)};
}

} // namespace mcprt
