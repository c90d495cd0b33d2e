#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace mcprt {

namespace detail {
struct CancellationState;
}

/// Read-only view of a cancellation signal. Default-constructed tokens are
/// never cancelled.
class CancellationToken {
public:
    /// Registration handle; the callback is removed when it is destroyed.
    class Registration {
    public:
        Registration() = default;
        Registration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}
        ~Registration();

        Registration(Registration&& o) noexcept;
        Registration& operator=(Registration&& o) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        void reset();

        std::weak_ptr<detail::CancellationState> state_;
        uint64_t id_{0};
    };

    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const;

    /// True if this token is attached to a source at all.
    [[nodiscard]] bool can_be_cancelled() const { return static_cast<bool>(state_); }

    /// Run `cb` once on cancellation. Runs immediately if already cancelled.
    [[nodiscard]] Registration on_cancel(std::function<void()> cb) const;

    /// Wait until cancelled or `timeout` elapses. Returns is_cancelled().
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/// Owning side of a cancellation signal. Cancelling is idempotent.
class CancellationSource {
public:
    CancellationSource();

    /// Returns true on the first call only.
    bool cancel();
    [[nodiscard]] bool is_cancelled() const;
    [[nodiscard]] CancellationToken token() const { return CancellationToken{state_}; }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace mcprt
