#include "mcprt/cancellation.hpp"
#include <thread>

namespace mcprt {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    uint64_t next_id{1};
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

// ---------- Registration ----------

CancellationToken::Registration::~Registration() {
    reset();
}

CancellationToken::Registration::Registration(Registration&& o) noexcept
    : state_(std::move(o.state_)), id_(o.id_) {
    o.id_ = 0;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(Registration&& o) noexcept {
    if (this != &o) {
        reset();
        state_ = std::move(o.state_);
        id_ = o.id_;
        o.id_ = 0;
    }
    return *this;
}

void CancellationToken::Registration::reset() {
    if (id_ == 0) return;
    if (auto state = state_.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(id_);
    }
    id_ = 0;
    state_.reset();
}

// ---------- CancellationToken ----------

bool CancellationToken::is_cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken::Registration CancellationToken::on_cancel(std::function<void()> cb) const {
    if (!state_) return {};
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(cb));
            return Registration{state_, id};
        }
    }
    cb();
    return {};
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    return state_->cancelled;
}

// ---------- CancellationSource ----------

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

bool CancellationSource::cancel() {
    std::map<uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return false;
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    // Callbacks run outside the lock so they may touch the token again.
    for (auto& [id, cb] : callbacks) {
        if (cb) cb();
    }
    return true;
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace mcprt
