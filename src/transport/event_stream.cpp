#include "mcprt/transport/event_stream.hpp"
#include "mcprt/error.hpp"

namespace mcprt {

EventStream::EventStream(std::chrono::milliseconds ping_interval)
    : ping_interval_(ping_interval) {
}

std::string EventStream::frame(const std::string& message) {
    return "event: message\ndata: " + message + "\n\n";
}

void EventStream::push(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) throw McpTransportError("Client disconnected");
        if (finished_) throw McpTransportError("Stream already closed");
        events_.push_back(frame(message));
    }
    cv_.notify_all();
}

void EventStream::finish(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || finished_) return;
        events_.push_back(frame(message));
        finished_ = true;
    }
    cv_.notify_all();
}

EventStream::Next EventStream::next(std::string& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(lock, ping_interval_, [this] {
        return cancelled_ || !events_.empty() || finished_;
    });
    if (cancelled_) return Next::End;
    if (!ready) return Next::Ping;
    if (events_.empty()) return Next::End;  // finished and drained
    out = std::move(events_.front());
    events_.pop_front();
    return Next::Event;
}

void EventStream::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
        events_.clear();
    }
    cv_.notify_all();
    disconnect_.cancel();
}

bool EventStream::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool EventStream::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

} // namespace mcprt
