#pragma once
#include "../cancellation.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace mcprt {

/// Server-sent events queue for one streamed HTTP reply. The handler side
/// pushes messages; the connection side pulls framed events, or a keep-alive
/// tick when nothing arrives within the ping interval.
class EventStream {
public:
    enum class Next { Event, Ping, End };

    explicit EventStream(std::chrono::milliseconds ping_interval);

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Queue one JSON-RPC message. Throws McpTransportError once cancelled.
    void push(const std::string& message);

    /// Queue the terminal message and close the stream.
    void finish(const std::string& message);

    /// Next framed event into `out`, Ping after the interval passes idle,
    /// End once the terminal message has been pulled or after cancel().
    Next next(std::string& out);

    /// The client went away. Drops queued events and cancels token().
    void cancel();

    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] bool finished() const;
    [[nodiscard]] CancellationToken token() const { return disconnect_.token(); }
    [[nodiscard]] std::chrono::milliseconds ping_interval() const noexcept { return ping_interval_; }

    static std::string frame(const std::string& message);
    static constexpr const char* PING_EVENT = ": ping\n\n";

private:
    const std::chrono::milliseconds ping_interval_;
    CancellationSource disconnect_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> events_;
    bool finished_{false};
    bool cancelled_{false};
};

} // namespace mcprt
