#pragma once
#include "transport.hpp"
#include "../cancellation.hpp"
#include "../server.hpp"
#include "../worker_pool.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace mcprt {

/// Newline-delimited JSON-RPC over a pair of file descriptors. Input lines
/// are handled concurrently on a worker pool sized by the server's
/// concurrency limit; a single writer thread keeps output lines whole.
class StdioTransport : public ITransport {
public:
    /// Serve on the process stdin/stdout.
    explicit StdioTransport(McpServer& server);

    /// Serve on the given descriptors, which the transport then owns (for testing).
    StdioTransport(McpServer& server, int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Returns once input reaches EOF (after in-flight lines are answered) or
    /// after shutdown().
    void start() override;
    void shutdown() override;
    bool is_connected() const override;

    /// Lines currently being handled.
    [[nodiscard]] size_t in_flight() const;

private:
    void read_loop();
    void write_loop();
    void dispatch_line(std::string line);
    void handle_line(const std::string& line);
    void enqueue(const std::string& message);

    McpServer& server_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
    CancellationSource cancel_;

    std::thread writer_thread_;
    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    bool writing_{false};

    WorkerPool workers_;

    int wakeup_pipe_[2]{-1, -1};  // wakes the reader's poll() on shutdown
};

} // namespace mcprt
