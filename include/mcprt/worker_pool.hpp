#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mcprt {

/// Fixed-ceiling thread pool. Threads are started on demand, up to
/// `max_threads`, and reused; tasks beyond that wait in FIFO order.
/// All threads are joined by stop() or the destructor.
class WorkerPool {
public:
    explicit WorkerPool(size_t max_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false once the pool is stopping. Throws
    /// std::system_error if a needed thread cannot be started; the task is
    /// not queued in that case.
    [[nodiscard]] bool submit(std::function<void()> task);

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    /// Refuse new tasks, finish the queued ones and join every thread.
    /// Must not be called from a pool thread.
    void stop();

    /// Tasks queued or running.
    [[nodiscard]] size_t busy() const;
    [[nodiscard]] size_t threads() const;
    [[nodiscard]] size_t max_threads() const noexcept { return max_threads_; }

private:
    void run();

    const size_t max_threads_;
    mutable std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void()>> queue_;
    std::vector<std::thread> threads_;
    size_t idle_{0};
    size_t running_{0};
    bool stopping_{false};
};

} // namespace mcprt
