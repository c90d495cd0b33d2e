#include "mcprt/worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace mcprt {

WorkerPool::WorkerPool(size_t max_threads)
    : max_threads_(std::max<size_t>(1, max_threads)) {
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        // Start a thread when every idle one already has a task waiting for it.
        if (queue_.size() >= idle_ && threads_.size() < max_threads_) {
            threads_.emplace_back([this] { run(); });
        }
        queue_.push(std::move(task));
    }
    task_cv_.notify_one();
    return true;
}

void WorkerPool::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        ++idle_;
        task_cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        --idle_;
        if (queue_.empty()) return;  // stopping and drained

        auto task = std::move(queue_.front());
        queue_.pop();
        ++running_;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }

        lock.lock();
        --running_;
        if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
    }
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void WorkerPool::stop() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        joining.swap(threads_);
    }
    task_cv_.notify_all();
    for (auto& t : joining) {
        if (t.joinable()) t.join();
    }
}

size_t WorkerPool::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + running_;
}

size_t WorkerPool::threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

} // namespace mcprt
