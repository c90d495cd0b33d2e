#include "mcprt/transport/stdio_transport.hpp"
#include "mcprt/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace mcprt {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

StdioTransport::StdioTransport(McpServer& server)
    : server_(server), read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false)
    , workers_(server.options().max_concurrency) {
}

StdioTransport::StdioTransport(McpServer& server, int read_fd, int write_fd)
    : server_(server), read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true)
    , workers_(server.options().max_concurrency) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    workers_.stop();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writing_ = false;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start() {
    // shutdown() before start() means there is nothing to serve.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    if (::pipe(wakeup_pipe_) < 0) {
        running_ = false;
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writing_ = true;
    }
    connected_ = true;
    writer_thread_ = std::thread([this]() { write_loop(); });
    spdlog::info("stdio transport serving on fd {} -> fd {}", read_fd_, write_fd_);

    read_loop();

    // Answer everything already read before the writer goes away.
    workers_.wait_idle();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writing_ = false;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();

    connected_ = false;
    running_ = false;
    spdlog::info("stdio transport stopped");
}

void StdioTransport::read_loop() {
    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    while (!shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed on stdin: {}", std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            spdlog::error("Read error on stdin: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            // A final line without a newline still counts.
            if (!buffer.empty()) dispatch_line(std::move(buffer));
            spdlog::debug("stdin reached EOF");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            dispatch_line(buffer.substr(pos, nl - pos));
            pos = nl + 1;
        }
        if (pos > 0) buffer.erase(0, pos);
    }
}

void StdioTransport::dispatch_line(std::string line) {
    line = trim(line);
    if (line.empty()) return;

    try {
        if (!workers_.submit([this, line = std::move(line)]() { handle_line(line); })) {
            spdlog::warn("Dropping input line, transport is stopping");
        }
    } catch (const std::system_error& e) {
        spdlog::error("Could not start a worker for an input line: {}", e.what());
    }
}

void StdioTransport::handle_line(const std::string& line) {
    try {
        auto result = server_.handle(line, [this](const std::string& m) { enqueue(m); },
                                     {}, cancel_.token());
        if (const auto* text = std::get_if<std::string>(&result)) {
            enqueue(*text);
        }
    } catch (const InvalidMessageError& e) {
        spdlog::warn("Invalid message on stdin: {}", e.what());
        try {
            enqueue(e.response());
        } catch (const McpTransportError& te) {
            spdlog::warn("Dropping error response: {}", te.what());
        }
    } catch (const McpTransportError& e) {
        spdlog::warn("Dropping response: {}", e.what());
    } catch (const std::exception& e) {
        // Only reachable when the server rethrows handler exceptions.
        spdlog::error("Unhandled exception while handling a line: {}", e.what());
    }
}

void StdioTransport::enqueue(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!writing_) throw McpTransportError("Transport shut down");
        write_queue_.push(message);
    }
    write_cv_.notify_one();
}

void StdioTransport::write_loop() {
    while (true) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] { return !write_queue_.empty() || !writing_; });
            if (write_queue_.empty()) break;  // !writing_ and drained
            line = std::move(write_queue_.front());
            write_queue_.pop();
        }

        line += '\n';
        const char* data = line.data();
        size_t remaining = line.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                spdlog::error("Write error on stdout: {}", std::strerror(errno));
                connected_ = false;
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    cancel_.cancel();
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            spdlog::warn("Failed to wake stdio reader: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

size_t StdioTransport::in_flight() const {
    return workers_.busy();
}

} // namespace mcprt
