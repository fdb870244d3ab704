#include "zmcp/transport/stdio_transport.hpp"
#include "zmcp/error.hpp"
#include "zmcp/logging.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <string>

namespace zmcp {

namespace {

constexpr size_t kWriteChunk = PIPE_BUF;

void make_wakeup_pipe(int fds[2]) {
    if (::pipe(fds) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = ::fcntl(fds[1], F_GETFL, 0);
    ::fcntl(fds[1], F_SETFL, flags | O_NONBLOCK);
}

void report(const ErrorCallback& on_error, std::exception_ptr ep) {
    if (on_error) on_error(std::move(ep));
}

} // anonymous namespace

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(Options opts)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false), opts_(opts) {
    make_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true), opts_(opts) {
    make_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(LineCallback on_line, ErrorCallback on_error) {
    // If shutdown() was called before start(), return without blocking.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    // A vanished peer must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        read_loop(on_line, on_error);
    } catch (...) {
        running_ = false;
        connected_ = false;
        throw;
    }
    running_ = false;
    connected_ = false;
}

void StdioTransport::emit_line(std::string line, const LineCallback& on_line,
                               const ErrorCallback& on_error) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) return;  // blank

    if (opts_.max_frame_size > 0 && line.size() > opts_.max_frame_size) {
        report(on_error, std::make_exception_ptr(McpFrameTooLargeError(
            "Frame of " + std::to_string(line.size()) + " bytes exceeds limit of "
            + std::to_string(opts_.max_frame_size))));
        return;
    }
    on_line(std::move(line));
}

void StdioTransport::read_loop(const LineCallback& on_line, const ErrorCallback& on_error) {
    auto log = logging::get("transport");
    std::string buffer;
    buffer.reserve(4096);
    bool discarding = false;  // inside an oversize frame, skipping to its newline

    char chunk[4096];

    while (running_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
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
            report(on_error, std::make_exception_ptr(
                McpTransportError(std::string("Poll error: ") + strerror(errno))));
            continue;
        }

        // Wakeup pipe has data → shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLNVAL) {
            log->error("Input descriptor is not open; ending session");
            break;
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (errno == EBADF) {
                log->error("Input descriptor is not readable; ending session");
                break;
            }
            // A single failed read does not end the session.
            report(on_error, std::make_exception_ptr(
                McpTransportError(std::string("Read error: ") + strerror(errno))));
            continue;
        }
        if (n == 0) {
            // EOF; an unterminated trailing fragment is not a frame.
            if (!buffer.empty()) {
                log->debug("Discarding {} unterminated bytes at end of stream", buffer.size());
            }
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;

            if (discarding) {
                discarding = false;
                continue;
            }
            emit_line(std::move(line), on_line, on_error);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }

        if (!discarding && opts_.max_frame_size > 0 && buffer.size() > opts_.max_frame_size) {
            report(on_error, std::make_exception_ptr(McpFrameTooLargeError(
                "Frame exceeds limit of " + std::to_string(opts_.max_frame_size) + " bytes")));
            discarding = true;
        }
        if (discarding) buffer.clear();
    }
}

void StdioTransport::send(const std::string& frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }

    std::string out;
    out.reserve(frame.size() + 1);
    out += frame;
    out += '\n';

    const char* data = out.data();
    size_t remaining = out.size();
    while (remaining > 0) {
        // Wait for room on the output or for shutdown(). A peer that stops
        // reading must not block the writer past shutdown.
        struct pollfd fds[2];
        fds[0].fd = write_fd_;
        fds[0].events = POLLOUT;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Poll error: ") + strerror(errno));
        }
        if (fds[1].revents & POLLIN) {
            throw McpTransportError("Transport shut down");
        }
        if (fds[0].revents & POLLNVAL) {
            connected_ = false;
            throw McpTransportError("Write error: output descriptor is not open");
        }
        if (!(fds[0].revents & (POLLOUT | POLLERR | POLLHUP))) continue;

        // POLLOUT guarantees room for PIPE_BUF bytes, so this write cannot block.
        ssize_t written = ::write(write_fd_, data, std::min(remaining, kWriteChunk));
        if (written < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    // Write to wakeup pipe to interrupt poll() in read_loop().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            logging::get("transport")->warn("Failed to signal reader: {}", strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace zmcp
