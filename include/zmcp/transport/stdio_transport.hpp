#pragma once
#include "transport.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>

namespace zmcp {

/// StdioTransport reads newline-delimited frames from stdin and writes to stdout.
/// Reading runs on the caller's thread and uses poll() on a wakeup pipe so
/// that shutdown() interrupts a blocked read.
class StdioTransport : public ITransport {
public:
    struct Options {
        /// Lines longer than this are discarded and reported as
        /// McpFrameTooLargeError. 0 disables the limit.
        size_t max_frame_size = 10 * 1024 * 1024;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership and closes them on destruction.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Also sets SIGPIPE to SIG_IGN for the whole process, so that a peer
    /// closing its end surfaces as a McpTransportError from send() instead
    /// of terminating the process. Embedders that need their own SIGPIPE
    /// disposition must reinstall it after start() returns.
    void start(LineCallback on_line, ErrorCallback on_error = nullptr) override;

    /// Blocks while the peer is not reading; shutdown() from another thread
    /// aborts the wait with McpTransportError.
    void send(const std::string& frame) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const LineCallback& on_line, const ErrorCallback& on_error);
    void emit_line(std::string line, const LineCallback& on_line,
                   const ErrorCallback& on_error);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Options opts_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up the reader
};

} // namespace zmcp
