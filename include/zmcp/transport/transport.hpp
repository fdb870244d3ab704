#pragma once
#include <exception>
#include <functional>
#include <string>

namespace zmcp {

/// Callback for each inbound frame, passed through undecoded.
using LineCallback = std::function<void(std::string line)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract line-oriented transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of stream or shutdown().
    /// Recoverable read problems go to on_error; exceptions thrown by
    /// either callback abort start() and propagate to the caller.
    virtual void start(LineCallback on_line, ErrorCallback on_error = nullptr) = 0;

    /// Write one frame followed by a newline, atomically with respect to
    /// other send() calls. Throws McpTransportError on failure, and when
    /// shutdown() is called while the write is still pending.
    virtual void send(const std::string& frame) = 0;

    /// Graceful shutdown. Safe to call from any thread.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace zmcp
