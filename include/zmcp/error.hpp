#pragma once
#include "json_rpc.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace zmcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Frame could not be decoded at all (no identifier recoverable).
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

/// A frame that decoded as a request but is unusable. Carries the id when
/// one could be extracted so the reply can echo it.
class McpRequestError : public McpProtocolError {
public:
    std::optional<RequestId> id;
    McpRequestError(int code, const std::string& msg, std::optional<RequestId> id)
        : McpProtocolError(code, msg), id(std::move(id)) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Inbound line exceeded the configured maximum frame size.
class McpFrameTooLargeError : public McpTransportError {
public:
    using McpTransportError::McpTransportError;
};

class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

/// Thrown by Context::throw_if_cancelled().
class McpCancelledError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace zmcp
