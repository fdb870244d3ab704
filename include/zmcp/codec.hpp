#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace zmcp {

class Codec {
public:
    /// Classify one raw frame.
    ///
    /// Returns a JsonRpcRequest when the frame carries a non-null id and a
    /// JsonRpcNotification otherwise. Throws McpParseError when the frame is
    /// not a decodable JSON-RPC object, and McpRequestError when it decoded
    /// as a request that cannot be served (bad version or id type).
    /// Frames that look like responses throw McpProtocolError with
    /// InvalidRequest; callers log and drop them.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a response to a single-line JSON string (no newline).
    /// Throws McpTransportError when the payload cannot be encoded.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& msg);
    [[nodiscard]] static std::string serialize(const JsonRpcNotification& msg);
    [[nodiscard]] static std::string serialize(const JsonRpcRequest& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace zmcp
