#include "zmcp/codec.hpp"
#include "zmcp/error.hpp"
#include "zmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace zmcp {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Integers keep their exact value; ids depend on it.
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unknown JSON value type");
    }
}

nlohmann::json parse_document(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // Scalar documents are not messages; get_value() rejects them too.
    simdjson::ondemand::value root;
    error = doc.get_value().get(root);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_to_nlohmann(root);
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON document");
    }
    return j;
}

bool has_valid_version(const nlohmann::json& j) {
    auto it = j.find("jsonrpc");
    return it != j.end() && it->is_string() && it->get<std::string>() == JSONRPC_VERSION;
}

std::string dump_checked(const nlohmann::json& j) {
    try {
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        throw McpTransportError(std::string("Failed to encode frame: ") + e.what());
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    // A non-string method decodes as neither a request nor a notification.
    if (j.contains("method") && !j.at("method").is_string()) {
        throw McpParseError("'method' must be a string");
    }

    // An explicit null id classifies as a notification, like an absent one.
    bool has_id = j.contains("id") && !j.at("id").is_null();
    bool has_method = j.contains("method");

    if (has_id) {
        if (!has_method && (j.contains("result") || j.contains("error"))) {
            throw McpProtocolError(error::InvalidRequest, "Unexpected response frame");
        }

        JsonRpcRequest req;
        try {
            from_json(j.at("id"), req.id);
        } catch (const std::exception&) {
            throw McpRequestError(error::InvalidRequest,
                                  "Request id must be a string or a number", std::nullopt);
        }
        if (!has_valid_version(j)) {
            throw McpRequestError(error::InvalidRequest,
                                  "Invalid JSON-RPC version, expected '2.0'", req.id);
        }
        // A missing method dispatches as "" and fails lookup.
        req.method = j.value("method", std::string());
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }

    if (!has_valid_version(j)) {
        throw McpProtocolError(error::InvalidRequest,
                               "Invalid JSON-RPC version in notification");
    }
    JsonRpcNotification notif;
    notif.method = j.value("method", std::string());
    if (j.contains("params")) notif.params = j.at("params");
    return notif;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    nlohmann::json j = parse_document(raw);
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return dump_checked(j);
}

std::string Codec::serialize(const JsonRpcNotification& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return dump_checked(j);
}

std::string Codec::serialize(const JsonRpcRequest& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return dump_checked(j);
}

} // namespace zmcp
