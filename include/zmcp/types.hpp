#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zmcp {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

// ---------- Tool ----------

/// Discovery projection of a registered tool, as emitted by tools/list.
/// The strategy fields are filled only for tools that implement EnhancedTool.
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    std::optional<std::vector<std::string>> usage_triggers;
    std::optional<std::vector<std::string>> best_practices;
    std::optional<std::map<std::string, std::vector<std::string>>> synergies;
    std::optional<std::vector<nlohmann::json>> workflow_snippets;

    bool is_enhanced() const {
        return usage_triggers || best_practices || synergies || workflow_snippets;
    }

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema && usage_triggers == o.usage_triggers
               && best_practices == o.best_practices && synergies == o.synergies
               && workflow_snippets == o.workflow_snippets;
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    /// Convenience for the common single-text-block result.
    static CallToolResult text(std::string text, bool is_error = false);

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

// ---------- Capabilities ----------

struct ServerCapabilities {
    // Always present; tools are not negotiated.
    nlohmann::json tools = nlohmann::json::object();

    bool operator==(const ServerCapabilities& o) const { return tools == o.tools; }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace zmcp
