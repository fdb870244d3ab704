#include "zmcp/types.hpp"
#include <stdexcept>

namespace zmcp {

CallToolResult CallToolResult::text(std::string text, bool is_error) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    result.is_error = is_error;
    return result;
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    const std::string type = j.value("type", std::string("text"));
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
    // Empty collections are omitted, matching the discovery wire format.
    if (t.usage_triggers && !t.usage_triggers->empty()) j["usageTriggers"] = *t.usage_triggers;
    if (t.best_practices && !t.best_practices->empty()) j["bestPractices"] = *t.best_practices;
    if (t.synergies && !t.synergies->empty()) j["synergies"] = *t.synergies;
    if (t.workflow_snippets && !t.workflow_snippets->empty()) {
        j["workflowSnippets"] = *t.workflow_snippets;
    }
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    t.input_schema = j.at("inputSchema");
    if (j.contains("usageTriggers")) {
        t.usage_triggers = j.at("usageTriggers").get<std::vector<std::string>>();
    }
    if (j.contains("bestPractices")) {
        t.best_practices = j.at("bestPractices").get<std::vector<std::string>>();
    }
    if (j.contains("synergies")) {
        t.synergies = j.at("synergies").get<std::map<std::string, std::vector<std::string>>>();
    }
    if (j.contains("workflowSnippets")) {
        t.workflow_snippets = j.at("workflowSnippets").get<std::vector<nlohmann::json>>();
    }
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& c : t.content) {
        content.push_back(c);
    }
    j = {{"content", content}};
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content = j.at("content").get<std::vector<TextContent>>();
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    t.is_error = j.value("isError", false);
}

// ---------- ServerCapabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = {{"tools", t.tools}};
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    t.tools = j.at("tools");
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string());
}

// ---------- InitializeResult ----------

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

} // namespace zmcp
