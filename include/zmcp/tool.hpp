#pragma once
#include "context.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zmcp {

/// A named, schema-described unit of executable functionality.
///
/// execute() reports failure by throwing; the dispatcher turns the exception
/// text into an Internal Error reply. A result with is_error set is a
/// successful call whose payload describes a domain-level problem.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string description() const = 0;
    [[nodiscard]] virtual nlohmann::json input_schema() const = 0;

    virtual CallToolResult execute(const Context& ctx, const nlohmann::json& arguments) = 0;
};

/// Tool with strategic discovery metadata surfaced through tools/list.
/// All accessors are side-effect free.
class EnhancedTool : public Tool {
public:
    [[nodiscard]] virtual std::vector<std::string> usage_triggers() const = 0;
    [[nodiscard]] virtual std::vector<std::string> best_practices() const = 0;
    [[nodiscard]] virtual std::map<std::string, std::vector<std::string>> synergies() const = 0;
    [[nodiscard]] virtual std::vector<nlohmann::json> workflow_snippets() const = 0;
};

/// Project a tool onto its tools/list entry, probing for EnhancedTool.
ToolDefinition describe_tool(const Tool& tool);

} // namespace zmcp
