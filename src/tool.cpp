#include "zmcp/tool.hpp"

namespace zmcp {

ToolDefinition describe_tool(const Tool& tool) {
    ToolDefinition def;
    def.name = tool.name();
    def.description = tool.description();
    def.input_schema = tool.input_schema();

    if (const auto* enhanced = dynamic_cast<const EnhancedTool*>(&tool)) {
        def.usage_triggers = enhanced->usage_triggers();
        def.best_practices = enhanced->best_practices();
        def.synergies = enhanced->synergies();
        def.workflow_snippets = enhanced->workflow_snippets();
    }
    return def;
}

} // namespace zmcp
