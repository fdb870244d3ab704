#include "zmcp/tool_registry.hpp"
#include "zmcp/logging.hpp"
#include <stdexcept>

namespace zmcp {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    std::string name = tool->name();
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = tools_.insert_or_assign(name, std::move(tool));
        (void)it;
        replaced = !inserted;
    }
    auto log = logging::get("registry");
    if (replaced) {
        log->warn("Replaced tool: {}", name);
    } else {
        log->info("Registered tool: {}", name);
    }
    return replaced;
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) return nullptr;
    return it->second;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Tool>> out;
    out.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        out.push_back(tool);
    }
    return out;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

} // namespace zmcp
