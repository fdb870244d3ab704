#pragma once
#include "tool.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zmcp {

/// Name -> Tool mapping. Populated before serving; later registrations are
/// safe but replace any tool of the same name.
class ToolRegistry {
public:
    /// Returns true if an existing tool of the same name was replaced.
    bool register_tool(std::shared_ptr<Tool> tool);

    [[nodiscard]] std::shared_ptr<Tool> find(const std::string& name) const;
    [[nodiscard]] bool has_tool(const std::string& name) const;

    /// Snapshot of all tools, ordered by name.
    [[nodiscard]] std::vector<std::shared_ptr<Tool>> tools() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace zmcp
