#pragma once

#include "dialogue/tool.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace printvoice {
namespace dialogue {

class ToolRegistry {
public:
    // Returns false if the tool is null or its name is already taken
    bool registerTool(std::shared_ptr<Tool> tool);

    std::shared_ptr<Tool> getTool(const std::string& name) const;
    bool hasTool(const std::string& name) const;
    std::vector<std::string> getToolNames() const;
    size_t size() const;

    /**
     * Run a tool by name. Never throws: an unknown tool or a tool that
     * throws yields {"success": false, "error": ...}.
     */
    nlohmann::json execute(const std::string& name, const nlohmann::json& params) const;

    // [{name, description, input_schema}, ...] for the system prompt
    nlohmann::json catalog() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace dialogue
} // namespace printvoice
