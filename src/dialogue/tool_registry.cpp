#include "dialogue/tool_registry.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace dialogue {

bool ToolRegistry::registerTool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        utils::Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.find(name) != tools_.end()) {
        utils::Logger::warn("Tool '" + name + "' is already registered, skipping");
        return false;
    }

    tools_[name] = std::move(tool);
    utils::Logger::info("Registered tool: " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::getTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second : nullptr;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

std::vector<std::string> ToolRegistry::getToolNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& entry : tools_) {
        names.push_back(entry.first);
    }
    return names;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

nlohmann::json ToolRegistry::execute(const std::string& name, const nlohmann::json& params) const {
    auto tool = getTool(name);
    if (!tool) {
        utils::Logger::warn("Model requested unknown tool '" + name + "'");
        return toolFailure("Unknown tool");
    }

    utils::Logger::info("Executing tool: " + name);
    try {
        return tool->execute(params);
    } catch (const std::exception& e) {
        PRINTVOICE_REPORT_ERROR(utils::ErrorCategory::TOOL_EXECUTION, utils::ErrorSeverity::WARNING,
                                e.what(), name);
        return toolFailure(std::string("Tool execution failed: ") + e.what());
    }
}

nlohmann::json ToolRegistry::catalog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : tools_) {
        tools.push_back({
            {"name", entry.second->name()},
            {"description", entry.second->description()},
            {"input_schema", entry.second->parameterSchema()}
        });
    }
    return tools;
}

} // namespace dialogue
} // namespace printvoice
