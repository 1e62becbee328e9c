#include "plugin.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace toolbelt {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_tool(const std::string& type, ToolFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[type] = std::move(factory);
}

std::unique_ptr<Tool> PluginRegistry::create_tool(const ToolConfig& config) const {
    ToolFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(config.type);
        if (it == tools_.end()) {
            throw std::invalid_argument("Unknown tool type: " + config.type);
        }
        factory = it->second;
    }
    return factory(config);
}

std::vector<std::unique_ptr<Tool>> PluginRegistry::create_tools(const Config& config) const {
    std::vector<std::unique_ptr<Tool>> result;
    for (const auto& tc : config.tool_configs()) {
        try {
            result.push_back(create_tool(tc));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[plugin] Skipping tool " << tc.name << ": " << e.what() << "\n";
        }
    }
    return result;
}

std::vector<std::string> PluginRegistry::tool_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_tool(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(type) > 0;
}

} // namespace toolbelt
