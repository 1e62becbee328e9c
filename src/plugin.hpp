#pragma once
#include "tool.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace toolbelt {

using ToolFactory = std::function<std::unique_ptr<Tool>(const ToolConfig& config)>;

// Central registry for self-registering tool implementations, keyed by
// tool type ("bash", "process", "mcp").
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_tool(const std::string& type, ToolFactory factory);

    // Throws std::invalid_argument for an unknown type
    std::unique_ptr<Tool> create_tool(const ToolConfig& config) const;

    // One tool per configured entry. Entries with an unknown type are
    // skipped with a warning.
    std::vector<std::unique_ptr<Tool>> create_tools(const Config& config) const;

    std::vector<std::string> tool_types() const;
    bool has_tool(const std::string& type) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFactory> tools_;
};

// Used at file scope in each tool .cpp
struct ToolRegistrar {
    ToolRegistrar(const std::string& type, ToolFactory factory) {
        PluginRegistry::instance().register_tool(type, std::move(factory));
    }
};

} // namespace toolbelt
