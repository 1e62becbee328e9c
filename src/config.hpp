#pragma once
#include "tool.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbelt {

struct Config {
    ProcessLimits process;

    // Configured tool instances keyed by tool name
    std::map<std::string, ToolConfig> tools;

    // Load from ~/.toolbelt/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from already-parsed JSON (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // One ToolConfig per configured tool, with the process limits applied
    std::vector<ToolConfig> tool_configs() const;

    // Settings of a tool by name (nullptr if not configured)
    const ToolConfig* find_tool(const std::string& name) const;
};

} // namespace toolbelt
