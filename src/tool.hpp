#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace toolbelt {

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

// Time bounds shared by every process-backed tool
struct ProcessLimits {
    uint32_t default_timeout = 30;       // seconds, used when a call passes 0
    uint32_t kill_grace_ms = 2000;       // SIGTERM -> SIGKILL delay
    uint32_t mcp_call_timeout_ms = 5000; // per JSON-RPC call
};

// One configured tool instance: its name, which implementation backs it,
// and the implementation's string settings (workspace, command, args...)
struct ToolConfig {
    std::string name;
    std::string type;
    std::string description;
    std::unordered_map<std::string, std::string> settings;
    ProcessLimits limits;

    std::string setting(const std::string& key, const std::string& fallback = "") const;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;
    virtual void reset() {}

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

} // namespace toolbelt
