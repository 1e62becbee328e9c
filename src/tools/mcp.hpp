#pragma once
#include "../tool.hpp"
#include "../mcp/mcp_transport.hpp"
#include <mutex>
#include <string>

namespace toolbelt {

// Forwards each call to an MCP server child as a JSON-RPC request whose
// method is the tool's configured name. The server is started on first use
// and restarted after it goes away.
class McpTool : public Tool {
public:
    explicit McpTool(ToolConfig config);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return config_.name; }
    std::string description() const override;
    std::string parameters_json() const override;
    void reset() override;

    McpTransport& transport() { return transport_; }

private:
    // Configuration error message, empty if the config is usable
    std::string config_error() const;

    // Throws McpError(Spawn) when the server cannot be started
    void ensure_started() const;

    // Close the session after the child went away (end of stream, or a broken
    // stdin pipe) so the next call restarts it
    void handle_error(const McpError& e) const;

    ToolConfig config_;
    mutable std::mutex start_mutex_;
    mutable McpTransport transport_;
};

} // namespace toolbelt
