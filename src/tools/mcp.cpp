#include "mcp.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include "../util.hpp"

#include <filesystem>
#include <iostream>

static toolbelt::ToolRegistrar reg_mcp("mcp",
    [](const toolbelt::ToolConfig& config) {
        return std::make_unique<toolbelt::McpTool>(config);
    });

namespace toolbelt {

namespace {

const char* const kFallbackSchema = R"({"type":"object"})";

std::string working_directory(const ToolConfig& config) {
    std::string workspace = config.setting("workspace");
    if (!workspace.empty()) return workspace;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

// list_tools answers with a bare array or with {"tools": [...]}
const nlohmann::json* find_tool_entry(const nlohmann::json& result, const std::string& name) {
    const nlohmann::json* list = &result;
    if (result.is_object() && result.contains("tools")) {
        list = &result["tools"];
    }
    if (!list->is_array()) return nullptr;
    for (const auto& entry : *list) {
        if (entry.is_object() && entry.contains("name") && entry["name"].is_string() &&
            entry["name"].get<std::string>() == name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

McpTool::McpTool(ToolConfig config)
    : config_(std::move(config)),
      transport_(config_.name,
                 std::chrono::milliseconds(config_.limits.mcp_call_timeout_ms)) {}

std::string McpTool::config_error() const {
    if (config_.setting("command").empty()) {
        return "Configuration error: command is not set for " + config_.name;
    }
    std::string workspace = config_.setting("workspace");
    std::error_code ec;
    if (!workspace.empty() && !std::filesystem::is_directory(workspace, ec)) {
        return "Configuration error: workspace is not a directory: " + workspace;
    }
    return "";
}

void McpTool::ensure_started() const {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (transport_.is_open()) return;
    transport_.start(config_.setting("command"), working_directory(config_),
                     split_shell_args(config_.setting("args")));
}

void McpTool::handle_error(const McpError& e) const {
    if (e.kind() == McpErrorKind::EndOfStream || e.kind() == McpErrorKind::Write) {
        std::cerr << "[mcp] " << config_.name << ": server went away, closing session\n";
        transport_.close();
    }
}

ToolResult McpTool::execute(const std::string& args_json) {
    std::string err = config_error();
    if (!err.empty()) return ToolResult{false, err};

    nlohmann::json params;
    if (auto parse_err = parse_tool_json(args_json, params)) return *parse_err;

    try {
        ensure_started();
        nlohmann::json result = transport_.invoke(config_.name, params);
        return ToolResult{true, dump_json(result)};
    } catch (const McpError& e) {
        handle_error(e);
        return ToolResult{false, std::string("MCP error: ") + e.what()};
    }
}

std::string McpTool::description() const {
    if (!config_.description.empty()) return config_.description;
    return "Call the " + config_.name + " tool on an MCP server (" +
           config_.setting("command", "unconfigured") + ")";
}

std::string McpTool::parameters_json() const {
    std::string err = config_error();
    if (!err.empty()) {
        std::cerr << "[mcp] " << config_.name << ": " << err << "\n";
        return kFallbackSchema;
    }

    try {
        ensure_started();
        nlohmann::json result = transport_.invoke("list_tools", nlohmann::json::object());
        const nlohmann::json* entry = find_tool_entry(result, config_.name);
        if (!entry) {
            std::cerr << "[mcp] " << config_.name << ": server does not list this tool\n";
            return kFallbackSchema;
        }
        for (const char* key : {"parameters", "inputSchema"}) {
            if (entry->contains(key) && (*entry)[key].is_object()) {
                return dump_json((*entry)[key]);
            }
        }
        std::cerr << "[mcp] " << config_.name << ": no parameter schema listed\n";
    } catch (const McpError& e) {
        handle_error(e);
        std::cerr << "[mcp] " << config_.name << ": list_tools failed: " << e.what() << "\n";
    }
    return kFallbackSchema;
}

void McpTool::reset() {
    transport_.close();
}

} // namespace toolbelt
