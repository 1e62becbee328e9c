#pragma once
#include "../tool.hpp"
#include "../process/run_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolbelt {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Failed to parse arguments: expected a JSON object"};
    }
    return std::nullopt;
}

// Serialize for the caller. Child output is not guaranteed to be UTF-8.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline ToolResult to_tool_result(const RunResult& result) {
    return ToolResult{result.ok(), dump_json(result.to_json())};
}

} // namespace toolbelt
