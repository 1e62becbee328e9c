#include "process_tool_base.hpp"
#include "tool_util.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>

namespace toolbelt {

std::optional<ToolResult> parse_process_args(const std::string& args_json, ProcessArgs& out) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return err;

    if (args.contains("action") && !args["action"].is_null()) {
        if (!args["action"].is_string()) {
            return ToolResult{false, "Parameter action must be a string"};
        }
        std::string action = args["action"].get<std::string>();
        if (!action.empty()) out.action = action;
    }

    for (const char* key : {"command_arguments", "command"}) {
        if (!args.contains(key) || args[key].is_null()) continue;
        if (!args[key].is_string()) {
            return ToolResult{false, std::string("Parameter ") + key + " must be a string"};
        }
        out.command_text = args[key].get<std::string>();
        break;
    }

    if (args.contains("background") && !args["background"].is_null()) {
        if (!args["background"].is_boolean()) {
            return ToolResult{false, "Parameter background must be a boolean"};
        }
        out.background = args["background"].get<bool>();
    }

    if (args.contains("shell") && !args["shell"].is_null()) {
        if (!args["shell"].is_boolean()) {
            return ToolResult{false, "Parameter shell must be a boolean"};
        }
        out.shell = args["shell"].get<bool>();
    }

    if (args.contains("timeout") && !args["timeout"].is_null()) {
        if (!args["timeout"].is_number_integer()) {
            return ToolResult{false, "Parameter timeout must be an integer (seconds)"};
        }
        if (args["timeout"].is_number_unsigned()) {
            uint64_t t = args["timeout"].get<uint64_t>();
            out.timeout = t > static_cast<uint64_t>(std::numeric_limits<int>::max())
                              ? std::numeric_limits<int>::max()
                              : static_cast<int>(t);
        } else {
            int64_t t = args["timeout"].get<int64_t>();
            if (t > std::numeric_limits<int>::max()) t = std::numeric_limits<int>::max();
            if (t < 0) t = ForegroundRunner::kNoTimeout;
            out.timeout = static_cast<int>(t);
        }
    }

    if (args.contains("env") && !args["env"].is_null()) {
        if (!args["env"].is_array()) {
            return ToolResult{false, "Parameter env must be an array of KEY=VALUE strings"};
        }
        for (const auto& e : args["env"]) {
            if (!e.is_string()) {
                return ToolResult{false, "Parameter env must be an array of KEY=VALUE strings"};
            }
            out.env.push_back(e.get<std::string>());
        }
        std::string bad = find_invalid_env_entry(out.env);
        if (!bad.empty()) {
            return ToolResult{false, "Invalid env entry (expected KEY=VALUE): " + bad};
        }
    }

    if (args.contains("pid") && !args["pid"].is_null()) {
        if (!args["pid"].is_number_integer()) {
            return ToolResult{false, "Parameter pid must be an integer"};
        }
        int64_t pid = args["pid"].get<int64_t>();
        if (pid <= 0 || pid > std::numeric_limits<pid_t>::max()) {
            return ToolResult{false, "Parameter pid must be a positive process id"};
        }
        out.pid = static_cast<pid_t>(pid);
    }

    if (args.contains("input") && !args["input"].is_null()) {
        if (!args["input"].is_string()) {
            return ToolResult{false, "Parameter input must be a string"};
        }
        out.input = args["input"].get<std::string>();
    }

    return std::nullopt;
}

ProcessToolBase::ProcessToolBase(ToolConfig config, std::shared_ptr<ProcessRegistry> registry)
    : config_(std::move(config)),
      registry_(registry ? std::move(registry)
                         : std::make_shared<ProcessRegistry>(
                               std::chrono::milliseconds(config_.limits.kill_grace_ms))),
      runner_(static_cast<int>(config_.limits.default_timeout)) {}

void ProcessToolBase::reset() {
    registry_->kill_all();
}

ToolResult ProcessToolBase::execute(const std::string& args_json) {
    std::string workspace = config_.setting("workspace");
    if (workspace.empty()) {
        return ToolResult{false, "Configuration error: workspace is not set for " + config_.name};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace, ec)) {
        return ToolResult{false, "Configuration error: workspace is not a directory: " + workspace};
    }
    if (auto err = validate_config()) return *err;

    ProcessArgs args;
    if (auto err = parse_process_args(args_json, args)) return *err;

    if (args.action == "run") {
        return run(args, workspace);
    }

    bool io_action = args.action == "read" || args.action == "write";
    if (args.action != "status" && args.action != "kill" &&
        !(io_action && supports_io_actions())) {
        return ToolResult{false, "Unknown action: " + args.action};
    }
    if (args.pid == 0) {
        return ToolResult{false, "Missing required parameter: pid (for " + args.action + ")"};
    }

    if (args.action == "status") {
        return to_tool_result(registry_->status(args.pid));
    }
    if (args.action == "read") {
        return to_tool_result(registry_->read(args.pid));
    }

    try {
        if (args.action == "kill") {
            return to_tool_result(registry_->kill(args.pid));
        }
        if (args.input.empty()) {
            return ToolResult{false, "Missing required parameter: input (for write)"};
        }
        return to_tool_result(registry_->write(args.pid, args.input));
    } catch (const ProcessError& e) {
        return ToolResult{false, std::string("Failed to ") + args.action + " process " +
                                 std::to_string(args.pid) + ": " + e.what()};
    }
}

ToolResult ProcessToolBase::run(const ProcessArgs& args, const std::string& workspace) {
    CommandSpec spec;
    if (auto err = build_command(args, spec)) return *err;
    spec.working_dir = workspace;
    spec.env = args.env;

    if (args.background) {
        return to_tool_result(registry_->spawn(spec, args.input));
    }
    return to_tool_result(runner_.run(spec, args.timeout, args.input));
}

} // namespace toolbelt
