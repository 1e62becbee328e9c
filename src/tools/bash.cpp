#include "bash.hpp"
#include "../plugin.hpp"
#include "../util.hpp"

static toolbelt::ToolRegistrar reg_bash("bash",
    [](const toolbelt::ToolConfig& config) {
        return std::make_unique<toolbelt::BashTool>(config);
    });

namespace toolbelt {

BashTool::BashTool(ToolConfig config, std::shared_ptr<ProcessRegistry> registry)
    : ProcessToolBase(std::move(config), std::move(registry)) {}

std::optional<ToolResult> BashTool::build_command(const ProcessArgs& args,
                                                  CommandSpec& spec) const {
    if (args.command_text.empty()) {
        return ToolResult{false, "Missing required parameter: command_arguments"};
    }
    spec.executable = config_.setting("command", "bash");
    spec.args = split_shell_args(config_.setting("args", "-c"));
    spec.args.push_back(args.command_text);
    return std::nullopt;
}

std::string BashTool::description() const {
    if (!config_.description.empty()) return config_.description;
    return "Execute a bash command in the workspace. Set background to start long-running "
           "commands (e.g. servers) and get a pid back; use action status or kill with that "
           "pid to check on or stop them.";
}

std::string BashTool::parameters_json() const {
    return R"json({"type":"object","properties":{"action":{"type":"string","enum":["run","status","kill"],"description":"run (default), status (check pid), or kill (stop pid)"},"command_arguments":{"type":"string","description":"The bash command to execute (required for run)"},"background":{"type":"boolean","description":"Run the command in the background"},"timeout":{"type":"integer","description":"Timeout in seconds (0 = default of 30, negative = no timeout)"},"env":{"type":"array","items":{"type":"string"},"description":"Environment variables as KEY=VALUE pairs"},"pid":{"type":"integer","description":"PID of a background process (for status and kill)"}}})json";
}

} // namespace toolbelt
