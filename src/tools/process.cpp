#include "process.hpp"
#include "../plugin.hpp"
#include "../util.hpp"

static toolbelt::ToolRegistrar reg_process("process",
    [](const toolbelt::ToolConfig& config) {
        return std::make_unique<toolbelt::ProcessTool>(config);
    });

namespace toolbelt {

ProcessTool::ProcessTool(ToolConfig config, std::shared_ptr<ProcessRegistry> registry)
    : ProcessToolBase(std::move(config), std::move(registry)) {}

std::optional<ToolResult> ProcessTool::validate_config() const {
    if (config_.setting("command").empty()) {
        return ToolResult{false, "Configuration error: command is not set for " + config_.name};
    }
    return std::nullopt;
}

std::optional<ToolResult> ProcessTool::build_command(const ProcessArgs& args,
                                                     CommandSpec& spec) const {
    std::vector<std::string> base = split_shell_args(config_.setting("args"));
    base.insert(base.begin(), config_.setting("command"));

    if (args.shell) {
        std::string line = join_shell_args(base);
        if (!args.command_text.empty()) {
            line += " " + args.command_text;
        }
        spec.executable = "bash";
        spec.args = {"-c", line};
        return std::nullopt;
    }

    spec.executable = base.front();
    spec.args.assign(base.begin() + 1, base.end());
    for (auto& arg : split_shell_args(args.command_text)) {
        spec.args.push_back(std::move(arg));
    }
    return std::nullopt;
}

std::string ProcessTool::description() const {
    std::string desc = config_.description.empty()
        ? "Run " + config_.setting("command", "the configured program") +
          " with the given arguments. Supports background processes: status, kill, "
          "write (send a line to stdin) and read (collect new output) by pid."
        : config_.description;
    return desc;
}

std::string ProcessTool::parameters_json() const {
    return R"json({"type":"object","properties":{"action":{"type":"string","enum":["run","status","kill","read","write"],"description":"run (default), status, kill, read (new output) or write (send input) for a background pid"},"command_arguments":{"type":"string","description":"Arguments appended to the configured command, split like a shell would (quotes and backslash escapes respected)"},"shell":{"type":"boolean","description":"Run the whole command line through bash -c"},"background":{"type":"boolean","description":"Run in the background and return a pid"},"timeout":{"type":"integer","description":"Timeout in seconds (0 = default of 30, negative = no timeout)"},"env":{"type":"array","items":{"type":"string"},"description":"Environment variables as KEY=VALUE pairs"},"pid":{"type":"integer","description":"PID of a background process"},"input":{"type":"string","description":"Data for the process's stdin (newline appended)"}}})json";
}

} // namespace toolbelt
