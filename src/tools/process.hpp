#pragma once
#include "process_tool_base.hpp"

namespace toolbelt {

// Runs a configured base executable. Fixed arguments from the "args"
// setting come first, then the call's command_arguments split shell-style.
// Actions: run, status, kill, read, write.
class ProcessTool : public ProcessToolBase {
public:
    explicit ProcessTool(ToolConfig config, std::shared_ptr<ProcessRegistry> registry = nullptr);

    std::string description() const override;
    std::string parameters_json() const override;

protected:
    std::optional<ToolResult> validate_config() const override;
    std::optional<ToolResult> build_command(const ProcessArgs& args,
                                            CommandSpec& spec) const override;
    bool supports_io_actions() const override { return true; }
};

} // namespace toolbelt
