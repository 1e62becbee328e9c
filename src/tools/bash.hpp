#pragma once
#include "process_tool_base.hpp"

namespace toolbelt {

// Runs the command text through a shell (bash -c by default).
// Actions: run, status, kill.
class BashTool : public ProcessToolBase {
public:
    explicit BashTool(ToolConfig config, std::shared_ptr<ProcessRegistry> registry = nullptr);

    std::string description() const override;
    std::string parameters_json() const override;

protected:
    std::optional<ToolResult> build_command(const ProcessArgs& args,
                                            CommandSpec& spec) const override;
};

} // namespace toolbelt
