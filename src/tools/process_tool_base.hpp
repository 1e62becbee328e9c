#pragma once
#include "../tool.hpp"
#include "../process/command_spec.hpp"
#include "../process/foreground_runner.hpp"
#include "../process/process_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace toolbelt {

// Arguments shared by the process-family tools
struct ProcessArgs {
    std::string action = "run";
    std::string command_text;           // "command_arguments" (or "command")
    bool background = false;
    int timeout = 0;                    // 0 = default, negative = none
    std::vector<std::string> env;       // KEY=VALUE overlay
    pid_t pid = 0;
    std::string input;                  // written to stdin, newline appended
    bool shell = false;
};

// Returns an error ToolResult for malformed or ill-typed arguments
std::optional<ToolResult> parse_process_args(const std::string& args_json, ProcessArgs& out);

// Common run/status/kill dispatch. Subclasses decide how the command line
// is assembled from their configuration and the call's arguments.
class ProcessToolBase : public Tool {
public:
    ProcessToolBase(ToolConfig config, std::shared_ptr<ProcessRegistry> registry);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return config_.name; }
    void reset() override;

    ProcessRegistry& registry() { return *registry_; }

protected:
    // Configuration checks beyond the workspace, run before anything else
    virtual std::optional<ToolResult> validate_config() const { return std::nullopt; }

    virtual std::optional<ToolResult> build_command(const ProcessArgs& args,
                                                    CommandSpec& spec) const = 0;

    // read/write actions on background processes
    virtual bool supports_io_actions() const { return false; }

    ToolConfig config_;

private:
    ToolResult run(const ProcessArgs& args, const std::string& workspace);

    std::shared_ptr<ProcessRegistry> registry_;
    ForegroundRunner runner_;
};

} // namespace toolbelt
