#pragma once
#include "command_spec.hpp"
#include "run_result.hpp"
#include <chrono>
#include <string>

namespace toolbelt {

// Runs a command to completion or to its deadline, whichever comes first.
// Timeout semantics (seconds): 0 = default, negative = no deadline.
class ForegroundRunner {
public:
    static constexpr int kDefaultTimeoutSeconds = 30;
    static constexpr int kNoTimeout = -1;

    explicit ForegroundRunner(int default_timeout_seconds = kDefaultTimeoutSeconds);

    // Never throws for process-level problems: spawn errors come back as
    // RunStatus::Failed with the reason in stderr_text. Non-empty input is
    // written to stdin followed by a newline; stdin is closed either way.
    RunResult run(const CommandSpec& spec, int timeout_seconds,
                  const std::string& input = "") const;

    // Deadline actually applied for a requested timeout; kNoTimeout if none
    int effective_timeout(int requested_seconds) const;

private:
    // Time allowed for pipes to reach EOF after the child is gone, in case a
    // descendant left the process group and still holds them
    static constexpr std::chrono::milliseconds kOutputDrainGrace{500};

    int default_timeout_;
};

} // namespace toolbelt
