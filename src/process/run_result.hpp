#pragma once
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace toolbelt {

enum class RunStatus {
    Running,
    Completed,
    Failed,
    Timeout,
    Exited,
    Terminated,
    NotFound,
    Written,
    Read,
};

const char* status_name(RunStatus status);

// Externally visible outcome of every process operation. Timeout and failure
// still carry whatever output was captured before the process ended.
struct RunResult {
    std::string stdout_text;
    std::string stderr_text;
    pid_t pid = 0;        // set for background processes
    int exit_code = -1;   // -1 when unknown or killed by a signal
    RunStatus status = RunStatus::Failed;

    // Whether the caller should treat this as a successful tool call
    bool ok() const;

    nlohmann::json to_json() const;
};

// Map a waitpid() status to an exit code, -1 for signals
int exit_code_from_wait_status(int wait_status);

} // namespace toolbelt
