#include "run_result.hpp"
#include <sys/wait.h>

namespace toolbelt {

const char* status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Running:    return "running";
        case RunStatus::Completed:  return "completed";
        case RunStatus::Failed:     return "failed";
        case RunStatus::Timeout:    return "timeout";
        case RunStatus::Exited:     return "exited";
        case RunStatus::Terminated: return "terminated";
        case RunStatus::NotFound:   return "not found";
        case RunStatus::Written:    return "written";
        case RunStatus::Read:       return "read";
    }
    return "unknown";
}

bool RunResult::ok() const {
    return status != RunStatus::Failed && status != RunStatus::Timeout;
}

nlohmann::json RunResult::to_json() const {
    nlohmann::json j = {
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"status", status_name(status)}
    };
    if (pid > 0) {
        j["pid"] = pid;
    }
    if (exit_code >= 0) {
        j["exit_code"] = exit_code;
    }
    return j;
}

int exit_code_from_wait_status(int wait_status) {
    if (wait_status >= 0 && WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    return -1;
}

} // namespace toolbelt
