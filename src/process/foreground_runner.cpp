#include "foreground_runner.hpp"
#include "process_handle.hpp"

#include <csignal>
#include <future>
#include <iostream>
#include <memory>

namespace toolbelt {

ForegroundRunner::ForegroundRunner(int default_timeout_seconds)
    : default_timeout_(default_timeout_seconds > 0 ? default_timeout_seconds
                                                   : kDefaultTimeoutSeconds) {}

int ForegroundRunner::effective_timeout(int requested_seconds) const {
    if (requested_seconds < 0) return kNoTimeout;
    if (requested_seconds == 0) return default_timeout_;
    return requested_seconds;
}

RunResult ForegroundRunner::run(const CommandSpec& spec, int timeout_seconds,
                                const std::string& input) const {
    RunResult result;

    std::unique_ptr<ProcessHandle> proc;
    try {
        proc = ProcessHandle::spawn(spec);
    } catch (const ProcessError& e) {
        std::cerr << "[process] Failed to start " << spec.display() << ": " << e.what() << "\n";
        result.status = RunStatus::Failed;
        result.stderr_text = e.what();
        return result;
    }

    // Feed stdin from its own task so a child that never reads cannot
    // stall us before the deadline is armed.
    ProcessHandle* child = proc.get();
    auto feeder = std::async(std::launch::async, [child, input]() {
        if (!input.empty()) {
            child->write_input(input + "\n");
        }
        child->close_input();
    });

    int timeout = effective_timeout(timeout_seconds);
    bool timed_out = false;

    if (timeout == kNoTimeout) {
        proc->wait_exit();
    } else {
        auto finished = std::async(std::launch::async, [child]() { child->wait_exit(); });
        if (finished.wait_for(std::chrono::seconds(timeout)) == std::future_status::timeout) {
            timed_out = true;
            try {
                proc->signal(SIGKILL);
            } catch (const ProcessError& e) {
                // Best effort: the waiter below still reaps whatever is left
                std::cerr << "[process] Kill after timeout failed: " << e.what() << "\n";
            }
            std::cerr << "[process] Command timed out after " << timeout << "s: "
                      << spec.display() << "\n";
        }
        finished.get();
    }
    // The child is gone; a descendant still holding stdin must not stall us
    proc->cancel_input();
    feeder.get();

    proc->output().wait_closed(kOutputDrainGrace);
    proc->output().stop();

    result.stdout_text = proc->output().stdout_text();
    result.stderr_text = proc->output().stderr_text();
    result.exit_code = proc->exit_code();

    if (timed_out) {
        result.status = RunStatus::Timeout;
        result.exit_code = -1;
    } else if (result.exit_code == 0) {
        result.status = RunStatus::Completed;
    } else {
        result.status = RunStatus::Failed;
    }
    return result;
}

} // namespace toolbelt
