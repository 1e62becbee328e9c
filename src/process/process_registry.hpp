#pragma once
#include "command_spec.hpp"
#include "process_handle.hpp"
#include "run_result.hpp"
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <sys/types.h>
#include <unordered_map>

namespace toolbelt {

// Background processes tracked by pid. Exit is only observed when status()
// is asked for; a pid that is absent was either never tracked or already
// reaped, and callers cannot tell which.
// All methods are thread-safe.
class ProcessRegistry {
public:
    static constexpr std::chrono::milliseconds kDefaultKillGrace{2000};
    static constexpr std::chrono::milliseconds kDefaultWriteTimeout{5000};

    explicit ProcessRegistry(std::chrono::milliseconds kill_grace = kDefaultKillGrace,
                             std::chrono::milliseconds write_timeout = kDefaultWriteTimeout);
    ~ProcessRegistry();

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    // Start without waiting. Running + pid on success, Failed (reason in
    // stderr_text) when the process could not be started. Input is fed to
    // stdin in the background.
    RunResult spawn(const CommandSpec& spec, const std::string& input = "");

    // Running, Exited (entry removed) or NotFound
    RunResult status(pid_t pid);

    // SIGTERM to the process group, entry removed -> Terminated, or NotFound.
    // Throws ProcessError if the signal cannot be delivered.
    RunResult kill(pid_t pid);

    // Send input plus newline to stdin -> Written, or NotFound. Throws
    // ProcessError when the child does not take the input within the write
    // timeout, has closed stdin, or is killed meanwhile.
    RunResult write(pid_t pid, const std::string& input);

    // Output accumulated since the previous read -> Read, or NotFound
    RunResult read(pid_t pid);

    bool contains(pid_t pid) const;
    size_t size() const;

    // Terminate and forget every tracked process
    void kill_all();

private:
    std::shared_ptr<ProcessHandle> find(pid_t pid) const;

    std::chrono::milliseconds kill_grace_;
    std::chrono::milliseconds write_timeout_;

    // Handles are shared so stdin writes and output reads run without the
    // registry lock held
    mutable std::shared_mutex mutex_;
    std::unordered_map<pid_t, std::shared_ptr<ProcessHandle>> processes_;
};

} // namespace toolbelt
