#pragma once
#include "command_spec.hpp"
#include "output_capture.hpp"
#include "spawn.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>

namespace toolbelt {

// One live child process: pid, piped stdin, captured stdout/stderr and the
// terminal state, which is recorded exactly once when the pid is reaped.
// Reaping only happens under the handle's mutex, so the pid cannot be
// recycled by the OS while signal() is delivering to it.
class ProcessHandle {
public:
    // Throws ProcessError when the process cannot be started
    static std::unique_ptr<ProcessHandle> spawn(const CommandSpec& spec);

    // Kills the process group and reaps the child if it is still alive
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking exit check. Returns true once the child has exited.
    bool poll_exit();

    // Block until the child exits, then reap it
    void wait_exit();

    bool has_exited() const;

    // Exit code once exited normally, otherwise -1
    int exit_code() const;

    // Deliver sig to the child's process group. Returns false when the child
    // is already gone. Throws ProcessError if delivery fails otherwise.
    bool signal(int sig);

    // SIGTERM, give the child `grace` to exit, then SIGKILL and reap
    void terminate(std::chrono::milliseconds grace);

    // Write to the child's stdin. False if stdin is closed, the child
    // stopped reading, the timeout passed or cancel_input() was called.
    // A negative timeout waits until one of the others happens.
    bool write_input(const std::string& data,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(-1));

    // Write data to stdin from a background thread and return at once
    void feed_input(std::string data);

    // Wake every blocked write_input(). Later writes fail immediately.
    void cancel_input();

    void close_input();

    OutputCapture& output() { return capture_; }
    const OutputCapture& output() const { return capture_; }

private:
    explicit ProcessHandle(const SpawnedProcess& proc);

    bool reap_locked(bool block);

    pid_t pid_;
    int stdin_fd_;
    int cancel_fds_[2] = {-1, -1};
    std::mutex stdin_mutex_;
    std::thread input_thread_;
    OutputCapture capture_;

    mutable std::mutex mutex_;
    bool exited_ = false;
    int wait_status_ = -1;
};

} // namespace toolbelt
