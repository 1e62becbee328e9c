#pragma once
#include "command_spec.hpp"
#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace toolbelt {

// Thrown when a process cannot be started or signalled
class ProcessError : public std::runtime_error {
public:
    ProcessError(const std::string& message, int error_code)
        : std::runtime_error(message), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

// Raw result of a successful spawn. The caller owns the pid and every fd.
struct SpawnedProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

// Start spec.executable in a new session (so pid == process group id) with
// all three standard streams piped. Exec and chdir failures in the child are
// reported here as ProcessError; no half-started child is left behind.
SpawnedProcess spawn_process(const CommandSpec& spec);

// Resolve a bare executable name against PATH. Names containing '/' are
// returned unchanged. Returns empty when nothing executable is found.
std::string resolve_executable(const std::string& name, const std::string& path_env);

// Write everything to fd. A closed reader yields false instead of SIGPIPE.
// With a cancel_fd or a timeout, fd should be O_NONBLOCK. The write then
// gives up (false, errno ECANCELED) once cancel_fd becomes readable, or
// (false, errno ETIMEDOUT) once timeout_ms has passed.
bool write_all(int fd, const std::string& data, int cancel_fd = -1, int timeout_ms = -1);

// Put fd in O_NONBLOCK mode. False if fcntl fails.
bool set_nonblocking(int fd);

// close() that ignores -1 and resets the descriptor
void close_fd(int& fd);

} // namespace toolbelt
