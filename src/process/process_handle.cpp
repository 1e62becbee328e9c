#include "process_handle.hpp"
#include "run_result.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace toolbelt {

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const CommandSpec& spec) {
    SpawnedProcess proc = spawn_process(spec);
    try {
        return std::unique_ptr<ProcessHandle>(new ProcessHandle(proc));
    } catch (const ProcessError&) {
        // Capture setup failed after the child started; don't leave it behind
        close_fd(proc.stdin_fd);
        ::kill(-proc.pid, SIGKILL);
        int status = 0;
        while (waitpid(proc.pid, &status, 0) < 0 && errno == EINTR) {}
        throw;
    }
}

ProcessHandle::ProcessHandle(const SpawnedProcess& proc)
    : pid_(proc.pid),
      stdin_fd_(proc.stdin_fd),
      capture_(proc.stdout_fd, proc.stderr_fd) {
    if (pipe2(cancel_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
        int err = errno;
        throw ProcessError(std::string("Failed to create cancel pipe: ") + std::strerror(err), err);
    }
    if (stdin_fd_ >= 0 && !set_nonblocking(stdin_fd_)) {
        int err = errno;
        close_fd(cancel_fds_[0]);
        close_fd(cancel_fds_[1]);
        throw ProcessError(std::string("Failed to configure stdin: ") + std::strerror(err), err);
    }
}

ProcessHandle::~ProcessHandle() {
    cancel_input();
    if (!has_exited()) {
        try {
            signal(SIGKILL);
        } catch (const ProcessError& e) {
            std::cerr << "[process] Failed to kill " << pid_ << ": " << e.what() << "\n";
        }
        wait_exit();
    }
    if (input_thread_.joinable()) {
        input_thread_.join();
    }
    close_input();
    close_fd(cancel_fds_[0]);
    close_fd(cancel_fds_[1]);
}

bool ProcessHandle::reap_locked(bool block) {
    if (exited_) return true;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exited_ = true;
        wait_status_ = status;
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere (e.g. SIGCHLD set to SIG_IGN); status is lost
        exited_ = true;
        wait_status_ = -1;
    }
    return exited_;
}

bool ProcessHandle::poll_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reap_locked(false);
}

void ProcessHandle::wait_exit() {
    if (has_exited()) return;

    // Wait without reaping so the pid stays ours until we hold the lock
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0 &&
           errno == EINTR) {}

    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked(true);
}

bool ProcessHandle::has_exited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
}

int ProcessHandle::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_) return -1;
    return exit_code_from_wait_status(wait_status_);
}

bool ProcessHandle::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) return false;

    if (::kill(-pid_, sig) == 0) return true;
    int err = errno;
    if (err == ESRCH) {
        // Group not formed yet (child between fork and setsid)
        if (::kill(pid_, sig) == 0) return true;
        err = errno;
        if (err == ESRCH) return false;
    }
    throw ProcessError("Failed to signal process " + std::to_string(pid_) + ": " +
                       std::strerror(err), err);
}

void ProcessHandle::terminate(std::chrono::milliseconds grace) {
    cancel_input();
    if (!signal(SIGTERM)) return;

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (poll_exit()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::cerr << "[process] " << pid_ << " ignored SIGTERM, sending SIGKILL\n";
    signal(SIGKILL);
    wait_exit();
}

bool ProcessHandle::write_input(const std::string& data, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    int timeout_ms = -1;
    if (timeout.count() >= 0) {
        timeout_ms = static_cast<int>(std::min<int64_t>(timeout.count(), INT_MAX));
    }
    return write_all(stdin_fd_, data, cancel_fds_[0], timeout_ms);
}

void ProcessHandle::feed_input(std::string data) {
    if (input_thread_.joinable()) {
        input_thread_.join();
    }
    input_thread_ = std::thread([this, data = std::move(data)]() {
        if (!write_input(data)) {
            int err = errno;
            if (err != ECANCELED) {
                std::cerr << "[process] Failed to write input to " << pid_ << ": "
                          << std::strerror(err) << "\n";
            }
        }
    });
}

void ProcessHandle::cancel_input() {
    char b = 1;
    // One byte keeps the pipe readable; a full pipe means it already is
    while (::write(cancel_fds_[1], &b, 1) < 0 && errno == EINTR) {}
}

void ProcessHandle::close_input() {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    close_fd(stdin_fd_);
}

} // namespace toolbelt
