#include "spawn.hpp"
#include "../util.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace toolbelt {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
};

void open_pipe(Pipe& p) {
    if (pipe2(p.fds, O_CLOEXEC) != 0) {
        int err = errno;
        throw ProcessError(std::string("Failed to create pipe: ") + std::strerror(err), err);
    }
}

std::string overlay_path(const std::vector<std::string>& env) {
    std::string path;
    bool found = false;
    for (const auto& entry : env) {
        if (entry.rfind("PATH=", 0) == 0) {
            path = entry.substr(5);
            found = true;
        }
    }
    if (found) return path;
    if (const char* p = std::getenv("PATH")) return p;
    return "/usr/local/bin:/usr/bin:/bin";
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const SpawnedProcess& child_ends, int report_fd,
                             const char* working_dir, const char* exe,
                             char* const* argv, char* const* envp) {
    setsid();

    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigaction(SIGPIPE, &dfl, nullptr);

    dup2(child_ends.stdin_fd, STDIN_FILENO);
    dup2(child_ends.stdout_fd, STDOUT_FILENO);
    dup2(child_ends.stderr_fd, STDERR_FILENO);

    if (working_dir != nullptr && chdir(working_dir) != 0) {
        int err = errno;
        ssize_t ignored = write(report_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    execve(exe, argv, envp);

    int err = errno;
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string resolve_executable(const std::string& name, const std::string& path_env) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) return name;

    for (auto dir : split(path_env, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

SpawnedProcess spawn_process(const CommandSpec& spec) {
    if (spec.executable.empty()) {
        throw ProcessError("No executable specified", EINVAL);
    }

    std::string exe = resolve_executable(spec.executable, overlay_path(spec.env));
    if (exe.empty()) {
        throw ProcessError("Executable not found: " + spec.executable, ENOENT);
    }

    // Everything the child needs is allocated before fork
    std::vector<std::string> env = build_environment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.executable);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    Pipe in, out, err, report;
    open_pipe(in);
    open_pipe(out);
    open_pipe(err);
    open_pipe(report);

    const char* working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        throw ProcessError(std::string("Failed to fork process: ") + std::strerror(e), e);
    }

    if (pid == 0) {
        SpawnedProcess child_ends;
        child_ends.stdin_fd = in.fds[0];
        child_ends.stdout_fd = out.fds[1];
        child_ends.stderr_fd = err.fds[1];
        exec_child(child_ends, report.fds[1], working_dir, exe.c_str(),
                   argv.data(), envp.data());
    }

    // Parent: drop the child's ends so EOF propagates
    close_fd(in.fds[0]);
    close_fd(out.fds[1]);
    close_fd(err.fds[1]);
    close_fd(report.fds[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(report.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        std::string what = working_dir != nullptr && child_errno == ENOENT &&
                           access(working_dir, F_OK) != 0
            ? "Failed to enter working directory " + spec.working_dir
            : "Failed to execute " + spec.executable;
        throw ProcessError(what + ": " + std::strerror(child_errno), child_errno);
    }

    SpawnedProcess proc;
    proc.pid = pid;
    std::swap(proc.stdin_fd, in.fds[1]);
    std::swap(proc.stdout_fd, out.fds[0]);
    std::swap(proc.stderr_fd, err.fds[0]);
    return proc;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool write_all(int fd, const std::string& data, int cancel_fd, int timeout_ms) {
    if (fd < 0) return false;

    // Block SIGPIPE on this thread for the duration of the write and
    // consume any SIGPIPE we caused ourselves.
    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    sigset_t pending;
    sigpending(&pending);
    bool was_pending = sigismember(&pending, SIGPIPE) == 1;

    bool polled = cancel_fd >= 0 || timeout_ms >= 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    bool ok = true;
    bool broke = false;
    size_t written = 0;
    while (written < data.size()) {
        if (polled) {
            int wait_ms = -1;
            if (timeout_ms >= 0) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0) {
                    errno = ETIMEDOUT;
                    ok = false;
                    break;
                }
                wait_ms = static_cast<int>(left.count());
            }
            struct pollfd pfds[2];
            pfds[0].fd = fd;
            pfds[0].events = POLLOUT;
            pfds[0].revents = 0;
            pfds[1].fd = cancel_fd;
            pfds[1].events = POLLIN;
            pfds[1].revents = 0;
            int n = poll(pfds, cancel_fd >= 0 ? 2 : 1, wait_ms);
            if (n < 0) {
                if (errno == EINTR) continue;
                ok = false;
                break;
            }
            if (n == 0) continue;
            if (cancel_fd >= 0 && pfds[1].revents != 0) {
                errno = ECANCELED;
                ok = false;
                break;
            }
        }
        ssize_t w = ::write(fd, data.data() + written, data.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (polled && (errno == EAGAIN || errno == EWOULDBLOCK)) continue;
            broke = errno == EPIPE;
            ok = false;
            break;
        }
        written += static_cast<size_t>(w);
    }

    int err = errno;
    if (broke && !was_pending) {
        struct timespec zero {};
        while (sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {}
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = err;
    return ok;
}

} // namespace toolbelt
