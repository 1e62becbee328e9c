#include "mcp_transport.hpp"
#include "../process/command_spec.hpp"
#include "../process/spawn.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <limits>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace toolbelt {

const char* mcp_error_kind_name(McpErrorKind kind) {
    switch (kind) {
        case McpErrorKind::Spawn:       return "spawn";
        case McpErrorKind::Closed:      return "closed";
        case McpErrorKind::Write:       return "write";
        case McpErrorKind::Timeout:     return "timeout";
        case McpErrorKind::EndOfStream: return "end_of_stream";
        case McpErrorKind::Decode:      return "decode";
        case McpErrorKind::Remote:      return "remote";
        case McpErrorKind::Protocol:    return "protocol";
    }
    return "unknown";
}

McpTransport::McpTransport(std::string label, std::chrono::milliseconds call_timeout)
    : label_(std::move(label)), call_timeout_(call_timeout) {}

McpTransport::~McpTransport() {
    close();
}

nlohmann::json McpTransport::make_request(const std::string& method,
                                          const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params},
        {"id", 1}
    };
}

void McpTransport::start(const std::string& command, const std::string& working_dir,
                         const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (open_) {
        throw McpError(McpErrorKind::Spawn, "MCP transport already started");
    }

    CommandSpec spec;
    spec.executable = command;
    spec.args = args;
    spec.working_dir = working_dir;

    SpawnedProcess proc;
    try {
        proc = spawn_process(spec);
    } catch (const ProcessError& e) {
        std::cerr << "[mcp] " << label_ << ": failed to start server: " << e.what() << "\n";
        throw McpError(McpErrorKind::Spawn,
                       std::string("Failed to start MCP server: ") + e.what());
    }

    if (pipe2(wake_fds_, O_CLOEXEC) != 0 || !set_nonblocking(proc.stdin_fd)) {
        close_fd(wake_fds_[0]);
        close_fd(wake_fds_[1]);
        ::kill(-proc.pid, SIGKILL);
        int status = 0;
        while (waitpid(proc.pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(proc.stdin_fd);
        close_fd(proc.stdout_fd);
        close_fd(proc.stderr_fd);
        throw McpError(McpErrorKind::Spawn, "Failed to set up MCP server pipes");
    }

    pid_ = proc.pid;
    stdin_fd_ = proc.stdin_fd;
    stdout_fd_ = proc.stdout_fd;
    stderr_fd_ = proc.stderr_fd;
    open_ = true;
    {
        std::lock_guard<std::mutex> stderr_lock(stderr_mutex_);
        stderr_lines_.clear();
    }
    stderr_thread_ = std::thread(&McpTransport::drain_stderr, this, stderr_fd_, wake_fds_[0]);

    std::cerr << "[mcp] " << label_ << ": server started (pid " << pid_ << "): "
              << spec.display() << "\n";
}

nlohmann::json McpTransport::invoke(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> call_lock(call_mutex_);

    int in_fd;
    int out_fd;
    int wake_fd;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_) {
            throw McpError(McpErrorKind::Closed, "MCP transport is not running");
        }
        in_fd = stdin_fd_;
        out_fd = stdout_fd_;
        wake_fd = wake_fds_[0];
    }

    auto deadline = std::chrono::steady_clock::now() + call_timeout_;
    std::string line = make_request(method, params).dump() + "\n";
    int write_timeout_ms =
        static_cast<int>(std::min<int64_t>(call_timeout_.count(), std::numeric_limits<int>::max()));
    if (!write_all(in_fd, line, wake_fd, write_timeout_ms)) {
        if (errno == ECANCELED) {
            throw McpError(McpErrorKind::Closed, "MCP transport closed during call");
        }
        throw McpError(McpErrorKind::Write, "Error writing request to MCP server stdin");
    }

    while (true) {
        std::string response_line;
        try {
            response_line = read_response_line(out_fd, wake_fd, deadline);
        } catch (const McpError& e) {
            if (e.kind() == McpErrorKind::Decode && discard_late_response()) {
                continue;
            }
            if (e.kind() == McpErrorKind::Timeout) {
                // Its answer may still arrive; the next call must not take it
                ++abandoned_;
            }
            throw;
        }
        if (response_line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        nlohmann::json response;
        try {
            response = nlohmann::json::parse(response_line);
        } catch (const nlohmann::json::parse_error& e) {
            if (discard_late_response()) continue;
            throw McpError(McpErrorKind::Decode,
                           std::string("Error decoding MCP response: ") + e.what());
        }

        if (!response.is_object()) {
            if (discard_late_response()) continue;
            throw McpError(McpErrorKind::Protocol, "MCP response is not a JSON object");
        }

        // Server-initiated notification, not our answer
        if (response.contains("method") && !response.contains("id")) {
            std::cerr << "[mcp] " << label_ << ": notification "
                      << response["method"].dump() << "\n";
            continue;
        }

        if (discard_late_response()) continue;

        if (response.contains("error")) {
            const auto& err = response["error"];
            std::string message;
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            } else {
                message = err.dump();
            }
            std::string code;
            if (err.is_object() && err.contains("code") && err["code"].is_number_integer()) {
                code = " (code " + std::to_string(err["code"].get<int64_t>()) + ")";
            }
            throw McpError(McpErrorKind::Remote, "MCP server error" + code + ": " + message, err);
        }

        if (!response.contains("result")) {
            throw McpError(McpErrorKind::Protocol, "No 'result' in MCP response");
        }
        return response["result"];
    }
}

bool McpTransport::discard_late_response() {
    if (abandoned_ == 0) return false;
    --abandoned_;
    std::cerr << "[mcp] " << label_ << ": discarding late response to a timed out call\n";
    return true;
}

std::string McpTransport::read_response_line(int out_fd, int wake_fd,
                                             std::chrono::steady_clock::time_point deadline) {
    std::array<char, 4096> buffer;

    while (true) {
        if (skip_partial_line_) {
            auto nl = read_buffer_.find('\n');
            if (nl == std::string::npos) {
                read_buffer_.clear();
            } else {
                read_buffer_.erase(0, nl + 1);
                skip_partial_line_ = false;
            }
            scan_pos_ = 0;
        }
        if (!skip_partial_line_) {
            auto nl = read_buffer_.find('\n', scan_pos_);
            if (nl != std::string::npos) {
                std::string line = read_buffer_.substr(0, nl);
                read_buffer_.erase(0, nl + 1);
                scan_pos_ = 0;
                return line;
            }
            scan_pos_ = read_buffer_.size();
            if (read_buffer_.size() > kMaxLineBytes) {
                // Drop what we have and the rest of the line when it arrives
                read_buffer_.clear();
                scan_pos_ = 0;
                skip_partial_line_ = true;
                throw McpError(McpErrorKind::Decode,
                               "MCP response line exceeds " + std::to_string(kMaxLineBytes) +
                               " bytes");
            }
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw McpError(McpErrorKind::Timeout,
                           "Timeout reading MCP response after " +
                           std::to_string(call_timeout_.count()) + "ms");
        }

        struct pollfd pfds[2];
        pfds[0].fd = out_fd;
        pfds[0].events = POLLIN;
        pfds[0].revents = 0;
        pfds[1].fd = wake_fd;
        pfds[1].events = POLLIN;
        pfds[1].revents = 0;

        int ret = poll(pfds, 2, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpError(McpErrorKind::EndOfStream, "Error polling MCP server stdout");
        }
        if (ret == 0) {
            continue; // deadline check above throws
        }
        if (pfds[1].revents != 0) {
            throw McpError(McpErrorKind::Closed, "MCP transport closed during call");
        }

        ssize_t n = ::read(out_fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw McpError(McpErrorKind::EndOfStream, "Error reading from MCP server stdout");
        }
        if (n == 0) {
            if (!read_buffer_.empty() && !skip_partial_line_) {
                std::string line;
                line.swap(read_buffer_);
                scan_pos_ = 0;
                return line;
            }
            std::string message = "MCP server closed its output (end of stream)";
            std::string last = last_stderr_line();
            if (!last.empty()) {
                message += "; last stderr: " + last;
            }
            throw McpError(McpErrorKind::EndOfStream, message);
        }
        read_buffer_.append(buffer.data(), static_cast<size_t>(n));
    }
}

void McpTransport::drain_stderr(int fd, int wake_fd) {
    std::array<char, 4096> buffer;
    std::string pending;

    auto emit = [this](const std::string& line) {
        std::cerr << "[mcp] " << label_ << " stderr: " << line << "\n";
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_lines_.push_back(line);
        while (stderr_lines_.size() > kStderrHistory) {
            stderr_lines_.pop_front();
        }
    };

    while (true) {
        struct pollfd pfds[2];
        pfds[0].fd = fd;
        pfds[0].events = POLLIN;
        pfds[0].revents = 0;
        pfds[1].fd = wake_fd;
        pfds[1].events = POLLIN;
        pfds[1].revents = 0;

        int ret = poll(pfds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pfds[1].revents != 0) {
            break;
        }

        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) break;

        pending.append(buffer.data(), static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            pending.erase(0, pos + 1);
            emit(line);
        }
    }

    if (!pending.empty()) {
        emit(pending);
    }
}

void McpTransport::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (pid_ < 0) {
            return;
        }
        open_ = false;
        if (wake_fds_[1] >= 0) {
            char c = 1;
            ssize_t ignored = ::write(wake_fds_[1], &c, 1);
            (void)ignored;
        }
        // Not reaped yet, so the pid still belongs to our child
        if (::kill(-pid_, SIGKILL) != 0) {
            ::kill(pid_, SIGKILL);
        }
    }

    // Wait for an in-flight invoke() to notice the wake pipe
    std::lock_guard<std::mutex> call_lock(call_mutex_);

    std::thread drain;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        drain = std::move(stderr_thread_);
    }
    if (drain.joinable()) {
        drain.join();
    }

    pid_t old_pid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        old_pid = pid_;
        pid_ = -1;
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        close_fd(wake_fds_[0]);
        close_fd(wake_fds_[1]);
    }
    read_buffer_.clear();
    scan_pos_ = 0;
    skip_partial_line_ = false;
    abandoned_ = 0;

    std::cerr << "[mcp] " << label_ << ": server " << old_pid << " closed\n";
}

bool McpTransport::is_open() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return open_;
}

pid_t McpTransport::pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_;
}

std::vector<std::string> McpTransport::recent_stderr() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return std::vector<std::string>(stderr_lines_.begin(), stderr_lines_.end());
}

std::string McpTransport::last_stderr_line() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_lines_.empty() ? std::string() : stderr_lines_.back();
}

} // namespace toolbelt
