#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbelt {

enum class McpErrorKind {
    Spawn,        // child could not be started
    Closed,       // not started, or close() was called
    Write,        // request could not be written
    Timeout,      // no response before the per-call deadline
    EndOfStream,  // child closed stdout (usually: it exited)
    Decode,       // response line is not valid JSON
    Remote,       // response carried an "error" member
    Protocol,     // response had neither "result" nor "error"
};

const char* mcp_error_kind_name(McpErrorKind kind);

class McpError : public std::runtime_error {
public:
    McpError(McpErrorKind kind, const std::string& message,
             nlohmann::json remote_error = nullptr)
        : std::runtime_error(message), kind_(kind), remote_error_(std::move(remote_error)) {}

    McpErrorKind kind() const { return kind_; }

    // The response's "error" member for Remote errors, null otherwise
    const nlohmann::json& remote_error() const { return remote_error_; }

private:
    McpErrorKind kind_;
    nlohmann::json remote_error_;
};

// Persistent child process speaking line-delimited JSON-RPC 2.0 on its
// stdin/stdout. stderr is drained on a dedicated thread for the life of the
// session and only ever logged.
//
// Requests always carry id 1 and the next line read is taken as the answer
// to the last line written, so invoke() serialises callers internally.
// A call that times out still owes one response line; the next call reads
// and drops it before taking its own answer.
class McpTransport {
public:
    static constexpr std::chrono::milliseconds kDefaultCallTimeout{5000};
    static constexpr size_t kStderrHistory = 50;
    static constexpr size_t kMaxLineBytes = 4 * 1024 * 1024;

    explicit McpTransport(std::string label = "mcp",
                          std::chrono::milliseconds call_timeout = kDefaultCallTimeout);
    ~McpTransport();

    McpTransport(const McpTransport&) = delete;
    McpTransport& operator=(const McpTransport&) = delete;

    // Throws McpError(Spawn) if the child cannot be started or the
    // transport is already running
    void start(const std::string& command, const std::string& working_dir,
               const std::vector<std::string>& args);

    // Send one request and wait for its response. Returns the "result"
    // member; throws McpError otherwise.
    nlohmann::json invoke(const std::string& method, const nlohmann::json& params);

    // Cancel any in-flight call, kill the child, release every stream.
    // Safe to call repeatedly.
    void close();

    // Started and not closed. Does not notice a child that died on its own;
    // that surfaces as EndOfStream on the next invoke().
    bool is_open() const;

    pid_t pid() const;

    // Most recent stderr lines from the child, oldest first
    std::vector<std::string> recent_stderr() const;

    static nlohmann::json make_request(const std::string& method, const nlohmann::json& params);

private:
    void drain_stderr(int fd, int wake_fd);
    std::string read_response_line(int out_fd, int wake_fd,
                                   std::chrono::steady_clock::time_point deadline);
    std::string last_stderr_line() const;
    bool discard_late_response();

    std::string label_;
    std::chrono::milliseconds call_timeout_;

    // Held for the whole of start() and close()
    std::mutex close_mutex_;

    // Serialises invoke() and guards the read state below
    std::mutex call_mutex_;
    std::string read_buffer_;
    size_t scan_pos_ = 0;              // read_buffer_ before this has no newline
    bool skip_partial_line_ = false;   // dropping the tail of an oversized line
    size_t abandoned_ = 0;             // timed out calls whose answer is still due

    // Guards process state and fds
    mutable std::mutex state_mutex_;
    bool open_ = false;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_fds_[2] = {-1, -1};
    std::thread stderr_thread_;

    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_lines_;
};

} // namespace toolbelt
