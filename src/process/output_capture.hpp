#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace toolbelt {

// In-memory sink pair for a child's stdout and stderr. Takes ownership of
// both read ends and drains them on a dedicated thread until EOF or stop(),
// so the child never blocks on a full pipe.
class OutputCapture {
public:
    OutputCapture(int stdout_fd, int stderr_fd);
    ~OutputCapture();

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    std::string stdout_text() const;
    std::string stderr_text() const;

    // Return everything captured since the last take() and clear it
    void take(std::string& out, std::string& err);

    // Block until both streams reached EOF or the timeout passed.
    // Returns true on EOF.
    bool wait_closed(std::chrono::milliseconds timeout);

    // Stop draining. Data not yet read stays in the pipes. Idempotent.
    void stop();

private:
    void drain_loop();

    int stdout_fd_;
    int stderr_fd_;
    int wake_fds_[2] = {-1, -1};

    mutable std::mutex mutex_;
    std::condition_variable closed_cv_;
    bool closed_ = false;
    std::string stdout_;
    std::string stderr_;
    std::thread thread_;
};

} // namespace toolbelt
