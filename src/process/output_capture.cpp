#include "output_capture.hpp"
#include "spawn.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace toolbelt {

OutputCapture::OutputCapture(int stdout_fd, int stderr_fd)
    : stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {
    if (pipe2(wake_fds_, O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        throw ProcessError("Failed to create capture wake pipe", err);
    }
    thread_ = std::thread(&OutputCapture::drain_loop, this);
}

OutputCapture::~OutputCapture() {
    stop();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(wake_fds_[0]);
    close_fd(wake_fds_[1]);
}

std::string OutputCapture::stdout_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stdout_;
}

std::string OutputCapture::stderr_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stderr_;
}

void OutputCapture::take(std::string& out, std::string& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.swap(stdout_);
    err.swap(stderr_);
    stdout_.clear();
    stderr_.clear();
}

bool OutputCapture::wait_closed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return closed_cv_.wait_for(lock, timeout, [this] { return closed_; });
}

void OutputCapture::stop() {
    if (wake_fds_[1] >= 0) {
        char c = 1;
        ssize_t ignored = write(wake_fds_[1], &c, 1);
        (void)ignored;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void OutputCapture::drain_loop() {
    std::array<char, 4096> buffer;
    bool out_open = stdout_fd_ >= 0;
    bool err_open = stderr_fd_ >= 0;

    while (out_open || err_open) {
        struct pollfd pfds[3];
        pfds[0].fd = out_open ? stdout_fd_ : -1;
        pfds[0].events = POLLIN;
        pfds[1].fd = err_open ? stderr_fd_ : -1;
        pfds[1].events = POLLIN;
        pfds[2].fd = wake_fds_[0];
        pfds[2].events = POLLIN;
        for (auto& p : pfds) p.revents = 0;

        int ret = poll(pfds, 3, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pfds[2].revents != 0) {
            break; // stop() requested
        }

        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = read(pfds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
            if (n <= 0) {
                (i == 0 ? out_open : err_open) = false;
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            (i == 0 ? stdout_ : stderr_).append(buffer.data(), static_cast<size_t>(n));
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    closed_cv_.notify_all();
}

} // namespace toolbelt
