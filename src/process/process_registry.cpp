#include "process_registry.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

namespace toolbelt {

namespace {

constexpr std::chrono::milliseconds kOutputDrainGrace{500};

RunResult not_found() {
    RunResult r;
    r.status = RunStatus::NotFound;
    return r;
}

} // namespace

ProcessRegistry::ProcessRegistry(std::chrono::milliseconds kill_grace,
                                 std::chrono::milliseconds write_timeout)
    : kill_grace_(kill_grace), write_timeout_(write_timeout) {}

ProcessRegistry::~ProcessRegistry() {
    kill_all();
}

RunResult ProcessRegistry::spawn(const CommandSpec& spec, const std::string& input) {
    RunResult result;

    std::shared_ptr<ProcessHandle> proc;
    try {
        proc = ProcessHandle::spawn(spec);
    } catch (const ProcessError& e) {
        std::cerr << "[process] Failed to start background command " << spec.display()
                  << ": " << e.what() << "\n";
        result.status = RunStatus::Failed;
        result.stderr_text = e.what();
        return result;
    }

    if (!input.empty()) {
        proc->feed_input(input + "\n");
    }

    pid_t pid = proc->pid();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        processes_[pid] = std::move(proc);
    }
    std::cerr << "[process] Background command started (pid " << pid << "): "
              << spec.display() << "\n";

    result.pid = pid;
    result.status = RunStatus::Running;
    result.stdout_text = "Command started in background";
    return result;
}

std::shared_ptr<ProcessHandle> ProcessRegistry::find(pid_t pid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = processes_.find(pid);
    if (it == processes_.end()) return nullptr;
    return it->second;
}

RunResult ProcessRegistry::status(pid_t pid) {
    std::shared_ptr<ProcessHandle> proc = find(pid);
    if (!proc) {
        return not_found();
    }
    if (!proc->poll_exit()) {
        RunResult r;
        r.pid = pid;
        r.status = RunStatus::Running;
        r.stdout_text = proc->output().stdout_text();
        r.stderr_text = proc->output().stderr_text();
        return r;
    }

    // Exited: take the entry out so the pid can be reused safely
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = processes_.find(pid);
        if (it == processes_.end() || it->second != proc) {
            return not_found();
        }
        processes_.erase(it);
    }

    proc->output().wait_closed(kOutputDrainGrace);
    proc->output().stop();

    RunResult r;
    r.pid = pid;
    r.status = RunStatus::Exited;
    r.exit_code = proc->exit_code();
    r.stdout_text = proc->output().stdout_text();
    r.stderr_text = proc->output().stderr_text();
    std::cerr << "[process] Background process " << pid << " has exited\n";
    return r;
}

RunResult ProcessRegistry::kill(pid_t pid) {
    std::shared_ptr<ProcessHandle> proc;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = processes_.find(pid);
        if (it == processes_.end()) {
            return not_found();
        }
        proc = std::move(it->second);
        processes_.erase(it);
    }

    try {
        proc->terminate(kill_grace_);
    } catch (const ProcessError& e) {
        std::cerr << "[process] Failed to terminate " << pid << ": " << e.what() << "\n";
        std::unique_lock<std::shared_mutex> lock(mutex_);
        processes_.emplace(pid, std::move(proc));
        throw;
    }

    proc->output().wait_closed(kOutputDrainGrace);
    proc->output().stop();

    RunResult r;
    r.pid = pid;
    r.status = RunStatus::Terminated;
    r.stdout_text = proc->output().stdout_text();
    r.stderr_text = proc->output().stderr_text();
    std::cerr << "[process] Background process " << pid << " terminated\n";
    return r;
}

RunResult ProcessRegistry::write(pid_t pid, const std::string& input) {
    std::shared_ptr<ProcessHandle> proc = find(pid);
    if (!proc) {
        return not_found();
    }
    if (!proc->write_input(input + "\n", write_timeout_)) {
        int err = errno;
        throw ProcessError("Failed to write to stdin of process " + std::to_string(pid) + ": " +
                           std::strerror(err), err);
    }
    RunResult r;
    r.pid = pid;
    r.status = RunStatus::Written;
    return r;
}

RunResult ProcessRegistry::read(pid_t pid) {
    std::shared_ptr<ProcessHandle> proc = find(pid);
    if (!proc) {
        return not_found();
    }
    RunResult r;
    r.pid = pid;
    r.status = RunStatus::Read;
    proc->output().take(r.stdout_text, r.stderr_text);
    return r;
}

bool ProcessRegistry::contains(pid_t pid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return processes_.count(pid) > 0;
}

size_t ProcessRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return processes_.size();
}

void ProcessRegistry::kill_all() {
    std::vector<std::shared_ptr<ProcessHandle>> victims;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        victims.reserve(processes_.size());
        for (auto& entry : processes_) {
            victims.push_back(std::move(entry.second));
        }
        processes_.clear();
    }

    for (auto& proc : victims) {
        try {
            proc->terminate(kill_grace_);
        } catch (const ProcessError& e) {
            // The handle's destructor still SIGKILLs and reaps
            std::cerr << "[process] Failed to terminate " << proc->pid() << ": " << e.what() << "\n";
        }
    }
}

} // namespace toolbelt
