#include <catch2/catch.hpp>
#include "process/process_registry.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <future>
#include <string>
#include <thread>
#include <unistd.h>

using namespace toolbelt;

static CommandSpec sh(const std::string& script) {
    CommandSpec spec;
    spec.executable = "sh";
    spec.args = {"-c", script};
    return spec;
}

// Poll status until the process is no longer running
static RunResult wait_for_exit(ProcessRegistry& registry, pid_t pid) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    RunResult r = registry.status(pid);
    while (r.status == RunStatus::Running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        r = registry.status(pid);
    }
    return r;
}

// ═══ spawn / status ══════════════════════════════════════════════

TEST_CASE("ProcessRegistry: spawn returns running with a pid", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("sleep 30"));
    REQUIRE(r.status == RunStatus::Running);
    REQUIRE(r.pid > 0);
    REQUIRE(r.stdout_text == "Command started in background");
    REQUIRE(registry.contains(r.pid));
    REQUIRE(registry.size() == 1);

    auto s = registry.status(r.pid);
    REQUIRE(s.status == RunStatus::Running);
    REQUIRE(s.pid == r.pid);
}

TEST_CASE("ProcessRegistry: running, then exited, then not found", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("echo out; echo err >&2; sleep 1; exit 4"));
    REQUIRE(r.status == RunStatus::Running);
    REQUIRE(registry.status(r.pid).status == RunStatus::Running);

    auto s = wait_for_exit(registry, r.pid);
    REQUIRE(s.status == RunStatus::Exited);
    REQUIRE(s.exit_code == 4);
    REQUIRE(s.stdout_text == "out\n");
    REQUIRE(s.stderr_text == "err\n");
    REQUIRE_FALSE(registry.contains(r.pid));

    REQUIRE(registry.status(r.pid).status == RunStatus::NotFound);
}

TEST_CASE("ProcessRegistry: status of a running process shows output so far", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("echo ready; sleep 30"));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    RunResult s = registry.status(r.pid);
    while (s.stdout_text.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        s = registry.status(r.pid);
    }
    REQUIRE(s.status == RunStatus::Running);
    REQUIRE(s.stdout_text == "ready\n");
}

TEST_CASE("ProcessRegistry: status of an untracked pid is not found", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.status(999999);
    REQUIRE(r.status == RunStatus::NotFound);
    REQUIRE(r.ok());
}

TEST_CASE("ProcessRegistry: spawn failure is failed and untracked", "[registry]") {
    ProcessRegistry registry;
    CommandSpec spec;
    spec.executable = "no_such_binary_toolbelt";
    auto r = registry.spawn(spec);
    REQUIRE(r.status == RunStatus::Failed);
    REQUIRE(r.pid == 0);
    REQUIRE(registry.size() == 0);
}

// ═══ kill ════════════════════════════════════════════════════════

TEST_CASE("ProcessRegistry: kill of an untracked pid is not found", "[registry]") {
    ProcessRegistry registry;
    REQUIRE(registry.kill(999999).status == RunStatus::NotFound);
}

TEST_CASE("ProcessRegistry: kill terminates and untracks", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("sleep 30"));
    pid_t pid = r.pid;

    auto k = registry.kill(pid);
    REQUIRE(k.status == RunStatus::Terminated);
    REQUIRE(k.pid == pid);
    REQUIRE_FALSE(registry.contains(pid));
    REQUIRE(::kill(pid, 0) == -1);
    REQUIRE(errno == ESRCH);

    REQUIRE(registry.kill(pid).status == RunStatus::NotFound);
    REQUIRE(registry.status(pid).status == RunStatus::NotFound);
}

TEST_CASE("ProcessRegistry: kill of an already exited process is safe", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("exit 0"));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    auto k = registry.kill(r.pid);
    REQUIRE(k.status == RunStatus::Terminated);
    REQUIRE_FALSE(registry.contains(r.pid));
}

TEST_CASE("ProcessRegistry: kill escalates when SIGTERM is ignored", "[registry]") {
    ProcessRegistry registry(std::chrono::milliseconds(200));
    auto r = registry.spawn(sh("trap '' TERM; while :; do sleep 1; done"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto k = registry.kill(r.pid);
    REQUIRE(k.status == RunStatus::Terminated);
    REQUIRE(::kill(r.pid, 0) == -1);
}

TEST_CASE("ProcessRegistry: kill_all empties the registry", "[registry]") {
    ProcessRegistry registry(std::chrono::milliseconds(200));
    auto a = registry.spawn(sh("sleep 30"));
    auto b = registry.spawn(sh("sleep 30"));
    REQUIRE(registry.size() == 2);

    registry.kill_all();
    REQUIRE(registry.size() == 0);
    REQUIRE(::kill(a.pid, 0) == -1);
    REQUIRE(::kill(b.pid, 0) == -1);
}

// ═══ write / read ════════════════════════════════════════════════

TEST_CASE("ProcessRegistry: write and read talk to a background process", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("while read line; do echo got:$line; done"));

    auto w = registry.write(r.pid, "one");
    REQUIRE(w.status == RunStatus::Written);

    std::string collected;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (collected.find("got:one\n") == std::string::npos &&
           std::chrono::steady_clock::now() < deadline) {
        auto rd = registry.read(r.pid);
        REQUIRE(rd.status == RunStatus::Read);
        collected += rd.stdout_text;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    REQUIRE(collected == "got:one\n");

    // Already consumed
    REQUIRE(registry.read(r.pid).stdout_text.empty());
    REQUIRE(registry.kill(r.pid).status == RunStatus::Terminated);
}

TEST_CASE("ProcessRegistry: initial input is sent on spawn", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("read line; echo first:$line"), "hello");
    auto s = wait_for_exit(registry, r.pid);
    REQUIRE(s.status == RunStatus::Exited);
    REQUIRE(s.stdout_text == "first:hello\n");
}

TEST_CASE("ProcessRegistry: spawn with input larger than the pipe to a non-reader returns at once", "[registry]") {
    ProcessRegistry registry(std::chrono::milliseconds(200));
    auto start = std::chrono::steady_clock::now();
    auto r = registry.spawn(sh("sleep 30"), std::string(200000, 'x'));
    REQUIRE(r.status == RunStatus::Running);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    REQUIRE(registry.status(r.pid).status == RunStatus::Running);

    start = std::chrono::steady_clock::now();
    REQUIRE(registry.kill(r.pid).status == RunStatus::Terminated);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("ProcessRegistry: write to a non-reader times out and keeps the process", "[registry]") {
    ProcessRegistry registry(std::chrono::milliseconds(200), std::chrono::milliseconds(300));
    auto r = registry.spawn(sh("sleep 30"));

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(registry.write(r.pid, std::string(200000, 'x')), ProcessError);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(registry.contains(r.pid));
    REQUIRE(registry.status(r.pid).status == RunStatus::Running);
}

TEST_CASE("ProcessRegistry: kill while a write is stuck terminates", "[registry]") {
    ProcessRegistry registry(std::chrono::milliseconds(200), std::chrono::seconds(60));
    auto r = registry.spawn(sh("sleep 30"));

    // No Catch assertions off the main thread
    auto writer = std::async(std::launch::async, [&registry, &r]() {
        try {
            registry.write(r.pid, std::string(200000, 'x'));
        } catch (const ProcessError&) {
            return true;
        }
        return false;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto start = std::chrono::steady_clock::now();
    auto k = registry.kill(r.pid);
    REQUIRE(k.status == RunStatus::Terminated);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(writer.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(writer.get());
    REQUIRE_FALSE(registry.contains(r.pid));
}

TEST_CASE("ProcessRegistry: write and read on untracked pid are not found", "[registry]") {
    ProcessRegistry registry;
    REQUIRE(registry.write(999999, "x").status == RunStatus::NotFound);
    REQUIRE(registry.read(999999).status == RunStatus::NotFound);
}

TEST_CASE("ProcessRegistry: write to a process that closed stdin throws", "[registry]") {
    ProcessRegistry registry;
    auto r = registry.spawn(sh("exec 0<&-; sleep 30"));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    REQUIRE_THROWS_AS(registry.write(r.pid, "ignored"), ProcessError);
    REQUIRE(registry.contains(r.pid));
}

TEST_CASE("ProcessRegistry: destructor terminates tracked processes", "[registry]") {
    pid_t pid;
    {
        ProcessRegistry registry(std::chrono::milliseconds(200));
        pid = registry.spawn(sh("sleep 30")).pid;
        REQUIRE(::kill(pid, 0) == 0);
    }
    REQUIRE(::kill(pid, 0) == -1);
    REQUIRE(errno == ESRCH);
}
