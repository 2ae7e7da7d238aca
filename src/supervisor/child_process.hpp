#pragma once

#include "supervisor/exit_outcome.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

struct SpawnOptions {
    int output_fd = -1;             // receives both stdout and stderr; -1 inherits
    std::string working_dir;        // empty = inherit
    bool own_process_group = true;  // setpgid(0, 0) in the child
};

/// One spawned child. Owns the pid until the exit status has been reaped.
class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Fork and exec argv[0] (PATH lookup applies).
    /// Returns false if the child never started; the reason is in outcome().
    bool spawn(const std::vector<std::string>& argv, const SpawnOptions& opts = {});

    /// Block until the child exits. Polls `should_stop` every 100ms and
    /// returns false early (child still running) once it yields true.
    bool wait(const std::function<bool()>& should_stop = nullptr);

    /// Non-blocking reap. Returns true once the child has exited.
    bool poll();

    /// SIGTERM, wait up to `timeout`, then SIGKILL. Always reaps.
    bool terminate(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    /// Check if the child process is currently running
    bool is_running() const;

    /// Get the PID of the child process (-1 if not running)
    pid_t pid() const;

    /// Outcome of the last run; meaningful once is_running() is false
    const ExitOutcome& outcome() const;

private:
    pid_t pid_ = -1;
    bool own_process_group_ = true;
    ExitOutcome outcome_;

    bool reap(int options);
    void send_signal(int sig);
};
