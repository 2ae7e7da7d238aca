#pragma once

#include "supervisor/child_process.hpp"
#include "supervisor/exit_outcome.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

struct SupervisorOptions {
    std::vector<std::string> command;
    std::string log_path = "respawn.log";
    bool run_markers = true;
    std::string working_dir;
    std::chrono::milliseconds backoff{5000};
    bool own_process_group = true;
    std::chrono::milliseconds stop_timeout{5000};
};

/// Keeps one command running: spawn, wait, report, back off, repeat.
/// Every termination (clean exit included) leads to a restart until
/// request_stop() is called.
class Supervisor {
public:
    enum class State { Idle, Starting, Running, Backoff, Stopped };

    /// Notices are written to `notices` (std::cout when omitted)
    explicit Supervisor(SupervisorOptions options);
    Supervisor(SupervisorOptions options, std::ostream& notices);
    ~Supervisor();

    /// Main loop — blocks until stop is requested.
    /// Returns the number of runs that were started (spawn failures included).
    unsigned run();

    /// Request graceful stop (safe from a signal handler or another thread)
    void request_stop();
    bool stop_requested() const;

    State state() const;

    /// PID of the running child (-1 outside the Running state)
    pid_t child_pid() const;

    /// Invoked after each spawn attempt with the run number and pid
    /// (-1 when the spawn failed)
    std::function<void(unsigned run, pid_t pid)> on_spawn;

    /// Invoked when a run ends, before the backoff starts
    std::function<void(unsigned run, const ExitOutcome& outcome)> on_exit;

    static const char* state_name(State s);

private:
    SupervisorOptions options_;
    std::ostream& notices_;
    ChildProcess child_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<State> state_{State::Idle};
    std::atomic<pid_t> child_pid_{-1};

    std::string command_line() const;
    std::string backoff_text() const;
    ExitOutcome run_once(unsigned run);
    void backoff();
};
