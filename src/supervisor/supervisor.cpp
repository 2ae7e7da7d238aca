#include "supervisor/supervisor.hpp"
#include "supervisor/log_sink.hpp"

#include <cerrno>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

static constexpr auto kSleepSlice = std::chrono::milliseconds(100);

Supervisor::Supervisor(SupervisorOptions options)
    : Supervisor(std::move(options), std::cout) {}

Supervisor::Supervisor(SupervisorOptions options, std::ostream& notices)
    : options_(std::move(options)), notices_(notices) {}

Supervisor::~Supervisor() {
    request_stop();
}

const char* Supervisor::state_name(State s) {
    switch (s) {
        case State::Idle:     return "idle";
        case State::Starting: return "starting";
        case State::Running:  return "running";
        case State::Backoff:  return "backoff";
        case State::Stopped:  return "stopped";
    }
    return "unknown";
}

std::string Supervisor::command_line() const {
    std::string line;
    for (const auto& arg : options_.command) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}

std::string Supervisor::backoff_text() const {
    auto ms = options_.backoff.count();
    std::ostringstream oss;
    if (ms % 1000 == 0) {
        oss << ms / 1000 << (ms == 1000 ? " second" : " seconds");
    } else {
        oss << std::fixed << std::setprecision(ms % 100 == 0 ? 1 : 3)
            << static_cast<double>(ms) / 1000.0 << " seconds";
    }
    return oss.str();
}

ExitOutcome Supervisor::run_once(unsigned run) {
    state_.store(State::Starting);
    notices_ << "Starting " << command_line() << " (run " << run << ")..." << std::endl;

    // A stop that lands while starting must not launch a child only to kill it
    if (stop_flag_.load()) {
        return ExitOutcome::spawn_failed(ECANCELED, "stop requested");
    }

    // Reopened every run so a log directory that appears later is picked up
    LogSink sink(options_.log_path, options_.run_markers);
    if (!sink.open()) {
        int e = errno;
        if (on_spawn) on_spawn(run, -1);
        return ExitOutcome::spawn_failed(e, "open log " + options_.log_path);
    }
    sink.mark_run_started(run);

    SpawnOptions opts;
    opts.output_fd = sink.fd();
    opts.working_dir = options_.working_dir;
    opts.own_process_group = options_.own_process_group;

    if (!child_.spawn(options_.command, opts)) {
        if (on_spawn) on_spawn(run, -1);
        sink.mark_run_ended(run, child_.outcome().describe());
        return child_.outcome();
    }

    child_pid_.store(child_.pid());
    state_.store(State::Running);
    if (on_spawn) on_spawn(run, child_.pid());

    if (!child_.wait([this] { return stop_flag_.load(); })) {
        notices_ << "Stopping " << command_line() << " (pid " << child_.pid() << ")..." << std::endl;
        child_.terminate(options_.stop_timeout);
    }
    child_pid_.store(-1);

    sink.mark_run_ended(run, child_.outcome().describe());
    return child_.outcome();
}

void Supervisor::backoff() {
    state_.store(State::Backoff);

    auto deadline = std::chrono::steady_clock::now() + options_.backoff;
    while (!stop_flag_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(remaining < kSleepSlice ? remaining : kSleepSlice);
    }
}

unsigned Supervisor::run() {
    unsigned runs = 0;

    while (!stop_flag_.load()) {
        ++runs;
        ExitOutcome outcome = run_once(runs);

        if (stop_flag_.load()) {
            notices_ << command_line() << " stopped with " << outcome.describe() << "." << std::endl;
            if (on_exit) on_exit(runs, outcome);
            break;
        }

        // Clean exits restart exactly like crashes
        notices_ << command_line() << " crashed with " << outcome.describe()
                 << ". Restarting in " << backoff_text() << "..." << std::endl;
        if (on_exit) on_exit(runs, outcome);

        backoff();
    }

    state_.store(State::Stopped);
    return runs;
}

void Supervisor::request_stop() {
    stop_flag_.store(true);
}

bool Supervisor::stop_requested() const {
    return stop_flag_.load();
}

Supervisor::State Supervisor::state() const {
    return state_.load();
}

pid_t Supervisor::child_pid() const {
    return child_pid_.load();
}
