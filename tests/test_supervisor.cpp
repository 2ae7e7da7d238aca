#include <gtest/gtest.h>
#include "supervisor/supervisor.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono;

class SupervisorTest : public ::testing::Test {
protected:
    std::string temp_dir_;
    std::ostringstream notices_;

    void SetUp() override {
        temp_dir_ = "/tmp/respawn_sup_" + std::to_string(::getpid());
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    SupervisorOptions options(std::vector<std::string> command,
                              milliseconds backoff = milliseconds(50)) {
        SupervisorOptions opts;
        opts.command = std::move(command);
        opts.log_path = temp_dir_ + "/child.log";
        opts.backoff = backoff;
        opts.stop_timeout = milliseconds(1000);
        return opts;
    }

    std::string read_log() {
        std::ifstream in(temp_dir_ + "/child.log");
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static bool wait_for_state(const Supervisor& sv, Supervisor::State s, int timeout_ms = 5000) {
        for (int waited = 0; waited < timeout_ms; waited += 10) {
            if (sv.state() == s) return true;
            std::this_thread::sleep_for(milliseconds(10));
        }
        return false;
    }

    static size_t count(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }
};

TEST_F(SupervisorTest, CleanExitStillRestarts) {
    Supervisor sv(options({"true"}), notices_);
    std::vector<ExitOutcome> outcomes;
    sv.on_exit = [&](unsigned run, const ExitOutcome& o) {
        outcomes.push_back(o);
        if (run == 3) sv.request_stop();
    };

    EXPECT_EQ(sv.run(), 3u);
    ASSERT_EQ(outcomes.size(), 3u);
    for (const auto& o : outcomes) {
        EXPECT_EQ(o, ExitOutcome::exited(0));
    }
    EXPECT_EQ(sv.state(), Supervisor::State::Stopped);
}

TEST_F(SupervisorTest, EveryExitCodeRestarts) {
    for (int code : {0, 1, 2, 42, 255}) {
        Supervisor sv(options({"/bin/sh", "-c", "exit " + std::to_string(code)}), notices_);
        unsigned exits = 0;
        sv.on_exit = [&](unsigned run, const ExitOutcome& o) {
            EXPECT_EQ(o, ExitOutcome::exited(code));
            ++exits;
            if (run == 2) sv.request_stop();
        };
        EXPECT_EQ(sv.run(), 2u) << "exit code " << code;
        EXPECT_EQ(exits, 2u);
    }
}

TEST_F(SupervisorTest, SpawnFailureIsRetried) {
    Supervisor sv(options({"/nonexistent/binary"}), notices_);
    std::vector<pid_t> pids;
    sv.on_spawn = [&](unsigned, pid_t pid) { pids.push_back(pid); };
    sv.on_exit = [&](unsigned run, const ExitOutcome& o) {
        EXPECT_EQ(o.kind, ExitOutcome::Kind::SpawnFailed);
        if (run == 3) sv.request_stop();
    };

    EXPECT_EQ(sv.run(), 3u);
    EXPECT_EQ(pids, (std::vector<pid_t>{-1, -1, -1}));
    EXPECT_EQ(count(notices_.str(), "crashed with spawn failure"), 3u);
}

TEST_F(SupervisorTest, UnwritableLogIsRetried) {
    std::string blocker = temp_dir_ + "/not-a-dir";
    std::ofstream(blocker) << "x";

    auto opts = options({"true"});
    opts.log_path = blocker + "/child.log";
    Supervisor sv(opts, notices_);
    sv.on_exit = [&](unsigned run, const ExitOutcome& o) {
        EXPECT_EQ(o.kind, ExitOutcome::Kind::SpawnFailed);
        EXPECT_NE(o.describe().find("open log"), std::string::npos);
        if (run == 2) sv.request_stop();
    };
    EXPECT_EQ(sv.run(), 2u);
}

TEST_F(SupervisorTest, SpawnSpacingIsRunTimePlusBackoff) {
    Supervisor sv(options({"sleep", "0.2"}, milliseconds(300)), notices_);
    std::vector<steady_clock::time_point> spawns;
    sv.on_spawn = [&](unsigned run, pid_t) {
        spawns.push_back(steady_clock::now());
        if (run == 3) sv.request_stop();
    };

    sv.run();
    ASSERT_EQ(spawns.size(), 3u);
    for (size_t i = 1; i < spawns.size(); ++i) {
        auto gap = duration_cast<milliseconds>(spawns[i] - spawns[i - 1]);
        EXPECT_GE(gap, milliseconds(500)) << "gap " << i;
        EXPECT_LT(gap, milliseconds(1000)) << "gap " << i;
    }
}

TEST_F(SupervisorTest, BackoffWaitsFullInterval) {
    Supervisor sv(options({"true"}, milliseconds(400)), notices_);
    std::vector<steady_clock::time_point> exits;
    std::vector<steady_clock::time_point> spawns;
    sv.on_exit = [&](unsigned, const ExitOutcome&) { exits.push_back(steady_clock::now()); };
    sv.on_spawn = [&](unsigned run, pid_t) {
        spawns.push_back(steady_clock::now());
        if (run == 2) sv.request_stop();
    };

    sv.run();
    ASSERT_EQ(spawns.size(), 2u);
    ASSERT_GE(exits.size(), 1u);
    EXPECT_GE(spawns[1] - exits[0], milliseconds(400));
}

TEST_F(SupervisorTest, LogIsAppendOnlyAcrossRuns) {
    {
        std::ofstream out(temp_dir_ + "/child.log");
        out << "before supervisor\n";
    }

    auto opts = options({"/bin/sh", "-c",
        "n=$(cat counter 2>/dev/null || echo 0); n=$((n+1)); echo $n > counter; "
        "echo line-$n; echo err-$n 1>&2"});
    opts.working_dir = temp_dir_;
    Supervisor sv(opts, notices_);
    sv.on_exit = [&](unsigned run, const ExitOutcome&) {
        if (run == 3) sv.request_stop();
    };
    sv.run();

    std::string log = read_log();
    EXPECT_EQ(log.rfind("before supervisor\n", 0), 0u);

    size_t last = 0;
    for (int run = 1; run <= 3; ++run) {
        std::string r = std::to_string(run);
        auto started = log.find("--- respawn: run " + r + " started ");
        auto line = log.find("line-" + r + "\n");
        auto err = log.find("err-" + r + "\n");
        auto ended = log.find("--- respawn: run " + r + " ended: exit code 0 ---");
        ASSERT_NE(started, std::string::npos) << log;
        ASSERT_NE(line, std::string::npos) << log;
        ASSERT_NE(err, std::string::npos) << log;
        ASSERT_NE(ended, std::string::npos) << log;
        EXPECT_LT(last, started);
        EXPECT_LT(started, line);
        EXPECT_LT(line, err);
        EXPECT_LT(err, ended);
        last = ended;
    }
}

TEST_F(SupervisorTest, NoMarkersLeavesOnlyChildOutput) {
    auto opts = options({"echo", "hello"});
    opts.run_markers = false;
    Supervisor sv(opts, notices_);
    sv.on_exit = [&](unsigned run, const ExitOutcome&) {
        if (run == 2) sv.request_stop();
    };
    sv.run();
    EXPECT_EQ(read_log(), "hello\nhello\n");
}

TEST_F(SupervisorTest, ChildrenNeverOverlap) {
    auto opts = options({"/bin/sh", "-c",
        "if [ -e lock ]; then echo OVERLAP; fi; touch lock; sleep 0.1; rm lock"},
        milliseconds(0));
    opts.working_dir = temp_dir_;
    opts.run_markers = false;
    Supervisor sv(opts, notices_);

    pid_t previous = -1;
    sv.on_spawn = [&](unsigned run, pid_t pid) {
        // The previous child must already be reaped
        if (previous > 0) {
            EXPECT_EQ(kill(previous, 0), -1) << "run " << run;
        }
        previous = pid;
    };
    sv.on_exit = [&](unsigned run, const ExitOutcome&) {
        if (run == 5) sv.request_stop();
    };

    EXPECT_EQ(sv.run(), 5u);
    EXPECT_EQ(read_log().find("OVERLAP"), std::string::npos);
}

TEST_F(SupervisorTest, StopDuringBackoff) {
    Supervisor sv(options({"true"}, seconds(30)), notices_);
    unsigned runs = 0;
    std::thread loop([&] { runs = sv.run(); });

    ASSERT_TRUE(wait_for_state(sv, Supervisor::State::Backoff));
    auto start = steady_clock::now();
    sv.request_stop();
    loop.join();

    EXPECT_LT(steady_clock::now() - start, seconds(1));
    EXPECT_EQ(runs, 1u);
    EXPECT_EQ(sv.state(), Supervisor::State::Stopped);
}

TEST_F(SupervisorTest, StopDuringRunTerminatesChild) {
    Supervisor sv(options({"sleep", "60"}), notices_);
    ExitOutcome last;
    sv.on_exit = [&](unsigned, const ExitOutcome& o) { last = o; };
    std::thread loop([&] { sv.run(); });

    ASSERT_TRUE(wait_for_state(sv, Supervisor::State::Running));
    pid_t child = sv.child_pid();
    ASSERT_GT(child, 0);

    auto start = steady_clock::now();
    sv.request_stop();
    loop.join();

    EXPECT_LT(steady_clock::now() - start, seconds(2));
    EXPECT_EQ(last, ExitOutcome::signaled(SIGTERM));
    EXPECT_EQ(sv.child_pid(), -1);
    EXPECT_EQ(kill(child, 0), -1);
    EXPECT_NE(notices_.str().find("Stopping sleep 60"), std::string::npos);
}

TEST_F(SupervisorTest, StopBeforeRun) {
    Supervisor sv(options({"true"}), notices_);
    bool spawned = false;
    sv.on_spawn = [&](unsigned, pid_t) { spawned = true; };
    sv.request_stop();
    EXPECT_TRUE(sv.stop_requested());
    EXPECT_EQ(sv.run(), 0u);
    EXPECT_FALSE(spawned);
}

// Requests a stop whenever a notice is flushed
class StopOnFlush : public std::stringbuf {
public:
    explicit StopOnFlush(Supervisor*& target) : target_(target) {}

protected:
    int sync() override {
        if (target_) target_->request_stop();
        return std::stringbuf::sync();
    }

private:
    Supervisor*& target_;
};

TEST_F(SupervisorTest, StopWhileStartingSpawnsNothing) {
    Supervisor* target = nullptr;
    StopOnFlush buf(target);
    std::ostream notices(&buf);
    Supervisor sv(options({"true"}), notices);
    target = &sv;

    bool spawned = false;
    ExitOutcome last;
    sv.on_spawn = [&](unsigned, pid_t) { spawned = true; };
    sv.on_exit = [&](unsigned, const ExitOutcome& o) { last = o; };

    EXPECT_EQ(sv.run(), 1u);
    EXPECT_FALSE(spawned);
    EXPECT_EQ(last.kind, ExitOutcome::Kind::SpawnFailed);
    EXPECT_EQ(last.error, ECANCELED);
    EXPECT_FALSE(fs::exists(temp_dir_ + "/child.log"));
    EXPECT_NE(buf.str().find("stopped with"), std::string::npos) << buf.str();
    EXPECT_EQ(buf.str().find("Restarting"), std::string::npos);
}

TEST_F(SupervisorTest, NoticesGoToStreamNotLog) {
    Supervisor sv(options({"/bin/sh", "-c", "exit 3"}, milliseconds(100)), notices_);
    sv.on_exit = [&](unsigned run, const ExitOutcome&) {
        if (run == 2) sv.request_stop();
    };
    sv.run();

    std::string text = notices_.str();
    EXPECT_NE(text.find("Starting /bin/sh -c exit 3 (run 1)..."), std::string::npos) << text;
    EXPECT_NE(text.find("/bin/sh -c exit 3 crashed with exit code 3. Restarting in 0.1 seconds..."),
              std::string::npos) << text;
    EXPECT_NE(text.find("Starting /bin/sh -c exit 3 (run 2)..."), std::string::npos) << text;

    EXPECT_EQ(read_log().find("Starting"), std::string::npos);
}

TEST_F(SupervisorTest, StateNames) {
    EXPECT_STREQ(Supervisor::state_name(Supervisor::State::Idle), "idle");
    EXPECT_STREQ(Supervisor::state_name(Supervisor::State::Backoff), "backoff");
    EXPECT_STREQ(Supervisor::state_name(Supervisor::State::Stopped), "stopped");
}
