#include "supervisor/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

static constexpr auto kPollInterval = std::chrono::milliseconds(100);

// Sent over the error pipe when the child fails before exec completes
struct ExecFailure {
    int stage;  // 0 = chdir, 1 = exec, 2 = redirect
    int error;
};

[[noreturn]] static void child_fail(int fd, int stage) {
    ExecFailure f{stage, errno};
    ssize_t n;
    do {
        n = ::write(fd, &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
    _exit(127);
}

ChildProcess::ChildProcess() = default;

ChildProcess::~ChildProcess() {
    if (is_running()) {
        terminate();
    }
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, const SpawnOptions& opts) {
    if (is_running()) {
        terminate();
    }

    if (argv.empty() || argv[0].empty()) {
        outcome_ = ExitOutcome::spawn_failed(EINVAL, "empty command");
        return false;
    }

    // Build everything the child needs before fork()
    std::vector<const char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(arg.c_str());
    }
    cargv.push_back(nullptr);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        outcome_ = ExitOutcome::spawn_failed(errno, "pipe");
        return false;
    }

    own_process_group_ = opts.own_process_group;
    pid_t parent = getpid();

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        outcome_ = ExitOutcome::spawn_failed(e, "fork");
        return false;
    }

    if (pid == 0) {
        // Child process
        ::close(err_pipe[0]);

        if (opts.own_process_group) {
            setpgid(0, 0);
        }

        // Do not outlive a supervisor that is killed outright
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() != parent) {
            _exit(127);
        }

        // Dispositions set to SIG_IGN survive exec; start from defaults
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        for (int sig = 1; sig < NSIG; ++sig) {
            if (sig == SIGKILL || sig == SIGSTOP) continue;
            signal(sig, SIG_DFL);
        }

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) ::close(devnull);
        }

        if (opts.output_fd >= 0) {
            if (dup2(opts.output_fd, STDOUT_FILENO) < 0 ||
                dup2(opts.output_fd, STDERR_FILENO) < 0) {
                child_fail(err_pipe[1], 2);
            }
        }

        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) < 0) {
            child_fail(err_pipe[1], 0);
        }

        execvp(cargv[0], const_cast<char* const*>(cargv.data()));

        // If execvp returns, it failed
        child_fail(err_pipe[1], 1);
    }

    // Parent process
    ::close(err_pipe[1]);
    if (opts.own_process_group) {
        // Both sides call setpgid so kill(-pid) works regardless of scheduling
        setpgid(pid, pid);
    }
    pid_ = pid;

    // A successful exec closes the pipe without writing anything
    ExecFailure failure{};
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        reap(0);
        std::string context;
        switch (failure.stage) {
            case 0:  context = "chdir " + opts.working_dir; break;
            case 2:  context = "redirect output"; break;
            default: context = argv[0]; break;
        }
        outcome_ = ExitOutcome::spawn_failed(failure.error, context);
        return false;
    }

    return true;
}

bool ChildProcess::reap(int options) {
    if (pid_ <= 0) return true;

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, options);
    } while (result < 0 && errno == EINTR);

    if (result == 0) return false;  // still running (WNOHANG)

    if (result < 0) {
        // Someone else reaped it; the real status is lost
        outcome_ = ExitOutcome::spawn_failed(errno, "waitpid");
    } else {
        outcome_ = ExitOutcome::from_wait_status(status);
    }
    pid_ = -1;
    return true;
}

bool ChildProcess::poll() {
    return reap(WNOHANG);
}

bool ChildProcess::wait(const std::function<bool()>& should_stop) {
    if (!should_stop) {
        return reap(0);
    }

    while (!reap(WNOHANG)) {
        if (should_stop()) return false;
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

void ChildProcess::send_signal(int sig) {
    if (pid_ <= 0) return;
    if (own_process_group_ && kill(-pid_, sig) == 0) return;
    kill(pid_, sig);
}

bool ChildProcess::terminate(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) return true;

    send_signal(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(WNOHANG)) return true;
        std::this_thread::sleep_for(kPollInterval);
    }
    if (reap(WNOHANG)) return true;

    // Force kill if still running
    send_signal(SIGKILL);
    return reap(0);
}

bool ChildProcess::is_running() const {
    return pid_ > 0;
}

pid_t ChildProcess::pid() const {
    return pid_;
}

const ExitOutcome& ChildProcess::outcome() const {
    return outcome_;
}
