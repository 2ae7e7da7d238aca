#pragma once

#include <string>

struct ExitOutcome {
    enum class Kind {
        Exited,       // normal exit, `code` is valid
        Signaled,     // killed by `signal`
        SpawnFailed,  // never ran, `error` is an errno value
    };

    Kind kind = Kind::Exited;
    int code = 0;
    int signal = 0;
    bool core_dumped = false;
    int error = 0;
    std::string message;

    static ExitOutcome exited(int code);
    static ExitOutcome signaled(int signal, bool core_dumped = false);
    static ExitOutcome spawn_failed(int error, const std::string& context = "");

    /// Translate a raw waitpid() status word
    static ExitOutcome from_wait_status(int status);

    /// Human-readable form used in notices and run markers,
    /// e.g. "exit code 1", "signal 9 (Killed)"
    std::string describe() const;

    /// Shell-style status: code, 128 + signal, or 127 for spawn failures
    int shell_status() const;

    bool operator==(const ExitOutcome& other) const;
    bool operator!=(const ExitOutcome& other) const { return !(*this == other); }
};
