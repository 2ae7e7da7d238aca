#include "supervisor/exit_outcome.hpp"

#include <cstring>
#include <sys/wait.h>

ExitOutcome ExitOutcome::exited(int code) {
    ExitOutcome o;
    o.kind = Kind::Exited;
    o.code = code;
    return o;
}

ExitOutcome ExitOutcome::signaled(int signal, bool core_dumped) {
    ExitOutcome o;
    o.kind = Kind::Signaled;
    o.signal = signal;
    o.core_dumped = core_dumped;
    return o;
}

ExitOutcome ExitOutcome::spawn_failed(int error, const std::string& context) {
    ExitOutcome o;
    o.kind = Kind::SpawnFailed;
    o.error = error;
    o.message = context;
    return o;
}

ExitOutcome ExitOutcome::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return exited(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
#ifdef WCOREDUMP
        return signaled(WTERMSIG(status), WCOREDUMP(status) != 0);
#else
        return signaled(WTERMSIG(status));
#endif
    }
    // Stopped/continued states are never requested (no WUNTRACED)
    return exited(status);
}

std::string ExitOutcome::describe() const {
    switch (kind) {
        case Kind::Exited:
            return "exit code " + std::to_string(code);
        case Kind::Signaled: {
            std::string s = "signal " + std::to_string(signal);
            const char* name = strsignal(signal);
            if (name) {
                s += " (";
                s += name;
                s += ")";
            }
            if (core_dumped) s += ", core dumped";
            return s;
        }
        case Kind::SpawnFailed: {
            std::string s = "spawn failure: ";
            if (!message.empty()) s += message + ": ";
            s += std::strerror(error);
            return s;
        }
    }
    return "unknown outcome";
}

int ExitOutcome::shell_status() const {
    switch (kind) {
        case Kind::Exited:      return code;
        case Kind::Signaled:    return 128 + signal;
        case Kind::SpawnFailed: return 127;
    }
    return -1;
}

bool ExitOutcome::operator==(const ExitOutcome& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case Kind::Exited:      return code == other.code;
        case Kind::Signaled:    return signal == other.signal;
        case Kind::SpawnFailed: return error == other.error;
    }
    return false;
}
