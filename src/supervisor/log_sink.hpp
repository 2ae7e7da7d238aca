#pragma once

#include <string>

/// Append-only log file shared by every child run.
/// Children write to it directly through the inherited descriptor.
class LogSink {
public:
    explicit LogSink(const std::string& path, bool run_markers = true);
    ~LogSink();

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    /// Open (or reopen) the file in append mode, creating parent dirs.
    /// On failure returns false and leaves errno set.
    bool open();
    void close();

    bool is_open() const;
    int fd() const;
    const std::string& path() const;

    /// Write "--- respawn: run N started <time> ---" (no-op with markers off)
    bool mark_run_started(unsigned run);

    /// Write "--- respawn: run N ended: <outcome> ---" (no-op with markers off)
    bool mark_run_ended(unsigned run, const std::string& outcome);

    /// Current UTC time as ISO-8601, e.g. 2024-01-02T03:04:05Z
    static std::string timestamp();

private:
    std::string path_;
    bool run_markers_;
    int fd_ = -1;

    bool write_line(const std::string& line);
};
