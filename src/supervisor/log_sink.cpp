#include "supervisor/log_sink.hpp"

#include <cerrno>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

LogSink::LogSink(const std::string& path, bool run_markers)
    : path_(path), run_markers_(run_markers) {}

LogSink::~LogSink() {
    close();
}

bool LogSink::open() {
    close();

    if (path_.empty()) {
        errno = EINVAL;
        return false;
    }

    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            errno = ec.value();
            return false;
        }
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    return fd_ >= 0;
}

void LogSink::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool LogSink::is_open() const { return fd_ >= 0; }
int LogSink::fd() const { return fd_; }
const std::string& LogSink::path() const { return path_; }

std::string LogSink::timestamp() {
    auto t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool LogSink::mark_run_started(unsigned run) {
    if (!run_markers_) return true;
    return write_line("--- respawn: run " + std::to_string(run) +
                      " started " + timestamp() + " ---");
}

bool LogSink::mark_run_ended(unsigned run, const std::string& outcome) {
    if (!run_markers_) return true;
    return write_line("--- respawn: run " + std::to_string(run) +
                      " ended: " + outcome + " ---");
}

bool LogSink::write_line(const std::string& line) {
    if (fd_ < 0) return false;

    // O_APPEND makes each write() land at the current end of file
    std::string buf = line + "\n";
    size_t total = 0;
    while (total < buf.size()) {
        ssize_t n = ::write(fd_, buf.data() + total, buf.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}
