#pragma once

#include "supervisor/supervisor.hpp"

#include <string>
#include <vector>

struct RespawnConfig {
    // Target
    std::vector<std::string> command;
    std::string working_dir;

    // Log sink
    std::string log_path = "respawn.log";
    bool run_markers = true;

    // Restart policy
    double backoff_seconds = 5.0;

    // Child handling
    bool own_process_group = true;
    double stop_timeout_seconds = 5.0;
};

class Config {
public:
    /// Upper bound for backoff_seconds and stop_timeout_seconds (one day)
    static constexpr double kMaxSeconds = 86400.0;

    /// Use `path` instead of the default config file location
    explicit Config(const std::string& path = "");
    ~Config();

    struct LoadResult { bool ok; bool found; std::string error; };
    /// Load the YAML file. A missing file is ok (defaults stay in place);
    /// a malformed one is reported in `error`.
    LoadResult load();
    bool save();

    /// Check values that YAML cannot constrain. Returns empty on success.
    std::string validate() const;

    /// Resolve into supervisor options (~ expanded, seconds converted)
    SupervisorOptions to_options() const;

    RespawnConfig& data();
    const RespawnConfig& data() const;
    const std::string& path() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string default_config_path();
    static std::string expand_home(const std::string& path);

private:
    std::string path_;
    RespawnConfig config_;
};
