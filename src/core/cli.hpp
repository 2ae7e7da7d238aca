#pragma once

#include <string>
#include <vector>

class Config;

class CLI {
public:
    /// Returned by run() for the `run` subcommand; the caller starts the supervisor
    static constexpr int kRunSupervisor = -2;

    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or kRunSupervisor for `run`.
    static int run(int argc, char* argv[]);

    struct RunArgs {
        std::string config_path;
        std::string log_path;
        std::string working_dir;
        bool has_backoff = false;
        double backoff_seconds = 0;
        bool no_markers = false;
        std::vector<std::string> command;
    };

    /// Parse the flags after `run` / `config <sub>` (argv[first] onward).
    /// Returns false with `err` set on a usage error.
    static bool parse_run_args(int argc, char* argv[], int first, RunArgs& out, std::string& err);

    /// Load `config` (constructed with args.config_path), apply the command
    /// line overrides and validate. Returns 0, or 1 after printing the
    /// problem to stderr.
    static int load_run_config(const RunArgs& args, Config& config);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_config(int argc, char* argv[]);

    static int config_show(const RunArgs& args);
    static int config_init(const RunArgs& args);
};
