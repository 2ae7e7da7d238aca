#include "core/cli.hpp"
#include "core/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: respawn run [options] [--] COMMAND [ARGS...]\n";
        std::cerr << "Run 'respawn help' for usage.\n";
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "run") == 0) {
        return kRunSupervisor;  // caller loads config and runs the loop
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'respawn help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "respawn — keep a command running, restarting it whenever it exits\n"
        "\n"
        "Usage:\n"
        "  respawn run [options] [--] COMMAND [ARGS...]   Supervise COMMAND\n"
        "  respawn run [options]                          Supervise the configured command\n"
        "  respawn config show [--config FILE]            Print the resolved configuration\n"
        "  respawn config init [--config FILE] [-- CMD]   Write a default config file\n"
        "  respawn version                                Show version\n"
        "  respawn help                                   Show this help\n"
        "\n"
        "Options:\n"
        "  --config FILE      Config file (default ~/.config/respawn/config.yaml)\n"
        "  --log FILE         Append child stdout/stderr to FILE (default respawn.log)\n"
        "  --backoff SECONDS  Delay before each restart (default 5)\n"
        "  --workdir DIR      Run the child in DIR\n"
        "  --no-markers       Do not write run delimiters into the log\n"
        "\n"
        "The child is restarted after every exit, clean or not. Stop the\n"
        "supervisor with SIGTERM, SIGINT or SIGHUP; the running child is\n"
        "terminated (SIGTERM, then SIGKILL) before respawn exits.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "respawn " << APP_VERSION << "\n";
    return 0;
}

// ── run arguments ───────────────────────────────────────────

bool CLI::parse_run_args(int argc, char* argv[], int first, RunArgs& out, std::string& err) {
    int i = first;
    while (i < argc) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--") == 0) {
            ++i;
            break;
        }
        if (arg[0] != '-') {
            break;  // first non-option starts the command
        }

        bool takes_value = std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--log") == 0 ||
                           std::strcmp(arg, "--backoff") == 0 || std::strcmp(arg, "--workdir") == 0;
        if (takes_value && i + 1 >= argc) {
            err = std::string("Missing value for ") + arg;
            return false;
        }

        if (std::strcmp(arg, "--config") == 0) {
            out.config_path = argv[++i];
        } else if (std::strcmp(arg, "--log") == 0) {
            out.log_path = argv[++i];
        } else if (std::strcmp(arg, "--workdir") == 0) {
            out.working_dir = argv[++i];
        } else if (std::strcmp(arg, "--backoff") == 0) {
            const char* value = argv[++i];
            char* end = nullptr;
            errno = 0;
            double seconds = std::strtod(value, &end);
            if (errno != 0 || end == value || *end != '\0' ||
                !(seconds >= 0 && seconds <= Config::kMaxSeconds)) {
                err = std::string("Invalid backoff: ") + value;
                return false;
            }
            out.has_backoff = true;
            out.backoff_seconds = seconds;
        } else if (std::strcmp(arg, "--no-markers") == 0) {
            out.no_markers = true;
        } else {
            err = std::string("Unknown option: ") + arg;
            return false;
        }
        ++i;
    }

    for (; i < argc; ++i) {
        out.command.emplace_back(argv[i]);
    }
    return true;
}

int CLI::load_run_config(const RunArgs& args, Config& config) {
    auto loaded = config.load();
    if (!loaded.ok) {
        std::cerr << "Failed to load config: " << loaded.error << "\n";
        return 1;
    }
    if (!args.config_path.empty() && !loaded.found) {
        std::cerr << "Config file not found: " << config.path() << "\n";
        return 1;
    }

    auto& d = config.data();
    if (!args.command.empty()) d.command = args.command;
    if (!args.log_path.empty()) d.log_path = args.log_path;
    if (!args.working_dir.empty()) d.working_dir = args.working_dir;
    if (args.has_backoff) d.backoff_seconds = args.backoff_seconds;
    if (args.no_markers) d.run_markers = false;

    std::string problem = config.validate();
    if (!problem.empty()) {
        std::cerr << "Invalid configuration: " << problem << "\n";
        if (d.command.empty()) {
            std::cerr << "Usage: respawn run [options] [--] COMMAND [ARGS...]\n";
        }
        return 1;
    }
    return 0;
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: respawn config <show|init> [--config FILE]\n";
        return 1;
    }

    RunArgs args;
    std::string err;
    if (!parse_run_args(argc, argv, 3, args, err)) {
        std::cerr << err << "\n";
        return 1;
    }

    const char* sub = argv[2];
    if (std::strcmp(sub, "show") == 0) return config_show(args);
    if (std::strcmp(sub, "init") == 0) return config_init(args);

    std::cerr << "Unknown config command: " << sub << "\n";
    std::cerr << "Usage: respawn config <show|init> [--config FILE]\n";
    return 1;
}

int CLI::config_show(const RunArgs& args) {
    Config config(args.config_path);
    auto loaded = config.load();
    if (!loaded.ok) {
        std::cerr << "Failed to load config: " << loaded.error << "\n";
        return 1;
    }

    auto opts = config.to_options();
    std::string command;
    for (const auto& arg : opts.command) {
        if (!command.empty()) command += ' ';
        command += arg;
    }

    std::cout << "Config:   " << config.path() << (loaded.found ? "" : " (not found, using defaults)") << "\n";
    std::cout << "Command:  " << (command.empty() ? "(not set)" : command) << "\n";
    if (!opts.working_dir.empty())
        std::cout << "Workdir:  " << opts.working_dir << "\n";
    std::cout << "Log:      " << opts.log_path << " (run markers " << (opts.run_markers ? "on" : "off") << ")\n";
    std::cout << "Backoff:  " << config.data().backoff_seconds << "s\n";
    std::cout << "Group:    " << (opts.own_process_group ? "own process group" : "shared with respawn") << "\n";
    std::cout << "Stop:     SIGTERM, SIGKILL after " << config.data().stop_timeout_seconds << "s\n";

    std::string problem = config.validate();
    if (!problem.empty()) {
        std::cout << "Warning:  " << problem << "\n";
    }
    return 0;
}

int CLI::config_init(const RunArgs& args) {
    Config config(args.config_path);
    if (config.path().empty()) {
        std::cerr << "Cannot determine config path (HOME not set); use --config FILE\n";
        return 1;
    }
    if (fs::exists(config.path())) {
        std::cerr << "Config file already exists: " << config.path() << "\n";
        return 1;
    }

    auto& d = config.data();
    d.command = args.command;
    if (!args.log_path.empty()) d.log_path = args.log_path;
    if (!args.working_dir.empty()) d.working_dir = args.working_dir;
    if (args.has_backoff) d.backoff_seconds = args.backoff_seconds;
    if (args.no_markers) d.run_markers = false;

    if (!config.save()) {
        std::cerr << "Failed to write config: " << config.path() << "\n";
        return 1;
    }
    std::cout << "Wrote " << config.path() << "\n";
    return 0;
}
