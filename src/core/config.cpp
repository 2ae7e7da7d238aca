#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

// Missing keys fall back to the default; present keys must convert
template <typename T>
static T read_or(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    return value.as<T>();
}

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config(const std::string& path)
    : path_(path.empty() ? default_config_path() : expand_home(path)) {}

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/respawn";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/respawn";
}

std::string Config::default_config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

Config::LoadResult Config::load() {
    if (path_.empty() || !fs::exists(path_)) {
        return {true, false, ""};
    }

    try {
        const YAML::Node root = YAML::LoadFile(path_);
        if (!root.IsDefined() || root.IsNull()) {
            return {true, true, ""};
        }
        if (!root.IsMap()) {
            return {false, true, path_ + ": top level must be a mapping"};
        }

        // A plain string runs through the shell, a list is exec'd directly
        const YAML::Node cmd = root["command"];
        if (cmd && !cmd.IsNull()) {
            config_.command.clear();
            if (cmd.IsScalar()) {
                config_.command = {"/bin/sh", "-c", cmd.as<std::string>()};
            } else if (cmd.IsSequence()) {
                for (const auto& arg : cmd) {
                    config_.command.push_back(arg.as<std::string>());
                }
            } else {
                return {false, true, path_ + ": 'command' must be a string or a list"};
            }
        }
        config_.working_dir = read_or(root, "working_dir", config_.working_dir);

        // Log section
        if (const YAML::Node log = root["log"]) {
            config_.log_path = read_or(log, "path", config_.log_path);
            config_.run_markers = read_or(log, "run_markers", config_.run_markers);
        }

        // Restart section
        if (const YAML::Node restart = root["restart"]) {
            config_.backoff_seconds = read_or(restart, "backoff_seconds", config_.backoff_seconds);
        }

        // Child section
        if (const YAML::Node child = root["child"]) {
            config_.own_process_group = read_or(child, "own_process_group", config_.own_process_group);
            config_.stop_timeout_seconds = read_or(child, "stop_timeout_seconds", config_.stop_timeout_seconds);
        }

        return {true, true, ""};
    } catch (const YAML::Exception& e) {
        return {false, true, path_ + ": " + e.what()};
    }
}

bool Config::save() {
    if (path_.empty()) return false;

    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "command" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& arg : config_.command) {
            out << arg;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "working_dir" << YAML::Value << config_.working_dir;

        // Log section
        out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << config_.log_path;
        out << YAML::Key << "run_markers" << YAML::Value << config_.run_markers;
        out << YAML::EndMap;

        // Restart section
        out << YAML::Key << "restart" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "backoff_seconds" << YAML::Value << config_.backoff_seconds;
        out << YAML::EndMap;

        // Child section
        out << YAML::Key << "child" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "own_process_group" << YAML::Value << config_.own_process_group;
        out << YAML::Key << "stop_timeout_seconds" << YAML::Value << config_.stop_timeout_seconds;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path_);
        if (!fout.is_open()) return false;
        fout << out.c_str() << "\n";
        return fout.good();
    } catch (const std::exception&) {
        return false;
    }
}

std::string Config::validate() const {
    if (config_.command.empty() || config_.command[0].empty()) {
        return "no command to supervise";
    }
    if (config_.log_path.empty()) {
        return "log path is empty";
    }
    if (!(config_.backoff_seconds >= 0 && config_.backoff_seconds <= kMaxSeconds)) {
        return "backoff_seconds must be between 0 and 86400";
    }
    if (!(config_.stop_timeout_seconds >= 0 && config_.stop_timeout_seconds <= kMaxSeconds)) {
        return "stop_timeout_seconds must be between 0 and 86400";
    }
    return "";
}

// Clamped so an unvalidated value can never overflow the clock arithmetic
static std::chrono::milliseconds to_millis(double seconds) {
    if (!(seconds > 0)) return std::chrono::milliseconds(0);
    if (seconds > Config::kMaxSeconds) seconds = Config::kMaxSeconds;
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

SupervisorOptions Config::to_options() const {
    SupervisorOptions opts;
    opts.command = config_.command;
    opts.log_path = expand_home(config_.log_path);
    opts.run_markers = config_.run_markers;
    opts.working_dir = expand_home(config_.working_dir);
    opts.backoff = to_millis(config_.backoff_seconds);
    opts.own_process_group = config_.own_process_group;
    opts.stop_timeout = to_millis(config_.stop_timeout_seconds);
    return opts;
}

RespawnConfig& Config::data() { return config_; }
const RespawnConfig& Config::data() const { return config_; }
const std::string& Config::path() const { return path_; }
