#pragma once
#include <string>
#include <vector>

struct Config {
    std::string data_dir;
    std::string socket_path;

    std::string machine_id;
    std::string replication_root;   // empty: local only
    int sync_interval_seconds = 600;
    int snapshot_interval_seconds = 3600;
    size_t recent_limit = 5000;
    size_t search_limit = 10000;
    bool git_commit = true;

    std::vector<std::string> ignore_commands;
    std::vector<std::string> ignore_patterns;
    std::vector<int> success_codes{0};

    std::string journalPath() const;
    std::string lockPath() const;
    std::string logPath() const;
    std::string archiveDir() const;
};

// SHIST_TESTING set: isolated data directory and socket.
bool testing_mode();
// Resolves SHIST_HOME and creates the data directory.
std::string get_data_dir();
std::string get_hostname();

// Reads <data>/config.json on top of the defaults. A broken file is reported
// and ignored.
Config load_config();
Config load_config(const std::string& data_dir, const std::string& socket_path);
