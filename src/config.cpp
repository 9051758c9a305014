#include "config.hpp"
#include "ipc.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

bool testing_mode() {
    const char* testing = std::getenv("SHIST_TESTING");
    return testing && *testing;
}

std::string get_data_dir() {
    fs::path dir;
    const char* override_dir = std::getenv("SHIST_HOME");
    if (override_dir && *override_dir) {
        dir = override_dir;
    } else {
        const char* home = std::getenv("HOME");
        if (!home) return "shist"; // Fallback
        dir = fs::path(home) / ".local" / "share" / "shist";
    }
    if (testing_mode()) dir += "-testing";

    if (!fs::exists(dir)) fs::create_directories(dir);
    return dir.string();
}

std::string get_hostname() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "localhost";
    }
    return buffer;
}

std::string Config::journalPath() const { return (fs::path(data_dir) / "journal.db").string(); }
std::string Config::lockPath() const { return (fs::path(data_dir) / "shistd.lock").string(); }
std::string Config::logPath() const { return (fs::path(data_dir) / "daemon.log").string(); }
std::string Config::archiveDir() const { return (fs::path(data_dir) / "archive").string(); }

Config load_config() {
    return load_config(get_data_dir(), get_socket_path());
}

Config load_config(const std::string& data_dir, const std::string& socket_path) {
    Config config;
    config.data_dir = data_dir;
    config.socket_path = socket_path;
    config.machine_id = get_hostname();

    fs::path file = fs::path(data_dir) / "config.json";
    if (!fs::exists(file)) return config;

    try {
        std::ifstream in(file);
        nlohmann::json j = nlohmann::json::parse(in);

        config.machine_id = j.value("machine_id", config.machine_id);
        config.replication_root = j.value("replication_root", config.replication_root);
        config.sync_interval_seconds = j.value("sync_interval_seconds", config.sync_interval_seconds);
        config.snapshot_interval_seconds = j.value("snapshot_interval_seconds", config.snapshot_interval_seconds);
        config.recent_limit = j.value("recent_limit", config.recent_limit);
        config.search_limit = j.value("search_limit", config.search_limit);
        config.git_commit = j.value("git_commit", config.git_commit);
        config.ignore_commands = j.value("ignore_commands", config.ignore_commands);
        config.ignore_patterns = j.value("ignore_patterns", config.ignore_patterns);
        config.success_codes = j.value("success_codes", config.success_codes);

        if (config.recent_limit == 0) config.recent_limit = 1;
        if (config.sync_interval_seconds <= 0) config.sync_interval_seconds = 600;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config Warning: ignoring " << file << ": " << e.what() << std::endl;
        Config fallback;
        fallback.data_dir = data_dir;
        fallback.socket_path = socket_path;
        fallback.machine_id = get_hostname();
        return fallback;
    }

    if (!config.replication_root.empty() && config.replication_root[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) config.replication_root = std::string(home) + config.replication_root.substr(1);
    }
    return config;
}
