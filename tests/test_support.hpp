#pragma once
#include "event.hpp"
#include "machine_file.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("shist-test-" + random_token(12))) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline Event make_event(const std::string& command, double start, int exit_code = 0,
                        const std::string& session = "s1", const std::string& folder = "/home/u") {
    Event e;
    e.command = command;
    e.start_time = start;
    e.end_time = start + 0.5;
    e.exit_code = exit_code;
    e.folder = folder;
    e.session_id = session;
    return e;
}

// Event as published by another machine.
inline Event foreign_event(const std::string& machine, int64_t sequence, const std::string& command,
                           double start, int exit_code = 0) {
    Event e = make_event(command, start, exit_code, machine + "-session");
    e.machine = machine;
    e.sequence = sequence;
    return e;
}

inline void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}
