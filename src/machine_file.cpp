#include "machine_file.hpp"
#include "errors.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

std::string MachineIdentity::fileName() const {
    std::string safe;
    for (char c : machine_id) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        safe += ok ? c : '_';
    }
    if (safe.empty()) safe = "unknown";
    return safe + "-" + std::to_string(static_cast<long long>(std::floor(created_at))) + "-" +
           token + MACHINE_FILE_SUFFIX;
}

MachineFile load_machine_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw CorruptFile("cannot open " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();

    MachineFile file;
    bool have_header = false;
    size_t pos = 0;

    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) break; // partial line, writer not done
        std::string line = content.substr(pos, end - pos);
        pos = end + 1;
        if (line.empty()) continue;

        // 1. Header
        if (!have_header) {
            nlohmann::json header;
            try {
                header = nlohmann::json::parse(line);
                file.format_version = header.at("format_version").get<int>();
                file.machine_id = header.at("machine_id").get<std::string>();
                file.created_at = header.value("created_at", 0.0);
            } catch (const nlohmann::json::exception& e) {
                throw CorruptFile(path + ": bad header: " + e.what());
            }
            if (file.format_version != MACHINE_FILE_VERSION) {
                throw CorruptFile(path + ": unsupported format_version " +
                                  std::to_string(file.format_version));
            }
            have_header = true;
            continue;
        }

        // 2. Events
        try {
            Event event = nlohmann::json::parse(line).at("event").get<Event>();
            if (event.machine != file.machine_id || event.sequence <= 0) {
                file.corrupt_records++;
                continue;
            }
            file.events.push_back(std::move(event));
        } catch (const nlohmann::json::exception&) {
            file.corrupt_records++;
        }
    }

    if (!have_header) throw CorruptFile(path + ": missing header");
    return file;
}

std::string serialize_machine_file(const MachineFile& file) {
    std::string out;
    nlohmann::json header{
        {"format_version", file.format_version},
        {"machine_id", file.machine_id},
        {"created_at", file.created_at},
    };
    out += header.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out += '\n';
    for (const auto& e : file.events) {
        out += nlohmann::json{{"event", e}}.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        out += '\n';
    }
    return out;
}

static void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void write_file_atomic(const std::string& path, const std::string& content) {
    fs::path target(path);
    if (target.has_parent_path()) fs::create_directories(target.parent_path());

    std::string tmp = path + ".tmp." + std::to_string(getpid());
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw_errno("open " + tmp);

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            close(fd);
            unlink(tmp.c_str());
            errno = saved;
            throw_errno("write " + tmp);
        }
        data += n;
        left -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        int saved = errno;
        close(fd);
        unlink(tmp.c_str());
        errno = saved;
        throw_errno("fsync " + tmp);
    }
    close(fd);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        int saved = errno;
        unlink(tmp.c_str());
        errno = saved;
        throw_errno("rename " + tmp);
    }

    // make the rename itself durable
    std::string dir = target.has_parent_path() ? target.parent_path().string() : ".";
    int dir_fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        int rc = fsync(dir_fd);
        int saved = errno;
        close(dir_fd);
        // some network filesystems do not support fsync on directories
        if (rc != 0 && saved != EINVAL && saved != ENOTSUP) {
            errno = saved;
            throw_errno("fsync " + dir);
        }
    }
}

void write_machine_file(const std::string& path, const MachineFile& file) {
    write_file_atomic(path, serialize_machine_file(file));
}

std::string random_token(size_t length) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
    std::string token;
    for (size_t i = 0; i < length; i++) token += alphabet[pick(gen)];
    return token;
}
