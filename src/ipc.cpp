#include "ipc.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <system_error>
#include <unistd.h>

std::string get_socket_path() {
    std::string name = testing_mode() ? "shist-testing" : "shist";
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir) {
        return std::string(runtime_dir) + "/" + name + ".sock";
    }
    return "/tmp/" + name + "_" + std::to_string(getuid()) + ".sock";
}

Channel::Channel(int fd) : fd_(fd) {}

Channel::~Channel() {
    if (fd_ >= 0) close(fd_);
}

bool Channel::readLine(std::string& line) {
    while (true) {
        size_t pos = buffer_.find(DELIMITER);
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            return true;
        }
        if (buffer_.size() > MAX_MESSAGE_SIZE) {
            throw MalformedRequest("message exceeds " + std::to_string(MAX_MESSAGE_SIZE) + " bytes");
        }

        char chunk[BUFFER_SIZE];
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) return false;
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "recv");
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

bool Channel::writeLine(const std::string& line) {
    std::string data = line;
    data += DELIMITER;
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = send(fd_, p, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

void Channel::setTimeout(int milliseconds) {
    struct timeval tv;
    tv.tv_sec = milliseconds / 1000;
    tv.tv_usec = (milliseconds % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::system_error(errno, std::generic_category(), "setsockopt");
    }
}

void Channel::setSendTimeout(int milliseconds) {
    struct timeval tv;
    tv.tv_sec = milliseconds / 1000;
    tv.tv_usec = (milliseconds % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::system_error(errno, std::generic_category(), "setsockopt");
    }
}

static sockaddr_un make_address(const std::string& path) {
    sockaddr_un address;
    std::memset(&address, 0, sizeof(address));
    address.sun_family = AF_UNIX;
    strncpy(address.sun_path, path.c_str(), sizeof(address.sun_path) - 1);
    return address;
}

int connect_unix(const std::string& path) {
    int sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        throw DaemonUnreachable("socket: " + std::string(std::strerror(errno)));
    }

    sockaddr_un address = make_address(path);
    if (connect(sock, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        int saved = errno;
        close(sock);
        throw DaemonUnreachable("no daemon on " + path + ": " + std::strerror(saved));
    }
    return sock;
}

int listen_unix(const std::string& path, int backlog) {
    int server_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd < 0) throw std::system_error(errno, std::generic_category(), "socket");

    sockaddr_un address = make_address(path);
    if (bind(server_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        int saved = errno;
        close(server_fd);
        throw std::system_error(saved, std::generic_category(), "bind " + path);
    }
    if (chmod(path.c_str(), 0600) < 0 || listen(server_fd, backlog) < 0) {
        int saved = errno;
        close(server_fd);
        unlink(path.c_str());
        throw std::system_error(saved, std::generic_category(), "listen " + path);
    }
    return server_fd;
}
