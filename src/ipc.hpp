#pragma once
#include <string>

// Requests and responses are single-line JSON documents terminated by '\n'.
const char DELIMITER = '\n';
const int BUFFER_SIZE = 8192;
const size_t MAX_MESSAGE_SIZE = 1 << 20;

std::string get_socket_path();

// Buffered line reader/writer over a connected stream socket. Owns the fd.
class Channel {
public:
    explicit Channel(int fd);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // False on orderly EOF. Throws std::system_error on socket errors and
    // timeouts, MalformedRequest when a line exceeds MAX_MESSAGE_SIZE.
    bool readLine(std::string& line);

    // False when the peer is gone. Never raises SIGPIPE.
    bool writeLine(const std::string& line);

    // Receive and send timeouts; setSendTimeout only bounds writes.
    void setTimeout(int milliseconds);
    void setSendTimeout(int milliseconds);
    int fd() const { return fd_; }

private:
    int fd_;
    std::string buffer_;
};

// Throws DaemonUnreachable when nothing listens on path.
int connect_unix(const std::string& path);

// Throws std::system_error.
int listen_unix(const std::string& path, int backlog = 16);
