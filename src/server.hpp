#pragma once
#include "ipc.hpp"
#include "service.hpp"
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

// Exclusive flock on the lock file, held for the daemon's lifetime.
class InstanceLock {
public:
    // Throws DuplicateInstance when another process holds the lock.
    explicit InstanceLock(const std::string& path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

private:
    int fd_ = -1;
};

// True when a daemon answers is-alive on the socket.
bool probe_daemon(const std::string& socket_path, int timeout_ms = 1000);

// Serves the newline-delimited JSON protocol on a Unix socket, one thread per
// connection. A connection may carry any number of requests.
class RequestServer {
public:
    RequestServer(HistoryService& service, std::string socket_path);
    ~RequestServer();

    RequestServer(const RequestServer&) = delete;
    RequestServer& operator=(const RequestServer&) = delete;

    // Throws DuplicateInstance if a live daemon owns the socket; a stale
    // socket file is removed.
    void bind();

    // Blocks until stop(). Waits for open connections before returning.
    void run();

    // Async-signal-safe.
    void stop() { stopping_.store(true); }

    // Exit status for the daemon: non-zero after a fatal storage failure.
    int exitCode() const { return exit_code_.load(); }
    void fail(const std::string& reason);

    // Connection threads not yet reaped, including the caller's own.
    size_t connections() const;

private:
    struct Worker {
        std::thread thread;
        int fd = -1;
        bool done = false;
    };

    void serve(Worker* worker, int fd);
    // False closes the connection.
    bool handle(Channel& channel, const std::string& line);
    bool dispatch(Channel& channel, const nlohmann::json& request);
    bool streamSearch(Channel& channel, const nlohmann::json& request);
    nlohmann::json navigate(const nlohmann::json& request, bool previous);

    void reapWorkers(bool all);

    HistoryService& service_;
    std::string socket_path_;
    int server_fd_ = -1;
    std::atomic<bool> stopping_{false};
    std::atomic<int> exit_code_{0};
    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};
