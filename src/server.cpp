#include "server.hpp"
#include "errors.hpp"
#include "protocol.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <iterator>
#include <poll.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace {
const int POLL_INTERVAL_MS = 250;
// A client that stops reading a search stream is dropped after this long.
const int SEND_TIMEOUT_MS = 10000;
}

InstanceLock::InstanceLock(const std::string& path) {
    fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }
    if (flock(fd_, LOCK_EX | LOCK_NB) < 0) {
        int saved = errno;
        close(fd_);
        fd_ = -1;
        if (saved == EWOULDBLOCK) {
            throw DuplicateInstance("another shistd holds " + path);
        }
        throw std::system_error(saved, std::generic_category(), "flock " + path);
    }
    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd_, 0) < 0 || write(fd_, pid.data(), pid.size()) < 0) {
        std::cerr << "Server Warning: cannot record pid in " << path << ": " << std::strerror(errno) << std::endl;
    }
}

InstanceLock::~InstanceLock() {
    if (fd_ >= 0) close(fd_);
}

bool probe_daemon(const std::string& socket_path, int timeout_ms) {
    try {
        Channel channel(connect_unix(socket_path));
        channel.setTimeout(timeout_ms);
        if (!channel.writeLine(encode_message(make_request(op::IS_ALIVE)))) return false;

        std::string line;
        if (!channel.readLine(line)) return false;
        auto response = nlohmann::json::parse(line);
        return response.value("ok", false) && response.value("service", std::string()) == SERVICE_NAME;
    } catch (const DaemonUnreachable&) {
        return false;
    } catch (const std::system_error&) {
        return false;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

RequestServer::RequestServer(HistoryService& service, std::string socket_path)
    : service_(service), socket_path_(std::move(socket_path)) {}

RequestServer::~RequestServer() {
    stop();
    reapWorkers(true);
    if (server_fd_ >= 0) {
        close(server_fd_);
        unlink(socket_path_.c_str());
    }
}

void RequestServer::fail(const std::string& reason) {
    std::cerr << "Server Error: shutting down: " << reason << std::endl;
    exit_code_.store(1);
    stop();
}

void RequestServer::bind() {
    struct stat st;
    if (lstat(socket_path_.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            throw std::runtime_error(socket_path_ + " exists and is not a socket");
        }
        // 1. Something still accepts connections: refuse to take over
        try {
            Channel probe(connect_unix(socket_path_));
            throw DuplicateInstance("a daemon is already listening on " + socket_path_);
        } catch (const DaemonUnreachable&) {
            // 2. Left behind by a crashed daemon
            std::cerr << "Server: removing stale socket " << socket_path_ << std::endl;
            unlink(socket_path_.c_str());
        }
    }
    server_fd_ = listen_unix(socket_path_);
}

void RequestServer::run() {
    if (server_fd_ < 0) bind();

    while (!stopping_.load()) {
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        reapWorkers(false);
        if (rc < 0) {
            if (errno == EINTR) continue;
            fail(std::string("poll: ") + std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        int client = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                std::cerr << "Server Warning: accept: " << std::strerror(errno) << std::endl;
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace_back();
        Worker* worker = &workers_.back();
        worker->fd = client;
        worker->thread = std::thread(&RequestServer::serve, this, worker, client);
    }

    close(server_fd_);
    server_fd_ = -1;
    unlink(socket_path_.c_str());

    // Idle connections block in recv; in-flight requests still get their answer.
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& w : workers_) {
            if (!w.done && w.fd >= 0) shutdown(w.fd, SHUT_RD);
        }
    }
    reapWorkers(true);
}

void RequestServer::reapWorkers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            auto next = std::next(it);
            if (all || it->done) finished.splice(finished.end(), workers_, it);
            it = next;
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

size_t RequestServer::connections() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void RequestServer::serve(Worker* worker, int fd) {
    Channel channel(fd);
    try {
        channel.setSendTimeout(SEND_TIMEOUT_MS);
        std::string line;
        while (channel.readLine(line)) {
            if (!handle(channel, line)) break;
        }
    } catch (const MalformedRequest& e) {
        // oversized line; the stream cannot be resynchronised
        channel.writeLine(encode_message(error_response(ERR_MALFORMED, e.what())));
    } catch (const std::system_error& e) {
        if (!stopping_.load()) {
            std::cerr << "Server Warning: connection dropped: " << e.what() << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    worker->fd = -1;
    worker->done = true;
}

bool RequestServer::handle(Channel& channel, const std::string& line) {
    if (line.empty()) return true;

    nlohmann::json response;
    try {
        auto request = nlohmann::json::parse(line);
        if (!request.is_object()) throw MalformedRequest("request is not a JSON object");
        return dispatch(channel, request);
    } catch (const nlohmann::json::exception& e) {
        response = error_response(ERR_MALFORMED, e.what());
    } catch (const MalformedRequest& e) {
        response = error_response(ERR_MALFORMED, e.what());
    } catch (const StorageFailure& e) {
        response = error_response(ERR_STORAGE, e.what());
    } catch (const std::system_error&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "Server Error: " << e.what() << std::endl;
        response = error_response(ERR_INTERNAL, e.what());
    }
    return channel.writeLine(encode_message(response));
}

bool RequestServer::dispatch(Channel& channel, const nlohmann::json& request) {
    std::string name = request.at("op").get<std::string>();
    nlohmann::json response = ok_response();

    if (name == op::APPEND_EVENT) {
        Event stored = service_.appendEvent(parse_append_request(request));
        response["sequence"] = stored.sequence;
    } else if (name == op::SEARCH) {
        return streamSearch(channel, request);
    } else if (name == op::PREVIOUS_EVENT) {
        response = navigate(request, true);
    } else if (name == op::NEXT_EVENT) {
        response = navigate(request, false);
    } else if (name == op::STATUS) {
        response["status"] = service_.status();
        response["status"]["connections"] = connections();
    } else if (name == op::IS_ALIVE) {
        response["service"] = SERVICE_NAME;
        response["pid"] = getpid();
    } else if (name == op::STOP) {
        bool sent = channel.writeLine(encode_message(response));
        stop();
        if (!sent) std::cerr << "Server Warning: stop requester hung up early" << std::endl;
        return false;
    } else if (name == op::SYNC_NOW) {
        response["report"] = service_.syncNow();
    } else if (name == op::IMPORT_HISTORY) {
        response["result"] = service_.importZshHistory(request.at("path").get<std::string>());
    } else {
        throw MalformedRequest("unknown op '" + name + "'");
    }
    return channel.writeLine(encode_message(response));
}

bool RequestServer::streamSearch(Channel& channel, const nlohmann::json& request) {
    SearchQuery query = parse_search_query(request);
    size_t count = 0;

    // A failed write means the client went away; stop producing.
    if (query.mode == SearchMode::AGGREGATED_UNIQUE) {
        for (const auto& a : service_.searchAggregated(query)) {
            if (!channel.writeLine(encode_message(nlohmann::json{{"aggregated", a}}))) return false;
            ++count;
        }
    } else {
        for (const auto& e : service_.search(query)) {
            if (!channel.writeLine(encode_message(nlohmann::json{{"event", e}}))) return false;
            ++count;
        }
    }

    nlohmann::json done = ok_response();
    done["done"] = true;
    done["count"] = count;
    return channel.writeLine(encode_message(done));
}

nlohmann::json RequestServer::navigate(const nlohmann::json& request, bool previous) {
    NavigationState state;
    if (request.contains("navigation") && !request.at("navigation").is_null()) {
        state = request.at("navigation").get<NavigationState>();
    } else {
        request.at("session_id").get_to(state.session_id);
        state.session_start = request.value("session_start", 0.0);
    }
    std::string buffer = request.value("buffer", std::string());
    size_t cursor = request.value("cursor", buffer.size());

    NavigationStep step = previous ? service_.previousEvent(state, buffer, cursor)
                                   : service_.nextEvent(state, buffer, cursor);

    nlohmann::json response = ok_response();
    response["moved"] = step.moved;
    response["buffer"] = step.buffer;
    response["navigation"] = step.state;
    if (step.event) {
        response["event"] = *step.event;
    } else {
        response["event"] = nullptr;
    }
    return response;
}
