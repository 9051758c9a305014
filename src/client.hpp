#pragma once
#include "ipc.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// Connection to shistd. Connects lazily and reuses the connection for later
// requests.
class Client {
public:
    using RecordHandler = std::function<void(const nlohmann::json&)>;

    explicit Client(std::string socket_path, int timeout_ms = 5000);

    // One request, one response. Throws DaemonUnreachable when the daemon is
    // not running or stops answering; error responses are rethrown as
    // MalformedRequest, StorageFailure or std::runtime_error.
    nlohmann::json call(const nlohmann::json& request);

    // Search requests: every record line goes to on_record, the final
    // {"done":true} line is returned.
    nlohmann::json stream(const nlohmann::json& request, const RecordHandler& on_record);

    // Never throws.
    bool isAlive();

    void setTimeout(int milliseconds) { timeout_ms_ = milliseconds; }

private:
    Channel& channel();
    void send(const nlohmann::json& request);
    nlohmann::json receive();

    std::string socket_path_;
    int timeout_ms_;
    std::unique_ptr<Channel> channel_;
};
