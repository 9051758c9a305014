#include "client.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include <memory>
#include <sys/stat.h>
#include <system_error>

Client::Client(std::string socket_path, int timeout_ms)
    : socket_path_(std::move(socket_path)), timeout_ms_(timeout_ms) {}

Channel& Client::channel() {
    if (!channel_) {
        // Fail fast without a connect attempt when no daemon ever created the socket
        struct stat st;
        if (stat(socket_path_.c_str(), &st) < 0) {
            throw DaemonUnreachable("no daemon socket at " + socket_path_);
        }
        channel_ = std::make_unique<Channel>(connect_unix(socket_path_));
    }
    channel_->setTimeout(timeout_ms_);
    return *channel_;
}

void Client::send(const nlohmann::json& request) {
    if (!channel().writeLine(encode_message(request))) {
        channel_.reset();
        throw DaemonUnreachable("daemon closed the connection");
    }
}

nlohmann::json Client::receive() {
    std::string line;
    try {
        if (!channel_->readLine(line)) {
            channel_.reset();
            throw DaemonUnreachable("daemon closed the connection");
        }
    } catch (const std::system_error& e) {
        channel_.reset();
        throw DaemonUnreachable(std::string("no answer from daemon: ") + e.what());
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        channel_.reset();
        throw std::runtime_error(std::string("garbled response: ") + e.what());
    }

    // record lines of a stream carry no "ok"
    if (response.contains("ok") && !response.value("ok", false)) {
        std::string kind = response.value("error", std::string(ERR_INTERNAL));
        std::string message = response.value("message", kind);
        if (kind == ERR_MALFORMED) throw MalformedRequest(message);
        if (kind == ERR_STORAGE) throw StorageFailure(message);
        throw std::runtime_error(message);
    }
    return response;
}

nlohmann::json Client::call(const nlohmann::json& request) {
    send(request);
    return receive();
}

nlohmann::json Client::stream(const nlohmann::json& request, const RecordHandler& on_record) {
    send(request);
    while (true) {
        nlohmann::json message = receive();
        if (message.value("done", false)) return message;
        on_record(message);
    }
}

bool Client::isAlive() {
    try {
        auto response = call(make_request(op::IS_ALIVE));
        return response.value("service", std::string()) == SERVICE_NAME;
    } catch (const DaemonUnreachable&) {
        return false;
    } catch (const std::exception&) {
        // something answered, but not a daemon speaking this protocol
        return false;
    }
}
