#include "client.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "server.hpp"
#include "service.hpp"
#include "test_support.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

nlohmann::json append_request(const std::string& command, double start, int exit_code = 0,
                              const std::string& session = "s1") {
    nlohmann::json request = make_request(op::APPEND_EVENT);
    request["command"] = command;
    request["start_time"] = start;
    request["end_time"] = start + 1;
    request["exit_code"] = exit_code;
    request["folder"] = "/home/u";
    request["machine"] = "m1";
    request["session_id"] = session;
    return request;
}

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = load_config(data.path().string(), data.file("shist.sock"));
        config.machine_id = "m1";
        service = std::make_unique<HistoryService>(config);
        server = std::make_unique<RequestServer>(*service, config.socket_path);
        server->bind();
        service->start();
        thread = std::thread([this] { server->run(); });
    }

    void TearDown() override {
        server->stop();
        if (thread.joinable()) thread.join();
        service->shutdown();
    }

    std::vector<nlohmann::json> search(Client& client, const std::string& mode, const std::string& text = "") {
        nlohmann::json request = make_request(op::SEARCH);
        request["mode"] = mode;
        request["query"] = text;
        request["session_id"] = "s1";
        std::vector<nlohmann::json> records;
        nlohmann::json done = client.stream(request, [&records](const nlohmann::json& r) { records.push_back(r); });
        EXPECT_EQ(done["count"].get<size_t>(), records.size());
        return records;
    }

    TempDir data;
    Config config;
    std::unique_ptr<HistoryService> service;
    std::unique_ptr<RequestServer> server;
    std::thread thread;
};

}

TEST_F(ServerTest, AppendThenSearchMostRecentFirst) {
    Client client(config.socket_path);
    EXPECT_EQ(client.call(append_request("ls", 100))["sequence"], 1);
    EXPECT_EQ(client.call(append_request("false", 101, 1))["sequence"], 2);

    auto records = search(client, "all");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"]["command"], "false");
    EXPECT_EQ(records[0]["event"]["machine"], "m1");
    EXPECT_EQ(records[1]["event"]["command"], "ls");
}

TEST_F(ServerTest, AggregatedSearchCollapsesRepeats) {
    Client client(config.socket_path);
    client.call(append_request("make", 1));
    client.call(append_request("make", 2, 2));
    client.call(append_request("make", 3));

    auto records = search(client, "aggregated-unique");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["aggregated"]["count"], 3);
    EXPECT_EQ(records[0]["aggregated"]["failure_count"], 1);
    EXPECT_NEAR(records[0]["aggregated"]["failure_ratio"].get<double>(), 1.0 / 3.0, 1e-9);
}

TEST_F(ServerTest, MalformedRequestKeepsTheConnection) {
    Channel channel(connect_unix(config.socket_path));
    channel.setTimeout(5000);
    std::string line;

    ASSERT_TRUE(channel.writeLine("this is not json"));
    ASSERT_TRUE(channel.readLine(line));
    auto error = nlohmann::json::parse(line);
    EXPECT_FALSE(error["ok"].get<bool>());
    EXPECT_EQ(error["error"], ERR_MALFORMED);

    ASSERT_TRUE(channel.writeLine("{\"op\":\"is-alive\"}"));
    ASSERT_TRUE(channel.readLine(line));
    EXPECT_TRUE(nlohmann::json::parse(line)["ok"].get<bool>());
}

TEST_F(ServerTest, RejectedRequestsSurfaceAsExceptions) {
    Client client(config.socket_path);
    EXPECT_THROW(client.call(make_request("no-such-op")), MalformedRequest);

    nlohmann::json missing_session = append_request("ls", 1);
    missing_session.erase("session_id");
    EXPECT_THROW(client.call(missing_session), MalformedRequest);

    nlohmann::json bad_mode = make_request(op::SEARCH);
    bad_mode["mode"] = "sideways";
    EXPECT_THROW(client.call(bad_mode), MalformedRequest);

    EXPECT_TRUE(client.isAlive());
    EXPECT_EQ(service->store().size(), 0u);
}

TEST_F(ServerTest, NavigationRoundTrip) {
    Client client(config.socket_path);
    client.call(append_request("git status", 10));
    client.call(append_request("git push", 20));

    nlohmann::json previous = make_request(op::PREVIOUS_EVENT);
    previous["session_id"] = "s1";
    previous["buffer"] = "git";
    previous["cursor"] = 3;
    nlohmann::json back = client.call(previous);
    EXPECT_TRUE(back["moved"].get<bool>());
    EXPECT_EQ(back["buffer"], "git push");
    EXPECT_EQ(back["event"]["sequence"], 2);

    nlohmann::json next = make_request(op::NEXT_EVENT);
    next["navigation"] = back["navigation"];
    next["buffer"] = back["buffer"];
    nlohmann::json forward = client.call(next);
    EXPECT_TRUE(forward["moved"].get<bool>());
    EXPECT_EQ(forward["buffer"], "git");
    EXPECT_TRUE(forward["event"].is_null());
}

TEST_F(ServerTest, StatusReportsCounts) {
    Client client(config.socket_path);
    client.call(append_request("ls", 10));
    client.call(append_request("false", 11, 1));

    nlohmann::json status = client.call(make_request(op::STATUS))["status"];
    EXPECT_EQ(status["machine_id"], "m1");
    EXPECT_EQ(status["events"], 2);
    EXPECT_EQ(status["failures"], 1);
    EXPECT_EQ(status["per_machine"]["m1"], 2);
    EXPECT_GE(status["uptime"].get<double>(), 0.0);
}

TEST_F(ServerTest, ImportAndSyncRequests) {
    write_text(data.file("zsh_history"), ": 100:0;ls\n: 200:1;make\n");
    Client client(config.socket_path);

    nlohmann::json import = make_request(op::IMPORT_HISTORY);
    import["path"] = data.file("zsh_history");
    EXPECT_EQ(client.call(import)["result"]["imported"], 2);

    import["path"] = data.file("missing");
    EXPECT_THROW(client.call(import), MalformedRequest);

    nlohmann::json report = client.call(make_request(op::SYNC_NOW))["report"];
    EXPECT_FALSE(report["root_available"].get<bool>());
}

TEST_F(ServerTest, ClientLeavingMidStreamEndsTheSearch) {
    Client client(config.socket_path);
    for (int i = 0; i < 3000; i++) {
        client.call(append_request("echo " + std::string(200, static_cast<char>('a' + i % 26)), 1000 + i));
    }

    {
        int fd = connect_unix(config.socket_path);
        int small = 4096;
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &small, sizeof(small));
        Channel reader(fd);
        nlohmann::json request = make_request(op::SEARCH);
        request["mode"] = "all";
        ASSERT_TRUE(reader.writeLine(request.dump()));

        std::string line;
        for (int i = 0; i < 5; i++) {
            ASSERT_TRUE(reader.readLine(line));
            EXPECT_TRUE(nlohmann::json::parse(line).contains("event"));
        }
    } // closes the connection with most results unread

    // the streaming worker notices, finishes and is reaped
    size_t connections = 0;
    for (int i = 0; i < 100; i++) {
        connections = client.call(make_request(op::STATUS))["status"]["connections"].get<size_t>();
        if (connections == 1) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    EXPECT_EQ(connections, 1u);

    Client fresh(config.socket_path);
    EXPECT_TRUE(fresh.isAlive());
    EXPECT_EQ(fresh.call(append_request("after", 9000))["sequence"], 3001);
}

TEST_F(ServerTest, EndBeforeStartIsClamped) {
    Event e = make_event("sleep 1", 50);
    e.end_time = 40;
    EXPECT_EQ(service->appendEvent(e).duration(), 0);
}

TEST_F(ServerTest, AppendedEventsReachTheJournal) {
    Client client(config.socket_path);
    client.call(append_request("ls", 10));
    ASSERT_TRUE(service->flush());

    HistoryJournal journal(config.journalPath(), true);
    size_t corrupt = 0;
    auto events = journal.loadEvents(corrupt);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].command, "ls");
}

TEST_F(ServerTest, SecondInstanceIsRefused) {
    RequestServer second(*service, config.socket_path);
    EXPECT_THROW(second.bind(), DuplicateInstance);

    InstanceLock held(config.lockPath());
    EXPECT_THROW(InstanceLock again(config.lockPath()), DuplicateInstance);

    // the running instance is undisturbed
    Client client(config.socket_path);
    EXPECT_TRUE(client.isAlive());
}

TEST_F(ServerTest, StopRequestEndsTheServer) {
    Client client(config.socket_path);
    client.call(make_request(op::STOP));
    thread.join();

    EXPECT_FALSE(probe_daemon(config.socket_path));
    EXPECT_FALSE(std::filesystem::exists(config.socket_path));
}

TEST(ServerStartupTest, StaleSocketIsReplaced) {
    TempDir data;
    Config config = load_config(data.path().string(), data.file("stale.sock"));
    config.machine_id = "m1";

    // a socket file nobody listens on, as left by a crashed daemon
    close(listen_unix(config.socket_path));
    ASSERT_TRUE(std::filesystem::exists(config.socket_path));

    HistoryService service(config);
    RequestServer server(service, config.socket_path);
    EXPECT_NO_THROW(server.bind());
}

TEST(ServiceStartTest, FirstSyncRunsOnTheTimerThread) {
    TempDir data;
    TempDir root;
    Config config = load_config(data.path().string(), data.file("s.sock"));
    config.machine_id = "m1";
    config.replication_root = root.path().string();
    config.git_commit = false;

    HistoryService service(config);
    service.appendEvent(make_event("ls", 10));
    service.start();

    for (int i = 0; i < 100 && service.status().sync.last_sync == 0.0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_GT(service.status().sync.last_sync, 0.0);
    EXPECT_TRUE(std::filesystem::exists(root.path() / service.identity().fileName()));
    service.shutdown();
}

TEST(ServiceStartTest, JournalFailureReachesTheHandlerSetAfterConstruction) {
    TempDir data;
    Config config = load_config(data.path().string(), data.file("s.sock"));
    config.machine_id = "m1";

    HistoryService service(config);
    std::atomic<int> failures{0};
    service.setFailureHandler([&failures](const std::string&) { failures++; });

    {
        SQLite::Database other(config.journalPath(), SQLite::OPEN_READWRITE);
        other.exec("DROP TABLE events;");
    }
    service.appendEvent(make_event("ls", 10));
    EXPECT_FALSE(service.flush());
    EXPECT_EQ(failures.load(), 1);
    EXPECT_THROW(service.appendEvent(make_event("pwd", 11)), StorageFailure);
}

TEST(ClientTest, FailsFastWithoutDaemon) {
    TempDir data;
    Client client(data.file("nobody.sock"));
    EXPECT_THROW(client.call(make_request(op::IS_ALIVE)), DaemonUnreachable);
    EXPECT_FALSE(client.isAlive());
    EXPECT_FALSE(probe_daemon(data.file("nobody.sock")));
}
