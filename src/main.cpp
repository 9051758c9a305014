#include "client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_store.hpp"
#include "journal.hpp"
#include "navigation.hpp"
#include "protocol.hpp"
#include "search.hpp"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {
const int DEFAULT_TIMEOUT_MS = 5000;
const int APPEND_TIMEOUT_MS = 2000;
const int LONG_TIMEOUT_MS = 120000;

// Options that take no value
const std::set<std::string> FLAGS = {"--success", "--filter-failed", "--keep-ignored", "--json"};

struct Args {
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    std::vector<std::string> positional;

    bool has(const std::string& key) const { return options.count(key) > 0; }
    bool flag(const std::string& key) const { return flags.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }
};

Args parse_args(int argc, char* argv[], int first) {
    Args args;
    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (FLAGS.count(arg)) {
            args.flags.insert(arg);
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            args.options[arg] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

void print_usage() {
    std::cout
        << "usage: shist <command> [options]\n"
        << "\n"
        << "  append-event --command C --start T --session S [--end T] [--exit N] [--folder F]\n"
        << "  search [TEXT] [--mode all|session|folder|aggregated] [--session S] [--folder F]\n"
        << "         [--success] [--filter-failed] [--keep-ignored] [--limit N] [--scorer NAME] [--json]\n"
        << "  previous-event --session S [--session-start T] [--buffer B] [--cursor N] [--state JSON]\n"
        << "  next-event     --session S [--session-start T] [--buffer B] [--cursor N] [--state JSON]\n"
        << "  run-server | stop-server | is-server-alive | status | sync-now\n"
        << "  import-zsh-history [FILE]\n";
}

// "Daemon unreachable" is reported once per shell session, not on every prompt.
void warn_unreachable_once(const Config& config, const std::string& session_id, const std::string& reason) {
    std::string name = session_id;
    for (auto& c : name) {
        if (c == '/') c = '_';
    }
    fs::path marker = fs::path(config.data_dir) / "warned" / name;
    std::error_code ec;
    if (fs::exists(marker, ec)) return;

    std::cerr << "shist: history daemon unreachable, commands are not recorded (" << reason
              << "). Start it with 'shist run-server'." << std::endl;
    fs::create_directories(marker.parent_path(), ec);
    std::ofstream touch(marker);
}

int cmd_append(const Config& config, const Args& args) {
    nlohmann::json request = make_request(op::APPEND_EVENT);
    request["command"] = args.get("--command");
    request["start_time"] = std::stod(args.get("--start", "0"));
    request["end_time"] = args.has("--end") ? std::stod(args.get("--end")) : request["start_time"].get<double>();
    request["exit_code"] = std::stoi(args.get("--exit", "0"));
    request["folder"] = args.get("--folder", fs::current_path().string());
    request["session_id"] = args.get("--session");

    try {
        Client client(config.socket_path, APPEND_TIMEOUT_MS);
        client.call(request);
    } catch (const DaemonUnreachable& e) {
        warn_unreachable_once(config, args.get("--session", "default"), e.what());
    }
    return 0;
}

SearchQuery query_from_args(const Args& args) {
    SearchQuery query;
    std::string mode = args.get("--mode", "all");
    auto parsed = parse_search_mode(mode);
    if (!parsed) throw std::invalid_argument("unknown mode '" + mode + "'");
    query.mode = *parsed;
    if (!args.positional.empty()) query.query_text = args.positional[0];
    query.session_id = args.get("--session");
    query.folder = args.get("--folder");
    if (query.mode == SearchMode::FOLDER && query.folder.empty()) {
        query.folder = fs::current_path().string();
    }
    query.success_only = args.flag("--success");
    query.filter_failed = args.flag("--filter-failed");
    query.filter_ignored = !args.flag("--keep-ignored");
    query.limit = static_cast<size_t>(std::stoul(args.get("--limit", "0")));
    query.scorer = args.get("--scorer", "recency");
    return query;
}

void print_record(const nlohmann::json& record, bool as_json) {
    if (as_json) {
        std::cout << encode_message(record) << "\n";
    } else if (record.contains("aggregated")) {
        std::cout << record["aggregated"]["event"]["command"].get<std::string>() << "\n";
    } else {
        std::cout << record["event"]["command"].get<std::string>() << "\n";
    }
}

// Reads the journal directly when no daemon runs. Sees everything that was
// flushed, nothing newer.
int search_direct(const Config& config, const SearchQuery& query, bool as_json) {
    std::cerr << "[degraded] daemon unreachable, searching " << config.journalPath() << " directly" << std::endl;
    if (!fs::exists(config.journalPath())) return 0;

    HistoryJournal journal(config.journalPath(), true);
    size_t corrupt = 0;
    EventStore store(config.machine_id, CommandFilter(config));
    store.restore(journal.loadEvents(corrupt));

    SearchQuery capped = query;
    if (config.search_limit > 0 && (capped.limit == 0 || capped.limit > config.search_limit)) {
        capped.limit = config.search_limit;
    }

    if (query.mode == SearchMode::AGGREGATED_UNIQUE) {
        auto scorer = scorer_by_name(query.scorer);
        if (!scorer) throw std::invalid_argument("unknown scorer '" + query.scorer + "'");
        for (const auto& a : store.aggregate(capped, now_seconds(), *scorer)) {
            print_record(nlohmann::json{{"aggregated", a}}, as_json);
        }
    } else {
        for (const auto& e : store.query(capped)) {
            print_record(nlohmann::json{{"event", e}}, as_json);
        }
    }
    return 0;
}

int cmd_search(const Config& config, const Args& args) {
    SearchQuery query = query_from_args(args);
    bool as_json = args.flag("--json");

    nlohmann::json request = make_request(op::SEARCH);
    add_search_query(request, query);

    // Nothing is printed before the daemon answered, so the fallback never
    // duplicates output.
    std::vector<nlohmann::json> records;
    try {
        Client client(config.socket_path, DEFAULT_TIMEOUT_MS);
        client.stream(request, [&records](const nlohmann::json& record) { records.push_back(record); });
    } catch (const DaemonUnreachable&) {
        return search_direct(config, query, as_json);
    }
    for (const auto& r : records) print_record(r, as_json);
    return 0;
}

// Output: the updated navigation state on the first line, the new buffer after it.
int cmd_navigate(const Config& config, const Args& args, bool previous) {
    nlohmann::json request = make_request(previous ? op::PREVIOUS_EVENT : op::NEXT_EVENT);
    if (args.has("--state") && !args.get("--state").empty()) {
        request["navigation"] = nlohmann::json::parse(args.get("--state"));
    } else {
        request["session_id"] = args.get("--session");
        request["session_start"] = std::stod(args.get("--session-start", "0"));
    }
    std::string buffer = args.get("--buffer");
    request["buffer"] = buffer;
    request["cursor"] = args.has("--cursor") ? std::stoul(args.get("--cursor")) : buffer.size();

    Client client(config.socket_path, DEFAULT_TIMEOUT_MS);
    nlohmann::json response = client.call(request);

    std::cout << encode_message(response["navigation"]) << "\n";
    std::cout << response["buffer"].get<std::string>();
    return response.value("moved", false) ? 0 : 1;
}

std::string find_daemon_binary() {
    char self[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", self, sizeof(self) - 1);
    if (n > 0) {
        self[n] = '\0';
        fs::path sibling = fs::path(self).parent_path() / "shistd";
        if (fs::exists(sibling)) return sibling.string();
    }
    return "shistd";
}

int cmd_run_server() {
    std::string daemon = find_daemon_binary();
    execlp(daemon.c_str(), "shistd", "--foreground", static_cast<char*>(nullptr));
    std::cerr << "shist: cannot start " << daemon << ": " << std::strerror(errno) << std::endl;
    return 1;
}

int cmd_stop_server(const Config& config) {
    Client client(config.socket_path, DEFAULT_TIMEOUT_MS);
    client.call(make_request(op::STOP));

    // The daemon flushes and publishes before it releases the socket
    for (int i = 0; i < 300; i++) {
        Client probe(config.socket_path, 500);
        if (!probe.isAlive()) return 0;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cerr << "shist: daemon did not stop within 30s" << std::endl;
    return 1;
}

std::string default_zsh_history() {
    const char* histfile = std::getenv("HISTFILE");
    if (histfile && *histfile) return histfile;
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/.zsh_history";
}
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }
    std::string mode = argv[1];

    Config config;
    try {
        config = load_config();
    } catch (const std::exception& e) {
        std::cerr << "shist: " << e.what() << std::endl;
        return 1;
    }

    try {
        Args args = parse_args(argc, argv, 2);

        if (mode == "append-event") return cmd_append(config, args);
        if (mode == "search") return cmd_search(config, args);
        if (mode == "previous-event") return cmd_navigate(config, args, true);
        if (mode == "next-event") return cmd_navigate(config, args, false);
        if (mode == "run-server") return cmd_run_server();
        if (mode == "stop-server") return cmd_stop_server(config);

        if (mode == "is-server-alive") {
            Client client(config.socket_path, DEFAULT_TIMEOUT_MS);
            bool alive = client.isAlive();
            std::cout << (alive ? "alive" : "not running") << "\n";
            return alive ? 0 : 1;
        }
        if (mode == "status") {
            Client client(config.socket_path, DEFAULT_TIMEOUT_MS);
            std::cout << client.call(make_request(op::STATUS))["status"].dump(2) << "\n";
            return 0;
        }
        if (mode == "sync-now") {
            Client client(config.socket_path, LONG_TIMEOUT_MS);
            std::cout << client.call(make_request(op::SYNC_NOW))["report"].dump(2) << "\n";
            return 0;
        }
        if (mode == "import-zsh-history") {
            std::string path = args.positional.empty() ? default_zsh_history() : args.positional[0];
            nlohmann::json request = make_request(op::IMPORT_HISTORY);
            request["path"] = fs::absolute(path).string();
            Client client(config.socket_path, LONG_TIMEOUT_MS);
            std::cout << client.call(request)["result"].dump(2) << "\n";
            return 0;
        }
        if (mode == "help" || mode == "--help" || mode == "-h") {
            print_usage();
            return 0;
        }

        std::cerr << "shist: unknown command '" << mode << "'" << std::endl;
        print_usage();
        return 2;
    } catch (const DaemonUnreachable& e) {
        std::cerr << "shist: " << e.what() << std::endl;
        return 1;
    } catch (const MalformedRequest& e) {
        std::cerr << "shist: rejected: " << e.what() << std::endl;
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "shist: bad argument: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "shist: " << e.what() << std::endl;
        return 1;
    }
}
