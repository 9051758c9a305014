#include "service.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>

static MachineIdentity open_identity(HistoryJournal& journal, const Config& config) {
    journal.initSchema();
    return journal.identity(config.machine_id, now_seconds());
}

static SyncOptions sync_options(const Config& config) {
    SyncOptions options;
    options.replication_root = config.replication_root;
    options.local_archive_dir = config.archiveDir();
    options.recent_limit = config.recent_limit;
    options.interval_seconds = config.sync_interval_seconds;
    options.snapshot_interval_seconds = config.snapshot_interval_seconds;
    options.git_commit = config.git_commit;
    return options;
}

void to_json(nlohmann::json& j, const ServiceStatus& s) {
    j = nlohmann::json{
        {"machine_id", s.machine_id},
        {"replication_root", s.replication_root},
        {"events", s.store.total},
        {"own_events", s.store.own},
        {"failures", s.store.failures},
        {"earliest", s.store.earliest},
        {"latest", s.store.latest},
        {"per_machine", s.store.per_machine},
        {"key_conflicts", s.store.key_conflicts},
        {"last_sync", s.sync.last_sync},
        {"last_snapshot", s.sync.last_snapshot},
        {"last_sync_error", s.sync.last_error},
        {"corrupt_records", s.sync.corrupt_records + s.journal_corrupt_records},
        {"failed_files", s.sync.failed_files},
        {"merged_total", s.sync.merged_total},
        {"pending_writes", s.pending_writes},
        {"started_at", s.started_at},
        {"uptime", s.uptime},
    };
}

HistoryService::HistoryService(const Config& config)
    : config_(config),
      journal_(config.journalPath()),
      identity_(open_identity(journal_, config_)),
      store_(identity_.machine_id, CommandFilter(config_)),
      writer_(journal_, [this](const std::string& error) { reportFailure(error); }),
      sync_(store_, identity_, sync_options(config_)),
      started_at_(now_seconds()) {
    store_.restore(journal_.loadEvents(journal_corrupt_));
    if (journal_corrupt_ > 0) {
        std::cerr << "Journal Warning: skipped " << journal_corrupt_ << " corrupt records" << std::endl;
    }

    store_.setPersistHook([this](std::vector<Event> events) { writer_.enqueue(std::move(events)); });
    sync_.setCheckpointHook([this] {
        try {
            writer_.checkpoint();
        } catch (const StorageFailure& e) {
            std::cerr << "FATAL: " << e.what() << std::endl;
            reportFailure(e.what());
        }
    });
}

HistoryService::~HistoryService() {
    shutdown();
}

void HistoryService::setFailureHandler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    on_failure_ = std::move(handler);
}

void HistoryService::reportFailure(const std::string& reason) {
    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        handler = on_failure_;
    }
    if (handler) handler(reason);
}

void HistoryService::start() {
    // the first cycle runs on the timer thread, so a slow root never
    // delays the socket
    sync_.start();
    sync_.trigger();
}

void HistoryService::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    sync_.stop();
    if (!writer_.flush()) {
        std::cerr << "FATAL: pending events could not be written to " << journal_.path() << std::endl;
    }
    // publish what was appended since the last cycle
    if (!config_.replication_root.empty()) sync_.syncNow();
    writer_.stop();
}

Event HistoryService::appendEvent(Event event) {
    if (event.command.empty()) throw MalformedRequest("command is empty");
    if (event.session_id.empty()) throw MalformedRequest("session_id is empty");
    if (event.start_time <= 0.0) throw MalformedRequest("start_time must be positive");
    if (event.duration() < 0) event.end_time = event.start_time;
    if (writer_.failed()) throw StorageFailure("journal " + journal_.path() + " is not writable");

    if (!event.machine.empty() && event.machine != identity_.machine_id &&
        !machine_warned_.exchange(true)) {
        std::cerr << "Append Warning: events for '" << event.machine << "' are recorded as '"
                  << identity_.machine_id << "'" << std::endl;
    }
    return store_.appendLocal(std::move(event));
}

size_t HistoryService::effectiveLimit(size_t requested) const {
    if (config_.search_limit == 0) return requested;
    if (requested == 0 || requested > config_.search_limit) return config_.search_limit;
    return requested;
}

std::vector<Event> HistoryService::search(const SearchQuery& query) const {
    if (query.mode == SearchMode::SESSION && query.session_id.empty()) {
        throw MalformedRequest("session mode needs a session_id");
    }
    if (query.mode == SearchMode::FOLDER && query.folder.empty()) {
        throw MalformedRequest("folder mode needs a folder");
    }
    SearchQuery capped = query;
    capped.limit = effectiveLimit(query.limit);
    return store_.query(capped);
}

std::vector<AggregatedEvent> HistoryService::searchAggregated(const SearchQuery& query) const {
    auto scorer = scorer_by_name(query.scorer);
    if (!scorer) throw MalformedRequest("unknown scorer '" + query.scorer + "'");
    SearchQuery capped = query;
    capped.limit = effectiveLimit(query.limit);
    return store_.aggregate(capped, now_seconds(), *scorer);
}

NavigationStep HistoryService::previousEvent(const NavigationState& state, const std::string& buffer,
                                             size_t cursor) const {
    return step_previous(store_, state, buffer, cursor, now_seconds());
}

NavigationStep HistoryService::nextEvent(const NavigationState& state, const std::string& buffer,
                                         size_t cursor) const {
    return step_next(store_, state, buffer, cursor, now_seconds());
}

SyncReport HistoryService::syncNow() {
    return sync_.syncNow();
}

ImportResult HistoryService::importZshHistory(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw MalformedRequest("cannot read " + path);

    size_t unparsable = 0;
    std::vector<Event> events = parse_zsh_history(in, unparsable);
    ImportResult result = import_events(store_, std::move(events));
    result.unparsable = unparsable;
    return result;
}

ServiceStatus HistoryService::status() const {
    ServiceStatus s;
    s.machine_id = identity_.machine_id;
    s.replication_root = config_.replication_root;
    s.store = store_.statistics();
    s.sync = sync_.status();
    s.pending_writes = writer_.pending();
    s.journal_corrupt_records = journal_corrupt_;
    s.started_at = started_at_;
    s.uptime = now_seconds() - started_at_;
    return s;
}
