#pragma once
#include "config.hpp"
#include "event_store.hpp"
#include "history_import.hpp"
#include "journal.hpp"
#include "navigation.hpp"
#include "persistence.hpp"
#include "sync_engine.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ServiceStatus {
    std::string machine_id;
    std::string replication_root;
    StoreStatistics store;
    SyncStatus sync;
    size_t pending_writes = 0;
    size_t journal_corrupt_records = 0;
    double started_at = 0.0;
    double uptime = 0.0;
};

void to_json(nlohmann::json& j, const ServiceStatus& s);

// Everything one daemon owns: the journal, the in-memory store, the
// asynchronous writer and the sync engine.
class HistoryService {
public:
    using FailureHandler = std::function<void(const std::string&)>;

    // Throws StorageFailure when the journal cannot be opened.
    explicit HistoryService(const Config& config);
    ~HistoryService();

    HistoryService(const HistoryService&) = delete;
    HistoryService& operator=(const HistoryService&) = delete;

    // Starts the background timer with an immediate first cycle.
    void start();
    // Stops the timer and flushes pending writes synchronously.
    void shutdown();

    // May be set while the writer thread already runs.
    void setFailureHandler(FailureHandler handler);

    // Throws MalformedRequest on bad input, StorageFailure once the journal broke.
    Event appendEvent(Event event);

    std::vector<Event> search(const SearchQuery& query) const;
    // Throws MalformedRequest for an unknown scorer.
    std::vector<AggregatedEvent> searchAggregated(const SearchQuery& query) const;

    NavigationStep previousEvent(const NavigationState& state, const std::string& buffer, size_t cursor) const;
    NavigationStep nextEvent(const NavigationState& state, const std::string& buffer, size_t cursor) const;

    SyncReport syncNow();
    ImportResult importZshHistory(const std::string& path);
    ServiceStatus status() const;

    const Config& config() const { return config_; }
    const MachineIdentity& identity() const { return identity_; }
    EventStore& store() { return store_; }
    bool flush() { return writer_.flush(); }

private:
    size_t effectiveLimit(size_t requested) const;
    void reportFailure(const std::string& reason);

    Config config_;
    HistoryJournal journal_;
    MachineIdentity identity_;
    EventStore store_;
    size_t journal_corrupt_ = 0;
    std::mutex failure_mutex_;
    FailureHandler on_failure_;
    PersistenceWriter writer_;
    SyncEngine sync_;
    double started_at_;
    std::atomic<bool> machine_warned_{false};
    bool shut_down_ = false;
};
