#pragma once
#include "event_store.hpp"
#include "machine_file.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

struct SyncOptions {
    std::string replication_root;   // empty: local only
    std::string local_archive_dir;  // local-archive snapshots; empty: none
    size_t recent_limit = 5000;
    int interval_seconds = 600;
    int snapshot_interval_seconds = 3600;
    bool git_commit = true;
};

struct SyncReport {
    bool root_available = false;
    size_t files_seen = 0;
    size_t files_read = 0;
    size_t files_unchanged = 0;
    size_t files_failed = 0;
    size_t events_merged = 0;
    size_t corrupt_records = 0;
    bool published = false;
    bool committed = false;
    std::string error;
};

struct SyncStatus {
    double last_sync = 0.0;      // 0: never
    double last_snapshot = 0.0;
    std::string last_error;
    size_t corrupt_records = 0;  // total over all reads
    size_t failed_files = 0;     // files refused in the last cycle
    size_t merged_total = 0;
};

// Exchanges machine files through the replication root. Every machine only
// ever writes its own files, so nothing here takes a lock on shared files; a
// half-written foreign file is simply read again on the next cycle.
class SyncEngine {
public:
    SyncEngine(EventStore& store, MachineIdentity identity, SyncOptions options);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // Called by snapshotLocal() before the archive is written, e.g. to
    // compact the journal.
    void setCheckpointHook(std::function<void()> hook);

    // One full cycle: discover, merge, publish. Never throws for an
    // unavailable root; the report carries the error.
    SyncReport syncNow();

    // Compacts local storage and rewrites the archive files.
    void snapshotLocal();

    // Background timer; trigger() wakes it early.
    void start();
    void trigger();
    void stop();

    SyncStatus status() const;

    std::string recentPath() const;
    std::string archivePath() const;
    std::string localArchivePath() const;

private:
    using Signature = std::pair<uintmax_t, int64_t>; // size, mtime

    void scanForeign(SyncReport& report);
    void publish(SyncReport& report, bool force_archive);
    bool isOwnPublished(const std::string& path) const;
    void loadArchivedWatermark();
    void run();

    EventStore& store_;
    MachineIdentity identity_;
    SyncOptions options_;
    std::function<void()> checkpoint_;

    std::mutex sync_mutex_;  // one cycle at a time
    std::map<std::string, Signature> seen_;
    int64_t published_max_ = -1;
    int64_t archived_max_ = -1;

    mutable std::mutex status_mutex_;
    SyncStatus status_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool triggered_ = false;
    bool stopping_ = false;
    std::thread thread_;
};
