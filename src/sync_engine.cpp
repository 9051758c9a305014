#include "sync_engine.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

SyncEngine::SyncEngine(EventStore& store, MachineIdentity identity, SyncOptions options)
    : store_(store), identity_(std::move(identity)), options_(std::move(options)) {}

SyncEngine::~SyncEngine() {
    stop();
}

void SyncEngine::setCheckpointHook(std::function<void()> hook) {
    checkpoint_ = std::move(hook);
}

std::string SyncEngine::recentPath() const {
    if (options_.replication_root.empty()) return "";
    return (fs::path(options_.replication_root) / identity_.fileName()).string();
}

std::string SyncEngine::archivePath() const {
    if (options_.replication_root.empty()) return "";
    return (fs::path(options_.replication_root) / "archive" / identity_.fileName()).string();
}

std::string SyncEngine::localArchivePath() const {
    if (options_.local_archive_dir.empty()) return "";
    return (fs::path(options_.local_archive_dir) / identity_.fileName()).string();
}

bool SyncEngine::isOwnPublished(const std::string& path) const {
    std::error_code ec;
    return fs::equivalent(path, recentPath(), ec) || fs::equivalent(path, archivePath(), ec);
}

SyncReport SyncEngine::syncNow() {
    std::lock_guard<std::mutex> lock(sync_mutex_);
    SyncReport report;

    try {
        if (options_.replication_root.empty()) {
            throw ReplicationRootUnavailable("no replication root configured");
        }
        std::error_code ec;
        if (!fs::is_directory(options_.replication_root, ec)) {
            throw ReplicationRootUnavailable("replication root " + options_.replication_root +
                                             " is not a directory");
        }
        report.root_available = true;

        // 1. Merge what other machines published
        scanForeign(report);

        // 2. Publish our own state
        publish(report, false);
    } catch (const ReplicationRootUnavailable& e) {
        report.error = e.what();
        if (!options_.replication_root.empty()) {
            std::cerr << "Sync Warning: " << e.what() << ", continuing local-only" << std::endl;
        }
    } catch (const fs::filesystem_error& e) {
        report.error = e.what();
        std::cerr << "Sync Warning: " << e.what() << std::endl;
    } catch (const std::system_error& e) {
        report.error = e.what();
        std::cerr << "Sync Warning: cannot publish: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> status_lock(status_mutex_);
    status_.last_sync = now_seconds();
    status_.last_error = report.error;
    status_.corrupt_records += report.corrupt_records;
    status_.failed_files = report.files_failed;
    status_.merged_total += report.events_merged;
    return report;
}

void SyncEngine::scanForeign(SyncReport& report) {
    std::vector<fs::path> candidates;
    auto options = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(options_.replication_root, options);
         it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_directory() && it->path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file() && it->path().extension() == MACHINE_FILE_SUFFIX) {
            candidates.push_back(it->path());
        }
    }

    for (const auto& path : candidates) {
        std::string p = path.string();
        if (isOwnPublished(p)) continue;
        report.files_seen++;

        std::error_code ec;
        uintmax_t size = fs::file_size(path, ec);
        if (ec) continue; // vanished meanwhile
        auto mtime = fs::last_write_time(path, ec);
        if (ec) continue;
        Signature sig{size, static_cast<int64_t>(mtime.time_since_epoch().count())};

        auto known = seen_.find(p);
        if (known != seen_.end() && known->second == sig) {
            report.files_unchanged++;
            continue;
        }

        try {
            MachineFile file = load_machine_file(p);
            report.files_read++;
            report.corrupt_records += file.corrupt_records;

            // only the suffix above the merge watermark is new; an earlier
            // installation of this machine is compared in full, since its
            // sequences may have been reused here
            int64_t watermark = 0;
            if (file.machine_id != identity_.machine_id) watermark = store_.watermark(file.machine_id);
            std::vector<Event> fresh;
            for (auto& e : file.events) {
                if (e.sequence > watermark) fresh.push_back(std::move(e));
            }
            report.events_merged += store_.mergeForeign(file.machine_id, fresh);
            seen_[p] = sig;
        } catch (const CorruptFile& e) {
            report.files_failed++;
            std::cerr << "Sync Warning: skipping " << e.what() << std::endl;
        }
    }
}

void SyncEngine::loadArchivedWatermark() {
    archived_max_ = 0;
    std::error_code ec;
    if (!fs::exists(archivePath(), ec)) return;
    try {
        MachineFile archived = load_machine_file(archivePath());
        if (!archived.events.empty()) archived_max_ = archived.events.back().sequence;
    } catch (const CorruptFile& e) {
        std::cerr << "Sync Warning: own archive unreadable, rewriting: " << e.what() << std::endl;
    }
}

void SyncEngine::publish(SyncReport& report, bool force_archive) {
    const std::string& own = identity_.machine_id;
    int64_t max_seq = store_.maxSequence(own);
    if (archived_max_ < 0) loadArchivedWatermark();

    std::error_code ec;
    bool recent_missing = !fs::exists(recentPath(), ec);
    if (max_seq == published_max_ && !force_archive && !recent_missing) return;

    // includes events of earlier installations of this machine
    std::vector<Event> ours = store_.eventsOf(own);

    MachineFile file;
    file.machine_id = own;
    file.created_at = identity_.created_at;

    std::vector<std::string> written;
    size_t limit = options_.recent_limit == 0 ? ours.size() : options_.recent_limit;
    size_t first_recent = ours.size() > limit ? ours.size() - limit : 0;
    int64_t oldest_recent = ours.empty() ? 0 : ours[first_recent].sequence;

    // the archive must overlap the recent window, or readers would see a gap
    if (force_archive || (first_recent > 0 && archived_max_ < oldest_recent - 1)) {
        file.events = ours;
        write_machine_file(archivePath(), file);
        archived_max_ = max_seq;
        written.push_back(archivePath());
    }

    file.events.assign(ours.begin() + static_cast<std::ptrdiff_t>(first_recent), ours.end());
    write_machine_file(recentPath(), file);
    written.push_back(recentPath());
    published_max_ = max_seq;
    report.published = true;

    if (!options_.git_commit) return;
    auto workdir = find_git_workdir(options_.replication_root);
    if (!workdir) return;

    std::vector<std::string> relative;
    for (const auto& w : written) {
        relative.push_back(fs::relative(fs::weakly_canonical(w), fs::weakly_canonical(*workdir)).string());
    }
    try {
        report.committed = git_commit_paths(*workdir, relative,
            "publish " + std::to_string(file.events.size()) + " events from " + own);
    } catch (const std::runtime_error& e) {
        std::cerr << "Sync Warning: git commit failed: " << e.what() << std::endl;
    }
}

void SyncEngine::snapshotLocal() {
    if (checkpoint_) checkpoint_();

    std::lock_guard<std::mutex> lock(sync_mutex_);
    try {
        if (!options_.local_archive_dir.empty()) {
            MachineFile file;
            file.machine_id = identity_.machine_id;
            file.created_at = identity_.created_at;
            file.events = store_.eventsOf(identity_.machine_id);
            write_machine_file(localArchivePath(), file);
        }
        std::error_code ec;
        if (!options_.replication_root.empty() && fs::is_directory(options_.replication_root, ec)) {
            SyncReport report;
            publish(report, true);
        }
    } catch (const std::system_error& e) {
        std::cerr << "Sync Warning: snapshot failed: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> status_lock(status_mutex_);
    status_.last_snapshot = now_seconds();
}

void SyncEngine::start() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread(&SyncEngine::run, this);
}

void SyncEngine::trigger() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        triggered_ = true;
    }
    timer_cv_.notify_one();
}

void SyncEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

SyncStatus SyncEngine::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void SyncEngine::run() {
    auto interval = std::chrono::seconds(options_.interval_seconds);
    auto snapshot_interval = std::chrono::seconds(options_.snapshot_interval_seconds);
    auto next_snapshot = std::chrono::steady_clock::now() + snapshot_interval;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(timer_mutex_);
            auto wake = [this] { return stopping_ || triggered_; };
            if (options_.interval_seconds > 0) {
                timer_cv_.wait_for(lock, interval, wake);
            } else {
                timer_cv_.wait(lock, wake);  // manual sync only
            }
            if (stopping_) break;
            triggered_ = false;
        }

        syncNow();

        if (options_.snapshot_interval_seconds > 0 && std::chrono::steady_clock::now() >= next_snapshot) {
            snapshotLocal();
            next_snapshot = std::chrono::steady_clock::now() + snapshot_interval;
        }
    }
}
