#pragma once
#include "event.hpp"
#include "journal.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Drains queued events into the journal on its own thread, so callers never
// wait for disk. Batches keep their queue order.
class PersistenceWriter {
public:
    using FailureHandler = std::function<void(const std::string&)>;

    PersistenceWriter(HistoryJournal& journal, FailureHandler on_failure);
    ~PersistenceWriter();

    PersistenceWriter(const PersistenceWriter&) = delete;
    PersistenceWriter& operator=(const PersistenceWriter&) = delete;

    void enqueue(std::vector<Event> events);

    // Blocks until everything queued so far is written, or the writer failed.
    // Returns false after a failure.
    bool flush();

    // Flushes, then compacts the journal. Throws StorageFailure.
    void checkpoint();

    // Flushes and joins the writer thread.
    void stop();

    size_t pending() const;
    bool failed() const;

private:
    void run();

    HistoryJournal& journal_;
    FailureHandler on_failure_;

    std::mutex journal_mutex_;  // serializes journal access with checkpoint()
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::vector<Event>> queue_;
    size_t pending_events_ = 0;
    bool writing_ = false;
    bool stopping_ = false;
    bool failed_ = false;

    std::thread thread_;
};
