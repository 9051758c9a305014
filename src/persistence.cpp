#include "persistence.hpp"
#include "errors.hpp"
#include <iostream>

PersistenceWriter::PersistenceWriter(HistoryJournal& journal, FailureHandler on_failure)
    : journal_(journal), on_failure_(std::move(on_failure)) {
    thread_ = std::thread(&PersistenceWriter::run, this);
}

PersistenceWriter::~PersistenceWriter() {
    stop();
}

void PersistenceWriter::enqueue(std::vector<Event> events) {
    if (events.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_events_ += events.size();
        queue_.push_back(std::move(events));
    }
    work_cv_.notify_one();
}

bool PersistenceWriter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return failed_ || (queue_.empty() && !writing_); });
    return !failed_;
}

void PersistenceWriter::checkpoint() {
    if (!flush()) throw StorageFailure("journal writer failed, not compacting");
    std::lock_guard<std::mutex> lock(journal_mutex_);
    journal_.checkpoint();
}

void PersistenceWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

size_t PersistenceWriter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_events_;
}

bool PersistenceWriter::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void PersistenceWriter::run() {
    while (true) {
        std::vector<Event> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (failed_) {
                // nothing is written after a storage failure
                queue_.clear();
                pending_events_ = 0;
            }
            if (queue_.empty()) {
                // stop() only returns once the queue is drained
                if (stopping_) break;
                continue;
            }
            // merge everything waiting into one transaction
            while (!queue_.empty()) {
                auto& next = queue_.front();
                batch.insert(batch.end(), std::make_move_iterator(next.begin()),
                             std::make_move_iterator(next.end()));
                queue_.pop_front();
            }
            writing_ = true;
        }

        std::string error;
        try {
            std::lock_guard<std::mutex> lock(journal_mutex_);
            journal_.appendEvents(batch);
        } catch (const StorageFailure& e) {
            error = e.what();
        }

        // the handler runs before flush() can report the failure
        if (!error.empty()) {
            std::cerr << "FATAL: " << error << std::endl;
            if (on_failure_) on_failure_(error);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            writing_ = false;
            pending_events_ -= batch.size();
            if (!error.empty()) failed_ = true;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}
