#pragma once
#include "event.hpp"
#include "machine_file.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <string>
#include <vector>

// SQLite store of every event this machine knows: its own events and the
// foreign events ingested from the replication root. Only the daemon opens it
// read-write.
class HistoryJournal {
public:
    // Throws StorageFailure when the database cannot be opened.
    explicit HistoryJournal(const std::string& db_path, bool read_only = false);

    void initSchema();

    // Creates the identity on first run. Later runs keep the stored one.
    MachineIdentity identity(const std::string& default_machine_id, double now);

    // One transaction; rows already present are left untouched.
    void appendEvents(const std::vector<Event>& events);

    std::vector<Event> loadEvents(size_t& corrupt_records);

    // Truncates the WAL into the main database file.
    void checkpoint();

    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    SQLite::Database db_;
};
