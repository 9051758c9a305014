#include "journal.hpp"
#include "errors.hpp"
#include <iostream>

HistoryJournal::HistoryJournal(const std::string& db_path, bool read_only) try
    : db_path_(db_path),
      db_(db_path, read_only ? SQLite::OPEN_READONLY : (SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)) {
    db_.setBusyTimeout(2000);
} catch (const SQLite::Exception& e) {
    throw StorageFailure("Journal Open Error: " + db_path + ": " + e.what());
}

void HistoryJournal::initSchema() {
    try {
        // WAL lets a degraded front-end read while the daemon writes
        db_.exec("PRAGMA journal_mode=WAL;");
        db_.exec("PRAGMA synchronous=NORMAL;");

        db_.exec("CREATE TABLE IF NOT EXISTS meta ("
                 "key TEXT PRIMARY KEY, "
                 "value TEXT NOT NULL"
                 ");");

        db_.exec("CREATE TABLE IF NOT EXISTS events ("
                 "machine TEXT NOT NULL, "
                 "sequence INTEGER NOT NULL, "
                 "command TEXT NOT NULL, "
                 "start_time REAL NOT NULL, "
                 "end_time REAL NOT NULL, "
                 "exit_code INTEGER NOT NULL, "
                 "folder TEXT NOT NULL, "
                 "session_id TEXT NOT NULL, "
                 "PRIMARY KEY (machine, sequence)"
                 ");");

        db_.exec("CREATE INDEX IF NOT EXISTS idx_events_start ON events(start_time);");
    } catch (const SQLite::Exception& e) {
        throw StorageFailure("Journal Init Error: " + std::string(e.what()));
    }
}

MachineIdentity HistoryJournal::identity(const std::string& default_machine_id, double now) {
    try {
        auto read = [&](const char* key, std::string& out) {
            SQLite::Statement q(db_, "SELECT value FROM meta WHERE key = ?");
            q.bind(1, key);
            if (!q.executeStep()) return false;
            out = q.getColumn(0).getString();
            return true;
        };

        MachineIdentity id;
        std::string version, created;
        if (read("machine_id", id.machine_id) && read("created_at", created) && read("token", id.token)) {
            read("format_version", version);
            if (!version.empty() && std::stoi(version) != MACHINE_FILE_VERSION) {
                throw StorageFailure("journal " + db_path_ + " has unsupported format_version " + version);
            }
            id.created_at = std::stod(created);
            if (id.machine_id != default_machine_id) {
                std::cerr << "Journal Warning: keeping machine id '" << id.machine_id
                          << "', configured '" << default_machine_id << "' is ignored" << std::endl;
            }
            return id;
        }

        id.machine_id = default_machine_id;
        id.created_at = now;
        id.token = random_token();

        SQLite::Transaction tx(db_);
        SQLite::Statement insert(db_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
        auto write = [&](const char* key, const std::string& value) {
            insert.bind(1, key);
            insert.bind(2, value);
            insert.exec();
            insert.reset();
        };
        write("format_version", std::to_string(MACHINE_FILE_VERSION));
        write("machine_id", id.machine_id);
        write("created_at", std::to_string(id.created_at));
        write("token", id.token);
        tx.commit();
        return id;
    } catch (const SQLite::Exception& e) {
        throw StorageFailure("Journal Identity Error: " + std::string(e.what()));
    } catch (const std::logic_error& e) {
        throw StorageFailure("Journal Identity Error: bad meta value: " + std::string(e.what()));
    }
}

void HistoryJournal::appendEvents(const std::vector<Event>& events) {
    if (events.empty()) return;
    try {
        SQLite::Transaction tx(db_);
        SQLite::Statement insert(db_, "INSERT OR IGNORE INTO events "
            "(machine, sequence, command, start_time, end_time, exit_code, folder, session_id) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");

        for (const auto& e : events) {
            insert.bind(1, e.machine);
            insert.bind(2, static_cast<long long>(e.sequence));
            insert.bind(3, e.command);
            insert.bind(4, e.start_time);
            insert.bind(5, e.end_time);
            insert.bind(6, e.exit_code);
            insert.bind(7, e.folder);
            insert.bind(8, e.session_id);
            insert.exec();
            insert.reset();
        }
        tx.commit();
    } catch (const SQLite::Exception& e) {
        throw StorageFailure("Journal Write Error: " + std::string(e.what()));
    }
}

std::vector<Event> HistoryJournal::loadEvents(size_t& corrupt_records) {
    std::vector<Event> events;
    corrupt_records = 0;
    try {
        SQLite::Statement query(db_, "SELECT machine, sequence, command, start_time, end_time, "
                                     "exit_code, folder, session_id FROM events "
                                     "ORDER BY machine, sequence");
        while (query.executeStep()) {
            bool broken = false;
            for (int i = 0; i < 8; i++) {
                if (query.getColumn(i).isNull()) broken = true;
            }
            if (broken || query.getColumn(1).getInt64() <= 0) {
                corrupt_records++;
                continue;
            }

            Event e;
            e.machine = query.getColumn(0).getString();
            e.sequence = query.getColumn(1).getInt64();
            e.command = query.getColumn(2).getString();
            e.start_time = query.getColumn(3).getDouble();
            e.end_time = query.getColumn(4).getDouble();
            e.exit_code = query.getColumn(5).getInt();
            e.folder = query.getColumn(6).getString();
            e.session_id = query.getColumn(7).getString();
            events.push_back(std::move(e));
        }
    } catch (const SQLite::Exception& e) {
        throw StorageFailure("Journal Read Error: " + std::string(e.what()));
    }
    return events;
}

void HistoryJournal::checkpoint() {
    try {
        db_.exec("PRAGMA wal_checkpoint(TRUNCATE);");
    } catch (const SQLite::Exception& e) {
        throw StorageFailure("Journal Checkpoint Error: " + std::string(e.what()));
    }
}
