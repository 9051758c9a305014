#include "errors.hpp"
#include "journal.hpp"
#include "persistence.hpp"
#include "test_support.hpp"
#include <atomic>
#include <gtest/gtest.h>

namespace {

Event own_event(int64_t sequence, const std::string& command) {
    return foreign_event("m1", sequence, command, 100.0 + static_cast<double>(sequence));
}

}

TEST(JournalTest, IdentityIsCreatedOnceAndKept) {
    TempDir dir;
    MachineIdentity first;
    {
        HistoryJournal journal(dir.file("journal.db"));
        journal.initSchema();
        first = journal.identity("m1", 1234.5);
        EXPECT_EQ(first.machine_id, "m1");
        EXPECT_DOUBLE_EQ(first.created_at, 1234.5);
        EXPECT_EQ(first.token.size(), 8u);
    }

    HistoryJournal reopened(dir.file("journal.db"));
    reopened.initSchema();
    MachineIdentity second = reopened.identity("renamed-host", 9999);
    EXPECT_EQ(second.machine_id, "m1");
    EXPECT_EQ(second.token, first.token);
    EXPECT_EQ(second.fileName(), first.fileName());
}

TEST(JournalTest, AppendedEventsSurviveReopen) {
    TempDir dir;
    {
        HistoryJournal journal(dir.file("journal.db"));
        journal.initSchema();
        journal.appendEvents({own_event(1, "ls"), own_event(2, "make")});
        journal.appendEvents({foreign_event("m2", 1, "pwd", 50)});
    }

    HistoryJournal journal(dir.file("journal.db"));
    size_t corrupt = 99;
    auto events = journal.loadEvents(corrupt);
    EXPECT_EQ(corrupt, 0u);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(same_content(events[0], own_event(1, "ls")));
    EXPECT_EQ(events[2].machine, "m2");
}

TEST(JournalTest, DuplicateKeysAreIgnored) {
    TempDir dir;
    HistoryJournal journal(dir.file("journal.db"));
    journal.initSchema();
    journal.appendEvents({own_event(1, "ls")});
    journal.appendEvents({own_event(1, "something else"), own_event(2, "pwd")});

    size_t corrupt = 0;
    auto events = journal.loadEvents(corrupt);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].command, "ls");
}

TEST(JournalTest, ReadOnlyJournalSeesCommittedEvents) {
    TempDir dir;
    HistoryJournal writer(dir.file("journal.db"));
    writer.initSchema();
    writer.appendEvents({own_event(1, "ls")});

    HistoryJournal reader(dir.file("journal.db"), true);
    size_t corrupt = 0;
    EXPECT_EQ(reader.loadEvents(corrupt).size(), 1u);
    EXPECT_THROW(reader.appendEvents({own_event(2, "pwd")}), StorageFailure);
}

TEST(JournalTest, MissingReadOnlyJournalFails) {
    TempDir dir;
    EXPECT_THROW(HistoryJournal(dir.file("absent.db"), true), StorageFailure);
}

TEST(JournalTest, CheckpointKeepsContent) {
    TempDir dir;
    HistoryJournal journal(dir.file("journal.db"));
    journal.initSchema();
    journal.appendEvents({own_event(1, "ls")});
    journal.checkpoint();

    size_t corrupt = 0;
    EXPECT_EQ(journal.loadEvents(corrupt).size(), 1u);
}

TEST(PersistenceWriterTest, FlushWritesEverythingInOrder) {
    TempDir dir;
    HistoryJournal journal(dir.file("journal.db"));
    journal.initSchema();
    PersistenceWriter writer(journal, nullptr);

    for (int64_t i = 1; i <= 50; i++) writer.enqueue({own_event(i, "cmd " + std::to_string(i))});
    ASSERT_TRUE(writer.flush());
    EXPECT_EQ(writer.pending(), 0u);

    size_t corrupt = 0;
    auto events = journal.loadEvents(corrupt);
    ASSERT_EQ(events.size(), 50u);
    for (size_t i = 0; i < events.size(); i++) {
        EXPECT_EQ(events[i].sequence, static_cast<int64_t>(i + 1));
    }
}

TEST(PersistenceWriterTest, StopDrainsTheQueue) {
    TempDir dir;
    HistoryJournal journal(dir.file("journal.db"));
    journal.initSchema();
    {
        PersistenceWriter writer(journal, nullptr);
        writer.enqueue({own_event(1, "ls"), own_event(2, "pwd")});
        writer.stop();
    }
    size_t corrupt = 0;
    EXPECT_EQ(journal.loadEvents(corrupt).size(), 2u);
}

TEST(PersistenceWriterTest, StorageFailureIsReportedOnce) {
    TempDir dir;
    {
        HistoryJournal setup(dir.file("journal.db"));
        setup.initSchema();
    }
    HistoryJournal read_only(dir.file("journal.db"), true);

    std::atomic<int> failures{0};
    PersistenceWriter writer(read_only, [&failures](const std::string&) { failures++; });
    writer.enqueue({own_event(1, "ls")});

    EXPECT_FALSE(writer.flush());
    EXPECT_TRUE(writer.failed());
    EXPECT_EQ(failures.load(), 1);
    EXPECT_THROW(writer.checkpoint(), StorageFailure);

    writer.enqueue({own_event(2, "pwd")});
    EXPECT_FALSE(writer.flush());
    writer.stop();
    EXPECT_EQ(failures.load(), 1);
}
