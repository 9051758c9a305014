#include "history_import.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>

TEST(HistoryImportTest, ParsesExtendedHistory) {
    std::istringstream in(": 1700000000:0;ls -la\n"
                          ": 1700000010:3;make\n"
                          "plain line without timestamp\n"
                          "\n"
                          ": 1700000020:1;echo one \\\n"
                          "two\n");
    size_t unparsable = 0;
    auto events = parse_zsh_history(in, unparsable);

    EXPECT_EQ(unparsable, 1u);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].command, "ls -la");
    EXPECT_EQ(events[0].start_time, 1700000000);
    EXPECT_EQ(events[1].end_time, 1700000013);
    EXPECT_EQ(events[1].duration(), 3);
    EXPECT_EQ(events[2].command, "echo one \ntwo");
    EXPECT_EQ(events[2].session_id, IMPORT_SESSION);
}

TEST(HistoryImportTest, VeryLongCommandLineIsParsed) {
    std::string blob(200 * 1024, 'x');
    std::istringstream in(": 1700000000:0;echo " + blob + "\n"
                          ": 1700000005:0;pwd\n"
                          ": 17000x0000:0;not a timestamp\n");
    size_t unparsable = 0;
    auto events = parse_zsh_history(in, unparsable);

    EXPECT_EQ(unparsable, 1u);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].command.size(), blob.size() + 5);
    EXPECT_EQ(events[1].command, "pwd");
}

TEST(HistoryImportTest, ImportAppendsOldestFirst) {
    EventStore store("m1");
    store.appendLocal(make_event("already here", 5));

    std::vector<Event> events = {make_event("second", 20), make_event("first", 10)};
    ImportResult result = import_events(store, events);
    EXPECT_EQ(result.imported, 2u);

    auto own = store.eventsOf("m1");
    ASSERT_EQ(own.size(), 3u);
    EXPECT_EQ(own[1].command, "first");
    EXPECT_EQ(own[1].sequence, 2);
    EXPECT_EQ(own[1].session_id, IMPORT_SESSION);
    EXPECT_EQ(own[2].command, "second");
}

TEST(HistoryImportTest, ImportingTwiceAddsNothing) {
    EventStore store("m1");
    std::istringstream history(": 100:0;ls\n: 200:0;pwd\n: 200:0;pwd\n");
    size_t unparsable = 0;
    auto events = parse_zsh_history(history, unparsable);

    ImportResult first = import_events(store, events);
    EXPECT_EQ(first.imported, 2u);
    EXPECT_EQ(first.duplicates, 1u);

    ImportResult second = import_events(store, events);
    EXPECT_EQ(second.imported, 0u);
    EXPECT_EQ(second.duplicates, 3u);
    EXPECT_EQ(store.size(), 2u);
}
