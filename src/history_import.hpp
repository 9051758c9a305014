#pragma once
#include "event.hpp"
#include "event_store.hpp"
#include <istream>
#include <string>
#include <vector>

const char* const IMPORT_SESSION = "zsh-import";

struct ImportResult {
    size_t imported = 0;
    size_t duplicates = 0;
    size_t unparsable = 0;
};

// Parses zsh EXTENDED_HISTORY lines ": <start>:<duration>;<command>". A
// trailing backslash continues the command on the next line. Events carry no
// machine or sequence yet.
std::vector<Event> parse_zsh_history(std::istream& in, size_t& unparsable);

// Appends the events as own events of the import session, oldest first.
// Events whose start time and command are already imported are skipped.
ImportResult import_events(EventStore& store, std::vector<Event> events);
