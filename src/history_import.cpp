#include "history_import.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

bool all_digits(const std::string& text, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; i++) {
        if (text[i] < '0' || text[i] > '9') return false;
    }
    return true;
}

// ": <start>:<elapsed>;<command>", scanned by hand so that command length
// does not matter.
bool parse_header(const std::string& line, Event& e) {
    if (line.compare(0, 2, ": ") != 0) return false;
    size_t colon = line.find(':', 2);
    if (colon == std::string::npos) return false;
    size_t semicolon = line.find(';', colon + 1);
    if (semicolon == std::string::npos) return false;
    if (!all_digits(line, 2, colon) || !all_digits(line, colon + 1, semicolon)) return false;

    try {
        e.start_time = static_cast<double>(std::stoll(line.substr(2, colon - 2)));
        e.end_time = e.start_time + static_cast<double>(std::stoll(line.substr(colon + 1, semicolon - colon - 1)));
    } catch (const std::out_of_range&) {
        return false;
    }
    e.command = line.substr(semicolon + 1);
    return true;
}

}

std::vector<Event> parse_zsh_history(std::istream& in, size_t& unparsable) {
    std::vector<Event> events;
    unparsable = 0;
    std::string line;

    while (std::getline(in, line)) {
        Event e;
        if (!parse_header(line, e)) {
            if (!line.empty()) unparsable++;
            continue;
        }

        // multi-line commands are stored with a trailing backslash per line
        while (!e.command.empty() && e.command.back() == '\\') {
            std::string next;
            if (!std::getline(in, next)) break;
            e.command.pop_back();
            e.command += '\n';
            e.command += next;
        }

        e.session_id = IMPORT_SESSION;
        e.exit_code = 0;
        events.push_back(std::move(e));
    }
    return events;
}

ImportResult import_events(EventStore& store, std::vector<Event> events) {
    ImportResult result;

    SearchQuery existing_query;
    existing_query.mode = SearchMode::SESSION;
    existing_query.session_id = IMPORT_SESSION;

    std::set<std::pair<double, std::string>> known;
    for (const auto& e : store.query(existing_query)) {
        known.emplace(e.start_time, e.command);
    }

    std::stable_sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
        return a.start_time < b.start_time;
    });

    for (auto& e : events) {
        if (!known.emplace(e.start_time, e.command).second) {
            result.duplicates++;
            continue;
        }
        e.session_id = IMPORT_SESSION;
        store.appendLocal(std::move(e));
        result.imported++;
    }
    return result;
}
