#include "event.hpp"
#include <chrono>
#include <tuple>

bool EventOrder::operator<(const EventOrder& other) const {
    return std::tie(start_time, sequence, machine) <
           std::tie(other.start_time, other.sequence, other.machine);
}

bool same_content(const Event& a, const Event& b) {
    return a.command == b.command && a.start_time == b.start_time &&
           a.end_time == b.end_time && a.exit_code == b.exit_code &&
           a.folder == b.folder && a.machine == b.machine &&
           a.session_id == b.session_id && a.sequence == b.sequence;
}

std::string fingerprint(const Event& e) {
    // \x1F cannot be typed into a shell prompt, so it never collides
    std::string fp;
    fp.reserve(e.command.size() + e.folder.size() + e.machine.size() + 2);
    fp += e.command;
    fp += '\x1F';
    fp += e.folder;
    fp += '\x1F';
    fp += e.machine;
    return fp;
}

double now_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const Event& e) {
    j = nlohmann::json{
        {"command", e.command},
        {"start_time", e.start_time},
        {"end_time", e.end_time},
        {"exit_code", e.exit_code},
        {"folder", e.folder},
        {"machine", e.machine},
        {"session_id", e.session_id},
        {"sequence", e.sequence},
    };
}

// Throws nlohmann::json::exception on missing or mistyped fields.
void from_json(const nlohmann::json& j, Event& e) {
    j.at("command").get_to(e.command);
    j.at("start_time").get_to(e.start_time);
    j.at("end_time").get_to(e.end_time);
    j.at("exit_code").get_to(e.exit_code);
    j.at("folder").get_to(e.folder);
    j.at("machine").get_to(e.machine);
    j.at("session_id").get_to(e.session_id);
    j.at("sequence").get_to(e.sequence);
}

void to_json(nlohmann::json& j, const AggregatedEvent& a) {
    j = nlohmann::json{
        {"event", a.most_recent},
        {"count", a.count},
        {"failure_count", a.failure_count},
        {"failure_ratio", a.failure_ratio()},
    };
}
