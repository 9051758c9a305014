#include "navigation.hpp"
#include <algorithm>
#include <limits>

namespace {

constexpr int64_t ORIGIN_SEQUENCE = std::numeric_limits<int64_t>::max();

void move_to_origin(NavigationState& s) {
    s.reference_time = s.armed_at;
    s.reference_sequence = ORIGIN_SEQUENCE;
    s.reference_machine.clear();
}

bool at_origin(const NavigationState& s) {
    return s.reference_sequence == ORIGIN_SEQUENCE && s.reference_machine.empty() &&
           s.reference_time == s.armed_at;
}

NavigationState armed_copy(const NavigationState& state, const std::string& buffer,
                           size_t cursor, double now) {
    NavigationState s = state;
    if (!s.armed) {
        s.armed = true;
        s.prefix = buffer.substr(0, std::min(cursor, buffer.size()));
        s.armed_at = now;
        move_to_origin(s);
    }
    return s;
}

void move_to(NavigationState& s, const Event& e) {
    s.reference_time = e.start_time;
    s.reference_sequence = e.sequence;
    s.reference_machine = e.machine;
}

}

void reset_navigation(NavigationState& state) {
    state.armed = false;
    state.prefix.clear();
    state.reference_time = 0.0;
    state.reference_sequence = 0;
    state.reference_machine.clear();
    state.armed_at = 0.0;
}

NavigationStep step_previous(const EventStore& store, const NavigationState& state,
                             const std::string& buffer, size_t cursor, double now) {
    NavigationState s = armed_copy(state, buffer, cursor, now);
    NavigationScope scope{s.session_id, s.session_start};

    NavigationStep step;
    auto event = store.previousEvent(scope, s.prefix, s.reference());
    if (!event) {
        step.buffer = buffer;
        step.state = state;
        return step;
    }

    move_to(s, *event);
    step.moved = true;
    step.buffer = event->command;
    step.event = std::move(event);
    step.state = s;
    return step;
}

NavigationStep step_next(const EventStore& store, const NavigationState& state,
                         const std::string& buffer, size_t cursor, double now) {
    NavigationState s = armed_copy(state, buffer, cursor, now);
    NavigationScope scope{s.session_id, s.session_start};

    NavigationStep step;
    auto event = store.nextEvent(scope, s.prefix, s.reference());
    if (event) {
        move_to(s, *event);
        step.moved = true;
        step.buffer = event->command;
        step.event = std::move(event);
        step.state = s;
        return step;
    }

    if (state.armed && !at_origin(s)) {
        // past the newest match: back to what the user typed
        move_to_origin(s);
        step.moved = true;
        step.buffer = s.prefix;
        step.state = s;
        return step;
    }

    step.buffer = buffer;
    step.state = state;
    return step;
}

void to_json(nlohmann::json& j, const NavigationState& s) {
    j = nlohmann::json{
        {"session_id", s.session_id},
        {"session_start", s.session_start},
        {"armed", s.armed},
        {"prefix", s.prefix},
        {"reference_time", s.reference_time},
        {"reference_sequence", s.reference_sequence},
        {"reference_machine", s.reference_machine},
        {"armed_at", s.armed_at},
    };
}

void from_json(const nlohmann::json& j, NavigationState& s) {
    j.at("session_id").get_to(s.session_id);
    s.session_start = j.value("session_start", 0.0);
    s.armed = j.value("armed", false);
    s.prefix = j.value("prefix", std::string());
    s.reference_time = j.value("reference_time", 0.0);
    s.reference_sequence = j.value("reference_sequence", static_cast<int64_t>(0));
    s.reference_machine = j.value("reference_machine", std::string());
    s.armed_at = j.value("armed_at", 0.0);
}
