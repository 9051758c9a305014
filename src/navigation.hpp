#pragma once
#include "event.hpp"
#include "event_store.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Prefix history stepping of one shell session. The front-end keeps this
// struct between key presses and sends it with every step.
struct NavigationState {
    std::string session_id;
    double session_start = 0.0;

    bool armed = false;
    std::string prefix;
    // position of the event shown last; the armed origin uses the maximum
    // sequence so that events at that very instant are still reachable
    double reference_time = 0.0;
    int64_t reference_sequence = 0;
    std::string reference_machine;
    double armed_at = 0.0;

    EventOrder reference() const { return {reference_time, reference_sequence, reference_machine}; }
};

struct NavigationStep {
    bool moved = false;            // false: nothing matched, state unchanged
    std::optional<Event> event;    // empty when stepping back onto the prefix
    std::string buffer;            // what the command line shows afterwards
    NavigationState state;
};

// The user edited the buffer, ran a command or cancelled.
void reset_navigation(NavigationState& state);

NavigationStep step_previous(const EventStore& store, const NavigationState& state,
                             const std::string& buffer, size_t cursor, double now);
NavigationStep step_next(const EventStore& store, const NavigationState& state,
                         const std::string& buffer, size_t cursor, double now);

void to_json(nlohmann::json& j, const NavigationState& s);
void from_json(const nlohmann::json& j, NavigationState& s);
