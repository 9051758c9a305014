#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>

struct Event {
    std::string command;
    double start_time = 0.0;
    double end_time = 0.0;
    int exit_code = 0;
    std::string folder;
    std::string machine;
    std::string session_id;
    int64_t sequence = 0;

    double duration() const { return end_time - start_time; }
};

// Global identity of an event. Never derived from timestamps.
struct EventKey {
    std::string machine;
    int64_t sequence = 0;

    bool operator==(const EventKey& other) const {
        return sequence == other.sequence && machine == other.machine;
    }
};

struct EventKeyHash {
    size_t operator()(const EventKey& key) const {
        size_t h = std::hash<std::string>()(key.machine);
        return h ^ (std::hash<int64_t>()(key.sequence) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

inline EventKey key_of(const Event& e) { return {e.machine, e.sequence}; }

// Display order: start_time ascending, then sequence, then machine so that
// events from different machines never compare equal.
struct EventOrder {
    double start_time = 0.0;
    int64_t sequence = 0;
    std::string machine;

    bool operator<(const EventOrder& other) const;
};

inline EventOrder order_of(const Event& e) { return {e.start_time, e.sequence, e.machine}; }

bool same_content(const Event& a, const Event& b);

// Collapses repeated command+folder+machine occurrences for the aggregated view.
std::string fingerprint(const Event& e);

struct AggregatedEvent {
    Event most_recent;
    int64_t count = 0;
    int64_t failure_count = 0;

    double failure_ratio() const {
        return count == 0 ? 0.0 : static_cast<double>(failure_count) / static_cast<double>(count);
    }
};

// Wall clock in fractional seconds since the epoch.
double now_seconds();

void to_json(nlohmann::json& j, const Event& e);
void from_json(const nlohmann::json& j, Event& e);
void to_json(nlohmann::json& j, const AggregatedEvent& a);
