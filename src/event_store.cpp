#include "event_store.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <mutex>

namespace {

constexpr int64_t SEQUENCE_MIN = std::numeric_limits<int64_t>::min();

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

}

EventStore::EventStore(std::string own_machine, CommandFilter filter)
    : own_machine_(std::move(own_machine)), filter_(std::move(filter)) {}

void EventStore::setPersistHook(PersistHook hook) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    persist_ = std::move(hook);
}

bool EventStore::insertLocked(Event event) {
    EventKey key = key_of(event);
    if (by_key_.count(key)) return false;

    size_t id = events_.size();
    EventOrder order = order_of(event);

    by_key_.emplace(key, id);
    by_recency_.emplace(order, id);
    by_session_[event.session_id].emplace(order, id);
    by_folder_[event.folder].emplace(order, id);

    MachineState& state = machines_[event.machine];
    state.by_sequence.emplace(event.sequence, id);
    auto it = state.by_sequence.find(state.watermark + 1);
    while (it != state.by_sequence.end() && it->first == state.watermark + 1) {
        state.watermark++;
        ++it;
    }

    events_.push_back(std::move(event));
    return true;
}

Event EventStore::appendLocal(Event event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    event.machine = own_machine_;
    auto it = machines_.find(own_machine_);
    int64_t last = (it == machines_.end() || it->second.by_sequence.empty())
                       ? 0 : it->second.by_sequence.rbegin()->first;
    event.sequence = last + 1;

    insertLocked(event);
    if (persist_) persist_({event});
    return event;
}

bool EventStore::hasAdoptedLocked(const Event& event) const {
    auto it = by_recency_.lower_bound({EventOrder{event.start_time, SEQUENCE_MIN, ""}, 0});
    for (; it != by_recency_.end() && it->first.start_time == event.start_time; ++it) {
        const Event& e = events_[it->second];
        if (e.machine != own_machine_ || e.sequence == event.sequence) continue;
        Event renumbered = event;
        renumbered.sequence = e.sequence;
        if (same_content(e, renumbered)) return true;
    }
    return false;
}

size_t EventStore::mergeForeign(const std::string& machine, const std::vector<Event>& events) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<Event> inserted;
    std::vector<Event> displaced;
    size_t conflicts = 0;
    for (const auto& e : events) {
        if (e.machine != machine || e.sequence <= 0) continue;

        auto existing = by_key_.find(key_of(e));
        if (existing == by_key_.end()) {
            insertLocked(e);
            inserted.push_back(e);
            continue;
        }
        if (same_content(events_[existing->second], e)) continue; // merged before

        // Two installations used the same key. An earlier installation of
        // this machine keeps its event under the next own sequence.
        if (machine == own_machine_) {
            if (hasAdoptedLocked(e)) continue;
            displaced.push_back(e);
        }
        conflicts++;
    }

    for (auto& e : displaced) {
        auto own = machines_.find(own_machine_);
        e.sequence = own->second.by_sequence.rbegin()->first + 1;
        insertLocked(e);
        inserted.push_back(std::move(e));
    }

    if (conflicts > 0) {
        conflicts_ += conflicts;
        std::cerr << "Merge Warning: " << conflicts << " events of '" << machine
                  << "' reuse a known key with different content";
        if (!displaced.empty()) std::cerr << ", " << displaced.size() << " kept under new sequences";
        std::cerr << std::endl;
    }

    size_t count = inserted.size();
    if (persist_ && count > 0) persist_(std::move(inserted));
    return count;
}

size_t EventStore::restore(const std::vector<Event>& events) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& e : events) {
        if (e.sequence > 0 && insertLocked(e)) count++;
    }
    return count;
}

bool EventStore::matchesQuery(const Event& e, const SearchQuery& query) const {
    if (!query.query_text.empty() && e.command.find(query.query_text) == std::string::npos) {
        return false;
    }
    if (query.success_only && !filter_.success(e.exit_code)) return false;
    return true;
}

std::vector<Event> EventStore::query(const SearchQuery& query) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const OrderIndex* index = &by_recency_;
    if (query.mode == SearchMode::SESSION || query.mode == SearchMode::FOLDER) {
        const auto& map = query.mode == SearchMode::SESSION ? by_session_ : by_folder_;
        const auto& wanted = query.mode == SearchMode::SESSION ? query.session_id : query.folder;
        auto it = map.find(wanted);
        if (it == map.end()) return {};
        index = &it->second;
    }

    // most recent first
    std::vector<Event> results;
    for (auto it = index->rbegin(); it != index->rend(); ++it) {
        const Event& e = events_[it->second];
        if (!matchesQuery(e, query)) continue;
        results.push_back(e);
        if (query.limit > 0 && results.size() >= query.limit) break;
    }
    return results;
}

std::vector<AggregatedEvent> EventStore::aggregate(const SearchQuery& query, double now,
                                                   const AggregateScorer& scorer) const {
    std::unordered_map<std::string, AggregatedEvent> groups;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        // oldest first, so the last event seen is the most recent one
        for (const auto& entry : by_recency_) {
            const Event& e = events_[entry.second];
            if (!matchesQuery(e, query)) continue;
            if (query.filter_ignored && filter_.ignored(e.command)) continue;

            AggregatedEvent& agg = groups[fingerprint(e)];
            agg.most_recent = e;
            agg.count++;
            if (!filter_.success(e.exit_code)) agg.failure_count++;
        }
    }

    struct Ranked {
        double score;
        AggregatedEvent agg;
    };
    std::vector<Ranked> ranked;
    ranked.reserve(groups.size());
    for (auto& g : groups) {
        if (query.filter_failed && g.second.failure_count == g.second.count) continue;
        double score = scorer(g.second, now);
        ranked.push_back({score, std::move(g.second)});
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.score != b.score) return a.score > b.score;
        EventOrder oa = order_of(a.agg.most_recent);
        EventOrder ob = order_of(b.agg.most_recent);
        if (oa < ob || ob < oa) return ob < oa;
        return a.agg.most_recent.command < b.agg.most_recent.command;
    });

    std::vector<AggregatedEvent> results;
    for (auto& r : ranked) {
        results.push_back(std::move(r.agg));
        if (query.limit > 0 && results.size() >= query.limit) break;
    }
    return results;
}

std::optional<Event> EventStore::previousEvent(const NavigationScope& scope, const std::string& prefix,
                                               const EventOrder& reference) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::optional<std::pair<EventOrder, size_t>> best;
    auto search = [&](const OrderIndex& index, const EventOrder& before) {
        auto it = index.lower_bound({before, 0});
        while (it != index.begin()) {
            --it;
            if (starts_with(events_[it->second].command, prefix)) {
                if (!best || best->first < it->first) best = *it;
                return;
            }
        }
    };

    auto session = by_session_.find(scope.session_id);
    if (session != by_session_.end()) search(session->second, reference);

    if (scope.session_start > 0.0) {
        // everything below the session start is in scope
        EventOrder bound{scope.session_start, SEQUENCE_MIN, ""};
        search(by_recency_, reference < bound ? reference : bound);
    }

    if (!best) return std::nullopt;
    return events_[best->second];
}

std::optional<Event> EventStore::nextEvent(const NavigationScope& scope, const std::string& prefix,
                                           const EventOrder& reference) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::optional<std::pair<EventOrder, size_t>> best;
    auto search = [&](const OrderIndex& index, const EventOrder* until) {
        auto it = index.upper_bound({reference, std::numeric_limits<size_t>::max()});
        for (; it != index.end(); ++it) {
            if (until && !(it->first < *until)) return;
            if (starts_with(events_[it->second].command, prefix)) {
                if (!best || it->first < best->first) best = *it;
                return;
            }
        }
    };

    auto session = by_session_.find(scope.session_id);
    if (session != by_session_.end()) search(session->second, nullptr);

    if (scope.session_start > 0.0) {
        EventOrder bound{scope.session_start, SEQUENCE_MIN, ""};
        search(by_recency_, &bound);
    }

    if (!best) return std::nullopt;
    return events_[best->second];
}

int64_t EventStore::watermark(const std::string& machine) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = machines_.find(machine);
    return it == machines_.end() ? 0 : it->second.watermark;
}

int64_t EventStore::maxSequence(const std::string& machine) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = machines_.find(machine);
    if (it == machines_.end() || it->second.by_sequence.empty()) return 0;
    return it->second.by_sequence.rbegin()->first;
}

bool EventStore::contains(const EventKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_key_.count(key) > 0;
}

size_t EventStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return events_.size();
}

std::vector<Event> EventStore::eventsOf(const std::string& machine) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Event> out;
    auto it = machines_.find(machine);
    if (it == machines_.end()) return out;
    out.reserve(it->second.by_sequence.size());
    for (const auto& entry : it->second.by_sequence) out.push_back(events_[entry.second]);
    return out;
}

std::vector<std::string> EventStore::machines() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& m : machines_) out.push_back(m.first);
    std::sort(out.begin(), out.end());
    return out;
}

StoreStatistics EventStore::statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    StoreStatistics stats;
    stats.total = events_.size();
    stats.key_conflicts = conflicts_;
    for (const auto& m : machines_) stats.per_machine[m.first] = m.second.by_sequence.size();
    auto own = machines_.find(own_machine_);
    if (own != machines_.end()) stats.own = own->second.by_sequence.size();
    for (const auto& e : events_) {
        if (!filter_.success(e.exit_code)) stats.failures++;
    }
    if (!by_recency_.empty()) {
        stats.earliest = by_recency_.begin()->first.start_time;
        stats.latest = by_recency_.rbegin()->first.start_time;
    }
    return stats;
}
