#pragma once
#include "event.hpp"
#include "search.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Which events a navigation step may return: the session's own events, and
// everything that started before the session did (when session_start > 0).
struct NavigationScope {
    std::string session_id;
    double session_start = 0.0;
};

struct StoreStatistics {
    size_t total = 0;
    size_t own = 0;
    size_t failures = 0;
    double earliest = 0.0;
    double latest = 0.0;
    size_t key_conflicts = 0;  // merged events that reused a known key
    std::map<std::string, size_t> per_machine;
};

// In-memory history of every known machine. Mutations are serialized by one
// exclusive lock that is held for the index update only; queries copy their
// results out under a shared lock, so a streamed result never blocks writers.
class EventStore {
public:
    // Receives newly inserted events while the mutation lock is held, so
    // batches arrive in sequence order. Must not block.
    using PersistHook = std::function<void(std::vector<Event>)>;

    explicit EventStore(std::string own_machine, CommandFilter filter = CommandFilter());

    void setPersistHook(PersistHook hook);

    // Assigns the next sequence of the own machine and inserts the event.
    Event appendLocal(Event event);

    // Inserts the events of `machine` whose key is not present yet. Events of
    // another machine are ignored. Returns the number inserted; merging the
    // same events again inserts nothing.
    //
    // An event whose key is present with different content is a key conflict:
    // it is counted and logged. When `machine` is the own machine the event
    // comes from an earlier installation and is inserted under the next own
    // sequence instead, once.
    size_t mergeForeign(const std::string& machine, const std::vector<Event>& events);

    // Startup load of journal content. Does not call the persist hook.
    size_t restore(const std::vector<Event>& events);

    std::vector<Event> query(const SearchQuery& query) const;
    std::vector<AggregatedEvent> aggregate(const SearchQuery& query, double now,
                                           const AggregateScorer& scorer) const;

    // Closest matching event strictly before / after `reference` in display order.
    std::optional<Event> previousEvent(const NavigationScope& scope, const std::string& prefix,
                                       const EventOrder& reference) const;
    std::optional<Event> nextEvent(const NavigationScope& scope, const std::string& prefix,
                                   const EventOrder& reference) const;

    // Highest sequence such that every sequence up to it is present.
    int64_t watermark(const std::string& machine) const;
    int64_t maxSequence(const std::string& machine) const;

    bool contains(const EventKey& key) const;
    size_t size() const;
    std::vector<Event> eventsOf(const std::string& machine) const;
    std::vector<std::string> machines() const;
    StoreStatistics statistics() const;

private:
    using OrderIndex = std::set<std::pair<EventOrder, size_t>>;

    struct MachineState {
        std::map<int64_t, size_t> by_sequence;
        int64_t watermark = 0;
    };

    bool insertLocked(Event event);
    bool hasAdoptedLocked(const Event& event) const;
    bool matchesQuery(const Event& e, const SearchQuery& query) const;

    std::string own_machine_;
    CommandFilter filter_;
    PersistHook persist_;

    mutable std::shared_mutex mutex_;
    std::vector<Event> events_;
    std::unordered_map<EventKey, size_t, EventKeyHash> by_key_;
    OrderIndex by_recency_;
    std::unordered_map<std::string, OrderIndex> by_session_;
    std::unordered_map<std::string, OrderIndex> by_folder_;
    std::unordered_map<std::string, MachineState> machines_;
    size_t conflicts_ = 0;
};
