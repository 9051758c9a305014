#pragma once
#include "config.hpp"
#include "event.hpp"
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

enum class SearchMode { ALL, SESSION, FOLDER, AGGREGATED_UNIQUE };

std::optional<SearchMode> parse_search_mode(const std::string& name);
const char* to_string(SearchMode mode);

struct SearchQuery {
    SearchMode mode = SearchMode::ALL;
    std::string query_text;     // substring of the command
    std::string session_id;     // SESSION
    std::string folder;         // FOLDER
    bool success_only = false;
    bool filter_failed = false;  // AGGREGATED_UNIQUE: drop commands that never succeeded
    bool filter_ignored = true;  // AGGREGATED_UNIQUE: apply ignore_commands / ignore_patterns
    size_t limit = 0;            // 0: no cap
    std::string scorer = "recency";
};

// Ranking of the aggregated view; higher scores come first. Ties are broken
// by recency, then by command text.
using AggregateScorer = std::function<double(const AggregatedEvent&, double now)>;

AggregateScorer recency_scorer();
AggregateScorer frequency_scorer();
// count weighted by an exponential decay of the last use
AggregateScorer frecency_scorer(double half_life_seconds = 7 * 24 * 3600.0);
std::optional<AggregateScorer> scorer_by_name(const std::string& name);

// Commands longer than this are never matched against ignore_patterns;
// std::regex recursion depth grows with the input length.
constexpr size_t IGNORE_PATTERN_MAX_LENGTH = 4096;

class CommandFilter {
public:
    CommandFilter() = default;
    explicit CommandFilter(const Config& config);

    bool ignored(const std::string& command) const;
    bool success(int exit_code) const;

private:
    std::vector<std::string> ignore_commands_;
    std::vector<std::regex> ignore_patterns_;
    std::vector<int> success_codes_{0};
};
