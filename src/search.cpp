#include "search.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

std::optional<SearchMode> parse_search_mode(const std::string& name) {
    if (name == "all") return SearchMode::ALL;
    if (name == "session") return SearchMode::SESSION;
    if (name == "folder") return SearchMode::FOLDER;
    if (name == "aggregated-unique" || name == "aggregated") return SearchMode::AGGREGATED_UNIQUE;
    return std::nullopt;
}

const char* to_string(SearchMode mode) {
    switch (mode) {
        case SearchMode::ALL: return "all";
        case SearchMode::SESSION: return "session";
        case SearchMode::FOLDER: return "folder";
        case SearchMode::AGGREGATED_UNIQUE: return "aggregated-unique";
    }
    return "all";
}

AggregateScorer recency_scorer() {
    return [](const AggregatedEvent& a, double) { return a.most_recent.start_time; };
}

AggregateScorer frequency_scorer() {
    return [](const AggregatedEvent& a, double) { return static_cast<double>(a.count); };
}

AggregateScorer frecency_scorer(double half_life_seconds) {
    return [half_life_seconds](const AggregatedEvent& a, double now) {
        double age = std::max(0.0, now - a.most_recent.start_time);
        return static_cast<double>(a.count) * std::exp2(-age / half_life_seconds);
    };
}

std::optional<AggregateScorer> scorer_by_name(const std::string& name) {
    if (name.empty() || name == "recency") return recency_scorer();
    if (name == "frequency") return frequency_scorer();
    if (name == "frecency") return frecency_scorer();
    return std::nullopt;
}

CommandFilter::CommandFilter(const Config& config)
    : ignore_commands_(config.ignore_commands), success_codes_(config.success_codes) {
    for (const auto& pattern : config.ignore_patterns) {
        try {
            ignore_patterns_.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            std::cerr << "Config Warning: bad ignore pattern '" << pattern << "': " << e.what() << std::endl;
        }
    }
}

bool CommandFilter::ignored(const std::string& command) const {
    if (std::find(ignore_commands_.begin(), ignore_commands_.end(), command) != ignore_commands_.end()) {
        return true;
    }
    if (command.size() > IGNORE_PATTERN_MAX_LENGTH) return false;
    for (const auto& pattern : ignore_patterns_) {
        if (std::regex_match(command, pattern)) return true;
    }
    return false;
}

bool CommandFilter::success(int exit_code) const {
    return std::find(success_codes_.begin(), success_codes_.end(), exit_code) != success_codes_.end();
}
