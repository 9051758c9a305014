#pragma once
#include "event.hpp"
#include "history_import.hpp"
#include "search.hpp"
#include "sync_engine.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Request names on the control socket.
namespace op {
const char* const APPEND_EVENT = "append-event";
const char* const SEARCH = "search";
const char* const PREVIOUS_EVENT = "previous-event";
const char* const NEXT_EVENT = "next-event";
const char* const STATUS = "status";
const char* const IS_ALIVE = "is-alive";
const char* const STOP = "stop";
const char* const SYNC_NOW = "sync-now";
const char* const IMPORT_HISTORY = "import-history";
}

const char* const SERVICE_NAME = "shistd";

// Error kinds in {"ok":false,"error":<kind>}.
const char* const ERR_MALFORMED = "malformed-request";
const char* const ERR_STORAGE = "storage-failure";
const char* const ERR_INTERNAL = "internal";

nlohmann::json make_request(const char* name);
nlohmann::json ok_response();
nlohmann::json error_response(const std::string& kind, const std::string& message);

// Throw MalformedRequest on missing or mistyped fields.
Event parse_append_request(const nlohmann::json& request);
SearchQuery parse_search_query(const nlohmann::json& request);

void add_search_query(nlohmann::json& request, const SearchQuery& query);

void to_json(nlohmann::json& j, const SyncReport& r);
void to_json(nlohmann::json& j, const ImportResult& r);

// Single-line encoding; invalid UTF-8 in commands is replaced, not rejected.
std::string encode_message(const nlohmann::json& message);
