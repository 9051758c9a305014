#include "protocol.hpp"
#include "errors.hpp"

nlohmann::json make_request(const char* name) {
    return nlohmann::json{{"op", name}};
}

nlohmann::json ok_response() {
    return nlohmann::json{{"ok", true}};
}

nlohmann::json error_response(const std::string& kind, const std::string& message) {
    return nlohmann::json{{"ok", false}, {"error", kind}, {"message", message}};
}

Event parse_append_request(const nlohmann::json& request) {
    try {
        Event e;
        request.at("command").get_to(e.command);
        request.at("start_time").get_to(e.start_time);
        e.end_time = request.value("end_time", e.start_time);
        e.exit_code = request.value("exit_code", 0);
        e.folder = request.value("folder", std::string());
        e.machine = request.value("machine", std::string());
        request.at("session_id").get_to(e.session_id);
        return e;
    } catch (const nlohmann::json::exception& e) {
        throw MalformedRequest(std::string("append-event: ") + e.what());
    }
}

SearchQuery parse_search_query(const nlohmann::json& request) {
    SearchQuery q;
    try {
        std::string mode = request.value("mode", std::string("all"));
        auto parsed = parse_search_mode(mode);
        if (!parsed) throw MalformedRequest("unknown search mode '" + mode + "'");
        q.mode = *parsed;
        q.query_text = request.value("query", std::string());
        q.session_id = request.value("session_id", std::string());
        q.folder = request.value("folder", std::string());
        q.success_only = request.value("success_only", false);
        q.filter_failed = request.value("filter_failed", false);
        q.filter_ignored = request.value("filter_ignored", true);
        q.limit = request.value("limit", static_cast<size_t>(0));
        q.scorer = request.value("scorer", std::string("recency"));
    } catch (const nlohmann::json::exception& e) {
        throw MalformedRequest(std::string("search: ") + e.what());
    }
    return q;
}

void add_search_query(nlohmann::json& request, const SearchQuery& query) {
    request["mode"] = to_string(query.mode);
    request["query"] = query.query_text;
    if (!query.session_id.empty()) request["session_id"] = query.session_id;
    if (!query.folder.empty()) request["folder"] = query.folder;
    request["success_only"] = query.success_only;
    request["filter_failed"] = query.filter_failed;
    request["filter_ignored"] = query.filter_ignored;
    request["limit"] = query.limit;
    request["scorer"] = query.scorer;
}

void to_json(nlohmann::json& j, const SyncReport& r) {
    j = nlohmann::json{
        {"root_available", r.root_available},
        {"files_seen", r.files_seen},
        {"files_read", r.files_read},
        {"files_unchanged", r.files_unchanged},
        {"files_failed", r.files_failed},
        {"events_merged", r.events_merged},
        {"corrupt_records", r.corrupt_records},
        {"published", r.published},
        {"committed", r.committed},
        {"error", r.error},
    };
}

void to_json(nlohmann::json& j, const ImportResult& r) {
    j = nlohmann::json{{"imported", r.imported}, {"duplicates", r.duplicates}, {"unparsable", r.unparsable}};
}

std::string encode_message(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
