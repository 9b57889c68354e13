#include "anchorlog/rest_remote_store.hpp"
#include "anchorlog/errors.hpp"
#include "anchorlog/log.hpp"
#include "json_codec.hpp"

namespace anchorlog {

namespace {

std::string id_filter(const uuid_t& id) {
    return "id=eq." + id.to_string();
}

std::string greater_than(const char* column, timestamp_t t) {
    return std::string(column) + "=gt." + std::to_string(to_unix_nanos(t));
}

std::string less_than(const char* column, timestamp_t t) {
    return std::string(column) + "=lt." + std::to_string(to_unix_nanos(t));
}

// Decodes a JSON array body with `decode`, mapping every failure to remote_error.
template<typename T, typename F>
std::vector<T> decode_rows(const std::string& body, const char* op, F&& decode) {
    auto parsed = detail::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        throw remote_error(std::string(op) + ": response is not a JSON array");
    }
    std::vector<T> rows;
    rows.reserve(parsed.size());
    try {
        for (const auto& item : parsed) {
            rows.push_back(decode(item));
        }
    } catch (const storage_error& e) {
        throw remote_error(std::string(op) + ": " + e.what());
    }
    return rows;
}

template<typename T>
std::optional<T> first_row(std::vector<T> rows) {
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

} // namespace

rest_remote_store::rest_remote_store(rest_config config, std::shared_ptr<http_client> client)
    : config_(std::move(config)), client_(std::move(client)) {
    if (!client_) {
        client_ = std::make_shared<null_http_client>();
    }
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

http_request rest_remote_store::make_request(const std::string& method, const std::string& table,
                                             const std::string& query) const {
    http_request req;
    req.method = method;
    req.url = config_.base_url + "/rest/v1/" + table;
    if (!query.empty()) {
        req.url += "?" + query;
    }
    req.headers["apikey"] = config_.api_key;
    req.headers["Authorization"] = "Bearer " + config_.api_key;
    req.headers["Accept"] = "application/json";
    return req;
}

http_response rest_remote_store::perform(const http_request& request, const char* op) {
    auto response = client_->send(request);
    if (!response.is_success()) {
        LOG_DEBUG("rest", "%s %s -> %d", request.method.c_str(), request.url.c_str(), response.status_code);
        throw remote_error(std::string(op) + " failed with status " + std::to_string(response.status_code),
                           response.status_code);
    }
    return response;
}

void rest_remote_store::upsert(const std::string& table, const std::string& json_body) {
    auto req = make_request("POST", table);
    req.headers["Prefer"] = "resolution=merge-duplicates";
    req.set_json_body(json_body);
    perform(req, "upsert");
}

std::string rest_remote_store::fetch(const std::string& table, const std::string& query, const char* op) {
    return perform(make_request("GET", table, query), op).body_string();
}

void rest_remote_store::remove_where(const std::string& table, const std::string& query, const char* op) {
    perform(make_request("DELETE", table, query), op);
}

// ============================================================================
// Spaces
// ============================================================================

void rest_remote_store::upload_space(const stored_space& s) {
    upsert(config_.spaces_table, detail::stored_space_to_json(s).dump());
}

std::optional<stored_space> rest_remote_store::download_space(const uuid_t& id) {
    auto body = fetch(config_.spaces_table, id_filter(id), "download_space");
    return first_row(decode_rows<stored_space>(body, "download_space", detail::stored_space_from_json));
}

std::vector<stored_space> rest_remote_store::list_spaces_modified_since(timestamp_t since) {
    auto body = fetch(config_.spaces_table, greater_than("updatedAt", since), "list_spaces");
    return decode_rows<stored_space>(body, "list_spaces", detail::stored_space_from_json);
}

void rest_remote_store::remove_space(const uuid_t& id) {
    remove_where(config_.spaces_table, id_filter(id), "remove_space");
}

// ============================================================================
// Anchors
// ============================================================================

void rest_remote_store::upload_anchor(const anchor& a) {
    upsert(config_.anchors_table, detail::anchor_to_json(a).dump());
}

std::optional<anchor> rest_remote_store::download_anchor(const uuid_t& id) {
    auto body = fetch(config_.anchors_table, id_filter(id), "download_anchor");
    return first_row(decode_rows<anchor>(body, "download_anchor", detail::anchor_from_json));
}

std::vector<anchor> rest_remote_store::list_anchors_modified_since(timestamp_t since) {
    auto body = fetch(config_.anchors_table, greater_than("updatedAt", since), "list_anchors");
    return decode_rows<anchor>(body, "list_anchors", detail::anchor_from_json);
}

void rest_remote_store::remove_anchor(const uuid_t& id) {
    remove_where(config_.anchors_table, id_filter(id), "remove_anchor");
}

void rest_remote_store::remove_anchors_deleted_before(timestamp_t before) {
    remove_where(config_.anchors_table, less_than("deletedAt", before), "purge_anchors");
}

// ============================================================================
// Events
// ============================================================================

void rest_remote_store::upload_event(const anchor_event& e) {
    upsert(config_.events_table, detail::event_to_json(e).dump());
}

std::optional<anchor_event> rest_remote_store::download_event(const uuid_t& id) {
    auto body = fetch(config_.events_table, id_filter(id), "download_event");
    return first_row(decode_rows<anchor_event>(body, "download_event", detail::event_from_json));
}

std::vector<anchor_event> rest_remote_store::list_events_modified_since(timestamp_t since) {
    auto body = fetch(config_.events_table, greater_than("updatedAt", since), "list_events");
    return decode_rows<anchor_event>(body, "list_events", detail::event_from_json);
}

void rest_remote_store::remove_event(const uuid_t& id) {
    remove_where(config_.events_table, id_filter(id), "remove_event");
}

void rest_remote_store::remove_events_older_than(timestamp_t before) {
    remove_where(config_.events_table, less_than("timestamp", before), "purge_events");
}

} // namespace anchorlog
