#pragma once

#ifdef __cplusplus

#include "network.hpp"
#include "remote_store.hpp"
#include <memory>
#include <string>

namespace anchorlog {

/// Connection settings for a PostgREST-style backend.
struct rest_config {
    std::string base_url;          // e.g. "https://project.example.co"
    std::string api_key;           // sent as apikey and Bearer token
    std::string spaces_table = "spaces";
    std::string anchors_table = "anchors";
    std::string events_table = "anchor_events";
};

// ============================================================================
// rest_remote_store - remote_store over PostgREST JSON endpoints
// ============================================================================
//
//   upsert   POST   /rest/v1/<table>                 Prefer: resolution=merge-duplicates
//   fetch    GET    /rest/v1/<table>?id=eq.<id>
//   list     GET    /rest/v1/<table>?updatedAt=gt.<nanos>
//   delete   DELETE /rest/v1/<table>?id=eq.<id>
//   purge    DELETE /rest/v1/<table>?<column>=lt.<nanos>
//
// Non-2xx responses and undecodable bodies raise remote_error.

class rest_remote_store : public remote_store {
public:
    rest_remote_store(rest_config config, std::shared_ptr<http_client> client);

    void upload_space(const stored_space& s) override;
    std::optional<stored_space> download_space(const uuid_t& id) override;
    std::vector<stored_space> list_spaces_modified_since(timestamp_t since) override;
    void remove_space(const uuid_t& id) override;

    void upload_anchor(const anchor& a) override;
    std::optional<anchor> download_anchor(const uuid_t& id) override;
    std::vector<anchor> list_anchors_modified_since(timestamp_t since) override;
    void remove_anchor(const uuid_t& id) override;
    void remove_anchors_deleted_before(timestamp_t before) override;

    void upload_event(const anchor_event& e) override;
    std::optional<anchor_event> download_event(const uuid_t& id) override;
    std::vector<anchor_event> list_events_modified_since(timestamp_t since) override;
    void remove_event(const uuid_t& id) override;
    void remove_events_older_than(timestamp_t before) override;

    const rest_config& config() const { return config_; }

private:
    rest_config config_;
    std::shared_ptr<http_client> client_;

    http_request make_request(const std::string& method, const std::string& table,
                              const std::string& query = {}) const;
    http_response perform(const http_request& request, const char* op);
    void upsert(const std::string& table, const std::string& json_body);
    /// GET returning the response body (a JSON array).
    std::string fetch(const std::string& table, const std::string& query, const char* op);
    void remove_where(const std::string& table, const std::string& query, const char* op);
};

} // namespace anchorlog

#endif // __cplusplus
