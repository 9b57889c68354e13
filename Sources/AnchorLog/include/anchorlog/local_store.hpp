#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "models.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anchorlog {

// ============================================================================
// local_store - durable SQLite record store, the source of truth
// ============================================================================
//
// Every write runs in its own transaction. Reads of a missing record return
// nullopt. SQLite failures surface as db_error. Assumes one logical writer;
// the internal mutex only serializes threads sharing this instance.

class local_store {
public:
    /// Opens (creating if needed) the store at `path`; ":memory:" is ephemeral.
    explicit local_store(const std::string& path = ":memory:");

    local_store(const local_store&) = delete;
    local_store& operator=(const local_store&) = delete;

    // Spaces
    void save_space(const stored_space& s);
    std::optional<stored_space> load_space(const uuid_t& id);
    std::vector<stored_space> load_all_spaces();
    std::vector<stored_space> load_spaces_modified_since(timestamp_t since);
    /// Removes the space and its anchors. Events are kept.
    void delete_space(const uuid_t& id);

    // Anchors
    void save_anchor(const anchor& a);
    std::optional<anchor> load_anchor(const uuid_t& id);
    std::vector<anchor> load_anchors(const uuid_t& space_id);
    std::vector<anchor> load_all_anchors();
    std::vector<anchor> load_anchors_modified_since(timestamp_t since);
    /// Hard-deletes anchors soft-deleted strictly before `before`. Returns the count.
    size_t purge_deleted_anchors(timestamp_t before);

    // Event log
    void append_event(const anchor_event& e);
    /// Appends `events` in order and writes the snapshot in one transaction.
    void commit_anchor(const anchor& a, const std::vector<anchor_event>& events);
    /// All events of a space, in insertion order.
    std::vector<anchor_event> load_events(const uuid_t& space_id);
    /// One anchor's events, ordered by version.
    std::vector<anchor_event> load_anchor_events(const uuid_t& anchor_id);
    /// Events appended with a timestamp strictly after `since`, in insertion order.
    std::vector<anchor_event> load_events_since(timestamp_t since);
    /// Highest version recorded for the anchor in any space, 0 if none.
    int64_t current_version(const uuid_t& anchor_id);
    /// Space named by the anchor's first event; nullopt if it has no events.
    std::optional<uuid_t> logged_space(const uuid_t& anchor_id);

    // Pending queue
    void save_pending_operations(const std::vector<pending_operation>& ops);
    std::vector<pending_operation> load_pending_operations();

    // Sync bookkeeping
    std::optional<timestamp_t> last_sync_date();
    void set_last_sync_date(timestamp_t date);

    /// Database pages in use plus the WAL file, in bytes.
    int64_t total_size();
    /// Deletes every row of every table.
    void clear_all();

private:
    database db_;
    std::recursive_mutex mutex_;

    void create_schema();
    void write_space(const stored_space& s);
    void write_anchor(const anchor& a);
    void write_event(const anchor_event& e);
    std::optional<std::string> meta_value(const std::string& key);
    void set_meta_value(const std::string& key, const column_value_t& value);
};

} // namespace anchorlog

#endif // __cplusplus
