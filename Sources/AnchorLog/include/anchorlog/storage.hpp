#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "diff.hpp"
#include "errors.hpp"
#include "local_store.hpp"
#include "models.hpp"
#include "timeline.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace anchorlog {

/// Outcome of one sync() call.
struct sync_report {
    size_t retried = 0;                 // queued operations that succeeded this time
    size_t dropped = 0;                 // queued operations abandoned after their last attempt
    std::vector<pending_operation> dropped_operations;
    size_t uploaded = 0;                // records pushed in the upload phase
    size_t downloaded = 0;              // remote records adopted locally
    size_t conflicts_kept_local = 0;    // differing remote records not newer than local
};

// ============================================================================
// storage - save/load/rollback/sync orchestrator
// ============================================================================
//
// The local store is always written first and is the source of truth. With
// sync_strategy::on_save a failed upload leaves the local write in place,
// queues a retry and throws storage_error(cloud_sync_failed). Retries only
// happen inside sync().
//
// Saves, deletes and rollbacks of one anchor are serialized by a per-anchor
// mutex. Two storage instances over the same database are not supported.

class storage {
public:
    explicit storage(storage_config config = storage_config::defaults());
    /// Uses an existing local store instead of opening config.path.
    storage(storage_config config, std::shared_ptr<local_store> store);

    storage(const storage&) = delete;
    storage& operator=(const storage&) = delete;

    const storage_config& config() const { return config_; }
    bool is_cloud_enabled() const { return config_.is_cloud_enabled(); }

    // ========================================================================
    // Spaces
    // ========================================================================

    /// Compresses per config and persists. Throws invalid_payload if the
    /// payload codec rejects the blob.
    void save(const space& s);
    /// Local first, then the remote (caching the download locally).
    std::optional<space> load_space(const uuid_t& id);
    std::vector<space> load_all_spaces();
    /// Removes the space and its anchors; their events are kept.
    void delete_space(const uuid_t& id);

    // ========================================================================
    // Anchors
    // ========================================================================

    /// Persists the snapshot and appends at most one classified event
    /// (plus a synthetic `created` for a record that predates the event log).
    void save(const anchor& a);
    std::optional<anchor> load_anchor(const uuid_t& id);
    std::vector<anchor> load_anchors(const uuid_t& space_id, bool include_deleted = false);
    /// Soft delete. Throws not_found for an unknown id.
    void delete_anchor(const uuid_t& id);
    /// Hard-deletes anchors soft-deleted before `before`, locally and remotely.
    /// Emits no events. Returns the local count.
    size_t purge_deleted_anchors(timestamp_t before);

    // ========================================================================
    // Versioning
    // ========================================================================

    /// Restores the state at `version` as a new `restored` event and returns it.
    anchor rollback(const uuid_t& anchor_id, int64_t version);
    /// Events of one anchor in version order. Throws not_found if there are none.
    std::vector<anchor_event> history(const uuid_t& anchor_id);
    anchorlog::timeline timeline(const uuid_t& space_id);
    std::vector<anchor> anchors_at(const uuid_t& space_id, timestamp_t date);
    anchorlog::diff diff(const uuid_t& space_id, timestamp_t from, timestamp_t to);
    /// Throws event_log_corrupted unless every anchor of the space has
    /// versions 1..N starting with `created`.
    void verify_history(const uuid_t& space_id);

    // ========================================================================
    // Sync
    // ========================================================================

    sync_report sync();
    size_t pending_operation_count();
    std::vector<pending_operation> pending_operations();
    std::optional<timestamp_t> last_sync_date();

    // ========================================================================
    // Maintenance
    // ========================================================================

    void clear_local_storage();
    int64_t local_storage_size();

    // ========================================================================
    // Async façade: work runs on config().sched; `done` receives the
    // exception (or null) and the result. The storage must outlive the call.
    // ========================================================================

    using completion = std::function<void(std::exception_ptr)>;
    template<typename T>
    using result_completion = std::function<void(std::exception_ptr, T)>;

    void save_async(space s, completion done);
    void save_async(anchor a, completion done);
    void load_space_async(uuid_t id, result_completion<std::optional<space>> done);
    void load_anchor_async(uuid_t id, result_completion<std::optional<anchor>> done);
    void delete_space_async(uuid_t id, completion done);
    void delete_anchor_async(uuid_t id, completion done);
    void rollback_async(uuid_t anchor_id, int64_t version, result_completion<std::optional<anchor>> done);
    void sync_async(result_completion<sync_report> done);

private:
    storage_config config_;
    std::shared_ptr<local_store> store_;

    std::mutex queue_mutex_;
    std::vector<pending_operation> pending_;

    std::mutex anchor_locks_mutex_;
    std::unordered_map<uuid_t, std::shared_ptr<std::mutex>> anchor_locks_;

    std::shared_ptr<std::mutex> lock_for(const uuid_t& anchor_id);
    void save_anchor_locked(const anchor& a);
    space decode_space(const stored_space& s) const;
    void stamp(anchor_event& e) const;

    bool uploads_on_save() const;
    /// Uploads a snapshot and its new events; on failure queues a retry and
    /// throws cloud_sync_failed.
    void push_anchor(const anchor& a, const std::vector<anchor_event>& events);
    void enqueue(pending_kind kind, const uuid_t& target);
    void persist_queue();
    void execute(const pending_operation& op);
    size_t upload_changes(timestamp_t since);
    void download_changes(timestamp_t since, sync_report& report);

    template<typename T, typename F>
    void post(F&& work, result_completion<T> done);
};

} // namespace anchorlog

#endif // __cplusplus
