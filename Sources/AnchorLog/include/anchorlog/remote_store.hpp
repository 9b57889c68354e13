#pragma once

#ifdef __cplusplus

#include "models.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace anchorlog {

// ============================================================================
// remote_store - replica the orchestrator syncs with
// ============================================================================
//
// Uploads are idempotent upserts by id. Implementations report failures by
// throwing remote_error.

class remote_store {
public:
    virtual ~remote_store() = default;

    // Spaces
    virtual void upload_space(const stored_space& s) = 0;
    virtual std::optional<stored_space> download_space(const uuid_t& id) = 0;
    virtual std::vector<stored_space> list_spaces_modified_since(timestamp_t since) = 0;
    virtual void remove_space(const uuid_t& id) = 0;

    // Anchors
    virtual void upload_anchor(const anchor& a) = 0;
    virtual std::optional<anchor> download_anchor(const uuid_t& id) = 0;
    virtual std::vector<anchor> list_anchors_modified_since(timestamp_t since) = 0;
    virtual void remove_anchor(const uuid_t& id) = 0;
    /// Drops anchors soft-deleted strictly before `before`.
    virtual void remove_anchors_deleted_before(timestamp_t before) = 0;

    // Events
    virtual void upload_event(const anchor_event& e) = 0;
    virtual std::optional<anchor_event> download_event(const uuid_t& id) = 0;
    virtual std::vector<anchor_event> list_events_modified_since(timestamp_t since) = 0;
    virtual void remove_event(const uuid_t& id) = 0;
    /// Drops events whose timestamp is strictly before `before`.
    virtual void remove_events_older_than(timestamp_t before) = 0;
};

// ============================================================================
// memory_remote_store - in-process replica with failure injection
// ============================================================================

class memory_remote_store : public remote_store {
public:
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

    /// The next `count` calls throw remote_error.
    void fail_next(int count);
    /// While offline, every call throws remote_error.
    void set_offline(bool offline);

    /// Number of calls that reached the store (failed ones included).
    int call_count() const;
    size_t space_count() const;
    size_t anchor_count() const;
    size_t event_count() const;

private:
    mutable std::mutex mutex_;
    std::map<uuid_t, stored_space> spaces_;
    std::map<uuid_t, anchor> anchors_;
    std::map<uuid_t, anchor_event> events_;
    int fail_remaining_ = 0;
    bool offline_ = false;
    int calls_ = 0;

    // Caller holds mutex_.
    void check_available(const char* op);
};

} // namespace anchorlog

#endif // __cplusplus
