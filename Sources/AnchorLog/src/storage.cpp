#include "anchorlog/storage.hpp"
#include "anchorlog/compression.hpp"
#include "anchorlog/log.hpp"
#include <algorithm>
#include <map>

namespace anchorlog {

storage::storage(storage_config config)
    : storage(config, std::make_shared<local_store>(config.path)) {}

storage::storage(storage_config config, std::shared_ptr<local_store> store)
    : config_(std::move(config)), store_(std::move(store)) {
    if (!config_.sched) {
        config_.sched = make_default_scheduler();
    }
    if (!config_.payload) {
        config_.payload = std::make_shared<opaque_payload_codec>();
    }
    if (config_.backend == storage_backend::remote && !config_.remote) {
        LOG_WARN("storage", "Remote backend selected but no remote_store was injected; running local-only");
    }
    pending_ = store_->load_pending_operations();
}

std::shared_ptr<std::mutex> storage::lock_for(const uuid_t& anchor_id) {
    std::lock_guard lock(anchor_locks_mutex_);
    auto& slot = anchor_locks_[anchor_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

bool storage::uploads_on_save() const {
    return config_.sync == sync_strategy::on_save && is_cloud_enabled();
}

void storage::stamp(anchor_event& e) const {
    if (config_.actor_id) e.actor_id = config_.actor_id;
}

// ============================================================================
// Spaces
// ============================================================================

void storage::save(const space& s) {
    if (!config_.payload->validate(s.payload)) {
        throw storage_error::invalid_payload(s.id);
    }

    stored_space record;
    record.id = s.id;
    record.name = s.name;
    record.payload = compress(s.payload, config_.compression);
    record.created_at = s.created_at;
    record.updated_at = s.updated_at;
    record.is_compressed = config_.compression != compression_level::none && !s.payload.empty();

    store_->save_space(record);
    LOG_DEBUG("storage", "Saved space %s (%zu -> %zu bytes)", s.id.to_string().c_str(),
              config_.payload->size(s.payload), record.payload.size());

    if (uploads_on_save()) {
        try {
            config_.remote->upload_space(record);
        } catch (const remote_error& e) {
            enqueue(pending_kind::save_space, s.id);
            throw storage_error::cloud_sync_failed(e.what());
        }
    }
}

space storage::decode_space(const stored_space& s) const {
    space out;
    out.id = s.id;
    out.name = s.name;
    out.payload = s.is_compressed ? decompress(s.payload) : s.payload;
    out.created_at = s.created_at;
    out.updated_at = s.updated_at;
    return out;
}

std::optional<space> storage::load_space(const uuid_t& id) {
    if (auto local = store_->load_space(id)) {
        return decode_space(*local);
    }
    if (!is_cloud_enabled()) {
        return std::nullopt;
    }

    std::optional<stored_space> remote;
    try {
        remote = config_.remote->download_space(id);
    } catch (const remote_error& e) {
        throw storage_error::cloud_sync_failed(e.what());
    }
    if (!remote) {
        return std::nullopt;
    }
    store_->save_space(*remote);
    return decode_space(*remote);
}

std::vector<space> storage::load_all_spaces() {
    std::vector<space> out;
    for (const auto& s : store_->load_all_spaces()) {
        out.push_back(decode_space(s));
    }
    return out;
}

void storage::delete_space(const uuid_t& id) {
    store_->delete_space(id);

    if (uploads_on_save()) {
        try {
            config_.remote->remove_space(id);
        } catch (const remote_error& e) {
            enqueue(pending_kind::delete_space, id);
            throw storage_error::cloud_sync_failed(e.what());
        }
    }
}

// ============================================================================
// Anchors
// ============================================================================

void storage::save(const anchor& a) {
    auto guard = lock_for(a.id);
    std::lock_guard lock(*guard);
    save_anchor_locked(a);
}

void storage::save_anchor_locked(const anchor& a) {
    if (a.space_id.is_nil()) {
        throw storage_error::invalid_reference("anchor " + a.id.to_string() + " has no space");
    }
    if (!a.validate()) {
        throw storage_error::invalid_reference("anchor " + a.id.to_string() + " has a non-finite transform");
    }

    auto existing = store_->load_anchor(a.id);
    if (existing && existing->space_id != a.space_id) {
        throw storage_error::invalid_reference("anchor " + a.id.to_string() + " cannot move to another space");
    }
    // The snapshot may be gone (purge, deleted space) while the history remains.
    auto logged = store_->logged_space(a.id);
    if (logged && *logged != a.space_id) {
        throw storage_error::invalid_reference("anchor " + a.id.to_string() + " belongs to space " +
                                               logged->to_string());
    }
    int64_t version = store_->current_version(a.id);

    std::vector<anchor_event> events;

    if (existing && version == 0) {
        // Record predates the event log: seed its history from the stored snapshot.
        LOG_INFO("storage", "Migrating legacy anchor %s into the event log", a.id.to_string().c_str());
        events.push_back(anchor_event::created(*existing, existing->created_at));
        version = 1;
    }

    if (!existing) {
        if (version == 0) {
            events.push_back(anchor_event::created(a));
        } else {
            // Snapshot was purged or its space deleted; history continues.
            events.push_back(anchor_event::restored(a, version));
        }
    } else if (!existing->is_deleted() && a.is_deleted()) {
        events.push_back(anchor_event::deleted(a, version));
    } else if (existing->is_deleted() && !a.is_deleted()) {
        events.push_back(anchor_event::restored(a, version));
    } else if (existing->transform != a.transform) {
        events.push_back(anchor_event::moved(a, version));
    } else if (existing->metadata != a.metadata) {
        events.push_back(anchor_event::updated(a, version));
    }

    for (auto& e : events) {
        stamp(e);
    }

    store_->commit_anchor(a, events);

    if (uploads_on_save()) {
        push_anchor(a, events);
    }
}

void storage::push_anchor(const anchor& a, const std::vector<anchor_event>& events) {
    try {
        config_.remote->upload_anchor(a);
        for (const auto& e : events) {
            config_.remote->upload_event(e);
        }
    } catch (const remote_error& e) {
        enqueue(pending_kind::save_anchor, a.id);
        throw storage_error::cloud_sync_failed(e.what());
    }
}

std::optional<anchor> storage::load_anchor(const uuid_t& id) {
    return store_->load_anchor(id);
}

std::vector<anchor> storage::load_anchors(const uuid_t& space_id, bool include_deleted) {
    auto anchors = store_->load_anchors(space_id);
    if (!include_deleted) {
        std::erase_if(anchors, [](const anchor& a) { return a.is_deleted(); });
    }
    return anchors;
}

void storage::delete_anchor(const uuid_t& id) {
    auto guard = lock_for(id);
    std::lock_guard lock(*guard);

    auto existing = store_->load_anchor(id);
    if (!existing) {
        throw storage_error::not_found("anchor", id);
    }
    if (existing->is_deleted()) {
        return;
    }
    // Stored transform and metadata are reused, so only `deleted` is emitted.
    save_anchor_locked(existing->marked_deleted());
}

size_t storage::purge_deleted_anchors(timestamp_t before) {
    size_t purged = store_->purge_deleted_anchors(before);
    if (is_cloud_enabled()) {
        try {
            config_.remote->remove_anchors_deleted_before(before);
        } catch (const remote_error& e) {
            throw storage_error::cloud_sync_failed(e.what());
        }
    }
    return purged;
}

// ============================================================================
// Versioning
// ============================================================================

anchor storage::rollback(const uuid_t& anchor_id, int64_t version) {
    auto guard = lock_for(anchor_id);
    std::lock_guard lock(*guard);

    auto events = store_->load_anchor_events(anchor_id);
    if (events.empty()) {
        throw storage_error::not_found("anchor", anchor_id);
    }
    bool has_version = std::any_of(events.begin(), events.end(),
                                   [&](const anchor_event& e) { return e.version == version; });
    if (!has_version) {
        throw storage_error::version_not_found(anchor_id, version);
    }

    std::vector<anchor_event> prefix;
    for (const auto& e : events) {
        if (e.version <= version) prefix.push_back(e);
    }
    anchor restored = reconstruct_anchor(anchor_id, prefix);

    if (auto current = store_->load_anchor(anchor_id)) {
        restored.created_at = current->created_at;
    }
    restored.deleted_at.reset();
    restored.updated_at = now();

    int64_t max_version = events.back().version;
    auto event = anchor_event::restored(restored, max_version, restored.updated_at);
    stamp(event);

    store_->commit_anchor(restored, {event});
    LOG_DEBUG("storage", "Rolled back %s to v%lld as v%lld", anchor_id.to_string().c_str(),
              static_cast<long long>(version), static_cast<long long>(event.version));

    if (uploads_on_save()) {
        push_anchor(restored, {event});
    }
    return restored;
}

std::vector<anchor_event> storage::history(const uuid_t& anchor_id) {
    auto events = store_->load_anchor_events(anchor_id);
    if (events.empty()) {
        throw storage_error::not_found("anchor", anchor_id);
    }
    return events;
}

anchorlog::timeline storage::timeline(const uuid_t& space_id) {
    return anchorlog::timeline(space_id, store_->load_events(space_id));
}

std::vector<anchor> storage::anchors_at(const uuid_t& space_id, timestamp_t date) {
    return timeline(space_id).state(date);
}

anchorlog::diff storage::diff(const uuid_t& space_id, timestamp_t from, timestamp_t to) {
    return timeline(space_id).diff(from, to);
}

void storage::verify_history(const uuid_t& space_id) {
    std::map<uuid_t, std::vector<const anchor_event*>> by_anchor;
    auto events = store_->load_events(space_id);
    for (const auto& e : events) {
        by_anchor[e.anchor_id].push_back(&e);
    }
    for (auto& [anchor_id, list] : by_anchor) {
        std::sort(list.begin(), list.end(),
                  [](const anchor_event* a, const anchor_event* b) { return a->version < b->version; });
        if (list.front()->type != event_type::created) {
            LOG_ERROR("storage", "Anchor %s history does not start with created", anchor_id.to_string().c_str());
            throw storage_error::event_log_corrupted(space_id);
        }
        for (size_t i = 0; i < list.size(); ++i) {
            if (list[i]->version != static_cast<int64_t>(i + 1)) {
                LOG_ERROR("storage", "Anchor %s has a version gap at %zu", anchor_id.to_string().c_str(), i + 1);
                throw storage_error::event_log_corrupted(space_id);
            }
        }
    }
}

// ============================================================================
// Pending queue
// ============================================================================

void storage::enqueue(pending_kind kind, const uuid_t& target) {
    std::lock_guard lock(queue_mutex_);
    auto op = pending_operation::make(kind, target);
    auto it = std::find_if(pending_.begin(), pending_.end(), [&](const pending_operation& queued) {
        return queued.kind == kind && queued.target_id == target;
    });
    if (it != pending_.end()) {
        op.retry_count = it->retry_count;
        op.created_at = it->created_at;
    }

    // A space's latest save or delete supersedes the other, and the queue
    // replays in order, so the newest intent goes last.
    bool space_op = kind == pending_kind::save_space || kind == pending_kind::delete_space;
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), [&](const pending_operation& queued) {
        if (queued.target_id != target) return false;
        if (queued.kind == kind) return true;
        return space_op && (queued.kind == pending_kind::save_space || queued.kind == pending_kind::delete_space);
    }), pending_.end());
    pending_.push_back(op);

    LOG_WARN("storage", "Queued %s %s for retry (%zu pending)", to_string(kind),
             target.to_string().c_str(), pending_.size());
    persist_queue();
}

// Caller holds queue_mutex_.
void storage::persist_queue() {
    try {
        store_->save_pending_operations(pending_);
    } catch (const db_error& e) {
        LOG_ERROR("storage", "Failed to persist pending operations: %s", e.what());
        throw;
    }
}

size_t storage::pending_operation_count() {
    std::lock_guard lock(queue_mutex_);
    return pending_.size();
}

std::vector<pending_operation> storage::pending_operations() {
    std::lock_guard lock(queue_mutex_);
    return pending_;
}

void storage::execute(const pending_operation& op) {
    switch (op.kind) {
        case pending_kind::save_space:
            if (auto s = store_->load_space(op.target_id)) {
                config_.remote->upload_space(*s);
            }
            break;
        case pending_kind::delete_space:
            config_.remote->remove_space(op.target_id);
            break;
        case pending_kind::save_anchor:
            if (auto a = store_->load_anchor(op.target_id)) {
                config_.remote->upload_anchor(*a);
                for (const auto& e : store_->load_anchor_events(op.target_id)) {
                    config_.remote->upload_event(e);
                }
            }
            break;
    }
}

// ============================================================================
// Sync
// ============================================================================

std::optional<timestamp_t> storage::last_sync_date() {
    return store_->last_sync_date();
}

sync_report storage::sync() {
    if (!is_cloud_enabled()) {
        throw storage_error::cloud_not_configured();
    }

    sync_report report;

    // 1. Drain the retry queue.
    {
        std::lock_guard lock(queue_mutex_);
        std::vector<pending_operation> remaining;
        for (auto op : pending_) {
            try {
                execute(op);
                ++report.retried;
            } catch (const remote_error& e) {
                op.retry_count += 1;
                if (op.retry_count < config_.max_retry_attempts) {
                    remaining.push_back(op);
                } else {
                    LOG_ERROR("storage", "Dropping %s %s after %d attempts: %s", to_string(op.kind),
                              op.target_id.to_string().c_str(), op.retry_count, e.what());
                    report.dropped_operations.push_back(op);
                }
            }
        }
        report.dropped = report.dropped_operations.size();
        pending_ = std::move(remaining);
        persist_queue();
    }

    // 2. Upload local changes. The download phase uses the previous mark.
    auto since = store_->last_sync_date().value_or(distant_past());
    auto started = now();
    try {
        report.uploaded = upload_changes(since);
    } catch (const remote_error& e) {
        throw storage_error::cloud_sync_failed(e.what());
    }
    store_->set_last_sync_date(started);

    // 3. Download remote changes, last write wins.
    try {
        download_changes(since, report);
    } catch (const remote_error& e) {
        throw storage_error::cloud_sync_failed(e.what());
    }

    LOG_INFO("storage", "Sync complete: %zu retried, %zu dropped, %zu uploaded, %zu downloaded",
             report.retried, report.dropped, report.uploaded, report.downloaded);
    return report;
}

size_t storage::upload_changes(timestamp_t since) {
    size_t uploaded = 0;
    for (const auto& s : store_->load_spaces_modified_since(since)) {
        config_.remote->upload_space(s);
        ++uploaded;
    }
    for (const auto& a : store_->load_anchors_modified_since(since)) {
        config_.remote->upload_anchor(a);
        ++uploaded;
    }
    for (const auto& e : store_->load_events_since(since)) {
        config_.remote->upload_event(e);
        ++uploaded;
    }
    return uploaded;
}

void storage::download_changes(timestamp_t since, sync_report& report) {
    for (const auto& remote : config_.remote->list_spaces_modified_since(since)) {
        auto local = store_->load_space(remote.id);
        if (!local || remote.updated_at > local->updated_at) {
            LOG_DEBUG("storage", "LWW: adopting remote space %s", remote.id.to_string().c_str());
            store_->save_space(remote);
            ++report.downloaded;
        } else if (remote != *local) {
            LOG_DEBUG("storage", "LWW: keeping local space %s", remote.id.to_string().c_str());
            ++report.conflicts_kept_local;
        }
    }

    for (const auto& remote : config_.remote->list_anchors_modified_since(since)) {
        auto guard = lock_for(remote.id);
        std::lock_guard lock(*guard);
        auto local = store_->load_anchor(remote.id);
        if (!local || remote.updated_at > local->updated_at) {
            LOG_DEBUG("storage", "LWW: adopting remote anchor %s", remote.id.to_string().c_str());
            store_->save_anchor(remote);
            ++report.downloaded;
        } else if (remote != *local) {
            LOG_DEBUG("storage", "LWW: keeping local anchor %s", remote.id.to_string().c_str());
            ++report.conflicts_kept_local;
        }
    }
}

// ============================================================================
// Maintenance
// ============================================================================

void storage::clear_local_storage() {
    store_->clear_all();
    std::lock_guard lock(queue_mutex_);
    pending_.clear();
}

int64_t storage::local_storage_size() {
    return store_->total_size();
}

// ============================================================================
// Async façade
// ============================================================================

template<typename T, typename F>
void storage::post(F&& work, result_completion<T> done) {
    config_.sched->invoke([work = std::forward<F>(work), done = std::move(done)]() mutable {
        T result{};
        std::exception_ptr error;
        try {
            result = work();
        } catch (...) {
            error = std::current_exception();   // handed to the caller
        }
        if (done) done(error, std::move(result));
    });
}

namespace {

struct no_result {};

storage::result_completion<no_result> drop_result(storage::completion done) {
    return [done = std::move(done)](std::exception_ptr error, no_result) {
        if (done) done(error);
    };
}

} // namespace

void storage::save_async(space s, completion done) {
    post<no_result>([this, s = std::move(s)] { save(s); return no_result{}; }, drop_result(std::move(done)));
}

void storage::save_async(anchor a, completion done) {
    post<no_result>([this, a = std::move(a)] { save(a); return no_result{}; }, drop_result(std::move(done)));
}

void storage::load_space_async(uuid_t id, result_completion<std::optional<space>> done) {
    post<std::optional<space>>([this, id] { return load_space(id); }, std::move(done));
}

void storage::load_anchor_async(uuid_t id, result_completion<std::optional<anchor>> done) {
    post<std::optional<anchor>>([this, id] { return load_anchor(id); }, std::move(done));
}

void storage::delete_space_async(uuid_t id, completion done) {
    post<no_result>([this, id] { delete_space(id); return no_result{}; }, drop_result(std::move(done)));
}

void storage::delete_anchor_async(uuid_t id, completion done) {
    post<no_result>([this, id] { delete_anchor(id); return no_result{}; }, drop_result(std::move(done)));
}

void storage::rollback_async(uuid_t anchor_id, int64_t version, result_completion<std::optional<anchor>> done) {
    post<std::optional<anchor>>(
        [this, anchor_id, version]() -> std::optional<anchor> { return rollback(anchor_id, version); },
        std::move(done));
}

void storage::sync_async(result_completion<sync_report> done) {
    post<sync_report>([this] { return sync(); }, std::move(done));
}

} // namespace anchorlog
