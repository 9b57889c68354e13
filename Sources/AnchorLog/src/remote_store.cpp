#include "anchorlog/remote_store.hpp"
#include "anchorlog/errors.hpp"

namespace anchorlog {

namespace {

template<typename T>
std::optional<T> find_record(const std::map<uuid_t, T>& records, const uuid_t& id) {
    auto it = records.find(id);
    if (it == records.end()) return std::nullopt;
    return it->second;
}

template<typename T, typename Pred>
std::vector<T> select_records(const std::map<uuid_t, T>& records, Pred&& pred) {
    std::vector<T> out;
    for (const auto& [_, record] : records) {
        if (pred(record)) out.push_back(record);
    }
    return out;
}

} // namespace

void memory_remote_store::check_available(const char* op) {
    ++calls_;
    if (offline_) {
        throw remote_error(std::string(op) + ": remote is offline");
    }
    if (fail_remaining_ > 0) {
        --fail_remaining_;
        throw remote_error(std::string(op) + ": injected failure");
    }
}

// Spaces

void memory_remote_store::upload_space(const stored_space& s) {
    std::lock_guard lock(mutex_);
    check_available("upload_space");
    spaces_[s.id] = s;
}

std::optional<stored_space> memory_remote_store::download_space(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    check_available("download_space");
    return find_record(spaces_, id);
}

std::vector<stored_space> memory_remote_store::list_spaces_modified_since(timestamp_t since) {
    std::lock_guard lock(mutex_);
    check_available("list_spaces_modified_since");
    return select_records(spaces_, [&](const stored_space& s) { return s.updated_at > since; });
}

void memory_remote_store::remove_space(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    check_available("remove_space");
    spaces_.erase(id);
}

// Anchors

void memory_remote_store::upload_anchor(const anchor& a) {
    std::lock_guard lock(mutex_);
    check_available("upload_anchor");
    anchors_[a.id] = a;
}

std::optional<anchor> memory_remote_store::download_anchor(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    check_available("download_anchor");
    return find_record(anchors_, id);
}

std::vector<anchor> memory_remote_store::list_anchors_modified_since(timestamp_t since) {
    std::lock_guard lock(mutex_);
    check_available("list_anchors_modified_since");
    return select_records(anchors_, [&](const anchor& a) { return a.updated_at > since; });
}

void memory_remote_store::remove_anchor(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    check_available("remove_anchor");
    anchors_.erase(id);
}

void memory_remote_store::remove_anchors_deleted_before(timestamp_t before) {
    std::lock_guard lock(mutex_);
    check_available("remove_anchors_deleted_before");
    std::erase_if(anchors_, [&](const auto& entry) {
        return entry.second.deleted_at && *entry.second.deleted_at < before;
    });
}

// Events

void memory_remote_store::upload_event(const anchor_event& e) {
    std::lock_guard lock(mutex_);
    check_available("upload_event");
    events_[e.id] = e;
}

std::optional<anchor_event> memory_remote_store::download_event(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    check_available("download_event");
    return find_record(events_, id);
}

std::vector<anchor_event> memory_remote_store::list_events_modified_since(timestamp_t since) {
    std::lock_guard lock(mutex_);
    check_available("list_events_modified_since");
    return select_records(events_, [&](const anchor_event& e) { return e.timestamp > since; });
}

void memory_remote_store::remove_event(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    check_available("remove_event");
    events_.erase(id);
}

void memory_remote_store::remove_events_older_than(timestamp_t before) {
    std::lock_guard lock(mutex_);
    check_available("remove_events_older_than");
    std::erase_if(events_, [&](const auto& entry) { return entry.second.timestamp < before; });
}

// Failure injection and inspection

void memory_remote_store::fail_next(int count) {
    std::lock_guard lock(mutex_);
    fail_remaining_ = count;
}

void memory_remote_store::set_offline(bool offline) {
    std::lock_guard lock(mutex_);
    offline_ = offline;
}

int memory_remote_store::call_count() const {
    std::lock_guard lock(mutex_);
    return calls_;
}

size_t memory_remote_store::space_count() const {
    std::lock_guard lock(mutex_);
    return spaces_.size();
}

size_t memory_remote_store::anchor_count() const {
    std::lock_guard lock(mutex_);
    return anchors_.size();
}

size_t memory_remote_store::event_count() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

} // namespace anchorlog
