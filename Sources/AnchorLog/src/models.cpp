#include "anchorlog/models.hpp"
#include "anchorlog/errors.hpp"
#include "json_codec.hpp"
#include <cmath>

namespace anchorlog {

// ============================================================================
// space
// ============================================================================

space space::make(std::vector<uint8_t> payload, std::optional<std::string> name) {
    auto t = now();
    return {uuid_t::generate(), std::move(name), std::move(payload), t, t};
}

space space::with_payload(std::vector<uint8_t> payload) const {
    space copy = *this;
    copy.payload = std::move(payload);
    copy.updated_at = now();
    return copy;
}

space space::with_name(std::optional<std::string> name) const {
    space copy = *this;
    copy.name = std::move(name);
    copy.updated_at = now();
    return copy;
}

std::string stored_space::to_json() const {
    return detail::stored_space_to_json(*this).dump();
}

std::optional<stored_space> stored_space::from_json(const std::string& json) {
    auto parsed = detail::json::parse(json, nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    try {
        return detail::stored_space_from_json(parsed);
    } catch (const storage_error&) {
        return std::nullopt;
    }
}

// ============================================================================
// anchor
// ============================================================================

anchor anchor::make(const uuid_t& space_id, const transform_t& transform, metadata_map metadata) {
    anchor a;
    a.id = uuid_t::generate();
    a.space_id = space_id;
    a.transform = transform;
    a.metadata = std::move(metadata);
    a.created_at = now();
    a.updated_at = a.created_at;
    return a;
}

anchor anchor::with_transform(const transform_t& transform) const {
    anchor copy = *this;
    copy.transform = transform;
    copy.updated_at = now();
    return copy;
}

anchor anchor::with_metadata(metadata_map metadata) const {
    anchor copy = *this;
    copy.metadata = std::move(metadata);
    copy.updated_at = now();
    return copy;
}

anchor anchor::with_metadata_value(const std::string& key, std::optional<metadata_value> value) const {
    anchor copy = *this;
    if (value) {
        copy.metadata[key] = std::move(*value);
    } else {
        copy.metadata.erase(key);
    }
    copy.updated_at = now();
    return copy;
}

anchor anchor::marked_deleted() const {
    anchor copy = *this;
    copy.updated_at = now();
    copy.deleted_at = copy.updated_at;
    return copy;
}

anchor anchor::restored() const {
    anchor copy = *this;
    copy.deleted_at.reset();
    copy.updated_at = now();
    return copy;
}

std::optional<metadata_value> anchor::metadata_for(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> anchor::string_metadata(const std::string& key) const {
    auto v = metadata_for(key);
    return v ? v->as_string() : std::nullopt;
}

std::optional<int64_t> anchor::int_metadata(const std::string& key) const {
    auto v = metadata_for(key);
    return v ? v->as_int() : std::nullopt;
}

std::optional<bool> anchor::bool_metadata(const std::string& key) const {
    auto v = metadata_for(key);
    return v ? v->as_bool() : std::nullopt;
}

bool anchor::validate() const {
    if (space_id.is_nil()) return false;
    for (float f : transform) {
        if (!std::isfinite(f)) return false;
    }
    return true;
}

std::string anchor::to_json() const {
    return detail::anchor_to_json(*this).dump();
}

std::optional<anchor> anchor::from_json(const std::string& json) {
    auto parsed = detail::json::parse(json, nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    try {
        return detail::anchor_from_json(parsed);
    } catch (const storage_error&) {
        return std::nullopt;
    }
}

// ============================================================================
// anchor_event
// ============================================================================

const char* to_string(event_type type) {
    switch (type) {
        case event_type::created: return "created";
        case event_type::moved: return "moved";
        case event_type::updated: return "updated";
        case event_type::deleted: return "deleted";
        case event_type::restored: return "restored";
    }
    return "unknown";
}

std::optional<event_type> event_type_from_string(const std::string& s) {
    if (s == "created") return event_type::created;
    if (s == "moved") return event_type::moved;
    if (s == "updated") return event_type::updated;
    if (s == "deleted") return event_type::deleted;
    if (s == "restored") return event_type::restored;
    return std::nullopt;
}

namespace {

anchor_event base_event(const anchor& a, event_type type, int64_t version, timestamp_t at) {
    anchor_event e;
    e.id = uuid_t::generate();
    e.anchor_id = a.id;
    e.space_id = a.space_id;
    e.type = type;
    e.timestamp = at;
    e.version = version;
    return e;
}

} // namespace

anchor_event anchor_event::created(const anchor& a, timestamp_t at) {
    auto e = base_event(a, event_type::created, 1, at);
    e.transform = a.transform;
    e.metadata = a.metadata;
    return e;
}

anchor_event anchor_event::moved(const anchor& a, int64_t previous_version, timestamp_t at) {
    auto e = base_event(a, event_type::moved, previous_version + 1, at);
    e.transform = a.transform;
    return e;
}

anchor_event anchor_event::updated(const anchor& a, int64_t previous_version, timestamp_t at) {
    auto e = base_event(a, event_type::updated, previous_version + 1, at);
    e.metadata = a.metadata;
    return e;
}

anchor_event anchor_event::deleted(const anchor& a, int64_t previous_version, timestamp_t at) {
    return base_event(a, event_type::deleted, previous_version + 1, at);
}

anchor_event anchor_event::restored(const anchor& a, int64_t previous_version, timestamp_t at) {
    auto e = base_event(a, event_type::restored, previous_version + 1, at);
    e.transform = a.transform;
    e.metadata = a.metadata;
    return e;
}

std::string anchor_event::to_json() const {
    return detail::event_to_json(*this).dump();
}

std::optional<anchor_event> anchor_event::from_json(const std::string& json) {
    auto parsed = detail::json::parse(json, nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    try {
        return detail::event_from_json(parsed);
    } catch (const storage_error&) {
        return std::nullopt;
    }
}

// ============================================================================
// pending_operation
// ============================================================================

const char* to_string(pending_kind kind) {
    switch (kind) {
        case pending_kind::save_space: return "saveSpace";
        case pending_kind::delete_space: return "deleteSpace";
        case pending_kind::save_anchor: return "saveAnchor";
    }
    return "unknown";
}

std::string pending_operations_to_json(const std::vector<pending_operation>& ops) {
    auto arr = detail::json::array();
    for (const auto& op : ops) {
        arr.push_back(detail::pending_operation_to_json(op));
    }
    return arr.dump();
}

std::vector<pending_operation> pending_operations_from_json(const std::string& json) {
    if (json.empty()) return {};
    auto parsed = detail::json::parse(json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        throw storage_error::decoding_failed("pending operation queue is not a JSON array");
    }
    std::vector<pending_operation> ops;
    ops.reserve(parsed.size());
    for (const auto& item : parsed) {
        ops.push_back(detail::pending_operation_from_json(item));
    }
    return ops;
}

} // namespace anchorlog
