#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "metadata.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anchorlog {

// ============================================================================
// space - a mapped environment holding one opaque payload
// ============================================================================

struct space {
    uuid_t id;
    std::optional<std::string> name;
    std::vector<uint8_t> payload;   // never interpreted by the core
    timestamp_t created_at;
    timestamp_t updated_at;

    /// New space with a fresh id; created_at == updated_at == now.
    static space make(std::vector<uint8_t> payload, std::optional<std::string> name = std::nullopt);

    space with_payload(std::vector<uint8_t> payload) const;
    space with_name(std::optional<std::string> name) const;

    size_t payload_size() const { return payload.size(); }

    bool operator==(const space& other) const {
        return id == other.id && name == other.name && payload == other.payload &&
               created_at == other.created_at && updated_at == other.updated_at;
    }
    bool operator!=(const space& other) const { return !(*this == other); }
};

/// Space as persisted locally and remotely: payload may be compressed.
struct stored_space {
    uuid_t id;
    std::optional<std::string> name;
    std::vector<uint8_t> payload;
    timestamp_t created_at;
    timestamp_t updated_at;
    bool is_compressed = false;

    std::string to_json() const;
    static std::optional<stored_space> from_json(const std::string& json);

    bool operator==(const stored_space& other) const {
        return id == other.id && name == other.name && payload == other.payload &&
               created_at == other.created_at && updated_at == other.updated_at &&
               is_compressed == other.is_compressed;
    }
};

// ============================================================================
// anchor - positioned, annotated object inside a space
// ============================================================================
//
// Mutators never change the receiver; each returns a new value whose
// updated_at is bumped to now.

struct anchor {
    uuid_t id;
    uuid_t space_id;
    transform_t transform = identity_transform();
    metadata_map metadata;
    timestamp_t created_at;
    timestamp_t updated_at;
    std::optional<timestamp_t> deleted_at;   // soft-delete marker

    static anchor make(const uuid_t& space_id,
                       const transform_t& transform = identity_transform(),
                       metadata_map metadata = {});

    anchor with_transform(const transform_t& transform) const;
    anchor with_metadata(metadata_map metadata) const;
    /// Set one key; nullopt removes it.
    anchor with_metadata_value(const std::string& key, std::optional<metadata_value> value) const;
    anchor marked_deleted() const;
    anchor restored() const;

    bool is_deleted() const { return deleted_at.has_value(); }
    bool has_metadata() const { return !metadata.empty(); }
    position3 position() const { return translation_of(transform); }

    std::optional<metadata_value> metadata_for(const std::string& key) const;
    std::optional<std::string> string_metadata(const std::string& key) const;
    std::optional<int64_t> int_metadata(const std::string& key) const;
    std::optional<bool> bool_metadata(const std::string& key) const;

    /// False if the space reference is nil or the transform has non-finite entries.
    bool validate() const;

    std::string to_json() const;
    static std::optional<anchor> from_json(const std::string& json);

    bool operator==(const anchor& other) const {
        return id == other.id && space_id == other.space_id && transform == other.transform &&
               metadata == other.metadata && created_at == other.created_at &&
               updated_at == other.updated_at && deleted_at == other.deleted_at;
    }
    bool operator!=(const anchor& other) const { return !(*this == other); }
};

// ============================================================================
// anchor_event - immutable, append-only record of one anchor transition
// ============================================================================

enum class event_type {
    created,    // transform + metadata
    moved,      // transform only
    updated,    // metadata only
    deleted,    // neither
    restored    // transform + metadata
};

const char* to_string(event_type type);
std::optional<event_type> event_type_from_string(const std::string& s);

struct anchor_event {
    uuid_t id;
    uuid_t anchor_id;
    uuid_t space_id;
    event_type type = event_type::created;
    timestamp_t timestamp;
    int64_t version = 1;
    std::optional<transform_t> transform;
    std::optional<metadata_map> metadata;
    std::optional<std::string> actor_id;

    static anchor_event created(const anchor& a, timestamp_t at = now());
    static anchor_event moved(const anchor& a, int64_t previous_version, timestamp_t at = now());
    static anchor_event updated(const anchor& a, int64_t previous_version, timestamp_t at = now());
    static anchor_event deleted(const anchor& a, int64_t previous_version, timestamp_t at = now());
    static anchor_event restored(const anchor& a, int64_t previous_version, timestamp_t at = now());

    /// True for every type except deleted.
    bool is_active_state() const { return type != event_type::deleted; }
    bool has_transform() const { return transform.has_value(); }
    bool has_metadata() const { return metadata.has_value(); }

    std::string to_json() const;
    static std::optional<anchor_event> from_json(const std::string& json);

    bool operator==(const anchor_event& other) const {
        return id == other.id && anchor_id == other.anchor_id && space_id == other.space_id &&
               type == other.type && timestamp == other.timestamp && version == other.version &&
               transform == other.transform && metadata == other.metadata &&
               actor_id == other.actor_id;
    }
};

// ============================================================================
// pending_operation - deferred remote write awaiting retry
// ============================================================================

enum class pending_kind {
    save_space,
    delete_space,
    save_anchor
};

const char* to_string(pending_kind kind);

struct pending_operation {
    pending_kind kind = pending_kind::save_anchor;
    uuid_t target_id;
    int retry_count = 0;
    timestamp_t created_at;

    static pending_operation make(pending_kind kind, const uuid_t& target_id) {
        return {kind, target_id, 0, now()};
    }

    bool operator==(const pending_operation& other) const {
        return kind == other.kind && target_id == other.target_id &&
               retry_count == other.retry_count && created_at == other.created_at;
    }
};

/// Whole-queue JSON snapshot, as stored by the local store.
std::string pending_operations_to_json(const std::vector<pending_operation>& ops);
std::vector<pending_operation> pending_operations_from_json(const std::string& json);

} // namespace anchorlog

#endif // __cplusplus
