#include "anchorlog/local_store.hpp"
#include "anchorlog/errors.hpp"
#include "anchorlog/log.hpp"
#include <cstring>
#include <filesystem>

namespace anchorlog {

namespace {

constexpr const char* k_pending_key = "pending_operations";
constexpr const char* k_last_sync_key = "last_sync_date";

std::vector<uint8_t> transform_to_blob(const transform_t& t) {
    std::vector<uint8_t> blob(sizeof(float) * 16);
    std::memcpy(blob.data(), t.data(), blob.size());
    return blob;
}

transform_t transform_from_blob(const std::vector<uint8_t>& blob) {
    if (blob.size() != sizeof(float) * 16) {
        throw storage_error::decoding_failed("transform blob has " + std::to_string(blob.size()) + " bytes");
    }
    transform_t t{};
    std::memcpy(t.data(), blob.data(), blob.size());
    return t;
}

column_value_t optional_text(const std::optional<std::string>& s) {
    if (s) return *s;
    return nullptr;
}

column_value_t optional_time(const std::optional<timestamp_t>& t) {
    if (t) return to_unix_nanos(*t);
    return nullptr;
}

uuid_t row_uuid(const database::row_t& row, const std::string& column) {
    auto parsed = uuid_t::parse(row_text(row, column));
    if (!parsed) {
        throw storage_error::decoding_failed("malformed " + column);
    }
    return *parsed;
}

stored_space space_from_row(const database::row_t& row) {
    stored_space s;
    s.id = row_uuid(row, "id");
    if (!row_is_null(row, "name")) s.name = row_text(row, "name");
    s.payload = row_blob(row, "payload");
    s.is_compressed = row_int(row, "isCompressed") != 0;
    s.created_at = from_unix_nanos(row_int(row, "createdAt"));
    s.updated_at = from_unix_nanos(row_int(row, "updatedAt"));
    return s;
}

anchor anchor_from_row(const database::row_t& row) {
    anchor a;
    a.id = row_uuid(row, "id");
    a.space_id = row_uuid(row, "spaceId");
    a.transform = transform_from_blob(row_blob(row, "transform"));
    a.metadata = metadata_from_json(row_text(row, "metadata"));
    a.created_at = from_unix_nanos(row_int(row, "createdAt"));
    a.updated_at = from_unix_nanos(row_int(row, "updatedAt"));
    if (!row_is_null(row, "deletedAt")) {
        a.deleted_at = from_unix_nanos(row_int(row, "deletedAt"));
    }
    return a;
}

anchor_event event_from_row(const database::row_t& row) {
    anchor_event e;
    e.id = row_uuid(row, "id");
    e.anchor_id = row_uuid(row, "anchorId");
    e.space_id = row_uuid(row, "spaceId");
    auto type = event_type_from_string(row_text(row, "type"));
    if (!type) {
        throw storage_error::decoding_failed("unknown event type '" + row_text(row, "type") + "'");
    }
    e.type = *type;
    e.timestamp = from_unix_nanos(row_int(row, "timestamp"));
    e.version = row_int(row, "version");
    if (!row_is_null(row, "transform")) e.transform = transform_from_blob(row_blob(row, "transform"));
    if (!row_is_null(row, "metadata")) e.metadata = metadata_from_json(row_text(row, "metadata"));
    if (!row_is_null(row, "actorId")) e.actor_id = row_text(row, "actorId");
    return e;
}

template<typename T, typename F>
std::vector<T> map_rows(const std::vector<database::row_t>& rows, F&& fn) {
    std::vector<T> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(fn(row));
    }
    return out;
}

} // namespace

local_store::local_store(const std::string& path) : db_(path) {
    create_schema();
    LOG_INFO("local_store", "Opened %s", path.c_str());
}

void local_store::create_schema() {
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS Space (
            id TEXT PRIMARY KEY,
            name TEXT,
            payload BLOB NOT NULL,
            isCompressed INTEGER NOT NULL DEFAULT 0,
            createdAt INTEGER NOT NULL,
            updatedAt INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_space_updated ON Space(updatedAt);

        CREATE TABLE IF NOT EXISTS Anchor (
            id TEXT PRIMARY KEY,
            spaceId TEXT NOT NULL,
            transform BLOB NOT NULL,
            metadata TEXT NOT NULL,
            createdAt INTEGER NOT NULL,
            updatedAt INTEGER NOT NULL,
            deletedAt INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_anchor_space ON Anchor(spaceId);
        CREATE INDEX IF NOT EXISTS idx_anchor_updated ON Anchor(updatedAt);

        CREATE TABLE IF NOT EXISTS AnchorEvent (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            anchorId TEXT NOT NULL,
            spaceId TEXT NOT NULL,
            type TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            version INTEGER NOT NULL,
            transform BLOB,
            metadata TEXT,
            actorId TEXT,
            UNIQUE(anchorId, version)
        );
        CREATE INDEX IF NOT EXISTS idx_event_space ON AnchorEvent(spaceId);

        CREATE TABLE IF NOT EXISTS _anchorlog_meta (
            key TEXT PRIMARY KEY,
            value
        );
    )");
}

// ============================================================================
// Spaces
// ============================================================================

void local_store::write_space(const stored_space& s) {
    db_.upsert("Space", {
        {"id", s.id.to_string()},
        {"name", optional_text(s.name)},
        {"payload", s.payload},
        {"isCompressed", static_cast<int64_t>(s.is_compressed ? 1 : 0)},
        {"createdAt", to_unix_nanos(s.created_at)},
        {"updatedAt", to_unix_nanos(s.updated_at)},
    }, {"id"});
}

void local_store::save_space(const stored_space& s) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    write_space(s);
    tx.commit();
}

std::optional<stored_space> local_store::load_space(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    auto rows = db_.query("SELECT * FROM Space WHERE id = ?", {id.to_string()});
    if (rows.empty()) return std::nullopt;
    return space_from_row(rows.front());
}

std::vector<stored_space> local_store::load_all_spaces() {
    std::lock_guard lock(mutex_);
    return map_rows<stored_space>(db_.query("SELECT * FROM Space ORDER BY createdAt"), space_from_row);
}

std::vector<stored_space> local_store::load_spaces_modified_since(timestamp_t since) {
    std::lock_guard lock(mutex_);
    return map_rows<stored_space>(
        db_.query("SELECT * FROM Space WHERE updatedAt > ? ORDER BY updatedAt", {to_unix_nanos(since)}),
        space_from_row);
}

void local_store::delete_space(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    db_.execute("DELETE FROM Anchor WHERE spaceId = ?", {id.to_string()});
    db_.execute("DELETE FROM Space WHERE id = ?", {id.to_string()});
    tx.commit();
}

// ============================================================================
// Anchors
// ============================================================================

void local_store::write_anchor(const anchor& a) {
    db_.upsert("Anchor", {
        {"id", a.id.to_string()},
        {"spaceId", a.space_id.to_string()},
        {"transform", transform_to_blob(a.transform)},
        {"metadata", metadata_to_json(a.metadata)},
        {"createdAt", to_unix_nanos(a.created_at)},
        {"updatedAt", to_unix_nanos(a.updated_at)},
        {"deletedAt", optional_time(a.deleted_at)},
    }, {"id"});
}

void local_store::save_anchor(const anchor& a) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    write_anchor(a);
    tx.commit();
}

std::optional<anchor> local_store::load_anchor(const uuid_t& id) {
    std::lock_guard lock(mutex_);
    auto rows = db_.query("SELECT * FROM Anchor WHERE id = ?", {id.to_string()});
    if (rows.empty()) return std::nullopt;
    return anchor_from_row(rows.front());
}

std::vector<anchor> local_store::load_anchors(const uuid_t& space_id) {
    std::lock_guard lock(mutex_);
    return map_rows<anchor>(
        db_.query("SELECT * FROM Anchor WHERE spaceId = ? ORDER BY createdAt", {space_id.to_string()}),
        anchor_from_row);
}

std::vector<anchor> local_store::load_all_anchors() {
    std::lock_guard lock(mutex_);
    return map_rows<anchor>(db_.query("SELECT * FROM Anchor ORDER BY createdAt"), anchor_from_row);
}

std::vector<anchor> local_store::load_anchors_modified_since(timestamp_t since) {
    std::lock_guard lock(mutex_);
    return map_rows<anchor>(
        db_.query("SELECT * FROM Anchor WHERE updatedAt > ? ORDER BY updatedAt", {to_unix_nanos(since)}),
        anchor_from_row);
}

size_t local_store::purge_deleted_anchors(timestamp_t before) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    db_.execute("DELETE FROM Anchor WHERE deletedAt IS NOT NULL AND deletedAt < ?", {to_unix_nanos(before)});
    auto purged = static_cast<size_t>(db_.changes());
    tx.commit();
    LOG_DEBUG("local_store", "Purged %zu deleted anchors", purged);
    return purged;
}

// ============================================================================
// Event log
// ============================================================================

void local_store::write_event(const anchor_event& e) {
    column_value_t transform = nullptr;
    if (e.transform) transform = transform_to_blob(*e.transform);
    column_value_t metadata = nullptr;
    if (e.metadata) metadata = metadata_to_json(*e.metadata);

    db_.upsert("AnchorEvent", {
        {"id", e.id.to_string()},
        {"anchorId", e.anchor_id.to_string()},
        {"spaceId", e.space_id.to_string()},
        {"type", std::string(to_string(e.type))},
        {"timestamp", to_unix_nanos(e.timestamp)},
        {"version", e.version},
        {"transform", transform},
        {"metadata", metadata},
        {"actorId", optional_text(e.actor_id)},
    });
}

void local_store::append_event(const anchor_event& e) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    write_event(e);
    tx.commit();
}

void local_store::commit_anchor(const anchor& a, const std::vector<anchor_event>& events) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    for (const auto& e : events) {
        write_event(e);
    }
    write_anchor(a);
    tx.commit();
}

std::vector<anchor_event> local_store::load_events(const uuid_t& space_id) {
    std::lock_guard lock(mutex_);
    return map_rows<anchor_event>(
        db_.query("SELECT * FROM AnchorEvent WHERE spaceId = ? ORDER BY seq", {space_id.to_string()}),
        event_from_row);
}

std::vector<anchor_event> local_store::load_anchor_events(const uuid_t& anchor_id) {
    std::lock_guard lock(mutex_);
    return map_rows<anchor_event>(
        db_.query("SELECT * FROM AnchorEvent WHERE anchorId = ? ORDER BY version", {anchor_id.to_string()}),
        event_from_row);
}

std::vector<anchor_event> local_store::load_events_since(timestamp_t since) {
    std::lock_guard lock(mutex_);
    return map_rows<anchor_event>(
        db_.query("SELECT * FROM AnchorEvent WHERE timestamp > ? ORDER BY seq", {to_unix_nanos(since)}),
        event_from_row);
}

int64_t local_store::current_version(const uuid_t& anchor_id) {
    std::lock_guard lock(mutex_);
    auto rows = db_.query("SELECT MAX(version) AS v FROM AnchorEvent WHERE anchorId = ?",
                          {anchor_id.to_string()});
    if (rows.empty()) return 0;
    return row_int(rows.front(), "v", 0);
}

std::optional<uuid_t> local_store::logged_space(const uuid_t& anchor_id) {
    std::lock_guard lock(mutex_);
    auto rows = db_.query("SELECT spaceId FROM AnchorEvent WHERE anchorId = ? ORDER BY version LIMIT 1",
                          {anchor_id.to_string()});
    if (rows.empty()) return std::nullopt;
    return uuid_t::parse(row_text(rows.front(), "spaceId"));
}

// ============================================================================
// Meta: pending queue and last sync date
// ============================================================================

std::optional<std::string> local_store::meta_value(const std::string& key) {
    auto rows = db_.query("SELECT value FROM _anchorlog_meta WHERE key = ?", {key});
    if (rows.empty() || row_is_null(rows.front(), "value")) return std::nullopt;
    const auto& value = rows.front().at("value");
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    if (auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    return std::nullopt;
}

void local_store::set_meta_value(const std::string& key, const column_value_t& value) {
    db_.upsert("_anchorlog_meta", {{"key", key}, {"value", value}}, {"key"});
}

void local_store::save_pending_operations(const std::vector<pending_operation>& ops) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    set_meta_value(k_pending_key, pending_operations_to_json(ops));
    tx.commit();
}

std::vector<pending_operation> local_store::load_pending_operations() {
    std::lock_guard lock(mutex_);
    auto json = meta_value(k_pending_key);
    if (!json) return {};
    return pending_operations_from_json(*json);
}

std::optional<timestamp_t> local_store::last_sync_date() {
    std::lock_guard lock(mutex_);
    auto rows = db_.query("SELECT value FROM _anchorlog_meta WHERE key = ?", {std::string(k_last_sync_key)});
    if (rows.empty() || row_is_null(rows.front(), "value")) return std::nullopt;
    return from_unix_nanos(row_int(rows.front(), "value"));
}

void local_store::set_last_sync_date(timestamp_t date) {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    set_meta_value(k_last_sync_key, to_unix_nanos(date));
    tx.commit();
}

// ============================================================================
// Maintenance
// ============================================================================

int64_t local_store::total_size() {
    std::lock_guard lock(mutex_);
    auto pages = db_.query("PRAGMA page_count");
    auto page_size = db_.query("PRAGMA page_size");
    int64_t size = 0;
    if (!pages.empty() && !page_size.empty()) {
        size = row_int(pages.front(), "page_count") * row_int(page_size.front(), "page_size");
    }
    if (!db_.is_memory()) {
        std::error_code ec;
        auto wal = std::filesystem::file_size(db_.path() + "-wal", ec);
        if (!ec) size += static_cast<int64_t>(wal);
    }
    return size;
}

void local_store::clear_all() {
    std::lock_guard lock(mutex_);
    transaction tx(db_);
    db_.execute("DELETE FROM AnchorEvent");
    db_.execute("DELETE FROM Anchor");
    db_.execute("DELETE FROM Space");
    db_.execute("DELETE FROM _anchorlog_meta");
    tx.commit();
    LOG_INFO("local_store", "Cleared all local records");
}

} // namespace anchorlog
