#include "json_codec.hpp"
#include "anchorlog/errors.hpp"
#include <iomanip>
#include <sstream>

namespace anchorlog {
namespace detail {

// ============================================================================
// Metadata
// ============================================================================

json metadata_value_to_json(const metadata_value& value) {
    switch (value.kind()) {
        case metadata_kind::null_kind:
            return nullptr;
        case metadata_kind::bool_kind:
            return *value.as_bool();
        case metadata_kind::int_kind:
            return *value.as_int();
        case metadata_kind::double_kind:
            return *value.as_double();
        case metadata_kind::string_kind:
            return *value.as_string();
        case metadata_kind::array_kind: {
            json arr = json::array();
            auto items = value.as_array();   // keep the copy alive across the loop
            for (const auto& item : *items) {
                arr.push_back(metadata_value_to_json(item));
            }
            return arr;
        }
        case metadata_kind::dictionary_kind:
            return metadata_map_to_json(*value.as_dictionary());
    }
    return nullptr;
}

metadata_value metadata_value_from_json(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return metadata_value(nullptr);
        case json::value_t::boolean:
            return metadata_value(j.get<bool>());
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return metadata_value(j.get<int64_t>());
        case json::value_t::number_float:
            return metadata_value(j.get<double>());
        case json::value_t::string:
            return metadata_value(j.get<std::string>());
        case json::value_t::array: {
            metadata_value::array_t items;
            items.reserve(j.size());
            for (const auto& item : j) {
                items.push_back(metadata_value_from_json(item));
            }
            return metadata_value(std::move(items));
        }
        case json::value_t::object:
            return metadata_value(metadata_map_from_json(j));
        default:
            throw storage_error::decoding_failed("unsupported metadata value");
    }
}

json metadata_map_to_json(const metadata_map& metadata) {
    json obj = json::object();
    for (const auto& [key, value] : metadata) {
        obj[key] = metadata_value_to_json(value);
    }
    return obj;
}

metadata_map metadata_map_from_json(const json& j) {
    if (!j.is_object()) {
        throw storage_error::decoding_failed("metadata is not an object");
    }
    metadata_map result;
    for (auto it = j.begin(); it != j.end(); ++it) {
        result.emplace(it.key(), metadata_value_from_json(it.value()));
    }
    return result;
}

// ============================================================================
// Transform / bytes
// ============================================================================

json transform_to_json(const transform_t& transform) {
    json arr = json::array();
    for (float f : transform) {
        arr.push_back(f);
    }
    return arr;
}

transform_t transform_from_json(const json& j) {
    if (!j.is_array() || j.size() != 16) {
        throw storage_error::decoding_failed("transform must hold 16 numbers");
    }
    transform_t result{};
    for (size_t i = 0; i < 16; ++i) {
        if (!j[i].is_number()) {
            throw storage_error::decoding_failed("transform entry is not a number");
        }
        result[i] = j[i].get<float>();
    }
    return result;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream hex;
    for (auto byte : data) {
        hex << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte);
    }
    return hex.str();
}

std::vector<uint8_t> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw storage_error::decoding_failed("odd-length hex payload");
    }
    std::vector<uint8_t> data;
    data.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw storage_error::decoding_failed("invalid hex payload");
        }
        data.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return data;
}

// ============================================================================
// Records
// ============================================================================

namespace {

uuid_t uuid_field(const json& j, const char* key) {
    auto parsed = uuid_t::parse(j.at(key).get<std::string>());
    if (!parsed) {
        throw storage_error::decoding_failed(std::string("malformed uuid in ") + key);
    }
    return *parsed;
}

timestamp_t time_field(const json& j, const char* key) {
    return from_unix_nanos(j.at(key).get<int64_t>());
}

template<typename F>
auto decode(const char* what, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::exception& e) {
        throw storage_error::decoding_failed(std::string(what) + ": " + e.what());
    }
}

} // namespace

json anchor_to_json(const anchor& a) {
    json j;
    j["id"] = a.id.to_string();
    j["spaceId"] = a.space_id.to_string();
    j["transform"] = transform_to_json(a.transform);
    j["metadata"] = metadata_map_to_json(a.metadata);
    j["createdAt"] = to_unix_nanos(a.created_at);
    j["updatedAt"] = to_unix_nanos(a.updated_at);
    j["deletedAt"] = a.deleted_at ? json(to_unix_nanos(*a.deleted_at)) : json(nullptr);
    return j;
}

anchor anchor_from_json(const json& j) {
    return decode("anchor", [&] {
        anchor a;
        a.id = uuid_field(j, "id");
        a.space_id = uuid_field(j, "spaceId");
        a.transform = transform_from_json(j.at("transform"));
        a.metadata = j.contains("metadata") ? metadata_map_from_json(j.at("metadata")) : metadata_map{};
        a.created_at = time_field(j, "createdAt");
        a.updated_at = time_field(j, "updatedAt");
        if (j.contains("deletedAt") && !j.at("deletedAt").is_null()) {
            a.deleted_at = time_field(j, "deletedAt");
        }
        return a;
    });
}

json event_to_json(const anchor_event& e) {
    json j;
    j["id"] = e.id.to_string();
    j["anchorId"] = e.anchor_id.to_string();
    j["spaceId"] = e.space_id.to_string();
    j["type"] = to_string(e.type);
    j["timestamp"] = to_unix_nanos(e.timestamp);
    j["updatedAt"] = to_unix_nanos(e.timestamp);
    j["version"] = e.version;
    j["transform"] = e.transform ? transform_to_json(*e.transform) : json(nullptr);
    j["metadata"] = e.metadata ? metadata_map_to_json(*e.metadata) : json(nullptr);
    j["actorId"] = e.actor_id ? json(*e.actor_id) : json(nullptr);
    return j;
}

anchor_event event_from_json(const json& j) {
    return decode("event", [&] {
        anchor_event e;
        e.id = uuid_field(j, "id");
        e.anchor_id = uuid_field(j, "anchorId");
        e.space_id = uuid_field(j, "spaceId");
        auto type = event_type_from_string(j.at("type").get<std::string>());
        if (!type) {
            throw storage_error::decoding_failed("unknown event type");
        }
        e.type = *type;
        e.timestamp = time_field(j, "timestamp");
        e.version = j.at("version").get<int64_t>();
        if (j.contains("transform") && !j.at("transform").is_null()) {
            e.transform = transform_from_json(j.at("transform"));
        }
        if (j.contains("metadata") && !j.at("metadata").is_null()) {
            e.metadata = metadata_map_from_json(j.at("metadata"));
        }
        if (j.contains("actorId") && j.at("actorId").is_string()) {
            e.actor_id = j.at("actorId").get<std::string>();
        }
        return e;
    });
}

json stored_space_to_json(const stored_space& s) {
    json j;
    j["id"] = s.id.to_string();
    j["name"] = s.name ? json(*s.name) : json(nullptr);
    j["payload"] = hex_encode(s.payload);
    j["createdAt"] = to_unix_nanos(s.created_at);
    j["updatedAt"] = to_unix_nanos(s.updated_at);
    j["isCompressed"] = s.is_compressed;
    return j;
}

stored_space stored_space_from_json(const json& j) {
    return decode("space", [&] {
        stored_space s;
        s.id = uuid_field(j, "id");
        if (j.contains("name") && j.at("name").is_string()) {
            s.name = j.at("name").get<std::string>();
        }
        s.payload = hex_decode(j.at("payload").get<std::string>());
        s.created_at = time_field(j, "createdAt");
        s.updated_at = time_field(j, "updatedAt");
        s.is_compressed = j.value("isCompressed", false);
        return s;
    });
}

json pending_operation_to_json(const pending_operation& op) {
    json j;
    j["kind"] = to_string(op.kind);
    j["targetId"] = op.target_id.to_string();
    j["retryCount"] = op.retry_count;
    j["createdAt"] = to_unix_nanos(op.created_at);
    return j;
}

pending_operation pending_operation_from_json(const json& j) {
    return decode("pending operation", [&] {
        pending_operation op;
        auto kind = j.at("kind").get<std::string>();
        if (kind == "saveSpace") {
            op.kind = pending_kind::save_space;
        } else if (kind == "deleteSpace") {
            op.kind = pending_kind::delete_space;
        } else if (kind == "saveAnchor") {
            op.kind = pending_kind::save_anchor;
        } else {
            throw storage_error::decoding_failed("unknown pending operation kind: " + kind);
        }
        op.target_id = uuid_field(j, "targetId");
        op.retry_count = j.at("retryCount").get<int>();
        op.created_at = time_field(j, "createdAt");
        return op;
    });
}

} // namespace detail
} // namespace anchorlog
