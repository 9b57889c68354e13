#pragma once

// Internal JSON mapping shared by models, the local queue record and the
// remote wire format. Not installed.

#include "anchorlog/models.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace anchorlog {
namespace detail {

using json = nlohmann::json;

json metadata_value_to_json(const metadata_value& value);
metadata_value metadata_value_from_json(const json& j);

json metadata_map_to_json(const metadata_map& metadata);
metadata_map metadata_map_from_json(const json& j);

json transform_to_json(const transform_t& transform);
transform_t transform_from_json(const json& j);

std::string hex_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> hex_decode(const std::string& hex);

// Every *_from_json throws storage_error(decoding_failed) on a malformed
// document; nlohmann exceptions never escape.
json anchor_to_json(const anchor& a);
anchor anchor_from_json(const json& j);

json event_to_json(const anchor_event& e);
anchor_event event_from_json(const json& j);

json stored_space_to_json(const stored_space& s);
stored_space stored_space_from_json(const json& j);

json pending_operation_to_json(const pending_operation& op);
pending_operation pending_operation_from_json(const json& j);

} // namespace detail
} // namespace anchorlog
