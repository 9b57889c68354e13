#include "anchorlog/metadata.hpp"
#include "anchorlog/errors.hpp"
#include "json_codec.hpp"

namespace anchorlog {

metadata_value::metadata_value(array_t v)
    : value_(std::make_shared<const array_t>(std::move(v))) {}

metadata_value::metadata_value(dictionary_t v)
    : value_(std::make_shared<const dictionary_t>(std::move(v))) {}

std::optional<bool> metadata_value::as_bool() const {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int64_t> metadata_value::as_int() const {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    return std::nullopt;
}

std::optional<double> metadata_value::as_double() const {
    if (auto* v = std::get_if<double>(&value_)) return *v;
    return std::nullopt;
}

std::optional<std::string> metadata_value::as_string() const {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    return std::nullopt;
}

std::optional<metadata_value::array_t> metadata_value::as_array() const {
    if (auto* v = std::get_if<std::shared_ptr<const array_t>>(&value_)) return **v;
    return std::nullopt;
}

std::optional<metadata_value::dictionary_t> metadata_value::as_dictionary() const {
    if (auto* v = std::get_if<std::shared_ptr<const dictionary_t>>(&value_)) return **v;
    return std::nullopt;
}

bool metadata_value::operator==(const metadata_value& other) const {
    if (value_.index() != other.value_.index()) return false;
    switch (kind()) {
        case metadata_kind::null_kind:
            return true;
        case metadata_kind::bool_kind:
            return std::get<bool>(value_) == std::get<bool>(other.value_);
        case metadata_kind::int_kind:
            return std::get<int64_t>(value_) == std::get<int64_t>(other.value_);
        case metadata_kind::double_kind:
            return std::get<double>(value_) == std::get<double>(other.value_);
        case metadata_kind::string_kind:
            return std::get<std::string>(value_) == std::get<std::string>(other.value_);
        case metadata_kind::array_kind:
            // Compare contents, not pointers
            return *std::get<std::shared_ptr<const array_t>>(value_) ==
                   *std::get<std::shared_ptr<const array_t>>(other.value_);
        case metadata_kind::dictionary_kind:
            return *std::get<std::shared_ptr<const dictionary_t>>(value_) ==
                   *std::get<std::shared_ptr<const dictionary_t>>(other.value_);
    }
    return false;
}

std::string metadata_to_json(const metadata_map& metadata) {
    return detail::metadata_map_to_json(metadata).dump();
}

metadata_map metadata_from_json(const std::string& json) {
    if (json.empty()) return {};
    auto parsed = detail::json::parse(json, nullptr, false);
    if (parsed.is_discarded()) {
        throw storage_error::decoding_failed("metadata is not valid JSON");
    }
    return detail::metadata_map_from_json(parsed);
}

} // namespace anchorlog
