#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace anchorlog {

// ============================================================================
// metadata_value - closed tagged union for dynamic anchor metadata
// ============================================================================
//
// Accessors return nullopt on a kind mismatch instead of throwing.
// Nested arrays and dictionaries are held behind shared immutable storage so
// copies stay cheap and no two values ever alias mutable state.

enum class metadata_kind : int {
    null_kind = 0,
    bool_kind = 1,
    int_kind = 2,
    double_kind = 3,
    string_kind = 4,
    array_kind = 5,
    dictionary_kind = 6
};

class metadata_value {
public:
    using array_t = std::vector<metadata_value>;
    using dictionary_t = std::map<std::string, metadata_value>;

    metadata_value() = default;
    metadata_value(std::nullptr_t) {}
    metadata_value(bool v) : value_(v) {}
    metadata_value(int v) : value_(static_cast<int64_t>(v)) {}
    metadata_value(int64_t v) : value_(v) {}
    metadata_value(double v) : value_(v) {}
    metadata_value(const char* v) : value_(std::string(v)) {}
    metadata_value(std::string v) : value_(std::move(v)) {}
    metadata_value(array_t v);
    metadata_value(dictionary_t v);

    metadata_kind kind() const { return static_cast<metadata_kind>(value_.index()); }
    bool is_null() const { return kind() == metadata_kind::null_kind; }

    std::optional<bool> as_bool() const;
    std::optional<int64_t> as_int() const;
    std::optional<double> as_double() const;
    std::optional<std::string> as_string() const;
    std::optional<array_t> as_array() const;
    std::optional<dictionary_t> as_dictionary() const;

    bool operator==(const metadata_value& other) const;
    bool operator!=(const metadata_value& other) const { return !(*this == other); }

private:
    // Alternative order must match metadata_kind.
    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        std::shared_ptr<const array_t>,
        std::shared_ptr<const dictionary_t>
    > value_ = nullptr;
};

using metadata_map = metadata_value::dictionary_t;

/// Serialize a metadata map as a JSON object (keys sorted).
std::string metadata_to_json(const metadata_map& metadata);

/// Parse a JSON object into a metadata map. Throws storage_error
/// (decoding_failed) on malformed input.
metadata_map metadata_from_json(const std::string& json);

} // namespace anchorlog

#endif // __cplusplus
