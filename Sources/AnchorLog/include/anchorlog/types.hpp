#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <cstddef>
#include <cctype>
#include <string>
#include <optional>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>
#include <functional>

namespace anchorlog {

// Wall-clock timestamp. Persisted as integer nanoseconds since the Unix epoch
// so that every record round-trips exactly.
using timestamp_t = std::chrono::system_clock::time_point;

inline timestamp_t now() {
    return std::chrono::system_clock::now();
}

inline int64_t to_unix_nanos(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_unix_nanos(int64_t nanos) {
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(std::chrono::nanoseconds(nanos)));
}

/// Earliest representable instant; used as "never synced".
inline timestamp_t distant_past() {
    return from_unix_nanos(INT64_MIN);
}

// UUID type (stored as TEXT, lowercase hyphenated)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Parse from string (accepts with or without hyphens). nullopt if malformed.
    static std::optional<uuid_t> parse(const std::string& s) {
        std::string hex;
        for (char c : s) {
            if (c == '-') continue;
            if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
            hex += c;
        }
        if (hex.size() != 32) return std::nullopt;
        uuid_t result;
        for (size_t i = 0; i < 16; ++i) {
            result.bytes[i] = static_cast<uint8_t>(std::stoi(hex.substr(i * 2, 2), nullptr, 16));
        }
        return result;
    }

    // Parse from string; malformed input yields the nil UUID.
    static uuid_t from_string(const std::string& s) {
        return parse(s).value_or(uuid_t{});
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        // Set version (4) and variant (RFC 4122)
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
    bool operator<(const uuid_t& other) const { return bytes < other.bytes; }

    // Check if UUID is nil (all zeros)
    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }
};

// 4x4 transform, column-major. Indices 12..14 hold the translation.
using transform_t = std::array<float, 16>;

inline transform_t identity_transform() {
    return {1, 0, 0, 0,
            0, 1, 0, 0,
            0, 0, 1, 0,
            0, 0, 0, 1};
}

struct position3 {
    float x = 0;
    float y = 0;
    float z = 0;

    bool operator==(const position3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

inline position3 translation_of(const transform_t& t) {
    return {t[12], t[13], t[14]};
}

} // namespace anchorlog

template<>
struct std::hash<anchorlog::uuid_t> {
    size_t operator()(const anchorlog::uuid_t& id) const noexcept {
        uint64_t h = 1469598103934665603ULL;
        for (auto b : id.bytes) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

#endif // __cplusplus
