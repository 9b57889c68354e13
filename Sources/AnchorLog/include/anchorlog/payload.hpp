#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace anchorlog {

/// Boundary to the spatial payload format. The core never looks inside a
/// payload; it only asks the codec whether one is acceptable and how big it is.
class payload_codec {
public:
    virtual ~payload_codec() = default;

    virtual bool validate(const std::vector<uint8_t>& payload) const = 0;
    virtual size_t size(const std::vector<uint8_t>& payload) const = 0;
};

/// Accepts any non-empty blob; size is the byte count.
class opaque_payload_codec : public payload_codec {
public:
    bool validate(const std::vector<uint8_t>& payload) const override {
        return !payload.empty();
    }

    size_t size(const std::vector<uint8_t>& payload) const override {
        return payload.size();
    }
};

} // namespace anchorlog

#endif // __cplusplus
