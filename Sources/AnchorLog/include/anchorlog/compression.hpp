#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <cstdint>
#include <vector>

namespace anchorlog {

enum class compression_level {
    none,       // identity
    balanced    // zlib deflate, default level
};

/// Compress `data` at `level`. Empty input always yields empty output.
/// Throws storage_error(compression_failed) if the encoder fails.
std::vector<uint8_t> compress(const std::vector<uint8_t>& data, compression_level level);

/// Inverse of compress(..., balanced). The output buffer grows as needed up to
/// `max_output` bytes; a stream that would need more, or is corrupt or
/// truncated, throws storage_error(decompression_failed).
std::vector<uint8_t> decompress(const std::vector<uint8_t>& data,
                                size_t max_output = size_t(1) << 30);

} // namespace anchorlog

#endif // __cplusplus
