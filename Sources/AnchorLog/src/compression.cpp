#include "anchorlog/compression.hpp"
#include "anchorlog/errors.hpp"
#include "anchorlog/log.hpp"
#include <algorithm>
#include <limits>
#include <string>
#include <zlib.h>

namespace anchorlog {

std::vector<uint8_t> compress(const std::vector<uint8_t>& data, compression_level level) {
    if (level == compression_level::none || data.empty()) {
        return data;
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(bound);
    int rc = compress2(out.data(), &bound,
                       reinterpret_cast<const Bytef*>(data.data()),
                       static_cast<uLong>(data.size()),
                       Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK || bound == 0) {
        LOG_ERROR("compression", "compress2 failed (rc=%d, %zu input bytes)", rc, data.size());
        throw storage_error::compression_failed();
    }
    out.resize(bound);
    return out;
}

std::vector<uint8_t> decompress(const std::vector<uint8_t>& data, size_t max_output) {
    if (data.empty()) {
        return {};
    }

    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        throw storage_error::decompression_failed("inflateInit failed");
    }

    // One byte past the cap tells "exactly max_output" apart from "more".
    const size_t cap = max_output == std::numeric_limits<size_t>::max() ? max_output : max_output + 1;
    constexpr size_t max_chunk = std::numeric_limits<uInt>::max();

    // Original size is unknown; start at 4x input and double on demand.
    std::vector<uint8_t> out(std::min(cap, std::max<size_t>(data.size() * 4, 1024)));
    size_t consumed = 0;
    size_t produced = 0;

    auto fail = [&](const std::string& msg) {
        inflateEnd(&stream);
        throw storage_error::decompression_failed(msg);
    };

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (stream.avail_in == 0 && consumed < data.size()) {
            size_t chunk = std::min(max_chunk, data.size() - consumed);
            stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data() + consumed));
            stream.avail_in = static_cast<uInt>(chunk);
            consumed += chunk;
        }
        if (produced == out.size()) {
            out.resize(out.size() > cap / 2 ? cap : out.size() * 2);
        }
        size_t room = std::min(max_chunk, out.size() - produced);
        stream.next_out = out.data() + produced;
        stream.avail_out = static_cast<uInt>(room);

        rc = inflate(&stream, Z_NO_FLUSH);
        produced += room - stream.avail_out;

        if (produced > max_output) {
            fail("output exceeds " + std::to_string(max_output) + " bytes");
        }
        if (rc == Z_BUF_ERROR && stream.avail_in == 0 && consumed == data.size() && stream.avail_out > 0) {
            fail("truncated stream");
        }
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            fail(stream.msg ? stream.msg : "inflate error " + std::to_string(rc));
        }
    }

    out.resize(produced);
    inflateEnd(&stream);
    return out;
}

} // namespace anchorlog
