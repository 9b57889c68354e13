#include "anchorlog/errors.hpp"

namespace anchorlog {

const char* to_string(storage_errc code) {
    switch (code) {
        case storage_errc::not_found: return "not_found";
        case storage_errc::cloud_not_configured: return "cloud_not_configured";
        case storage_errc::cloud_sync_failed: return "cloud_sync_failed";
        case storage_errc::compression_failed: return "compression_failed";
        case storage_errc::decompression_failed: return "decompression_failed";
        case storage_errc::invalid_reference: return "invalid_reference";
        case storage_errc::invalid_payload: return "invalid_payload";
        case storage_errc::version_not_found: return "version_not_found";
        case storage_errc::reconstruction_failed: return "reconstruction_failed";
        case storage_errc::event_log_corrupted: return "event_log_corrupted";
        case storage_errc::decoding_failed: return "decoding_failed";
    }
    return "unknown";
}

storage_error storage_error::not_found(const std::string& kind, const uuid_t& id) {
    std::string label = kind;
    if (!label.empty()) label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    storage_error e(storage_errc::not_found, label + " not found: " + id.to_string());
    e.kind_ = kind;
    e.id_ = id;
    return e;
}

storage_error storage_error::cloud_not_configured() {
    return storage_error(storage_errc::cloud_not_configured,
                         "Cloud sync is not configured. Set backend to remote and provide a remote_store.");
}

storage_error storage_error::cloud_sync_failed(const std::string& cause) {
    storage_error e(storage_errc::cloud_sync_failed, "Cloud sync failed: " + cause);
    e.cause_ = cause;
    return e;
}

storage_error storage_error::compression_failed() {
    return storage_error(storage_errc::compression_failed, "Failed to compress data");
}

storage_error storage_error::decompression_failed(const std::string& cause) {
    std::string msg = "Failed to decompress data";
    if (!cause.empty()) msg += ": " + cause;
    storage_error e(storage_errc::decompression_failed, msg);
    e.cause_ = cause;
    return e;
}

storage_error storage_error::invalid_reference(const std::string& what) {
    return storage_error(storage_errc::invalid_reference, "Invalid reference: " + what);
}

storage_error storage_error::invalid_payload(const uuid_t& space_id) {
    storage_error e(storage_errc::invalid_payload,
                    "Space payload rejected by codec: " + space_id.to_string());
    e.kind_ = "space";
    e.id_ = space_id;
    return e;
}

storage_error storage_error::version_not_found(const uuid_t& anchor_id, int64_t version) {
    storage_error e(storage_errc::version_not_found,
                    "Version " + std::to_string(version) + " not found for anchor " + anchor_id.to_string());
    e.kind_ = "anchor";
    e.id_ = anchor_id;
    e.version_ = version;
    return e;
}

storage_error storage_error::reconstruction_failed(const uuid_t& anchor_id) {
    storage_error e(storage_errc::reconstruction_failed,
                    "Failed to reconstruct anchor state: " + anchor_id.to_string());
    e.kind_ = "anchor";
    e.id_ = anchor_id;
    return e;
}

storage_error storage_error::event_log_corrupted(const uuid_t& space_id) {
    storage_error e(storage_errc::event_log_corrupted,
                    "Event log corrupted for space: " + space_id.to_string());
    e.kind_ = "space";
    e.id_ = space_id;
    return e;
}

storage_error storage_error::decoding_failed(const std::string& what) {
    storage_error e(storage_errc::decoding_failed, "Failed to decode record: " + what);
    e.cause_ = what;
    return e;
}

} // namespace anchorlog
