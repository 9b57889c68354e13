#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <optional>

namespace anchorlog {

enum class storage_errc {
    not_found,
    cloud_not_configured,
    cloud_sync_failed,
    compression_failed,
    decompression_failed,
    invalid_reference,
    invalid_payload,
    version_not_found,
    reconstruction_failed,
    event_log_corrupted,
    decoding_failed
};

const char* to_string(storage_errc code);

/// Error raised by the storage layer. SQLite failures are reported separately
/// as db_error and are never wrapped.
class storage_error : public std::runtime_error {
public:
    storage_error(storage_errc code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    storage_errc code() const { return code_; }

    /// Record kind for not_found ("space", "anchor", "event").
    const std::string& kind() const { return kind_; }
    const std::optional<uuid_t>& id() const { return id_; }
    const std::optional<int64_t>& version() const { return version_; }
    /// Underlying failure text for cloud_sync_failed / decompression_failed.
    const std::string& cause() const { return cause_; }

    static storage_error not_found(const std::string& kind, const uuid_t& id);
    static storage_error cloud_not_configured();
    static storage_error cloud_sync_failed(const std::string& cause);
    static storage_error compression_failed();
    static storage_error decompression_failed(const std::string& cause = {});
    static storage_error invalid_reference(const std::string& what);
    static storage_error invalid_payload(const uuid_t& space_id);
    static storage_error version_not_found(const uuid_t& anchor_id, int64_t version);
    static storage_error reconstruction_failed(const uuid_t& anchor_id);
    static storage_error event_log_corrupted(const uuid_t& space_id);
    static storage_error decoding_failed(const std::string& what);

private:
    storage_errc code_;
    std::string kind_;
    std::optional<uuid_t> id_;
    std::optional<int64_t> version_;
    std::string cause_;
};

/// Failure reported by a remote_store implementation. The orchestrator turns
/// these into cloud_sync_failed and queues a retry.
class remote_error : public std::runtime_error {
public:
    explicit remote_error(const std::string& msg, int status = 0)
        : std::runtime_error(msg), status_(status) {}

    /// HTTP status when the failure came from an HTTP transport, else 0.
    int status() const { return status_; }

private:
    int status_;
};

} // namespace anchorlog

#endif // __cplusplus
