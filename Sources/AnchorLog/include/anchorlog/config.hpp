#pragma once

#ifdef __cplusplus

#include "compression.hpp"
#include "payload.hpp"
#include "remote_store.hpp"
#include "scheduler.hpp"
#include <memory>
#include <optional>
#include <string>

namespace anchorlog {

enum class storage_backend {
    local_only,
    remote
};

enum class sync_strategy {
    manual,     // only sync() talks to the remote
    on_save     // every save also uploads immediately
};

struct storage_config {
    storage_backend backend = storage_backend::local_only;
    sync_strategy sync = sync_strategy::manual;
    compression_level compression = compression_level::balanced;

    /// SQLite database file. ":memory:" keeps everything in RAM.
    std::string path = ":memory:";

    std::shared_ptr<remote_store> remote;
    std::shared_ptr<scheduler> sched;
    std::shared_ptr<payload_codec> payload;

    /// Attempts before a pending operation is dropped.
    int max_retry_attempts = 5;

    /// Stamped onto every emitted event when set.
    std::optional<std::string> actor_id;

    static storage_config defaults() { return {}; }

    static storage_config with_remote(std::shared_ptr<remote_store> remote,
                                      sync_strategy strategy = sync_strategy::on_save) {
        storage_config config;
        config.backend = storage_backend::remote;
        config.sync = strategy;
        config.remote = std::move(remote);
        return config;
    }

    bool is_cloud_enabled() const {
        return backend == storage_backend::remote && remote != nullptr;
    }
};

} // namespace anchorlog

#endif // __cplusplus
