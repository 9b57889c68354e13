#pragma once

// AnchorLog - local-first, event-sourced persistence for spatial anchors
//
// Usage:
//   #include <AnchorLog.hpp>
//
//   int main() {
//       anchorlog::storage store;   // in-memory; set config.path for a file
//
//       auto room = anchorlog::space::make(scan_bytes, "Living room");
//       store.save(room);
//
//       auto lamp = anchorlog::anchor::make(room.id);
//       store.save(lamp);                                   // v1 created
//       store.save(lamp.with_metadata_value("label", "Lamp")); // v2 updated
//
//       for (auto& e : store.history(lamp.id)) {
//           std::printf("v%lld %s\n", (long long)e.version, anchorlog::to_string(e.type));
//       }
//       store.rollback(lamp.id, 1);                         // v3 restored
//   }

#include "anchorlog/types.hpp"
#include "anchorlog/log.hpp"
#include "anchorlog/errors.hpp"
#include "anchorlog/metadata.hpp"
#include "anchorlog/models.hpp"
#include "anchorlog/compression.hpp"
#include "anchorlog/db.hpp"
#include "anchorlog/local_store.hpp"
#include "anchorlog/diff.hpp"
#include "anchorlog/timeline.hpp"
#include "anchorlog/scheduler.hpp"
#include "anchorlog/network.hpp"
#include "anchorlog/payload.hpp"
#include "anchorlog/remote_store.hpp"
#include "anchorlog/rest_remote_store.hpp"
#include "anchorlog/config.hpp"
#include "anchorlog/storage.hpp"
