#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <cmath>
#include <future>
#include <iostream>
#include <limits>

namespace storage_tests {

using namespace anchorlog;
using test_support::tick;
using test_support::translated;

std::vector<uint8_t> repeating_payload(size_t n) {
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(i % 16);
    return out;
}

std::vector<event_type> types_of(const std::vector<anchor_event>& events) {
    std::vector<event_type> out;
    for (const auto& e : events) out.push_back(e.type);
    return out;
}

// ============================================================================
// Spaces
// ============================================================================

void test_space_save_load_compressed() {
    std::cout << "  test_space_save_load_compressed..." << std::flush;

    auto store = std::make_shared<local_store>();
    storage db(storage_config::defaults(), store);

    auto s = space::make(repeating_payload(10000), "Kitchen");
    db.save(s);

    auto raw = store->load_space(s.id);
    assert(raw && raw->is_compressed);
    assert(raw->payload.size() < s.payload.size());

    auto loaded = db.load_space(s.id);
    assert(loaded && *loaded == s);
    assert(db.load_all_spaces().size() == 1);
    assert(!db.load_space(uuid_t::generate()));

    std::cout << " OK" << std::endl;
}

void test_space_save_uncompressed() {
    std::cout << "  test_space_save_uncompressed..." << std::flush;

    auto store = std::make_shared<local_store>();
    auto config = storage_config::defaults();
    config.compression = compression_level::none;
    storage db(config, store);

    auto s = space::make({1, 2, 3});
    db.save(s);
    auto raw = store->load_space(s.id);
    assert(raw && !raw->is_compressed && raw->payload == s.payload);
    assert(*db.load_space(s.id) == s);

    std::cout << " OK" << std::endl;
}

void test_space_payload_validation() {
    std::cout << "  test_space_payload_validation..." << std::flush;

    storage db;
    auto empty = space::make({});
    auto code = test_support::expect_storage_error([&] { db.save(empty); });
    assert(code == storage_errc::invalid_payload);
    assert(db.load_all_spaces().empty());

    std::cout << " OK" << std::endl;
}

void test_delete_space() {
    std::cout << "  test_delete_space..." << std::flush;

    storage db;
    auto s = space::make({9, 9, 9});
    db.save(s);
    auto a = anchor::make(s.id);
    db.save(a);

    db.delete_space(s.id);
    assert(!db.load_space(s.id));
    assert(!db.load_anchor(a.id));
    // The history survives the space.
    assert(db.history(a.id).size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Anchors and the event log
// ============================================================================

void test_full_lifecycle_and_rollback() {
    std::cout << "  test_full_lifecycle_and_rollback..." << std::flush;

    storage db;
    auto space_id = uuid_t::generate();
    auto t1 = translated(0, 0, 0);
    auto t2 = translated(1, 0, 0);

    auto a = anchor::make(space_id, t1, {{"text", "A"}});
    db.save(a);
    tick();
    auto moved = a.with_transform(t2);
    db.save(moved);
    tick();
    auto updated = moved.with_metadata({{"text", "B"}});
    db.save(updated);
    tick();
    db.delete_anchor(a.id);

    auto events = db.history(a.id);
    assert(events.size() == 4);
    assert((types_of(events) == std::vector<event_type>{
        event_type::created, event_type::moved, event_type::updated, event_type::deleted}));
    for (size_t i = 0; i < events.size(); ++i) {
        assert(events[i].version == static_cast<int64_t>(i + 1));
    }
    assert(events[1].transform == t2 && !events[1].metadata);
    assert(!events[2].transform && events[2].metadata);
    assert(!events[3].transform && !events[3].metadata);

    assert(db.load_anchors(space_id).empty());
    assert(db.load_anchors(space_id, true).size() == 1);

    tick();
    auto restored = db.rollback(a.id, 1);
    assert(restored.transform == t1);
    assert(restored.string_metadata("text") == std::string("A"));
    assert(!restored.is_deleted());
    assert(restored.created_at == a.created_at);

    events = db.history(a.id);
    assert(events.size() == 5);
    assert(events.back().type == event_type::restored);
    assert(events.back().version == 5);
    assert(events.back().transform == t1);

    auto current = db.load_anchor(a.id);
    assert(current && *current == restored);
    db.verify_history(space_id);

    std::cout << " OK" << std::endl;
}

void test_versions_are_contiguous() {
    std::cout << "  test_versions_are_contiguous..." << std::flush;

    storage db;
    auto a = anchor::make(uuid_t::generate());
    db.save(a);
    for (int i = 1; i <= 5; ++i) {
        tick();
        a = a.with_transform(translated(static_cast<float>(i), 0, 0));
        db.save(a);
    }
    // Saving the same state again is not a transition.
    db.save(a);

    auto events = db.history(a.id);
    assert(events.size() == 6);
    for (size_t i = 0; i < events.size(); ++i) {
        assert(events[i].version == static_cast<int64_t>(i + 1));
    }
    db.verify_history(a.space_id);

    std::cout << " OK" << std::endl;
}

void test_transform_change_wins_over_metadata() {
    std::cout << "  test_transform_change_wins_over_metadata..." << std::flush;

    storage db;
    auto a = anchor::make(uuid_t::generate(), translated(0, 0, 0), {{"text", "A"}});
    db.save(a);
    tick();
    auto both = a.with_transform(translated(2, 0, 0)).with_metadata({{"text", "B"}});
    db.save(both);

    auto events = db.history(a.id);
    assert(events.size() == 2);
    assert(events[1].type == event_type::moved);
    // The snapshot still holds both changes.
    assert(db.load_anchor(a.id)->string_metadata("text") == std::string("B"));

    std::cout << " OK" << std::endl;
}

void test_delete_with_transform_change_emits_only_deleted() {
    std::cout << "  test_delete_with_transform_change_emits_only_deleted..." << std::flush;

    storage db;
    auto a = anchor::make(uuid_t::generate(), translated(0, 0, 0));
    db.save(a);
    tick();
    auto b = a.with_transform(translated(5, 0, 0)).marked_deleted();
    db.save(b);

    auto events = db.history(a.id);
    assert(events.size() == 2);
    assert(events[1].type == event_type::deleted);
    assert(!events[1].transform);

    auto snapshot = db.load_anchor(a.id);
    assert(snapshot && snapshot->is_deleted());
    assert(snapshot->transform == translated(5, 0, 0));

    std::cout << " OK" << std::endl;
}

void test_delete_anchor_edge_cases() {
    std::cout << "  test_delete_anchor_edge_cases..." << std::flush;

    storage db;
    auto code = test_support::expect_storage_error([&] { db.delete_anchor(uuid_t::generate()); });
    assert(code == storage_errc::not_found);

    auto a = anchor::make(uuid_t::generate(), translated(1, 2, 3), {{"k", 1}});
    db.save(a);
    db.delete_anchor(a.id);
    db.delete_anchor(a.id);   // already deleted: nothing new

    auto events = db.history(a.id);
    assert(events.size() == 2);
    auto snapshot = db.load_anchor(a.id);
    assert(snapshot->transform == translated(1, 2, 3));
    assert(snapshot->int_metadata("k") == int64_t(1));

    // Saving a live copy again restores it.
    tick();
    db.save(a.with_metadata({{"k", 2}}));
    events = db.history(a.id);
    assert(events.size() == 3 && events[2].type == event_type::restored);

    std::cout << " OK" << std::endl;
}

void test_legacy_record_migration() {
    std::cout << "  test_legacy_record_migration..." << std::flush;

    auto store = std::make_shared<local_store>();
    auto legacy = anchor::make(uuid_t::generate(), translated(0, 1, 0), {{"text", "old"}});
    legacy.created_at = now() - std::chrono::hours(24);
    legacy.updated_at = legacy.created_at;
    store->save_anchor(legacy);   // snapshot with no events

    storage db(storage_config::defaults(), store);
    db.save(legacy.with_metadata({{"text", "new"}}));

    auto events = db.history(legacy.id);
    assert(events.size() == 2);
    assert(events[0].type == event_type::created);
    assert(events[0].timestamp == legacy.created_at);
    assert(events[0].metadata && events[0].metadata->at("text") == metadata_value("old"));
    assert(events[1].type == event_type::updated);
    assert(events[1].version == 2);

    std::cout << " OK" << std::endl;
}

void test_rollback_errors() {
    std::cout << "  test_rollback_errors..." << std::flush;

    storage db;
    auto code = test_support::expect_storage_error([&] { db.rollback(uuid_t::generate(), 1); });
    assert(code == storage_errc::not_found);

    auto a = anchor::make(uuid_t::generate());
    db.save(a);
    bool threw = false;
    try {
        db.rollback(a.id, 99);
    } catch (const storage_error& e) {
        threw = true;
        assert(e.code() == storage_errc::version_not_found);
        assert(e.version() == int64_t(99));
        assert(e.id() == a.id);
    }
    assert(threw);
    assert(db.history(a.id).size() == 1);

    std::cout << " OK" << std::endl;
}

void test_invalid_references() {
    std::cout << "  test_invalid_references..." << std::flush;

    storage db;

    auto orphan = anchor::make(uuid_t{});
    assert(test_support::expect_storage_error([&] { db.save(orphan); }) == storage_errc::invalid_reference);

    auto bad = anchor::make(uuid_t::generate());
    bad.transform[0] = std::numeric_limits<float>::quiet_NaN();
    assert(test_support::expect_storage_error([&] { db.save(bad); }) == storage_errc::invalid_reference);

    auto a = anchor::make(uuid_t::generate());
    db.save(a);
    auto elsewhere = a;
    elsewhere.space_id = uuid_t::generate();
    assert(test_support::expect_storage_error([&] { db.save(elsewhere); }) == storage_errc::invalid_reference);

    assert(db.history(a.id).size() == 1);
    assert(test_support::expect_storage_error([&] { db.history(orphan.id); }) == storage_errc::not_found);

    std::cout << " OK" << std::endl;
}

void test_history_pins_space() {
    std::cout << "  test_history_pins_space..." << std::flush;

    storage db;
    auto first = space::make({1});
    db.save(first);
    auto a = anchor::make(first.id);
    db.save(a);
    db.delete_space(first.id);
    assert(!db.load_anchor(a.id));

    // The snapshot is gone but the event log still names the first space.
    auto moved = a;
    moved.space_id = uuid_t::generate();
    assert(test_support::expect_storage_error([&] { db.save(moved); }) == storage_errc::invalid_reference);
    assert(db.history(a.id).size() == 1);

    tick();
    db.save(a.with_transform(translated(1, 0, 0)));
    auto events = db.history(a.id);
    assert(events.size() == 2);
    assert(events[1].type == event_type::restored && events[1].version == 2);
    assert(events[1].space_id == first.id);

    std::cout << " OK" << std::endl;
}

void test_list_metadata_survives_storage() {
    std::cout << "  test_list_metadata_survives_storage..." << std::flush;

    storage db;
    metadata_map meta{
        {"tags", metadata_value(metadata_value::array_t{"door", "exit", int64_t(3)})},
        {"label", metadata_value(metadata_value::dictionary_t{
            {"text", "Exit"},
            {"sizes", metadata_value(metadata_value::array_t{1.5, 2.5})}})},
    };
    auto a = anchor::make(uuid_t::generate(), identity_transform(), meta);
    db.save(a);

    auto loaded = db.load_anchor(a.id);
    assert(loaded && loaded->metadata == meta);
    auto tags = loaded->metadata_for("tags")->as_array();
    assert(tags && tags->size() == 3 && (*tags)[1] == metadata_value("exit"));

    auto events = db.history(a.id);
    assert(events[0].metadata && *events[0].metadata == meta);

    auto decoded = anchor::from_json(a.to_json());
    assert(decoded && decoded->metadata == meta);

    std::cout << " OK" << std::endl;
}

void test_purge_then_resave_continues_history() {
    std::cout << "  test_purge_then_resave_continues_history..." << std::flush;

    storage db;
    auto keep = anchor::make(uuid_t::generate());
    auto gone = anchor::make(keep.space_id);
    db.save(keep);
    db.save(gone);
    db.delete_anchor(gone.id);

    assert(db.purge_deleted_anchors(now() + std::chrono::seconds(1)) == 1);
    assert(!db.load_anchor(gone.id));
    assert(db.load_anchor(keep.id));
    assert(db.history(gone.id).size() == 2);

    tick();
    db.save(gone.with_transform(translated(4, 0, 0)));
    auto events = db.history(gone.id);
    assert(events.size() == 3);
    assert(events[2].type == event_type::restored && events[2].version == 3);
    db.verify_history(keep.space_id);

    std::cout << " OK" << std::endl;
}

void test_timeline_views() {
    std::cout << "  test_timeline_views..." << std::flush;

    storage db;
    auto space_id = uuid_t::generate();
    auto before = now();
    tick();
    auto a = anchor::make(space_id, translated(0, 0, 0));
    db.save(a);
    tick();
    auto mid = now();
    tick();
    db.save(a.with_transform(translated(0, 3, 4)));
    auto b = anchor::make(space_id);
    db.save(b);

    assert(db.anchors_at(space_id, before).empty());
    assert(db.anchors_at(space_id, mid).size() == 1);
    assert(db.anchors_at(space_id, now()).size() == 2);

    auto d = db.diff(space_id, mid, now());
    assert(d.added.size() == 1 && d.added[0].id == b.id);
    assert(d.moved.size() == 1);
    assert(std::fabs(d.moved[0].distance_moved() - 5.0f) < 1e-5f);
    assert(d.summary() == "1 added, 1 moved");

    auto tl = db.timeline(space_id);
    assert(tl.size() == 3);
    assert(tl.anchor_ids().size() == 2);

    std::cout << " OK" << std::endl;
}

void test_verify_history_detects_gaps() {
    std::cout << "  test_verify_history_detects_gaps..." << std::flush;

    auto store = std::make_shared<local_store>();
    storage db(storage_config::defaults(), store);
    auto a = anchor::make(uuid_t::generate());
    db.save(a);
    db.verify_history(a.space_id);

    store->append_event(anchor_event::moved(a, 2));   // v3 with no v2
    auto code = test_support::expect_storage_error([&] { db.verify_history(a.space_id); });
    assert(code == storage_errc::event_log_corrupted);

    auto headless = anchor::make(uuid_t::generate());
    store->append_event(anchor_event::moved(headless, 0));
    code = test_support::expect_storage_error([&] { db.verify_history(headless.space_id); });
    assert(code == storage_errc::event_log_corrupted);

    std::cout << " OK" << std::endl;
}

void test_actor_id_is_stamped() {
    std::cout << "  test_actor_id_is_stamped..." << std::flush;

    auto config = storage_config::defaults();
    config.actor_id = "device-7";
    storage db(config);

    auto a = anchor::make(uuid_t::generate());
    db.save(a);
    tick();
    db.save(a.with_transform(translated(1, 1, 1)));
    db.rollback(a.id, 1);

    for (const auto& e : db.history(a.id)) {
        assert(e.actor_id == std::string("device-7"));
    }

    std::cout << " OK" << std::endl;
}

void test_maintenance() {
    std::cout << "  test_maintenance..." << std::flush;

    test_support::temp_db tmp("maintenance");
    auto config = storage_config::defaults();
    config.path = tmp.path;
    {
        storage db(config);
        db.save(space::make(repeating_payload(4096)));
        db.save(anchor::make(uuid_t::generate()));
        assert(db.local_storage_size() > 0);
        db.clear_local_storage();
        assert(db.load_all_spaces().empty());
        assert(db.pending_operation_count() == 0);
        assert(!db.last_sync_date());
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Async façade
// ============================================================================

void test_async_on_worker_thread() {
    std::cout << "  test_async_on_worker_thread..." << std::flush;

    auto config = storage_config::defaults();
    auto worker = std::make_shared<std_thread_scheduler>();
    config.sched = worker;
    storage db(config);

    auto a = anchor::make(uuid_t::generate());

    std::promise<bool> saved;
    db.save_async(a, [&](std::exception_ptr error) {
        saved.set_value(error == nullptr && worker->is_on_thread());
    });
    assert(saved.get_future().get());

    std::promise<std::optional<anchor>> loaded;
    db.load_anchor_async(a.id, [&](std::exception_ptr, std::optional<anchor> result) {
        loaded.set_value(std::move(result));
    });
    auto result = loaded.get_future().get();
    assert(result && *result == a);

    std::promise<storage_errc> failed;
    db.rollback_async(uuid_t::generate(), 1, [&](std::exception_ptr error, std::optional<anchor> value) {
        assert(error && !value);
        try {
            std::rethrow_exception(error);
        } catch (const storage_error& e) {
            failed.set_value(e.code());
        }
    });
    assert(failed.get_future().get() == storage_errc::not_found);

    std::promise<std::exception_ptr> synced;
    db.sync_async([&](std::exception_ptr error, sync_report) { synced.set_value(error); });
    auto sync_error = synced.get_future().get();
    assert(sync_error);

    std::cout << " OK" << std::endl;
}

void test_async_immediate() {
    std::cout << "  test_async_immediate..." << std::flush;

    storage db;
    auto s = space::make({1, 2, 3, 4});
    bool called = false;
    db.save_async(s, [&](std::exception_ptr error) {
        called = true;
        assert(!error);
    });
    assert(called);

    std::optional<space> loaded;
    db.load_space_async(s.id, [&](std::exception_ptr, std::optional<space> result) { loaded = result; });
    assert(loaded && *loaded == s);

    bool deleted = false;
    db.delete_space_async(s.id, [&](std::exception_ptr error) { deleted = !error; });
    assert(deleted && !db.load_space(s.id));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing storage..." << std::endl;
    test_space_save_load_compressed();
    test_space_save_uncompressed();
    test_space_payload_validation();
    test_delete_space();
    test_full_lifecycle_and_rollback();
    test_versions_are_contiguous();
    test_transform_change_wins_over_metadata();
    test_delete_with_transform_change_emits_only_deleted();
    test_delete_anchor_edge_cases();
    test_legacy_record_migration();
    test_rollback_errors();
    test_invalid_references();
    test_history_pins_space();
    test_list_metadata_survives_storage();
    test_purge_then_resave_continues_history();
    test_timeline_views();
    test_verify_history_detects_gaps();
    test_actor_id_is_stamped();
    test_maintenance();
    test_async_on_worker_thread();
    test_async_immediate();
}

} // namespace storage_tests
