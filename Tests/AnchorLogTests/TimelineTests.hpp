#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

namespace timeline_tests {

using namespace anchorlog;
using test_support::at_seconds;
using test_support::translated;

anchor_event make_event(const uuid_t& anchor_id, const uuid_t& space_id, event_type type,
                        timestamp_t at, int64_t version,
                        std::optional<transform_t> transform = std::nullopt,
                        std::optional<metadata_map> metadata = std::nullopt) {
    anchor_event e;
    e.id = uuid_t::generate();
    e.anchor_id = anchor_id;
    e.space_id = space_id;
    e.type = type;
    e.timestamp = at;
    e.version = version;
    e.transform = transform;
    e.metadata = metadata;
    return e;
}

void test_state_reconstruction() {
    std::cout << "  test_state_reconstruction..." << std::flush;

    auto space_id = uuid_t::generate();
    auto anchor_id = uuid_t::generate();
    auto base = now();

    timeline tl(space_id, {
        make_event(anchor_id, space_id, event_type::created, at_seconds(base, -100), 1,
                   translated(0, 0, 0), metadata_map{{"text", "Original"}}),
        make_event(anchor_id, space_id, event_type::moved, at_seconds(base, -50), 2, translated(1, 0, 0)),
        make_event(anchor_id, space_id, event_type::updated, at_seconds(base, -25), 3,
                   std::nullopt, metadata_map{{"text", "Changed"}}),
    });

    assert(tl.state(at_seconds(base, -150)).empty());

    auto early = tl.state(at_seconds(base, -75));
    assert(early.size() == 1);
    assert(early[0].transform == translated(0, 0, 0));
    assert(early[0].string_metadata("text") == std::string("Original"));

    auto mid = tl.state(at_seconds(base, -50));   // inclusive of the event instant
    assert(mid[0].transform == translated(1, 0, 0));
    assert(mid[0].updated_at == at_seconds(base, -50));

    auto late = tl.state(base);
    assert(late[0].transform == translated(1, 0, 0));
    assert(late[0].string_metadata("text") == std::string("Changed"));
    assert(late[0].created_at == at_seconds(base, -100));

    std::cout << " OK" << std::endl;
}

void test_state_with_deletion_and_restore() {
    std::cout << "  test_state_with_deletion_and_restore..." << std::flush;

    auto space_id = uuid_t::generate();
    auto anchor_id = uuid_t::generate();
    auto base = now();

    timeline tl(space_id, {
        make_event(anchor_id, space_id, event_type::created, at_seconds(base, -100), 1, translated(0, 0, 0)),
        make_event(anchor_id, space_id, event_type::deleted, at_seconds(base, -50), 2),
        make_event(anchor_id, space_id, event_type::restored, at_seconds(base, -10), 3,
                   translated(2, 0, 0), metadata_map{{"text", "Back"}}),
    });

    assert(tl.state(at_seconds(base, -75)).size() == 1);
    assert(tl.state(at_seconds(base, -25)).empty());
    auto restored = tl.state(base);
    assert(restored.size() == 1);
    assert(restored[0].transform == translated(2, 0, 0));
    assert(!restored[0].is_deleted());

    std::cout << " OK" << std::endl;
}

void test_events_without_created_are_dropped() {
    std::cout << "  test_events_without_created_are_dropped..." << std::flush;

    auto space_id = uuid_t::generate();
    auto base = now();
    auto orphan = uuid_t::generate();
    auto whole = uuid_t::generate();

    timeline tl(space_id, {
        make_event(orphan, space_id, event_type::moved, at_seconds(base, -10), 2, translated(1, 1, 1)),
        make_event(whole, space_id, event_type::created, at_seconds(base, -10), 1),
    });

    auto state = tl.state(base);
    assert(state.size() == 1);
    assert(state[0].id == whole);
    assert(state[0].transform == identity_transform());

    std::cout << " OK" << std::endl;
}

void test_sorting_is_stable() {
    std::cout << "  test_sorting_is_stable..." << std::flush;

    auto space_id = uuid_t::generate();
    auto anchor_id = uuid_t::generate();
    auto t = now();

    // Same instant: created must still fold before moved.
    timeline tl(space_id, {
        make_event(anchor_id, space_id, event_type::created, t, 1, translated(0, 0, 0)),
        make_event(anchor_id, space_id, event_type::moved, t, 2, translated(3, 0, 0)),
        make_event(uuid_t::generate(), space_id, event_type::created, t - std::chrono::seconds(1), 1),
    });

    assert(tl.events()[0].timestamp < t);
    assert(tl.events()[1].type == event_type::created);
    assert(tl.events()[2].type == event_type::moved);
    auto state = tl.state_by_id(t);
    assert(state.at(anchor_id).transform == translated(3, 0, 0));

    std::cout << " OK" << std::endl;
}

void test_bounds_and_queries() {
    std::cout << "  test_bounds_and_queries..." << std::flush;

    auto space_id = uuid_t::generate();
    auto a = uuid_t::generate();
    auto b = uuid_t::generate();
    auto base = now();

    timeline empty(space_id, {});
    assert(empty.empty());
    assert(!empty.start_date() && !empty.end_date() && !empty.duration());
    assert(!empty.closest_event(base));

    timeline tl(space_id, {
        make_event(a, space_id, event_type::created, at_seconds(base, -100), 1),
        make_event(b, space_id, event_type::created, at_seconds(base, -50), 1),
        make_event(a, space_id, event_type::moved, at_seconds(base, 0), 2, translated(1, 0, 0)),
    });

    assert(tl.start_date() == at_seconds(base, -100));
    assert(tl.end_date() == base);
    assert(*tl.duration() == std::chrono::seconds(100));

    auto ids = tl.anchor_ids();
    assert(ids.size() == 2 && ids[0] == a && ids[1] == b);
    assert(tl.events_for(a).size() == 2);
    assert(tl.events_between(at_seconds(base, -60), at_seconds(base, -50)).size() == 1);
    assert(tl.events_of_type(event_type::created).size() == 2);

    auto closest = tl.closest_event(at_seconds(base, -70));
    assert(closest && closest->anchor_id == b);
    // Equidistant from -100 and -50: the earlier event wins.
    assert(tl.closest_event(at_seconds(base, -75))->anchor_id == a);

    std::cout << " OK" << std::endl;
}

void test_scrubber_dates() {
    std::cout << "  test_scrubber_dates..." << std::flush;

    auto space_id = uuid_t::generate();
    auto base = now();
    timeline tl(space_id, {
        make_event(uuid_t::generate(), space_id, event_type::created, at_seconds(base, -100), 1),
        make_event(uuid_t::generate(), space_id, event_type::created, base, 1),
    });

    auto dates = tl.scrubber_dates(11);
    assert(dates.size() == 11);
    assert(dates.front() == at_seconds(base, -100));
    assert(dates.back() == base);
    assert(dates[5] == at_seconds(base, -50));

    assert(tl.scrubber_dates(base, base, 10).size() == 1);
    assert(tl.scrubber_dates(at_seconds(base, -1), base, 1).size() == 1);

    std::cout << " OK" << std::endl;
}

void test_significant_dates() {
    std::cout << "  test_significant_dates..." << std::flush;

    auto space_id = uuid_t::generate();
    // 2024-01-01T00:00:00Z
    auto day0 = from_unix_nanos(int64_t(1704067200) * 1000000000);
    timeline tl(space_id, {
        make_event(uuid_t::generate(), space_id, event_type::created, day0 + std::chrono::hours(1), 1),
        make_event(uuid_t::generate(), space_id, event_type::created, day0 + std::chrono::hours(5), 1),
        make_event(uuid_t::generate(), space_id, event_type::created, day0 + std::chrono::hours(30), 1),
    });

    auto dates = tl.significant_dates();
    assert(dates.size() == 2);
    assert(dates[0] == day0 + std::chrono::hours(1));
    assert(dates[1] == day0 + std::chrono::hours(30));

    std::cout << " OK" << std::endl;
}

void test_diff_classification() {
    std::cout << "  test_diff_classification..." << std::flush;

    auto space_id = uuid_t::generate();
    auto base = now();
    auto stays = uuid_t::generate();
    auto moves = uuid_t::generate();
    auto retagged = uuid_t::generate();
    auto both = uuid_t::generate();
    auto removed = uuid_t::generate();
    auto added = uuid_t::generate();
    metadata_map tag{{"text", "A"}};

    timeline tl(space_id, {
        make_event(stays, space_id, event_type::created, at_seconds(base, -100), 1, translated(0, 0, 0), tag),
        make_event(moves, space_id, event_type::created, at_seconds(base, -100), 1, translated(0, 0, 0), tag),
        make_event(retagged, space_id, event_type::created, at_seconds(base, -100), 1, translated(0, 0, 0), tag),
        make_event(both, space_id, event_type::created, at_seconds(base, -100), 1, translated(0, 0, 0), tag),
        make_event(removed, space_id, event_type::created, at_seconds(base, -100), 1),
        make_event(moves, space_id, event_type::moved, at_seconds(base, -40), 2, translated(3, 4, 0)),
        make_event(retagged, space_id, event_type::updated, at_seconds(base, -40), 2, std::nullopt,
                   metadata_map{{"text", "B"}, {"new", 1}}),
        make_event(both, space_id, event_type::moved, at_seconds(base, -40), 2, translated(1, 0, 0)),
        make_event(both, space_id, event_type::updated, at_seconds(base, -30), 3, std::nullopt,
                   metadata_map{{"text", "C"}}),
        make_event(removed, space_id, event_type::deleted, at_seconds(base, -30), 2),
        make_event(added, space_id, event_type::created, at_seconds(base, -20), 1),
    });

    auto d = tl.diff(at_seconds(base, -50), base);
    assert(d.added.size() == 1 && d.added[0].id == added);
    assert(d.removed.size() == 1 && d.removed[0].id == removed);
    assert(d.moved.size() == 2);     // `both` is reported only as moved
    assert(d.updated.size() == 1 && d.updated[0].current.id == retagged);
    assert(d.unchanged.size() == 1 && d.unchanged[0].id == stays);
    assert(d.change_count() == 5);
    assert(d.has_changes());
    assert(d.summary() == "1 added, 1 removed, 2 moved, 1 updated");

    for (const auto& m : d.moved) {
        if (m.current.id == moves) {
            assert(std::fabs(m.distance_moved() - 5.0f) < 1e-5f);
            assert(m.previous_transform == translated(0, 0, 0));
        }
    }

    const auto& u = d.updated[0];
    assert(u.added_keys() == std::vector<std::string>{"new"});
    assert(u.removed_keys().empty());
    assert(u.changed_keys() == std::vector<std::string>{"text"});
    assert(u.previous_metadata == tag);

    assert(d.current_anchors().size() == 5);
    assert(d.previous_anchors().size() == 5);

    std::cout << " OK" << std::endl;
}

void test_diff_same_instant_has_no_changes() {
    std::cout << "  test_diff_same_instant_has_no_changes..." << std::flush;

    auto space_id = uuid_t::generate();
    auto a = uuid_t::generate();
    auto base = now();
    timeline tl(space_id, {
        make_event(a, space_id, event_type::created, at_seconds(base, -10), 1),
        make_event(a, space_id, event_type::moved, at_seconds(base, -5), 2, translated(1, 1, 1)),
        make_event(a, space_id, event_type::deleted, at_seconds(base, -1), 3),
    });

    for (int s : {-20, -10, -7, -5, -1, 0}) {
        auto d = tl.diff(at_seconds(base, s), at_seconds(base, s));
        assert(!d.has_changes());
        assert(d.summary() == "No changes");
    }

    std::cout << " OK" << std::endl;
}

void test_reconstruct_anchor() {
    std::cout << "  test_reconstruct_anchor..." << std::flush;

    auto space_id = uuid_t::generate();
    auto id = uuid_t::generate();
    auto base = now();

    std::vector<anchor_event> events{
        make_event(id, space_id, event_type::created, at_seconds(base, -3), 1, translated(1, 0, 0),
                   metadata_map{{"k", "v"}}),
        make_event(id, space_id, event_type::deleted, at_seconds(base, -2), 2),
    };
    auto a = reconstruct_anchor(id, events);
    assert(a.is_deleted());
    assert(a.transform == translated(1, 0, 0));

    std::vector<anchor_event> headless{events[1]};
    auto code = test_support::expect_storage_error([&] { reconstruct_anchor(id, headless); });
    assert(code == storage_errc::reconstruction_failed);
    code = test_support::expect_storage_error([&] { reconstruct_anchor(id, {}); });
    assert(code == storage_errc::reconstruction_failed);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing timeline and diff..." << std::endl;
    test_state_reconstruction();
    test_state_with_deletion_and_restore();
    test_events_without_created_are_dropped();
    test_sorting_is_stable();
    test_bounds_and_queries();
    test_scrubber_dates();
    test_significant_dates();
    test_diff_classification();
    test_diff_same_instant_has_no_changes();
    test_reconstruct_anchor();
}

} // namespace timeline_tests
