#include "anchorlog/timeline.hpp"
#include "anchorlog/errors.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace anchorlog {

namespace {

struct folded_state {
    anchor value;
    bool active = true;
};

// Applies one event to an existing state. `created` is handled by the caller.
void apply_event(folded_state& state, const anchor_event& e) {
    switch (e.type) {
        case event_type::created:
            break;
        case event_type::moved:
            if (e.transform) state.value.transform = *e.transform;
            break;
        case event_type::updated:
            if (e.metadata) state.value.metadata = *e.metadata;
            break;
        case event_type::deleted:
            state.active = false;
            state.value.deleted_at = e.timestamp;
            break;
        case event_type::restored:
            if (e.transform) state.value.transform = *e.transform;
            if (e.metadata) state.value.metadata = *e.metadata;
            state.active = true;
            state.value.deleted_at.reset();
            break;
    }
    state.value.updated_at = e.timestamp;
}

folded_state seed_state(const anchor_event& e) {
    folded_state state;
    state.value.id = e.anchor_id;
    state.value.space_id = e.space_id;
    state.value.transform = e.transform.value_or(identity_transform());
    state.value.metadata = e.metadata.value_or(metadata_map{});
    state.value.created_at = e.timestamp;
    state.value.updated_at = e.timestamp;
    return state;
}

} // namespace

timeline::timeline(const uuid_t& space_id, std::vector<anchor_event> events)
    : space_id_(space_id), events_(std::move(events)) {
    std::stable_sort(events_.begin(), events_.end(),
                     [](const anchor_event& a, const anchor_event& b) { return a.timestamp < b.timestamp; });
}

std::optional<timestamp_t> timeline::start_date() const {
    if (events_.empty()) return std::nullopt;
    return events_.front().timestamp;
}

std::optional<timestamp_t> timeline::end_date() const {
    if (events_.empty()) return std::nullopt;
    return events_.back().timestamp;
}

std::optional<std::chrono::nanoseconds> timeline::duration() const {
    if (events_.empty()) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::nanoseconds>(events_.back().timestamp - events_.front().timestamp);
}

std::vector<uuid_t> timeline::anchor_ids() const {
    std::vector<uuid_t> ids;
    std::set<uuid_t> seen;
    for (const auto& e : events_) {
        if (seen.insert(e.anchor_id).second) {
            ids.push_back(e.anchor_id);
        }
    }
    return ids;
}

std::vector<anchor_event> timeline::events_for(const uuid_t& anchor_id) const {
    std::vector<anchor_event> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out),
                 [&](const anchor_event& e) { return e.anchor_id == anchor_id; });
    return out;
}

std::vector<anchor_event> timeline::events_between(timestamp_t from, timestamp_t to) const {
    std::vector<anchor_event> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out),
                 [&](const anchor_event& e) { return e.timestamp >= from && e.timestamp <= to; });
    return out;
}

std::vector<anchor_event> timeline::events_of_type(event_type type) const {
    std::vector<anchor_event> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out),
                 [&](const anchor_event& e) { return e.type == type; });
    return out;
}

// ============================================================================
// State reconstruction
// ============================================================================

std::map<uuid_t, anchor> timeline::state_by_id(timestamp_t at) const {
    std::map<uuid_t, folded_state> states;
    for (const auto& e : events_) {
        if (e.timestamp > at) break;   // sorted
        if (e.type == event_type::created) {
            states[e.anchor_id] = seed_state(e);
            continue;
        }
        auto it = states.find(e.anchor_id);
        if (it == states.end()) continue;   // no preceding created
        apply_event(it->second, e);
    }

    std::map<uuid_t, anchor> visible;
    for (auto& [id, state] : states) {
        if (state.active) {
            visible.emplace(id, std::move(state.value));
        }
    }
    return visible;
}

std::vector<anchor> timeline::state(timestamp_t at) const {
    std::vector<anchor> out;
    for (auto& [_, a] : state_by_id(at)) {
        out.push_back(std::move(a));
    }
    return out;
}

anchorlog::diff timeline::diff(timestamp_t from, timestamp_t to) const {
    auto before = state_by_id(from);
    auto after = state_by_id(to);

    anchorlog::diff result;
    result.space_id = space_id_;
    result.from_date = from;
    result.to_date = to;

    for (const auto& [id, current] : after) {
        auto it = before.find(id);
        if (it == before.end()) {
            result.added.push_back(current);
            continue;
        }
        const anchor& previous = it->second;
        if (previous.transform != current.transform) {
            result.moved.push_back({current, previous.transform});
        } else if (previous.metadata != current.metadata) {
            result.updated.push_back({current, previous.metadata});
        } else {
            result.unchanged.push_back(current);
        }
    }
    for (const auto& [id, previous] : before) {
        if (!after.count(id)) {
            result.removed.push_back(previous);
        }
    }
    return result;
}

// ============================================================================
// Navigation helpers
// ============================================================================

std::vector<timestamp_t> timeline::scrubber_dates(timestamp_t from, timestamp_t to, int steps) const {
    if (!(from < to) || steps <= 1) {
        return {from};
    }
    std::vector<timestamp_t> dates;
    dates.reserve(static_cast<size_t>(steps));
    auto span = std::chrono::duration<double, timestamp_t::period>(to - from);
    for (int i = 0; i < steps - 1; ++i) {
        auto offset = span * (static_cast<double>(i) / static_cast<double>(steps - 1));
        dates.push_back(from + std::chrono::duration_cast<timestamp_t::duration>(offset));
    }
    dates.push_back(to);
    return dates;
}

std::vector<timestamp_t> timeline::scrubber_dates(int steps) const {
    auto t = now();
    return scrubber_dates(start_date().value_or(t), end_date().value_or(t), steps);
}

std::optional<anchor_event> timeline::closest_event(timestamp_t date) const {
    const anchor_event* best = nullptr;
    timestamp_t::duration best_distance{};
    for (const auto& e : events_) {
        auto distance = e.timestamp > date ? e.timestamp - date : date - e.timestamp;
        if (!best || distance < best_distance) {
            best = &e;
            best_distance = distance;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::vector<timestamp_t> timeline::significant_dates() const {
    std::vector<timestamp_t> dates;
    std::set<int64_t> seen_days;
    for (const auto& e : events_) {
        auto day = std::chrono::floor<std::chrono::days>(e.timestamp).time_since_epoch().count();
        if (seen_days.insert(day).second) {
            dates.push_back(e.timestamp);
        }
    }
    return dates;
}

// ============================================================================
// Single-anchor reconstruction
// ============================================================================

anchor reconstruct_anchor(const uuid_t& anchor_id, const std::vector<anchor_event>& events) {
    if (events.empty() || events.front().type != event_type::created) {
        throw storage_error::reconstruction_failed(anchor_id);
    }
    auto state = seed_state(events.front());
    for (size_t i = 1; i < events.size(); ++i) {
        if (events[i].anchor_id != anchor_id) continue;
        if (events[i].type == event_type::created) {
            throw storage_error::reconstruction_failed(anchor_id);
        }
        apply_event(state, events[i]);
    }
    return state.value;
}

} // namespace anchorlog
