#pragma once

#ifdef __cplusplus

#include "diff.hpp"
#include "models.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <vector>

namespace anchorlog {

// ============================================================================
// timeline - a space's events in timestamp order, folded into state on demand
// ============================================================================

class timeline {
public:
    /// Events are stably sorted by timestamp; equal timestamps keep input order.
    timeline(const uuid_t& space_id, std::vector<anchor_event> events);

    const uuid_t& space_id() const { return space_id_; }
    const std::vector<anchor_event>& events() const { return events_; }
    bool empty() const { return events_.empty(); }
    size_t size() const { return events_.size(); }

    std::optional<timestamp_t> start_date() const;
    std::optional<timestamp_t> end_date() const;
    std::optional<std::chrono::nanoseconds> duration() const;

    /// Distinct anchor ids in order of first appearance.
    std::vector<uuid_t> anchor_ids() const;
    std::vector<anchor_event> events_for(const uuid_t& anchor_id) const;
    /// Events with from <= timestamp <= to.
    std::vector<anchor_event> events_between(timestamp_t from, timestamp_t to) const;
    std::vector<anchor_event> events_of_type(event_type type) const;

    /// Visible anchors at `at`, ordered by id. Anchors whose events do not
    /// start with a created event are left out.
    std::vector<anchor> state(timestamp_t at) const;
    std::map<uuid_t, anchor> state_by_id(timestamp_t at) const;

    anchorlog::diff diff(timestamp_t from, timestamp_t to) const;

    /// `steps` evenly spaced instants from `from` to `to`, both included.
    /// A single instant when the range is empty or steps <= 1.
    std::vector<timestamp_t> scrubber_dates(timestamp_t from, timestamp_t to, int steps = 100) const;
    /// Same, over start_date()..end_date().
    std::vector<timestamp_t> scrubber_dates(int steps = 100) const;

    /// Event nearest to `date`; the earlier one on a tie.
    std::optional<anchor_event> closest_event(timestamp_t date) const;

    /// Timestamp of the first event of each UTC day that has events.
    std::vector<timestamp_t> significant_dates() const;

private:
    uuid_t space_id_;
    std::vector<anchor_event> events_;
};

/// Folds one anchor's events (ordered by version) into its state. The first
/// event must be `created`; otherwise throws storage_error(reconstruction_failed).
anchor reconstruct_anchor(const uuid_t& anchor_id, const std::vector<anchor_event>& events);

} // namespace anchorlog

#endif // __cplusplus
