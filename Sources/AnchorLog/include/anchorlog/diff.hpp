#pragma once

#ifdef __cplusplus

#include "models.hpp"
#include <string>
#include <vector>

namespace anchorlog {

// ============================================================================
// diff - changes to a space between two instants
// ============================================================================

struct moved_anchor {
    anchor current;                 // state at to_date
    transform_t previous_transform; // transform at from_date

    position3 previous_position() const { return translation_of(previous_transform); }
    position3 current_position() const { return current.position(); }
    /// Euclidean distance between the two translations.
    float distance_moved() const;

    bool operator==(const moved_anchor& other) const {
        return current == other.current && previous_transform == other.previous_transform;
    }
};

struct updated_anchor {
    anchor current;
    metadata_map previous_metadata;

    std::vector<std::string> added_keys() const;
    std::vector<std::string> removed_keys() const;
    /// Keys present in both with different values.
    std::vector<std::string> changed_keys() const;

    bool operator==(const updated_anchor& other) const {
        return current == other.current && previous_metadata == other.previous_metadata;
    }
};

struct diff {
    uuid_t space_id;
    timestamp_t from_date;
    timestamp_t to_date;
    std::vector<anchor> added;
    std::vector<anchor> removed;
    std::vector<moved_anchor> moved;
    std::vector<updated_anchor> updated;
    std::vector<anchor> unchanged;

    size_t change_count() const {
        return added.size() + removed.size() + moved.size() + updated.size();
    }
    bool has_changes() const { return change_count() > 0; }

    /// e.g. "2 added, 1 moved", or "No changes".
    std::string summary() const;

    /// Every anchor visible at to_date.
    std::vector<anchor> current_anchors() const;
    /// Every anchor visible at from_date.
    std::vector<anchor> previous_anchors() const;
};

} // namespace anchorlog

#endif // __cplusplus
