#include "anchorlog/diff.hpp"
#include <cmath>

namespace anchorlog {

float moved_anchor::distance_moved() const {
    auto a = previous_position();
    auto b = current_position();
    float dx = b.x - a.x;
    float dy = b.y - a.y;
    float dz = b.z - a.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

std::vector<std::string> updated_anchor::added_keys() const {
    std::vector<std::string> keys;
    for (const auto& [key, _] : current.metadata) {
        if (!previous_metadata.count(key)) keys.push_back(key);
    }
    return keys;
}

std::vector<std::string> updated_anchor::removed_keys() const {
    std::vector<std::string> keys;
    for (const auto& [key, _] : previous_metadata) {
        if (!current.metadata.count(key)) keys.push_back(key);
    }
    return keys;
}

std::vector<std::string> updated_anchor::changed_keys() const {
    std::vector<std::string> keys;
    for (const auto& [key, value] : current.metadata) {
        auto it = previous_metadata.find(key);
        if (it != previous_metadata.end() && it->second != value) keys.push_back(key);
    }
    return keys;
}

std::string diff::summary() const {
    std::string out;
    auto append = [&](size_t count, const char* label) {
        if (count == 0) return;
        if (!out.empty()) out += ", ";
        out += std::to_string(count) + " " + label;
    };
    append(added.size(), "added");
    append(removed.size(), "removed");
    append(moved.size(), "moved");
    append(updated.size(), "updated");
    return out.empty() ? "No changes" : out;
}

std::vector<anchor> diff::current_anchors() const {
    std::vector<anchor> out = added;
    for (const auto& m : moved) out.push_back(m.current);
    for (const auto& u : updated) out.push_back(u.current);
    out.insert(out.end(), unchanged.begin(), unchanged.end());
    return out;
}

std::vector<anchor> diff::previous_anchors() const {
    std::vector<anchor> out = removed;
    for (const auto& m : moved) {
        anchor prev = m.current;
        prev.transform = m.previous_transform;
        out.push_back(prev);
    }
    for (const auto& u : updated) {
        anchor prev = u.current;
        prev.metadata = u.previous_metadata;
        out.push_back(prev);
    }
    out.insert(out.end(), unchanged.begin(), unchanged.end());
    return out;
}

} // namespace anchorlog
