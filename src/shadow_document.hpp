#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace shadowsync {

// Milliseconds since the Unix epoch.
using timestamp_ms = int64_t;

timestamp_ms current_time_ms();

struct reported_property {
    nlohmann::json value;
    timestamp_ms timestamp = 0;
};

struct desired_property {
    nlohmann::json value;
    timestamp_ms timestamp = 0;
    bool applied = false;  // false = pending device confirmation
};

struct shadow_document {
    std::string device_id;
    std::map<std::string, reported_property> reported;
    std::map<std::string, desired_property> desired;

    // Removal time of deleted properties. Values older than the removal are
    // stale; a newer value clears the tombstone.
    std::map<std::string, timestamp_ms> removed_reported;
    std::map<std::string, timestamp_ms> removed_desired;

    uint64_t version = 0;
    timestamp_ms last_modified = 0;
    bool active = true;

    // Desired properties not yet confirmed by the device.
    std::vector<std::string> pending() const;
};

enum class shadow_section {
    reported,
    desired
};

enum class change_kind {
    added,
    changed,
    removed
};

enum class delta_classification {
    none,
    reported_changed,
    desired_changed,
    both
};

struct property_change {
    shadow_section section;
    std::string property;
    change_kind kind;
    nlohmann::json old_value;
    nlohmann::json new_value;
};

// Property changes between two consecutive document versions.
struct shadow_delta {
    std::string device_id;
    uint64_t from_version = 0;
    uint64_t to_version = 0;
    delta_classification classification = delta_classification::none;
    timestamp_ms timestamp = 0;
    std::vector<property_change> changes;

    // Properties rejected because a newer value is already stored.
    std::vector<std::string> ignored;
    // Desired properties confirmed by this mutation.
    std::vector<std::string> applied;

    bool empty() const { return changes.empty(); }

    // Change for `property` in `section`, or nullptr.
    const property_change* find(shadow_section section, const std::string& property) const;
};

// One property where desired and reported disagree.
struct drift_entry {
    std::string property;
    nlohmann::json reported;  // null when never reported
    nlohmann::json desired;
    bool applied = false;
};

const char* to_string(shadow_section s);
const char* to_string(change_kind k);
const char* to_string(delta_classification c);

void to_json(nlohmann::json& j, const shadow_delta& delta);
void to_json(nlohmann::json& j, const shadow_document& doc);
void to_json(nlohmann::json& j, const drift_entry& entry);

} // namespace shadowsync
