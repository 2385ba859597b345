#include "shadow_document.hpp"
#include <chrono>

namespace shadowsync {

timestamp_ms current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<std::string> shadow_document::pending() const {
    std::vector<std::string> out;
    for (const auto& [name, prop] : desired) {
        if (!prop.applied) out.push_back(name);
    }
    return out;
}

const property_change* shadow_delta::find(shadow_section section, const std::string& property) const {
    for (const auto& c : changes) {
        if (c.section == section && c.property == property) return &c;
    }
    return nullptr;
}

const char* to_string(shadow_section s) {
    switch (s) {
        case shadow_section::reported: return "reported";
        case shadow_section::desired:  return "desired";
    }
    return "unknown";
}

const char* to_string(change_kind k) {
    switch (k) {
        case change_kind::added:   return "added";
        case change_kind::changed: return "changed";
        case change_kind::removed: return "removed";
    }
    return "unknown";
}

const char* to_string(delta_classification c) {
    switch (c) {
        case delta_classification::none:             return "none";
        case delta_classification::reported_changed: return "reported-changed";
        case delta_classification::desired_changed:  return "desired-changed";
        case delta_classification::both:             return "both";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const shadow_delta& delta) {
    nlohmann::json reported = nlohmann::json::object();
    nlohmann::json desired = nlohmann::json::object();
    nlohmann::json changes = nlohmann::json::array();

    for (const auto& c : delta.changes) {
        auto& section = c.section == shadow_section::reported ? reported : desired;
        section[c.property] = c.new_value;
        changes.push_back({
            {"section", to_string(c.section)},
            {"property", c.property},
            {"kind", to_string(c.kind)},
            {"old", c.old_value},
            {"new", c.new_value}
        });
    }

    j = {
        {"device_id", delta.device_id},
        {"from_version", delta.from_version},
        {"to_version", delta.to_version},
        {"classification", to_string(delta.classification)},
        {"timestamp", delta.timestamp},
        {"reported", std::move(reported)},
        {"desired", std::move(desired)},
        {"changes", std::move(changes)}
    };
}

void to_json(nlohmann::json& j, const shadow_document& doc) {
    nlohmann::json reported = nlohmann::json::object();
    for (const auto& [name, prop] : doc.reported) {
        reported[name] = {{"value", prop.value}, {"timestamp", prop.timestamp}};
    }

    nlohmann::json desired = nlohmann::json::object();
    for (const auto& [name, prop] : doc.desired) {
        desired[name] = {
            {"value", prop.value},
            {"timestamp", prop.timestamp},
            {"status", prop.applied ? "applied" : "pending"}
        };
    }

    j = {
        {"device_id", doc.device_id},
        {"version", doc.version},
        {"last_modified", doc.last_modified},
        {"active", doc.active},
        {"reported", std::move(reported)},
        {"desired", std::move(desired)},
        {"removed", {
            {"reported", doc.removed_reported},
            {"desired", doc.removed_desired}
        }}
    };
}

void to_json(nlohmann::json& j, const drift_entry& entry) {
    j = {
        {"property", entry.property},
        {"reported", entry.reported},
        {"desired", entry.desired},
        {"status", entry.applied ? "applied" : "pending"}
    };
}

} // namespace shadowsync
