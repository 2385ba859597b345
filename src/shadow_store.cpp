#include "shadow_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace shadowsync {

namespace {

void require_object(const nlohmann::json& properties) {
    if (!properties.is_object()) {
        throw std::invalid_argument("shadow properties must be a JSON object, got " +
                                    std::string(properties.type_name()));
    }
}

// True when `timestamp` is older than the stored value for `name`, or than
// its removal when the property is gone.
template <typename Section>
bool is_stale(const Section& section, const std::map<std::string, timestamp_ms>& removed,
              const std::string& name, timestamp_ms timestamp) {
    auto it = section.find(name);
    if (it != section.end()) return timestamp < it->second.timestamp;
    auto tomb = removed.find(name);
    return tomb != removed.end() && timestamp < tomb->second;
}

} // anonymous namespace

const char* to_string(lifecycle_event e) {
    switch (e) {
        case lifecycle_event::created:        return "created";
        case lifecycle_event::decommissioned: return "decommissioned";
    }
    return "unknown";
}

shadow_store::shadow_store(const store_options& opts,
                           std::shared_ptr<shadow_repository> repository,
                           std::shared_ptr<device_registry> devices,
                           std::shared_ptr<spdlog::logger> log)
    : m_opts(opts), m_repository(std::move(repository)),
      m_devices(std::move(devices)), m_log(std::move(log))
{
    if (m_opts.lock_shards == 0) m_opts.lock_shards = 1;
    m_shards.reserve(m_opts.lock_shards);
    for (std::size_t i = 0; i < m_opts.lock_shards; ++i) {
        m_shards.push_back(std::make_unique<shard>());
    }
}

void shadow_store::on_lifecycle(lifecycle_listener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_listeners.push_back(std::move(listener));
}

void shadow_store::on_delta(delta_listener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_delta_listeners.push_back(std::move(listener));
}

std::size_t shadow_store::shard_index(std::string_view device_id, std::size_t shard_count) {
    if (shard_count == 0) return 0;
    return std::hash<std::string_view>{}(device_id) % shard_count;
}

std::shared_ptr<shadow_store::device_slot> shadow_store::slot_for(const std::string& device_id) {
    auto& s = *m_shards[shard_index(device_id, m_shards.size())];
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.slots.find(device_id);
    if (it != s.slots.end()) return it->second;

    if (!m_devices->exists(device_id)) {
        throw device_not_found_error(device_id);
    }

    auto slot = std::make_shared<device_slot>();
    s.slots.emplace(device_id, slot);
    return slot;
}

void shadow_store::ensure_loaded(const std::string& device_id, device_slot& slot) {
    if (slot.loaded) return;

    auto doc = m_repository->load_shadow(device_id);
    if (doc) {
        slot.doc = std::move(*doc);
        slot.stored = true;
        m_count.fetch_add(1, std::memory_order_relaxed);
        m_log->debug("Loaded shadow '{}' at version {}", device_id, slot.doc.version);
    } else {
        slot.doc = shadow_document{};
        slot.doc.device_id = device_id;
    }
    slot.loaded = true;
}

void shadow_store::create_document(const std::string& device_id, device_slot& slot) {
    shadow_document doc;
    doc.device_id = device_id;
    doc.last_modified = current_time_ms();

    m_repository->save_shadow(doc);
    slot.doc = std::move(doc);
    slot.stored = true;
    m_count.fetch_add(1, std::memory_order_relaxed);

    m_log->info("Created shadow for device '{}'", device_id);

    std::lock_guard<std::mutex> lock(m_listener_mutex);
    for (auto& listener : m_listeners) listener(lifecycle_event::created, slot.doc);
}

void shadow_store::check_mutable(const std::string& device_id, device_slot& slot) {
    ensure_loaded(device_id, slot);
    if (slot.stored && !slot.doc.active) {
        throw device_decommissioned_error(device_id);
    }
    if (!m_devices->exists(device_id)) {
        throw device_not_found_error(device_id);
    }
    if (!slot.stored) {
        create_document(device_id, slot);
    }
}

delta_classification shadow_store::classify(const std::vector<property_change>& changes) {
    bool reported = false;
    bool desired = false;
    for (const auto& c : changes) {
        if (c.section == shadow_section::reported) reported = true;
        else desired = true;
    }
    if (reported && desired) return delta_classification::both;
    if (reported) return delta_classification::reported_changed;
    if (desired) return delta_classification::desired_changed;
    return delta_classification::none;
}

void shadow_store::commit(device_slot& slot, shadow_document next, shadow_delta& delta, bool touched) {
    bool versioned = !delta.changes.empty();

    if (versioned) {
        next.version = slot.doc.version + 1;
        next.last_modified = std::max(slot.doc.last_modified, delta.timestamp);
        delta.to_version = next.version;
        delta.classification = classify(delta.changes);
    } else {
        delta.to_version = delta.from_version;
        if (!touched) return;
    }

    m_repository->save_shadow(next);

    if (versioned && m_opts.history_limit > 0) {
        slot.history.push_back(std::move(slot.doc));
        while (slot.history.size() > m_opts.history_limit) {
            slot.history.pop_front();
        }
    }
    slot.doc = std::move(next);

    if (!versioned) return;

    m_log->debug("Shadow '{}' v{} -> v{} ({}, {} changes)",
                 delta.device_id, delta.from_version, delta.to_version,
                 to_string(delta.classification), delta.changes.size());

    std::vector<delta_listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        listeners = m_delta_listeners;
    }
    for (auto& listener : listeners) listener(delta);
}

shadow_delta shadow_store::apply_reported(const std::string& device_id,
                                          const nlohmann::json& properties,
                                          timestamp_ms timestamp)
{
    require_object(properties);

    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    check_mutable(device_id, *slot);

    shadow_document next = slot->doc;
    shadow_delta delta;
    delta.device_id = device_id;
    delta.from_version = next.version;
    delta.timestamp = timestamp;
    bool touched = false;

    for (const auto& [name, value] : properties.items()) {
        auto it = next.reported.find(name);
        auto tomb = next.removed_reported.find(name);

        if (is_stale(next.reported, next.removed_reported, name, timestamp)) {
            delta.ignored.push_back(name);
            continue;
        }

        if (value.is_null()) {
            if (it != next.reported.end()) {
                delta.changes.push_back({shadow_section::reported, name, change_kind::removed,
                                         it->second.value, nullptr});
                next.reported.erase(it);
                next.removed_reported[name] = timestamp;
            } else if (tomb == next.removed_reported.end() || timestamp > tomb->second) {
                next.removed_reported[name] = timestamp;
                touched = true;
            }
            continue;
        }

        if (tomb != next.removed_reported.end()) next.removed_reported.erase(tomb);

        if (it == next.reported.end()) {
            delta.changes.push_back({shadow_section::reported, name, change_kind::added,
                                     nullptr, value});
            next.reported.emplace(name, reported_property{value, timestamp});
        } else if (it->second.value == value) {
            if (timestamp > it->second.timestamp) {
                it->second.timestamp = timestamp;
                touched = true;
            }
        } else {
            delta.changes.push_back({shadow_section::reported, name, change_kind::changed,
                                     it->second.value, value});
            it->second.value = value;
            it->second.timestamp = timestamp;
        }

        // The device now reports what the operator asked for.
        auto d = next.desired.find(name);
        if (d != next.desired.end() && !d->second.applied && d->second.value == value) {
            delta.applied.push_back(name);
            touched = true;
            if (m_opts.prune_applied_desired) {
                delta.changes.push_back({shadow_section::desired, name, change_kind::removed,
                                         d->second.value, nullptr});
                next.removed_desired[name] = d->second.timestamp;
                next.desired.erase(d);
            } else {
                d->second.applied = true;
            }
        }
    }

    commit(*slot, std::move(next), delta, touched);
    return delta;
}

shadow_delta shadow_store::apply_desired(const std::string& device_id,
                                         const nlohmann::json& properties,
                                         timestamp_ms timestamp,
                                         std::optional<uint64_t> expected_version)
{
    require_object(properties);

    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    check_mutable(device_id, *slot);

    if (expected_version && *expected_version != slot->doc.version) {
        throw version_conflict_error(*expected_version, slot->doc.version);
    }

    shadow_document next = slot->doc;
    shadow_delta delta;
    delta.device_id = device_id;
    delta.from_version = next.version;
    delta.timestamp = timestamp;
    bool touched = false;

    for (const auto& [name, value] : properties.items()) {
        auto it = next.desired.find(name);
        auto tomb = next.removed_desired.find(name);

        if (is_stale(next.desired, next.removed_desired, name, timestamp)) {
            delta.ignored.push_back(name);
            continue;
        }

        if (value.is_null()) {
            if (it != next.desired.end()) {
                delta.changes.push_back({shadow_section::desired, name, change_kind::removed,
                                         it->second.value, nullptr});
                next.desired.erase(it);
                next.removed_desired[name] = timestamp;
            } else if (tomb == next.removed_desired.end() || timestamp > tomb->second) {
                next.removed_desired[name] = timestamp;
                touched = true;
            }
            continue;
        }

        if (tomb != next.removed_desired.end()) next.removed_desired.erase(tomb);

        if (it != next.desired.end() && it->second.value == value) {
            if (timestamp > it->second.timestamp) {
                it->second.timestamp = timestamp;
                touched = true;
            }
            continue;
        }

        // Pending until the device reports the value or mark_applied runs,
        // even when the current reported value already matches.
        if (it == next.desired.end()) {
            delta.changes.push_back({shadow_section::desired, name, change_kind::added,
                                     nullptr, value});
            next.desired.emplace(name, desired_property{value, timestamp, false});
        } else {
            delta.changes.push_back({shadow_section::desired, name, change_kind::changed,
                                     it->second.value, value});
            it->second.value = value;
            it->second.timestamp = timestamp;
            it->second.applied = false;
        }
    }

    commit(*slot, std::move(next), delta, touched);
    return delta;
}

shadow_document shadow_store::get(const std::string& device_id) {
    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    ensure_loaded(device_id, *slot);
    return slot->doc;
}

shadow_delta shadow_store::mark_applied(const std::string& device_id,
                                        const std::vector<std::string>& properties)
{
    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    check_mutable(device_id, *slot);

    shadow_document next = slot->doc;
    shadow_delta delta;
    delta.device_id = device_id;
    delta.from_version = next.version;
    delta.timestamp = current_time_ms();

    for (const auto& name : properties) {
        auto it = next.desired.find(name);
        if (it == next.desired.end() || it->second.applied) continue;

        delta.applied.push_back(name);
        if (m_opts.prune_applied_desired) {
            delta.changes.push_back({shadow_section::desired, name, change_kind::removed,
                                     it->second.value, nullptr});
            next.removed_desired[name] = it->second.timestamp;
            next.desired.erase(it);
        } else {
            it->second.applied = true;
        }
    }

    commit(*slot, std::move(next), delta, !delta.applied.empty());
    return delta;
}

shadow_delta shadow_store::clear_desired(const std::string& device_id,
                                         const std::vector<std::string>& properties)
{
    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    check_mutable(device_id, *slot);

    shadow_document next = slot->doc;
    shadow_delta delta;
    delta.device_id = device_id;
    delta.from_version = next.version;
    delta.timestamp = current_time_ms();

    auto remove = [&](std::map<std::string, desired_property>::iterator it) {
        delta.changes.push_back({shadow_section::desired, it->first, change_kind::removed,
                                 it->second.value, nullptr});
        next.removed_desired[it->first] = std::max(delta.timestamp, it->second.timestamp);
        return next.desired.erase(it);
    };

    if (properties.empty()) {
        for (auto it = next.desired.begin(); it != next.desired.end();) {
            it = remove(it);
        }
    } else {
        for (const auto& name : properties) {
            auto it = next.desired.find(name);
            if (it != next.desired.end()) remove(it);
        }
    }

    commit(*slot, std::move(next), delta, false);
    return delta;
}

std::vector<drift_entry> shadow_store::drift(const std::string& device_id) {
    auto doc = get(device_id);

    std::vector<drift_entry> out;
    for (const auto& [name, want] : doc.desired) {
        auto it = doc.reported.find(name);
        if (it != doc.reported.end() && it->second.value == want.value) continue;

        drift_entry e;
        e.property = name;
        e.reported = it != doc.reported.end() ? it->second.value : nlohmann::json();
        e.desired = want.value;
        e.applied = want.applied;
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<shadow_document> shadow_store::history(const std::string& device_id, std::size_t limit) {
    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    ensure_loaded(device_id, *slot);

    std::vector<shadow_document> out;
    for (auto it = slot->history.rbegin(); it != slot->history.rend(); ++it) {
        if (limit > 0 && out.size() >= limit) break;
        out.push_back(*it);
    }
    return out;
}

shadow_document shadow_store::register_device(const std::string& device_id) {
    if (device_id.empty()) {
        throw std::invalid_argument("device id must not be empty");
    }
    m_devices->add(device_id);

    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    ensure_loaded(device_id, *slot);

    if (!slot->stored) {
        create_document(device_id, *slot);
    } else if (!slot->doc.active) {
        throw device_decommissioned_error(device_id);
    }
    return slot->doc;
}

shadow_document shadow_store::decommission(const std::string& device_id) {
    auto slot = slot_for(device_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    check_mutable(device_id, *slot);

    shadow_document next = slot->doc;
    next.active = false;
    next.last_modified = current_time_ms();

    m_repository->save_shadow(next);
    slot->doc = std::move(next);

    m_log->info("Decommissioned shadow for device '{}' at version {}",
                device_id, slot->doc.version);

    std::lock_guard<std::mutex> listeners_lock(m_listener_mutex);
    for (auto& listener : m_listeners) listener(lifecycle_event::decommissioned, slot->doc);
    return slot->doc;
}

} // namespace shadowsync
