#pragma once

#include "device_registry.hpp"
#include "shadow_document.hpp"
#include "shadow_repository.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shadowsync {

struct store_options {
    std::size_t lock_shards = 64;
    std::size_t history_limit = 100;

    // Remove desired entries once the device confirms them.
    bool prune_applied_desired = false;
};

enum class lifecycle_event {
    created,
    decommissioned
};

const char* to_string(lifecycle_event e);

// Authoritative per-device shadow state.
//
// Mutations for one device are serialized on that device's mutex; devices
// never share a mutation lock. The device table itself is split into
// `lock_shards` independently locked maps so that lookups for unrelated
// devices do not contend.
//
// Every mutation follows the same sequence: copy the document, merge the
// incoming properties (last-writer-wins per property), save the copy to the
// repository and only then make it current. A failing save leaves the stored
// state untouched.
class shadow_store {
public:
    // Listeners run under the device lock, so one device's notifications are
    // delivered in version order. They must not call back into the store.
    using lifecycle_listener = std::function<void(lifecycle_event, const shadow_document&)>;
    using delta_listener = std::function<void(const shadow_delta&)>;

    shadow_store(const store_options& opts,
                 std::shared_ptr<shadow_repository> repository,
                 std::shared_ptr<device_registry> devices,
                 std::shared_ptr<spdlog::logger> log);

    shadow_store(const shadow_store&) = delete;
    shadow_store& operator=(const shadow_store&) = delete;

    void on_lifecycle(lifecycle_listener listener);

    // Called with every committed versioned delta.
    void on_delta(delta_listener listener);

    // Merge device-asserted properties. A null value removes the property.
    // Throws device_not_found_error, device_decommissioned_error, or
    // std::invalid_argument when `properties` is not an object.
    shadow_delta apply_reported(const std::string& device_id,
                                const nlohmann::json& properties,
                                timestamp_ms timestamp);

    // Merge operator-requested properties. Every changed entry becomes
    // pending; a later report of the same value or mark_applied confirms it.
    // Throws version_conflict_error when `expected_version` is set and stale.
    shadow_delta apply_desired(const std::string& device_id,
                               const nlohmann::json& properties,
                               timestamp_ms timestamp,
                               std::optional<uint64_t> expected_version = std::nullopt);

    // Current document. A registered device without a stored shadow yields
    // an empty version 0 document.
    shadow_document get(const std::string& device_id);

    // Flag pending desired entries as applied. Flags are metadata and do not
    // advance the version; with pruning enabled the flagged entries are
    // removed instead, which does. `applied` in the result lists the flipped
    // names.
    shadow_delta mark_applied(const std::string& device_id,
                              const std::vector<std::string>& properties);

    // Remove desired entries; an empty list clears all of them.
    shadow_delta clear_desired(const std::string& device_id,
                               const std::vector<std::string>& properties = {});

    // Desired properties whose value differs from the reported one.
    std::vector<drift_entry> drift(const std::string& device_id);

    // Prior versions, newest first. limit 0 = everything retained.
    std::vector<shadow_document> history(const std::string& device_id, std::size_t limit = 0);

    // Register the device and create its shadow at version 0. Returns the
    // existing document when already registered.
    shadow_document register_device(const std::string& device_id);

    // Mark the shadow inactive. Reads keep working; mutations throw
    // device_decommissioned_error.
    shadow_document decommission(const std::string& device_id);

    // Number of shadows held in memory.
    std::size_t size() const { return m_count.load(std::memory_order_relaxed); }

    static std::size_t shard_index(std::string_view device_id, std::size_t shard_count);

private:
    struct device_slot {
        std::mutex mutex;
        bool loaded = false;
        bool stored = false;  // false until the document exists in the repository
        shadow_document doc;
        std::deque<shadow_document> history;  // newest at the back
    };

    struct shard {
        std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<device_slot>> slots;
    };

    // Slot for `device_id`, inserted on first use. Throws device_not_found_error
    // when the device registry does not know the id.
    std::shared_ptr<device_slot> slot_for(const std::string& device_id);

    // Load the document from the repository if this slot has not been loaded.
    // Caller holds slot.mutex.
    void ensure_loaded(const std::string& device_id, device_slot& slot);

    // Create and persist the version 0 document. Caller holds slot.mutex.
    void create_document(const std::string& device_id, device_slot& slot);

    // Throws when the device cannot be mutated. Caller holds slot.mutex.
    void check_mutable(const std::string& device_id, device_slot& slot);

    // Persist `next` and make it current. Bumps the version when `delta` has
    // changes; `touched` forces a save for metadata-only updates.
    void commit(device_slot& slot, shadow_document next, shadow_delta& delta, bool touched);

    static delta_classification classify(const std::vector<property_change>& changes);

    store_options m_opts;
    std::shared_ptr<shadow_repository> m_repository;
    std::shared_ptr<device_registry> m_devices;
    std::shared_ptr<spdlog::logger> m_log;

    std::vector<std::unique_ptr<shard>> m_shards;
    std::atomic<std::size_t> m_count{0};

    std::mutex m_listener_mutex;
    std::vector<lifecycle_listener> m_listeners;
    std::vector<delta_listener> m_delta_listeners;
};

} // namespace shadowsync
