#pragma once

#include "registry_snapshot.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace shadowsync {

struct subscription_options {
    std::string subscriber;
    bool exclusive = false;
    bool one_shot = false;
};

// Maps subscription ids to pattern + callback.
// Uses RCU-style snapshot swapping: readers get a lock-free shared_ptr<const registry_snapshot>,
// writers serialize via mutex and atomically publish new snapshots.
class subscription_registry {
public:
    explicit subscription_registry(std::shared_ptr<spdlog::logger> log);

    // Returns the new subscription id. Throws invalid_pattern_error.
    uint64_t register_subscription(const std::string& pattern,
                                   subscription_callback callback,
                                   subscription_options opts = {});

    // Returns true if the subscription existed.
    bool unregister(uint64_t subscription_id);

    // Remove every subscription owned by `subscriber`. Returns the count removed.
    std::size_t unregister_subscriber(const std::string& subscriber);

    // Remove all exclusive subscriptions (connection loss). Returns the count removed.
    std::size_t drop_exclusive();

    // Matching subscriptions in registration order.
    std::vector<std::shared_ptr<const subscription>> resolve(std::string_view topic) const;

    std::shared_ptr<const subscription> get(uint64_t id) const;

    // Get an immutable snapshot for lock-free concurrent reads.
    std::shared_ptr<const registry_snapshot> snapshot() const;

    std::size_t active_count() const;

private:
    template <typename Pred>
    std::size_t remove_if(Pred pred, const char* reason);

    void publish_snapshot(std::vector<std::shared_ptr<const subscription>> subs);

    std::shared_ptr<spdlog::logger> m_log;

    // Serializes all write operations.
    std::mutex m_write_mutex;
    uint64_t m_next_id = 1;

    // Current snapshot; atomic load/store for lock-free reader access.
    std::shared_ptr<const registry_snapshot> m_snapshot;
};

} // namespace shadowsync
