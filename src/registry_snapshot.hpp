#pragma once

#include "message.hpp"
#include "topic_pattern.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shadowsync {

// A routed, deserialized message as seen by subscription callbacks.
struct delivery {
    std::string topic;
    message_envelope envelope;
    nlohmann::json payload;
    uint32_t delivery_count = 1;
};

// Return false (or throw) to report failure; the message is then requeued.
using subscription_callback = std::function<bool(const delivery&)>;

struct subscription {
    uint64_t id;
    std::string subscriber;  // opaque owner token
    topic_pattern pattern;
    subscription_callback callback;
    bool exclusive = false;  // removed when the broker connection drops
    bool one_shot = false;   // removed after the first successful delivery

    // Held by the worker currently delivering a one-shot subscription.
    mutable std::atomic<bool> claimed{false};
};

// Immutable view of all subscriptions, in registration order.
// Shared by worker threads via shared_ptr<const registry_snapshot>.
struct registry_snapshot {
    std::vector<std::shared_ptr<const subscription>> subscriptions;
    uint64_t generation = 0;
};

} // namespace shadowsync
