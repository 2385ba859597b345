#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace shadowsync {

inline constexpr const char* default_content_type = "application/json";

struct message_envelope {
    std::string content_type = default_content_type;
    std::optional<std::string> message_id;
    std::optional<std::string> correlation_id;
    std::optional<std::string> reply_to;
    std::map<std::string, std::string> headers;

    std::optional<std::string> header(const std::string& name) const {
        auto it = headers.find(name);
        if (it != headers.end()) return it->second;
        return std::nullopt;
    }
};

// Final decision for one inbound message.
enum class settle_outcome {
    ack,
    nack_requeue,
    nack_discard
};

struct inbound_message {
    std::string topic;
    message_envelope envelope;
    std::string body;

    // 1 on first delivery, incremented on every requeue.
    uint32_t delivery_count = 1;

    // Installed by the broker connection; called exactly once per delivery.
    std::function<void(settle_outcome)> settle;
};

inline const char* to_string(settle_outcome o) {
    switch (o) {
        case settle_outcome::ack:          return "ack";
        case settle_outcome::nack_requeue: return "nack_requeue";
        case settle_outcome::nack_discard: return "nack_discard";
    }
    return "unknown";
}

} // namespace shadowsync
