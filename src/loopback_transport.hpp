#pragma once

#include "topic_pattern.hpp"
#include "transport.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace shadowsync {

// In-process transport. Published messages are routed synchronously to the
// matching subscriptions; queue groups receive round-robin.
class loopback_transport : public transport {
public:
    struct published_message {
        std::string topic;
        message_envelope envelope;
        std::string body;
    };

    asio::awaitable<transport_status> open(std::string exchange) override;
    void close() override;
    bool is_open() const override;

    asio::awaitable<transport_status> publish(
        std::string topic, message_envelope envelope, std::string body) override;

    asio::awaitable<std::pair<uint64_t, transport_status>> subscribe(
        std::string pattern, std::string queue_group, message_handler handler) override;

    void unsubscribe(uint64_t handle) override;
    void on_connection_lost(lost_handler handler) override;

    // Simulate a dropped session: subscriptions are discarded and the
    // connection-lost handler fires.
    void drop();

    // Make the next `count` open() attempts fail.
    void fail_next_opens(unsigned int count);

    std::vector<published_message> published() const;
    std::size_t subscription_count() const;
    unsigned int open_attempts() const;
    const std::string& exchange() const { return m_exchange; }

private:
    struct entry {
        topic_pattern pattern;
        std::string queue_group;
        message_handler handler;
    };

    mutable std::mutex m_mutex;
    bool m_open = false;
    std::string m_exchange;
    unsigned int m_failures_pending = 0;
    unsigned int m_open_attempts = 0;

    uint64_t m_next_handle = 1;
    std::map<uint64_t, entry> m_entries;
    std::map<std::string, std::size_t> m_group_cursor;

    lost_handler m_lost;
    std::vector<published_message> m_published;
};

} // namespace shadowsync
