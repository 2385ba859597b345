#pragma once

#include "message.hpp"
#include "topic_pattern.hpp"
#include "transport.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shadowsync {

struct broker_options {
    std::string exchange;
    std::chrono::milliseconds reconnect_initial_delay{100};
    std::chrono::milliseconds reconnect_max_delay{30000};

    // When false, publish() during an outage throws not_connected_error
    // instead of waiting for the reconnect.
    bool retry = true;
};

// Owns one transport session. Consumers declared here survive reconnects:
// after the session is re-established every consumer is re-subscribed with
// its original queue name and pattern under the same consumer id.
//
// Messages are delivered with a settle callback. nack_requeue redelivers the
// message through the same consumer with delivery_count + 1; ack and
// nack_discard end the delivery.
class broker_connection {
public:
    using consumer_handler = std::function<void(inbound_message)>;
    using lost_callback = std::function<void()>;

    broker_connection(asio::io_context& ioc, transport_sptr transport,
                      broker_options opts, std::shared_ptr<spdlog::logger> log);
    ~broker_connection();

    broker_connection(const broker_connection&) = delete;
    broker_connection& operator=(const broker_connection&) = delete;

    // Establish the session, retrying with exponential backoff until it
    // succeeds or close() is called. No-op when already connected.
    asio::awaitable<bool> connect();

    bool is_connected() const { return m_connected.load(); }

    // Throws not_connected_error before the first successful connect(),
    // after close(), or during an outage when retry is disabled.
    asio::awaitable<transport_status> publish(
        std::string topic, message_envelope envelope, std::string body);

    // Thread-safe fire-and-forget publish. Never throws; failures are logged.
    void publish_async(std::string topic, message_envelope envelope, std::string body);

    // Throws not_connected_error before connect(), invalid_pattern_error on a
    // bad pattern. During an outage the consumer is recorded and subscribed
    // on reconnect.
    asio::awaitable<uint64_t> declare_consumer(
        std::string queue_name, std::string pattern, consumer_handler handler);

    bool cancel(uint64_t consumer_id);

    void close();

    // Called on the I/O thread whenever the session drops.
    void on_connection_lost(lost_callback cb);

    std::size_t consumer_count() const;
    uint64_t reconnect_count() const { return m_reconnects.load(); }

    // Delay before retry number `attempt` (0-based): initial * 2^attempt,
    // capped at max.
    static std::chrono::milliseconds backoff_delay(
        uint32_t attempt,
        std::chrono::milliseconds initial,
        std::chrono::milliseconds max);

private:
    struct consumer_record {
        uint64_t id;
        std::string queue_name;
        topic_pattern pattern;
        consumer_handler handler;
        std::optional<uint64_t> transport_handle;
    };

    asio::awaitable<void> subscribe_consumer(uint64_t consumer_id);
    asio::awaitable<void> redeclare_consumers();
    void deliver(uint64_t consumer_id, inbound_message msg);
    void handle_connection_lost();

    asio::io_context& m_ioc;
    transport_sptr m_transport;
    broker_options m_opts;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_connecting{false};
    std::atomic<bool> m_ever_connected{false};
    std::atomic<bool> m_closed{false};
    std::atomic<uint64_t> m_reconnects{0};

    mutable std::mutex m_mutex;
    uint64_t m_next_consumer_id = 1;
    std::map<uint64_t, consumer_record> m_consumers;
    std::vector<lost_callback> m_lost_callbacks;
};

} // namespace shadowsync
