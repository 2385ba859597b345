#pragma once

#include "message.hpp"
#include <asio/awaitable.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace shadowsync {

class transport_status {
public:
    transport_status() = default;
    explicit transport_status(std::string error) : m_error(std::move(error)) {}

    bool failed() const { return !m_error.empty(); }
    const std::string& error() const { return m_error; }

private:
    std::string m_error;
};

// Physical message transport underneath broker_connection.
// All methods run on the io_context that owns the transport; handlers are
// invoked on that same thread.
class transport {
public:
    using message_handler = std::function<void(inbound_message)>;
    using lost_handler = std::function<void()>;

    virtual ~transport() = default;

    // Open the session and bind the logical exchange used for routing.
    virtual asio::awaitable<transport_status> open(std::string exchange) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual asio::awaitable<transport_status> publish(
        std::string topic, message_envelope envelope, std::string body) = 0;

    // Subscribe with a dot-delimited pattern ('*' and '#' wildcards).
    // Members of the same non-empty queue group share deliveries.
    virtual asio::awaitable<std::pair<uint64_t, transport_status>> subscribe(
        std::string pattern, std::string queue_group, message_handler handler) = 0;

    virtual void unsubscribe(uint64_t handle) = 0;

    // Invoked when an open session drops. Subscriptions do not survive.
    virtual void on_connection_lost(lost_handler handler) = 0;
};

using transport_sptr = std::shared_ptr<transport>;

} // namespace shadowsync
