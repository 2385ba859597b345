#pragma once

#include "broker_connection.hpp"
#include "config.hpp"
#include "device_registry.hpp"
#include "message_dispatcher.hpp"
#include "shadow_notifier.hpp"
#include "shadow_repository.hpp"
#include "shadow_store.hpp"
#include "subscription_registry.hpp"
#include "transport.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shadowsync {

// Properties and metadata carried by one inbound shadow message.
//
// Accepted bodies:
//   {"state": {...}, "timestamp": 100, "version": 3}
//   {...}   flat property map; timestamp from the "timestamp" header
// Without a timestamp the receive time is used. "version" is only honored on
// desired updates (optimistic concurrency).
struct shadow_update {
    nlohmann::json properties;
    timestamp_ms timestamp = 0;
    std::optional<uint64_t> expected_version;

    static shadow_update from_delivery(const delivery& d);
};

class shadow_service {
public:
    // `repository` and `devices` default to the in-memory implementations,
    // seeded from cfg.devices / cfg.require_registered_devices.
    shadow_service(asio::io_context& ioc, const config& cfg, transport_sptr transport,
                   std::shared_ptr<session_gateway> gateway,
                   std::shared_ptr<spdlog::logger> log,
                   std::shared_ptr<shadow_repository> repository = nullptr,
                   std::shared_ptr<device_registry> devices = nullptr);
    ~shadow_service();

    shadow_service(const shadow_service&) = delete;
    shadow_service& operator=(const shadow_service&) = delete;

    // Connect the broker, start the workers, declare the reported/desired
    // consumers and register the configured devices. Returns false when the
    // broker was closed before a session could be established.
    asio::awaitable<bool> start();

    // Stop workers and close the broker. Safe to call more than once.
    void stop();

    // Operations exposed to the REST and WebSocket collaborators. All of
    // them throw device_not_found_error for unknown devices.
    shadow_document get_shadow(const std::string& device_id);
    shadow_delta patch_desired(const std::string& device_id, const nlohmann::json& properties,
                               std::optional<uint64_t> expected_version = std::nullopt);
    shadow_delta mark_applied(const std::string& device_id, const std::vector<std::string>& properties);
    shadow_delta clear_desired(const std::string& device_id, const std::vector<std::string>& properties = {});
    std::vector<drift_entry> drift(const std::string& device_id);
    std::vector<shadow_document> history(const std::string& device_id, std::size_t limit = 0);
    shadow_document register_device(const std::string& device_id);
    shadow_document decommission(const std::string& device_id);

    // Delta feed; see shadow_notifier::subscribe. Callbacks for one device
    // arrive in version order under that device's lock and must not call
    // back into this service for the same device.
    std::string subscribe_deltas(const std::string& pattern,
                                 shadow_notifier::delta_callback callback,
                                 std::vector<std::string> fields = {});
    bool unsubscribe_deltas(const std::string& feed_id);

    // Device id of "<prefix>.<device>.shadow.<kind>"; empty when the topic
    // does not have that shape.
    std::string device_of(std::string_view topic) const;

    std::string reported_pattern() const { return m_cfg.topic_prefix + ".*.shadow.reported"; }
    std::string desired_pattern() const { return m_cfg.topic_prefix + ".*.shadow.desired"; }

    broker_connection& broker() { return m_broker; }
    subscription_registry& registry() { return m_registry; }
    message_dispatcher& dispatcher() { return m_dispatcher; }
    shadow_store& store() { return m_store; }
    shadow_notifier& notifier() { return m_notifier; }

private:
    bool on_reported(const delivery& d);
    bool on_desired(const delivery& d);

    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    broker_connection m_broker;
    subscription_registry m_registry;
    message_dispatcher m_dispatcher;
    std::shared_ptr<shadow_repository> m_repository;
    std::shared_ptr<device_registry> m_devices;
    shadow_store m_store;
    shadow_notifier m_notifier;

    asio::steady_timer m_stats_timer;
    std::atomic<bool> m_started{false};
    std::atomic<bool> m_stopped{false};
};

} // namespace shadowsync
