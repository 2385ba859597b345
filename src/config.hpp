#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shadowsync {

enum class transport_kind {
    nats,
    loopback
};

struct config {
    // Broker connection
    transport_kind transport = transport_kind::nats;
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Logical exchange: subject namespace shared by all topic routing.
    // Empty means subjects are used as-is.
    std::string exchange;

    // Topics are <topic_prefix>.<deviceId>.shadow.{reported,desired,update}
    std::string topic_prefix = "devices";
    std::string queue_group;  // optional load-balancing across instances
    std::string default_content_type = "application/json";

    // Connect / reconnect with bounded exponential backoff (unbounded attempts)
    uint32_t connect_timeout_ms = 5000;
    uint32_t reconnect_initial_delay_ms = 100;
    uint32_t reconnect_max_delay_ms = 30000;

    // Dispatch
    unsigned int worker_threads = 0;  // 0 = hardware_concurrency
    uint32_t max_redeliveries = 5;
    std::string dead_letter_prefix = "deadletter";

    // Shadow store
    unsigned int lock_shards = 64;
    std::size_t history_limit = 100;
    bool prune_applied_desired = false;
    bool require_registered_devices = true;
    std::vector<std::string> devices;

    // Operational
    int stats_interval_seconds = 10;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse transport_kind from string. Returns nullopt if invalid.
std::optional<transport_kind> parse_transport(const std::string& s);

} // namespace shadowsync
