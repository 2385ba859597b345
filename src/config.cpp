#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace shadowsync {

std::optional<transport_kind> parse_transport(const std::string& s) {
    if (s == "nats")     return transport_kind::nats;
    if (s == "loopback") return transport_kind::loopback;
    return std::nullopt;
}

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg;

    // Broker connection
    if (auto n = root["transport"]) {
        auto t = parse_transport(n.as<std::string>());
        if (!t) throw std::runtime_error("config: invalid 'transport': " + n.as<std::string>());
        cfg.transport = *t;
    }
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();
    if (auto n = root["exchange"])     cfg.exchange = n.as<std::string>();

    // Topics
    if (auto n = root["topic_prefix"]) cfg.topic_prefix = n.as<std::string>();
    if (cfg.topic_prefix.empty()) {
        throw std::runtime_error("config: 'topic_prefix' must not be empty");
    }
    if (cfg.topic_prefix.find_first_of("*#") != std::string::npos) {
        throw std::runtime_error("config: 'topic_prefix' must not contain wildcards");
    }
    if (cfg.topic_prefix.find('.') != std::string::npos) {
        throw std::runtime_error("config: 'topic_prefix' must be a single segment");
    }
    if (auto n = root["queue_group"])          cfg.queue_group = n.as<std::string>();
    if (auto n = root["default_content_type"]) cfg.default_content_type = n.as<std::string>();

    // Reconnect
    if (auto n = root["connect_timeout_ms"])         cfg.connect_timeout_ms = n.as<uint32_t>();
    if (auto n = root["reconnect_initial_delay_ms"]) cfg.reconnect_initial_delay_ms = n.as<uint32_t>();
    if (auto n = root["reconnect_max_delay_ms"])     cfg.reconnect_max_delay_ms = n.as<uint32_t>();
    if (cfg.reconnect_initial_delay_ms == 0) {
        throw std::runtime_error("config: 'reconnect_initial_delay_ms' must be positive");
    }
    if (cfg.reconnect_max_delay_ms < cfg.reconnect_initial_delay_ms) {
        throw std::runtime_error("config: 'reconnect_max_delay_ms' must be >= 'reconnect_initial_delay_ms'");
    }

    // Dispatch
    if (auto n = root["worker_threads"])     cfg.worker_threads = n.as<unsigned int>();
    if (auto n = root["max_redeliveries"])   cfg.max_redeliveries = n.as<uint32_t>();
    if (auto n = root["dead_letter_prefix"]) cfg.dead_letter_prefix = n.as<std::string>();

    // Shadow store
    if (auto n = root["lock_shards"]) cfg.lock_shards = n.as<unsigned int>();
    if (cfg.lock_shards == 0) throw std::runtime_error("config: 'lock_shards' must be positive");
    if (auto n = root["history_limit"])              cfg.history_limit = n.as<std::size_t>();
    if (auto n = root["prune_applied_desired"])      cfg.prune_applied_desired = n.as<bool>();
    if (auto n = root["require_registered_devices"]) cfg.require_registered_devices = n.as<bool>();

    if (auto devs = root["devices"]) {
        if (!devs.IsSequence()) throw std::runtime_error("config: 'devices' must be a list");
        for (const auto& item : devs) {
            auto id = item.as<std::string>();
            if (id.empty() || id.find_first_of(".*#") != std::string::npos) {
                throw std::runtime_error("config: invalid device id: '" + id + "'");
            }
            cfg.devices.push_back(std::move(id));
        }
    }

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();

    return cfg;
}

} // namespace shadowsync
