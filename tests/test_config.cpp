#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

// Writes `yaml` to a temporary file removed when the guard goes out of scope.
class temp_config {
public:
    explicit temp_config(const std::string& yaml) {
        static int counter = 0;
        m_path = std::filesystem::temp_directory_path() /
                 ("shadow_sync_test_" + std::to_string(::getpid()) + "_" +
                  std::to_string(counter++) + ".yaml");
        std::ofstream out(m_path);
        out << yaml;
    }
    ~temp_config() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST(config, defaults_for_empty_file) {
    temp_config f("{}\n");
    auto cfg = shadowsync::load_config(f.path());

    EXPECT_EQ(cfg.transport, shadowsync::transport_kind::nats);
    EXPECT_EQ(cfg.nats_address, "127.0.0.1");
    EXPECT_EQ(cfg.nats_port, 4222);
    EXPECT_EQ(cfg.topic_prefix, "devices");
    EXPECT_EQ(cfg.default_content_type, "application/json");
    EXPECT_EQ(cfg.reconnect_initial_delay_ms, 100u);
    EXPECT_EQ(cfg.reconnect_max_delay_ms, 30000u);
    EXPECT_EQ(cfg.max_redeliveries, 5u);
    EXPECT_EQ(cfg.dead_letter_prefix, "deadletter");
    EXPECT_EQ(cfg.lock_shards, 64u);
    EXPECT_EQ(cfg.history_limit, 100u);
    EXPECT_FALSE(cfg.prune_applied_desired);
    EXPECT_TRUE(cfg.require_registered_devices);
    EXPECT_TRUE(cfg.devices.empty());
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(config, parses_all_sections) {
    temp_config f(
        "transport: loopback\n"
        "nats_address: nats.local\n"
        "nats_port: 4333\n"
        "exchange: plant1\n"
        "topic_prefix: fleet\n"
        "queue_group: shadow-workers\n"
        "reconnect_initial_delay_ms: 50\n"
        "reconnect_max_delay_ms: 800\n"
        "worker_threads: 3\n"
        "max_redeliveries: 2\n"
        "dead_letter_prefix: dlq\n"
        "lock_shards: 16\n"
        "history_limit: 5\n"
        "prune_applied_desired: true\n"
        "require_registered_devices: false\n"
        "devices: [wh-1, wh-2]\n"
        "stats_interval_seconds: 0\n"
        "log_level: debug\n");

    auto cfg = shadowsync::load_config(f.path());

    EXPECT_EQ(cfg.transport, shadowsync::transport_kind::loopback);
    EXPECT_EQ(cfg.nats_address, "nats.local");
    EXPECT_EQ(cfg.nats_port, 4333);
    EXPECT_EQ(cfg.exchange, "plant1");
    EXPECT_EQ(cfg.topic_prefix, "fleet");
    EXPECT_EQ(cfg.queue_group, "shadow-workers");
    EXPECT_EQ(cfg.reconnect_initial_delay_ms, 50u);
    EXPECT_EQ(cfg.reconnect_max_delay_ms, 800u);
    EXPECT_EQ(cfg.worker_threads, 3u);
    EXPECT_EQ(cfg.max_redeliveries, 2u);
    EXPECT_EQ(cfg.dead_letter_prefix, "dlq");
    EXPECT_EQ(cfg.lock_shards, 16u);
    EXPECT_EQ(cfg.history_limit, 5u);
    EXPECT_TRUE(cfg.prune_applied_desired);
    EXPECT_FALSE(cfg.require_registered_devices);
    ASSERT_EQ(cfg.devices.size(), 2u);
    EXPECT_EQ(cfg.devices[1], "wh-2");
    EXPECT_EQ(cfg.stats_interval_seconds, 0);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(config, rejects_invalid_values) {
    EXPECT_THROW(shadowsync::load_config(temp_config("transport: amqp\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config("topic_prefix: dev.*\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config("topic_prefix: a.b\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config("lock_shards: 0\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config("reconnect_initial_delay_ms: 0\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config(
        "reconnect_initial_delay_ms: 500\nreconnect_max_delay_ms: 100\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config("devices: wh-1\n").path()), std::runtime_error);
    EXPECT_THROW(shadowsync::load_config(temp_config("devices: [wh.1]\n").path()), std::runtime_error);
}

TEST(config, missing_file_throws) {
    EXPECT_ANY_THROW(shadowsync::load_config("/nonexistent/shadow_sync.yaml"));
}

TEST(config, parse_transport) {
    EXPECT_EQ(shadowsync::parse_transport("nats"), shadowsync::transport_kind::nats);
    EXPECT_EQ(shadowsync::parse_transport("loopback"), shadowsync::transport_kind::loopback);
    EXPECT_FALSE(shadowsync::parse_transport("kafka").has_value());
}
