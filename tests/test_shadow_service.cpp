#include "shadow_service.hpp"
#include "errors.hpp"
#include "loopback_transport.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using nlohmann::json;
using testing_support::await;
using testing_support::make_log;
using testing_support::run_until;

namespace {

class recording_gateway : public shadowsync::session_gateway {
public:
    void push_to_session(const std::string& session_id, const shadowsync::shadow_delta& delta) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pushes.emplace_back(session_id, delta.to_version);
        if (session_id == failing_session) throw std::runtime_error("socket closed");
    }

    std::vector<std::pair<std::string, uint64_t>> pushes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pushes;
    }

    std::string failing_session;

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, uint64_t>> m_pushes;
};

// Saves fail while `fail` is set, or for the next `fail_times` calls.
class switchable_repository : public shadowsync::memory_shadow_repository {
public:
    void save_shadow(const shadowsync::shadow_document& doc) override {
        int n = fail_times.load();
        while (n > 0 && !fail_times.compare_exchange_weak(n, n - 1)) {}
        if (fail || n > 0) throw std::runtime_error("storage unavailable");
        memory_shadow_repository::save_shadow(doc);
    }

    std::atomic<bool> fail{false};
    std::atomic<int> fail_times{0};
};

shadowsync::config test_config() {
    shadowsync::config cfg;
    cfg.transport = shadowsync::transport_kind::loopback;
    cfg.reconnect_initial_delay_ms = 1;
    cfg.reconnect_max_delay_ms = 8;
    cfg.worker_threads = 2;
    cfg.max_redeliveries = 2;
    cfg.stats_interval_seconds = 0;
    cfg.devices = {"wh-1"};
    return cfg;
}

// Collects messages published on a topic pattern; handlers run on the
// io_context thread.
struct topic_recorder {
    std::vector<shadowsync::inbound_message> messages;

    shadowsync::broker_connection::consumer_handler handler() {
        return [this](shadowsync::inbound_message m) {
            m.settle(shadowsync::settle_outcome::ack);
            messages.push_back(std::move(m));
        };
    }
};

class service_fixture : public ::testing::Test {
protected:
    service_fixture() : service_fixture(test_config()) {}

    explicit service_fixture(shadowsync::config cfg)
        : transport(std::make_shared<shadowsync::loopback_transport>()),
          gateway(std::make_shared<recording_gateway>()),
          repository(std::make_shared<switchable_repository>()),
          service(std::make_unique<shadowsync::shadow_service>(
              ioc, cfg, transport, gateway, make_log(), repository))
    {}

    void SetUp() override {
        ASSERT_TRUE(await(ioc, service->start()));
        await(ioc, service->broker().declare_consumer("ui", "devices.*.shadow.update", updates.handler()));
    }

    void TearDown() override {
        service->stop();
    }

    void publish(const std::string& topic, const std::string& body,
                 std::optional<int64_t> timestamp = std::nullopt) {
        shadowsync::message_envelope env;
        if (timestamp) env.headers["timestamp"] = std::to_string(*timestamp);
        auto s = await(ioc, service->broker().publish(topic, env, body));
        ASSERT_FALSE(s.failed()) << s.error();
    }

    // Wait until the dispatcher has settled `count` messages in total.
    bool wait_settled(uint64_t count) {
        return run_until(ioc, [&] {
            auto st = service->dispatcher().get_stats();
            return st.delivered + st.unroutable + st.dead_lettered >= count;
        });
    }

    asio::io_context ioc;
    std::shared_ptr<shadowsync::loopback_transport> transport;
    std::shared_ptr<recording_gateway> gateway;
    std::shared_ptr<switchable_repository> repository;
    std::unique_ptr<shadowsync::shadow_service> service;
    topic_recorder updates;
};

} // namespace

TEST(shadow_update, state_form_carries_timestamp_and_version) {
    shadowsync::delivery d;
    d.payload = json::parse(R"({"state": {"mode": "eco"}, "timestamp": 250, "version": 4})");

    auto u = shadowsync::shadow_update::from_delivery(d);
    EXPECT_EQ(u.properties, json({{"mode", "eco"}}));
    EXPECT_EQ(u.timestamp, 250);
    ASSERT_TRUE(u.expected_version);
    EXPECT_EQ(*u.expected_version, 4u);
}

TEST(shadow_update, flat_form_uses_timestamp_header) {
    shadowsync::delivery d;
    d.payload = json::parse(R"({"temperature": 125})");
    d.envelope.headers["timestamp"] = "100";

    auto u = shadowsync::shadow_update::from_delivery(d);
    EXPECT_EQ(u.properties["temperature"], 125);
    EXPECT_EQ(u.timestamp, 100);
    EXPECT_FALSE(u.expected_version);
}

TEST(shadow_update, missing_timestamp_uses_receive_time) {
    shadowsync::delivery d;
    d.payload = json::parse(R"({"temperature": 125})");
    d.envelope.headers["timestamp"] = "yesterday";

    auto before = shadowsync::current_time_ms();
    auto u = shadowsync::shadow_update::from_delivery(d);
    EXPECT_GE(u.timestamp, before);
}

TEST(shadow_notifier, touches_field_filters) {
    shadowsync::shadow_delta delta;
    delta.changes.push_back({shadowsync::shadow_section::reported, "temperature",
                             shadowsync::change_kind::changed, 120, 125});

    using shadowsync::shadow_notifier;
    EXPECT_TRUE(shadow_notifier::touches(delta, {}));
    EXPECT_TRUE(shadow_notifier::touches(delta, {"reported.temperature"}));
    EXPECT_TRUE(shadow_notifier::touches(delta, {"reported"}));
    EXPECT_TRUE(shadow_notifier::touches(delta, {"temperature"}));
    EXPECT_FALSE(shadow_notifier::touches(delta, {"desired.temperature"}));
    EXPECT_FALSE(shadow_notifier::touches(delta, {"reported.humidity"}));
}

TEST_F(service_fixture, device_topic_parsing) {
    EXPECT_EQ(service->device_of("devices.wh-1.shadow.reported"), "wh-1");
    EXPECT_EQ(service->device_of("devices.wh-1.shadow.desired"), "wh-1");
    EXPECT_EQ(service->device_of("devices.wh-1.extra.shadow.reported"), "");
    EXPECT_EQ(service->device_of("other.wh-1.shadow.reported"), "");
}

TEST_F(service_fixture, configured_devices_start_at_version_zero) {
    auto doc = service->get_shadow("wh-1");
    EXPECT_EQ(doc.version, 0u);
    EXPECT_TRUE(doc.active);

    ASSERT_TRUE(run_until(ioc, [&] {
        for (const auto& p : transport->published()) {
            if (p.topic == "devices.wh-1.shadow.created") return true;
        }
        return false;
    }));
}

TEST_F(service_fixture, reported_state_produces_single_delta) {
    publish("devices.wh-1.shadow.reported", R"({"temperature": 125})", 100);

    ASSERT_TRUE(run_until(ioc, [&] { return !updates.messages.empty(); }));
    testing_support::run_for(ioc, std::chrono::milliseconds(50));
    ASSERT_EQ(updates.messages.size(), 1u);

    const auto& msg = updates.messages[0];
    EXPECT_EQ(msg.topic, "devices.wh-1.shadow.update");
    EXPECT_EQ(msg.envelope.content_type, "application/json");

    auto body = json::parse(msg.body);
    EXPECT_EQ(body["device_id"], "wh-1");
    EXPECT_EQ(body["reported"]["temperature"], 125);
    EXPECT_EQ(body["from_version"], 0);
    EXPECT_EQ(body["to_version"], 1);
    EXPECT_EQ(body["classification"], "reported-changed");

    auto doc = service->get_shadow("wh-1");
    EXPECT_EQ(doc.reported.at("temperature").timestamp, 100);
}

TEST_F(service_fixture, duplicate_report_does_not_publish_again) {
    publish("devices.wh-1.shadow.reported", R"({"temperature": 125})", 100);
    publish("devices.wh-1.shadow.reported", R"({"temperature": 125})", 100);

    ASSERT_TRUE(wait_settled(2));
    testing_support::run_for(ioc, std::chrono::milliseconds(50));

    EXPECT_EQ(updates.messages.size(), 1u);
    EXPECT_EQ(service->get_shadow("wh-1").version, 1u);
}

TEST_F(service_fixture, desired_confirmed_by_device_report) {
    auto desired = service->patch_desired("wh-1", {{"target_temperature", 130}});
    EXPECT_EQ(desired.classification, shadowsync::delta_classification::desired_changed);
    EXPECT_FALSE(service->get_shadow("wh-1").desired.at("target_temperature").applied);

    ASSERT_TRUE(run_until(ioc, [&] { return updates.messages.size() == 1; }));

    publish("devices.wh-1.shadow.reported", R"({"target_temperature": 130})", 100);

    ASSERT_TRUE(run_until(ioc, [&] {
        return service->get_shadow("wh-1").desired.at("target_temperature").applied;
    }));
    ASSERT_TRUE(run_until(ioc, [&] { return updates.messages.size() >= 2; }));
    testing_support::run_for(ioc, std::chrono::milliseconds(50));

    // One desired-change delta from the operator, then only the report.
    ASSERT_EQ(updates.messages.size(), 2u);
    auto first = json::parse(updates.messages[0].body);
    auto second = json::parse(updates.messages[1].body);
    EXPECT_EQ(first["classification"], "desired-changed");
    EXPECT_EQ(second["classification"], "reported-changed");
    EXPECT_TRUE(second["desired"].empty());
    EXPECT_EQ(second["reported"]["target_temperature"], 130);

    EXPECT_TRUE(service->drift("wh-1").empty());
}

TEST_F(service_fixture, desired_topic_honors_expected_version) {
    publish("devices.wh-1.shadow.desired", R"({"state": {"mode": "eco"}, "version": 5})");
    ASSERT_TRUE(wait_settled(1));
    EXPECT_EQ(service->get_shadow("wh-1").version, 0u);

    publish("devices.wh-1.shadow.desired", R"({"state": {"mode": "eco"}, "version": 0})");
    ASSERT_TRUE(wait_settled(2));

    auto doc = service->get_shadow("wh-1");
    EXPECT_EQ(doc.version, 1u);
    EXPECT_EQ(doc.desired.at("mode").value, "eco");
    EXPECT_FALSE(doc.desired.at("mode").applied);
}

TEST_F(service_fixture, unknown_device_is_acked_and_ignored) {
    publish("devices.ghost.shadow.reported", R"({"temperature": 1})", 100);

    ASSERT_TRUE(wait_settled(1));
    testing_support::run_for(ioc, std::chrono::milliseconds(30));

    EXPECT_EQ(service->dispatcher().get_stats().delivered, 1u);
    EXPECT_EQ(service->dispatcher().get_stats().failed, 0u);
    EXPECT_TRUE(updates.messages.empty());
    EXPECT_THROW(service->get_shadow("ghost"), shadowsync::device_not_found_error);
    EXPECT_THROW(service->patch_desired("ghost", {{"x", 1}}), shadowsync::device_not_found_error);
}

TEST_F(service_fixture, malformed_payload_is_discarded) {
    publish("devices.wh-1.shadow.reported", "{temperature", 100);

    ASSERT_TRUE(wait_settled(1));
    auto st = service->dispatcher().get_stats();
    EXPECT_EQ(st.malformed, 1u);
    EXPECT_EQ(st.failed, 0u);
    EXPECT_EQ(service->get_shadow("wh-1").version, 0u);
}

TEST_F(service_fixture, persistent_failure_is_dead_lettered) {
    topic_recorder dead;
    await(ioc, service->broker().declare_consumer("", "deadletter.#", dead.handler()));

    repository->fail = true;
    publish("devices.wh-1.shadow.reported", R"({"temperature": 125})", 100);

    ASSERT_TRUE(run_until(ioc, [&] { return !dead.messages.empty(); }));

    // max_redeliveries = 2: three failed attempts, the last one dead-lettered.
    auto st = service->dispatcher().get_stats();
    EXPECT_EQ(st.failed, 3u);
    EXPECT_EQ(st.dead_lettered, 1u);

    const auto& dl = dead.messages[0];
    EXPECT_EQ(dl.topic, "deadletter.devices.wh-1.shadow.reported");
    EXPECT_EQ(dl.envelope.header("x-delivery-count"), "3");
    EXPECT_EQ(dl.body, R"({"temperature": 125})");

    repository->fail = false;
    EXPECT_EQ(service->get_shadow("wh-1").version, 0u);
}

TEST_F(service_fixture, transient_failure_is_retried) {
    repository->fail_times = 1;
    publish("devices.wh-1.shadow.reported", R"({"temperature": 125})", 100);

    ASSERT_TRUE(run_until(ioc, [&] { return !updates.messages.empty(); }));
    EXPECT_EQ(service->get_shadow("wh-1").version, 1u);

    auto st = service->dispatcher().get_stats();
    EXPECT_EQ(st.failed, 1u);
    EXPECT_EQ(st.delivered, 1u);
    EXPECT_EQ(st.dead_lettered, 0u);
}

TEST_F(service_fixture, survives_connection_loss) {
    auto exclusive = service->registry().register_subscription(
        "devices.#", [](const shadowsync::delivery&) { return true; },
        {"session-1", true, false});

    transport->fail_next_opens(2);
    transport->drop();

    ASSERT_TRUE(run_until(ioc, [&] { return service->broker().is_connected(); }));
    EXPECT_FALSE(service->registry().get(exclusive));
    EXPECT_EQ(service->broker().reconnect_count(), 1u);

    publish("devices.wh-1.shadow.reported", R"({"temperature": 99})", 100);
    ASSERT_TRUE(run_until(ioc, [&] { return !updates.messages.empty(); }));
    EXPECT_EQ(service->get_shadow("wh-1").reported.at("temperature").value, 99);
}

TEST_F(service_fixture, sessions_receive_filtered_deltas) {
    service->notifier().watch("temp-view", "devices.wh-1.shadow.update", {"reported.temperature"});
    service->notifier().watch("all-view", "devices.*.shadow.update");
    service->notifier().watch("other-device", "devices.wh-2.shadow.update");

    publish("devices.wh-1.shadow.reported", R"({"humidity": 40})", 100);
    publish("devices.wh-1.shadow.reported", R"({"temperature": 125})", 200);

    ASSERT_TRUE(run_until(ioc, [&] { return gateway->pushes().size() >= 3; }));
    testing_support::run_for(ioc, std::chrono::milliseconds(30));

    auto pushes = gateway->pushes();
    ASSERT_EQ(pushes.size(), 3u);
    EXPECT_EQ(pushes[0], std::make_pair(std::string("all-view"), uint64_t{1}));

    int temp_view = 0;
    int all_view = 0;
    for (const auto& [session, version] : pushes) {
        if (session == "temp-view") { ++temp_view; EXPECT_EQ(version, 2u); }
        if (session == "all-view") ++all_view;
        EXPECT_NE(session, "other-device");
    }
    EXPECT_EQ(temp_view, 1);
    EXPECT_EQ(all_view, 2);

    EXPECT_TRUE(service->notifier().unwatch("all-view"));
    EXPECT_FALSE(service->notifier().unwatch("all-view"));
}

TEST_F(service_fixture, failing_session_does_not_block_others) {
    gateway->failing_session = "broken";
    service->notifier().watch("broken", "devices.#");
    service->notifier().watch("healthy", "devices.#");

    auto delta = service->patch_desired("wh-1", {{"mode", "eco"}});
    EXPECT_EQ(delta.to_version, 1u);

    auto pushes = gateway->pushes();
    ASSERT_EQ(pushes.size(), 2u);
    EXPECT_EQ(service->get_shadow("wh-1").version, 1u);
}

TEST_F(service_fixture, delta_feed_subscription) {
    std::vector<shadowsync::shadow_delta> feed;
    auto id = service->subscribe_deltas("devices.wh-1.shadow.update",
        [&](const shadowsync::shadow_delta& d) { feed.push_back(d); });

    service->patch_desired("wh-1", {{"mode", "eco"}});
    service->clear_desired("wh-1", {"mode"});
    ASSERT_EQ(feed.size(), 2u);
    EXPECT_EQ(feed[1].changes[0].kind, shadowsync::change_kind::removed);

    EXPECT_TRUE(service->unsubscribe_deltas(id));
    service->patch_desired("wh-1", {{"mode", "boost"}});
    EXPECT_EQ(feed.size(), 2u);
}

TEST_F(service_fixture, delta_feed_is_ordered_across_threads) {
    std::vector<uint64_t> versions;
    service->subscribe_deltas("devices.wh-1.shadow.update",
        [&](const shadowsync::shadow_delta& d) { versions.push_back(d.to_version); });

    std::vector<std::thread> writers;
    for (int t = 0; t < 2; ++t) {
        writers.emplace_back([&, t] {
            for (int n = 0; n < 50; ++n) {
                service->patch_desired("wh-1", {{"setting-" + std::to_string(t), n}});
            }
        });
    }
    for (auto& w : writers) w.join();

    ASSERT_EQ(versions.size(), 100u);
    for (std::size_t i = 0; i < versions.size(); ++i) {
        EXPECT_EQ(versions[i], i + 1);
    }
}

TEST_F(service_fixture, watch_rejects_bad_pattern) {
    EXPECT_THROW(service->notifier().watch("s", "devices.#.update"), shadowsync::invalid_pattern_error);
}

TEST_F(service_fixture, register_and_decommission_publish_lifecycle) {
    service->register_device("pump-1");
    service->patch_desired("pump-1", {{"rpm", 1200}});
    auto retired = service->decommission("pump-1");
    EXPECT_FALSE(retired.active);

    EXPECT_THROW(service->patch_desired("pump-1", {{"rpm", 0}}), shadowsync::device_decommissioned_error);
    EXPECT_EQ(service->history("pump-1").size(), 1u);

    ASSERT_TRUE(run_until(ioc, [&] {
        bool created = false;
        bool decommissioned = false;
        for (const auto& p : transport->published()) {
            if (p.topic == "devices.pump-1.shadow.created") created = true;
            if (p.topic == "devices.pump-1.shadow.decommissioned") {
                decommissioned = !json::parse(p.body)["active"].get<bool>();
            }
        }
        return created && decommissioned;
    }));
}

TEST_F(service_fixture, mark_applied_confirms_without_new_version) {
    service->patch_desired("wh-1", {{"firmware", "2.1"}});
    auto delta = service->mark_applied("wh-1", {"firmware"});

    EXPECT_TRUE(delta.empty());
    EXPECT_EQ(delta.applied, std::vector<std::string>{"firmware"});
    auto doc = service->get_shadow("wh-1");
    EXPECT_EQ(doc.version, 1u);
    EXPECT_TRUE(doc.desired.at("firmware").applied);

    json j = doc;
    EXPECT_EQ(j["desired"]["firmware"]["status"], "applied");
}
