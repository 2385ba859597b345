#include "shadow_service.hpp"
#include "errors.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <charconv>
#include <stdexcept>
#include <system_error>

namespace shadowsync {

shadow_update shadow_update::from_delivery(const delivery& d) {
    shadow_update u;
    const auto& body = d.payload;

    if (body.is_object() && body.contains("state") && body["state"].is_object()) {
        u.properties = body["state"];
        if (auto it = body.find("timestamp"); it != body.end() && it->is_number_integer()) {
            u.timestamp = it->get<timestamp_ms>();
        }
        if (auto it = body.find("version"); it != body.end() && it->is_number_unsigned()) {
            u.expected_version = it->get<uint64_t>();
        }
    } else {
        u.properties = body;
    }

    if (u.timestamp == 0) {
        if (auto ts = d.envelope.header("timestamp")) {
            timestamp_ms parsed = 0;
            auto [ptr, ec] = std::from_chars(ts->data(), ts->data() + ts->size(), parsed);
            if (ec == std::errc() && ptr == ts->data() + ts->size()) u.timestamp = parsed;
        }
    }
    if (u.timestamp == 0) u.timestamp = current_time_ms();
    return u;
}

namespace {

std::shared_ptr<device_registry> default_devices(const config& cfg) {
    return std::make_shared<memory_device_registry>(!cfg.require_registered_devices, cfg.devices);
}

broker_options make_broker_options(const config& cfg) {
    broker_options opts;
    opts.exchange = cfg.exchange;
    opts.reconnect_initial_delay = std::chrono::milliseconds(cfg.reconnect_initial_delay_ms);
    opts.reconnect_max_delay = std::chrono::milliseconds(cfg.reconnect_max_delay_ms);
    return opts;
}

} // anonymous namespace

shadow_service::shadow_service(asio::io_context& ioc, const config& cfg, transport_sptr transport,
                               std::shared_ptr<session_gateway> gateway,
                               std::shared_ptr<spdlog::logger> log,
                               std::shared_ptr<shadow_repository> repository,
                               std::shared_ptr<device_registry> devices)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_broker(ioc, std::move(transport), make_broker_options(cfg), m_log),
      m_registry(m_log),
      m_dispatcher(dispatcher_options{cfg.worker_threads, cfg.max_redeliveries, cfg.dead_letter_prefix},
                   m_registry,
                   [this](std::string topic, message_envelope envelope, std::string body) {
                       m_broker.publish_async(std::move(topic), std::move(envelope), std::move(body));
                   },
                   m_log),
      m_repository(repository ? std::move(repository) : std::make_shared<memory_shadow_repository>()),
      m_devices(devices ? std::move(devices) : default_devices(cfg)),
      m_store(store_options{cfg.lock_shards, cfg.history_limit, cfg.prune_applied_desired},
              m_repository, m_devices, m_log),
      m_notifier(m_broker, cfg.topic_prefix, std::move(gateway), m_log),
      m_stats_timer(ioc)
{
    m_store.on_delta([this](const shadow_delta& delta) {
        m_notifier.notify(delta);
    });
    m_store.on_lifecycle([this](lifecycle_event e, const shadow_document& doc) {
        m_notifier.notify_lifecycle(e, doc);
    });

    m_broker.on_connection_lost([this] {
        auto dropped = m_registry.drop_exclusive();
        if (dropped > 0) {
            m_log->warn("Dropped {} exclusive subscriptions after connection loss", dropped);
        }
    });

    m_registry.register_subscription(reported_pattern(),
        [this](const delivery& d) { return on_reported(d); },
        subscription_options{"shadow_service", false, false});
    m_registry.register_subscription(desired_pattern(),
        [this](const delivery& d) { return on_desired(d); },
        subscription_options{"shadow_service", false, false});
}

shadow_service::~shadow_service() {
    stop();
}

asio::awaitable<bool> shadow_service::start() {
    if (m_started.exchange(true)) co_return m_broker.is_connected();

    bool connected = co_await m_broker.connect();
    if (!connected) {
        m_log->error("Broker closed before a session was established");
        co_return false;
    }

    m_dispatcher.start();

    auto submit = [this](inbound_message msg) { m_dispatcher.submit(std::move(msg)); };
    co_await m_broker.declare_consumer(m_cfg.queue_group, reported_pattern(), submit);
    co_await m_broker.declare_consumer(m_cfg.queue_group, desired_pattern(), submit);
    m_log->info("Consuming '{}' and '{}'", reported_pattern(), desired_pattern());

    for (const auto& id : m_cfg.devices) {
        try {
            m_store.register_device(id);
        } catch (const device_decommissioned_error&) {
            m_log->warn("Configured device '{}' is decommissioned", id);
        }
    }

    if (m_cfg.stats_interval_seconds > 0) {
        asio::co_spawn(m_ioc, stats_loop(), asio::detached);
    }

    m_log->info("Shadow service started ({} workers, prefix '{}', {} registered devices)",
               m_dispatcher.thread_count(), m_cfg.topic_prefix, m_cfg.devices.size());
    co_return true;
}

void shadow_service::stop() {
    if (m_stopped.exchange(true)) return;

    m_stats_timer.cancel();
    m_dispatcher.stop();
    m_broker.close();
}

std::string shadow_service::device_of(std::string_view topic) const {
    auto segments = topic_pattern::split(topic);
    if (segments.size() != 4 || segments[0] != m_cfg.topic_prefix || segments[2] != "shadow") {
        return {};
    }
    return segments[1];
}

bool shadow_service::on_reported(const delivery& d) {
    auto device_id = device_of(d.topic);
    auto update = shadow_update::from_delivery(d);

    try {
        auto delta = m_store.apply_reported(device_id, update.properties, update.timestamp);
        if (!delta.ignored.empty()) {
            m_log->debug("Ignored {} stale reported properties for '{}'",
                         delta.ignored.size(), device_id);
        }
    } catch (const device_not_found_error& e) {
        // Not retriable: the device will not appear by redelivering.
        m_log->warn("Rejected report on '{}': {}", d.topic, e.what());
    } catch (const std::invalid_argument& e) {
        m_log->warn("Rejected report on '{}': {}", d.topic, e.what());
    }
    return true;
}

bool shadow_service::on_desired(const delivery& d) {
    auto device_id = device_of(d.topic);
    auto update = shadow_update::from_delivery(d);

    try {
        m_store.apply_desired(device_id, update.properties, update.timestamp,
                              update.expected_version);
    } catch (const device_not_found_error& e) {
        m_log->warn("Rejected desired update on '{}': {}", d.topic, e.what());
    } catch (const version_conflict_error& e) {
        m_log->warn("Rejected desired update on '{}': {}", d.topic, e.what());
    } catch (const std::invalid_argument& e) {
        m_log->warn("Rejected desired update on '{}': {}", d.topic, e.what());
    }
    return true;
}

shadow_document shadow_service::get_shadow(const std::string& device_id) {
    return m_store.get(device_id);
}

shadow_delta shadow_service::patch_desired(const std::string& device_id,
                                           const nlohmann::json& properties,
                                           std::optional<uint64_t> expected_version)
{
    return m_store.apply_desired(device_id, properties, current_time_ms(), expected_version);
}

shadow_delta shadow_service::mark_applied(const std::string& device_id,
                                          const std::vector<std::string>& properties)
{
    return m_store.mark_applied(device_id, properties);
}

shadow_delta shadow_service::clear_desired(const std::string& device_id,
                                           const std::vector<std::string>& properties)
{
    return m_store.clear_desired(device_id, properties);
}

std::vector<drift_entry> shadow_service::drift(const std::string& device_id) {
    return m_store.drift(device_id);
}

std::vector<shadow_document> shadow_service::history(const std::string& device_id, std::size_t limit) {
    return m_store.history(device_id, limit);
}

shadow_document shadow_service::register_device(const std::string& device_id) {
    return m_store.register_device(device_id);
}

shadow_document shadow_service::decommission(const std::string& device_id) {
    return m_store.decommission(device_id);
}

std::string shadow_service::subscribe_deltas(const std::string& pattern,
                                             shadow_notifier::delta_callback callback,
                                             std::vector<std::string> fields)
{
    return m_notifier.subscribe(pattern, std::move(callback), std::move(fields));
}

bool shadow_service::unsubscribe_deltas(const std::string& feed_id) {
    return m_notifier.unwatch(feed_id);
}

asio::awaitable<void> shadow_service::stats_loop() {
    while (!m_stopped) {
        m_stats_timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        try {
            co_await m_stats_timer.async_wait(asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return;  // cancelled by stop()
        }

        auto ds = m_dispatcher.get_stats();
        m_log->info("stats: received={} delivered={} failed={} unroutable={} malformed={} dead_lettered={} subscriptions={} queue_depth={} shadows={} deltas={}",
                   ds.received,
                   ds.delivered,
                   ds.failed,
                   ds.unroutable,
                   ds.malformed,
                   ds.dead_lettered,
                   m_registry.active_count(),
                   ds.queue_depth,
                   m_store.size(),
                   m_notifier.published_count());
    }
}

} // namespace shadowsync
