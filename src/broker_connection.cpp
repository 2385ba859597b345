#include "broker_connection.hpp"
#include "errors.hpp"
#include <algorithm>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace shadowsync {

broker_connection::broker_connection(asio::io_context& ioc, transport_sptr transport,
                                     broker_options opts,
                                     std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_transport(std::move(transport)), m_opts(std::move(opts)),
      m_log(std::move(log))
{
    m_transport->on_connection_lost([this] { handle_connection_lost(); });
}

broker_connection::~broker_connection() {
    close();
    m_transport->on_connection_lost(nullptr);
}

std::chrono::milliseconds broker_connection::backoff_delay(
    uint32_t attempt,
    std::chrono::milliseconds initial,
    std::chrono::milliseconds max)
{
    auto delay = initial;
    for (uint32_t i = 0; i < attempt && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, max);
}

asio::awaitable<bool> broker_connection::connect() {
    if (m_closed) co_return false;
    if (m_connected) co_return true;

    asio::steady_timer timer(co_await asio::this_coro::executor);

    // Another caller is already connecting: wait for it, then take over if
    // its session dropped again before we looked.
    while (m_connecting.exchange(true)) {
        timer.expires_after(std::chrono::milliseconds(10));
        co_await timer.async_wait(asio::use_awaitable);
        if (m_closed) co_return false;
    }
    if (m_connected) {
        m_connecting = false;
        co_return true;
    }

    uint32_t attempt = 0;
    while (!m_closed) {
        auto s = co_await m_transport->open(m_opts.exchange);
        if (!s.failed()) break;

        auto delay = backoff_delay(attempt++, m_opts.reconnect_initial_delay,
                                   m_opts.reconnect_max_delay);
        m_log->warn("Broker connect attempt {} failed: {} (retrying in {}ms)",
                   attempt, s.error(), delay.count());
        timer.expires_after(delay);
        co_await timer.async_wait(asio::use_awaitable);
    }

    if (m_closed) {
        m_connecting = false;
        co_return false;
    }

    bool reconnect = m_ever_connected.exchange(true);
    m_connected = true;
    if (reconnect) {
        m_reconnects++;
        m_log->info("Broker reconnected (exchange '{}'), redeclaring consumers", m_opts.exchange);
    } else {
        m_log->info("Broker connected (exchange '{}')", m_opts.exchange);
    }

    co_await redeclare_consumers();
    m_connecting = false;
    co_return true;
}

asio::awaitable<transport_status> broker_connection::publish(
    std::string topic, message_envelope envelope, std::string body)
{
    if (m_closed || !m_ever_connected) {
        throw not_connected_error("publish to '" + topic + "' before connect");
    }

    if (!m_connected) {
        if (!m_opts.retry) {
            throw not_connected_error("publish to '" + topic + "' while disconnected");
        }
        asio::steady_timer timer(co_await asio::this_coro::executor);
        while (!m_connected) {
            if (m_closed) throw not_connected_error("broker closed");
            timer.expires_after(std::chrono::milliseconds(10));
            co_await timer.async_wait(asio::use_awaitable);
        }
    }

    auto s = co_await m_transport->publish(std::move(topic), std::move(envelope), std::move(body));
    co_return s;
}

void broker_connection::publish_async(std::string topic, message_envelope envelope,
                                      std::string body)
{
    if (m_closed || !m_ever_connected) {
        m_log->warn("Dropping publish to '{}': broker not connected", topic);
        return;
    }

    asio::co_spawn(m_ioc,
        [this, topic = std::move(topic), envelope = std::move(envelope),
         body = std::move(body)]() mutable -> asio::awaitable<void> {
            try {
                auto s = co_await publish(topic, std::move(envelope), std::move(body));
                if (s.failed()) {
                    m_log->warn("Failed to publish to '{}': {}", topic, s.error());
                }
            } catch (const not_connected_error& e) {
                m_log->warn("Dropping publish to '{}': {}", topic, e.what());
            }
        },
        asio::detached
    );
}

asio::awaitable<uint64_t> broker_connection::declare_consumer(
    std::string queue_name, std::string pattern, consumer_handler handler)
{
    if (m_closed || !m_ever_connected) {
        throw not_connected_error("declare consumer '" + pattern + "' before connect");
    }

    topic_pattern compiled(pattern);

    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_consumer_id++;
        m_consumers.emplace(id, consumer_record{id, std::move(queue_name),
                                                std::move(compiled), std::move(handler),
                                                std::nullopt});
    }
    m_log->info("Declared consumer {} on '{}'", id, pattern);

    if (m_connected) {
        co_await subscribe_consumer(id);
    }
    co_return id;
}

asio::awaitable<void> broker_connection::subscribe_consumer(uint64_t consumer_id) {
    std::string queue_name;
    std::string pattern;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_consumers.find(consumer_id);
        if (it == m_consumers.end() || it->second.transport_handle) co_return;
        queue_name = it->second.queue_name;
        pattern = it->second.pattern.str();
    }

    auto [handle, s] = co_await m_transport->subscribe(
        pattern, queue_name,
        [this, consumer_id](inbound_message msg) { deliver(consumer_id, std::move(msg)); });

    if (s.failed()) {
        // Retried on the next reconnect.
        m_log->warn("Failed to subscribe consumer {} on '{}': {}", consumer_id, pattern, s.error());
        co_return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_consumers.find(consumer_id);
    if (it == m_consumers.end()) {
        // Cancelled while subscribing.
        m_transport->unsubscribe(handle);
        co_return;
    }
    it->second.transport_handle = handle;
}

asio::awaitable<void> broker_connection::redeclare_consumers() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, rec] : m_consumers) {
            rec.transport_handle.reset();
            ids.push_back(id);
        }
    }
    for (auto id : ids) {
        co_await subscribe_consumer(id);
    }
}

void broker_connection::deliver(uint64_t consumer_id, inbound_message msg) {
    consumer_handler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_consumers.find(consumer_id);
        if (it == m_consumers.end()) {
            m_log->debug("Dropping delivery on '{}' for cancelled consumer {}", msg.topic, consumer_id);
            return;
        }
        handler = it->second.handler;
    }

    // The settle callback keeps its own copy of the message for redelivery.
    inbound_message redelivery;
    redelivery.topic = msg.topic;
    redelivery.envelope = msg.envelope;
    redelivery.body = msg.body;
    redelivery.delivery_count = msg.delivery_count + 1;

    msg.settle = [this, consumer_id, redelivery = std::move(redelivery)](settle_outcome outcome) mutable {
        if (outcome != settle_outcome::nack_requeue || m_closed) return;
        asio::post(m_ioc, [this, consumer_id, m = std::move(redelivery)]() mutable {
            deliver(consumer_id, std::move(m));
        });
    };

    handler(std::move(msg));
}

bool broker_connection::cancel(uint64_t consumer_id) {
    std::optional<uint64_t> handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_consumers.find(consumer_id);
        if (it == m_consumers.end()) return false;
        handle = it->second.transport_handle;
        m_consumers.erase(it);
    }
    if (handle) m_transport->unsubscribe(*handle);
    m_log->info("Cancelled consumer {}", consumer_id);
    return true;
}

void broker_connection::close() {
    if (m_closed.exchange(true)) return;

    std::vector<uint64_t> handles;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, rec] : m_consumers) {
            if (rec.transport_handle) handles.push_back(*rec.transport_handle);
        }
        m_consumers.clear();
    }
    for (auto h : handles) m_transport->unsubscribe(h);

    m_connected = false;
    m_transport->close();
    m_log->info("Broker connection closed");
}

void broker_connection::on_connection_lost(lost_callback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lost_callbacks.push_back(std::move(cb));
}

void broker_connection::handle_connection_lost() {
    if (m_closed) return;
    m_connected = false;
    m_log->warn("Broker connection lost");

    std::vector<lost_callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, rec] : m_consumers) rec.transport_handle.reset();
        callbacks = m_lost_callbacks;
    }
    for (auto& cb : callbacks) cb();

    asio::co_spawn(m_ioc,
        [this]() -> asio::awaitable<void> {
            co_await connect();
        },
        asio::detached
    );
}

std::size_t broker_connection::consumer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_consumers.size();
}

} // namespace shadowsync
