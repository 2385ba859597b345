#include "loopback_transport.hpp"

namespace shadowsync {

asio::awaitable<transport_status> loopback_transport::open(std::string exchange) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_open_attempts;
    if (m_failures_pending > 0) {
        --m_failures_pending;
        co_return transport_status("loopback: connection refused");
    }
    m_exchange = std::move(exchange);
    m_open = true;
    co_return transport_status{};
}

void loopback_transport::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
    m_entries.clear();
    m_group_cursor.clear();
}

bool loopback_transport::is_open() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

asio::awaitable<transport_status> loopback_transport::publish(
    std::string topic, message_envelope envelope, std::string body)
{
    std::vector<message_handler> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) co_return transport_status("loopback: not open");

        m_published.push_back({topic, envelope, body});

        // Ungrouped subscriptions all receive; each queue group receives once.
        std::map<std::string, std::vector<const entry*>> groups;
        for (const auto& [handle, e] : m_entries) {
            if (!e.pattern.matches(topic)) continue;
            if (e.queue_group.empty()) {
                targets.push_back(e.handler);
            } else {
                groups[e.queue_group].push_back(&e);
            }
        }
        for (auto& [group, members] : groups) {
            auto& cursor = m_group_cursor[group];
            targets.push_back(members[cursor % members.size()]->handler);
            ++cursor;
        }
    }

    for (auto& handler : targets) {
        inbound_message msg;
        msg.topic = topic;
        msg.envelope = envelope;
        msg.body = body;
        handler(std::move(msg));
    }
    co_return transport_status{};
}

asio::awaitable<std::pair<uint64_t, transport_status>> loopback_transport::subscribe(
    std::string pattern, std::string queue_group, message_handler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_open) co_return std::make_pair(uint64_t{0}, transport_status("loopback: not open"));

    uint64_t handle = m_next_handle++;
    m_entries.emplace(handle, entry{topic_pattern(std::move(pattern)),
                                    std::move(queue_group), std::move(handler)});
    co_return std::make_pair(handle, transport_status{});
}

void loopback_transport::unsubscribe(uint64_t handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(handle);
}

void loopback_transport::on_connection_lost(lost_handler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lost = std::move(handler);
}

void loopback_transport::drop() {
    lost_handler lost;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) return;
        m_open = false;
        m_entries.clear();
        m_group_cursor.clear();
        lost = m_lost;
    }
    if (lost) lost();
}

void loopback_transport::fail_next_opens(unsigned int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failures_pending = count;
}

std::vector<loopback_transport::published_message> loopback_transport::published() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_published;
}

std::size_t loopback_transport::subscription_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

unsigned int loopback_transport::open_attempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open_attempts;
}

} // namespace shadowsync
