#include "nats_transport.hpp"
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <span>

namespace shadowsync {

nats_transport::nats_transport(asio::io_context& ioc, nats_settings settings,
                               std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_settings(std::move(settings)), m_log(std::move(log))
{}

nats_transport::~nats_transport() {
    close();
}

std::vector<std::string> nats_transport::to_subjects(const std::string& pattern) {
    if (pattern.empty()) return {};
    if (pattern == "#") return {">"};

    static const std::string tail = ".#";
    if (pattern.size() > tail.size() &&
        pattern.compare(pattern.size() - tail.size(), tail.size(), tail) == 0) {
        auto prefix = pattern.substr(0, pattern.size() - tail.size());
        return {prefix, prefix + ".>"};
    }
    return {pattern};
}

std::string nats_transport::qualify(const std::string& subject) const {
    if (m_exchange.empty()) return subject;
    return m_exchange + "." + subject;
}

std::string nats_transport::unqualify(std::string_view subject) const {
    if (!m_exchange.empty() && subject.size() > m_exchange.size() &&
        subject.substr(0, m_exchange.size()) == m_exchange &&
        subject[m_exchange.size()] == '.') {
        subject.remove_prefix(m_exchange.size() + 1);
    }
    return std::string(subject);
}

asio::awaitable<transport_status> nats_transport::open(std::string exchange) {
    m_exchange = std::move(exchange);

    if (!m_conn) {
        std::optional<nats_asio::ssl_config> ssl_conf;
        if (!m_settings.tls_cert.empty()) {
            nats_asio::ssl_config sc;
            sc.cert = m_settings.tls_cert;
            sc.key  = m_settings.tls_key;
            sc.ca   = m_settings.tls_ca;
            sc.verify = true;
            ssl_conf = sc;
        }

        auto log = m_log;
        auto on_connected = [log](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
            log->info("Connected to NATS");
            co_return;
        };

        auto on_disconnected = [this](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
            m_log->warn("Disconnected from NATS");
            drop_subscriptions();
            lost_handler lost;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                lost = m_lost;
            }
            if (lost) lost();
            co_return;
        };

        auto on_error = [log](nats_asio::iconnection& /*c*/, std::string_view err) -> asio::awaitable<void> {
            log->error("NATS connection error: {}", err);
            co_return;
        };

        m_conn = nats_asio::create_connection(
            m_ioc, on_connected, on_disconnected, on_error, ssl_conf);

        nats_asio::connect_config nats_cfg;
        nats_cfg.address = m_settings.address;
        nats_cfg.port = m_settings.port;
        m_conn->start(nats_cfg);
    }

    // The client reconnects on its own; an open() call waits for it up to
    // the connect timeout.
    asio::steady_timer timer(co_await asio::this_coro::executor);
    auto deadline = std::chrono::steady_clock::now() + m_settings.connect_timeout;
    while (!m_conn->is_connected()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return transport_status("timed out connecting to " + m_settings.address +
                                       ":" + std::to_string(m_settings.port));
        }
        timer.expires_after(std::chrono::milliseconds(50));
        co_await timer.async_wait(asio::use_awaitable);
    }
    co_return transport_status{};
}

void nats_transport::close() {
    drop_subscriptions();
    if (m_conn) {
        m_conn->stop();
        m_conn.reset();
    }
}

bool nats_transport::is_open() const {
    return m_conn && m_conn->is_connected();
}

asio::awaitable<transport_status> nats_transport::publish(
    std::string topic, message_envelope envelope, std::string body)
{
    if (!is_open()) co_return transport_status("nats: not connected");

    std::optional<std::string_view> reply_to;
    if (envelope.reply_to) reply_to = *envelope.reply_to;

    auto subject = qualify(topic);
    auto s = co_await m_conn->publish(
        subject, std::span<const char>(body.data(), body.size()), reply_to);

    if (s.failed()) co_return transport_status(std::string(s.error()));
    co_return transport_status{};
}

asio::awaitable<std::pair<uint64_t, transport_status>> nats_transport::subscribe(
    std::string pattern, std::string queue_group, message_handler handler)
{
    if (!is_open()) co_return std::make_pair(uint64_t{0}, transport_status("nats: not connected"));

    auto subjects = to_subjects(pattern);
    if (subjects.empty()) {
        co_return std::make_pair(uint64_t{0}, transport_status("nats: empty pattern"));
    }

    nats_asio::subscribe_options opts;
    if (!queue_group.empty()) opts.queue_group = queue_group;

    std::vector<nats_asio::isubscription_sptr> subs;
    for (const auto& subject : subjects) {
        auto [sub, status] = co_await m_conn->subscribe(
            qualify(subject),
            [this, handler](auto subj, auto reply_to, auto payload) -> asio::awaitable<void> {
                inbound_message msg;
                msg.topic = unqualify(subj);
                msg.envelope.content_type = m_settings.default_content_type;
                if (reply_to) msg.envelope.reply_to = std::string(*reply_to);
                msg.body.assign(payload.begin(), payload.end());
                handler(std::move(msg));
                co_return;
            },
            opts);

        if (status.failed()) {
            for (auto& s : subs) s->cancel();
            co_return std::make_pair(uint64_t{0}, transport_status(std::string(status.error())));
        }
        subs.push_back(sub);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t handle = m_next_handle++;
    m_subscriptions.emplace(handle, std::move(subs));
    co_return std::make_pair(handle, transport_status{});
}

void nats_transport::unsubscribe(uint64_t handle) {
    std::vector<nats_asio::isubscription_sptr> subs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscriptions.find(handle);
        if (it == m_subscriptions.end()) return;
        subs = std::move(it->second);
        m_subscriptions.erase(it);
    }
    for (auto& s : subs) s->cancel();
}

void nats_transport::on_connection_lost(lost_handler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lost = std::move(handler);
}

void nats_transport::drop_subscriptions() {
    std::map<uint64_t, std::vector<nats_asio::isubscription_sptr>> subs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        subs.swap(m_subscriptions);
    }
    for (auto& [handle, list] : subs) {
        for (auto& s : list) s->cancel();
    }
}

} // namespace shadowsync
