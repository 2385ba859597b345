#pragma once

#include "transport.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shadowsync {

struct nats_settings {
    std::string address = "127.0.0.1";
    uint16_t port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;
    std::string default_content_type = shadowsync::default_content_type;
    std::chrono::milliseconds connect_timeout{5000};
};

// Core NATS transport. Subjects share the '.' delimiter with topic patterns;
// '*' maps to '*' and a trailing '#' maps to '>'. The exchange, when set, is
// a subject namespace prepended on publish and stripped on receipt.
//
// Core NATS carries no headers and no broker-side acknowledgement: only the
// body and reply subject cross the wire, and redelivery is handled above the
// transport by broker_connection.
class nats_transport : public transport {
public:
    nats_transport(asio::io_context& ioc, nats_settings settings,
                   std::shared_ptr<spdlog::logger> log);
    ~nats_transport() override;

    asio::awaitable<transport_status> open(std::string exchange) override;
    void close() override;
    bool is_open() const override;

    asio::awaitable<transport_status> publish(
        std::string topic, message_envelope envelope, std::string body) override;

    asio::awaitable<std::pair<uint64_t, transport_status>> subscribe(
        std::string pattern, std::string queue_group, message_handler handler) override;

    void unsubscribe(uint64_t handle) override;
    void on_connection_lost(lost_handler handler) override;

    // NATS subjects needed to cover a topic pattern. "devices.#" needs both
    // "devices" and "devices.>" since '>' requires at least one token.
    static std::vector<std::string> to_subjects(const std::string& pattern);

private:
    std::string qualify(const std::string& subject) const;
    std::string unqualify(std::string_view subject) const;
    void drop_subscriptions();

    asio::io_context& m_ioc;
    nats_settings m_settings;
    std::shared_ptr<spdlog::logger> m_log;

    nats_asio::iconnection_sptr m_conn;
    std::string m_exchange;

    std::mutex m_mutex;
    uint64_t m_next_handle = 1;
    std::map<uint64_t, std::vector<nats_asio::isubscription_sptr>> m_subscriptions;
    lost_handler m_lost;
};

} // namespace shadowsync
