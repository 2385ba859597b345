#pragma once

#include "broker_connection.hpp"
#include "shadow_document.hpp"
#include "shadow_store.hpp"
#include "topic_pattern.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace shadowsync {

// Real-time session fan-out provided by the HTTP/WebSocket gateway.
class session_gateway {
public:
    virtual ~session_gateway() = default;

    virtual void push_to_session(const std::string& session_id, const shadow_delta& delta) = 0;
};

// Publishes shadow deltas on "<prefix>.<device>.shadow.update" and routes
// them to locally watched sessions. Publishing is fire-and-forget: a broker
// or session failure is logged and never reaches the mutating caller.
class shadow_notifier {
public:
    using delta_callback = std::function<void(const shadow_delta&)>;

    // `gateway` may be null when no real-time sessions are served.
    shadow_notifier(broker_connection& broker, std::string topic_prefix,
                    std::shared_ptr<session_gateway> gateway,
                    std::shared_ptr<spdlog::logger> log);

    void notify(const std::string& device_id, const shadow_delta& delta);
    void notify(const shadow_delta& delta) { notify(delta.device_id, delta); }

    void notify_lifecycle(lifecycle_event event, const shadow_document& doc);

    // Push deltas whose update topic matches `pattern` to a gateway session.
    // `fields` restricts delivery to changes of "reported.<name>",
    // "desired.<name>", a whole section, or a bare property name; empty means
    // everything. Replaces an existing watch with the same id. Throws
    // invalid_pattern_error, or std::logic_error without a gateway.
    void watch(const std::string& session_id, const std::string& pattern,
               std::vector<std::string> fields = {});

    // In-process delta feed. Returns the session id to pass to unwatch().
    std::string subscribe(const std::string& pattern, delta_callback callback,
                          std::vector<std::string> fields = {});

    bool unwatch(const std::string& session_id);

    std::size_t session_count() const;
    uint64_t published_count() const { return m_published.load(std::memory_order_relaxed); }

    std::string update_topic(const std::string& device_id) const;
    std::string lifecycle_topic(const std::string& device_id, lifecycle_event event) const;

    static bool touches(const shadow_delta& delta, const std::vector<std::string>& fields);

private:
    struct session {
        std::string id;
        topic_pattern pattern;
        std::vector<std::string> fields;
        delta_callback sink;
    };

    void add_session(session s);

    broker_connection& m_broker;
    std::string m_prefix;
    std::shared_ptr<session_gateway> m_gateway;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::shared_ptr<const session>> m_sessions;
    uint64_t m_next_local = 1;

    std::atomic<uint64_t> m_published{0};
};

} // namespace shadowsync
