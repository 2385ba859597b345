#include "shadow_notifier.hpp"
#include <mutex>
#include <stdexcept>

namespace shadowsync {

shadow_notifier::shadow_notifier(broker_connection& broker, std::string topic_prefix,
                                 std::shared_ptr<session_gateway> gateway,
                                 std::shared_ptr<spdlog::logger> log)
    : m_broker(broker), m_prefix(std::move(topic_prefix)),
      m_gateway(std::move(gateway)), m_log(std::move(log))
{}

std::string shadow_notifier::update_topic(const std::string& device_id) const {
    return m_prefix + "." + device_id + ".shadow.update";
}

std::string shadow_notifier::lifecycle_topic(const std::string& device_id,
                                             lifecycle_event event) const {
    return m_prefix + "." + device_id + ".shadow." + to_string(event);
}

bool shadow_notifier::touches(const shadow_delta& delta, const std::vector<std::string>& fields) {
    if (fields.empty()) return true;

    for (const auto& c : delta.changes) {
        std::string section = to_string(c.section);
        for (const auto& f : fields) {
            if (f == c.property || f == section || f == section + "." + c.property) {
                return true;
            }
        }
    }
    return false;
}

void shadow_notifier::notify(const std::string& device_id, const shadow_delta& delta) {
    if (delta.empty()) return;

    auto topic = update_topic(device_id);

    message_envelope envelope;
    envelope.content_type = "application/json";
    envelope.message_id = device_id + ":" + std::to_string(delta.to_version);
    envelope.headers["x-shadow-version"] = std::to_string(delta.to_version);
    envelope.headers["x-shadow-classification"] = to_string(delta.classification);

    nlohmann::json body = delta;
    m_broker.publish_async(topic, std::move(envelope), body.dump());
    m_published.fetch_add(1, std::memory_order_relaxed);

    std::vector<std::shared_ptr<const session>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [id, s] : m_sessions) {
            if (s->pattern.matches(topic) && touches(delta, s->fields)) {
                targets.push_back(s);
            }
        }
    }

    for (const auto& s : targets) {
        try {
            s->sink(delta);
        } catch (const std::exception& e) {
            m_log->warn("Session '{}' rejected delta for '{}' v{}: {}",
                        s->id, device_id, delta.to_version, e.what());
        } catch (...) {
            m_log->warn("Session '{}' rejected delta for '{}' v{}: unknown exception",
                        s->id, device_id, delta.to_version);
        }
    }
}

void shadow_notifier::notify_lifecycle(lifecycle_event event, const shadow_document& doc) {
    message_envelope envelope;
    envelope.content_type = "application/json";
    envelope.headers["x-shadow-version"] = std::to_string(doc.version);

    nlohmann::json body = doc;
    m_broker.publish_async(lifecycle_topic(doc.device_id, event), std::move(envelope), body.dump());
}

void shadow_notifier::add_session(session s) {
    auto id = s.id;
    auto ptr = std::make_shared<const session>(std::move(s));

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_sessions[id] = std::move(ptr);
}

void shadow_notifier::watch(const std::string& session_id, const std::string& pattern,
                            std::vector<std::string> fields)
{
    if (!m_gateway) {
        throw std::logic_error("no session gateway configured");
    }

    topic_pattern p(pattern);
    auto gateway = m_gateway;
    add_session(session{
        session_id, std::move(p), std::move(fields),
        [gateway, session_id](const shadow_delta& d) { gateway->push_to_session(session_id, d); }
    });

    m_log->info("Session '{}' watching '{}'", session_id, pattern);
}

std::string shadow_notifier::subscribe(const std::string& pattern, delta_callback callback,
                                       std::vector<std::string> fields)
{
    topic_pattern p(pattern);

    std::string id;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        id = "local-" + std::to_string(m_next_local++);
    }
    add_session(session{id, std::move(p), std::move(fields), std::move(callback)});

    m_log->debug("Delta feed '{}' on '{}'", id, pattern);
    return id;
}

bool shadow_notifier::unwatch(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    bool removed = m_sessions.erase(session_id) > 0;
    if (removed) m_log->info("Session '{}' closed", session_id);
    return removed;
}

std::size_t shadow_notifier::session_count() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_sessions.size();
}

} // namespace shadowsync
