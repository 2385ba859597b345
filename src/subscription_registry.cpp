#include "subscription_registry.hpp"

namespace shadowsync {

subscription_registry::subscription_registry(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{
    // Publish an initial empty snapshot
    std::atomic_store(&m_snapshot, std::make_shared<const registry_snapshot>());
}

void subscription_registry::publish_snapshot(std::vector<std::shared_ptr<const subscription>> subs) {
    auto snap = std::make_shared<registry_snapshot>();
    snap->generation = std::atomic_load(&m_snapshot)->generation + 1;
    snap->subscriptions = std::move(subs);

    std::atomic_store(&m_snapshot,
                      std::shared_ptr<const registry_snapshot>(std::move(snap)));
}

uint64_t subscription_registry::register_subscription(const std::string& pattern,
                                                      subscription_callback callback,
                                                      subscription_options opts) {
    // Validate before taking the lock; throws invalid_pattern_error.
    topic_pattern compiled(pattern);

    std::lock_guard<std::mutex> lock(m_write_mutex);

    std::shared_ptr<const subscription> sub(new subscription{
        m_next_id++, std::move(opts.subscriber), std::move(compiled),
        std::move(callback), opts.exclusive, opts.one_shot});

    auto subs = std::atomic_load(&m_snapshot)->subscriptions;
    subs.push_back(sub);
    publish_snapshot(std::move(subs));

    m_log->info("New subscription {} on '{}'{}{}", sub->id, pattern,
               sub->exclusive ? " (exclusive)" : "",
               sub->one_shot ? " (one-shot)" : "");
    return sub->id;
}

template <typename Pred>
std::size_t subscription_registry::remove_if(Pred pred, const char* reason) {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    auto current = std::atomic_load(&m_snapshot);
    std::vector<std::shared_ptr<const subscription>> kept;
    kept.reserve(current->subscriptions.size());

    std::size_t removed = 0;
    for (const auto& sub : current->subscriptions) {
        if (pred(*sub)) {
            m_log->info("Removed subscription {} on '{}' ({})", sub->id, sub->pattern.str(), reason);
            ++removed;
        } else {
            kept.push_back(sub);
        }
    }

    if (removed > 0) publish_snapshot(std::move(kept));
    return removed;
}

bool subscription_registry::unregister(uint64_t subscription_id) {
    return remove_if([subscription_id](const subscription& s) { return s.id == subscription_id; },
                     "unregistered") > 0;
}

std::size_t subscription_registry::unregister_subscriber(const std::string& subscriber) {
    return remove_if([&subscriber](const subscription& s) { return s.subscriber == subscriber; },
                     "subscriber removed");
}

std::size_t subscription_registry::drop_exclusive() {
    return remove_if([](const subscription& s) { return s.exclusive; }, "connection lost");
}

std::vector<std::shared_ptr<const subscription>> subscription_registry::resolve(std::string_view topic) const {
    auto snap = std::atomic_load(&m_snapshot);

    std::vector<std::shared_ptr<const subscription>> matched;
    for (const auto& sub : snap->subscriptions) {
        if (sub->pattern.matches(topic)) matched.push_back(sub);
    }
    return matched;
}

std::shared_ptr<const subscription> subscription_registry::get(uint64_t id) const {
    auto snap = std::atomic_load(&m_snapshot);
    for (const auto& sub : snap->subscriptions) {
        if (sub->id == id) return sub;
    }
    return nullptr;
}

std::shared_ptr<const registry_snapshot> subscription_registry::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

std::size_t subscription_registry::active_count() const {
    return std::atomic_load(&m_snapshot)->subscriptions.size();
}

} // namespace shadowsync
