#include "message_dispatcher.hpp"
#include "errors.hpp"
#include "payload_codec.hpp"
#include <chrono>
#include <span>

namespace shadowsync {

const char* to_string(delivery_state s) {
    switch (s) {
        case delivery_state::received:      return "received";
        case delivery_state::routed:        return "routed";
        case delivery_state::delivered:     return "delivered";
        case delivery_state::failed:        return "failed";
        case delivery_state::dead_lettered: return "dead_lettered";
        case delivery_state::unroutable:    return "unroutable";
    }
    return "unknown";
}

message_dispatcher::message_dispatcher(const dispatcher_options& opts,
                                       subscription_registry& registry,
                                       dead_letter_sink dead_letter,
                                       std::shared_ptr<spdlog::logger> log)
    : m_opts(opts), m_registry(registry), m_dead_letter(std::move(dead_letter)),
      m_log(std::move(log)),
      m_thread_count(opts.worker_threads > 0 ? opts.worker_threads
                                             : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;

    m_queues.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queues.push_back(std::make_unique<moodycamel::BlockingConcurrentQueue<queue_item>>());
    }
}

message_dispatcher::~message_dispatcher() {
    stop();
}

void message_dispatcher::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&message_dispatcher::worker_loop, this, i);
    }
    m_log->info("Dispatcher started with {} workers", m_thread_count);
}

void message_dispatcher::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pill behind any queued work; workers drain their queue first.
    for (auto& q : m_queues) {
        q->enqueue(nullptr);
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->info("Dispatcher stopped");
}

std::string_view message_dispatcher::ordering_key(std::string_view topic) {
    auto first = topic.find('.');
    if (first == std::string_view::npos) return topic;
    auto rest = topic.substr(first + 1);
    auto second = rest.find('.');
    return second == std::string_view::npos ? rest : rest.substr(0, second);
}

void message_dispatcher::submit(inbound_message msg) {
    auto shard = std::hash<std::string_view>{}(ordering_key(msg.topic)) % m_queues.size();
    m_queues[shard]->enqueue(std::make_unique<inbound_message>(std::move(msg)));
}

std::size_t message_dispatcher::queue_depth() const {
    std::size_t depth = 0;
    for (const auto& q : m_queues) depth += q->size_approx();
    return depth;
}

message_dispatcher::stats message_dispatcher::get_stats() const {
    return {
        m_received.load(std::memory_order_relaxed),
        m_delivered.load(std::memory_order_relaxed),
        m_failed.load(std::memory_order_relaxed),
        m_unroutable.load(std::memory_order_relaxed),
        m_malformed.load(std::memory_order_relaxed),
        m_dead_lettered.load(std::memory_order_relaxed),
        queue_depth()
    };
}

void message_dispatcher::settle(inbound_message& msg, settle_outcome outcome) {
    m_log->debug("'{}' (delivery {}) settled: {}", msg.topic, msg.delivery_count, to_string(outcome));
    if (msg.settle) msg.settle(outcome);
}

delivery_state message_dispatcher::process(inbound_message& msg) {
    m_received.fetch_add(1, std::memory_order_relaxed);

    delivery d;
    try {
        d.payload = decode_payload(msg.envelope.content_type,
                                   std::span<const char>(msg.body.data(), msg.body.size()));
    } catch (const malformed_message_error& e) {
        // Never retried: redelivering a poison message cannot succeed.
        m_log->warn("Discarding malformed message on '{}': {}", msg.topic, e.what());
        m_malformed.fetch_add(1, std::memory_order_relaxed);
        m_unroutable.fetch_add(1, std::memory_order_relaxed);
        settle(msg, settle_outcome::ack);
        return delivery_state::unroutable;
    }

    auto matched = m_registry.resolve(msg.topic);
    if (matched.empty()) {
        m_log->warn("Unroutable message on '{}': no matching subscription", msg.topic);
        m_unroutable.fetch_add(1, std::memory_order_relaxed);
        settle(msg, settle_outcome::ack);
        return delivery_state::unroutable;
    }

    d.topic = msg.topic;
    d.envelope = msg.envelope;
    d.delivery_count = msg.delivery_count;

    // Every matched callback is attempted before the ack/nack decision.
    bool all_ok = true;
    for (const auto& sub : matched) {
        // A one-shot subscription is delivered by at most one worker at a time.
        if (sub->one_shot && sub->claimed.exchange(true)) continue;

        try {
            if (!sub->callback(d)) {
                throw callback_failure_error("subscriber reported failure");
            }
            if (sub->one_shot) m_registry.unregister(sub->id);
            continue;
        } catch (const std::exception& e) {
            m_log->error("Subscription {} ('{}') failed on '{}' (delivery {}): {}",
                        sub->id, sub->pattern.str(), msg.topic, msg.delivery_count, e.what());
        } catch (...) {
            m_log->error("Subscription {} ('{}') failed on '{}' (delivery {}): unknown exception",
                        sub->id, sub->pattern.str(), msg.topic, msg.delivery_count);
        }

        all_ok = false;
        if (sub->one_shot) sub->claimed.store(false);
    }

    if (all_ok) {
        m_delivered.fetch_add(1, std::memory_order_relaxed);
        settle(msg, settle_outcome::ack);
        return delivery_state::delivered;
    }

    m_failed.fetch_add(1, std::memory_order_relaxed);

    if (msg.delivery_count > m_opts.max_redeliveries) {
        auto dl_topic = m_opts.dead_letter_prefix + "." + msg.topic;
        m_log->error("Dead-lettering '{}' after {} deliveries -> '{}'",
                    msg.topic, msg.delivery_count, dl_topic);

        auto envelope = msg.envelope;
        envelope.headers["x-death-reason"] = "callback-failure";
        envelope.headers["x-delivery-count"] = std::to_string(msg.delivery_count);
        envelope.headers["x-original-topic"] = msg.topic;
        if (m_dead_letter) m_dead_letter(std::move(dl_topic), std::move(envelope), msg.body);

        m_dead_lettered.fetch_add(1, std::memory_order_relaxed);
        settle(msg, settle_outcome::ack);
        return delivery_state::dead_lettered;
    }

    settle(msg, settle_outcome::nack_requeue);
    return delivery_state::failed;
}

void message_dispatcher::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    auto& queue = *m_queues[worker_id];
    queue_item item;
    while (true) {
        // Block with timeout; the poison pill ends the loop once the queue is drained.
        bool got = queue.wait_dequeue_timed(item, std::chrono::milliseconds(100));
        if (!got) continue;

        if (!item) break;

        process(*item);
        item.reset();
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace shadowsync
