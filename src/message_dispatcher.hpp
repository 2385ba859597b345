#pragma once

#include "message.hpp"
#include "subscription_registry.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace shadowsync {

// Per-message state machine:
//   received -> routed -> delivered      (ack)
//   received -> routed -> failed         (nack, requeued)
//   received -> routed -> dead_lettered  (failed past max_redeliveries; ack)
//   received -> unroutable               (ack, discarded, logged)
enum class delivery_state {
    received,
    routed,
    delivered,
    failed,
    dead_lettered,
    unroutable
};

const char* to_string(delivery_state s);

struct dispatcher_options {
    unsigned int worker_threads = 0;  // 0 = hardware_concurrency
    uint32_t max_redeliveries = 5;
    std::string dead_letter_prefix = "deadletter";
};

class message_dispatcher {
public:
    struct stats {
        uint64_t received = 0;
        uint64_t delivered = 0;
        uint64_t failed = 0;
        uint64_t unroutable = 0;
        uint64_t malformed = 0;
        uint64_t dead_lettered = 0;
        std::size_t queue_depth = 0;
    };

    // Publishes a message to the dead-letter topic.
    using dead_letter_sink = std::function<void(std::string topic, message_envelope envelope, std::string body)>;

    message_dispatcher(const dispatcher_options& opts,
                       subscription_registry& registry,
                       dead_letter_sink dead_letter,
                       std::shared_ptr<spdlog::logger> log);
    ~message_dispatcher();

    // Spawn N worker threads. Must be called once.
    void start();

    // Signal workers to stop, drain the queues, and join threads.
    void stop();

    // Enqueue an inbound message. Messages with the same ordering key go to
    // the same worker and are processed in submission order.
    void submit(inbound_message msg);

    // Route, deliver and settle one message on the calling thread.
    delivery_state process(inbound_message& msg);

    // Device segment of "<prefix>.<device>.shadow.<kind>"; the whole topic
    // when it has a single segment.
    static std::string_view ordering_key(std::string_view topic);

    std::size_t queue_depth() const;

    stats get_stats() const;

    unsigned int thread_count() const { return m_thread_count; }

private:
    using queue_item = std::unique_ptr<inbound_message>;

    void worker_loop(unsigned int worker_id);
    void settle(inbound_message& msg, settle_outcome outcome);

    dispatcher_options m_opts;
    subscription_registry& m_registry;
    dead_letter_sink m_dead_letter;
    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    // One queue per worker; nullptr is the poison pill.
    std::vector<std::unique_ptr<moodycamel::BlockingConcurrentQueue<queue_item>>> m_queues;
    std::vector<std::thread> m_threads;

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_received{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_unroutable{0};
    std::atomic<uint64_t> m_malformed{0};
    std::atomic<uint64_t> m_dead_lettered{0};
};

} // namespace shadowsync
