#include "config.hpp"
#include "loopback_transport.hpp"
#include "nats_transport.hpp"
#include "shadow_service.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("shadow_sync",
        "Device shadow synchronization service");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("loopback", "Use the in-process transport instead of NATS")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("shadow_sync");

    // Load config
    shadowsync::config cfg;
    try {
        cfg = shadowsync::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("address"))  cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))     cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("loopback")) cfg.transport = shadowsync::transport_kind::loopback;
    if (result.count("verbose"))  cfg.log_level = "debug";

    // Set log level
    if (cfg.log_level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    unsigned int effective_workers = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (effective_workers == 0) effective_workers = 1;

    bool loopback = cfg.transport == shadowsync::transport_kind::loopback;

    console->info("shadow_sync starting");
    if (loopback) console->info("  transport: loopback (in-process)");
    else          console->info("  server: {}:{}", cfg.nats_address, cfg.nats_port);
    console->info("  topics: {}.<ID>.shadow.{{reported,desired,update}}", cfg.topic_prefix);
    console->info("  exchange: '{}'  queue group: '{}'", cfg.exchange, cfg.queue_group);
    console->info("  worker threads: {}", effective_workers);
    console->info("  lock shards: {}  history: {}  prune applied: {}",
                  cfg.lock_shards, cfg.history_limit, cfg.prune_applied_desired);
    console->info("  registered devices: {}{}", cfg.devices.size(),
                  cfg.require_registered_devices ? "" : " (open fleet)");

    // Single-threaded io_context (broker I/O + publish coroutines)
    asio::io_context ioc(1);

    // Transport
    shadowsync::transport_sptr transport;
    if (loopback) {
        transport = std::make_shared<shadowsync::loopback_transport>();
    } else {
        shadowsync::nats_settings ns;
        ns.address = cfg.nats_address;
        ns.port = cfg.nats_port;
        ns.tls_cert = cfg.tls_cert;
        ns.tls_key = cfg.tls_key;
        ns.tls_ca = cfg.tls_ca;
        ns.default_content_type = cfg.default_content_type;
        ns.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
        transport = std::make_shared<shadowsync::nats_transport>(ioc, ns, console);
    }

    // No WebSocket gateway in the standalone binary; deltas go to the broker.
    auto service = std::make_shared<shadowsync::shadow_service>(
        ioc, cfg, transport, nullptr, console);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        ioc.stop();
    });

    asio::co_spawn(ioc,
        [service, console, &ioc]() -> asio::awaitable<void> {
            bool ok = co_await service->start();
            if (!ok) {
                console->error("Shadow service failed to start");
                ioc.stop();
            }
        },
        asio::detached
    );

    // Run the event loop (single thread)
    ioc.run();

    // Shutdown ordering:
    // 1. Stop worker threads (drain queues + join) and close the broker
    service->stop();
    signals.cancel();

    // 2. Flush any remaining co_spawn'd publish coroutines
    ioc.restart();
    ioc.run();

    console->info("shadow_sync stopped");
    return 0;
}
