#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "pulselink.hpp"
#include "common/cli.hpp"
#include "common/loopback_transport.hpp"

using namespace pulselink;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "pulselink - Loopback Session Example\n"
        "Subscribes to 'order' frames, sends messages through a loopback transport\n"
        "and survives a simulated connection drop and network outage.\n");
    params.dump("=== pulselink Loopback Session ===", std::cout);

    lcr::log::Logger::instance().enable_color(true);
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------
    Config config;
    config.url = params.url;
    config.platform = params.platform;
    config.tenant_id = params.tenant;
    config.heartbeat.interval = std::chrono::milliseconds(params.heartbeat_ms);
    config.backoff.base_delay = std::chrono::milliseconds(params.base_delay_ms);
    config.backoff.max_delay = std::chrono::milliseconds(params.base_delay_ms) * 8;
    config.backoff.jitter_ratio = 0.1;

    // -------------------------------------------------------------
    // Collaborators
    // -------------------------------------------------------------
    examples::LoopbackTransport transport;
    StaticProvider credentials{params.token};
    Signals signals;
    SteadyClock clock;

    Manager<examples::LoopbackTransport, StaticProvider> manager{config, transport, credentials, signals, clock};

    manager.observe([](const Status& s) {
        std::cout << " -> STATUS " << s << std::endl;
    });
    manager.on_queue_overflow([](const core::queue::OutboundMessage& lost, std::size_t depth) {
        std::cout << " -> DROPPED " << lost.id << " (queue depth " << depth << ")" << std::endl;
    });

    int received = 0;
    auto sub = manager.subscribe("order", [&](const Frame& frame) {
        ++received;
        std::cout << " -> ORDER id=" << frame.id << " payload=" << frame.payload << std::endl;
    });

    // -------------------------------------------------------------
    // Main polling loop
    // -------------------------------------------------------------
    const auto start = std::chrono::steady_clock::now();
    const auto duration = std::chrono::seconds(params.duration_s);
    const auto drop_after = std::chrono::milliseconds(params.drop_after_ms);
    auto next_send = start;
    std::uint32_t sent = 0;
    bool dropped = false;
    bool offline = false;
    auto online_at = start;

    while (running.load()) {
        manager.poll();   // REQUIRED to make progress

        const auto now = std::chrono::steady_clock::now();
        if (now - start >= duration) {
            break;
        }
        if (sent < params.messages && now >= next_send) {
            ++sent;
            const std::string payload = "{\"seq\":" + std::to_string(sent) + "}";
            const Error err = manager.send("order", payload);
            if (err != Error::None) {
                std::cout << " -> SEND FAILED (" << core::to_string(err) << ")" << std::endl;
            }
            next_send = now + std::chrono::milliseconds(500);
        }
        if (!dropped && params.drop_after_ms > 0 && now - start >= drop_after) {
            std::cout << "\n[pulselink] SIMULATING CONNECTION DROP\n" << std::endl;
            transport.drop();
            dropped = true;
            if (params.offline_ms > 0) {
                std::cout << "[pulselink] NETWORK UNREACHABLE\n" << std::endl;
                signals.set_network_reachable(false);
                offline = true;
                online_at = now + std::chrono::milliseconds(params.offline_ms);
            }
        }
        if (offline && now >= online_at) {
            std::cout << "\n[pulselink] NETWORK REACHABLE\n" << std::endl;
            signals.set_network_reachable(true);
            offline = false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    sub.unsubscribe();
    manager.disconnect();

    std::cout << "\n========== SESSION SUMMARY ==========" << std::endl;
    std::cout << "Messages sent     : " << sent << std::endl;
    std::cout << "Messages received : " << received << std::endl;
    std::cout << "Connections       : " << manager.epoch() << std::endl;
    std::cout << "Queue depth       : " << manager.queue_depth() << std::endl;
    std::cout << "Dropped messages  : " << manager.dropped_messages() << std::endl;
    manager.telemetry().debug_dump(std::cout);

    return 0;
}
