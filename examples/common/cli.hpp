#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace pulselink::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);

// -------------------------------------------------------------
// Common example parameters
// -------------------------------------------------------------
struct Params {
    std::string url             = "wss://rt.example.com/socket";
    std::string token           = "demo-token";
    std::string platform        = "native";
    std::string tenant;
    std::uint32_t messages      = 10;
    std::uint32_t drop_after_ms = 3000;     // 0 = never
    std::uint32_t offline_ms    = 2000;     // network outage right after the drop (0 = none)
    std::uint32_t duration_s    = 15;
    std::uint32_t heartbeat_ms  = 2000;
    std::uint32_t base_delay_ms = 1000;
    std::string log_level       = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL        : " << url << "\n"
           << "  Platform   : " << platform << "\n"
           << "  Tenant     : " << (tenant.empty() ? "-" : tenant) << "\n"
           << "  Messages   : " << messages << "\n"
           << "  Drop after : " << drop_after_ms << " ms\n"
           << "  Offline    : " << offline_ms << " ms\n"
           << "  Duration   : " << duration_s << " s\n"
           << "  Heartbeat  : " << heartbeat_ms << " ms\n"
           << "  Base delay : " << base_delay_ms << " ms\n"
           << "  Log Level  : " << log_level << "\n";
    }
};

// -------------------------------------------------------------
// Build CLI for examples
// -------------------------------------------------------------
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Realtime endpoint (ws:// or wss://)")->check(ws_url_validator)->default_val(params.url);
    app.add_option("-t,--token", params.token, "Access token")->default_val(params.token);
    app.add_option("-p,--platform", params.platform, "Platform identifier")->default_val(params.platform);
    app.add_option("--tenant", params.tenant, "Tenant id (optional)");
    app.add_option("-n,--messages", params.messages, "Messages to send")->default_val(params.messages);
    app.add_option("--drop-after-ms", params.drop_after_ms, "Simulate an abnormal close after this many ms (0 = never)")->default_val(params.drop_after_ms);
    app.add_option("--offline-ms", params.offline_ms, "Network outage simulated right after the drop (0 = none)")->default_val(params.offline_ms);
    app.add_option("-d,--duration", params.duration_s, "Run time in seconds")->check(CLI::PositiveNumber)->default_val(params.duration_s);
    app.add_option("--heartbeat-ms", params.heartbeat_ms, "Heartbeat interval in ms")->check(CLI::PositiveNumber)->default_val(params.heartbeat_ms);
    app.add_option("--base-delay-ms", params.base_delay_ms, "Reconnect base delay in ms")->check(CLI::PositiveNumber)->default_val(params.base_delay_ms);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "This example runs against an in-process loopback transport.\n"
        "Press Ctrl+C to disconnect and exit cleanly."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace pulselink::examples::cli
