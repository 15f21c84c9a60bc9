#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>

#include "pulselink/core/config.hpp"
#include "pulselink/core/error.hpp"
#include "pulselink/core/transport/concepts.hpp"
#include "pulselink/core/transport/events.hpp"
#include "lcr/log/logger.hpp"


namespace pulselink::examples {

// -----------------------------------------------------------------------------
// LoopbackTransport
//
// In-process stand-in for a realtime server: the handshake completes on the
// next poll, every written frame is echoed back and heartbeat probes are
// answered with a reply frame. drop() simulates an abnormal close.
// -----------------------------------------------------------------------------
class LoopbackTransport {
public:
    [[nodiscard]]
    inline core::Error open(const std::string& url, std::uint64_t generation) noexcept {
        PL_DEBUG("[LOOPBACK] open " << url);
        generation_ = generation;
        open_ = true;
        events_.push_back(core::transport::Event::make_open(generation));
        return core::Error::None;
    }

    inline void close(std::uint16_t code, std::string_view reason) noexcept {
        PL_DEBUG("[LOOPBACK] close(" << code << ", " << reason << ")");
        open_ = false;
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (!open_) {
            return false;
        }
        if (text == R"({"type":"ping"})") {
            events_.push_back(core::transport::Event::make_message(generation_, R"({"type":"pong"})"));
        } else {
            events_.push_back(core::transport::Event::make_message(generation_, text));
        }
        return true;
    }

    [[nodiscard]]
    inline bool poll_event(core::transport::Event& ev) noexcept {
        if (events_.empty()) {
            return false;
        }
        ev = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    // Simulates the server dropping the connection
    inline void drop(std::uint16_t code = core::CLOSE_ABNORMAL) {
        if (!open_) {
            return;
        }
        open_ = false;
        events_.push_back(core::transport::Event::make_close(generation_, code));
    }

private:
    std::deque<core::transport::Event> events_;
    std::uint64_t generation_{0};
    bool open_{false};
};

static_assert(core::transport::TransportConcept<LoopbackTransport>);

} // namespace pulselink::examples
