#pragma once

/*
===============================================================================
 pulselink::core::transport::Event
===============================================================================

Event emitted by a Transport implementation and drained by the connection
core through poll_event().

This replaces the open / message / close / error callbacks of a browser-style
socket with a poll-driven event channel: the owner loop pulls events and
feeds them into the state machine one at a time.

-------------------------------------------------------------------------------
 Generation tagging
-------------------------------------------------------------------------------

Every event carries the generation passed to the open() call that produced
it. The state machine compares it with its current generation and drops the
event if they differ, so a late Open from an abandoned attempt can never
promote a newer attempt to Connected.

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------

A transport may run its own IO thread. If it does, it must hand events over
through a single-producer queue and expose them only via poll_event() on the
owner thread. No callback crosses threads.
===============================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>

#include "pulselink/core/error.hpp"


namespace pulselink::core::transport {

enum class EventType : std::uint8_t {
    Open    = 0,   // Handshake completed
    Message = 1,   // One inbound text frame (data holds the bytes)
    Close   = 2,   // Transport closed (close_code holds the status code)
    Error   = 3,   // Transport-level failure (error holds the classification)
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Open:    return "Open";
        case EventType::Message: return "Message";
        case EventType::Close:   return "Close";
        case EventType::Error:   return "Error";
        default:                 return "Unknown";
    }
}


struct Event {
    EventType type{EventType::Error};
    std::uint64_t generation{0};
    std::uint16_t close_code{0};   // valid only if type == EventType::Close
    Error error{Error::None};      // valid only if type == EventType::Error
    std::string data;              // valid only if type == EventType::Message

    static inline Event make_open(std::uint64_t generation) {
        Event ev;
        ev.type = EventType::Open;
        ev.generation = generation;
        return ev;
    }

    static inline Event make_message(std::uint64_t generation, std::string_view bytes) {
        Event ev;
        ev.type = EventType::Message;
        ev.generation = generation;
        ev.data.assign(bytes);
        return ev;
    }

    static inline Event make_close(std::uint64_t generation, std::uint16_t code) {
        Event ev;
        ev.type = EventType::Close;
        ev.generation = generation;
        ev.close_code = code;
        return ev;
    }

    static inline Event make_error(std::uint64_t generation, Error e) {
        Event ev;
        ev.type = EventType::Error;
        ev.generation = generation;
        ev.error = e;
        return ev;
    }
};

} // namespace pulselink::core::transport
