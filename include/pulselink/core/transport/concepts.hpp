#pragma once

#include <string>
#include <string_view>
#include <concepts>
#include <cstdint>

#include "pulselink/core/error.hpp"
#include "pulselink/core/transport/events.hpp"

namespace pulselink::core::transport {

// -----------------------------------------------------------------------------
// TransportConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the connection state machine.
//
// The Transport implementation:
//
//   • Starts a non-blocking open in open(); completion is reported later as
//     an Open, Error or Close event tagged with the given generation
//   • Returns a non-None Error from open() only for synchronous failures
//   • close() is idempotent and never blocks
//   • send() writes one text frame; false means the frame was not written
//   • Exposes poll_event() for the owner loop to drain
//
// -----------------------------------------------------------------------------

template<class T>
concept TransportConcept =
    requires(
        T t,
        const std::string& url,
        std::uint64_t generation,
        std::uint16_t code,
        std::string_view text,
        Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { t.open(url, generation) } noexcept -> std::same_as<Error>;
    { t.close(code, text) } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { t.send(text) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Event polling
    // ---------------------------------------------------------------------

    { t.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace pulselink::core::transport
