#pragma once

#include <concepts>
#include <string>
#include <string_view>

#include "pulselink/core/codec/frame.hpp"
#include "pulselink/core/codec/result.hpp"


namespace pulselink::core::codec {

// -----------------------------------------------------------------------------
// CodecConcept
// -----------------------------------------------------------------------------
//
// Serializes outbound frames to wire text and parses inbound text back to
// frames. Decode failures are reported through codec::Result; the caller
// logs and drops the frame, the connection is not affected.
//
// check_payload() tells whether caller-supplied payload text can be embedded
// in an outbound frame as is. encode() assumes it was checked.
//
// -----------------------------------------------------------------------------
template<class C>
concept CodecConcept =
    requires(C c, const Frame& in, Frame& out, std::string_view bytes) {
        { c.encode(in) } -> std::same_as<std::string>;
        { c.decode(bytes, out) } -> std::same_as<Result>;
        { c.check_payload(bytes) } -> std::same_as<Result>;
    };

} // namespace pulselink::core::codec
