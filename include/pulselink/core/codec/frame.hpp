#pragma once

#include <string>


namespace pulselink::core::codec {

// -----------------------------------------------------------------------------
// Frame
//
// One discrete unit exchanged over the connection: a type tag, an optional
// message id and an optional payload. The payload is raw JSON text; the core
// never interprets it.
// -----------------------------------------------------------------------------
struct Frame {
    std::string type;
    std::string id;
    std::string payload;   // empty = no payload

    friend inline bool operator==(const Frame&, const Frame&) = default;
};

} // namespace pulselink::core::codec
