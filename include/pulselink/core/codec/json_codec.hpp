#pragma once

#include <string>
#include <string_view>

#include "pulselink/core/codec/concepts.hpp"

#include "simdjson.h"


namespace pulselink::core::codec {

/*
================================================================================
JsonCodec
================================================================================

Wire format (one JSON object per text frame):

    {"type":"<type>","id":"<id>","payload":<json>}

  • "type"     required string
  • "id"       optional string (omitted on encode when empty)
  • "payload"  optional JSON value of any kind (omitted on encode when empty)

Decoding uses the simdjson DOM parser. The payload is kept as minified JSON
text so that listeners can parse it with whatever they like.

The codec owns a simdjson parser and is therefore not thread-safe; one
instance per connection.
================================================================================
*/
class JsonCodec {
public:
    JsonCodec() = default;

    // payload must be valid JSON text (or empty), see check_payload()
    [[nodiscard]]
    std::string encode(const Frame& frame) const;

    [[nodiscard]]
    Result decode(std::string_view bytes, Frame& out);

    // Ok for empty text or exactly one JSON value; InvalidJson otherwise
    // (malformed text, trailing content such as extra object members)
    [[nodiscard]]
    Result check_payload(std::string_view payload);

private:
    simdjson::dom::parser parser_;
};

static_assert(CodecConcept<JsonCodec>);

} // namespace pulselink::core::codec
