#include "pulselink/core/codec/json_codec.hpp"

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace pulselink::core::codec {

std::string JsonCodec::encode(const Frame& frame) const {
    std::string out;
    out.reserve(frame.type.size() + frame.id.size() + frame.payload.size() + 32);
    out += "{\"type\":";
    lcr::json::append_quoted(out, frame.type);
    if (!frame.id.empty()) {
        out += ",\"id\":";
        lcr::json::append_quoted(out, frame.id);
    }
    if (!frame.payload.empty()) {
        out += ",\"payload\":";
        out += frame.payload;
    }
    out += '}';
    return out;
}

Result JsonCodec::decode(std::string_view bytes, Frame& out) {
    out = Frame{};
    // Parse JSON message
    simdjson::dom::element root;
    auto error = parser_.parse(bytes.data(), bytes.size()).get(root);
    if (error) {
        PL_WARN("[CODEC] JSON parse error: " << error << " in message: " << bytes);
        return Result::InvalidJson;
    }
    if (root.type() != simdjson::dom::element_type::OBJECT) {
        PL_WARN("[CODEC] Frame is not a JSON object: " << bytes);
        return Result::InvalidSchema;
    }
    // Required: type
    std::string_view type;
    if (root["type"].get(type)) {
        PL_WARN("[CODEC] Frame without string 'type' field: " << bytes);
        return Result::InvalidSchema;
    }
    out.type.assign(type);
    // Optional: id
    auto id_field = root["id"];
    if (!id_field.error()) {
        std::string_view id;
        if (id_field.get(id)) {
            PL_WARN("[CODEC] Frame 'id' field is not a string: " << bytes);
            return Result::InvalidSchema;
        }
        out.id.assign(id);
    }
    // Optional: payload (any JSON value, kept as text)
    simdjson::dom::element payload;
    if (!root["payload"].get(payload)) {
        out.payload = simdjson::minify(payload);
    }
    return Result::Ok;
}

Result JsonCodec::check_payload(std::string_view payload) {
    if (payload.empty()) {
        return Result::Ok;
    }
    simdjson::dom::element value;
    auto error = parser_.parse(payload.data(), payload.size()).get(value);
    if (error) {
        PL_WARN("[CODEC] Payload is not a single JSON value: " << error << " in payload: " << payload);
        return Result::InvalidJson;
    }
    return Result::Ok;
}

} // namespace pulselink::core::codec
