#pragma once

#include <cstdint>
#include <string_view>


namespace pulselink::core::codec {

// ===============================================
// DECODE RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok            = 0,   // Decoded successfully
    InvalidJson   = 1,   // Structural failure (not JSON, truncated, bad compression)
    InvalidSchema = 2    // JSON, but not a frame (not an object, missing or non-string type)
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        default:                    return "unknown";
    }
}

} // namespace pulselink::core::codec
