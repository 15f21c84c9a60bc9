#pragma once

#include <string>
#include <string_view>
#include <cstddef>
#include <cstdint>


namespace lcr {
namespace json {

// Appends s as a quoted JSON string literal (RFC 8259 escaping)
inline void append_quoted(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

// Fast integer -> string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Appends value as exactly `digits` lowercase hex digits (zero padded, high
// digits truncated)
inline void append_hex(std::string& out, std::uint64_t value, int digits) {
    static constexpr char hex[] = "0123456789abcdef";
    char buf[16];
    if (digits > 16) {
        digits = 16;
    }
    for (int i = digits - 1; i >= 0; --i) {
        buf[i] = hex[value & 0x0F];
        value >>= 4;
    }
    out.append(buf, static_cast<std::size_t>(digits < 0 ? 0 : digits));
}

} // namespace json
} // namespace lcr
