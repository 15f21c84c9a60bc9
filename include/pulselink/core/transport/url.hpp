#pragma once

#include <string>
#include <string_view>

#include "pulselink/core/error.hpp"


namespace pulselink::core::transport {

// Contains parsed URL components
struct ParsedUrl {
    bool secure{false};    // true = wss, false = ws
    std::string host;
    std::string port;
    std::string path;      // path including any existing query string
};

// ---------------------------------------------------------------------
// Minimal URL parser supporting ws:// and wss://
//
// Accepts the URLs a realtime endpoint is normally configured with and
// rejects malformed inputs without attempting full RFC compliance.
//
// Example inputs:
//   wss://rt.example.com/socket
//   ws://localhost:8080/ws?v=2
// ---------------------------------------------------------------------
[[nodiscard]]
Error parse_url(const std::string& url, ParsedUrl& out);

// Percent-encodes a query parameter value (RFC 3986 unreserved set kept).
[[nodiscard]]
std::string url_encode(std::string_view value);

// ---------------------------------------------------------------------
// Builds the wire URL of one connection attempt.
//
// The access token and the platform identifier are appended as query
// parameters, plus the tenant when it is non-empty:
//
//   <base>?token=<token>&platform=<platform>[&tenant=<tenant>]
//
// If base already carries a query string the parameters are appended
// with '&'. Values are percent-encoded.
// ---------------------------------------------------------------------
[[nodiscard]]
std::string build_connect_url(std::string_view base,
                              std::string_view token,
                              std::string_view platform,
                              std::string_view tenant);

} // namespace pulselink::core::transport
