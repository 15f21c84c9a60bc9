#include "pulselink/core/transport/url.hpp"

#include <cstdlib>
#include <cstddef>



namespace pulselink::core::transport {

Error parse_url(const std::string& url, ParsedUrl& out) {
    out = ParsedUrl{};
    // 1) Extract scheme
    constexpr std::string_view ws  = "ws://";
    constexpr std::string_view wss = "wss://";
    std::size_t pos = 0;
    if (url.compare(0, ws.size(), ws) == 0) {
        out.secure = false;
        pos = ws.size();
    }
    else if (url.compare(0, wss.size(), wss) == 0) {
        out.secure = true;
        pos = wss.size();
    }
    else {
        return Error::InvalidUrl;
    }
    // 2) Extract host[:port] (authority ends at '/' or '?')
    const std::size_t end = url.find_first_of("/?", pos);
    const std::string hostport = (end == std::string::npos) ? url.substr(pos) : url.substr(pos, end - pos);
    if (hostport.empty()) {
        return Error::InvalidUrl;
    }
    // 3) Split host and port
    const std::size_t colon = hostport.find(':');
    if (colon != std::string::npos) {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
    } else {
        out.host = hostport;
        out.port = out.secure ? "443" : "80";
    }
    // 4) Path (default "/" if missing, query kept verbatim)
    if (end == std::string::npos) {
        out.path = "/";
    }
    else if (url[end] == '?') {
        out.path = "/" + url.substr(end);
    }
    else {
        out.path = url.substr(end);
    }

    // Invariants check --------------------------------

    if (out.host.empty() || out.port.empty()) {
        return Error::InvalidUrl;
    }
    for (char c : out.host) {
        if (c == ' ' || c == '@' || c == '#') {
            return Error::InvalidUrl;
        }
    }
    // Port must be numeric and in range
    if (out.port.size() > 5) {
        return Error::InvalidUrl;
    }
    for (char c : out.port) {
        if (c < '0' || c > '9') {
            return Error::InvalidUrl;
        }
    }
    const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
    if (p == 0 || p > 65535) {
        return Error::InvalidUrl;
    }
    // ---------------------------------------------------

    return Error::None;
}


std::string url_encode(std::string_view value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        const bool unreserved =
            (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}


std::string build_connect_url(std::string_view base,
                              std::string_view token,
                              std::string_view platform,
                              std::string_view tenant) {
    std::string url{base};
    url.reserve(url.size() + token.size() * 3 + platform.size() + tenant.size() + 32);

    if (url.find('?') == std::string::npos) {
        url.push_back('?');
    }
    else if (url.back() != '?' && url.back() != '&') {
        url.push_back('&');
    }
    url += "token=";
    url += url_encode(token);
    url += "&platform=";
    url += url_encode(platform);
    if (!tenant.empty()) {
        url += "&tenant=";
        url += url_encode(tenant);
    }
    return url;
}

} // namespace pulselink::core::transport
