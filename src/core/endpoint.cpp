#include "core/endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ironlink {

std::string Endpoint::host_header() const {
    const uint16_t default_port = tls ? 443 : 80;
    if (port == default_port) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

Endpoint parse_endpoint(const std::string& url) {
    Endpoint ep;
    ep.url = url;

    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("Endpoint URL has no scheme: " + url);
    }
    std::string scheme = url.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme == "wss") {
        ep.tls = true;
    } else if (scheme != "ws") {
        throw std::invalid_argument("Unsupported endpoint scheme '" + scheme + "' in " + url);
    }

    const size_t authority_begin = scheme_end + 3;
    const size_t path_begin = url.find_first_of("/?", authority_begin);
    const std::string authority = url.substr(authority_begin,
        path_begin == std::string::npos ? std::string::npos : path_begin - authority_begin);
    ep.target = path_begin == std::string::npos ? "/" : url.substr(path_begin);
    if (ep.target[0] == '?') {
        ep.target = "/" + ep.target;
    }

    // IPv6 字面量形如 [::1]:8080
    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 address in " + url);
        }
        ep.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Malformed authority in " + url);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon == std::string::npos) {
            ep.host = authority;
        } else {
            ep.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        }
    }

    if (ep.host.empty()) {
        throw std::invalid_argument("Endpoint URL has no host: " + url);
    }

    if (port_text.empty()) {
        ep.port = ep.tls ? 443 : 80;
    } else {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::invalid_argument("Invalid port '" + port_text + "' in " + url);
        }
        const unsigned long value = std::stoul(port_text);
        if (value == 0 || value > 65535) {
            throw std::invalid_argument("Port out of range in " + url);
        }
        ep.port = static_cast<uint16_t>(value);
    }
    return ep;
}

} // namespace ironlink
