/**
 * Url.cpp - URL splitting and percent-encoding
 */

#include "llt/net/Url.hpp"
#include "llt/core/TextUtil.hpp"

#include <cctype>

namespace llt::net {

Endpoint splitUrl(const std::string& url) {
    Endpoint endpoint;
    std::string rest = core::trim(url);

    std::string scheme = "https://";
    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        scheme = rest.substr(0, scheme_end + 3);
        rest = rest.substr(scheme_end + 3);
    }

    size_t slash = rest.find('/');
    if (slash == std::string::npos) {
        endpoint.origin = scheme + rest;
        return endpoint;
    }

    endpoint.origin = scheme + rest.substr(0, slash);
    endpoint.path_prefix = rest.substr(slash);
    while (!endpoint.path_prefix.empty() && endpoint.path_prefix.back() == '/') {
        endpoint.path_prefix.pop_back();
    }
    return endpoint;
}

std::string percentEncode(const std::string& text) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::vector<std::string> splitList(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(sep, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string part = core::trim(text.substr(start, end - start));
        if (!part.empty()) {
            parts.push_back(part);
        }
        start = end + 1;
    }
    return parts;
}

} // namespace llt::net
