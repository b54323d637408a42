/**
 * Url.hpp - URL helpers for the HTTP clients
 */

#pragma once

#include <string>
#include <vector>

namespace llt::net {

struct Endpoint {
    std::string origin;       // "https://api.lyrics.ovh" (what httplib::Client takes)
    std::string path_prefix;  // "/v1", empty if none
};

/// Split "scheme://host[:port][/path]". A missing scheme means https.
Endpoint splitUrl(const std::string& url);

/// Percent-encode everything except unreserved characters (A-Z a-z 0-9 - _ . ~).
std::string percentEncode(const std::string& text);

/// Split on sep, trim each piece, drop empty ones.
std::vector<std::string> splitList(const std::string& text, char sep);

} // namespace llt::net
