/**
 * LyricsProvider.cpp - lyrics.ovh client and local lyric files
 */

#include "llt/lyrics/LyricsProvider.hpp"
#include "llt/Config.hpp"
#include "llt/Errors.hpp"
#include "llt/core/TextUtil.hpp"
#include "llt/net/Url.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace llt::lyrics {

LyricsProvider::LyricsProvider(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms) {
}

LyricsProvider::LyricsProvider()
    : LyricsProvider(lyricsBaseUrlFromEnv()) {
}

LyricsProvider::~LyricsProvider() = default;

std::vector<std::string> LyricsProvider::fetch(const std::string& artist, const std::string& title) {
    net::Endpoint endpoint = net::splitUrl(base_url_);
    std::string path = endpoint.path_prefix + "/" + net::percentEncode(artist)
                     + "/" + net::percentEncode(title);

    httplib::Client client(endpoint.origin);
    client.set_connection_timeout(timeout_ms_ / 1000, (timeout_ms_ % 1000) * 1000);
    client.set_read_timeout(timeout_ms_ / 1000, (timeout_ms_ % 1000) * 1000);
    client.set_follow_location(true);

    std::cout << "[LyricsProvider] GET " << endpoint.origin << path << std::endl;

    auto res = client.Get(path);
    if (!res) {
        throw SetupError("lyrics request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw SetupError("lyrics request failed: HTTP " + std::to_string(res->status)
                         + " for " + artist + " - " + title);
    }

    auto lines = parseResponse(res->body);
    std::cout << "[LyricsProvider] Got " << lines.size() << " lines" << std::endl;
    return lines;
}

std::vector<std::string> LyricsProvider::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        throw SetupError("can't open lyrics file: " + path);
    }

    std::stringstream content;
    content << file.rdbuf();

    std::string text = content.str();
    // UTF-8 BOM
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }

    auto lines = normalize(splitLines(text));
    std::cout << "[LyricsProvider] Loaded " << lines.size() << " lines from " << path << std::endl;
    return lines;
}

std::vector<std::string> LyricsProvider::parseResponse(const std::string& body) {
    std::string raw;
    try {
        json res_json = json::parse(body);
        if (res_json.is_object()) {
            raw = res_json.value("lyrics", "");
        }
    } catch (const json::exception& e) {
        std::cerr << "[LyricsProvider] JSON parse error: " << e.what() << std::endl;
        throw SetupError(std::string("malformed lyrics response: ") + e.what());
    }

    if (raw.empty()) {
        throw SetupError("lyrics API returned empty text");
    }
    return normalize(splitLines(raw));
}

std::vector<std::string> LyricsProvider::normalize(const std::vector<std::string>& lines) {
    std::vector<std::string> normalized;
    normalized.reserve(lines.size());
    for (const auto& line : lines) {
        std::string collapsed = core::collapseWhitespace(line);
        if (!collapsed.empty()) {
            normalized.push_back(std::move(collapsed));
        }
    }
    if (normalized.empty()) {
        throw SetupError("no lyric lines available after normalization");
    }
    return normalized;
}

std::vector<std::string> LyricsProvider::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

} // namespace llt::lyrics
