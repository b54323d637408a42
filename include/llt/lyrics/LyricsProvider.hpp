/**
 * LyricsProvider.hpp - Lyric lines from the lyrics.ovh API or a local file
 */

#pragma once

#include <string>
#include <vector>

namespace llt::lyrics {

/**
 * Every method returns normalized lines: trimmed, whitespace runs collapsed,
 * blank lines removed. An empty result is a SetupError.
 */
class LyricsProvider {
public:
    explicit LyricsProvider(const std::string& base_url, int timeout_ms = 10000);
    LyricsProvider();  // base URL from LYRICS_OVH_BASE_URL
    ~LyricsProvider();

    /// GET {base}/{artist}/{title}
    std::vector<std::string> fetch(const std::string& artist, const std::string& title);

    std::vector<std::string> loadFromFile(const std::string& path);

    const std::string& baseUrl() const { return base_url_; }

    /// Extract the "lyrics" field of a lyrics.ovh JSON body.
    static std::vector<std::string> parseResponse(const std::string& body);

    static std::vector<std::string> normalize(const std::vector<std::string>& lines);

    /// Split on LF, CRLF or CR.
    static std::vector<std::string> splitLines(const std::string& text);

private:
    std::string base_url_;
    int timeout_ms_;
};

} // namespace llt::lyrics
